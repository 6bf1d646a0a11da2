#pragma once

#include "procgeo/core/status.h"
#include "procgeo/core/types.h"
#include "procgeo/path/path_data.h"

#include <cstdint>
#include <optional>

namespace procgeo {

struct PathModificationResult {
    PathData pathData;
    bool boundsChanged{false};
    std::optional<Bounds> newBounds;
};

// Result for the early-return path: the input, untouched, flagged unchanged.
PathModificationResult unchangedPath(const PathData& input);

// Result for a successful rewrite: recomputes tight bounds over the new data.
PathModificationResult modifiedPath(PathData output);

// ============================================================================
// Settings
// ============================================================================

struct SubdivideSettings {
    std::uint32_t iterations{1};  // 0..10, 0 is a no-op rewrite
    double factor{0.5};           // exclusive (0, 1), 0.5 inserts midpoints
    bool smooth{false};           // (prev + 2*cur + next) / 4 after each pass
};

struct SmoothSettings {
    std::uint32_t iterations{1};  // 1..10
    double factor{0.5};           // 0..1
    bool preserveCorners{false};
    double cornerThreshold{30.0}; // degrees, 0..180
};

struct SimplifySettings {
    double tolerance{1.0};
    bool preserveCorners{false};
    std::uint32_t minPoints{3};
};

enum class NoiseDirection : std::uint8_t { Both = 0, Normal = 1, Tangent = 2 };

struct NoiseOffsetSettings {
    double amplitude{10.0};
    double frequency{0.1};
    std::uint32_t octaves{3};     // 1..8
    std::int32_t seed{0};
    NoiseDirection direction{NoiseDirection::Both};
};

ValidationStatus validateSettings(const SubdivideSettings& s) noexcept;
ValidationStatus validateSettings(const SmoothSettings& s) noexcept;
ValidationStatus validateSettings(const SimplifySettings& s) noexcept;
ValidationStatus validateSettings(const NoiseOffsetSettings& s) noexcept;

// ============================================================================
// Modifiers
// ============================================================================
// Total functions: invalid settings, too few points and svg input all come
// back as unchangedPath(input). The input is never modified.

PathModificationResult subdividePath(const PathData& path, const SubdivideSettings& settings);
PathModificationResult smoothPath(const PathData& path, const SmoothSettings& settings);
PathModificationResult simplifyPath(const PathData& path, const SimplifySettings& settings);
PathModificationResult noiseOffsetPath(const PathData& path, const NoiseOffsetSettings& settings);

// Single-sample hash noise in [-1, 1).
double hashNoise(double x, double y) noexcept;

// Octave sum of hashNoise, normalized by total amplitude.
double fractalNoise(double x, double y, std::uint32_t octaves, double seed) noexcept;

} // namespace procgeo
