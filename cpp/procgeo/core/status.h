#ifndef PROCGEO_CORE_STATUS_H
#define PROCGEO_CORE_STATUS_H

#include <cstdint>

namespace procgeo {

// Result of validating a settings record or an input geometry. Anything other
// than Ok means the stage returns its input untouched.
enum class ValidationStatus : std::uint32_t {
    Ok = 0,
    InvalidIterations = 1,
    InvalidFactor = 2,
    InvalidThreshold = 3,
    InvalidTolerance = 4,
    InvalidMinPoints = 5,
    InvalidAmplitude = 6,
    InvalidFrequency = 7,
    InvalidOctaves = 8,
    InvalidCount = 9,
    InvalidRadius = 10,
    InvalidScale = 11,
    InvalidAxis = 12,
    InvalidProbability = 13,
    InsufficientPoints = 14,
    UnsupportedPathType = 15,
    InvalidDirection = 16,
};

inline bool isOk(ValidationStatus s) noexcept { return s == ValidationStatus::Ok; }

inline const char* describeStatus(ValidationStatus s) noexcept {
    switch (s) {
        case ValidationStatus::Ok: return "ok";
        case ValidationStatus::InvalidIterations: return "iterations out of range";
        case ValidationStatus::InvalidFactor: return "factor out of range";
        case ValidationStatus::InvalidThreshold: return "threshold out of range";
        case ValidationStatus::InvalidTolerance: return "tolerance must be non-negative";
        case ValidationStatus::InvalidMinPoints: return "minPoints must be at least 2";
        case ValidationStatus::InvalidAmplitude: return "amplitude must be non-negative";
        case ValidationStatus::InvalidFrequency: return "frequency must be positive";
        case ValidationStatus::InvalidOctaves: return "octaves must be within 1..8";
        case ValidationStatus::InvalidCount: return "count out of range";
        case ValidationStatus::InvalidRadius: return "radius must be non-negative";
        case ValidationStatus::InvalidScale: return "scale must be positive";
        case ValidationStatus::InvalidAxis: return "unknown mirror axis";
        case ValidationStatus::InvalidProbability: return "probability must be within 0..1";
        case ValidationStatus::InsufficientPoints: return "not enough points";
        case ValidationStatus::UnsupportedPathType: return "path type is pass-through only";
        case ValidationStatus::InvalidDirection: return "unknown noise direction";
    }
    return "unknown";
}

} // namespace procgeo

#endif // PROCGEO_CORE_STATUS_H
