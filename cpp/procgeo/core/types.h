#ifndef PROCGEO_CORE_TYPES_H
#define PROCGEO_CORE_TYPES_H

#include <cstddef>
#include <cstdint>

// Lightweight value types shared by every pipeline stage.

namespace procgeo {

// Host shapes report no size for these when the property bag is missing them.
static constexpr double defaultShapeWidth = 100.0;
static constexpr double defaultShapeHeight = 100.0;
static constexpr double defaultShapeRadius = 50.0;
static constexpr std::uint32_t defaultPolygonSides = 6;

static constexpr double kPi = 3.14159265358979323846;
static constexpr double kTwoPi = 2.0 * kPi;
static constexpr double kHalfPi = 0.5 * kPi;

struct Point2 {
    double x{0.0};
    double y{0.0};
};

inline bool operator==(const Point2& a, const Point2& b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) noexcept { return !(a == b); }

struct Size2 {
    double width{0.0};
    double height{0.0};
};

// Axis-aligned box, top-left anchored.
struct Bounds {
    double x{0.0};
    double y{0.0};
    double w{0.0};
    double h{0.0};

    double centerX() const noexcept { return x + w * 0.5; }
    double centerY() const noexcept { return y + h * 0.5; }
};

inline bool operator==(const Bounds& a, const Bounds& b) noexcept {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

// World placement of one instance. Rotation is radians, pivoting at the
// top-left corner (host convention).
struct Transform {
    double x{0.0};
    double y{0.0};
    double rotation{0.0};
    double scaleX{1.0};
    double scaleY{1.0};
};

} // namespace procgeo

#endif // PROCGEO_CORE_TYPES_H
