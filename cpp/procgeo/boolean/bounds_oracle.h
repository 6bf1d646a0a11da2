#pragma once

#include "procgeo/core/types.h"

#include <optional>
#include <string>

namespace procgeo {

// Host-side query for the rotation-aware, on-screen bounds of a shape.
class BoundsOracle {
public:
    virtual ~BoundsOracle() = default;
    virtual std::optional<Bounds> getVisualBounds(const std::string& shapeId) const = 0;
};

} // namespace procgeo
