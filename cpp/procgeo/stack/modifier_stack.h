#ifndef PROCGEO_STACK_MODIFIER_STACK_H
#define PROCGEO_STACK_MODIFIER_STACK_H

#include "procgeo/array/array_settings.h"
#include "procgeo/path/path_modifiers.h"
#include "procgeo/shape/shape.h"
#include "procgeo/shape/shape_state.h"

#include <cstdint>
#include <string>
#include <vector>

namespace procgeo {

enum class ModifierType : std::uint8_t {
    LinearArray = 0,
    CircularArray = 1,
    GridArray = 2,
    Mirror = 3,
    LSystem = 4,
    Subdivide = 5,
    Smooth = 6,
    Simplify = 7,
    NoiseOffset = 8,
};

const char* modifierTypeName(ModifierType type) noexcept;

// Only the member matching Modifier::type is read.
struct ModifierSettings {
    LinearArraySettings linear;
    CircularArraySettings circular;
    GridArraySettings grid;
    MirrorSettings mirror;
    LSystemSettings lsystem;
    SubdivideSettings subdivide;
    SmoothSettings smooth;
    SimplifySettings simplify;
    NoiseOffsetSettings noise;
};

struct Modifier {
    std::string id;
    ModifierType type{ModifierType::LinearArray};
    bool enabled{true};
    std::int32_t order{0};
    ModifierSettings settings;
};

// Modifier of `type` with default settings.
Modifier makeModifier(std::string id, ModifierType type, std::int32_t order = 0);

ShapeState createInitialState(const Shape& shape);

// One modifier over `state`. Group context only reaches array processors
// that support group mode.
ShapeState applyModifier(const ShapeState& state, const Modifier& modifier, const GroupContext* group = nullptr);

// Applies the enabled modifiers in ascending `order` (stable for ties),
// starting from createInitialState(shape).
ShapeState processModifiers(const Shape& shape, const std::vector<Modifier>& modifiers,
    const GroupContext* group = nullptr);

// Bakes every instance into a standalone shape with id
// "clone-<sourceId>-<index>". Throws std::invalid_argument on an empty state.
std::vector<Shape> materializeInstances(const ShapeState& state);

// Throws std::invalid_argument when `state` has no instances.
void validateState(const ShapeState& state);

} // namespace procgeo

#endif // PROCGEO_STACK_MODIFIER_STACK_H
