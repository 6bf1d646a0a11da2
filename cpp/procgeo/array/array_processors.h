#pragma once

#include "procgeo/array/array_settings.h"
#include "procgeo/shape/shape_state.h"

namespace procgeo {

// ============================================================================
// Instance array processors
// ============================================================================
// Each processor is a pure function of its inputs. Invalid settings return
// `input` unchanged. Output `index` values are contiguous from 0.
//
// When `group` is non-null the whole input is treated as one rigid group:
// clone offsets are measured in percent of the group bounds, clones are
// rigid copies of the formation about the group center, and the result is
// re-expressed relative to the group's current transform so the clones follow
// later edits to the group.

// count copies per source along a rotated offset vector. Output is
// source-major (all copies of source 0, then source 1), or copy-major in
// group mode so each copy of the formation stays contiguous.
ShapeState applyLinearArray(const ShapeState& input, const LinearArraySettings& settings,
    const GroupContext* group = nullptr);

// count copies per source on a circular sweep. Copy 0 sits on the source
// shifted by (centerX, centerY); every copy lies `radius` from the circle
// center. In group mode the formation orbits as one rigid body.
ShapeState applyCircularArray(const ShapeState& input, const CircularArraySettings& settings,
    const GroupContext* group = nullptr);

// rows x columns copies per source, row-major, starting at the source.
ShapeState applyGridArray(const ShapeState& input, const GridArraySettings& settings,
    const GroupContext* group = nullptr);

// Keeps every source and appends one reflected copy of each.
ShapeState applyMirror(const ShapeState& input, const MirrorSettings& settings,
    const GroupContext* group = nullptr);

// Keeps every source and appends the turtle-generated branch clones of each.
// Clones are numbered from 1 in emission order within their source's tree.
ShapeState applyLSystem(const ShapeState& input, const LSystemSettings& settings);

} // namespace procgeo
