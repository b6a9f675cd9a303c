#ifndef ARTCHIVE_CANVAS_SCENE_SCENE_OBJECT_H
#define ARTCHIVE_CANVAS_SCENE_SCENE_OBJECT_H

#include "canvas/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace canvas {

// =============================================================================
// Size accessors
// =============================================================================

// rect / image / gallery-item: stored size scaled. circle: 2*radius scaled.
// text: stored wrap width scaled, if set. Every other kind has no size for
// snapping purposes.
std::optional<float> objectWidth(const SceneObject& obj);
std::optional<float> objectHeight(const SceneObject& obj);

// Tight box of a flat x/y point array. Null when fewer than two pairs.
std::optional<Bounds> pathBounds(const std::vector<float>& points);

// Rough single-line text size used when no font measurement is available.
float estimateTextWidth(const TextShape& text);
float estimateTextHeight(const TextShape& text);

// Extent of a child in its parent's coordinate space, honouring the circle
// centre anchor and the path point offsets.
Bounds childExtent(const SceneObject& child);

// Axis-aligned box in parent coordinates, top-left anchored. Kinds without a
// size accessor fall back to their visual extent (container stored size,
// path points, estimated text).
BoundingBox boundingBox(const SceneObject& obj);

// Union of the extents of the visible children of a container, relative to
// the container position. Null when nothing is visible.
std::optional<Bounds> groupVisualBounds(const SceneObject& group);

// Recomputes the stored width/height of a group from its visible children.
// Frames and gallery items keep fixed dimensions. Returns true if changed.
bool recalculateGroupBounds(SceneObject& group);

// =============================================================================
// Partial update
// =============================================================================

// Fields left empty are not touched. Identity (id, kind) cannot be patched.
struct ObjectPatch {
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> rotation;
    std::optional<float> scaleX;
    std::optional<float> scaleY;
    std::optional<float> opacity;
    std::optional<std::int32_t> zIndex;
    std::optional<bool> visible;
    std::optional<std::string> name;
    std::optional<ShapeData> shape;
    std::optional<std::vector<SceneObject>> children;

    bool empty() const noexcept;
};

// Fails (object untouched) when the shape payload does not match the kind or
// children are given to a non-container.
bool applyPatch(SceneObject& obj, const ObjectPatch& patch);

// =============================================================================
// Validation
// =============================================================================

enum class ValidationIssue : std::uint8_t {
    None = 0,
    EmptyId = 1,
    DuplicateId = 2,
    NonFiniteValue = 3,
    NegativeSize = 4,
    OddPointCount = 5,
    ShapeMismatch = 6,
    ChildrenOnLeaf = 7,
};

const char* validationIssueName(ValidationIssue issue) noexcept;

ValidationIssue validateObject(const SceneObject& obj);
ValidationIssue validateDocument(const SceneDocument& doc);

} // namespace canvas

#endif // ARTCHIVE_CANVAS_SCENE_SCENE_OBJECT_H
