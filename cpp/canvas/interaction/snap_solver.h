#pragma once

#include "canvas/core/types.h"

#include <optional>
#include <string_view>
#include <vector>

namespace canvas {

// Proposed top-left of the moving object plus the context it snaps against.
struct SnapRequest {
    float x{0.0f};
    float y{0.0f};
    std::optional<float> width;
    std::optional<float> height;
    float canvasWidth{kDefaultCanvasWidth};
    float canvasHeight{kDefaultCanvasHeight};
    bool gridEnabled{true};
    bool snapEnabled{true};
};

struct SnapResult {
    float x{0.0f};
    float y{0.0f};
    bool snappedX{false};
    bool snappedY{false};
    // At most one guide per axis.
    std::vector<SnapGuide> guides;
};

float snapToGrid(float value, float gridSize = kGridSize);

// Per axis, first match wins: canvas centre, grid (centre, then top-left),
// then sibling edges/centres. Nothing snaps while snapEnabled is false.
SnapResult computeSnap(const SnapRequest& request, const std::vector<BoundingBox>& siblings);

// Siblings are every object of `objects` except `movingId`.
SnapResult computeSnap(const SnapRequest& request, const std::vector<SceneObject>& objects, std::string_view movingId);

} // namespace canvas
