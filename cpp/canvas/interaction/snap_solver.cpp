#include "canvas/interaction/snap_solver.h"

#include "canvas/scene/scene_object.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace canvas {

namespace {
    struct SnapAxisBest {
        bool snapped{false};
        float position{0.0f};
        float guide{0.0f};
        float dist{std::numeric_limits<float>::infinity()};
        SnapSource source{SnapSource::Object};
    };

    // Sibling extent along one axis.
    struct AxisSpan {
        float start;
        float size;
    };

    // `edge` is the moving-object feature (already offset by `pos`), `target`
    // the line it would land on, `snappedPos` the top-left that achieves it.
    inline void considerAxis(float edge, float target, float snappedPos, SnapSource source, SnapAxisBest& best) {
        const float dist = std::abs(edge - target);
        if (dist <= kSnapThreshold && dist < best.dist) {
            best.dist = dist;
            best.position = snappedPos;
            best.guide = target;
            best.snapped = true;
            best.source = source;
        }
    }

    SnapAxisBest solveAxis(
        float pos,
        float size,
        float canvasExtent,
        bool gridEnabled,
        const std::vector<AxisSpan>& siblings) {
        const float half = size * 0.5f;
        const float center = pos + half;

        SnapAxisBest best{};

        // 1. canvas centre
        const float canvasCenter = canvasExtent * 0.5f;
        considerAxis(center, canvasCenter, canvasCenter - half, SnapSource::CanvasCenter, best);
        if (best.snapped) return best;

        // 2. grid: centre first, then the raw top-left
        if (gridEnabled && std::isfinite(center)) {
            const float gridCenter = snapToGrid(center);
            considerAxis(center, gridCenter, gridCenter - half, SnapSource::Grid, best);
            if (best.snapped) return best;

            const float gridEdge = snapToGrid(pos);
            considerAxis(pos, gridEdge, gridEdge, SnapSource::Grid, best);
            if (best.snapped) return best;
        }

        // 3. siblings, strict improvement so the first sibling wins ties
        for (const AxisSpan& s : siblings) {
            const float left = s.start;
            const float right = s.start + s.size;
            const float mid = s.start + s.size * 0.5f;
            considerAxis(pos, left, left, SnapSource::Object, best);
            considerAxis(pos + size, right, right - size, SnapSource::Object, best);
            considerAxis(center, mid, mid - half, SnapSource::Object, best);
            considerAxis(pos, right, right, SnapSource::Object, best);
            considerAxis(pos + size, left, left - size, SnapSource::Object, best);
        }
        return best;
    }
} // namespace

float snapToGrid(float value, float gridSize) {
    if (gridSize <= 0.0f) return value;
    return std::round(value / gridSize) * gridSize;
}

SnapResult computeSnap(const SnapRequest& request, const std::vector<BoundingBox>& siblings) {
    SnapResult result{};
    result.x = request.x;
    result.y = request.y;
    if (!request.snapEnabled) return result;

    const float width = std::max(1.0f, request.width.value_or(0.0f));
    const float height = std::max(1.0f, request.height.value_or(0.0f));

    std::vector<AxisSpan> spansX;
    std::vector<AxisSpan> spansY;
    spansX.reserve(siblings.size());
    spansY.reserve(siblings.size());
    for (const BoundingBox& box : siblings) {
        spansX.push_back({box.x, box.width});
        spansY.push_back({box.y, box.height});
    }

    const SnapAxisBest bestX = solveAxis(request.x, width, request.canvasWidth, request.gridEnabled, spansX);
    const SnapAxisBest bestY = solveAxis(request.y, height, request.canvasHeight, request.gridEnabled, spansY);

    if (bestX.snapped) {
        result.x = bestX.position;
        result.snappedX = true;
        result.guides.push_back(SnapGuide{SnapAxis::Vertical, bestX.guide, bestX.source});
    }
    if (bestY.snapped) {
        result.y = bestY.position;
        result.snappedY = true;
        result.guides.push_back(SnapGuide{SnapAxis::Horizontal, bestY.guide, bestY.source});
    }
    return result;
}

SnapResult computeSnap(const SnapRequest& request, const std::vector<SceneObject>& objects, std::string_view movingId) {
    std::vector<BoundingBox> siblings;
    siblings.reserve(objects.size());
    for (const SceneObject& obj : objects) {
        if (obj.id == movingId) continue;
        siblings.push_back(boundingBox(obj));
    }
    return computeSnap(request, siblings);
}

} // namespace canvas
