#include "canvas/editor/canvas_editor.h"

#include "canvas/core/logging.h"
#include "canvas/scene/scene_tree.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace canvas {

namespace {

std::ptrdiff_t topLevelIndex(const std::vector<SceneObject>& objects, std::string_view id) {
    for (std::size_t i = 0; i < objects.size(); ++i) {
        if (objects[i].id == id) return static_cast<std::ptrdiff_t>(i);
    }
    return -1;
}

} // namespace

// =============================================================================
// Drag / snapping
// =============================================================================

bool CanvasEditor::computeMove(std::string_view id, float x, float y, SnapResult& out) const {
    ObjectPath path;
    if (!findObjectPath(state_.objects, id, path)) return false;

    const SceneObject* parent = nullptr;
    const std::vector<SceneObject>* siblings = &state_.objects;
    for (std::size_t depth = 0; depth + 1 < path.size(); ++depth) {
        parent = &(*siblings)[path[depth]];
        siblings = &parent->children;
    }
    const SceneObject& obj = (*siblings)[path.back()];

    // Snap in top-left space: a circle's stored position is its centre and
    // paths may start away from their anchor.
    const BoundingBox box = boundingBox(obj);
    const float offsetX = box.x - obj.x;
    const float offsetY = box.y - obj.y;

    SnapRequest request = buildSnapRequest(obj, box);
    request.x = x + offsetX;
    request.y = y + offsetY;
    if (parent) {
        // Children snap inside their container's coordinate space.
        if (const auto* frame = std::get_if<ContainerShape>(&parent->shape); frame && frame->width > 0.0f && frame->height > 0.0f) {
            request.canvasWidth = frame->width;
            request.canvasHeight = frame->height;
        }
    }

    out = computeSnap(request, *siblings, obj.id);
    out.x -= offsetX;
    out.y -= offsetY;
    return true;
}

SnapRequest CanvasEditor::buildSnapRequest(const SceneObject& obj, const BoundingBox& box) const {
    SnapRequest request{};
    request.width = objectWidth(obj).value_or(box.width);
    request.height = objectHeight(obj).value_or(box.height);
    request.canvasWidth = state_.width;
    request.canvasHeight = state_.height;
    request.gridEnabled = state_.gridEnabled;
    request.snapEnabled = state_.snapEnabled;
    return request;
}

SnapResult CanvasEditor::previewMove(std::string_view id, float x, float y) const {
    SnapResult result{};
    result.x = x;
    result.y = y;
    computeMove(id, x, y, result);
    return result;
}

SnapResult CanvasEditor::moveObject(std::string_view id, float x, float y) {
    SnapResult result{};
    result.x = x;
    result.y = y;
    if (!computeMove(id, x, y, result)) {
        CANVAS_LOG_DEBUG("[editor] moveObject ignored, unknown id '%.*s'", static_cast<int>(id.size()), id.data());
        return result;
    }

    const SceneObject* obj = findObject(id);
    if (obj && obj->x == result.x && obj->y == result.y) return result;

    ObjectPatch patch{};
    patch.x = result.x;
    patch.y = result.y;
    updateObject(id, patch);
    return result;
}

// =============================================================================
// Grouping
// =============================================================================

std::optional<std::string> CanvasEditor::groupObjects(const std::vector<std::string>& ids) {
    std::vector<SceneObject> grouped;
    std::vector<std::string> groupedIds;
    for (const SceneObject& obj : state_.objects) {
        if (std::find(ids.begin(), ids.end(), obj.id) == ids.end()) continue;
        grouped.push_back(obj);
        groupedIds.push_back(obj.id);
    }
    if (grouped.size() < 2) {
        CANVAS_LOG_WARN("[editor] groupObjects needs at least 2 top-level objects, got %zu", grouped.size());
        return std::nullopt;
    }

    Bounds bounds{
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::lowest(),
        std::numeric_limits<float>::lowest(),
    };
    for (const SceneObject& obj : grouped) {
        const Bounds b = childExtent(obj);
        bounds.minX = std::min(bounds.minX, b.minX);
        bounds.minY = std::min(bounds.minY, b.minY);
        bounds.maxX = std::max(bounds.maxX, b.maxX);
        bounds.maxY = std::max(bounds.maxY, b.maxY);
    }

    SceneObject group{};
    group.id = generateId();
    group.kind = ObjectKind::Group;
    group.x = bounds.minX;
    group.y = bounds.minY;
    ContainerShape box{};
    box.width = bounds.maxX - bounds.minX;
    box.height = bounds.maxY - bounds.minY;
    group.shape = box;
    group.children = std::move(grouped);
    for (SceneObject& child : group.children) {
        child.x -= bounds.minX;
        child.y -= bounds.minY;
    }

    const std::string groupId = group.id;
    ContentSnapshot after = captureContent();
    after.objects.erase(
        std::remove_if(after.objects.begin(), after.objects.end(), [&groupedIds](const SceneObject& obj) {
            return std::find(groupedIds.begin(), groupedIds.end(), obj.id) != groupedIds.end();
        }),
        after.objects.end());
    after.objects.push_back(std::move(group));

    if (!commitContent("Group objects", std::move(after), std::vector<std::string>{groupId}, groupedIds)) {
        return std::nullopt;
    }
    return groupId;
}

bool CanvasEditor::ungroupObject(std::string_view id) {
    const std::ptrdiff_t index = topLevelIndex(state_.objects, id);
    if (index < 0 || state_.objects[static_cast<std::size_t>(index)].kind != ObjectKind::Group) {
        CANVAS_LOG_WARN("[editor] ungroupObject: '%.*s' is not a top-level group", static_cast<int>(id.size()), id.data());
        return false;
    }

    const SceneObject& group = state_.objects[static_cast<std::size_t>(index)];
    std::vector<SceneObject> released = group.children;
    std::vector<std::string> childIds;
    childIds.reserve(released.size());
    for (SceneObject& child : released) {
        child.x += group.x;
        child.y += group.y;
        childIds.push_back(child.id);
    }

    ContentSnapshot after = captureContent();
    after.objects.erase(after.objects.begin() + index);
    after.objects.insert(
        after.objects.begin() + index,
        std::make_move_iterator(released.begin()),
        std::make_move_iterator(released.end()));

    return commitContent("Ungroup objects", std::move(after), std::move(childIds), std::vector<std::string>{group.id});
}

// =============================================================================
// Frames / layers
// =============================================================================

bool CanvasEditor::attachImageToFrame(std::string_view imageId, std::string_view frameId) {
    const SceneObject* image = findObject(imageId);
    const SceneObject* frame = findObject(frameId);
    if (!image || image->kind != ObjectKind::Image || !frame || frame->kind != ObjectKind::Frame) {
        CANVAS_LOG_WARN("[editor] attachImageToFrame: invalid image or frame");
        return false;
    }

    const auto* img = std::get_if<ImageShape>(&image->shape);
    const auto* box = std::get_if<ContainerShape>(&frame->shape);
    if (!img || !box || img->width <= 0.0f || img->height <= 0.0f || box->width <= 0.0f || box->height <= 0.0f) {
        CANVAS_LOG_WARN("[editor] attachImageToFrame: degenerate image or frame size");
        return false;
    }

    // Fit inside the frame keeping the aspect ratio, centred.
    const float imageAspect = img->width / img->height;
    const float frameAspect = box->width / box->height;
    SceneObject child = *image;
    auto& fitted = std::get<ImageShape>(child.shape);
    child.x = 0.0f;
    child.y = 0.0f;
    if (imageAspect > frameAspect) {
        fitted.width = box->width;
        fitted.height = box->width / imageAspect;
        child.y = (box->height - fitted.height) * 0.5f;
    } else {
        fitted.height = box->height;
        fitted.width = box->height * imageAspect;
        child.x = (box->width - fitted.width) * 0.5f;
    }

    ContentSnapshot after = captureContent();

    ObjectPath imagePath;
    if (!findObjectPath(after.objects, imageId, imagePath)) return false;
    std::vector<SceneObject>* imageSiblings = siblingsAtPath(after.objects, imagePath);
    if (!imageSiblings) return false;
    imageSiblings->erase(imageSiblings->begin() + static_cast<std::ptrdiff_t>(imagePath.back()));
    imagePath.pop_back();
    refreshAncestorGroups(after.objects, imagePath);

    ObjectPath framePath;
    if (!findObjectPath(after.objects, frameId, framePath)) return false;
    SceneObject* target = objectAtPath(after.objects, framePath);
    if (!target) return false;
    target->children.clear();
    target->children.push_back(std::move(child));
    refreshAncestorGroups(after.objects, framePath);

    CANVAS_LOG_DEBUG("[editor] attached image '%.*s' to frame '%.*s'",
        static_cast<int>(imageId.size()), imageId.data(), static_cast<int>(frameId.size()), frameId.data());
    return commitContent("Attach image to frame", std::move(after));
}

bool CanvasEditor::toggleVisibility(std::string_view id) {
    const SceneObject* obj = findObject(id);
    if (!obj) return false;
    ObjectPatch patch{};
    patch.visible = !obj->visible;
    return updateObject(id, patch);
}

bool CanvasEditor::reorderObject(std::string_view id, ReorderDirection direction) {
    const std::ptrdiff_t index = topLevelIndex(state_.objects, id);
    if (index < 0) return false;

    const std::ptrdiff_t count = static_cast<std::ptrdiff_t>(state_.objects.size());
    const std::ptrdiff_t target = direction == ReorderDirection::Up ? index - 1 : index + 1;
    if (target < 0 || target >= count) return false;

    ContentSnapshot after = captureContent();
    std::swap(after.objects[static_cast<std::size_t>(index)], after.objects[static_cast<std::size_t>(target)]);
    std::string description = std::string("Reorder ") + objectKindName(after.objects[static_cast<std::size_t>(target)].kind);
    return commitContent(std::move(description), std::move(after));
}

} // namespace canvas
