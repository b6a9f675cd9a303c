#include "canvas/scene/scene_object.h"

#include "canvas/core/string_utils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <unordered_set>

namespace canvas {

namespace {

std::size_t countCodepoints(const std::string& s) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < s.size()) {
        std::uint32_t len = 0;
        decodeUtf8Codepoint(s, pos, len);
        if (len == 0) break;
        pos += len;
        ++count;
    }
    return count;
}

std::size_t countLines(const std::string& s) {
    return static_cast<std::size_t>(std::count(s.begin(), s.end(), '\n')) + 1;
}

bool finite(float v) {
    return std::isfinite(v);
}

// Unscaled local size for kinds that carry one.
void storedSize(const SceneObject& obj, float& w, float& h) {
    w = 0.0f;
    h = 0.0f;
    if (const auto* rect = std::get_if<RectShape>(&obj.shape)) {
        w = rect->width;
        h = rect->height;
    } else if (const auto* image = std::get_if<ImageShape>(&obj.shape)) {
        w = image->width;
        h = image->height;
    } else if (const auto* box = std::get_if<ContainerShape>(&obj.shape)) {
        w = box->width;
        h = box->height;
    } else if (const auto* circle = std::get_if<CircleShape>(&obj.shape)) {
        w = circle->radius * 2.0f;
        h = circle->radius * 2.0f;
    } else if (const auto* text = std::get_if<TextShape>(&obj.shape)) {
        w = text->width ? *text->width : estimateTextWidth(*text);
        h = estimateTextHeight(*text);
    }
}

ValidationIssue validateShape(const SceneObject& obj) {
    if (!shapeMatchesKind(obj.kind, obj.shape)) return ValidationIssue::ShapeMismatch;

    return std::visit([](const auto& s) -> ValidationIssue {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, RectShape>) {
            if (!finite(s.width) || !finite(s.height) || !finite(s.strokeWidth)) return ValidationIssue::NonFiniteValue;
            if (s.width < 0.0f || s.height < 0.0f) return ValidationIssue::NegativeSize;
        } else if constexpr (std::is_same_v<T, CircleShape>) {
            if (!finite(s.radius) || !finite(s.strokeWidth)) return ValidationIssue::NonFiniteValue;
            if (s.radius < 0.0f) return ValidationIssue::NegativeSize;
        } else if constexpr (std::is_same_v<T, TextShape>) {
            if (!finite(s.fontSize) || (s.width && !finite(*s.width))) return ValidationIssue::NonFiniteValue;
            if (s.fontSize < 0.0f || (s.width && *s.width < 0.0f)) return ValidationIssue::NegativeSize;
        } else if constexpr (std::is_same_v<T, ImageShape>) {
            if (!finite(s.width) || !finite(s.height)) return ValidationIssue::NonFiniteValue;
            if (s.width < 0.0f || s.height < 0.0f) return ValidationIssue::NegativeSize;
            if (s.crop) {
                if (!finite(s.crop->x) || !finite(s.crop->y) || !finite(s.crop->width) || !finite(s.crop->height)) {
                    return ValidationIssue::NonFiniteValue;
                }
                if (s.crop->width < 0.0f || s.crop->height < 0.0f) return ValidationIssue::NegativeSize;
            }
        } else if constexpr (std::is_same_v<T, PathShape>) {
            if ((s.points.size() & 1u) != 0) return ValidationIssue::OddPointCount;
            for (const float p : s.points) {
                if (!finite(p)) return ValidationIssue::NonFiniteValue;
            }
        } else if constexpr (std::is_same_v<T, ContainerShape>) {
            if (!finite(s.width) || !finite(s.height) || !finite(s.borderWidth)) return ValidationIssue::NonFiniteValue;
            if (s.width < 0.0f || s.height < 0.0f) return ValidationIssue::NegativeSize;
        }
        return ValidationIssue::None;
    }, obj.shape);
}

ValidationIssue validateRecursive(const SceneObject& obj, std::unordered_set<std::string>& seen) {
    if (obj.id.empty()) return ValidationIssue::EmptyId;
    if (!seen.insert(obj.id).second) return ValidationIssue::DuplicateId;

    if (!finite(obj.x) || !finite(obj.y) || !finite(obj.rotation) || !finite(obj.scaleX)
        || !finite(obj.scaleY) || !finite(obj.opacity)) {
        return ValidationIssue::NonFiniteValue;
    }

    const ValidationIssue shapeIssue = validateShape(obj);
    if (shapeIssue != ValidationIssue::None) return shapeIssue;

    if (!obj.children.empty() && !isContainerKind(obj.kind)) return ValidationIssue::ChildrenOnLeaf;

    for (const SceneObject& child : obj.children) {
        const ValidationIssue issue = validateRecursive(child, seen);
        if (issue != ValidationIssue::None) return issue;
    }
    return ValidationIssue::None;
}

} // namespace

std::optional<float> objectWidth(const SceneObject& obj) {
    switch (obj.kind) {
        case ObjectKind::Rect:
            if (const auto* rect = std::get_if<RectShape>(&obj.shape)) return rect->width * obj.scaleX;
            break;
        case ObjectKind::Image:
            if (const auto* image = std::get_if<ImageShape>(&obj.shape)) return image->width * obj.scaleX;
            break;
        case ObjectKind::GalleryItem:
            if (const auto* box = std::get_if<ContainerShape>(&obj.shape)) return box->width * obj.scaleX;
            break;
        case ObjectKind::Circle:
            if (const auto* circle = std::get_if<CircleShape>(&obj.shape)) return circle->radius * 2.0f * obj.scaleX;
            break;
        case ObjectKind::Text:
            if (const auto* text = std::get_if<TextShape>(&obj.shape); text && text->width) {
                return *text->width * obj.scaleX;
            }
            break;
        default:
            break;
    }
    return std::nullopt;
}

std::optional<float> objectHeight(const SceneObject& obj) {
    switch (obj.kind) {
        case ObjectKind::Rect:
            if (const auto* rect = std::get_if<RectShape>(&obj.shape)) return rect->height * obj.scaleY;
            break;
        case ObjectKind::Image:
            if (const auto* image = std::get_if<ImageShape>(&obj.shape)) return image->height * obj.scaleY;
            break;
        case ObjectKind::GalleryItem:
            if (const auto* box = std::get_if<ContainerShape>(&obj.shape)) return box->height * obj.scaleY;
            break;
        case ObjectKind::Circle:
            if (const auto* circle = std::get_if<CircleShape>(&obj.shape)) return circle->radius * 2.0f * obj.scaleY;
            break;
        default:
            break;
    }
    return std::nullopt;
}

std::optional<Bounds> pathBounds(const std::vector<float>& points) {
    if (points.size() < 4) return std::nullopt;
    Bounds b{
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::lowest(),
        std::numeric_limits<float>::lowest(),
    };
    for (std::size_t i = 0; i + 1 < points.size(); i += 2) {
        b.minX = std::min(b.minX, points[i]);
        b.minY = std::min(b.minY, points[i + 1]);
        b.maxX = std::max(b.maxX, points[i]);
        b.maxY = std::max(b.maxY, points[i + 1]);
    }
    return b;
}

float estimateTextWidth(const TextShape& text) {
    return static_cast<float>(countCodepoints(text.text)) * text.fontSize * kTextCharWidthFactor;
}

float estimateTextHeight(const TextShape& text) {
    return static_cast<float>(countLines(text.text)) * text.fontSize * kTextLineHeightFactor;
}

Bounds childExtent(const SceneObject& child) {
    if (const auto* path = std::get_if<PathShape>(&child.shape)) {
        const auto local = pathBounds(path->points);
        if (!local) return Bounds{child.x, child.y, child.x, child.y};
        return Bounds{
            child.x + local->minX * child.scaleX,
            child.y + local->minY * child.scaleY,
            child.x + local->maxX * child.scaleX,
            child.y + local->maxY * child.scaleY,
        };
    }
    if (const auto* circle = std::get_if<CircleShape>(&child.shape)) {
        const float rx = circle->radius * child.scaleX;
        const float ry = circle->radius * child.scaleY;
        return Bounds{child.x - rx, child.y - ry, child.x + rx, child.y + ry};
    }

    float w = 0.0f;
    float h = 0.0f;
    storedSize(child, w, h);
    return Bounds{child.x, child.y, child.x + w * child.scaleX, child.y + h * child.scaleY};
}

BoundingBox boundingBox(const SceneObject& obj) {
    const Bounds b = childExtent(obj);
    return BoundingBox{b.minX, b.minY, b.maxX - b.minX, b.maxY - b.minY};
}

std::optional<Bounds> groupVisualBounds(const SceneObject& group) {
    if (!isContainerKind(group.kind)) return std::nullopt;

    std::optional<Bounds> out;
    for (const SceneObject& child : group.children) {
        if (!child.visible) continue;
        const Bounds b = childExtent(child);
        if (!out) {
            out = b;
            continue;
        }
        out->minX = std::min(out->minX, b.minX);
        out->minY = std::min(out->minY, b.minY);
        out->maxX = std::max(out->maxX, b.maxX);
        out->maxY = std::max(out->maxY, b.maxY);
    }
    return out;
}

bool recalculateGroupBounds(SceneObject& group) {
    if (group.kind != ObjectKind::Group) return false;
    auto* box = std::get_if<ContainerShape>(&group.shape);
    if (!box) return false;

    const auto bounds = groupVisualBounds(group);
    if (!bounds) return false;

    const float width = bounds->maxX - bounds->minX;
    const float height = bounds->maxY - bounds->minY;
    if (box->width == width && box->height == height) return false;
    box->width = width;
    box->height = height;
    return true;
}

bool ObjectPatch::empty() const noexcept {
    return !x && !y && !rotation && !scaleX && !scaleY && !opacity && !zIndex && !visible && !name
        && !shape && !children;
}

bool applyPatch(SceneObject& obj, const ObjectPatch& patch) {
    if (patch.shape && !shapeMatchesKind(obj.kind, *patch.shape)) return false;
    if (patch.children && !patch.children->empty() && !isContainerKind(obj.kind)) return false;

    if (patch.x) obj.x = *patch.x;
    if (patch.y) obj.y = *patch.y;
    if (patch.rotation) obj.rotation = *patch.rotation;
    if (patch.scaleX) obj.scaleX = *patch.scaleX;
    if (patch.scaleY) obj.scaleY = *patch.scaleY;
    if (patch.opacity) obj.opacity = std::clamp(*patch.opacity, 0.0f, 1.0f);
    if (patch.zIndex) obj.zIndex = *patch.zIndex;
    if (patch.visible) obj.visible = *patch.visible;
    if (patch.name) obj.name = *patch.name;
    if (patch.shape) obj.shape = *patch.shape;
    if (patch.children) obj.children = *patch.children;
    return true;
}

const char* validationIssueName(ValidationIssue issue) noexcept {
    switch (issue) {
        case ValidationIssue::None: return "none";
        case ValidationIssue::EmptyId: return "empty-id";
        case ValidationIssue::DuplicateId: return "duplicate-id";
        case ValidationIssue::NonFiniteValue: return "non-finite-value";
        case ValidationIssue::NegativeSize: return "negative-size";
        case ValidationIssue::OddPointCount: return "odd-point-count";
        case ValidationIssue::ShapeMismatch: return "shape-mismatch";
        case ValidationIssue::ChildrenOnLeaf: return "children-on-leaf";
    }
    return "unknown";
}

ValidationIssue validateObject(const SceneObject& obj) {
    std::unordered_set<std::string> seen;
    return validateRecursive(obj, seen);
}

ValidationIssue validateDocument(const SceneDocument& doc) {
    if ((doc.width && (!finite(*doc.width) || *doc.width < 0.0f))
        || (doc.height && (!finite(*doc.height) || *doc.height < 0.0f))) {
        return ValidationIssue::NegativeSize;
    }
    std::unordered_set<std::string> seen;
    for (const SceneObject& obj : doc.objects) {
        const ValidationIssue issue = validateRecursive(obj, seen);
        if (issue != ValidationIssue::None) return issue;
    }
    return ValidationIssue::None;
}

} // namespace canvas
