#include "canvas/core/types.h"

#include <array>

namespace canvas {

namespace {
constexpr std::array<const char*, kObjectKindCount> kKindNames = {
    "rect",
    "circle",
    "text",
    "image",
    "line",
    "group",
    "frame",
    "gallery-item",
    "triangle",
    "star",
    "diamond",
};
} // namespace

const char* objectKindName(ObjectKind kind) noexcept {
    const auto index = static_cast<std::size_t>(kind);
    if (index >= kKindNames.size()) return "unknown";
    return kKindNames[index];
}

bool parseObjectKind(std::string_view name, ObjectKind& out) noexcept {
    for (std::size_t i = 0; i < kKindNames.size(); ++i) {
        if (name == kKindNames[i]) {
            out = static_cast<ObjectKind>(i);
            return true;
        }
    }
    return false;
}

std::size_t shapeIndexForKind(ObjectKind kind) noexcept {
    switch (kind) {
        case ObjectKind::Rect:
            return 0;
        case ObjectKind::Circle:
            return 1;
        case ObjectKind::Text:
            return 2;
        case ObjectKind::Image:
            return 3;
        case ObjectKind::Line:
        case ObjectKind::Triangle:
        case ObjectKind::Star:
        case ObjectKind::Diamond:
            return 4;
        case ObjectKind::Group:
        case ObjectKind::Frame:
        case ObjectKind::GalleryItem:
            return 5;
    }
    return 0;
}

ShapeData defaultShapeForKind(ObjectKind kind) {
    switch (shapeIndexForKind(kind)) {
        case 1:
            return CircleShape{};
        case 2:
            return TextShape{};
        case 3:
            return ImageShape{};
        case 4: {
            PathShape path{};
            path.closed = isPolygonKind(kind);
            return path;
        }
        case 5:
            return ContainerShape{};
        default:
            return RectShape{};
    }
}

bool operator==(const CropRect& a, const CropRect& b) noexcept {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

bool operator==(const RectShape& a, const RectShape& b) noexcept {
    return a.width == b.width && a.height == b.height && a.cornerRadius == b.cornerRadius
        && a.fill == b.fill && a.stroke == b.stroke && a.strokeWidth == b.strokeWidth;
}

bool operator==(const CircleShape& a, const CircleShape& b) noexcept {
    return a.radius == b.radius && a.fill == b.fill && a.stroke == b.stroke && a.strokeWidth == b.strokeWidth;
}

bool operator==(const TextShape& a, const TextShape& b) noexcept {
    return a.text == b.text && a.fontSize == b.fontSize && a.fontFamily == b.fontFamily
        && a.width == b.width && a.isHyperlink == b.isHyperlink && a.fill == b.fill
        && a.fontStyle == b.fontStyle && a.textDecoration == b.textDecoration && a.align == b.align;
}

bool operator==(const ImageShape& a, const ImageShape& b) noexcept {
    return a.src == b.src && a.width == b.width && a.height == b.height && a.crop == b.crop;
}

bool operator==(const PathShape& a, const PathShape& b) noexcept {
    return a.points == b.points && a.closed == b.closed && a.fill == b.fill && a.stroke == b.stroke
        && a.strokeWidth == b.strokeWidth && a.lineCap == b.lineCap && a.lineJoin == b.lineJoin;
}

bool operator==(const ContainerShape& a, const ContainerShape& b) noexcept {
    return a.width == b.width && a.height == b.height && a.background == b.background
        && a.borderColor == b.borderColor && a.borderWidth == b.borderWidth && a.fill == b.fill
        && a.stroke == b.stroke && a.strokeWidth == b.strokeWidth && a.dashEnabled == b.dashEnabled
        && a.placeholder == b.placeholder;
}

bool operator==(const SceneObject& a, const SceneObject& b) noexcept {
    return a.id == b.id && a.kind == b.kind && a.x == b.x && a.y == b.y && a.rotation == b.rotation
        && a.scaleX == b.scaleX && a.scaleY == b.scaleY && a.opacity == b.opacity && a.zIndex == b.zIndex
        && a.visible == b.visible && a.name == b.name && a.shape == b.shape && a.children == b.children;
}

bool operator==(const SceneDocument& a, const SceneDocument& b) noexcept {
    return a.objects == b.objects && a.width == b.width && a.height == b.height && a.background == b.background;
}

} // namespace canvas
