// Content digest for CanvasEditor: stable across undo/redo round trips, used
// by tests and the bindings to detect document changes cheaply.

#include "canvas/editor/canvas_editor.h"
#include "canvas/core/string_utils.h"

#include <type_traits>

namespace canvas {

namespace {

std::uint64_t hashOptionalString(std::uint64_t h, const std::optional<std::string>& s) {
    h = hashU32(h, s ? 1u : 0u);
    return s ? hashString(h, *s) : h;
}

std::uint64_t hashShape(std::uint64_t h, const ShapeData& shape) {
    h = hashU32(h, static_cast<std::uint32_t>(shape.index()));
    return std::visit([h](const auto& s) mutable -> std::uint64_t {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, RectShape>) {
            h = hashF32(h, s.width);
            h = hashF32(h, s.height);
            h = hashF32(h, s.cornerRadius);
            h = hashString(h, s.fill);
            h = hashString(h, s.stroke);
            h = hashF32(h, s.strokeWidth);
        } else if constexpr (std::is_same_v<T, CircleShape>) {
            h = hashF32(h, s.radius);
            h = hashString(h, s.fill);
            h = hashString(h, s.stroke);
            h = hashF32(h, s.strokeWidth);
        } else if constexpr (std::is_same_v<T, TextShape>) {
            h = hashString(h, s.text);
            h = hashF32(h, s.fontSize);
            h = hashString(h, s.fontFamily);
            h = hashU32(h, s.width ? 1u : 0u);
            if (s.width) h = hashF32(h, *s.width);
            h = hashU32(h, s.isHyperlink ? 1u : 0u);
            h = hashString(h, s.fill);
            h = hashString(h, s.fontStyle);
            h = hashString(h, s.textDecoration);
            h = hashString(h, s.align);
        } else if constexpr (std::is_same_v<T, ImageShape>) {
            h = hashString(h, s.src);
            h = hashF32(h, s.width);
            h = hashF32(h, s.height);
            h = hashU32(h, s.crop ? 1u : 0u);
            if (s.crop) {
                h = hashF32(h, s.crop->x);
                h = hashF32(h, s.crop->y);
                h = hashF32(h, s.crop->width);
                h = hashF32(h, s.crop->height);
            }
        } else if constexpr (std::is_same_v<T, PathShape>) {
            h = hashU32(h, static_cast<std::uint32_t>(s.points.size()));
            for (const float p : s.points) h = hashF32(h, p);
            h = hashU32(h, s.closed ? 1u : 0u);
            h = hashString(h, s.fill);
            h = hashString(h, s.stroke);
            h = hashF32(h, s.strokeWidth);
            h = hashString(h, s.lineCap);
            h = hashString(h, s.lineJoin);
        } else if constexpr (std::is_same_v<T, ContainerShape>) {
            h = hashF32(h, s.width);
            h = hashF32(h, s.height);
            h = hashString(h, s.background);
            h = hashString(h, s.borderColor);
            h = hashF32(h, s.borderWidth);
            h = hashString(h, s.fill);
            h = hashString(h, s.stroke);
            h = hashF32(h, s.strokeWidth);
            h = hashU32(h, s.dashEnabled ? 1u : 0u);
            h = hashString(h, s.placeholder);
        }
        return h;
    }, shape);
}

std::uint64_t hashObjects(std::uint64_t h, const std::vector<SceneObject>& objects) {
    h = hashU32(h, static_cast<std::uint32_t>(objects.size()));
    for (const SceneObject& obj : objects) {
        h = hashString(h, obj.id);
        h = hashU32(h, static_cast<std::uint32_t>(obj.kind));
        h = hashF32(h, obj.x);
        h = hashF32(h, obj.y);
        h = hashF32(h, obj.rotation);
        h = hashF32(h, obj.scaleX);
        h = hashF32(h, obj.scaleY);
        h = hashF32(h, obj.opacity);
        h = hashU32(h, static_cast<std::uint32_t>(obj.zIndex));
        h = hashU32(h, obj.visible ? 1u : 0u);
        h = hashString(h, obj.name);
        h = hashShape(h, obj.shape);
        h = hashObjects(h, obj.children);
    }
    return h;
}

} // namespace

std::uint64_t CanvasEditor::getDocumentDigest() const {
    std::uint64_t h = kDigestOffset;
    h = hashU32(h, 0x4E435347u); // "GSCN"
    h = hashF32(h, state_.width);
    h = hashF32(h, state_.height);
    h = hashOptionalString(h, state_.background);
    return hashObjects(h, state_.objects);
}

} // namespace canvas
