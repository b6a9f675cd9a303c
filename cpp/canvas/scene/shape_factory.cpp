#include "canvas/scene/shape_factory.h"

#include <cmath>
#include <utility>

namespace canvas {

namespace {

constexpr float kPi = 3.14159265358979323846f;

PathShape styledPath(std::vector<float> points, bool closed) {
    PathShape path{};
    path.points = std::move(points);
    path.closed = closed;
    path.fill = kDefaultShapeFill;
    path.stroke = kDefaultShapeStroke;
    path.strokeWidth = kDefaultStrokeWidth;
    return path;
}

} // namespace

bool parseShapeKey(std::string_view key, ObjectKind& out) noexcept {
    if (key == "rectangle" || key == "rect") {
        out = ObjectKind::Rect;
    } else if (key == "circle") {
        out = ObjectKind::Circle;
    } else if (key == "line") {
        out = ObjectKind::Line;
    } else if (key == "triangle") {
        out = ObjectKind::Triangle;
    } else if (key == "star") {
        out = ObjectKind::Star;
    } else if (key == "diamond") {
        out = ObjectKind::Diamond;
    } else {
        return false;
    }
    return true;
}

std::vector<float> starPoints(float radius, int points) {
    const float inner = radius * kStarInnerRatio;
    const float step = (kPi * 2.0f) / static_cast<float>(points * 2);

    std::vector<float> coords;
    coords.reserve(static_cast<std::size_t>(points) * 4 + 2);
    for (int i = 0; i < points * 2; ++i) {
        const float r = (i % 2 == 0) ? radius : inner;
        const float angle = static_cast<float>(i) * step - kPi / 2.0f;
        coords.push_back(radius + r * std::cos(angle));
        coords.push_back(radius + r * std::sin(angle));
    }
    if (coords.size() >= 2) {
        coords.push_back(coords[0]);
        coords.push_back(coords[1]);
    }
    return coords;
}

std::optional<SceneObject> createShape(ObjectKind kind, std::string id, float x, float y) {
    SceneObject obj{};
    obj.id = std::move(id);
    obj.kind = kind;
    obj.x = x;
    obj.y = y;

    switch (kind) {
        case ObjectKind::Rect: {
            RectShape rect{};
            rect.width = 200.0f;
            rect.height = 150.0f;
            rect.fill = kDefaultShapeFill;
            rect.stroke = kDefaultShapeStroke;
            rect.strokeWidth = kDefaultStrokeWidth;
            obj.shape = std::move(rect);
            break;
        }
        case ObjectKind::Circle: {
            CircleShape circle{};
            circle.radius = 75.0f;
            circle.fill = kDefaultShapeFill;
            circle.stroke = kDefaultShapeStroke;
            circle.strokeWidth = kDefaultStrokeWidth;
            obj.shape = std::move(circle);
            break;
        }
        case ObjectKind::Line: {
            PathShape line = styledPath({0.0f, 0.0f, 200.0f, 0.0f}, false);
            line.stroke = "#000000";
            line.lineCap = "round";
            line.lineJoin = "round";
            obj.shape = std::move(line);
            break;
        }
        case ObjectKind::Triangle:
            obj.shape = styledPath({0.0f, 100.0f, 50.0f, 0.0f, 100.0f, 100.0f, 0.0f, 100.0f}, true);
            break;
        case ObjectKind::Star:
            obj.shape = styledPath(starPoints(kStarOuterRadius, kStarPointCount), true);
            break;
        case ObjectKind::Diamond:
            obj.shape = styledPath({50.0f, 0.0f, 100.0f, 50.0f, 50.0f, 100.0f, 0.0f, 50.0f, 50.0f, 0.0f}, true);
            break;
        default:
            return std::nullopt;
    }
    return obj;
}

SceneObject createText(std::string id, std::string content, float x, float y, float fontSize) {
    SceneObject obj{};
    obj.id = std::move(id);
    obj.kind = ObjectKind::Text;
    obj.x = x;
    obj.y = y;
    TextShape text{};
    text.text = std::move(content);
    text.fontSize = fontSize > 0.0f ? fontSize : kDefaultTextFontSize;
    text.fontFamily = kDefaultTextFamily;
    text.fill = "#000000";
    text.width = kDefaultTextWidth;
    obj.shape = std::move(text);
    return obj;
}

SceneObject createImage(std::string id, std::string src, float x, float y, float width, float height) {
    SceneObject obj{};
    obj.id = std::move(id);
    obj.kind = ObjectKind::Image;
    obj.x = x;
    obj.y = y;
    ImageShape image{};
    image.src = std::move(src);
    image.width = width;
    image.height = height;
    obj.shape = std::move(image);
    return obj;
}

SceneObject createFrame(std::string id, float x, float y, float width, float height, std::string placeholder) {
    SceneObject obj{};
    obj.id = std::move(id);
    obj.kind = ObjectKind::Frame;
    obj.x = x;
    obj.y = y;
    ContainerShape frame{};
    frame.width = width;
    frame.height = height;
    frame.stroke = kDefaultFrameStroke;
    frame.strokeWidth = kDefaultStrokeWidth;
    frame.dashEnabled = true;
    frame.placeholder = std::move(placeholder);
    obj.shape = std::move(frame);
    return obj;
}

} // namespace canvas
