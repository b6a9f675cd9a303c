#ifndef ARTCHIVE_CANVAS_SCENE_SHAPE_FACTORY_H
#define ARTCHIVE_CANVAS_SCENE_SHAPE_FACTORY_H

#include "canvas/core/types.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas {

static constexpr float kDefaultShapeX = 100.0f;
static constexpr float kDefaultShapeY = 100.0f;
static constexpr float kDefaultStrokeWidth = 2.0f;
static constexpr const char* kDefaultShapeFill = "#3b82f6";
static constexpr const char* kDefaultShapeStroke = "#1e40af";
static constexpr float kStarOuterRadius = 50.0f;
static constexpr float kStarInnerRatio = 0.4f;
static constexpr int kStarPointCount = 5;
static constexpr float kDefaultTextFontSize = 24.0f;
static constexpr float kDefaultTextWidth = 200.0f;
static constexpr const char* kDefaultTextFamily = "Arial";
static constexpr const char* kDefaultFrameStroke = "#9ca3af";

// Palette keys ("rectangle", "circle", "line", "triangle", "star", "diamond").
bool parseShapeKey(std::string_view key, ObjectKind& out) noexcept;

// Builds a palette shape with default size and style. Null for kinds the
// palette does not offer (text, image, containers).
std::optional<SceneObject> createShape(ObjectKind kind, std::string id, float x = kDefaultShapeX, float y = kDefaultShapeY);

// Text box with the editor defaults (Arial, black, 200 wide for wrapping).
SceneObject createText(std::string id, std::string content, float x, float y, float fontSize = kDefaultTextFontSize);
SceneObject createImage(std::string id, std::string src, float x, float y, float width, float height);
// Dashed, empty frame showing `placeholder` until an image is attached.
SceneObject createFrame(std::string id, float x, float y, float width, float height, std::string placeholder);

// Closed outline of a star centred at (r, r) in its own box, first point repeated.
std::vector<float> starPoints(float radius, int points);

} // namespace canvas

#endif // ARTCHIVE_CANVAS_SCENE_SHAPE_FACTORY_H
