#ifndef ARTCHIVE_CANVAS_RENDER_SCENE_RENDERER_H
#define ARTCHIVE_CANVAS_RENDER_SCENE_RENDERER_H

#include "canvas/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace canvas {

namespace text {
class TextMeasurer;
}

enum class VisualKind : std::uint8_t {
    Empty = 0,     // invisible or malformed object
    Box = 1,       // rect
    Ellipse = 2,   // circle
    Text = 3,
    Link = 4,      // text with a derived href
    Image = 5,
    Path = 6,      // line / triangle / star / diamond
    Container = 7, // group / frame / gallery-item
    Label = 8,     // frame placeholder, centred on (left, top)
};

const char* visualKindName(VisualKind kind) noexcept;

enum class TransformOpKind : std::uint8_t {
    Rotate = 0, // a = degrees
    Scale = 1,  // a = sx, b = sy
};

struct TransformOp {
    TransformOpKind kind;
    float a;
    float b;
};

// Positioned, transformed visual region. Coordinates are in the parent node's
// space, already multiplied by the projection scale. Transforms apply in list
// order around the node's top-left corner.
struct VisualNode {
    VisualKind kind{VisualKind::Empty};
    std::string id;
    float left{0.0f};
    float top{0.0f};
    float width{0.0f};
    float height{0.0f};
    float opacity{1.0f};
    std::int32_t zIndex{0};
    std::vector<TransformOp> transforms;

    // Box / Ellipse / Container / Path
    std::string fill;
    std::string stroke;
    float strokeWidth{0.0f};
    float cornerRadius{0.0f};
    bool dashed{false};

    // Text / Link / Label
    std::string text;
    std::vector<std::string> lines; // wrapped lines when measured
    std::string href;
    float fontSize{0.0f};
    std::string fontFamily;
    std::string fontStyle;
    std::string textDecoration;
    std::string align;
    std::optional<float> maxWidth;
    bool wrap{false};

    // Image
    std::string src;
    bool cropped{false};
    float sourceX{0.0f}; // image offset inside the cropped region
    float sourceY{0.0f};
    float sourceWidth{0.0f};
    float sourceHeight{0.0f};

    // Path: `pathData` is expressed in viewBox units.
    std::string pathData;
    bool closed{false};
    float viewBoxWidth{0.0f};
    float viewBoxHeight{0.0f};
    std::string lineCap;
    std::string lineJoin;

    std::vector<VisualNode> children;
};

struct ProjectOptions {
    // Prepended to hyperlinks that are site-relative paths ("/gallery/1").
    std::string origin;
    // When set, text nodes carry measured lines and size.
    text::TextMeasurer* measurer{nullptr};
};

static constexpr float kTextLineHeight = 1.2f;
static constexpr float kPlaceholderFontSize = 14.0f;
static constexpr const char* kPlaceholderColor = "#999";
static constexpr const char* kDefaultPathStroke = "#000000";

// Largest scale that fits the canvas in the viewport, never above 1.
float calculateFitScale(float canvasWidth, float canvasHeight, float viewportWidth, float viewportHeight);

// Absolute URL for hyperlink text, or empty when the text does not look like
// a link: absolute http(s) URLs pass through, "www." and bare domains get an
// https scheme, site-relative paths get `origin` prepended.
std::string deriveHyperlink(std::string_view text, std::string_view origin);

std::vector<TransformOp> objectTransforms(const SceneObject& obj);

// Projects one object (and its children) at `scale`. Pure.
VisualNode project(const SceneObject& obj, float scale, const ProjectOptions& options = {});

// Root container of canvas size holding every top-level object, stable
// sorted by zIndex.
VisualNode projectScene(
    const std::vector<SceneObject>& objects,
    float canvasWidth,
    float canvasHeight,
    const std::optional<std::string>& background,
    float scale,
    const ProjectOptions& options = {});
VisualNode projectScene(const SceneDocument& doc, float scale, const ProjectOptions& options = {});

} // namespace canvas

#endif // ARTCHIVE_CANVAS_RENDER_SCENE_RENDERER_H
