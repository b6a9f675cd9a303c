#ifndef ARTCHIVE_CANVAS_CORE_TYPES_H
#define ARTCHIVE_CANVAS_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Scene object model shared by the editor, snapping, renderer and persistence.

namespace canvas {

// Snapping / view constants
static constexpr float kSnapThreshold = 10.0f;
static constexpr float kGridSize = 10.0f;
static constexpr float kMinZoom = 0.2f;
static constexpr float kMaxZoom = 3.0f;

// Document defaults
static constexpr float kDefaultCanvasWidth = 1920.0f;
static constexpr float kDefaultCanvasHeight = 1080.0f;
static constexpr float kDefaultPasteOffset = 20.0f;
static constexpr double kDefaultAutosaveIntervalMs = 60000.0;

// Text estimate factors (used when no font measurement is available)
static constexpr float kDefaultFontSize = 16.0f;
static constexpr float kTextLineHeightFactor = 1.2f;
static constexpr float kTextCharWidthFactor = 0.6f;

enum class ObjectKind : std::uint8_t {
    Rect = 0,
    Circle = 1,
    Text = 2,
    Image = 3,
    Line = 4,
    Group = 5,
    Frame = 6,
    GalleryItem = 7,
    Triangle = 8,
    Star = 9,
    Diamond = 10,
};

static constexpr std::uint8_t kObjectKindCount = 11;

const char* objectKindName(ObjectKind kind) noexcept;
bool parseObjectKind(std::string_view name, ObjectKind& out) noexcept;

inline bool isContainerKind(ObjectKind kind) noexcept {
    return kind == ObjectKind::Group || kind == ObjectKind::Frame || kind == ObjectKind::GalleryItem;
}

inline bool isPolygonKind(ObjectKind kind) noexcept {
    return kind == ObjectKind::Triangle || kind == ObjectKind::Star || kind == ObjectKind::Diamond;
}

inline bool isPathKind(ObjectKind kind) noexcept {
    return kind == ObjectKind::Line || isPolygonKind(kind);
}

struct CropRect {
    float x;
    float y;
    float width;
    float height;
};

// Variant payloads. Colors are stored as CSS color strings; empty means unset.

struct RectShape {
    float width{0.0f};
    float height{0.0f};
    float cornerRadius{0.0f};
    std::string fill;
    std::string stroke;
    float strokeWidth{0.0f};
};

struct CircleShape {
    float radius{0.0f};
    std::string fill;
    std::string stroke;
    float strokeWidth{0.0f};
};

struct TextShape {
    std::string text;
    float fontSize{kDefaultFontSize};
    std::string fontFamily;
    std::optional<float> width; // soft wrap constraint
    bool isHyperlink{false};
    std::string fill;
    std::string fontStyle;
    std::string textDecoration;
    std::string align;
};

struct ImageShape {
    std::string src;
    float width{0.0f};
    float height{0.0f};
    std::optional<CropRect> crop;
};

// line, triangle, star, diamond. Points alternate x/y relative to the object position.
struct PathShape {
    std::vector<float> points;
    bool closed{false};
    std::string fill;
    std::string stroke;
    float strokeWidth{0.0f};
    std::string lineCap;
    std::string lineJoin;
};

// group, frame, gallery-item
struct ContainerShape {
    float width{0.0f};
    float height{0.0f};
    std::string background;
    std::string borderColor;
    float borderWidth{0.0f};
    std::string fill;
    std::string stroke;
    float strokeWidth{0.0f};
    bool dashEnabled{false};
    std::string placeholder;
};

using ShapeData = std::variant<RectShape, CircleShape, TextShape, ImageShape, PathShape, ContainerShape>;

// Index of the ShapeData alternative a kind must carry.
std::size_t shapeIndexForKind(ObjectKind kind) noexcept;
ShapeData defaultShapeForKind(ObjectKind kind);

inline bool shapeMatchesKind(ObjectKind kind, const ShapeData& shape) noexcept {
    return shape.index() == shapeIndexForKind(kind);
}

struct SceneObject {
    std::string id;
    ObjectKind kind{ObjectKind::Rect};
    float x{0.0f};
    float y{0.0f};
    float rotation{0.0f}; // degrees
    float scaleX{1.0f};
    float scaleY{1.0f};
    float opacity{1.0f};
    std::int32_t zIndex{0};
    bool visible{true};
    std::string name;
    ShapeData shape;
    // Owned exclusively; only populated for container kinds.
    std::vector<SceneObject> children;
};

struct BoundingBox {
    float x;
    float y;
    float width;
    float height;
};

struct Bounds {
    float minX;
    float minY;
    float maxX;
    float maxY;
};

// Shape exchanged with the persistence collaborator.
struct SceneDocument {
    std::vector<SceneObject> objects;
    std::optional<float> width;
    std::optional<float> height;
    std::optional<std::string> background;
};

enum class SnapAxis : std::uint8_t {
    Vertical = 0,   // guide is a vertical line, position is an x coordinate
    Horizontal = 1, // guide is a horizontal line, position is a y coordinate
};

enum class SnapSource : std::uint8_t {
    CanvasCenter = 0,
    Grid = 1,
    Object = 2,
};

struct SnapGuide {
    SnapAxis axis;
    float position;
    SnapSource source;
};

enum class CodecError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownObjectKind = 5,
    NestingTooDeep = 6,
};

// Structural equality (used by history tests and document comparison).
bool operator==(const CropRect& a, const CropRect& b) noexcept;
bool operator==(const RectShape& a, const RectShape& b) noexcept;
bool operator==(const CircleShape& a, const CircleShape& b) noexcept;
bool operator==(const TextShape& a, const TextShape& b) noexcept;
bool operator==(const ImageShape& a, const ImageShape& b) noexcept;
bool operator==(const PathShape& a, const PathShape& b) noexcept;
bool operator==(const ContainerShape& a, const ContainerShape& b) noexcept;
bool operator==(const SceneObject& a, const SceneObject& b) noexcept;
bool operator==(const SceneDocument& a, const SceneDocument& b) noexcept;

inline bool operator!=(const SceneObject& a, const SceneObject& b) noexcept { return !(a == b); }
inline bool operator!=(const SceneDocument& a, const SceneDocument& b) noexcept { return !(a == b); }

} // namespace canvas

#endif // ARTCHIVE_CANVAS_CORE_TYPES_H
