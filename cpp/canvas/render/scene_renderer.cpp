#include "canvas/render/scene_renderer.h"

#include "canvas/core/string_utils.h"
#include "canvas/scene/scene_object.h"
#include "canvas/text/text_measure.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace canvas {

static float normalizeScale(float scale) {
    return (scale > 1e-6f && std::isfinite(scale)) ? scale : 1.0f;
}

// Stroke widths of 0 mean "default" in stored documents.
static float strokeOrDefault(float strokeWidth) {
    return strokeWidth > 0.0f ? strokeWidth : 1.0f;
}

static bool looksLikeDomain(std::string_view s) {
    std::size_t i = 0;
    if (s.empty() || !isAsciiAlnum(s[0])) return false;
    ++i;
    while (i < s.size() && (isAsciiAlnum(s[i]) || s[i] == '-')) ++i;
    if (i >= s.size() || s[i] != '.') return false;
    ++i;
    std::size_t letters = 0;
    while (i + letters < s.size() && isAsciiAlpha(s[i + letters])) ++letters;
    return letters >= 2;
}

static std::string buildPathData(const std::vector<float>& xs, const std::vector<float>& ys, bool closed) {
    std::string d;
    for (std::size_t i = 0; i < xs.size(); ++i) {
        d += i == 0 ? "M " : " L ";
        d += formatNumber(xs[i]);
        d += ' ';
        d += formatNumber(ys[i]);
    }
    if (closed) d += " Z";
    return d;
}

const char* visualKindName(VisualKind kind) noexcept {
    switch (kind) {
        case VisualKind::Empty: return "empty";
        case VisualKind::Box: return "box";
        case VisualKind::Ellipse: return "ellipse";
        case VisualKind::Text: return "text";
        case VisualKind::Link: return "link";
        case VisualKind::Image: return "image";
        case VisualKind::Path: return "path";
        case VisualKind::Container: return "container";
        case VisualKind::Label: return "label";
    }
    return "unknown";
}

float calculateFitScale(float canvasWidth, float canvasHeight, float viewportWidth, float viewportHeight) {
    if (!(canvasWidth > 0.0f) || !(canvasHeight > 0.0f)) return 1.0f;
    const float scaleX = viewportWidth / canvasWidth;
    const float scaleY = viewportHeight / canvasHeight;
    const float scale = std::min(std::min(scaleX, scaleY), 1.0f);
    return std::isfinite(scale) && scale > 0.0f ? scale : 1.0f;
}

std::string deriveHyperlink(std::string_view text, std::string_view origin) {
    const std::string_view trimmed = trimAscii(text);
    if (trimmed.empty()) return {};

    if (startsWithIgnoreCase(trimmed, "http://") || startsWithIgnoreCase(trimmed, "https://")) {
        return std::string(trimmed);
    }
    if (startsWithIgnoreCase(trimmed, "www.")) {
        return "https://" + std::string(trimmed);
    }
    if (trimmed.find(' ') == std::string_view::npos && looksLikeDomain(trimmed)) {
        return "https://" + std::string(trimmed);
    }
    if (trimmed.front() == '/') {
        if (origin.empty()) return {};
        return std::string(origin) + std::string(trimmed);
    }
    return {};
}

std::vector<TransformOp> objectTransforms(const SceneObject& obj) {
    std::vector<TransformOp> ops;
    if (obj.rotation != 0.0f) {
        ops.push_back(TransformOp{TransformOpKind::Rotate, obj.rotation, 0.0f});
    }
    if (obj.scaleX != 1.0f || obj.scaleY != 1.0f) {
        ops.push_back(TransformOp{TransformOpKind::Scale, obj.scaleX, obj.scaleY});
    }
    return ops;
}

static void projectChildren(const SceneObject& obj, float scale, const ProjectOptions& options, VisualNode& node) {
    node.children.reserve(obj.children.size());
    for (const SceneObject& child : obj.children) {
        node.children.push_back(project(child, scale, options));
    }
    std::stable_sort(node.children.begin(), node.children.end(), [](const VisualNode& a, const VisualNode& b) {
        return a.zIndex < b.zIndex;
    });
}

static void projectText(const TextShape& t, float scale, const ProjectOptions& options, VisualNode& node) {
    node.text = t.text;
    node.fontSize = t.fontSize * scale;
    node.fontFamily = t.fontFamily;
    node.fontStyle = t.fontStyle;
    node.textDecoration = t.textDecoration;
    node.align = t.align;
    node.fill = t.fill;
    node.wrap = t.width.has_value();
    if (t.width) {
        node.maxWidth = *t.width * scale;
    }

    if (options.measurer) {
        bool bold = false;
        bool italic = false;
        text::parseFontStyle(t.fontStyle, bold, italic);
        const text::TextMeasurement m = options.measurer->measure(
            t.text, t.fontFamily, node.fontSize, node.maxWidth, bold, italic);
        node.lines.reserve(m.lines.size());
        for (const text::MeasuredLine& line : m.lines) {
            node.lines.push_back(line.text);
        }
        node.width = m.width;
        node.height = m.height;
    } else {
        node.width = node.maxWidth ? *node.maxWidth : estimateTextWidth(t) * scale;
        node.height = estimateTextHeight(t) * scale;
    }

    node.kind = VisualKind::Text;
    if (t.isHyperlink) {
        std::string href = deriveHyperlink(t.text, options.origin);
        if (!href.empty()) {
            node.kind = VisualKind::Link;
            node.href = std::move(href);
        }
    }
}

static void projectPath(const SceneObject& obj, const PathShape& p, float scale, VisualNode& node) {
    if (p.points.size() < 4 || p.points.size() % 2 != 0) {
        node.kind = VisualKind::Empty;
        return;
    }

    const std::size_t count = p.points.size() / 2;
    std::vector<float> xs(count);
    std::vector<float> ys(count);
    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();

    // Lines are laid out in pre-scaled absolute coordinates; polygons keep
    // object units and let the viewBox scale them.
    const bool isLine = obj.kind == ObjectKind::Line;
    for (std::size_t i = 0; i < count; ++i) {
        xs[i] = isLine ? (obj.x + p.points[2 * i]) * scale : p.points[2 * i];
        ys[i] = isLine ? (obj.y + p.points[2 * i + 1]) * scale : p.points[2 * i + 1];
        minX = std::min(minX, xs[i]);
        minY = std::min(minY, ys[i]);
        maxX = std::max(maxX, xs[i]);
        maxY = std::max(maxY, ys[i]);
    }
    for (std::size_t i = 0; i < count; ++i) {
        xs[i] -= minX;
        ys[i] -= minY;
    }

    node.kind = VisualKind::Path;
    node.stroke = p.stroke.empty() ? kDefaultPathStroke : p.stroke;
    // Path units are already scaled (line) or scaled by the viewBox (polygon),
    // so the stroke stays in object units.
    node.strokeWidth = strokeOrDefault(p.strokeWidth);

    if (isLine) {
        node.left = minX;
        node.top = minY;
        node.width = std::max(1.0f, maxX - minX);
        node.height = std::max(1.0f, maxY - minY);
        node.viewBoxWidth = node.width;
        node.viewBoxHeight = node.height;
        node.closed = false;
        node.lineCap = p.lineCap.empty() ? "round" : p.lineCap;
        node.lineJoin = p.lineJoin.empty() ? "round" : p.lineJoin;
    } else {
        node.left = (obj.x + minX) * scale;
        node.top = (obj.y + minY) * scale;
        node.width = (maxX - minX) * scale;
        node.height = (maxY - minY) * scale;
        node.viewBoxWidth = maxX - minX;
        node.viewBoxHeight = maxY - minY;
        node.closed = p.closed;
        node.fill = p.fill == "transparent" ? "none" : p.fill;
        node.lineCap = "round";
        node.lineJoin = "round";
    }
    node.pathData = buildPathData(xs, ys, node.closed);
}

VisualNode project(const SceneObject& obj, float scale, const ProjectOptions& options) {
    scale = normalizeScale(scale);

    VisualNode node{};
    node.id = obj.id;
    node.zIndex = obj.zIndex;
    if (!obj.visible) {
        return node;
    }

    node.left = obj.x * scale;
    node.top = obj.y * scale;
    node.opacity = obj.opacity;
    node.transforms = objectTransforms(obj);

    switch (obj.kind) {
        case ObjectKind::Rect: {
            const auto* r = std::get_if<RectShape>(&obj.shape);
            if (!r) break;
            node.kind = VisualKind::Box;
            node.width = r->width * scale;
            node.height = r->height * scale;
            node.fill = r->fill;
            if (!r->stroke.empty()) {
                node.stroke = r->stroke;
                node.strokeWidth = strokeOrDefault(r->strokeWidth) * scale;
            }
            node.cornerRadius = r->cornerRadius * scale;
            break;
        }
        case ObjectKind::Circle: {
            const auto* c = std::get_if<CircleShape>(&obj.shape);
            if (!c) break;
            // Stored position is the centre; the visual anchor is the top-left
            // of the bounding square.
            node.kind = VisualKind::Ellipse;
            node.left = (obj.x - c->radius) * scale;
            node.top = (obj.y - c->radius) * scale;
            node.width = c->radius * 2.0f * scale;
            node.height = node.width;
            node.fill = c->fill;
            if (!c->stroke.empty()) {
                node.stroke = c->stroke;
                node.strokeWidth = strokeOrDefault(c->strokeWidth) * scale;
            }
            break;
        }
        case ObjectKind::Text: {
            const auto* t = std::get_if<TextShape>(&obj.shape);
            if (!t) break;
            projectText(*t, scale, options, node);
            break;
        }
        case ObjectKind::Image: {
            const auto* img = std::get_if<ImageShape>(&obj.shape);
            if (!img) break;
            node.kind = VisualKind::Image;
            node.src = img->src;
            node.width = img->width * scale;
            node.height = img->height * scale;
            node.sourceWidth = node.width;
            node.sourceHeight = node.height;
            if (img->crop) {
                node.cropped = true;
                node.width = img->crop->width * scale;
                node.height = img->crop->height * scale;
                node.sourceX = -img->crop->x * scale;
                node.sourceY = -img->crop->y * scale;
            }
            break;
        }
        case ObjectKind::Line:
        case ObjectKind::Triangle:
        case ObjectKind::Star:
        case ObjectKind::Diamond: {
            const auto* p = std::get_if<PathShape>(&obj.shape);
            if (!p) break;
            projectPath(obj, *p, scale, node);
            break;
        }
        case ObjectKind::Group:
        case ObjectKind::GalleryItem: {
            const auto* box = std::get_if<ContainerShape>(&obj.shape);
            if (!box) break;
            node.kind = VisualKind::Container;
            node.width = box->width * scale;
            node.height = box->height * scale;
            node.fill = box->background;
            if (!box->borderColor.empty()) {
                node.stroke = box->borderColor;
                node.strokeWidth = strokeOrDefault(box->borderWidth) * scale;
            }
            projectChildren(obj, scale, options, node);
            break;
        }
        case ObjectKind::Frame: {
            const auto* box = std::get_if<ContainerShape>(&obj.shape);
            if (!box) break;
            node.kind = VisualKind::Container;
            node.width = box->width * scale;
            node.height = box->height * scale;
            node.fill = box->fill;
            node.dashed = box->dashEnabled;
            if (!box->stroke.empty()) {
                node.stroke = box->stroke;
                node.strokeWidth = strokeOrDefault(box->strokeWidth) * scale;
            }
            projectChildren(obj, scale, options, node);
            if (obj.children.empty() && !box->placeholder.empty()) {
                VisualNode label{};
                label.kind = VisualKind::Label;
                label.id = obj.id + ":placeholder";
                label.text = box->placeholder;
                label.fill = kPlaceholderColor;
                label.fontSize = kPlaceholderFontSize * scale;
                label.left = node.width * 0.5f;
                label.top = node.height * 0.5f;
                node.children.push_back(std::move(label));
            }
            break;
        }
    }
    return node;
}

VisualNode projectScene(
    const std::vector<SceneObject>& objects,
    float canvasWidth,
    float canvasHeight,
    const std::optional<std::string>& background,
    float scale,
    const ProjectOptions& options) {
    scale = normalizeScale(scale);

    VisualNode root{};
    root.kind = VisualKind::Container;
    root.id = "canvas";
    root.width = canvasWidth * scale;
    root.height = canvasHeight * scale;
    if (background) root.fill = *background;

    root.children.reserve(objects.size());
    for (const SceneObject& obj : objects) {
        root.children.push_back(project(obj, scale, options));
    }
    std::stable_sort(root.children.begin(), root.children.end(), [](const VisualNode& a, const VisualNode& b) {
        return a.zIndex < b.zIndex;
    });
    return root;
}

VisualNode projectScene(const SceneDocument& doc, float scale, const ProjectOptions& options) {
    return projectScene(
        doc.objects,
        doc.width.value_or(kDefaultCanvasWidth),
        doc.height.value_or(kDefaultCanvasHeight),
        doc.background,
        scale,
        options);
}

} // namespace canvas
