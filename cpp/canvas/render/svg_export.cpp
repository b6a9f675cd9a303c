#include "canvas/render/svg_export.h"

#include "canvas/core/string_utils.h"

namespace canvas {

namespace {

void appendAttr(std::string& out, const char* name, const std::string& value) {
    out += ' ';
    out += name;
    out += "=\"";
    out += escapeXml(value);
    out += '"';
}

void appendAttr(std::string& out, const char* name, float value) {
    out += ' ';
    out += name;
    out += "=\"";
    out += formatNumber(value);
    out += '"';
}

std::string transformAttr(const VisualNode& node) {
    std::string t = "translate(" + formatNumber(node.left) + " " + formatNumber(node.top) + ")";
    for (const TransformOp& op : node.transforms) {
        if (op.kind == TransformOpKind::Rotate) {
            t += " rotate(" + formatNumber(op.a) + ")";
        } else {
            t += " scale(" + formatNumber(op.a) + " " + formatNumber(op.b) + ")";
        }
    }
    return t;
}

void appendPaint(std::string& out, const VisualNode& node, const char* defaultFill) {
    appendAttr(out, "fill", node.fill.empty() ? std::string(defaultFill) : node.fill);
    if (!node.stroke.empty() && node.strokeWidth > 0.0f) {
        appendAttr(out, "stroke", node.stroke);
        appendAttr(out, "stroke-width", node.strokeWidth);
        if (node.dashed) {
            appendAttr(out, "stroke-dasharray", formatNumber(node.strokeWidth * 4.0f) + " " + formatNumber(node.strokeWidth * 2.0f));
        }
    }
}

void appendTextStyle(std::string& out, const VisualNode& node) {
    appendAttr(out, "font-size", node.fontSize);
    if (!node.fontFamily.empty()) appendAttr(out, "font-family", node.fontFamily);
    if (node.fontStyle.find("italic") != std::string::npos) appendAttr(out, "font-style", std::string("italic"));
    if (node.fontStyle.find("bold") != std::string::npos) appendAttr(out, "font-weight", std::string("bold"));
    if (!node.textDecoration.empty()) appendAttr(out, "text-decoration", node.textDecoration);
    appendAttr(out, "fill", node.fill.empty() ? std::string("#000000") : node.fill);
}

void appendTextBody(std::string& out, const VisualNode& node) {
    const float lineHeight = node.fontSize * kTextLineHeight;
    // Baseline of the first line sits at roughly the ascender.
    const float baseline = node.fontSize * 0.8f + (lineHeight - node.fontSize) * 0.5f;

    float anchorX = 0.0f;
    const char* anchor = "start";
    if (node.align == "center") {
        anchor = "middle";
        anchorX = node.width * 0.5f;
    } else if (node.align == "right") {
        anchor = "end";
        anchorX = node.width;
    }

    out += "<text";
    appendAttr(out, "x", anchorX);
    appendAttr(out, "y", baseline);
    appendAttr(out, "text-anchor", std::string(anchor));
    appendTextStyle(out, node);
    out += '>';
    if (node.lines.size() <= 1) {
        out += escapeXml(node.lines.empty() ? node.text : node.lines.front());
    } else {
        for (std::size_t i = 0; i < node.lines.size(); ++i) {
            out += "<tspan";
            appendAttr(out, "x", anchorX);
            appendAttr(out, "y", baseline + static_cast<float>(i) * lineHeight);
            out += '>';
            out += escapeXml(node.lines[i]);
            out += "</tspan>";
        }
    }
    out += "</text>";
}

void appendNode(std::string& out, const VisualNode& node) {
    if (node.kind == VisualKind::Empty) return;

    if (node.kind == VisualKind::Label) {
        out += "<text";
        appendAttr(out, "x", node.left);
        appendAttr(out, "y", node.top);
        appendAttr(out, "text-anchor", std::string("middle"));
        appendAttr(out, "dominant-baseline", std::string("central"));
        appendTextStyle(out, node);
        out += '>';
        out += escapeXml(node.text);
        out += "</text>";
        return;
    }

    out += "<g";
    appendAttr(out, "id", node.id);
    appendAttr(out, "transform", transformAttr(node));
    if (node.opacity < 1.0f) appendAttr(out, "opacity", node.opacity);
    out += '>';

    switch (node.kind) {
        case VisualKind::Box:
            out += "<rect";
            appendAttr(out, "width", node.width);
            appendAttr(out, "height", node.height);
            if (node.cornerRadius > 0.0f) appendAttr(out, "rx", node.cornerRadius);
            appendPaint(out, node, "none");
            out += "/>";
            break;
        case VisualKind::Ellipse:
            out += "<ellipse";
            appendAttr(out, "cx", node.width * 0.5f);
            appendAttr(out, "cy", node.height * 0.5f);
            appendAttr(out, "rx", node.width * 0.5f);
            appendAttr(out, "ry", node.height * 0.5f);
            appendPaint(out, node, "none");
            out += "/>";
            break;
        case VisualKind::Text:
            appendTextBody(out, node);
            break;
        case VisualKind::Link:
            out += "<a";
            appendAttr(out, "href", node.href);
            appendAttr(out, "target", std::string("_blank"));
            out += '>';
            appendTextBody(out, node);
            out += "</a>";
            break;
        case VisualKind::Image:
            out += "<svg";
            appendAttr(out, "width", node.width);
            appendAttr(out, "height", node.height);
            appendAttr(out, "overflow", std::string("hidden"));
            out += "><image";
            appendAttr(out, "x", node.sourceX);
            appendAttr(out, "y", node.sourceY);
            appendAttr(out, "width", node.sourceWidth);
            appendAttr(out, "height", node.sourceHeight);
            appendAttr(out, "href", node.src);
            appendAttr(out, "preserveAspectRatio", std::string("none"));
            out += "/></svg>";
            break;
        case VisualKind::Path:
            out += "<svg";
            appendAttr(out, "width", node.width);
            appendAttr(out, "height", node.height);
            appendAttr(out, "viewBox", "0 0 " + formatNumber(node.viewBoxWidth) + " " + formatNumber(node.viewBoxHeight));
            appendAttr(out, "overflow", std::string("visible"));
            out += "><path";
            appendAttr(out, "d", node.pathData);
            appendAttr(out, "fill", node.fill.empty() ? std::string("none") : node.fill);
            appendAttr(out, "stroke", node.stroke);
            appendAttr(out, "stroke-width", node.strokeWidth);
            appendAttr(out, "stroke-linecap", node.lineCap);
            appendAttr(out, "stroke-linejoin", node.lineJoin);
            out += "/></svg>";
            break;
        case VisualKind::Container:
            if (!node.fill.empty() || !node.stroke.empty()) {
                out += "<rect";
                appendAttr(out, "width", node.width);
                appendAttr(out, "height", node.height);
                appendPaint(out, node, "none");
                out += "/>";
            }
            for (const VisualNode& child : node.children) {
                appendNode(out, child);
            }
            break;
        case VisualKind::Empty:
        case VisualKind::Label:
            break;
    }
    out += "</g>";
}

} // namespace

std::string exportSvg(const VisualNode& root, float width, float height, const std::optional<std::string>& background) {
    std::string out;
    out.reserve(1024);
    out += "<svg xmlns=\"http://www.w3.org/2000/svg\"";
    appendAttr(out, "width", width);
    appendAttr(out, "height", height);
    appendAttr(out, "viewBox", "0 0 " + formatNumber(width) + " " + formatNumber(height));
    out += '>';
    if (background && !background->empty()) {
        out += "<rect";
        appendAttr(out, "width", width);
        appendAttr(out, "height", height);
        appendAttr(out, "fill", *background);
        out += "/>";
    }

    if (root.kind == VisualKind::Container && root.left == 0.0f && root.top == 0.0f && root.transforms.empty()) {
        // Scene root: its box is the document itself.
        for (const VisualNode& child : root.children) {
            appendNode(out, child);
        }
    } else {
        appendNode(out, root);
    }
    out += "</svg>";
    return out;
}

std::string exportDocumentSvg(const SceneDocument& doc, float scale, const ProjectOptions& options) {
    const VisualNode root = projectScene(doc, scale, options);
    return exportSvg(root, root.width, root.height, doc.background);
}

} // namespace canvas
