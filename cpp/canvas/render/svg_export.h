#ifndef ARTCHIVE_CANVAS_RENDER_SVG_EXPORT_H
#define ARTCHIVE_CANVAS_RENDER_SVG_EXPORT_H

#include "canvas/render/scene_renderer.h"

#include <optional>
#include <string>

namespace canvas {

// Serializes a projected visual tree into standalone SVG markup. Each node
// becomes a <g> translated to its position carrying its transform list.
std::string exportSvg(const VisualNode& root, float width, float height, const std::optional<std::string>& background);

// Projects the document at `scale` and serializes it.
std::string exportDocumentSvg(const SceneDocument& doc, float scale = 1.0f, const ProjectOptions& options = {});

} // namespace canvas

#endif // ARTCHIVE_CANVAS_RENDER_SVG_EXPORT_H
