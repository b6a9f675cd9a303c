#ifndef ARTCHIVE_CANVAS_EDITOR_EDITOR_STATE_H
#define ARTCHIVE_CANVAS_EDITOR_EDITOR_STATE_H

#include "canvas/core/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace canvas {

struct EditorConfig {
    float width{kDefaultCanvasWidth};
    float height{kDefaultCanvasHeight};
    bool gridEnabled{true};
    bool snapEnabled{true};
    float zoom{1.0f};
    float pasteOffset{kDefaultPasteOffset};
    // 0 = unbounded
    std::size_t historyDepth{0};
};

// The single live document plus view state. Content (objects, width, height,
// background) only changes through history commands.
struct EditorState {
    std::vector<SceneObject> objects;
    float width{kDefaultCanvasWidth};
    float height{kDefaultCanvasHeight};
    std::optional<std::string> background;

    // Ordered, no duplicates.
    std::vector<std::string> selectedIds;
    // Detached copies.
    std::vector<SceneObject> clipboard;

    float zoom{1.0f};
    float panX{0.0f};
    float panY{0.0f};
    bool gridEnabled{true};
    bool snapEnabled{true};
};

enum class ReorderDirection : std::uint8_t {
    Up = 0,   // towards index 0
    Down = 1,
};

inline float clampZoom(float zoom) {
    if (!(zoom >= kMinZoom)) return kMinZoom;
    if (zoom > kMaxZoom) return kMaxZoom;
    return zoom;
}

} // namespace canvas

#endif // ARTCHIVE_CANVAS_EDITOR_EDITOR_STATE_H
