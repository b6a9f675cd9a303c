#include "canvas/editor/canvas_editor.h"

#include "canvas/core/logging.h"
#include "canvas/scene/scene_tree.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace canvas {

CanvasEditor::CanvasEditor(EditorConfig config)
    : config_(config), history_(config.historyDepth) {
    state_.width = config_.width;
    state_.height = config_.height;
    state_.gridEnabled = config_.gridEnabled;
    state_.snapEnabled = config_.snapEnabled;
    state_.zoom = clampZoom(config_.zoom);
}

SceneDocument CanvasEditor::document() const {
    SceneDocument doc{};
    doc.objects = state_.objects;
    doc.width = state_.width;
    doc.height = state_.height;
    doc.background = state_.background;
    return doc;
}

const SceneObject* CanvasEditor::findObject(std::string_view id) const {
    return canvas::findObject(state_.objects, id);
}

// =============================================================================
// Content edits
// =============================================================================

bool CanvasEditor::addObject(SceneObject obj) {
    const ValidationIssue issue = validateObject(obj);
    if (issue != ValidationIssue::None) {
        CANVAS_LOG_WARN("[editor] addObject rejected '%s': %s", obj.id.c_str(), validationIssueName(issue));
        return false;
    }

    std::vector<std::string> ids;
    collectIds(obj, ids);
    for (const std::string& id : ids) {
        if (containsObject(state_.objects, id)) {
            CANVAS_LOG_WARN("[editor] addObject rejected duplicate id '%s'", id.c_str());
            return false;
        }
    }

    std::string description = std::string("Add ") + objectKindName(obj.kind);
    ContentSnapshot after = captureContent();
    after.objects.push_back(std::move(obj));
    return commitContent(std::move(description), std::move(after));
}

bool CanvasEditor::updateObject(std::string_view id, const ObjectPatch& patch) {
    if (patch.empty()) return false;

    ObjectPath path;
    if (!findObjectPath(state_.objects, id, path)) {
        CANVAS_LOG_DEBUG("[editor] updateObject ignored, unknown id '%.*s'", static_cast<int>(id.size()), id.data());
        return false;
    }

    ContentSnapshot after = captureContent();
    SceneObject* target = objectAtPath(after.objects, path);
    if (!target) return false;

    std::string description = std::string("Update ") + objectKindName(target->kind);
    if (!applyPatch(*target, patch)) {
        CANVAS_LOG_WARN("[editor] updateObject rejected patch for '%s'", target->id.c_str());
        return false;
    }
    // Patches that change nothing push no command.
    if (*target == *objectAtPath(state_.objects, path)) return false;
    refreshAncestorGroups(after.objects, path);
    return commitContent(std::move(description), std::move(after));
}

bool CanvasEditor::deleteObject(std::string_view id) {
    ObjectPath path;
    if (!findObjectPath(state_.objects, id, path)) {
        CANVAS_LOG_DEBUG("[editor] deleteObject ignored, unknown id '%.*s'", static_cast<int>(id.size()), id.data());
        return false;
    }

    ContentSnapshot after = captureContent();
    std::vector<SceneObject>* siblings = siblingsAtPath(after.objects, path);
    if (!siblings) return false;

    const std::size_t index = path.back();
    std::string description = std::string("Delete ") + objectKindName((*siblings)[index].kind);
    siblings->erase(siblings->begin() + static_cast<std::ptrdiff_t>(index));

    path.pop_back();
    refreshAncestorGroups(after.objects, path);
    return commitContent(std::move(description), std::move(after));
}

bool CanvasEditor::setCanvasSize(float width, float height) {
    if (!std::isfinite(width) || !std::isfinite(height) || width <= 0.0f || height <= 0.0f) return false;
    if (width == state_.width && height == state_.height) return false;

    ContentSnapshot after = captureContent();
    after.width = width;
    after.height = height;
    return commitContent("Resize canvas", std::move(after));
}

bool CanvasEditor::setBackground(std::optional<std::string> background) {
    if (background == state_.background) return false;

    ContentSnapshot after = captureContent();
    after.background = std::move(background);
    return commitContent("Change background", std::move(after));
}

bool CanvasEditor::undo() {
    if (!history_.undo()) return false;
    notifyListeners();
    return true;
}

bool CanvasEditor::redo() {
    if (!history_.redo()) return false;
    notifyListeners();
    return true;
}

// =============================================================================
// Selection / view
// =============================================================================

void CanvasEditor::selectObjects(const std::vector<std::string>& ids) {
    state_.selectedIds.clear();
    for (const std::string& id : ids) {
        if (!containsObject(state_.objects, id)) continue;
        if (std::find(state_.selectedIds.begin(), state_.selectedIds.end(), id) != state_.selectedIds.end()) continue;
        state_.selectedIds.push_back(id);
    }
}

void CanvasEditor::clearSelection() {
    state_.selectedIds.clear();
}

void CanvasEditor::setZoom(float zoom) {
    state_.zoom = clampZoom(zoom);
}

void CanvasEditor::setPan(float x, float y) {
    state_.panX = x;
    state_.panY = y;
}

void CanvasEditor::toggleGrid() {
    state_.gridEnabled = !state_.gridEnabled;
}

void CanvasEditor::toggleSnap() {
    state_.snapEnabled = !state_.snapEnabled;
}

// =============================================================================
// Document lifecycle
// =============================================================================

void CanvasEditor::initializeState(const SceneDocument& doc, double nowMs) {
    state_.objects = doc.objects;
    state_.width = doc.width.value_or(state_.width);
    state_.height = doc.height.value_or(state_.height);
    state_.background = doc.background;
    state_.selectedIds.clear();
    history_.clear();

    revision_++;
    lastSavedMs_ = nowMs;
    dirty_ = false;
    CANVAS_LOG_DEBUG("[editor] initialized with %zu objects", state_.objects.size());
    notifyListeners();
}

void CanvasEditor::markSaved(double nowMs, std::uint64_t savedRevision) {
    lastSavedMs_ = nowMs;
    if (savedRevision == revision_) {
        dirty_ = false;
    }
}

std::uint32_t CanvasEditor::addChangeListener(ChangeListener listener) {
    const std::uint32_t id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void CanvasEditor::removeChangeListener(std::uint32_t listenerId) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(), [listenerId](const auto& entry) {
            return entry.first == listenerId;
        }),
        listeners_.end());
}

// =============================================================================
// Internals
// =============================================================================

CanvasEditor::ContentSnapshot CanvasEditor::captureContent() const {
    ContentSnapshot snap{};
    snap.objects = state_.objects;
    snap.width = state_.width;
    snap.height = state_.height;
    snap.background = state_.background;
    return snap;
}

void CanvasEditor::restoreContent(const ContentSnapshot& snap) {
    state_.objects = snap.objects;
    state_.width = snap.width;
    state_.height = snap.height;
    state_.background = snap.background;
}

bool CanvasEditor::commitContent(
    std::string description,
    ContentSnapshot after,
    std::optional<std::vector<std::string>> selectionAfter,
    std::optional<std::vector<std::string>> selectionBefore) {
    ContentSnapshot before = captureContent();

    Command cmd{};
    cmd.description = std::move(description);
    cmd.execute = [this, after = std::move(after), selectionAfter = std::move(selectionAfter)]() {
        restoreContent(after);
        if (selectionAfter) state_.selectedIds = *selectionAfter;
        contentChanged();
    };
    cmd.undo = [this, before = std::move(before), selectionBefore = std::move(selectionBefore)]() {
        restoreContent(before);
        if (selectionBefore) state_.selectedIds = *selectionBefore;
        contentChanged();
    };

    if (!history_.execute(std::move(cmd))) return false;
    notifyListeners();
    return true;
}

void CanvasEditor::contentChanged() {
    pruneSelection();
    revision_++;
    if (lastSavedMs_) {
        dirty_ = true;
    }
}

void CanvasEditor::pruneSelection() {
    auto& selected = state_.selectedIds;
    selected.erase(
        std::remove_if(selected.begin(), selected.end(), [this](const std::string& id) {
            return !containsObject(state_.objects, id);
        }),
        selected.end());
}

void CanvasEditor::notifyListeners() {
    // Listeners may unregister themselves while being notified.
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        if (entry.second) entry.second(*this);
    }
}

} // namespace canvas
