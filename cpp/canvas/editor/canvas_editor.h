#ifndef ARTCHIVE_CANVAS_EDITOR_CANVAS_EDITOR_H
#define ARTCHIVE_CANVAS_EDITOR_CANVAS_EDITOR_H

#include "canvas/core/types.h"
#include "canvas/core/util.h"
#include "canvas/editor/editor_state.h"
#include "canvas/history/history_manager.h"
#include "canvas/interaction/snap_solver.h"
#include "canvas/scene/scene_object.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace canvas {

// Owns the live scene and is the only place content is mutated. Every content
// edit is a Command executed through the HistoryManager; selection and view
// setters bypass history. Unknown ids degrade to no-ops returning false.
class CanvasEditor {
public:
    using ChangeListener = std::function<void(const CanvasEditor&)>;
    using IdGenerator = std::function<std::string()>;

    explicit CanvasEditor(EditorConfig config = {});

    // Commands capture `this`.
    CanvasEditor(const CanvasEditor&) = delete;
    CanvasEditor& operator=(const CanvasEditor&) = delete;

    const EditorState& state() const noexcept { return state_; }
    const EditorConfig& config() const noexcept { return config_; }

    // Snapshot in the persistence collaborator's shape.
    SceneDocument document() const;
    const SceneObject* findObject(std::string_view id) const;

    // =========================================================================
    // Content edits (undoable)
    // =========================================================================

    // Rejects empty ids, ids already in the tree, and invalid objects.
    bool addObject(SceneObject obj);
    // Tree-wide. Undo restores the exact prior object. Patches that change
    // nothing are ignored.
    bool updateObject(std::string_view id, const ObjectPatch& patch);
    // Tree-wide. Undo reinserts at the original index and container.
    bool deleteObject(std::string_view id);

    // Drag commit: snaps against the object's siblings, then updates position.
    // Coordinates are the object's stored x/y (a circle's centre).
    SnapResult moveObject(std::string_view id, float x, float y);
    // Same computation without mutating; for per-frame drag feedback.
    SnapResult previewMove(std::string_view id, float x, float y) const;

    // Needs at least two top-level objects. Returns the new group id.
    std::optional<std::string> groupObjects(const std::vector<std::string>& ids);
    bool ungroupObject(std::string_view id);

    // Returns the ids of the pasted copies (empty when the clipboard is empty).
    std::vector<std::string> pasteObjects();

    bool attachImageToFrame(std::string_view imageId, std::string_view frameId);
    bool toggleVisibility(std::string_view id);
    bool reorderObject(std::string_view id, ReorderDirection direction);
    bool setCanvasSize(float width, float height);
    bool setBackground(std::optional<std::string> background);

    bool undo();
    bool redo();
    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }
    std::string undoDescription() const { return history_.undoDescription(); }
    std::string redoDescription() const { return history_.redoDescription(); }
    const HistoryManager& history() const noexcept { return history_; }

    // =========================================================================
    // Selection / view (not undoable)
    // =========================================================================

    // Unknown ids are dropped, duplicates collapsed.
    void selectObjects(const std::vector<std::string>& ids);
    void clearSelection();
    // Copies the selected objects to the clipboard. Returns the count.
    std::size_t copyObjects();

    void setZoom(float zoom);
    void setPan(float x, float y);
    void toggleGrid();
    void toggleSnap();

    // =========================================================================
    // Document lifecycle / save tracking
    // =========================================================================

    // Replaces the whole document, clears history and selection, and marks
    // the document as just saved at `nowMs`.
    void initializeState(const SceneDocument& doc, double nowMs = canvasNowMs());

    bool hasUnsavedChanges() const noexcept { return dirty_; }
    std::optional<double> lastSavedMs() const noexcept { return lastSavedMs_; }
    // Bumped on every content change (execute, undo, redo, initialize).
    std::uint64_t revision() const noexcept { return revision_; }
    // Records a successful save of the content at `savedRevision`. Edits made
    // after that revision keep the document dirty.
    void markSaved(double nowMs, std::uint64_t savedRevision);

    std::uint64_t getDocumentDigest() const;

    std::uint32_t addChangeListener(ChangeListener listener);
    void removeChangeListener(std::uint32_t listenerId);

    // Replaces the random base36 generator (tests use deterministic ids).
    void setIdGenerator(IdGenerator generator);
    // An id not used anywhere in the tree or the clipboard.
    std::string generateId() const;

private:
    struct ContentSnapshot {
        std::vector<SceneObject> objects;
        float width{0.0f};
        float height{0.0f};
        std::optional<std::string> background;
    };

    ContentSnapshot captureContent() const;
    void restoreContent(const ContentSnapshot& snap);

    // Builds the before/after command and runs it through history.
    // `selectionAfter` is applied on execute, `selectionBefore` on undo.
    bool commitContent(
        std::string description,
        ContentSnapshot after,
        std::optional<std::vector<std::string>> selectionAfter = std::nullopt,
        std::optional<std::vector<std::string>> selectionBefore = std::nullopt);

    SnapRequest buildSnapRequest(const SceneObject& obj, const BoundingBox& box) const;
    bool computeMove(std::string_view id, float x, float y, SnapResult& out) const;

    // Ids handed out are added to `reserved` so a batch never repeats one.
    std::string generateId(std::unordered_set<std::string>& reserved) const;
    void assignFreshIds(SceneObject& obj, std::unordered_set<std::string>& reserved) const;

    void contentChanged();
    void pruneSelection();
    void notifyListeners();

    EditorConfig config_;
    EditorState state_;
    HistoryManager history_;

    bool dirty_{false};
    std::optional<double> lastSavedMs_;
    std::uint64_t revision_{0};

    IdGenerator idGenerator_;
    std::vector<std::pair<std::uint32_t, ChangeListener>> listeners_;
    std::uint32_t nextListenerId_{1};
};

} // namespace canvas

#endif // ARTCHIVE_CANVAS_EDITOR_CANVAS_EDITOR_H
