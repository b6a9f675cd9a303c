#ifndef ARTCHIVE_CANVAS_PERSISTENCE_PERSISTENCE_COORDINATOR_H
#define ARTCHIVE_CANVAS_PERSISTENCE_PERSISTENCE_COORDINATOR_H

#include "canvas/persistence/scene_store.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace canvas {

class CanvasEditor;

enum class SaveState : std::uint8_t {
    Idle = 0,
    Dirty = 1,
    Saving = 2,
    Error = 3,
};

const char* saveStateName(SaveState state) noexcept;

struct PersistenceConfig {
    double autosaveIntervalMs{60000.0};
    std::optional<std::string> documentId;
};

// Debounced autosave plus explicit save/load between a CanvasEditor and a
// SceneStore. Time only advances through tick(), so the owner decides how the
// timer is driven (animation frame, event loop, tests).
class PersistenceCoordinator {
public:
    using Clock = std::function<double()>;
    using ErrorHandler = std::function<void(PersistenceError)>;

    // `editor` and `store` must outlive the coordinator. An empty clock falls
    // back to canvasNowMs().
    PersistenceCoordinator(CanvasEditor& editor, SceneStore& store, PersistenceConfig config = {}, Clock clock = {});
    ~PersistenceCoordinator();

    PersistenceCoordinator(const PersistenceCoordinator&) = delete;
    PersistenceCoordinator& operator=(const PersistenceCoordinator&) = delete;

    // Rebinding drops a pending timer. Unbinding makes save() a no-op.
    void bindDocument(std::optional<std::string> documentId);
    const std::optional<std::string>& documentId() const noexcept { return config_.documentId; }

    // Loads the bound document and hydrates the editor with it.
    PersistenceError load();

    // Saves the editor's current content. Returns NoDocument when unbound and
    // SaveInFlight when coalesced behind a running save. Otherwise returns the
    // result of a synchronous store, or Ok once an asynchronous save is issued.
    // `done` always receives the final outcome of the save that covers it.
    PersistenceError save(SaveCompletion done = {});

    // Fires the autosave when the armed deadline has passed.
    void tick();
    void tick(double nowMs);

    SaveState state() const noexcept { return state_; }
    bool isSaving() const noexcept { return inFlight_; }
    bool isTimerArmed() const noexcept { return deadlineMs_.has_value(); }
    std::optional<double> timerDeadlineMs() const noexcept { return deadlineMs_; }
    PersistenceError lastError() const noexcept { return lastError_; }
    bool hasFollowUpSave() const noexcept { return followUpPending_; }

    // Receives every save or load failure, including autosaves nobody awaits.
    void setErrorHandler(ErrorHandler handler);

private:
    void onEditorChanged();
    void armTimer();
    void disarmTimer();
    PersistenceError startSave(std::vector<SaveCompletion> completions);
    void finishSave(PersistenceError err, std::uint64_t savedRevision, std::vector<SaveCompletion> completions);
    void reportError(PersistenceError err);

    CanvasEditor& editor_;
    SceneStore& store_;
    PersistenceConfig config_;
    Clock clock_;
    ErrorHandler errorHandler_;

    SaveState state_{SaveState::Idle};
    std::optional<double> deadlineMs_;
    PersistenceError lastError_{PersistenceError::Ok};

    bool inFlight_{false};
    bool followUpPending_{false};
    std::vector<SaveCompletion> followUpCompletions_;

    std::uint32_t listenerId_{0};
    // Store completions hold a weak reference; they are dropped once this dies.
    std::shared_ptr<bool> alive_;
};

} // namespace canvas

#endif // ARTCHIVE_CANVAS_PERSISTENCE_PERSISTENCE_COORDINATOR_H
