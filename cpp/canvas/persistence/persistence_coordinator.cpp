#include "canvas/persistence/persistence_coordinator.h"

#include "canvas/core/logging.h"
#include "canvas/core/util.h"
#include "canvas/editor/canvas_editor.h"

#include <utility>

namespace canvas {

const char* saveStateName(SaveState state) noexcept {
    switch (state) {
        case SaveState::Idle: return "idle";
        case SaveState::Dirty: return "dirty";
        case SaveState::Saving: return "saving";
        case SaveState::Error: return "error";
    }
    return "unknown";
}

PersistenceCoordinator::PersistenceCoordinator(
    CanvasEditor& editor,
    SceneStore& store,
    PersistenceConfig config,
    Clock clock)
    : editor_(editor),
      store_(store),
      config_(std::move(config)),
      clock_(std::move(clock)),
      alive_(std::make_shared<bool>(true)) {
    if (!clock_) {
        clock_ = [] { return canvasNowMs(); };
    }
    listenerId_ = editor_.addChangeListener([this](const CanvasEditor&) { onEditorChanged(); });
    if (editor_.hasUnsavedChanges()) {
        onEditorChanged();
    }
}

PersistenceCoordinator::~PersistenceCoordinator() {
    alive_.reset();
    editor_.removeChangeListener(listenerId_);
}

void PersistenceCoordinator::bindDocument(std::optional<std::string> documentId) {
    config_.documentId = std::move(documentId);
    disarmTimer();
    if (config_.documentId && editor_.hasUnsavedChanges()) {
        armTimer();
    }
}

void PersistenceCoordinator::setErrorHandler(ErrorHandler handler) {
    errorHandler_ = std::move(handler);
}

void PersistenceCoordinator::onEditorChanged() {
    if (!editor_.hasUnsavedChanges()) {
        // Hydrated or otherwise back in sync with the store.
        disarmTimer();
        if (!inFlight_) state_ = SaveState::Idle;
        return;
    }
    if (!inFlight_) state_ = SaveState::Dirty;
    if (config_.documentId) {
        armTimer();
    }
}

void PersistenceCoordinator::armTimer() {
    deadlineMs_ = clock_() + config_.autosaveIntervalMs;
    CANVAS_LOG_DEBUG("[persistence] autosave armed for %.0f", *deadlineMs_);
}

void PersistenceCoordinator::disarmTimer() {
    deadlineMs_.reset();
}

void PersistenceCoordinator::tick() {
    tick(clock_());
}

void PersistenceCoordinator::tick(double nowMs) {
    if (!deadlineMs_ || nowMs < *deadlineMs_) return;
    CANVAS_LOG_DEBUG("[persistence] autosave timer fired");
    disarmTimer();
    save();
}

PersistenceError PersistenceCoordinator::load() {
    if (!config_.documentId) {
        return PersistenceError::NoDocument;
    }

    SceneDocument doc{};
    const PersistenceError err = store_.loadScene(*config_.documentId, doc);
    if (err != PersistenceError::Ok) {
        CANVAS_LOG_WARN("[persistence] load '%s' failed: %s", config_.documentId->c_str(), persistenceErrorName(err));
        lastError_ = err;
        reportError(err);
        return err;
    }

    lastError_ = PersistenceError::Ok;
    editor_.initializeState(doc, clock_());
    disarmTimer();
    if (!inFlight_) state_ = SaveState::Idle;
    CANVAS_LOG_DEBUG("[persistence] loaded '%s'", config_.documentId->c_str());
    return PersistenceError::Ok;
}

PersistenceError PersistenceCoordinator::save(SaveCompletion done) {
    if (!config_.documentId) {
        CANVAS_LOG_DEBUG("[persistence] save skipped, no document bound");
        if (done) done(PersistenceError::NoDocument);
        return PersistenceError::NoDocument;
    }

    if (inFlight_) {
        followUpPending_ = true;
        if (done) followUpCompletions_.push_back(std::move(done));
        CANVAS_LOG_DEBUG("[persistence] save coalesced behind the running save");
        return PersistenceError::SaveInFlight;
    }

    std::vector<SaveCompletion> completions;
    if (done) completions.push_back(std::move(done));
    return startSave(std::move(completions));
}

PersistenceError PersistenceCoordinator::startSave(std::vector<SaveCompletion> completions) {
    inFlight_ = true;
    state_ = SaveState::Saving;
    disarmTimer();

    const std::uint64_t revision = editor_.revision();
    const SceneDocument doc = editor_.document();
    const std::weak_ptr<bool> alive = alive_;
    const std::string documentId = *config_.documentId;
    // Set when the store completes before saveScene() returns.
    const auto syncResult = std::make_shared<std::optional<PersistenceError>>();

    CANVAS_LOG_DEBUG("[persistence] saving '%s' at revision %llu", documentId.c_str(),
        static_cast<unsigned long long>(revision));
    store_.saveScene(documentId, doc,
        [this, alive, syncResult, revision, completions = std::move(completions)](PersistenceError err) mutable {
            *syncResult = err;
            if (alive.expired()) return;
            finishSave(err, revision, std::move(completions));
        });

    // `this` may be gone here if a completion destroyed it.
    return syncResult->value_or(PersistenceError::Ok);
}

void PersistenceCoordinator::finishSave(
    PersistenceError err,
    std::uint64_t savedRevision,
    std::vector<SaveCompletion> completions) {
    inFlight_ = false;
    lastError_ = err;

    if (err == PersistenceError::Ok) {
        editor_.markSaved(clock_(), savedRevision);
        state_ = editor_.hasUnsavedChanges() ? SaveState::Dirty : SaveState::Idle;
        CANVAS_LOG_DEBUG("[persistence] saved revision %llu", static_cast<unsigned long long>(savedRevision));
    } else {
        // Dirty stays set; the next edit re-arms the timer.
        state_ = SaveState::Error;
        CANVAS_LOG_WARN("[persistence] save failed: %s%s", persistenceErrorName(err),
            isRetryable(err) ? " (retryable)" : "");
    }

    // Callbacks below may destroy this coordinator.
    const std::weak_ptr<bool> alive = alive_;
    if (err != PersistenceError::Ok) {
        reportError(err);
        if (alive.expired()) return;
    }
    for (SaveCompletion& done : completions) {
        if (done) done(err);
        if (alive.expired()) return;
    }

    if (followUpPending_ && !inFlight_) {
        followUpPending_ = false;
        std::vector<SaveCompletion> next = std::move(followUpCompletions_);
        followUpCompletions_.clear();
        if (!config_.documentId) {
            for (SaveCompletion& done : next) {
                if (done) done(PersistenceError::NoDocument);
                if (alive.expired()) return;
            }
            return;
        }
        const PersistenceError followUp = startSave(std::move(next));
        if (followUp != PersistenceError::Ok) {
            CANVAS_LOG_DEBUG("[persistence] coalesced follow-up save finished with %s", persistenceErrorName(followUp));
        }
    }
}

void PersistenceCoordinator::reportError(PersistenceError err) {
    if (errorHandler_) errorHandler_(err);
}

} // namespace canvas
