#ifndef ARTCHIVE_CANVAS_PERSISTENCE_MEMORY_SCENE_STORE_H
#define ARTCHIVE_CANVAS_PERSISTENCE_MEMORY_SCENE_STORE_H

#include "canvas/persistence/scene_store.h"

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

namespace canvas {

// In-process store. Failures can be injected, and saves can be held back to
// model a request that is still in flight.
class MemorySceneStore : public SceneStore {
public:
    PersistenceError loadScene(const std::string& documentId, SceneDocument& out) override;
    void saveScene(const std::string& documentId, const SceneDocument& doc, SaveCompletion done) override;

    void put(const std::string& documentId, SceneDocument doc);
    const SceneDocument* get(const std::string& documentId) const;
    bool has(const std::string& documentId) const { return get(documentId) != nullptr; }

    // Ok clears the injected failure.
    void setLoadFailure(PersistenceError err) { loadFailure_ = err; }
    void setSaveFailure(PersistenceError err) { saveFailure_ = err; }

    // While deferred, saves queue until completeNext()/completeAll().
    void setDeferred(bool deferred) { deferred_ = deferred; }
    bool completeNext();
    std::size_t completeAll();
    std::size_t pendingCount() const noexcept { return pending_.size(); }

    std::size_t saveCount() const noexcept { return saveCount_; }

private:
    struct PendingSave {
        std::string documentId;
        SceneDocument doc;
        SaveCompletion done;
    };

    void finishSave(PendingSave save);

    std::unordered_map<std::string, SceneDocument> documents_;
    std::deque<PendingSave> pending_;
    PersistenceError loadFailure_{PersistenceError::Ok};
    PersistenceError saveFailure_{PersistenceError::Ok};
    bool deferred_{false};
    std::size_t saveCount_{0};
};

} // namespace canvas

#endif // ARTCHIVE_CANVAS_PERSISTENCE_MEMORY_SCENE_STORE_H
