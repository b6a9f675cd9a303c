#include "canvas/persistence/memory_scene_store.h"

#include "canvas/scene/scene_object.h"

#include <utility>

namespace canvas {

PersistenceError MemorySceneStore::loadScene(const std::string& documentId, SceneDocument& out) {
    if (loadFailure_ != PersistenceError::Ok) return loadFailure_;
    const auto it = documents_.find(documentId);
    if (it == documents_.end()) return PersistenceError::NotFound;
    out = it->second;
    return PersistenceError::Ok;
}

void MemorySceneStore::saveScene(const std::string& documentId, const SceneDocument& doc, SaveCompletion done) {
    saveCount_++;
    PendingSave save{documentId, doc, std::move(done)};
    if (deferred_) {
        pending_.push_back(std::move(save));
        return;
    }
    finishSave(std::move(save));
}

void MemorySceneStore::put(const std::string& documentId, SceneDocument doc) {
    documents_[documentId] = std::move(doc);
}

const SceneDocument* MemorySceneStore::get(const std::string& documentId) const {
    const auto it = documents_.find(documentId);
    return it == documents_.end() ? nullptr : &it->second;
}

bool MemorySceneStore::completeNext() {
    if (pending_.empty()) return false;
    PendingSave save = std::move(pending_.front());
    pending_.pop_front();
    finishSave(std::move(save));
    return true;
}

std::size_t MemorySceneStore::completeAll() {
    std::size_t count = 0;
    // Completions may enqueue follow-up saves; those run too.
    while (completeNext()) {
        count++;
    }
    return count;
}

void MemorySceneStore::finishSave(PendingSave save) {
    PersistenceError result = saveFailure_;
    if (result == PersistenceError::Ok && validateDocument(save.doc) != ValidationIssue::None) {
        result = PersistenceError::ValidationError;
    }
    if (result == PersistenceError::Ok) {
        documents_[save.documentId] = std::move(save.doc);
    }
    if (save.done) save.done(result);
}

} // namespace canvas
