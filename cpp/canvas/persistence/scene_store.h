#ifndef ARTCHIVE_CANVAS_PERSISTENCE_SCENE_STORE_H
#define ARTCHIVE_CANVAS_PERSISTENCE_SCENE_STORE_H

#include "canvas/core/types.h"

#include <cstdint>
#include <functional>
#include <string>

namespace canvas {

enum class PersistenceError : std::uint8_t {
    Ok = 0,
    NotFound = 1,        // unknown document id
    Unauthorized = 2,    // caller lacks access
    ValidationError = 3, // malformed document or id
    TransientError = 4,  // network / storage failure
    NoDocument = 5,      // no document id bound
    SaveInFlight = 6,    // a save is already running; request was coalesced
};

const char* persistenceErrorName(PersistenceError err) noexcept;

// Only transient failures are worth retrying.
inline bool isRetryable(PersistenceError err) noexcept {
    return err == PersistenceError::TransientError;
}

using SaveCompletion = std::function<void(PersistenceError)>;

// External load/save collaborator.
class SceneStore {
public:
    virtual ~SceneStore() = default;

    virtual PersistenceError loadScene(const std::string& documentId, SceneDocument& out) = 0;

    // `done` runs exactly once, synchronously or later.
    virtual void saveScene(const std::string& documentId, const SceneDocument& doc, SaveCompletion done) = 0;
};

} // namespace canvas

#endif // ARTCHIVE_CANVAS_PERSISTENCE_SCENE_STORE_H
