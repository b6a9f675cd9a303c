#include "canvas/persistence/scene_store.h"

namespace canvas {

const char* persistenceErrorName(PersistenceError err) noexcept {
    switch (err) {
        case PersistenceError::Ok: return "ok";
        case PersistenceError::NotFound: return "not-found";
        case PersistenceError::Unauthorized: return "unauthorized";
        case PersistenceError::ValidationError: return "validation-error";
        case PersistenceError::TransientError: return "transient-error";
        case PersistenceError::NoDocument: return "no-document";
        case PersistenceError::SaveInFlight: return "save-in-flight";
    }
    return "unknown";
}

} // namespace canvas
