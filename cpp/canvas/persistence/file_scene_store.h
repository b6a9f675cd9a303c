#ifndef ARTCHIVE_CANVAS_PERSISTENCE_FILE_SCENE_STORE_H
#define ARTCHIVE_CANVAS_PERSISTENCE_FILE_SCENE_STORE_H

#include "canvas/persistence/scene_store.h"

#include <string>

namespace canvas {

static constexpr const char* kSceneFileExtension = ".gscn";

// One encoded scene file per document id inside `directory`. Saves write a
// temporary file and rename it over the target.
class FileSceneStore : public SceneStore {
public:
    explicit FileSceneStore(std::string directory);

    PersistenceError loadScene(const std::string& documentId, SceneDocument& out) override;
    // Completes synchronously.
    void saveScene(const std::string& documentId, const SceneDocument& doc, SaveCompletion done) override;

    // Ids are single path components: non-empty, no separators, no leading dot.
    static bool isValidDocumentId(const std::string& documentId);

    std::string pathFor(const std::string& documentId) const;
    const std::string& directory() const noexcept { return directory_; }

private:
    PersistenceError writeScene(const std::string& documentId, const SceneDocument& doc);

    std::string directory_;
};

} // namespace canvas

#endif // ARTCHIVE_CANVAS_PERSISTENCE_FILE_SCENE_STORE_H
