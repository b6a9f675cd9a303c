#include "canvas/persistence/file_scene_store.h"

#include "canvas/core/logging.h"
#include "canvas/persistence/scene_codec.h"
#include "canvas/scene/scene_object.h"

#include <cerrno>
#include <cstdio>
#include <cstdint>
#include <utility>
#include <vector>

namespace canvas {

namespace {

PersistenceError errorFromErrno(int err) {
    switch (err) {
        case ENOENT:
            return PersistenceError::NotFound;
        case EACCES:
        case EPERM:
            return PersistenceError::Unauthorized;
        default:
            return PersistenceError::TransientError;
    }
}

// Owns a FILE* for the duration of a scope.
struct FileCloser {
    std::FILE* file;
    ~FileCloser() {
        if (file) std::fclose(file);
    }
};

} // namespace

FileSceneStore::FileSceneStore(std::string directory)
    : directory_(std::move(directory)) {
    if (directory_.empty()) {
        directory_ = ".";
    }
}

bool FileSceneStore::isValidDocumentId(const std::string& documentId) {
    if (documentId.empty() || documentId.front() == '.') return false;
    for (const char c : documentId) {
        if (c == '/' || c == '\\' || c == '\0' || c == ':') return false;
    }
    return true;
}

std::string FileSceneStore::pathFor(const std::string& documentId) const {
    std::string path = directory_;
    if (path.back() != '/') path += '/';
    path += documentId;
    path += kSceneFileExtension;
    return path;
}

PersistenceError FileSceneStore::loadScene(const std::string& documentId, SceneDocument& out) {
    if (!isValidDocumentId(documentId)) return PersistenceError::ValidationError;

    const std::string path = pathFor(documentId);
    std::FILE* raw = std::fopen(path.c_str(), "rb");
    if (!raw) {
        const int err = errno;
        CANVAS_LOG_DEBUG("[store] open '%s' failed (errno %d)", path.c_str(), err);
        return errorFromErrno(err);
    }
    FileCloser closer{raw};

    std::vector<std::uint8_t> bytes;
    std::uint8_t chunk[4096];
    for (;;) {
        const std::size_t n = std::fread(chunk, 1, sizeof(chunk), raw);
        bytes.insert(bytes.end(), chunk, chunk + n);
        if (n < sizeof(chunk)) break;
    }
    if (std::ferror(raw)) {
        CANVAS_LOG_WARN("[store] read '%s' failed", path.c_str());
        return PersistenceError::TransientError;
    }

    SceneDocument doc{};
    const CodecError codecErr = decodeSceneDocument(bytes.data(), bytes.size(), doc);
    if (codecErr != CodecError::Ok) {
        CANVAS_LOG_WARN("[store] '%s' is not a scene file: %s", path.c_str(), codecErrorName(codecErr));
        return PersistenceError::ValidationError;
    }
    if (validateDocument(doc) != ValidationIssue::None) {
        return PersistenceError::ValidationError;
    }
    out = std::move(doc);
    return PersistenceError::Ok;
}

void FileSceneStore::saveScene(const std::string& documentId, const SceneDocument& doc, SaveCompletion done) {
    const PersistenceError result = writeScene(documentId, doc);
    if (done) done(result);
}

PersistenceError FileSceneStore::writeScene(const std::string& documentId, const SceneDocument& doc) {
    if (!isValidDocumentId(documentId)) return PersistenceError::ValidationError;

    const ValidationIssue issue = validateDocument(doc);
    if (issue != ValidationIssue::None) {
        CANVAS_LOG_WARN("[store] refusing to save '%s': %s", documentId.c_str(), validationIssueName(issue));
        return PersistenceError::ValidationError;
    }

    const std::vector<std::uint8_t> bytes = encodeSceneDocument(doc);
    const std::string path = pathFor(documentId);
    const std::string tmpPath = path + ".tmp";

    {
        std::FILE* raw = std::fopen(tmpPath.c_str(), "wb");
        if (!raw) {
            const int err = errno;
            CANVAS_LOG_WARN("[store] open '%s' for write failed (errno %d)", tmpPath.c_str(), err);
            return err == ENOENT ? PersistenceError::TransientError : errorFromErrno(err);
        }
        FileCloser closer{raw};
        if (std::fwrite(bytes.data(), 1, bytes.size(), raw) != bytes.size() || std::fflush(raw) != 0) {
            CANVAS_LOG_WARN("[store] write '%s' failed", tmpPath.c_str());
            closer.file = nullptr;
            std::fclose(raw);
            std::remove(tmpPath.c_str());
            return PersistenceError::TransientError;
        }
    }

    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        const int err = errno;
        CANVAS_LOG_WARN("[store] rename to '%s' failed (errno %d)", path.c_str(), err);
        std::remove(tmpPath.c_str());
        return err == ENOENT ? PersistenceError::TransientError : errorFromErrno(err);
    }
    CANVAS_LOG_DEBUG("[store] saved '%s' (%zu bytes)", path.c_str(), bytes.size());
    return PersistenceError::Ok;
}

} // namespace canvas
