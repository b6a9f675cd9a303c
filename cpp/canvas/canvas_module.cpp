#include "canvas/canvas_module.h"

#include "canvas/core/logging.h"
#include "canvas/persistence/scene_codec.h"
#include "canvas/render/svg_export.h"
#include "canvas/scene/shape_factory.h"

#include <cstdlib>
#include <utility>

namespace canvas {

CanvasModule::CanvasModule()
    : CanvasModule(EditorConfig{}) {}

CanvasModule::CanvasModule(EditorConfig config)
    : editor_(config) {
    // Start from a saved, empty document so edits mark it dirty.
    editor_.initializeState(SceneDocument{});
}

CanvasModule::~CanvasModule() = default;

std::uintptr_t CanvasModule::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void CanvasModule::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

std::uint32_t CanvasModule::loadDocumentFromPtr(std::uintptr_t ptr, std::uint32_t byteCount) {
    const auto* src = reinterpret_cast<const std::uint8_t*>(ptr);
    SceneDocument doc{};
    const CodecError err = decodeSceneDocument(src, byteCount, doc);
    if (err != CodecError::Ok) {
        CANVAS_LOG_WARN("[module] document rejected: %s", codecErrorName(err));
        return static_cast<std::uint32_t>(err);
    }
    editor_.initializeState(doc);
    return static_cast<std::uint32_t>(CodecError::Ok);
}

std::uint32_t CanvasModule::loadDocument(const std::vector<std::uint8_t>& bytes) {
    return loadDocumentFromPtr(reinterpret_cast<std::uintptr_t>(bytes.data()), static_cast<std::uint32_t>(bytes.size()));
}

CanvasModule::ByteBufferMeta CanvasModule::saveDocument() {
    documentBuffer_ = encodeSceneDocument(editor_.document());
    documentRevision_ = editor_.revision();
    documentGeneration_++;
    return ByteBufferMeta{
        documentGeneration_,
        static_cast<std::uint32_t>(documentBuffer_.size()),
        reinterpret_cast<std::uintptr_t>(documentBuffer_.data()),
    };
}

void CanvasModule::markSaved() {
    editor_.markSaved(canvasNowMs(), documentRevision_);
}

std::string CanvasModule::addShape(const std::string& key, float x, float y) {
    ObjectKind kind{};
    if (!parseShapeKey(key, kind)) {
        CANVAS_LOG_WARN("[module] unknown shape '%s'", key.c_str());
        return {};
    }
    std::optional<SceneObject> obj = createShape(kind, editor_.generateId(), x, y);
    if (!obj) return {};
    std::string id = obj->id;
    return editor_.addObject(std::move(*obj)) ? id : std::string();
}

std::string CanvasModule::addText(const std::string& content, float x, float y, float fontSize) {
    SceneObject obj = createText(editor_.generateId(), content, x, y, fontSize);
    std::string id = obj.id;
    return editor_.addObject(std::move(obj)) ? id : std::string();
}

std::string CanvasModule::addImage(const std::string& src, float x, float y, float width, float height) {
    SceneObject obj = createImage(editor_.generateId(), src, x, y, width, height);
    std::string id = obj.id;
    return editor_.addObject(std::move(obj)) ? id : std::string();
}

std::string CanvasModule::addFrame(float x, float y, float width, float height, const std::string& placeholder) {
    SceneObject obj = createFrame(editor_.generateId(), x, y, width, height, placeholder);
    std::string id = obj.id;
    return editor_.addObject(std::move(obj)) ? id : std::string();
}

CanvasModule::MoveResult CanvasModule::toMoveResult(const SnapResult& snap) {
    MoveResult result{snap.x, snap.y, false, 0.0f, false, 0.0f};
    for (const SnapGuide& guide : snap.guides) {
        if (guide.axis == SnapAxis::Vertical) {
            result.hasVerticalGuide = true;
            result.verticalGuide = guide.position;
        } else {
            result.hasHorizontalGuide = true;
            result.horizontalGuide = guide.position;
        }
    }
    return result;
}

CanvasModule::MoveResult CanvasModule::moveObject(const std::string& id, float x, float y) {
    return toMoveResult(editor_.moveObject(id, x, y));
}

CanvasModule::MoveResult CanvasModule::previewMove(const std::string& id, float x, float y) const {
    return toMoveResult(editor_.previewMove(id, x, y));
}

bool CanvasModule::deleteObject(const std::string& id) {
    return editor_.deleteObject(id);
}

bool CanvasModule::deleteSelection() {
    // Copy: each delete prunes the selection.
    const std::vector<std::string> ids = editor_.state().selectedIds;
    bool any = false;
    for (const std::string& id : ids) {
        any = editor_.deleteObject(id) || any;
    }
    return any;
}

bool CanvasModule::toggleVisibility(const std::string& id) {
    return editor_.toggleVisibility(id);
}

bool CanvasModule::reorderObject(const std::string& id, bool up) {
    return editor_.reorderObject(id, up ? ReorderDirection::Up : ReorderDirection::Down);
}

bool CanvasModule::attachImageToFrame(const std::string& imageId, const std::string& frameId) {
    return editor_.attachImageToFrame(imageId, frameId);
}

bool CanvasModule::setCanvasSize(float width, float height) {
    return editor_.setCanvasSize(width, height);
}

bool CanvasModule::setBackground(const std::string& color) {
    return editor_.setBackground(color.empty() ? std::nullopt : std::optional<std::string>(color));
}

void CanvasModule::selectObjects(const std::vector<std::string>& ids) {
    editor_.selectObjects(ids);
}

void CanvasModule::clearSelection() {
    editor_.clearSelection();
}

std::vector<std::string> CanvasModule::getSelectedIds() const {
    return editor_.state().selectedIds;
}

std::string CanvasModule::groupSelection() {
    return editor_.groupObjects(editor_.state().selectedIds).value_or(std::string());
}

bool CanvasModule::ungroupObject(const std::string& id) {
    return editor_.ungroupObject(id);
}

std::uint32_t CanvasModule::copySelection() {
    return static_cast<std::uint32_t>(editor_.copyObjects());
}

std::uint32_t CanvasModule::paste() {
    return static_cast<std::uint32_t>(editor_.pasteObjects().size());
}

bool CanvasModule::initializeTextSystem() {
    if (!fontManager_.initialize()) return false;
    if (!measurer_) {
        measurer_ = std::make_unique<text::TextMeasurer>(fontManager_);
    }
    return true;
}

std::uint32_t CanvasModule::loadFont(
    std::uintptr_t ptr,
    std::uint32_t byteCount,
    const std::string& family,
    bool bold,
    bool italic) {
    if (!initializeTextSystem()) return 0;
    return fontManager_.loadFontFromMemory(reinterpret_cast<const std::uint8_t*>(ptr), byteCount, family, bold, italic);
}

std::string CanvasModule::exportSvg(float scale) {
    ProjectOptions options{};
    options.origin = linkOrigin_;
    options.measurer = measurer_.get();
    return exportDocumentSvg(editor_.document(), scale, options);
}

CanvasModule::ModuleStats CanvasModule::getStats() const {
    const std::uint64_t digest = editor_.getDocumentDigest();
    ModuleStats stats{};
    stats.objectCount = static_cast<std::uint32_t>(editor_.state().objects.size());
    stats.selectedCount = static_cast<std::uint32_t>(editor_.state().selectedIds.size());
    stats.undoDepth = static_cast<std::uint32_t>(editor_.history().getUndoSize());
    stats.redoDepth = static_cast<std::uint32_t>(editor_.history().getRedoSize());
    stats.revision = static_cast<std::uint32_t>(editor_.revision());
    stats.hasUnsavedChanges = editor_.hasUnsavedChanges();
    stats.digestLo = static_cast<std::uint32_t>(digest & 0xFFFFFFFFu);
    stats.digestHi = static_cast<std::uint32_t>(digest >> 32);
    return stats;
}

} // namespace canvas
