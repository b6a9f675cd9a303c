#ifndef ARTCHIVE_CANVAS_CANVAS_MODULE_H
#define ARTCHIVE_CANVAS_CANVAS_MODULE_H

#include "canvas/editor/canvas_editor.h"
#include "canvas/text/font_manager.h"
#include "canvas/text/text_measure.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace canvas {

// Flat facade over the editor for the browser bindings: plain numbers,
// strings and linear-memory pointers only.
class CanvasModule {
public:
    struct ByteBufferMeta {
        std::uint32_t generation;
        std::uint32_t byteCount;
        std::uintptr_t ptr; // byte offset in WASM linear memory
    };

    struct MoveResult {
        float x;
        float y;
        bool hasVerticalGuide;
        float verticalGuide;
        bool hasHorizontalGuide;
        float horizontalGuide;
    };

    struct ModuleStats {
        std::uint32_t objectCount;
        std::uint32_t selectedCount;
        std::uint32_t undoDepth;
        std::uint32_t redoDepth;
        std::uint32_t revision;
        bool hasUnsavedChanges;
        // FNV digest split for JS (no 64-bit ints through embind).
        std::uint32_t digestLo;
        std::uint32_t digestHi;
    };

    CanvasModule();
    explicit CanvasModule(EditorConfig config);
    ~CanvasModule();

    CanvasModule(const CanvasModule&) = delete;
    CanvasModule& operator=(const CanvasModule&) = delete;

    CanvasEditor& editor() { return editor_; }
    const CanvasEditor& editor() const { return editor_; }

    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);

    // Returns a CodecError code; 0 on success.
    std::uint32_t loadDocumentFromPtr(std::uintptr_t ptr, std::uint32_t byteCount);
    std::uint32_t loadDocument(const std::vector<std::uint8_t>& bytes);
    // Encodes the current document into an internal buffer valid until the
    // next call.
    ByteBufferMeta saveDocument();
    const std::vector<std::uint8_t>& documentBytes() const { return documentBuffer_; }
    // Call once the bytes returned by saveDocument() were persisted.
    void markSaved();

    // Palette shapes by key ("rectangle", "circle", ...). Empty id on failure.
    std::string addShape(const std::string& key, float x, float y);
    std::string addText(const std::string& content, float x, float y, float fontSize);
    std::string addImage(const std::string& src, float x, float y, float width, float height);
    std::string addFrame(float x, float y, float width, float height, const std::string& placeholder);

    MoveResult moveObject(const std::string& id, float x, float y);
    MoveResult previewMove(const std::string& id, float x, float y) const;
    bool deleteObject(const std::string& id);
    bool deleteSelection();
    bool toggleVisibility(const std::string& id);
    bool reorderObject(const std::string& id, bool up);
    bool attachImageToFrame(const std::string& imageId, const std::string& frameId);
    bool setCanvasSize(float width, float height);
    // Empty string clears the background.
    bool setBackground(const std::string& color);

    void selectObjects(const std::vector<std::string>& ids);
    void clearSelection();
    std::vector<std::string> getSelectedIds() const;

    std::string groupSelection();
    bool ungroupObject(const std::string& id);
    std::uint32_t copySelection();
    std::uint32_t paste();

    bool undo() { return editor_.undo(); }
    bool redo() { return editor_.redo(); }
    bool canUndo() const { return editor_.canUndo(); }
    bool canRedo() const { return editor_.canRedo(); }

    void setZoom(float zoom) { editor_.setZoom(zoom); }
    float getZoom() const { return editor_.state().zoom; }
    void setPan(float x, float y) { editor_.setPan(x, y); }
    void toggleGrid() { editor_.toggleGrid(); }
    void toggleSnap() { editor_.toggleSnap(); }

    // Fonts registered here are used to measure text in exports.
    bool initializeTextSystem();
    std::uint32_t loadFont(std::uintptr_t ptr, std::uint32_t byteCount, const std::string& family, bool bold, bool italic);

    std::string exportSvg(float scale);
    void setLinkOrigin(const std::string& origin) { linkOrigin_ = origin; }

    ModuleStats getStats() const;

private:
    static MoveResult toMoveResult(const SnapResult& snap);

    CanvasEditor editor_;
    text::FontManager fontManager_;
    std::unique_ptr<text::TextMeasurer> measurer_;
    std::vector<std::uint8_t> documentBuffer_;
    std::uint32_t documentGeneration_{0};
    std::uint64_t documentRevision_{0};
    std::string linkOrigin_;
};

} // namespace canvas

#endif // ARTCHIVE_CANVAS_CANVAS_MODULE_H
