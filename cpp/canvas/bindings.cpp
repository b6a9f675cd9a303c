#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "canvas/canvas_module.h"

#ifdef EMSCRIPTEN
using canvas::CanvasModule;

EMSCRIPTEN_BINDINGS(artchive_canvas_module) {
    emscripten::register_vector<std::string>("StringList");

    emscripten::class_<CanvasModule>("CanvasModule")
        .constructor<>()
        .function("allocBytes", &CanvasModule::allocBytes)
        .function("freeBytes", &CanvasModule::freeBytes)
        // Document bytes
        .function("loadDocumentFromPtr", &CanvasModule::loadDocumentFromPtr)
        .function("saveDocument", &CanvasModule::saveDocument)
        .function("markSaved", &CanvasModule::markSaved)
        // Objects
        .function("addShape", &CanvasModule::addShape)
        .function("addText", &CanvasModule::addText)
        .function("addImage", &CanvasModule::addImage)
        .function("addFrame", &CanvasModule::addFrame)
        .function("moveObject", &CanvasModule::moveObject)
        .function("previewMove", &CanvasModule::previewMove)
        .function("deleteObject", &CanvasModule::deleteObject)
        .function("deleteSelection", &CanvasModule::deleteSelection)
        .function("toggleVisibility", &CanvasModule::toggleVisibility)
        .function("reorderObject", &CanvasModule::reorderObject)
        .function("attachImageToFrame", &CanvasModule::attachImageToFrame)
        .function("setCanvasSize", &CanvasModule::setCanvasSize)
        .function("setBackground", &CanvasModule::setBackground)
        // Selection / clipboard
        .function("selectObjects", &CanvasModule::selectObjects)
        .function("clearSelection", &CanvasModule::clearSelection)
        .function("getSelectedIds", &CanvasModule::getSelectedIds)
        .function("groupSelection", &CanvasModule::groupSelection)
        .function("ungroupObject", &CanvasModule::ungroupObject)
        .function("copySelection", &CanvasModule::copySelection)
        .function("paste", &CanvasModule::paste)
        // History
        .function("undo", &CanvasModule::undo)
        .function("redo", &CanvasModule::redo)
        .function("canUndo", &CanvasModule::canUndo)
        .function("canRedo", &CanvasModule::canRedo)
        // View
        .function("setZoom", &CanvasModule::setZoom)
        .function("getZoom", &CanvasModule::getZoom)
        .function("setPan", &CanvasModule::setPan)
        .function("toggleGrid", &CanvasModule::toggleGrid)
        .function("toggleSnap", &CanvasModule::toggleSnap)
        // Text / export
        .function("initializeTextSystem", &CanvasModule::initializeTextSystem)
        .function("loadFont", &CanvasModule::loadFont)
        .function("setLinkOrigin", &CanvasModule::setLinkOrigin)
        .function("exportSvg", &CanvasModule::exportSvg)
        .function("getStats", &CanvasModule::getStats);

    emscripten::value_object<CanvasModule::ByteBufferMeta>("ByteBufferMeta")
        .field("generation", &CanvasModule::ByteBufferMeta::generation)
        .field("byteCount", &CanvasModule::ByteBufferMeta::byteCount)
        .field("ptr", &CanvasModule::ByteBufferMeta::ptr);

    emscripten::value_object<CanvasModule::MoveResult>("MoveResult")
        .field("x", &CanvasModule::MoveResult::x)
        .field("y", &CanvasModule::MoveResult::y)
        .field("hasVerticalGuide", &CanvasModule::MoveResult::hasVerticalGuide)
        .field("verticalGuide", &CanvasModule::MoveResult::verticalGuide)
        .field("hasHorizontalGuide", &CanvasModule::MoveResult::hasHorizontalGuide)
        .field("horizontalGuide", &CanvasModule::MoveResult::horizontalGuide);

    emscripten::value_object<CanvasModule::ModuleStats>("ModuleStats")
        .field("objectCount", &CanvasModule::ModuleStats::objectCount)
        .field("selectedCount", &CanvasModule::ModuleStats::selectedCount)
        .field("undoDepth", &CanvasModule::ModuleStats::undoDepth)
        .field("redoDepth", &CanvasModule::ModuleStats::redoDepth)
        .field("revision", &CanvasModule::ModuleStats::revision)
        .field("hasUnsavedChanges", &CanvasModule::ModuleStats::hasUnsavedChanges)
        .field("digestLo", &CanvasModule::ModuleStats::digestLo)
        .field("digestHi", &CanvasModule::ModuleStats::digestHi);
}
#endif
