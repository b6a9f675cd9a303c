#include <gtest/gtest.h>

#include "canvas/canvas_module.h"
#include "canvas/persistence/scene_codec.h"

#include <cstring>

using namespace canvas;

TEST(CanvasModuleTest, AddsPaletteShapesAndTracksDirty) {
    CanvasModule module;
    EXPECT_FALSE(module.getStats().hasUnsavedChanges);

    const std::string id = module.addShape("star", 120.0f, 80.0f);
    ASSERT_FALSE(id.empty());
    EXPECT_TRUE(module.addShape("hexagon", 0.0f, 0.0f).empty());

    const auto stats = module.getStats();
    EXPECT_EQ(stats.objectCount, 1u);
    EXPECT_EQ(stats.undoDepth, 1u);
    EXPECT_TRUE(stats.hasUnsavedChanges);

    const SceneObject* star = module.editor().findObject(id);
    ASSERT_NE(star, nullptr);
    EXPECT_EQ(star->kind, ObjectKind::Star);
}

TEST(CanvasModuleTest, SaveAndReloadThroughLinearMemory) {
    CanvasModule source;
    source.addShape("rectangle", 10.0f, 10.0f);
    source.addText("Opening night", 50.0f, 400.0f, 32.0f);
    source.setBackground("#101010");

    const auto meta = source.saveDocument();
    ASSERT_GT(meta.byteCount, 0u);
    EXPECT_EQ(meta.generation, 1u);
    source.markSaved();
    EXPECT_FALSE(source.getStats().hasUnsavedChanges);

    CanvasModule target;
    const std::uintptr_t ptr = target.allocBytes(meta.byteCount);
    ASSERT_NE(ptr, 0u);
    std::memcpy(reinterpret_cast<void*>(ptr), reinterpret_cast<const void*>(meta.ptr), meta.byteCount);
    EXPECT_EQ(target.loadDocumentFromPtr(ptr, meta.byteCount), static_cast<std::uint32_t>(CodecError::Ok));
    target.freeBytes(ptr);

    EXPECT_EQ(target.editor().document(), source.editor().document());
    EXPECT_EQ(target.getStats().digestLo, source.getStats().digestLo);
    EXPECT_EQ(target.getStats().digestHi, source.getStats().digestHi);
    EXPECT_FALSE(target.canUndo());
}

TEST(CanvasModuleTest, EditsAfterSnapshotStayDirty) {
    CanvasModule module;
    module.addShape("circle", 300.0f, 300.0f);
    module.saveDocument();
    module.addShape("diamond", 600.0f, 300.0f);
    module.markSaved();
    EXPECT_TRUE(module.getStats().hasUnsavedChanges);
}

TEST(CanvasModuleTest, RejectsMalformedDocument) {
    CanvasModule module;
    module.addShape("rectangle", 0.0f, 0.0f);

    const std::vector<std::uint8_t> junk(32, 0xAB);
    EXPECT_EQ(module.loadDocument(junk), static_cast<std::uint32_t>(CodecError::InvalidMagic));
    EXPECT_EQ(module.loadDocument({}), static_cast<std::uint32_t>(CodecError::BufferTruncated));
    EXPECT_EQ(module.getStats().objectCount, 1u);
}

TEST(CanvasModuleTest, SelectionGroupAndClipboard) {
    EditorConfig config{};
    config.gridEnabled = false;
    CanvasModule module(config);
    const std::string a = module.addShape("rectangle", 0.0f, 0.0f);
    const std::string b = module.addShape("circle", 600.0f, 300.0f);

    module.selectObjects({a, b, "ghost"});
    EXPECT_EQ(module.getSelectedIds(), (std::vector<std::string>{a, b}));

    const std::string group = module.groupSelection();
    ASSERT_FALSE(group.empty());
    EXPECT_EQ(module.getStats().objectCount, 1u);
    EXPECT_EQ(module.getSelectedIds(), (std::vector<std::string>{group}));

    EXPECT_EQ(module.copySelection(), 1u);
    EXPECT_EQ(module.paste(), 1u);
    EXPECT_EQ(module.getStats().objectCount, 2u);

    EXPECT_TRUE(module.ungroupObject(group));
    EXPECT_EQ(module.getStats().objectCount, 3u);

    module.selectObjects({a, b});
    EXPECT_TRUE(module.deleteSelection());
    EXPECT_EQ(module.getStats().objectCount, 1u);
    EXPECT_TRUE(module.getSelectedIds().empty());

    module.clearSelection();
    EXPECT_FALSE(module.deleteSelection());
}

TEST(CanvasModuleTest, MoveReportsGuides) {
    EditorConfig config{};
    config.gridEnabled = false;
    CanvasModule module(config);
    const std::string a = module.addShape("rectangle", 0.0f, 0.0f);
    const std::string b = module.addShape("rectangle", 500.0f, 500.0f);

    const auto preview = module.previewMove(b, 205.0f, 505.0f);
    EXPECT_TRUE(preview.hasVerticalGuide);
    EXPECT_FLOAT_EQ(preview.verticalGuide, 200.0f);
    EXPECT_FALSE(preview.hasHorizontalGuide);

    const auto moved = module.moveObject(b, 205.0f, 505.0f);
    EXPECT_FLOAT_EQ(moved.x, 200.0f);
    EXPECT_FLOAT_EQ(module.editor().findObject(b)->x, 200.0f);
    EXPECT_TRUE(module.undo());
    EXPECT_TRUE(module.canRedo());
    EXPECT_FLOAT_EQ(module.editor().findObject(b)->x, 500.0f);
    EXPECT_TRUE(module.redo());
    (void)a;
}

TEST(CanvasModuleTest, FramesLayersAndView) {
    CanvasModule module;
    const std::string frame = module.addFrame(100.0f, 100.0f, 400.0f, 300.0f, "Drop artwork");
    const std::string image = module.addImage("art.png", 900.0f, 100.0f, 400.0f, 300.0f);
    ASSERT_FALSE(frame.empty());
    ASSERT_FALSE(image.empty());

    EXPECT_TRUE(module.attachImageToFrame(image, frame));
    EXPECT_EQ(module.getStats().objectCount, 1u);

    const std::string rect = module.addShape("rectangle", 0.0f, 0.0f);
    EXPECT_TRUE(module.reorderObject(rect, true));
    EXPECT_EQ(module.editor().state().objects.front().id, rect);
    EXPECT_TRUE(module.toggleVisibility(rect));
    EXPECT_FALSE(module.editor().findObject(rect)->visible);

    EXPECT_TRUE(module.setCanvasSize(800.0f, 600.0f));
    EXPECT_FALSE(module.setCanvasSize(-1.0f, 600.0f));
    EXPECT_TRUE(module.setBackground("#123456"));
    EXPECT_TRUE(module.setBackground(""));
    EXPECT_FALSE(module.editor().state().background.has_value());

    module.setZoom(5.0f);
    EXPECT_FLOAT_EQ(module.getZoom(), kMaxZoom);
    module.setPan(10.0f, 20.0f);
    module.toggleGrid();
    module.toggleSnap();
    EXPECT_FALSE(module.editor().state().snapEnabled);
}

TEST(CanvasModuleTest, ExportsSvgWithLinkOrigin) {
    CanvasModule module;
    module.setCanvasSize(800.0f, 600.0f);
    const std::string text = module.addText("/shows/spring", 10.0f, 10.0f, 20.0f);
    ObjectPatch patch{};
    TextShape shape = std::get<TextShape>(module.editor().findObject(text)->shape);
    shape.isHyperlink = true;
    patch.shape = shape;
    ASSERT_TRUE(module.editor().updateObject(text, patch));

    module.setLinkOrigin("https://artchive.io");
    const std::string svg = module.exportSvg(0.5f);
    EXPECT_NE(svg.find("width=\"400\" height=\"300\""), std::string::npos);
    EXPECT_NE(svg.find("href=\"https://artchive.io/shows/spring\""), std::string::npos);
}

TEST(CanvasModuleTest, ExportMeasuresTextOnceInitialized) {
    CanvasModule module;
    ASSERT_TRUE(module.initializeTextSystem());
    module.addText("first\nsecond", 0.0f, 0.0f, 20.0f);

    const std::string svg = module.exportSvg(1.0f);
    EXPECT_NE(svg.find(">first</tspan>"), std::string::npos);
    EXPECT_EQ(module.loadFont(0, 0, "Broken", false, false), 0u);
}
