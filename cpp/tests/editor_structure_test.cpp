#include <gtest/gtest.h>

#include "canvas/editor/canvas_editor.h"
#include "canvas/scene/shape_factory.h"

#include <memory>
#include <string>
#include <vector>

using namespace canvas;

namespace {

SceneObject rect(const std::string& id, float x, float y, float w = 100.0f, float h = 100.0f) {
    SceneObject obj = *createShape(ObjectKind::Rect, id, x, y);
    auto& shape = std::get<RectShape>(obj.shape);
    shape.width = w;
    shape.height = h;
    return obj;
}

std::vector<std::string> topLevelIds(const CanvasEditor& editor) {
    std::vector<std::string> ids;
    for (const SceneObject& obj : editor.state().objects) {
        ids.push_back(obj.id);
    }
    return ids;
}

class EditorStructureTest : public ::testing::Test {
protected:
    void SetUp() override {
        EditorConfig config{};
        config.gridEnabled = false;
        editor = std::make_unique<CanvasEditor>(config);
        editor->setIdGenerator([this]() { return "id" + std::to_string(++nextId); });
        editor->initializeState(SceneDocument{}, 0.0);
    }

    std::unique_ptr<CanvasEditor> editor;
    int nextId = 0;
};

} // namespace

TEST_F(EditorStructureTest, GroupWrapsObjectsRelativeToBounds) {
    editor->addObject(rect("a", 0.0f, 0.0f, 200.0f, 150.0f));
    editor->addObject(rect("b", 300.0f, 100.0f, 200.0f, 150.0f));

    const auto groupId = editor->groupObjects({"a", "b"});
    ASSERT_TRUE(groupId.has_value());
    EXPECT_EQ(topLevelIds(*editor), (std::vector<std::string>{*groupId}));
    EXPECT_EQ(editor->state().selectedIds, (std::vector<std::string>{*groupId}));

    const SceneObject* group = editor->findObject(*groupId);
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->kind, ObjectKind::Group);
    EXPECT_FLOAT_EQ(group->x, 0.0f);
    EXPECT_FLOAT_EQ(group->y, 0.0f);
    const auto& box = std::get<ContainerShape>(group->shape);
    EXPECT_FLOAT_EQ(box.width, 500.0f);
    EXPECT_FLOAT_EQ(box.height, 250.0f);
    ASSERT_EQ(group->children.size(), 2u);
    EXPECT_FLOAT_EQ(group->children[1].x, 300.0f);

    ASSERT_TRUE(editor->undo());
    EXPECT_EQ(topLevelIds(*editor), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(editor->state().selectedIds, (std::vector<std::string>{"a", "b"}));
}

TEST_F(EditorStructureTest, GroupNeedsTwoTopLevelObjects) {
    editor->addObject(rect("a", 0.0f, 0.0f));
    EXPECT_FALSE(editor->groupObjects({"a"}).has_value());
    EXPECT_FALSE(editor->groupObjects({"a", "ghost"}).has_value());
    EXPECT_EQ(editor->undoDescription(), "Add rect");
}

TEST_F(EditorStructureTest, UngroupRestoresAbsolutePositionsInPlace) {
    editor->addObject(rect("c", 800.0f, 800.0f));
    editor->addObject(rect("a", 50.0f, 60.0f));
    editor->addObject(rect("b", 300.0f, 100.0f));

    const auto groupId = editor->groupObjects({"a", "b"});
    ASSERT_TRUE(groupId.has_value());
    ObjectPatch move{};
    move.x = 150.0f;
    ASSERT_TRUE(editor->updateObject(*groupId, move));

    ASSERT_TRUE(editor->ungroupObject(*groupId));
    EXPECT_EQ(topLevelIds(*editor), (std::vector<std::string>{"c", "a", "b"}));
    EXPECT_FLOAT_EQ(editor->findObject("a")->x, 150.0f);
    EXPECT_FLOAT_EQ(editor->findObject("a")->y, 60.0f);
    EXPECT_FLOAT_EQ(editor->findObject("b")->x, 400.0f);
    EXPECT_EQ(editor->state().selectedIds, (std::vector<std::string>{"a", "b"}));

    EXPECT_FALSE(editor->ungroupObject("c"));
}

TEST_F(EditorStructureTest, NestedUpdateRefreshesGroupSize) {
    editor->addObject(rect("a", 0.0f, 0.0f));
    editor->addObject(rect("b", 100.0f, 0.0f));
    const auto groupId = editor->groupObjects({"a", "b"});
    ASSERT_TRUE(groupId.has_value());

    ObjectPatch grow{};
    RectShape wide = std::get<RectShape>(editor->findObject("b")->shape);
    wide.width = 300.0f;
    grow.shape = wide;
    ASSERT_TRUE(editor->updateObject("b", grow));

    const auto& box = std::get<ContainerShape>(editor->findObject(*groupId)->shape);
    EXPECT_FLOAT_EQ(box.width, 400.0f);
}

TEST_F(EditorStructureTest, PasteUsesFreshIdsAndOffset) {
    editor->addObject(rect("a", 10.0f, 20.0f));
    editor->selectObjects({"a"});
    ASSERT_EQ(editor->copyObjects(), 1u);

    const std::vector<std::string> first = editor->pasteObjects();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_NE(first[0], "a");
    EXPECT_EQ(editor->state().selectedIds, first);
    const SceneObject* copy = editor->findObject(first[0]);
    ASSERT_NE(copy, nullptr);
    EXPECT_FLOAT_EQ(copy->x, 30.0f);
    EXPECT_FLOAT_EQ(copy->y, 40.0f);
    EXPECT_EQ(editor->undoDescription(), "Paste 1 object(s)");

    const std::vector<std::string> second = editor->pasteObjects();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_NE(second[0], first[0]);
    EXPECT_EQ(editor->state().objects.size(), 3u);

    editor->undo();
    EXPECT_EQ(editor->state().selectedIds, first);
}

TEST_F(EditorStructureTest, PasteRenamesGroupChildren) {
    editor->addObject(rect("a", 0.0f, 0.0f));
    editor->addObject(rect("b", 200.0f, 0.0f));
    const auto groupId = editor->groupObjects({"a", "b"});
    ASSERT_TRUE(groupId.has_value());
    editor->selectObjects({*groupId});
    editor->copyObjects();

    const auto pasted = editor->pasteObjects();
    ASSERT_EQ(pasted.size(), 1u);
    const SceneObject* copy = editor->findObject(pasted[0]);
    ASSERT_NE(copy, nullptr);
    ASSERT_EQ(copy->children.size(), 2u);
    EXPECT_NE(copy->children[0].id, "a");
    EXPECT_NE(copy->children[1].id, "b");
    EXPECT_EQ(validateDocument(editor->document()), ValidationIssue::None);
}

TEST_F(EditorStructureTest, CopyTakesContainerButNotItsSelectedChild) {
    editor->addObject(rect("a", 100.0f, 100.0f));
    editor->addObject(rect("b", 300.0f, 100.0f));
    const auto groupId = editor->groupObjects({"a", "b"});
    ASSERT_TRUE(groupId.has_value());
    editor->selectObjects({*groupId, "a"});
    ASSERT_EQ(editor->state().selectedIds.size(), 2u);

    EXPECT_EQ(editor->copyObjects(), 1u);
    const auto pasted = editor->pasteObjects();
    ASSERT_EQ(pasted.size(), 1u);
    EXPECT_EQ(editor->state().objects.size(), 2u);

    const SceneObject* copy = editor->findObject(pasted[0]);
    ASSERT_NE(copy, nullptr);
    EXPECT_EQ(copy->kind, ObjectKind::Group);
    ASSERT_EQ(copy->children.size(), 2u);
    EXPECT_NE(copy->children[0].id, "a");
    EXPECT_NE(copy->children[1].id, "b");
    EXPECT_FLOAT_EQ(copy->x, 120.0f);
    EXPECT_FLOAT_EQ(copy->y, 120.0f);
    EXPECT_EQ(validateDocument(editor->document()), ValidationIssue::None);
}

TEST_F(EditorStructureTest, EmptyClipboardPastesNothing) {
    EXPECT_EQ(editor->copyObjects(), 0u);
    EXPECT_TRUE(editor->pasteObjects().empty());
    EXPECT_FALSE(editor->canUndo());
}

TEST_F(EditorStructureTest, RepeatingIdGeneratorStillYieldsUniqueIds) {
    editor->setIdGenerator([]() { return std::string("dup"); });
    editor->addObject(rect("a", 0.0f, 0.0f));
    editor->addObject(rect("b", 200.0f, 0.0f));
    editor->selectObjects({"a", "b"});
    editor->copyObjects();

    const auto pasted = editor->pasteObjects();
    ASSERT_EQ(pasted.size(), 2u);
    EXPECT_NE(pasted[0], pasted[1]);
    EXPECT_EQ(validateDocument(editor->document()), ValidationIssue::None);
}

TEST_F(EditorStructureTest, AttachImageFitsInsideFrame) {
    editor->addObject(createFrame("frame", 100.0f, 100.0f, 400.0f, 300.0f, "Drop artwork"));
    editor->addObject(createImage("img", "art.png", 900.0f, 50.0f, 800.0f, 400.0f));

    ASSERT_TRUE(editor->attachImageToFrame("img", "frame"));
    EXPECT_EQ(topLevelIds(*editor), (std::vector<std::string>{"frame"}));

    const SceneObject* frame = editor->findObject("frame");
    ASSERT_EQ(frame->children.size(), 1u);
    const SceneObject& child = frame->children[0];
    EXPECT_EQ(child.id, "img");
    const auto& image = std::get<ImageShape>(child.shape);
    EXPECT_FLOAT_EQ(image.width, 400.0f);
    EXPECT_FLOAT_EQ(image.height, 200.0f);
    EXPECT_FLOAT_EQ(child.x, 0.0f);
    EXPECT_FLOAT_EQ(child.y, 50.0f);

    ASSERT_TRUE(editor->undo());
    EXPECT_EQ(topLevelIds(*editor), (std::vector<std::string>{"frame", "img"}));
    EXPECT_TRUE(editor->findObject("frame")->children.empty());
}

TEST_F(EditorStructureTest, AttachRejectsWrongKinds) {
    editor->addObject(rect("r", 0.0f, 0.0f));
    editor->addObject(createImage("img", "art.png", 0.0f, 0.0f, 10.0f, 10.0f));
    EXPECT_FALSE(editor->attachImageToFrame("img", "r"));
    EXPECT_FALSE(editor->attachImageToFrame("r", "img"));
    EXPECT_EQ(editor->state().objects.size(), 2u);
}

TEST_F(EditorStructureTest, ReorderSwapsNeighbours) {
    editor->addObject(rect("a", 0.0f, 0.0f));
    editor->addObject(rect("b", 0.0f, 0.0f));
    editor->addObject(rect("c", 0.0f, 0.0f));

    ASSERT_TRUE(editor->reorderObject("c", ReorderDirection::Up));
    EXPECT_EQ(topLevelIds(*editor), (std::vector<std::string>{"a", "c", "b"}));
    EXPECT_FALSE(editor->reorderObject("a", ReorderDirection::Up));
    EXPECT_FALSE(editor->reorderObject("b", ReorderDirection::Down));
    ASSERT_TRUE(editor->reorderObject("a", ReorderDirection::Down));
    EXPECT_EQ(topLevelIds(*editor), (std::vector<std::string>{"c", "a", "b"}));
}

TEST_F(EditorStructureTest, ToggleVisibilityIsUndoable) {
    editor->addObject(rect("a", 0.0f, 0.0f));
    ASSERT_TRUE(editor->toggleVisibility("a"));
    EXPECT_FALSE(editor->findObject("a")->visible);
    ASSERT_TRUE(editor->toggleVisibility("a"));
    EXPECT_TRUE(editor->findObject("a")->visible);
    editor->undo();
    EXPECT_FALSE(editor->findObject("a")->visible);
}

TEST_F(EditorStructureTest, MoveSnapsToSiblingEdge) {
    editor->addObject(rect("a", 0.0f, 0.0f, 200.0f, 150.0f));
    editor->addObject(rect("b", 500.0f, 500.0f, 200.0f, 150.0f));

    const SnapResult preview = editor->previewMove("b", 205.0f, 505.0f);
    EXPECT_FLOAT_EQ(preview.x, 200.0f);
    EXPECT_FLOAT_EQ(editor->findObject("b")->x, 500.0f);

    const SnapResult result = editor->moveObject("b", 205.0f, 505.0f);
    EXPECT_FLOAT_EQ(result.x, 200.0f);
    EXPECT_FLOAT_EQ(result.y, 505.0f);
    EXPECT_FLOAT_EQ(editor->findObject("b")->x, 200.0f);

    editor->undo();
    EXPECT_FLOAT_EQ(editor->findObject("b")->x, 500.0f);
}

TEST_F(EditorStructureTest, CircleSnapsByItsBoundingBox) {
    editor->addObject(rect("a", 0.0f, 0.0f, 200.0f, 150.0f));
    editor->addObject(*createShape(ObjectKind::Circle, "c", 700.0f, 700.0f));

    // Radius 75: a centre at x=280 puts the left edge at 205, 5 from a's right edge.
    const SnapResult result = editor->moveObject("c", 280.0f, 600.0f);
    EXPECT_FLOAT_EQ(result.x, 275.0f);
    EXPECT_FLOAT_EQ(result.y, 600.0f);
    EXPECT_FLOAT_EQ(editor->findObject("c")->x, 275.0f);
}

TEST_F(EditorStructureTest, ChildSnapsToContainerCentre) {
    SceneObject frame = createFrame("frame", 500.0f, 500.0f, 400.0f, 300.0f, "");
    frame.children.push_back(rect("inner", 0.0f, 0.0f, 100.0f, 100.0f));
    ASSERT_TRUE(editor->addObject(frame));

    const SnapResult result = editor->moveObject("inner", 147.0f, 10.0f);
    EXPECT_FLOAT_EQ(result.x, 150.0f);
    EXPECT_FLOAT_EQ(result.y, 10.0f);
    ASSERT_FALSE(result.guides.empty());
    EXPECT_EQ(result.guides[0].source, SnapSource::CanvasCenter);
}

TEST_F(EditorStructureTest, SnapDisabledMovesFreely) {
    editor->toggleSnap();
    editor->addObject(rect("a", 0.0f, 0.0f, 200.0f, 150.0f));
    editor->addObject(rect("b", 500.0f, 500.0f));

    const SnapResult result = editor->moveObject("b", 203.0f, 3.0f);
    EXPECT_FLOAT_EQ(result.x, 203.0f);
    EXPECT_FLOAT_EQ(result.y, 3.0f);
    EXPECT_TRUE(result.guides.empty());
}
