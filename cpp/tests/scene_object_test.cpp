#include <gtest/gtest.h>

#include "canvas/scene/scene_object.h"
#include "canvas/scene/scene_tree.h"

using namespace canvas;

namespace {

SceneObject makeRect(const std::string& id, float x, float y, float w, float h) {
    SceneObject obj{};
    obj.id = id;
    obj.kind = ObjectKind::Rect;
    obj.x = x;
    obj.y = y;
    RectShape rect{};
    rect.width = w;
    rect.height = h;
    obj.shape = rect;
    return obj;
}

SceneObject makeCircle(const std::string& id, float x, float y, float r) {
    SceneObject obj{};
    obj.id = id;
    obj.kind = ObjectKind::Circle;
    obj.x = x;
    obj.y = y;
    CircleShape circle{};
    circle.radius = r;
    obj.shape = circle;
    return obj;
}

SceneObject makeLine(const std::string& id, float x, float y, std::vector<float> points) {
    SceneObject obj{};
    obj.id = id;
    obj.kind = ObjectKind::Line;
    obj.x = x;
    obj.y = y;
    PathShape path{};
    path.points = std::move(points);
    obj.shape = path;
    return obj;
}

SceneObject makeGroup(const std::string& id, std::vector<SceneObject> children) {
    SceneObject obj{};
    obj.id = id;
    obj.kind = ObjectKind::Group;
    obj.shape = ContainerShape{};
    obj.children = std::move(children);
    return obj;
}

} // namespace

TEST(SceneObjectTest, SizeAccessorsAreVariantAware) {
    SceneObject rect = makeRect("r", 0, 0, 100, 50);
    rect.scaleX = 2.0f;
    rect.scaleY = 0.5f;
    EXPECT_FLOAT_EQ(*objectWidth(rect), 200.0f);
    EXPECT_FLOAT_EQ(*objectHeight(rect), 25.0f);

    SceneObject circle = makeCircle("c", 0, 0, 20);
    circle.scaleX = 1.5f;
    EXPECT_FLOAT_EQ(*objectWidth(circle), 60.0f);
    EXPECT_FLOAT_EQ(*objectHeight(circle), 40.0f);

    SceneObject text{};
    text.id = "t";
    text.kind = ObjectKind::Text;
    TextShape t{};
    t.text = "hello";
    text.shape = t;
    EXPECT_FALSE(objectWidth(text).has_value());
    std::get<TextShape>(text.shape).width = 120.0f;
    EXPECT_FLOAT_EQ(*objectWidth(text), 120.0f);
    EXPECT_FALSE(objectHeight(text).has_value());

    EXPECT_FALSE(objectWidth(makeLine("l", 0, 0, {0, 0, 10, 0})).has_value());
    EXPECT_FALSE(objectWidth(makeGroup("g", {})).has_value());
}

TEST(SceneObjectTest, MismatchedShapeHasNoSize) {
    SceneObject broken = makeRect("r", 0, 0, 10, 10);
    broken.kind = ObjectKind::Circle;
    EXPECT_FALSE(objectWidth(broken).has_value());
    EXPECT_EQ(validateObject(broken), ValidationIssue::ShapeMismatch);
}

TEST(SceneObjectTest, CircleBoundingBoxIsCentred) {
    const BoundingBox box = boundingBox(makeCircle("c", 50, 50, 20));
    EXPECT_FLOAT_EQ(box.x, 30.0f);
    EXPECT_FLOAT_EQ(box.y, 30.0f);
    EXPECT_FLOAT_EQ(box.width, 40.0f);
    EXPECT_FLOAT_EQ(box.height, 40.0f);
}

TEST(SceneObjectTest, LineBoundingBoxUsesPoints) {
    const BoundingBox box = boundingBox(makeLine("l", 10, 20, {-5, 0, 15, 30}));
    EXPECT_FLOAT_EQ(box.x, 5.0f);
    EXPECT_FLOAT_EQ(box.y, 20.0f);
    EXPECT_FLOAT_EQ(box.width, 20.0f);
    EXPECT_FLOAT_EQ(box.height, 30.0f);
}

TEST(SceneObjectTest, GroupVisualBoundsSkipsHiddenChildren) {
    SceneObject hidden = makeRect("h", 500, 500, 10, 10);
    hidden.visible = false;
    SceneObject group = makeGroup("g", {makeRect("a", 0, 0, 10, 10), makeCircle("b", 40, 40, 10), hidden});

    const auto bounds = groupVisualBounds(group);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_FLOAT_EQ(bounds->minX, 0.0f);
    EXPECT_FLOAT_EQ(bounds->maxX, 50.0f);
    EXPECT_FLOAT_EQ(bounds->maxY, 50.0f);

    EXPECT_TRUE(recalculateGroupBounds(group));
    const auto& box = std::get<ContainerShape>(group.shape);
    EXPECT_FLOAT_EQ(box.width, 50.0f);
    EXPECT_FLOAT_EQ(box.height, 50.0f);
    EXPECT_FALSE(recalculateGroupBounds(group));
}

TEST(SceneObjectTest, GroupVisualBoundsNullWhenNothingVisible) {
    SceneObject child = makeRect("a", 0, 0, 10, 10);
    child.visible = false;
    EXPECT_FALSE(groupVisualBounds(makeGroup("g", {child})).has_value());
    EXPECT_FALSE(groupVisualBounds(makeRect("r", 0, 0, 1, 1)).has_value());
}

TEST(SceneObjectTest, TextEstimates) {
    TextShape t{};
    t.text = "abcd\nef";
    t.fontSize = 10.0f;
    EXPECT_FLOAT_EQ(estimateTextWidth(t), 7 * 10.0f * 0.6f);
    EXPECT_FLOAT_EQ(estimateTextHeight(t), 2 * 10.0f * 1.2f);
}

TEST(SceneObjectTest, ApplyPatchClampsOpacityAndRejectsMismatch) {
    SceneObject rect = makeRect("r", 0, 0, 10, 10);

    ObjectPatch patch{};
    patch.x = 5.0f;
    patch.opacity = 3.0f;
    ASSERT_TRUE(applyPatch(rect, patch));
    EXPECT_FLOAT_EQ(rect.x, 5.0f);
    EXPECT_FLOAT_EQ(rect.opacity, 1.0f);

    ObjectPatch wrongShape{};
    wrongShape.shape = CircleShape{};
    wrongShape.x = 99.0f;
    EXPECT_FALSE(applyPatch(rect, wrongShape));
    EXPECT_FLOAT_EQ(rect.x, 5.0f);

    ObjectPatch leafChildren{};
    leafChildren.children = std::vector<SceneObject>{makeRect("c", 0, 0, 1, 1)};
    EXPECT_FALSE(applyPatch(rect, leafChildren));
    EXPECT_TRUE(ObjectPatch{}.empty());
}

TEST(SceneObjectTest, ValidateDocumentFindsIssues) {
    SceneDocument doc{};
    doc.objects.push_back(makeRect("a", 0, 0, 10, 10));
    doc.objects.push_back(makeGroup("g", {makeRect("b", 0, 0, 5, 5)}));
    EXPECT_EQ(validateDocument(doc), ValidationIssue::None);

    doc.objects[1].children.push_back(makeRect("a", 0, 0, 1, 1));
    EXPECT_EQ(validateDocument(doc), ValidationIssue::DuplicateId);

    SceneDocument odd{};
    odd.objects.push_back(makeLine("l", 0, 0, {0, 0, 1}));
    EXPECT_EQ(validateDocument(odd), ValidationIssue::OddPointCount);

    SceneDocument negative{};
    negative.objects.push_back(makeRect("r", 0, 0, -1, 10));
    EXPECT_EQ(validateDocument(negative), ValidationIssue::NegativeSize);

    SceneDocument unnamed{};
    unnamed.objects.push_back(makeRect("", 0, 0, 1, 1));
    EXPECT_EQ(validateDocument(unnamed), ValidationIssue::EmptyId);

    SceneDocument leaf{};
    leaf.objects.push_back(makeRect("r", 0, 0, 1, 1));
    leaf.objects[0].children.push_back(makeRect("c", 0, 0, 1, 1));
    EXPECT_EQ(validateDocument(leaf), ValidationIssue::ChildrenOnLeaf);
}

TEST(SceneTreeTest, FindsNestedObjects) {
    std::vector<SceneObject> objects;
    objects.push_back(makeRect("a", 0, 0, 10, 10));
    objects.push_back(makeGroup("g", {makeRect("b", 0, 0, 5, 5), makeGroup("inner", {makeCircle("c", 1, 1, 1)})}));

    const SceneObject* c = findObject(objects, "c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->kind, ObjectKind::Circle);
    EXPECT_EQ(findObject(objects, "missing"), nullptr);
    EXPECT_TRUE(containsObject(objects, "inner"));

    ObjectPath path;
    ASSERT_TRUE(findObjectPath(objects, "c", path));
    EXPECT_EQ(path, (ObjectPath{1, 1, 0}));
    EXPECT_EQ(objectAtPath(objects, path)->id, "c");
    EXPECT_EQ(siblingsAtPath(objects, path), &objects[1].children[1].children);

    std::vector<std::string> ids;
    collectIds(objects, ids);
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "g", "b", "inner", "c"}));
}

TEST(SceneTreeTest, RefreshAncestorGroupsRecomputesSizes) {
    std::vector<SceneObject> objects;
    objects.push_back(makeGroup("outer", {makeGroup("inner", {makeRect("r", 0, 0, 10, 10)})}));

    ObjectPath path;
    ASSERT_TRUE(findObjectPath(objects, "r", path));
    std::get<RectShape>(objectAtPath(objects, path)->shape).width = 40.0f;
    path.pop_back();
    refreshAncestorGroups(objects, path);

    EXPECT_FLOAT_EQ(std::get<ContainerShape>(objects[0].children[0].shape).width, 40.0f);
    EXPECT_FLOAT_EQ(std::get<ContainerShape>(objects[0].shape).width, 40.0f);
}
