#include <gtest/gtest.h>

#include "canvas/scene/scene_object.h"
#include "canvas/scene/shape_factory.h"

#include <cmath>

using namespace canvas;

TEST(ShapeFactoryTest, ParsesPaletteKeys) {
    ObjectKind kind = ObjectKind::Text;
    EXPECT_TRUE(parseShapeKey("rectangle", kind));
    EXPECT_EQ(kind, ObjectKind::Rect);
    EXPECT_TRUE(parseShapeKey("star", kind));
    EXPECT_EQ(kind, ObjectKind::Star);
    EXPECT_TRUE(parseShapeKey("diamond", kind));
    EXPECT_EQ(kind, ObjectKind::Diamond);

    kind = ObjectKind::Circle;
    EXPECT_FALSE(parseShapeKey("hexagon", kind));
    EXPECT_FALSE(parseShapeKey("", kind));
    EXPECT_EQ(kind, ObjectKind::Circle);
}

TEST(ShapeFactoryTest, RectDefaults) {
    const auto rect = createShape(ObjectKind::Rect, "r1");
    ASSERT_TRUE(rect.has_value());
    EXPECT_EQ(rect->id, "r1");
    EXPECT_FLOAT_EQ(rect->x, kDefaultShapeX);
    EXPECT_FLOAT_EQ(rect->y, kDefaultShapeY);
    const auto& shape = std::get<RectShape>(rect->shape);
    EXPECT_FLOAT_EQ(shape.width, 200.0f);
    EXPECT_FLOAT_EQ(shape.height, 150.0f);
    EXPECT_EQ(shape.fill, kDefaultShapeFill);
    EXPECT_EQ(shape.stroke, kDefaultShapeStroke);
    EXPECT_EQ(validateObject(*rect), ValidationIssue::None);
}

TEST(ShapeFactoryTest, LineIsOpenAndRound) {
    const auto line = createShape(ObjectKind::Line, "l1", 10.0f, 20.0f);
    ASSERT_TRUE(line.has_value());
    const auto& path = std::get<PathShape>(line->shape);
    EXPECT_FALSE(path.closed);
    EXPECT_EQ(path.points.size(), 4u);
    EXPECT_EQ(path.lineCap, "round");
    EXPECT_EQ(path.lineJoin, "round");
    EXPECT_EQ(path.stroke, "#000000");
}

TEST(ShapeFactoryTest, PolygonsAreClosedWithEvenPoints) {
    for (const ObjectKind kind : {ObjectKind::Triangle, ObjectKind::Star, ObjectKind::Diamond}) {
        const auto shape = createShape(kind, "p");
        ASSERT_TRUE(shape.has_value()) << objectKindName(kind);
        const auto& path = std::get<PathShape>(shape->shape);
        EXPECT_TRUE(path.closed) << objectKindName(kind);
        EXPECT_EQ(path.points.size() % 2, 0u) << objectKindName(kind);
        EXPECT_EQ(validateObject(*shape), ValidationIssue::None) << objectKindName(kind);
    }
}

TEST(ShapeFactoryTest, StarPointsAlternateRadius) {
    const std::vector<float> points = starPoints(50.0f, 5);
    ASSERT_EQ(points.size(), 5u * 4u + 2u);

    // First vertex is the top tip, repeated at the end.
    EXPECT_NEAR(points[0], 50.0f, 1e-4f);
    EXPECT_NEAR(points[1], 0.0f, 1e-4f);
    EXPECT_FLOAT_EQ(points[points.size() - 2], points[0]);
    EXPECT_FLOAT_EQ(points[points.size() - 1], points[1]);

    for (std::size_t i = 0; i + 1 < points.size() - 2; i += 2) {
        const float dx = points[i] - 50.0f;
        const float dy = points[i + 1] - 50.0f;
        const float expected = ((i / 2) % 2 == 0) ? 50.0f : 20.0f;
        EXPECT_NEAR(std::sqrt(dx * dx + dy * dy), expected, 1e-3f);
    }
}

TEST(ShapeFactoryTest, NonPaletteKindsAreRejected) {
    EXPECT_FALSE(createShape(ObjectKind::Text, "t").has_value());
    EXPECT_FALSE(createShape(ObjectKind::Group, "g").has_value());
    EXPECT_FALSE(createShape(ObjectKind::Image, "i").has_value());
}

TEST(ShapeFactoryTest, TextImageAndFrameDefaults) {
    const SceneObject text = createText("t", "Hello", 5.0f, 6.0f, 0.0f);
    const auto& t = std::get<TextShape>(text.shape);
    EXPECT_FLOAT_EQ(t.fontSize, kDefaultTextFontSize);
    EXPECT_EQ(t.fontFamily, "Arial");
    ASSERT_TRUE(t.width.has_value());
    EXPECT_FLOAT_EQ(*t.width, kDefaultTextWidth);

    const SceneObject image = createImage("i", "art.png", 0.0f, 0.0f, 300.0f, 200.0f);
    EXPECT_EQ(image.kind, ObjectKind::Image);
    EXPECT_FLOAT_EQ(*objectWidth(image), 300.0f);

    const SceneObject frame = createFrame("f", 0.0f, 0.0f, 400.0f, 300.0f, "Drop artwork");
    const auto& box = std::get<ContainerShape>(frame.shape);
    EXPECT_TRUE(box.dashEnabled);
    EXPECT_EQ(box.stroke, kDefaultFrameStroke);
    EXPECT_EQ(box.placeholder, "Drop artwork");
    EXPECT_TRUE(frame.children.empty());
}
