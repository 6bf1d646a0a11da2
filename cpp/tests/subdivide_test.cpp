#include "tests/procgeo_test_common.h"
#include "procgeo/path/path_modifiers.h"

using namespace procgeo_test;

TEST(SubdivideTest, OpenPathGetsMidpoints) {
    const PathData input = PathData::fromPoints({{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}}, false);
    const PathModificationResult r = subdividePath(input, SubdivideSettings{});
    ASSERT_EQ(r.pathData.points.size(), 5u);
    EXPECT_EQ(r.pathData.points[1], (Point2{5.0, 0.0}));
    EXPECT_EQ(r.pathData.points[3], (Point2{10.0, 5.0}));
    EXPECT_EQ(r.pathData.points.back(), (Point2{10.0, 10.0}));
    EXPECT_TRUE(r.boundsChanged);
    ASSERT_TRUE(r.newBounds.has_value());
    EXPECT_EQ(*r.newBounds, (Bounds{0.0, 0.0, 10.0, 10.0}));
}

TEST(SubdivideTest, ClosedPathSplitsWrapSegment) {
    const PathData input = PathData::fromPoints(unitSquare(10.0), true);
    const PathModificationResult r = subdividePath(input, SubdivideSettings{});
    ASSERT_EQ(r.pathData.points.size(), 8u);
    EXPECT_EQ(r.pathData.points[7], (Point2{0.0, 5.0}));
    EXPECT_TRUE(r.pathData.isClosed);
}

TEST(SubdivideTest, IterationsCompound) {
    SubdivideSettings s;
    s.iterations = 2;
    const PathData input = PathData::fromPoints({{0.0, 0.0}, {8.0, 0.0}}, false);
    const PathModificationResult r = subdividePath(input, s);
    ASSERT_EQ(r.pathData.points.size(), 5u);
    EXPECT_EQ(r.pathData.points[1], (Point2{2.0, 0.0}));
}

TEST(SubdivideTest, FactorBiasesInsertedPoint) {
    SubdivideSettings s;
    s.factor = 0.25;
    const PathData input = PathData::fromPoints({{0.0, 0.0}, {8.0, 0.0}}, false);
    const PathModificationResult r = subdividePath(input, s);
    ASSERT_EQ(r.pathData.points.size(), 3u);
    EXPECT_EQ(r.pathData.points[1], (Point2{2.0, 0.0}));
}

TEST(SubdivideTest, SmoothingRelaxesInteriorAndKeepsEndpoints) {
    SubdivideSettings s;
    s.smooth = true;
    const PathData input = PathData::fromPoints({{0.0, 0.0}, {10.0, 10.0}, {20.0, 0.0}}, false);
    const PathModificationResult r = subdividePath(input, s);
    ASSERT_EQ(r.pathData.points.size(), 5u);
    EXPECT_EQ(r.pathData.points.front(), (Point2{0.0, 0.0}));
    EXPECT_EQ(r.pathData.points.back(), (Point2{20.0, 0.0}));
    // Peak (10,10) between (5,5) and (15,5): (5 + 20 + 15)/4, (5 + 20 + 5)/4.
    expectPointNear(r.pathData.points[2], 10.0, 7.5);
}

TEST(SubdivideTest, BezierMidpointInterpolatesHandles) {
    BezierPoint a;
    a.x = 0.0;
    a.y = 0.0;
    a.cp2 = Point2{0.0, 4.0};
    BezierPoint b;
    b.x = 10.0;
    b.y = 0.0;
    b.cp1 = Point2{10.0, 4.0};
    const PathModificationResult r = subdividePath(PathData::fromBezier({a, b}, false), SubdivideSettings{});
    ASSERT_EQ(r.pathData.bezier.size(), 3u);
    const BezierPoint& mid = r.pathData.bezier[1];
    EXPECT_EQ(mid.x, 5.0);
    ASSERT_TRUE(mid.cp1.has_value());
    EXPECT_EQ(*mid.cp1, (Point2{5.0, 4.0}));
}

TEST(SubdivideTest, InvalidFactorReturnsInputUnchanged) {
    SubdivideSettings s;
    s.factor = 1.0;
    EXPECT_EQ(validateSettings(s), ValidationStatus::InvalidFactor);
    const PathData input = PathData::fromPoints({{0.0, 0.0}, {8.0, 0.0}}, false);
    const PathModificationResult r = subdividePath(input, s);
    EXPECT_FALSE(r.boundsChanged);
    EXPECT_EQ(r.pathData.points, input.points);
}

TEST(SubdivideTest, SvgPassesThrough) {
    const PathData input = PathData::fromSvg("M0 0 L1 1", false);
    const PathModificationResult r = subdividePath(input, SubdivideSettings{});
    EXPECT_FALSE(r.boundsChanged);
    EXPECT_EQ(r.pathData.svg, input.svg);
}

TEST(SubdivideTest, SinglePointIsLeftAlone) {
    const PathData input = PathData::fromPoints({{1.0, 1.0}}, false);
    const PathModificationResult r = subdividePath(input, SubdivideSettings{});
    EXPECT_FALSE(r.boundsChanged);
    EXPECT_EQ(r.pathData.points.size(), 1u);
}
