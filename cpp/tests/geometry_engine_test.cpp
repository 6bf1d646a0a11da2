#include "tests/procgeo_test_common.h"
#include "procgeo/boolean/geometry_engine.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

using namespace procgeo_test;

namespace {

// Records every primitive call. Union concatenates, everything else keeps `a`.
class RecordingClipper : public PolygonClipper {
public:
    struct Call {
        std::string op;
        MultiPolygon a;
        MultiPolygon b;
    };

    MultiPolygon unite(const MultiPolygon& a, const MultiPolygon& b) override {
        record("union", a, b);
        MultiPolygon out = a;
        out.insert(out.end(), b.begin(), b.end());
        return out;
    }
    MultiPolygon subtract(const MultiPolygon& a, const MultiPolygon& b) override {
        record("subtract", a, b);
        return a;
    }
    MultiPolygon intersect(const MultiPolygon& a, const MultiPolygon& b) override {
        record("intersect", a, b);
        return a;
    }
    MultiPolygon exclude(const MultiPolygon& a, const MultiPolygon& b) override {
        record("exclude", a, b);
        return a;
    }

    std::vector<Call> calls;

private:
    void record(const char* op, const MultiPolygon& a, const MultiPolygon& b) {
        calls.push_back(Call{op, a, b});
    }
};

class FixedBoundsOracle : public BoundsOracle {
public:
    std::optional<Bounds> getVisualBounds(const std::string& shapeId) const override {
        auto it = bounds.find(shapeId);
        if (it == bounds.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, Bounds> bounds;
};

class GeometryEngineTest : public ::testing::Test {
protected:
    RecordingClipper clipper;
    GeometryEngine engine{clipper};

    Ring ringOf(const Shape& shape) {
        const MultiPolygon mp = engine.shapeToPolygon(shape);
        EXPECT_EQ(mp.size(), 1u);
        EXPECT_EQ(mp[0].size(), 1u);
        return mp[0][0];
    }
};

MultiPolygon boxPolygon(double x, double y, double w, double h) {
    Ring ring{{x, y}, {x + w, y}, {x + w, y + h}, {x, y + h}, {x, y}};
    return MultiPolygon{Polygon{ring}};
}

} // namespace

// ============================================================================
// shapeToPolygon
// ============================================================================

TEST_F(GeometryEngineTest, RectangleRing) {
    const Ring ring = ringOf(makeRect("r", 10.0, 20.0, 30.0, 40.0));
    ASSERT_EQ(ring.size(), 5u);
    expectPointNear(ring[0], 10.0, 20.0);
    expectPointNear(ring[2], 40.0, 60.0);
    EXPECT_EQ(ring.front(), ring.back());
}

TEST_F(GeometryEngineTest, TriangleApexOnTop) {
    const Ring ring = ringOf(makeShape("t", ShapeType::Triangle, 0.0, 0.0, 10.0, 20.0));
    ASSERT_EQ(ring.size(), 4u);
    expectPointNear(ring[0], 5.0, 0.0);
    expectPointNear(ring[1], 10.0, 20.0);
    expectPointNear(ring[2], 0.0, 20.0);
}

TEST_F(GeometryEngineTest, EllipseSampling) {
    const Ring ring = ringOf(makeShape("e", ShapeType::Ellipse, 0.0, 0.0, 20.0, 10.0));
    ASSERT_EQ(ring.size(), 33u);
    expectPointNear(ring[0], 20.0, 5.0);
    expectPointNear(ring[8], 10.0, 10.0);
    EXPECT_EQ(ring.front(), ring.back());
}

TEST_F(GeometryEngineTest, CircleIsCenteredOnPositionAndIgnoresRotation) {
    Shape c = makeShape("c", ShapeType::Circle, 10.0, 20.0, 0.0, 0.0);
    c.props.w.reset();
    c.props.h.reset();
    c.props.radius = 5.0;
    c.rotation = 1.0;
    const Ring ring = ringOf(c);
    ASSERT_EQ(ring.size(), 33u);
    expectPointNear(ring[0], 15.0, 20.0);
    expectPointNear(ring[16], 5.0, 20.0);
}

TEST_F(GeometryEngineTest, RegularPolygonStartsAtTop) {
    Shape p = makeShape("p", ShapeType::Polygon, 0.0, 0.0, 10.0, 10.0);
    p.props.sides = 4;
    const Ring ring = ringOf(p);
    ASSERT_EQ(ring.size(), 5u);
    expectPointNear(ring[0], 5.0, 0.0);
    expectPointNear(ring[1], 10.0, 5.0);
}

TEST_F(GeometryEngineTest, PolygonPointsAreTranslated) {
    Shape p = makeShape("p", ShapeType::Polygon, 100.0, 50.0, 10.0, 10.0);
    p.props.points = std::vector<Point2>{{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}};
    const Ring ring = ringOf(p);
    ASSERT_EQ(ring.size(), 4u);
    expectPointNear(ring[1], 110.0, 50.0);
    EXPECT_EQ(ring.front(), ring.back());
}

TEST_F(GeometryEngineTest, BezierUsesAnchorsOnly) {
    Shape b = makeShape("b", ShapeType::Bezier, 1.0, 1.0, 10.0, 10.0);
    BezierPoint a0;
    BezierPoint a1;
    a1.x = 10.0;
    a1.cp1 = Point2{5.0, -20.0};
    BezierPoint a2;
    a2.y = 10.0;
    b.props.bezierPoints = std::vector<BezierPoint>{a0, a1, a2};
    const Ring ring = ringOf(b);
    ASSERT_EQ(ring.size(), 4u);
    expectPointNear(ring[1], 11.0, 1.0);
}

TEST_F(GeometryEngineTest, FallsBackToBoundingBox) {
    const Ring text = ringOf(makeShape("t", ShapeType::Text, 2.0, 3.0, 8.0, 4.0));
    ASSERT_EQ(text.size(), 5u);
    expectPointNear(text[2], 10.0, 7.0);

    Shape line = makeShape("l", ShapeType::Line, 0.0, 0.0, 10.0, 1.0);
    line.props.points = std::vector<Point2>{{0.0, 0.0}, {10.0, 0.0}};
    EXPECT_EQ(ringOf(line).size(), 5u);
}

TEST_F(GeometryEngineTest, RotatesAboutCenter) {
    Shape r = makeRect("r", 0.0, 0.0, 10.0, 10.0);
    r.rotation = kHalfPi;
    const Ring ring = ringOf(r);
    expectPointNear(ring[0], 10.0, 0.0);
    expectPointNear(ring[1], 10.0, 10.0);
}

TEST_F(GeometryEngineTest, OutlinesAreMemoized) {
    Shape r = makeRect("r", 0.0, 0.0, 10.0, 10.0);
    engine.shapeToPolygon(r);
    engine.shapeToPolygon(r);
    EXPECT_EQ(engine.cache().size(), 1u);

    r.x = 5.0;
    const Ring moved = ringOf(r);
    EXPECT_EQ(engine.cache().size(), 2u);
    expectPointNear(moved[0], 5.0, 0.0);

    engine.cache().clear();
    EXPECT_EQ(engine.cache().size(), 0u);
}

TEST_F(GeometryEngineTest, CacheKeySeesGeometry) {
    Shape a = makeRect("r", 0.0, 0.0, 10.0, 10.0);
    Shape b = a;
    EXPECT_EQ(polygonCacheKey(a), polygonCacheKey(b));
    b.props.w = 11.0;
    EXPECT_NE(polygonCacheKey(a), polygonCacheKey(b));
    b = a;
    b.props.style.color = "#ff0000";
    EXPECT_EQ(polygonCacheKey(a), polygonCacheKey(b));
}

TEST_F(GeometryEngineTest, BoundedCacheFromOptions) {
    GeometryEngineOptions options;
    options.cacheCapacity = 2;
    GeometryEngine bounded(clipper, options);
    for (int i = 0; i < 5; ++i) {
        bounded.shapeToPolygon(makeRect("r" + std::to_string(i), 0.0, 0.0, 1.0, 1.0));
    }
    EXPECT_EQ(bounded.cache().size(), 2u);
}

// ============================================================================
// performBooleanOperation
// ============================================================================

TEST_F(GeometryEngineTest, FoldsLeftInInputOrder) {
    const std::vector<Shape> shapes{
        makeRect("a", 0.0, 0.0, 10.0, 10.0),
        makeRect("b", 20.0, 0.0, 10.0, 10.0),
        makeRect("c", 40.0, 0.0, 10.0, 10.0),
    };
    const MultiPolygon out = engine.performBooleanOperation(shapes, BooleanOp::Subtract);
    ASSERT_EQ(clipper.calls.size(), 2u);
    EXPECT_EQ(clipper.calls[0].op, "subtract");
    expectPointNear(clipper.calls[0].a[0][0][0], 0.0, 0.0);
    expectPointNear(clipper.calls[0].b[0][0][0], 20.0, 0.0);
    expectPointNear(clipper.calls[1].b[0][0][0], 40.0, 0.0);
    expectPointNear(out[0][0][0], 0.0, 0.0);
}

TEST_F(GeometryEngineTest, UnionAccumulates) {
    const std::vector<Shape> shapes{
        makeRect("a", 0.0, 0.0, 10.0, 10.0),
        makeRect("b", 20.0, 0.0, 10.0, 10.0),
        makeRect("c", 40.0, 0.0, 10.0, 10.0),
    };
    const MultiPolygon out = engine.performBooleanOperation(shapes, BooleanOp::Union);
    EXPECT_EQ(out.size(), 3u);
    EXPECT_EQ(clipper.calls[1].a.size(), 2u);
}

TEST_F(GeometryEngineTest, DegenerateOperandCounts) {
    EXPECT_TRUE(engine.performBooleanOperation({}, BooleanOp::Union).empty());
    const MultiPolygon single = engine.performBooleanOperation({makeRect("a", 1.0, 2.0, 3.0, 4.0)}, BooleanOp::Intersect);
    EXPECT_TRUE(clipper.calls.empty());
    ASSERT_EQ(single.size(), 1u);
    expectPointNear(single[0][0][0], 1.0, 2.0);
}

// ============================================================================
// Style and outline
// ============================================================================

TEST_F(GeometryEngineTest, StyleSourceByOperation) {
    Shape small = makeRect("small", 0.0, 0.0, 5.0, 5.0);
    Shape big = makeRect("big", 0.0, 0.0, 15.0, 15.0);
    Shape circle = makeShape("circle", ShapeType::Circle, 0.0, 0.0, 0.0, 0.0);
    circle.props.radius = 10.0;
    const std::vector<Shape> shapes{small, big, circle};

    EXPECT_EQ(engine.selectStyleSourceShape(shapes, BooleanOp::Union)->id, "circle");
    EXPECT_EQ(engine.selectStyleSourceShape(shapes, BooleanOp::Exclude)->id, "circle");
    EXPECT_EQ(engine.selectStyleSourceShape(shapes, BooleanOp::Subtract)->id, "small");
    EXPECT_EQ(engine.selectStyleSourceShape(shapes, BooleanOp::Intersect)->id, "small");
    EXPECT_EQ(engine.selectStyleSourceShape({}, BooleanOp::Union), nullptr);
}

TEST_F(GeometryEngineTest, StyleSourceTieKeepsFirst) {
    const std::vector<Shape> shapes{makeRect("a", 0.0, 0.0, 10.0, 10.0), makeRect("b", 5.0, 5.0, 10.0, 10.0)};
    EXPECT_EQ(engine.selectStyleSourceShape(shapes, BooleanOp::Union)->id, "a");
}

TEST_F(GeometryEngineTest, OutlineKeepsGeometricPositionWithoutHints) {
    const Shape original = makeRect("r", 0.0, 0.0, 10.0, 10.0);
    const Shape out = engine.polygonToOutlineShape(boxPolygon(3.0, 4.0, 20.0, 10.0), original);
    EXPECT_EQ(out.id, "r");
    EXPECT_EQ(out.type, ShapeType::Bezier);
    EXPECT_NEAR(out.x, 3.0, kEps);
    EXPECT_NEAR(out.y, 4.0, kEps);
    EXPECT_DOUBLE_EQ(out.rotation, 0.0);
    EXPECT_DOUBLE_EQ(*out.props.w, 20.0);
    EXPECT_DOUBLE_EQ(*out.props.h, 10.0);
    ASSERT_EQ(out.props.bezierPoints->size(), 4u);
    EXPECT_DOUBLE_EQ((*out.props.bezierPoints)[2].x, 20.0);
    EXPECT_FALSE((*out.props.bezierPoints)[2].cp1.has_value());
    EXPECT_TRUE(*out.props.closed);
}

TEST_F(GeometryEngineTest, OutlineUsesPositionContext) {
    const PositionContext ctx{Point2{100.0, 100.0}};
    const Shape out = engine.polygonToOutlineShape(boxPolygon(0.0, 0.0, 20.0, 10.0), makeRect("r", 0, 0, 1, 1), &ctx);
    EXPECT_DOUBLE_EQ(out.x, 90.0);
    EXPECT_DOUBLE_EQ(out.y, 95.0);
}

TEST_F(GeometryEngineTest, OutlineAppliesVisualBoundsOffset) {
    FixedBoundsOracle oracle;
    oracle.bounds["r"] = Bounds{12.0, 8.0, 10.0, 10.0};
    engine.setBoundsOracle(&oracle);
    const Shape original = makeRect("r", 10.0, 10.0, 10.0, 10.0);
    const Shape out = engine.polygonToOutlineShape(boxPolygon(0.0, 0.0, 5.0, 5.0), original);
    EXPECT_DOUBLE_EQ(out.x, 2.0);
    EXPECT_DOUBLE_EQ(out.y, -2.0);

    // Unknown to the oracle: no offset.
    const Shape other = engine.polygonToOutlineShape(boxPolygon(0.0, 0.0, 5.0, 5.0), makeRect("q", 10, 10, 10, 10));
    EXPECT_DOUBLE_EQ(other.x, 0.0);
    EXPECT_DOUBLE_EQ(other.y, 0.0);
}

TEST_F(GeometryEngineTest, OutlineStyle) {
    const Shape original = makeRect("r", 0.0, 0.0, 10.0, 10.0);
    const Shape plain = engine.polygonToOutlineShape(boxPolygon(0, 0, 5, 5), original);
    EXPECT_EQ(*plain.props.style.color, kDefaultOutlineColor);
    EXPECT_EQ(*plain.props.style.fillColor, kDefaultOutlineColor);
    EXPECT_DOUBLE_EQ(*plain.props.style.strokeWidth, kDefaultOutlineStrokeWidth);
    EXPECT_TRUE(*plain.props.style.fill);
    EXPECT_FALSE(plain.props.style.dash.has_value());

    Shape styled = makeRect("s", 0.0, 0.0, 1.0, 1.0);
    styled.props.style.color = "#ff0000";
    styled.props.style.strokeWidth = 3.0;
    styled.props.style.dash = "4 2";
    const Shape out = engine.polygonToOutlineShape(boxPolygon(0, 0, 5, 5), original, nullptr, &styled);
    EXPECT_EQ(out.id, "r");
    EXPECT_EQ(*out.props.style.color, "#ff0000");
    EXPECT_EQ(*out.props.style.fillColor, "#ff0000");
    EXPECT_TRUE(*out.props.style.fill);
    EXPECT_DOUBLE_EQ(*out.props.style.strokeWidth, 3.0);
    EXPECT_EQ(*out.props.style.dash, "4 2");
}

TEST_F(GeometryEngineTest, OutlineKeepsSeparateFillStyle) {
    Shape styled = makeRect("s", 0.0, 0.0, 1.0, 1.0);
    styled.props.style.color = "#ff0000";
    styled.props.style.fillColor = "#00ff00";
    styled.props.style.fill = false;
    const Shape out = engine.polygonToOutlineShape(
        boxPolygon(0, 0, 5, 5), makeRect("r", 0.0, 0.0, 10.0, 10.0), nullptr, &styled);
    EXPECT_EQ(*out.props.style.color, "#ff0000");
    EXPECT_EQ(*out.props.style.fillColor, "#00ff00");
    EXPECT_FALSE(*out.props.style.fill);

    // Without a style source the original's style is used.
    Shape original = makeRect("r", 0.0, 0.0, 10.0, 10.0);
    original.props.style.fillColor = "#0000ff";
    original.props.style.fill = false;
    const Shape own = engine.polygonToOutlineShape(boxPolygon(0, 0, 5, 5), original);
    EXPECT_EQ(*own.props.style.color, kDefaultOutlineColor);
    EXPECT_EQ(*own.props.style.fillColor, "#0000ff");
    EXPECT_FALSE(*own.props.style.fill);
}

TEST_F(GeometryEngineTest, DegenerateOutlineKeepsOriginal) {
    Shape original = makeShape("tri", ShapeType::Triangle, 1.0, 2.0, 3.0, 4.0);
    const Shape fromEmpty = engine.polygonToOutlineShape(MultiPolygon{}, original);
    EXPECT_EQ(fromEmpty.type, ShapeType::Triangle);
    EXPECT_DOUBLE_EQ(fromEmpty.x, 1.0);

    const MultiPolygon sliver{Polygon{Ring{{0.0, 0.0}, {1.0, 1.0}, {0.0, 0.0}}}};
    EXPECT_EQ(engine.polygonToOutlineShape(sliver, original).type, ShapeType::Triangle);
}

TEST_F(GeometryEngineTest, OutlineDropsHolesAndExtraPolygons) {
    MultiPolygon mp = boxPolygon(0.0, 0.0, 10.0, 10.0);
    mp[0].push_back(Ring{{2.0, 2.0}, {4.0, 2.0}, {4.0, 4.0}, {2.0, 2.0}});
    const MultiPolygon second = boxPolygon(50.0, 50.0, 10.0, 10.0);
    mp.push_back(second[0]);
    const Shape out = engine.polygonToOutlineShape(mp, makeRect("r", 0, 0, 10, 10));
    EXPECT_EQ(out.props.bezierPoints->size(), 4u);
    EXPECT_DOUBLE_EQ(*out.props.w, 10.0);
}

// ============================================================================
// Free helpers
// ============================================================================

TEST(GeometryHelpersTest, SharedStyleKeepsAgreedFields) {
    Shape a = makeRect("a", 0, 0, 1, 1);
    a.props.style.color = "#112233";
    a.props.style.strokeWidth = 1.0;
    a.props.style.fill = true;
    Shape b = a;
    b.props.style.strokeWidth = 2.0;
    b.props.style.fill.reset();

    const ShapeStyle shared = computeSharedStyle({a, b});
    EXPECT_EQ(*shared.color, "#112233");
    EXPECT_FALSE(shared.strokeWidth.has_value());
    EXPECT_FALSE(shared.fill.has_value());
    EXPECT_EQ(computeSharedStyle({}), ShapeStyle{});
}

TEST(GeometryHelpersTest, ApproximateArea) {
    EXPECT_DOUBLE_EQ(approximateArea(makeRect("r", 0, 0, 4, 5)), 20.0);
    Shape c = makeShape("c", ShapeType::Circle, 0, 0, 0, 0);
    c.props.radius = 2.0;
    EXPECT_DOUBLE_EQ(approximateArea(c), kPi * 4.0);
}

TEST(GeometryHelpersTest, CollectiveBoundsCoversScaledFootprints) {
    ShapeState state = singleInstance(makeRect("a", 0.0, 0.0, 10.0, 10.0));
    state.instances[0].transform.scaleX = 2.0;
    state.instances[0].transform.scaleY = 2.0;
    state.instances.push_back(singleInstance(makeRect("b", 50.0, -5.0, 10.0, 10.0)).instances[0]);

    const Bounds b = collectiveBounds(state);
    EXPECT_DOUBLE_EQ(b.x, 0.0);
    EXPECT_DOUBLE_EQ(b.y, -5.0);
    EXPECT_DOUBLE_EQ(b.w, 60.0);
    EXPECT_DOUBLE_EQ(b.h, 25.0);
    EXPECT_EQ(collectiveBounds(ShapeState{}), Bounds{});
}
