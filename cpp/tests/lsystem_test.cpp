#include "tests/procgeo_test_common.h"
#include "procgeo/array/array_processors.h"

using namespace procgeo_test;

namespace {

LSystemSettings lsystem(std::uint32_t iterations) {
    LSystemSettings s;
    s.iterations = iterations;
    return s;
}

ShapeState seedling() {
    return singleInstance(makeRect("r", 0.0, 0.0, 20.0, 20.0));
}

} // namespace

TEST(LSystemTest, ZeroIterationsKeepsOnlySources) {
    const ShapeState out = applyLSystem(seedling(), lsystem(0));
    ASSERT_EQ(out.instances.size(), 1u);
}

TEST(LSystemTest, FirstStepGrowsUpward) {
    const ShapeState input = seedling();
    const ShapeState out = applyLSystem(input, lsystem(1));
    ASSERT_EQ(out.instances.size(), 2u);
    expectTransformEq(out.instances[0].transform, input.instances[0].transform);
    const ShapeInstance& trunk = out.instances[1];
    expectPointNear(instanceVisualCenter(trunk), 10.0, -10.0);
    EXPECT_NEAR(trunk.transform.rotation, 0.0, kEps);
    EXPECT_TRUE(trunk.metadata.lsystem);
    EXPECT_EQ(*trunk.metadata.lsystemDepth, 1u);
    expectIndicesContiguous(out);
}

TEST(LSystemTest, BinaryBranchingDoublesPerLevel) {
    for (std::uint32_t n = 1; n <= 5; ++n) {
        const ShapeState out = applyLSystem(seedling(), lsystem(n));
        EXPECT_EQ(out.instances.size(), (1u << n)) << "iterations " << n;
    }
}

TEST(LSystemTest, ExplicitBranchListAndLengthDecay) {
    LSystemSettings s = lsystem(3);
    s.branches = {0.0};
    const ShapeState out = applyLSystem(seedling(), s);
    ASSERT_EQ(out.instances.size(), 4u);
    expectPointNear(instanceVisualCenter(out.instances[1]), 10.0, -10.0);
    expectPointNear(instanceVisualCenter(out.instances[2]), 10.0, -25.0);
    expectPointNear(instanceVisualCenter(out.instances[3]), 10.0, -36.25);
}

TEST(LSystemTest, ScaleShrinksPerLevel) {
    LSystemSettings s = lsystem(3);
    s.branches = {0.0};
    s.scalePerIteration = 0.5;
    const ShapeState out = applyLSystem(seedling(), s);
    EXPECT_DOUBLE_EQ(out.instances[1].transform.scaleX, 1.0);
    EXPECT_DOUBLE_EQ(out.instances[2].transform.scaleX, 0.5);
    EXPECT_DOUBLE_EQ(out.instances[3].transform.scaleY, 0.25);
}

TEST(LSystemTest, ZeroProbabilityStopsAfterTrunk) {
    LSystemSettings s = lsystem(4);
    s.branchProbability = 0.0;
    EXPECT_EQ(applyLSystem(seedling(), s).instances.size(), 2u);
}

TEST(LSystemTest, SameSeedSameTree) {
    LSystemSettings s = lsystem(6);
    s.branchProbability = 0.6;
    s.angleJitter = 12.0;
    s.seed = 1234;
    const ShapeState a = applyLSystem(seedling(), s);
    const ShapeState b = applyLSystem(seedling(), s);
    ASSERT_EQ(a.instances.size(), b.instances.size());
    for (std::size_t i = 0; i < a.instances.size(); ++i) {
        expectTransformEq(a.instances[i].transform, b.instances[i].transform);
    }
}

TEST(LSystemTest, SeedDrivesJitter) {
    LSystemSettings s = lsystem(3);
    s.angleJitter = 20.0;
    s.seed = 1;
    const ShapeState a = applyLSystem(seedling(), s);
    s.seed = 2;
    const ShapeState b = applyLSystem(seedling(), s);
    ASSERT_EQ(a.instances.size(), b.instances.size());
    // The trunk is not jittered; the first branch is.
    expectTransformEq(a.instances[1].transform, b.instances[1].transform);
    EXPECT_NE(a.instances[2].transform.rotation, b.instances[2].transform.rotation);
}

TEST(LSystemTest, SourcesAreRetainedAheadOfChildren) {
    ShapeState input = seedling();
    input.instances.push_back(singleInstance(makeRect("s", 100.0, 0.0, 20.0, 20.0)).instances[0]);
    reindex(input);
    const ShapeState out = applyLSystem(input, lsystem(2));
    ASSERT_EQ(out.instances.size(), 2u + 2u * 3u);
    EXPECT_EQ(out.instances[1].shape.id, "s");
    EXPECT_FALSE(out.instances[1].metadata.lsystem);
    EXPECT_EQ(*out.instances[5].metadata.sourceInstance, 1u);
}

TEST(LSystemTest, RejectsTooManyIterations) {
    const LSystemSettings s = lsystem(9);
    EXPECT_EQ(validateSettings(s), ValidationStatus::InvalidIterations);
    EXPECT_EQ(applyLSystem(seedling(), s).instances.size(), 1u);
    LSystemSettings p = lsystem(2);
    p.branchProbability = 1.5;
    EXPECT_EQ(validateSettings(p), ValidationStatus::InvalidProbability);
}

TEST(LSystemTest, RejectsExplosiveBranching) {
    LSystemSettings wide = lsystem(8);
    wide.branches.assign(40, 10.0);
    EXPECT_EQ(validateSettings(wide), ValidationStatus::InvalidCount);
    EXPECT_GT(lsystemCloneBound(wide), kMaxLSystemClones);
    EXPECT_EQ(applyLSystem(seedling(), wide).instances.size(), 1u);

    // Binary trees at full depth stay well inside the budget.
    EXPECT_EQ(lsystemCloneBound(lsystem(8)), 255u);
    EXPECT_EQ(validateSettings(lsystem(8)), ValidationStatus::Ok);

    LSystemSettings ternary = lsystem(8);
    ternary.branches = {-30.0, 0.0, 30.0};
    EXPECT_EQ(lsystemCloneBound(ternary), 3280u);
    EXPECT_EQ(validateSettings(ternary), ValidationStatus::Ok);

    LSystemSettings quad = lsystem(8);
    quad.branches = {-45.0, -15.0, 15.0, 45.0};
    EXPECT_EQ(validateSettings(quad), ValidationStatus::InvalidCount);
}

TEST(LSystemTest, ClonesCarryEmissionOrder) {
    const ShapeState out = applyLSystem(seedling(), lsystem(3));
    ASSERT_EQ(out.instances.size(), 8u);
    EXPECT_FALSE(out.instances[0].metadata.arrayIndex.has_value());
    for (std::size_t i = 1; i < out.instances.size(); ++i) {
        ASSERT_TRUE(out.instances[i].metadata.arrayIndex.has_value());
        EXPECT_EQ(*out.instances[i].metadata.arrayIndex, static_cast<std::uint32_t>(i));
        EXPECT_FALSE(out.instances[i].metadata.isFirstClone);
    }
}
