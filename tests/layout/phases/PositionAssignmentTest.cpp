#include <gtest/gtest.h>
#include "phases/PositionAssignment.h"

using namespace matchgraph;

// ============================================================================
// PositionAssignmentTest - 좌표 할당 및 충돌 회피 테스트
// ============================================================================

// --- Horizontal placement ---

TEST(PositionAssignmentTest, X_IsLinearInDegree) {
    LayeredPositionAssignment placer;
    SpacingOptions spacing;
    Layers layers = {{0.0, {"s"}}, {1.0, {"a"}}, {1.5, {"b"}}, {3.0, {"t"}}};

    PositionMap positions = placer.place(layers, spacing);

    EXPECT_DOUBLE_EQ(positions.at("s").x, 50.0);
    EXPECT_DOUBLE_EQ(positions.at("a").x, 270.0);
    EXPECT_DOUBLE_EQ(positions.at("b").x, 380.0);
    EXPECT_DOUBLE_EQ(positions.at("t").x, 710.0);
}

TEST(PositionAssignmentTest, BridgeLayer_SitsBetweenNeighbours) {
    LayeredPositionAssignment placer;
    Layers layers = {{1.0, {"a"}}, {1.5, {"b"}}, {2.0, {"c"}}};

    PositionMap positions = placer.place(layers, SpacingOptions{});

    EXPECT_LT(positions.at("a").x, positions.at("b").x);
    EXPECT_LT(positions.at("b").x, positions.at("c").x);
}

// --- Vertical placement ---

TEST(PositionAssignmentTest, SingleNodeLayer_CenteredOnMidline) {
    LayeredPositionAssignment placer;
    SpacingOptions spacing;
    spacing.canvasHeight = 800.0;

    PositionMap positions = placer.place({{2.0, {"only"}}}, spacing);

    EXPECT_DOUBLE_EQ(positions.at("only").y, 400.0);
}

TEST(PositionAssignmentTest, Layer_SymmetricAroundCenterInOrder) {
    LayeredPositionAssignment placer;

    PositionMap positions = placer.place({{1.0, {"c", "a", "b"}}}, SpacingOptions{});

    // verticalSpacing 50 is raised to the 60 minimum gap
    EXPECT_DOUBLE_EQ(positions.at("c").y, 240.0);
    EXPECT_DOUBLE_EQ(positions.at("a").y, 300.0);
    EXPECT_DOUBLE_EQ(positions.at("b").y, 360.0);
}

TEST(PositionAssignmentTest, EvenLayer_StraddlesCenter) {
    LayeredPositionAssignment placer;

    PositionMap positions = placer.place({{1.0, {"a", "b"}}}, SpacingOptions{});

    EXPECT_DOUBLE_EQ(positions.at("a").y, 270.0);
    EXPECT_DOUBLE_EQ(positions.at("b").y, 330.0);
}

TEST(PositionAssignmentTest, CrowdedLayer_GetsWiderSpacing) {
    SpacingOptions spacing;

    EXPECT_DOUBLE_EQ(LayeredPositionAssignment::layerSpacing(1, spacing), 60.0);
    EXPECT_DOUBLE_EQ(LayeredPositionAssignment::layerSpacing(4, spacing), 60.0);
    // 50 + (6 - 4) * 10
    EXPECT_DOUBLE_EQ(LayeredPositionAssignment::layerSpacing(6, spacing), 70.0);
    EXPECT_DOUBLE_EQ(LayeredPositionAssignment::layerSpacing(10, spacing), 110.0);
}

TEST(PositionAssignmentTest, CrowdedLayer_PositionsUseDensitySpacing) {
    LayeredPositionAssignment placer;

    PositionMap positions = placer.place({{1.0, {"a", "b", "c", "d", "e", "f"}}}, SpacingOptions{});

    EXPECT_DOUBLE_EQ(positions.at("a").y, 300.0 - 2.5 * 70.0);
    EXPECT_DOUBLE_EQ(positions.at("f").y, 300.0 + 2.5 * 70.0);
}

// --- Collision pass ---

TEST(PositionAssignmentTest, NearbyColumns_LowerNodePushedDown) {
    LayeredPositionAssignment placer;
    SpacingOptions spacing;
    spacing.horizontalSpacing = 50.0;   // columns inside the 80px window

    PositionMap positions = placer.place({{0.0, {"a"}}, {1.0, {"b"}}}, spacing);

    EXPECT_DOUBLE_EQ(positions.at("a").y, 300.0);
    EXPECT_DOUBLE_EQ(positions.at("b").y, 340.0);
}

TEST(PositionAssignmentTest, DistantColumns_AreNotAdjusted) {
    LayeredPositionAssignment placer;

    PositionMap positions = placer.place({{0.0, {"a"}}, {1.0, {"b"}}}, SpacingOptions{});

    EXPECT_DOUBLE_EQ(positions.at("a").y, 300.0);
    EXPECT_DOUBLE_EQ(positions.at("b").y, 300.0);
}

TEST(PositionAssignmentTest, ZeroPasses_SkipsCollisionHandling) {
    LayeredPositionAssignment placer;
    SpacingOptions spacing;
    spacing.horizontalSpacing = 50.0;
    spacing.collisionPasses = 0;

    PositionMap positions = placer.place({{0.0, {"a"}}, {1.0, {"b"}}}, spacing);

    EXPECT_DOUBLE_EQ(positions.at("b").y, 300.0);
}

TEST(PositionAssignmentTest, EmptyLayers_ProduceEmptyMap) {
    LayeredPositionAssignment placer;

    EXPECT_TRUE(placer.place({}, SpacingOptions{}).empty());
}

TEST(PositionAssignmentTest, NoTwoNodesShareAPosition) {
    LayeredPositionAssignment placer;
    Layers layers = {
        {0.0, {"s"}},
        {1.0, {"a", "b", "c", "d", "e", "f", "g"}},
        {1.5, {"h", "i"}},
        {2.0, {"j", "k", "l"}},
        {3.0, {"t"}}
    };

    PositionMap positions = placer.place(layers, SpacingOptions{});

    ASSERT_EQ(positions.size(), 14u);
    std::set<std::pair<double, double>> seen;
    for (const auto& [id, pos] : positions) {
        EXPECT_TRUE(seen.insert({pos.x, pos.y}).second) << id;
    }
}
