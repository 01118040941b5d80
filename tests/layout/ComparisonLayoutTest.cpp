#include <gtest/gtest.h>
#include "layout/ComparisonFixtures.h"
#include "matchgraph/layout/api/IPositionAssignment.h"

#include <algorithm>

using namespace matchgraph;
using namespace matchgraph::test;

// ============================================================================
// ComparisonLayoutTest - 비교 레이아웃 파이프라인 통합 테스트
// ============================================================================

namespace {

class CountingObserver : public ILayoutObserver {
public:
    int rejected = 0;
    int subgraphs = 0;
    int bridges = 0;
    int layered = 0;
    int positioned = 0;
    int completed = 0;
    std::string lastReason;

    void onRequestRejected(const LayoutRequest&, const std::string& reason) override {
        ++rejected;
        lastReason = reason;
    }
    void onSubgraphBuilt(const Subgraph&) override { ++subgraphs; }
    void onBridgeDetected(const NodeId&, int, int) override { ++bridges; }
    void onLayersAssigned(const LayerAssignmentResult&) override { ++layered; }
    void onPositionsAssigned(const PositionMap&) override { ++positioned; }
    void onLayoutComplete(const LayoutResult&) override { ++completed; }
};

LayoutRequest request(const NodeId& source, const NodeId& destination, int maxDegree) {
    LayoutRequest r;
    r.source = source;
    r.destination = destination;
    r.maxDegree = maxDegree;
    return r;
}

}  // namespace

// --- Scenarios ---

TEST(ComparisonLayoutTest, BridgeScenario_EndToEnd) {
    ComparisonLayout layout;

    LayoutResult result = layout.layout(bridgeGraph(), request("S", "T", 3));

    ASSERT_FALSE(result.isEmpty());
    EXPECT_DOUBLE_EQ(result.degreeOf("A"), 1.5);
    EXPECT_EQ(result.stats.bridgeCount, 1);
    EXPECT_EQ(result.stats.nodeCount, 5);
    EXPECT_EQ(result.stats.edgeCount, 6);
    EXPECT_EQ(result.stats.layerCount, 4);

    // A is drawn between the B/C column and T
    EXPECT_GT(result.positions.at("A").x, result.positions.at("B").x);
    EXPECT_LT(result.positions.at("A").x, result.positions.at("T").x);
}

TEST(ComparisonLayoutTest, BridgeScenario_Coordinates) {
    ComparisonLayout layout;

    LayoutResult result = layout.layout(bridgeGraph(), request("S", "T", 3));

    EXPECT_EQ(result.positionOf("S"), Point(50.0, 300.0));
    EXPECT_EQ(result.positionOf("B"), Point(270.0, 270.0));
    EXPECT_EQ(result.positionOf("C"), Point(270.0, 330.0));
    EXPECT_EQ(result.positionOf("A"), Point(380.0, 300.0));
    EXPECT_EQ(result.positionOf("T"), Point(710.0, 300.0));
}

TEST(ComparisonLayoutTest, ZeroDegree_WithoutDirectEdge_IsEmpty) {
    ComparisonLayout layout;

    LayoutResult result = layout.layout(bridgeGraph(), request("S", "T", 0));

    EXPECT_TRUE(result.isEmpty());
    EXPECT_TRUE(result.positions.empty());
    EXPECT_TRUE(result.layers.empty());
    EXPECT_EQ(result.request.source, "S");
}

TEST(ComparisonLayoutTest, ZeroDegree_DirectEdge_TwoNodesAtDegreeZero) {
    ContestGraph graph;
    graph.addNode("A", "Army");
    graph.addNode("B", "Navy");
    graph.addContest({"A", "B", 1.0});
    graph.addContest({"A", "C", 2.0});
    graph.addContest({"C", "B", 2.0});

    ComparisonLayout layout;
    LayoutResult result = layout.layout(graph, request("A", "B", 0));

    EXPECT_EQ(result.subgraph.nodes, (std::set<NodeId>{"A", "B"}));
    EXPECT_EQ(result.subgraph.edges, std::set<EdgeKeyString>{"A__B"});
    EXPECT_DOUBLE_EQ(result.degreeOf("A"), 0.0);
    EXPECT_DOUBLE_EQ(result.degreeOf("B"), 0.0);

    ASSERT_EQ(result.positions.size(), 2u);
    EXPECT_DOUBLE_EQ(result.positions.at("A").x, result.positions.at("B").x);
    EXPECT_NE(result.positions.at("A").y, result.positions.at("B").y);
}

TEST(ComparisonLayoutTest, UnderscoreIds_DirectContestIsLaidOut) {
    ContestGraph graph;
    graph.addNode("a_", "Alpha");
    graph.addNode("b", "Beta");
    graph.addContest({"a_", "b", 1.0});

    ComparisonLayout layout;
    LayoutResult result = layout.layout(graph, request("a_", "b", 1));

    ASSERT_FALSE(result.isEmpty());
    EXPECT_EQ(result.subgraph.nodes, (std::set<NodeId>{"a_", "b"}));
    EXPECT_EQ(result.subgraph.edges, std::set<EdgeKeyString>{"a___b"});
    EXPECT_DOUBLE_EQ(result.degreeOf("a_"), 0.0);
    EXPECT_DOUBLE_EQ(result.degreeOf("b"), 1.0);
    EXPECT_DOUBLE_EQ(result.positions.at("a_").x, 50.0);
    EXPECT_DOUBLE_EQ(result.positions.at("b").x, 270.0);
    EXPECT_FALSE(result.hasNode("a"));
    EXPECT_FALSE(result.hasNode("_b"));
}

// --- Properties ---

TEST(ComparisonLayoutTest, Determinism_IdenticalRunsProduceIdenticalPositions) {
    ContestGraph graph = conferenceGraph();
    ComparisonLayout first;
    ComparisonLayout second;

    for (int degree = 1; degree <= 5; ++degree) {
        LayoutResult a = first.layout(graph, request("OSU", "UGA", degree));
        LayoutResult b = second.layout(graph, request("OSU", "UGA", degree));

        EXPECT_EQ(a.positions, b.positions) << "degree " << degree;
        EXPECT_EQ(a.layers, b.layers);
        EXPECT_EQ(LayoutSerializer::toJson(a), LayoutSerializer::toJson(b));
    }
}

TEST(ComparisonLayoutTest, NodeSet_GrowsMonotonicallyWithMaxDegree) {
    ContestGraph graph = conferenceGraph();
    ComparisonLayout layout;

    std::set<NodeId> previous;
    for (int degree = 0; degree <= 6; ++degree) {
        LayoutResult result = layout.layout(graph, request("MICH", "BAMA", degree));
        EXPECT_TRUE(std::includes(result.subgraph.nodes.begin(), result.subgraph.nodes.end(),
                                  previous.begin(), previous.end()))
            << "degree " << degree;
        previous = result.subgraph.nodes;
    }
}

TEST(ComparisonLayoutTest, EndpointPinning_HoldsForEveryBound) {
    ContestGraph graph = conferenceGraph();
    ComparisonLayout layout;

    for (int degree = 1; degree <= 6; ++degree) {
        LayoutResult result = layout.layout(graph, request("PSU", "UGA", degree));
        if (result.isEmpty()) continue;

        EXPECT_DOUBLE_EQ(result.degreeOf("PSU"), 0.0);
        EXPECT_DOUBLE_EQ(result.degreeOf("UGA"),
                         static_cast<double>(result.subgraph.canonicalHops()))
            << "degree " << degree;
    }
}

TEST(ComparisonLayoutTest, NoCollision_NoSharedCoordinates) {
    ContestGraph graph = conferenceGraph();
    ComparisonLayout layout;

    for (int degree = 1; degree <= 6; ++degree) {
        LayoutResult result = layout.layout(graph, request("OSU", "BAMA", degree));

        std::set<std::pair<double, double>> seen;
        for (const auto& [id, pos] : result.positions) {
            EXPECT_TRUE(seen.insert({pos.x, pos.y}).second) << id << " at degree " << degree;
        }
    }
}

TEST(ComparisonLayoutTest, Crossings_NeverIncrease) {
    ContestGraph graph = conferenceGraph();
    ComparisonLayout layout;

    for (int degree = 1; degree <= 6; ++degree) {
        LayoutResult result = layout.layout(graph, request("OSU", "BAMA", degree));
        EXPECT_LE(result.stats.finalCrossings, result.stats.initialCrossings);
    }
}

TEST(ComparisonLayoutTest, X_MonotonicInDegree) {
    ContestGraph graph = conferenceGraph();
    ComparisonLayout layout;

    LayoutResult result = layout.layout(graph, request("OSU", "UGA", 4));
    ASSERT_FALSE(result.isEmpty());

    for (const auto& [a, pa] : result.positions) {
        for (const auto& [b, pb] : result.positions) {
            if (result.degreeOf(a) < result.degreeOf(b)) {
                EXPECT_LT(pa.x, pb.x) << a << " vs " << b;
            }
        }
    }
}

// --- Requests and filters ---

TEST(ComparisonLayoutTest, SourceEqualsDestination_IsRejected) {
    ComparisonLayout layout;
    CountingObserver observer;
    layout.setObserver(&observer);

    LayoutResult result = layout.layout(bridgeGraph(), request("S", "S", 3));

    EXPECT_TRUE(result.isEmpty());
    EXPECT_EQ(observer.rejected, 1);
    EXPECT_EQ(observer.lastReason, "source equals destination");
    EXPECT_EQ(observer.subgraphs, 0);
    EXPECT_EQ(observer.completed, 1);
}

TEST(ComparisonLayoutTest, NegativeDegree_IsRejected) {
    ComparisonLayout layout;
    CountingObserver observer;
    layout.setObserver(&observer);

    EXPECT_TRUE(layout.layout(bridgeGraph(), request("S", "T", -2)).isEmpty());
    EXPECT_EQ(observer.rejected, 1);
}

TEST(ComparisonLayoutTest, UnknownEndpoint_IsEmptyNotAnError) {
    ComparisonLayout layout;

    EXPECT_TRUE(layout.layout(bridgeGraph(), request("S", "Nowhere", 3)).isEmpty());
}

TEST(ComparisonLayoutTest, CategoryFilter_RestrictsEdges) {
    ComparisonLayout layout;
    LayoutRequest r = request("S", "T", 3);
    r.filter.category = "CONF";

    LayoutResult result = layout.layout(bridgeGraph(), r);

    EXPECT_EQ(result.subgraph.nodes, (std::set<NodeId>{"B", "C", "S", "T"}));
    EXPECT_TRUE(result.layering.bridges.empty());
}

TEST(ComparisonLayoutTest, Observer_SeesEveryPhase) {
    ComparisonLayout layout;
    CountingObserver observer;
    layout.setObserver(&observer);

    layout.layout(bridgeGraph(), request("S", "T", 3));

    EXPECT_EQ(observer.rejected, 0);
    EXPECT_EQ(observer.subgraphs, 1);
    EXPECT_EQ(observer.bridges, 1);
    EXPECT_EQ(observer.layered, 1);
    EXPECT_EQ(observer.positioned, 1);
    EXPECT_EQ(observer.completed, 1);
}

// --- Configuration ---

TEST(ComparisonLayoutTest, Options_ChangeSpacing) {
    LayoutOptions options;
    options.spacing.margin = 10.0;
    options.spacing.horizontalSpacing = 100.0;
    ComparisonLayout layout(options);

    LayoutResult result = layout.layout(bridgeGraph(), request("S", "T", 3));

    EXPECT_DOUBLE_EQ(result.positions.at("S").x, 10.0);
    EXPECT_DOUBLE_EQ(result.positions.at("A").x, 160.0);
    EXPECT_DOUBLE_EQ(result.positions.at("T").x, 310.0);
}

TEST(ComparisonLayoutTest, InvalidOptions_Throw) {
    LayoutOptions options;
    options.spacing.horizontalSpacing = 0.0;

    EXPECT_THROW(ComparisonLayout{options}, std::invalid_argument);

    ComparisonLayout layout;
    EXPECT_THROW(layout.setOptions(options), std::invalid_argument);
    EXPECT_DOUBLE_EQ(layout.options().spacing.horizontalSpacing, 220.0);
}

TEST(ComparisonLayoutTest, CustomPhase_CanBeInjected) {
    class FlatPlacement : public IPositionAssignment {
    public:
        PositionMap place(const Layers& layers, const SpacingOptions&) const override {
            PositionMap positions;
            double x = 0.0;
            for (const auto& layer : layers) {
                for (const auto& id : layer.nodes) {
                    positions[id] = {x, 0.0};
                    x += 1.0;
                }
            }
            return positions;
        }
        const char* algorithmName() const override { return "Flat"; }
    };

    ComparisonLayout layout;
    layout.setPositionAssignment(std::make_shared<FlatPlacement>());
    layout.setPositionAssignment(nullptr);   // ignored

    LayoutResult result = layout.layout(bridgeGraph(), request("S", "T", 3));

    EXPECT_DOUBLE_EQ(result.positions.at("S").x, 0.0);
    EXPECT_DOUBLE_EQ(result.positions.at("T").x, 4.0);
}
