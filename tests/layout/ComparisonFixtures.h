#pragma once

#include <matchgraph/matchgraph.h>

namespace matchgraph::test {

constexpr double STRONG = 3.0;   // weight 1/3
constexpr double WEAK = 0.5;     // weight 2

/// S connects to A, B and C. A reaches T directly (S-A-T), but the
/// strong contests make S-B-C-T the minimum-weight path. The weak S-C
/// contest puts C one hop from S.
inline ContestGraph bridgeGraph() {
    ContestGraph graph;
    for (const char* id : {"S", "A", "B", "C", "T"}) {
        graph.addNode(id);
    }
    graph.addContest({"S", "B", STRONG, "CONF", "g1"});
    graph.addContest({"B", "C", STRONG, "CONF", "g2"});
    graph.addContest({"C", "T", STRONG, "CONF", "g3"});
    graph.addContest({"S", "A", WEAK, "NONCONF", "g4"});
    graph.addContest({"A", "T", WEAK, "NONCONF", "g5"});
    graph.addContest({"S", "C", WEAK, "NONCONF", "g6"});
    return graph;
}

/// A larger schedule with several crossings between layers
inline ContestGraph conferenceGraph() {
    ContestGraph graph;
    graph.addNode("OSU", "Ohio State");
    graph.addNode("MICH", "Michigan");
    graph.addNode("PSU", "Penn State");
    graph.addNode("ORE", "Oregon");
    graph.addNode("UW", "Washington");
    graph.addNode("USC", "USC");
    graph.addNode("ND", "Notre Dame");
    graph.addNode("TEX", "Texas");
    graph.addNode("UGA", "Georgia");
    graph.addNode("BAMA", "Alabama");

    graph.addContest({"OSU", "MICH", 2.5, "CONF", "c1"});
    graph.addContest({"OSU", "PSU", 2.0, "CONF", "c2"});
    graph.addContest({"OSU", "ORE", 1.8, "CONF", "c3"});
    graph.addContest({"OSU", "TEX", 1.2, "NONCONF", "c4"});
    graph.addContest({"MICH", "USC", 1.0, "CONF", "c5"});
    graph.addContest({"MICH", "TEX", 1.5, "NONCONF", "c6"});
    graph.addContest({"PSU", "USC", 0.9, "CONF", "c7"});
    graph.addContest({"PSU", "ND", 1.4, "NONCONF", "c8"});
    graph.addContest({"ORE", "UW", 2.2, "CONF", "c9"});
    graph.addContest({"ORE", "ND", 0.7, "NONCONF", "c10"});
    graph.addContest({"UW", "UGA", 0.6, "NONCONF", "c11"});
    graph.addContest({"USC", "UGA", 0.8, "NONCONF", "c12"});
    graph.addContest({"ND", "BAMA", 1.1, "NONCONF", "c13"});
    graph.addContest({"TEX", "UGA", 2.8, "CONF", "c14"});
    graph.addContest({"TEX", "BAMA", 1.3, "CONF", "c15"});
    graph.addContest({"UGA", "BAMA", 3.0, "CONF", "c16"});
    graph.addContest({"MICH", "PSU", 1.9, "CONF", "c17"});
    return graph;
}

}  // namespace matchgraph::test
