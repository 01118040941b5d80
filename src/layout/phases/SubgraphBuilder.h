#pragma once

#include "matchgraph/layout/api/ISubgraphBuilder.h"
#include "Adjacency.h"

#include <optional>
#include <vector>

namespace matchgraph {

/// Weighted path between two nodes
struct WeightedPath {
    std::vector<NodeId> nodes;
    std::vector<EdgeKeyString> edges;
    double weight = 0.0;

    int hops() const { return nodes.empty() ? 0 : static_cast<int>(nodes.size()) - 1; }
};

/// Comparison subgraph from bounded simple-path enumeration.
///
/// 1. Dijkstra over edge weights gives the canonical path.
/// 2. A depth-first search enumerates every simple source -> destination
///    path of at most max(maxDegree, 1) hops; branches that cannot reach
///    the destination within the bound are pruned with BFS distances.
/// 3. Every node and edge on an enumerated path is kept.
class BoundedPathSubgraphBuilder : public ISubgraphBuilder {
public:
    BoundedPathSubgraphBuilder() = default;

    const char* algorithmName() const override { return "BoundedPath"; }

    Subgraph build(const NodeId& source,
                   const NodeId& destination,
                   int maxDegree,
                   const EdgeSet& edges,
                   ILayoutObserver* observer) const override;

    /// Minimum-weight path; std::nullopt when destination is unreachable
    static std::optional<WeightedPath> shortestPath(const NodeId& source,
                                                    const NodeId& destination,
                                                    const WeightedAdjacency& adjacency);

private:
    struct Enumeration;

    void enumerate(const NodeId& current, Enumeration& state) const;
};

}  // namespace matchgraph
