#pragma once

#include "matchgraph/core/EdgeKey.h"
#include "matchgraph/core/ContestGraph.h"
#include "matchgraph/layout/config/LayoutTypes.h"

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace matchgraph {

/// Undirected adjacency with neighbours sorted by id
using Adjacency = std::map<NodeId, std::vector<NodeId>>;

struct WeightedNeighbor {
    NodeId node;
    EdgeKeyString key;
    double weight = 0.0;
};

using WeightedAdjacency = std::map<NodeId, std::vector<WeightedNeighbor>>;

/// Adjacency restricted to `nodes` built from canonical keys.
/// Keys that do not parse, or that touch a node outside `nodes`, are skipped.
Adjacency buildAdjacency(const std::set<NodeId>& nodes, const std::set<EdgeKeyString>& edges);

/// Endpoints of a subgraph edge. The ids recorded in edgeDetails win over
/// parsing the key, which cannot split ids that end or start with '_'.
std::optional<std::pair<NodeId, NodeId>> edgeEndpoints(const Subgraph& subgraph,
                                                       const EdgeKeyString& key);

/// Adjacency over a subgraph's own nodes and edges
Adjacency buildAdjacency(const Subgraph& subgraph);

/// Adjacency over every edge of an edge universe
WeightedAdjacency buildWeightedAdjacency(const EdgeSet& edges);

/// Unweighted BFS hop distances from start. Nodes not reached are absent.
std::map<NodeId, int> hopDistances(const NodeId& start, const Adjacency& adjacency);
std::map<NodeId, int> hopDistances(const NodeId& start, const WeightedAdjacency& adjacency);

}  // namespace matchgraph
