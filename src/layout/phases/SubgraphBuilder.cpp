#include "SubgraphBuilder.h"
#include "matchgraph/layout/api/ILayoutObserver.h"
#include "matchgraph/common/Logger.h"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>

namespace matchgraph {

struct BoundedPathSubgraphBuilder::Enumeration {
    const WeightedAdjacency* adjacency = nullptr;
    const std::map<NodeId, int>* hopsToDestination = nullptr;
    NodeId destination;
    int bound = 0;

    // Current DFS path
    WeightedPath path;
    std::set<NodeId> onPath;

    // Union of every complete path
    std::set<NodeId> nodes;
    std::set<EdgeKeyString> edges;
    size_t pathCount = 0;

    // Cheapest complete path (ties: fewer hops, then node sequence)
    std::optional<WeightedPath> best;
};

namespace {
    bool cheaper(const WeightedPath& a, const WeightedPath& b) {
        if (a.weight != b.weight) return a.weight < b.weight;
        if (a.hops() != b.hops()) return a.hops() < b.hops();
        return a.nodes < b.nodes;
    }
}

Subgraph BoundedPathSubgraphBuilder::build(
    const NodeId& source,
    const NodeId& destination,
    int maxDegree,
    const EdgeSet& edges,
    ILayoutObserver* observer) const {

    Subgraph emptyResult = Subgraph::empty(source, destination, maxDegree);

    if (source.empty() || destination.empty() || source == destination || maxDegree < 0) {
        LOG_WARN("rejected comparison request '{}' -> '{}' (maxDegree={})",
                 source, destination, maxDegree);
        return emptyResult;
    }

    WeightedAdjacency adjacency = buildWeightedAdjacency(edges);
    if (adjacency.find(source) == adjacency.end() ||
        adjacency.find(destination) == adjacency.end()) {
        LOG_DEBUG("'{}' or '{}' has no edge passing the filter", source, destination);
        return emptyResult;
    }

    // maxDegree 0 asks for the direct matchup, i.e. single-hop paths
    const int bound = std::max(maxDegree, 1);

    std::map<NodeId, int> hopsToDestination = hopDistances(destination, adjacency);
    auto sourceHops = hopsToDestination.find(source);
    if (sourceHops == hopsToDestination.end() || sourceHops->second > bound) {
        LOG_DEBUG("no path of at most {} hops between '{}' and '{}'", bound, source, destination);
        return emptyResult;
    }

    Enumeration state;
    state.adjacency = &adjacency;
    state.hopsToDestination = &hopsToDestination;
    state.destination = destination;
    state.bound = bound;
    state.path.nodes.push_back(source);
    state.onPath.insert(source);

    enumerate(source, state);

    if (state.nodes.empty()) {
        return emptyResult;
    }

    Subgraph subgraph = emptyResult;
    subgraph.nodes = std::move(state.nodes);
    subgraph.edges = std::move(state.edges);
    for (const auto& key : subgraph.edges) {
        auto it = edges.find(key);
        if (it != edges.end()) {
            subgraph.edgeDetails.emplace(key, it->second);
        }
    }

    // The global minimum-weight path is canonical when it fits the bound;
    // otherwise the cheapest bounded path keeps the canonical path inside
    // the subgraph.
    std::optional<WeightedPath> canonical = shortestPath(source, destination, adjacency);
    if (!canonical || canonical->hops() > bound) {
        LOG_DEBUG("weighted shortest path has {} hops, bound is {}; using cheapest bounded path",
                  canonical ? canonical->hops() : -1, bound);
        canonical = state.best;
    }
    if (canonical) {
        subgraph.canonicalPath = canonical->nodes;
        subgraph.canonicalWeight = canonical->weight;
    }

    LOG_DEBUG("'{}' -> '{}' bound {}: {} paths, {} nodes, {} edges, canonical {} hops",
              source, destination, bound, state.pathCount,
              subgraph.nodes.size(), subgraph.edges.size(), subgraph.canonicalHops());

    if (observer) {
        observer->onSubgraphBuilt(subgraph);
    }
    return subgraph;
}

void BoundedPathSubgraphBuilder::enumerate(const NodeId& current, Enumeration& state) const {
    if (current == state.destination) {
        state.pathCount++;
        state.nodes.insert(state.path.nodes.begin(), state.path.nodes.end());
        state.edges.insert(state.path.edges.begin(), state.path.edges.end());
        if (!state.best || cheaper(state.path, *state.best)) {
            state.best = state.path;
        }
        return;
    }

    auto adjIt = state.adjacency->find(current);
    if (adjIt == state.adjacency->end()) {
        return;
    }

    const int depth = state.path.hops();
    for (const auto& neighbor : adjIt->second) {
        if (state.onPath.count(neighbor.node) > 0) continue;

        auto remaining = state.hopsToDestination->find(neighbor.node);
        if (remaining == state.hopsToDestination->end() ||
            depth + 1 + remaining->second > state.bound) {
            continue;
        }

        state.path.nodes.push_back(neighbor.node);
        state.path.edges.push_back(neighbor.key);
        state.path.weight += neighbor.weight;
        state.onPath.insert(neighbor.node);

        enumerate(neighbor.node, state);

        state.onPath.erase(neighbor.node);
        state.path.weight -= neighbor.weight;
        state.path.edges.pop_back();
        state.path.nodes.pop_back();
    }
}

std::optional<WeightedPath> BoundedPathSubgraphBuilder::shortestPath(
    const NodeId& source,
    const NodeId& destination,
    const WeightedAdjacency& adjacency) {

    using Entry = std::pair<double, NodeId>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;

    struct Predecessor {
        NodeId node;
        EdgeKeyString key;
    };

    std::map<NodeId, double> dist;
    std::map<NodeId, Predecessor> prev;
    std::set<NodeId> settled;

    dist[source] = 0.0;
    queue.push({0.0, source});

    while (!queue.empty()) {
        auto [d, current] = queue.top();
        queue.pop();

        if (!settled.insert(current).second) continue;
        if (current == destination) break;

        auto it = adjacency.find(current);
        if (it == adjacency.end()) continue;

        for (const auto& neighbor : it->second) {
            if (settled.count(neighbor.node) > 0) continue;

            double alt = d + neighbor.weight;
            auto known = dist.find(neighbor.node);
            if (known == dist.end() || alt < known->second) {
                dist[neighbor.node] = alt;
                prev[neighbor.node] = {current, neighbor.key};
                queue.push({alt, neighbor.node});
            }
        }
    }

    if (settled.count(destination) == 0) {
        return std::nullopt;
    }

    WeightedPath path;
    path.weight = dist[destination];
    for (NodeId cur = destination; cur != source; cur = prev[cur].node) {
        path.nodes.push_back(cur);
        path.edges.push_back(prev[cur].key);
    }
    path.nodes.push_back(source);
    std::reverse(path.nodes.begin(), path.nodes.end());
    std::reverse(path.edges.begin(), path.edges.end());
    return path;
}

}  // namespace matchgraph
