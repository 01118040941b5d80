#include "Adjacency.h"
#include "matchgraph/common/Logger.h"

#include <algorithm>
#include <queue>

namespace matchgraph {

namespace {
    const NodeId& neighborId(const NodeId& n) { return n; }
    const NodeId& neighborId(const WeightedNeighbor& n) { return n.node; }

    template <typename AdjacencyT>
    std::map<NodeId, int> bfs(const NodeId& start, const AdjacencyT& adjacency) {
        std::map<NodeId, int> dist;
        if (adjacency.find(start) == adjacency.end()) {
            return dist;
        }

        std::queue<NodeId> queue;
        dist[start] = 0;
        queue.push(start);

        while (!queue.empty()) {
            NodeId current = queue.front();
            queue.pop();
            int next = dist[current] + 1;

            auto it = adjacency.find(current);
            if (it == adjacency.end()) continue;

            for (const auto& neighbor : it->second) {
                const NodeId& id = neighborId(neighbor);
                if (dist.emplace(id, next).second) {
                    queue.push(id);
                }
            }
        }
        return dist;
    }

    template <typename Resolve>
    Adjacency buildAdjacencyWith(const std::set<NodeId>& nodes,
                                 const std::set<EdgeKeyString>& edges,
                                 Resolve resolve) {
        Adjacency adjacency;
        for (const auto& id : nodes) {
            adjacency[id];
        }

        for (const auto& key : edges) {
            auto ids = resolve(key);
            if (!ids) {
                LOG_DEBUG("skipping malformed edge key '{}'", key);
                continue;
            }
            auto a = adjacency.find(ids->first);
            auto b = adjacency.find(ids->second);
            if (a == adjacency.end() || b == adjacency.end()) {
                continue;
            }
            a->second.push_back(ids->second);
            b->second.push_back(ids->first);
        }

        for (auto& [id, neighbors] : adjacency) {
            std::sort(neighbors.begin(), neighbors.end());
            neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
        }
        return adjacency;
    }
}

Adjacency buildAdjacency(const std::set<NodeId>& nodes, const std::set<EdgeKeyString>& edges) {
    return buildAdjacencyWith(nodes, edges, [](const EdgeKeyString& key) {
        return parseEdgeKey(key);
    });
}

std::optional<std::pair<NodeId, NodeId>> edgeEndpoints(const Subgraph& subgraph,
                                                       const EdgeKeyString& key) {
    auto it = subgraph.edgeDetails.find(key);
    if (it != subgraph.edgeDetails.end()) {
        return std::make_pair(it->second.a, it->second.b);
    }
    return parseEdgeKey(key);
}

Adjacency buildAdjacency(const Subgraph& subgraph) {
    return buildAdjacencyWith(subgraph.nodes, subgraph.edges, [&subgraph](const EdgeKeyString& key) {
        return edgeEndpoints(subgraph, key);
    });
}

WeightedAdjacency buildWeightedAdjacency(const EdgeSet& edges) {
    WeightedAdjacency adjacency;
    for (const auto& [key, edge] : edges) {
        adjacency[edge.a].push_back({edge.b, key, edge.weight});
        adjacency[edge.b].push_back({edge.a, key, edge.weight});
    }

    for (auto& [id, neighbors] : adjacency) {
        std::sort(neighbors.begin(), neighbors.end(),
                  [](const WeightedNeighbor& x, const WeightedNeighbor& y) { return x.node < y.node; });
    }
    return adjacency;
}

std::map<NodeId, int> hopDistances(const NodeId& start, const Adjacency& adjacency) {
    return bfs(start, adjacency);
}

std::map<NodeId, int> hopDistances(const NodeId& start, const WeightedAdjacency& adjacency) {
    return bfs(start, adjacency);
}

}  // namespace matchgraph
