#include "LayerAssignment.h"
#include "matchgraph/layout/api/ILayoutObserver.h"
#include "matchgraph/common/Logger.h"

#include <algorithm>

namespace matchgraph {

namespace {
    const std::string& labelOf(const NodeId& id, const std::map<NodeId, std::string>& labels) {
        auto it = labels.find(id);
        return it != labels.end() ? it->second : id;
    }
}

LayerAssignmentResult BridgeLayerAssignment::assign(
    const Subgraph& subgraph,
    const std::map<NodeId, std::string>& labels,
    ILayoutObserver* observer) const {

    LayerAssignmentResult result;
    if (subgraph.isEmpty()) {
        return result;
    }

    Adjacency adjacency = buildAdjacency(subgraph);
    result.hopDistance = hopDistances(subgraph.source, adjacency);

    for (const auto& [id, hops] : result.hopDistance) {
        result.degrees[id] = static_cast<double>(hops);
    }

    auto destIt = result.degrees.find(subgraph.destination);
    if (destIt != result.degrees.end()) {
        // Direct matchup: both endpoints share the first layer
        destIt->second = subgraph.maxDegree == 0
            ? 0.0
            : static_cast<double>(subgraph.canonicalHops());

        if (subgraph.maxDegree != 0) {
            detectBridges(subgraph, adjacency, result, observer);
        }
    } else {
        LOG_WARN("destination '{}' is not reachable inside the subgraph", subgraph.destination);
    }

    size_t unreachable = subgraph.nodes.size() - result.hopDistance.size();
    if (unreachable > 0) {
        LOG_DEBUG("{} subgraph nodes are not reachable from '{}'", unreachable, subgraph.source);
    }

    assignEdgeDegrees(subgraph, result);
    result.layers = groupLayers(result.degrees, labels);

    LOG_DEBUG("assigned {} nodes to {} layers ({} bridges, canonical hops {})",
              result.degrees.size(), result.layers.size(),
              result.bridges.size(), subgraph.canonicalHops());

    if (observer) {
        observer->onLayersAssigned(result);
    }
    return result;
}

void BridgeLayerAssignment::detectBridges(
    const Subgraph& subgraph,
    const Adjacency& adjacency,
    LayerAssignmentResult& result,
    ILayoutObserver* observer) const {

    const int canonicalHops = subgraph.canonicalHops();
    const std::set<NodeId> onPath(subgraph.canonicalPath.begin(), subgraph.canonicalPath.end());

    auto destNeighbors = adjacency.find(subgraph.destination);
    if (destNeighbors == adjacency.end()) {
        return;
    }

    for (const auto& node : destNeighbors->second) {
        if (node == subgraph.source || onPath.count(node) > 0) continue;

        auto hops = result.hopDistance.find(node);
        if (hops == result.hopDistance.end()) continue;

        if (hops->second + 1 < canonicalHops) {
            result.degrees[node] = hops->second + 0.5;
            result.bridges.insert(node);

            LOG_TRACE("bridge '{}' at hop {} (canonical path has {} hops)",
                      node, hops->second, canonicalHops);
            if (observer) {
                observer->onBridgeDetected(node, hops->second, canonicalHops);
            }
        }
    }
}

void BridgeLayerAssignment::assignEdgeDegrees(
    const Subgraph& subgraph,
    LayerAssignmentResult& result) const {

    for (const auto& key : subgraph.edges) {
        auto ids = edgeEndpoints(subgraph, key);
        if (!ids) continue;

        auto a = result.hopDistance.find(ids->first);
        auto b = result.hopDistance.find(ids->second);
        if (a == result.hopDistance.end() || b == result.hopDistance.end()) continue;

        result.edgeDegree[key] = std::min(a->second, b->second);
    }
}

Layers BridgeLayerAssignment::groupLayers(
    const std::map<NodeId, double>& degrees,
    const std::map<NodeId, std::string>& labels) {

    std::map<double, std::vector<NodeId>> byDegree;
    for (const auto& [id, degree] : degrees) {
        byDegree[degree].push_back(id);
    }

    Layers layers;
    layers.reserve(byDegree.size());
    for (auto& [degree, nodes] : byDegree) {
        std::sort(nodes.begin(), nodes.end(), [&labels](const NodeId& a, const NodeId& b) {
            const std::string& la = labelOf(a, labels);
            const std::string& lb = labelOf(b, labels);
            if (la != lb) return la < lb;
            return a < b;
        });
        layers.push_back({degree, std::move(nodes)});
    }
    return layers;
}

}  // namespace matchgraph
