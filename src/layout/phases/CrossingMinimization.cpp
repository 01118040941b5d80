#include "CrossingMinimization.h"
#include "matchgraph/layout/api/ILayoutObserver.h"
#include "matchgraph/common/Logger.h"

#include <algorithm>
#include <unordered_map>

namespace matchgraph {

namespace {
    std::unordered_map<NodeId, int> positionsOf(const std::vector<NodeId>& layer) {
        std::unordered_map<NodeId, int> pos;
        for (size_t i = 0; i < layer.size(); ++i) {
            pos[layer[i]] = static_cast<int>(i);
        }
        return pos;
    }

    std::set<NodeId> nodesOf(const Layers& layers) {
        std::set<NodeId> nodes;
        for (const auto& layer : layers) {
            nodes.insert(layer.nodes.begin(), layer.nodes.end());
        }
        return nodes;
    }

    struct SortKey {
        bool hasNeighbors = false;
        double median = 0.0;
        bool onPath = false;
        std::string label;
        NodeId id;
    };

    bool keyLess(const SortKey& a, const SortKey& b) {
        if (a.hasNeighbors != b.hasNeighbors) return a.hasNeighbors;
        if (a.hasNeighbors && a.median != b.median) return a.median < b.median;
        if (a.onPath != b.onPath) return a.onPath;
        if (a.label != b.label) return a.label < b.label;
        return a.id < b.id;
    }
}

CrossingMinimizationResult MedianCrossingMinimization::minimize(
    const Layers& layers,
    const std::set<EdgeKeyString>& edges,
    const std::map<NodeId, std::string>& labels,
    const std::set<NodeId>& canonicalPathNodes,
    const CrossingOptions& options,
    ILayoutObserver* observer) const {

    CrossingMinimizationResult result;
    result.layers = layers;
    result.initialCrossings = countTotalCrossings(layers, edges);
    result.finalCrossings = result.initialCrossings;

    if (layers.size() < 2 || !options.enabled || result.initialCrossings == 0) {
        return result;
    }

    Adjacency adjacency = buildAdjacency(nodesOf(layers), edges);
    SortContext context{&adjacency, &labels, &canonicalPathNodes};

    const int layerCount = static_cast<int>(layers.size());
    const int maxIterations = std::min(options.maxIterations, 2 * layerCount + 1);

    Layers working = layers;
    int stalled = 0;

    for (int iteration = 1; iteration <= maxIterations; ++iteration) {
        sweep(working, iteration % 2 == 1, context);
        int crossings = countTotalCrossings(working, edges);
        result.iterations = iteration;

        if (observer) {
            observer->onCrossingIteration(iteration, crossings);
        }

        if (crossings < result.finalCrossings) {
            result.layers = working;
            result.finalCrossings = crossings;
            stalled = 0;
        } else {
            if (crossings > result.finalCrossings) {
                working = result.layers;
            }
            ++stalled;
        }

        if (result.finalCrossings == 0 || stalled >= options.stallIterations) {
            break;
        }
    }

    LOG_DEBUG("crossings {} -> {} after {} iterations",
              result.initialCrossings, result.finalCrossings, result.iterations);
    return result;
}

int MedianCrossingMinimization::countCrossings(
    const std::vector<NodeId>& first,
    const std::vector<NodeId>& second,
    const std::set<EdgeKeyString>& edges) const {

    auto firstPos = positionsOf(first);
    auto secondPos = positionsOf(second);

    // (position in first, position in second) for every edge spanning the pair
    std::vector<std::pair<int, int>> spans;
    for (const auto& key : edges) {
        auto ids = parseEdgeKey(key);
        if (!ids) continue;

        auto a1 = firstPos.find(ids->first);
        auto b2 = secondPos.find(ids->second);
        if (a1 != firstPos.end() && b2 != secondPos.end()) {
            spans.emplace_back(a1->second, b2->second);
            continue;
        }
        auto b1 = firstPos.find(ids->second);
        auto a2 = secondPos.find(ids->first);
        if (b1 != firstPos.end() && a2 != secondPos.end()) {
            spans.emplace_back(b1->second, a2->second);
        }
    }

    int crossings = 0;
    for (size_t i = 0; i < spans.size(); ++i) {
        for (size_t j = i + 1; j < spans.size(); ++j) {
            int d1 = spans[i].first - spans[j].first;
            int d2 = spans[i].second - spans[j].second;
            // Shared endpoints never cross
            if ((d1 < 0 && d2 > 0) || (d1 > 0 && d2 < 0)) {
                ++crossings;
            }
        }
    }
    return crossings;
}

int MedianCrossingMinimization::countTotalCrossings(
    const Layers& layers,
    const std::set<EdgeKeyString>& edges) const {

    int total = 0;
    for (size_t i = 0; i + 1 < layers.size(); ++i) {
        total += countCrossings(layers[i].nodes, layers[i + 1].nodes, edges);
    }
    return total;
}

double MedianCrossingMinimization::median(std::vector<int> positions) {
    if (positions.empty()) {
        return 0.0;
    }
    std::sort(positions.begin(), positions.end());
    size_t mid = positions.size() / 2;
    if (positions.size() % 2 == 1) {
        return static_cast<double>(positions[mid]);
    }
    return (positions[mid - 1] + positions[mid]) / 2.0;
}

void MedianCrossingMinimization::sweep(Layers& layers, bool downward, const SortContext& context) const {
    if (downward) {
        for (size_t i = 1; i < layers.size(); ++i) {
            orderLayer(layers[i], layers[i - 1], context);
        }
    } else {
        for (int i = static_cast<int>(layers.size()) - 2; i >= 0; --i) {
            orderLayer(layers[i], layers[i + 1], context);
        }
    }
}

void MedianCrossingMinimization::orderLayer(
    Layer& layer,
    const Layer& fixed,
    const SortContext& context) const {

    auto fixedPos = positionsOf(fixed.nodes);

    std::vector<SortKey> keys;
    keys.reserve(layer.nodes.size());
    for (const auto& id : layer.nodes) {
        SortKey key;
        key.id = id;
        key.onPath = context.pathNodes->count(id) > 0;

        auto label = context.labels->find(id);
        key.label = label != context.labels->end() ? label->second : id;

        std::vector<int> neighborPositions;
        auto adj = context.adjacency->find(id);
        if (adj != context.adjacency->end()) {
            for (const auto& neighbor : adj->second) {
                auto it = fixedPos.find(neighbor);
                if (it != fixedPos.end()) {
                    neighborPositions.push_back(it->second);
                }
            }
        }
        key.hasNeighbors = !neighborPositions.empty();
        key.median = median(std::move(neighborPositions));
        keys.push_back(std::move(key));
    }

    std::sort(keys.begin(), keys.end(), keyLess);

    std::vector<NodeId> reordered;
    reordered.reserve(keys.size());
    for (auto& key : keys) {
        reordered.push_back(std::move(key.id));
    }
    layer.nodes = std::move(reordered);
}

}  // namespace matchgraph
