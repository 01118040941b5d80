#pragma once

#include "LayoutTypes.h"

#include <optional>

namespace matchgraph {

/// Summary counters of one pipeline run
struct LayoutStats {
    int nodeCount = 0;
    int edgeCount = 0;
    int layerCount = 0;
    int bridgeCount = 0;
    int initialCrossings = 0;
    int finalCrossings = 0;
    int crossingIterations = 0;
};

/// Output of ComparisonLayout for one request.
///
/// An empty result (no path within the bound, or a rejected request) keeps
/// the request and an Empty subgraph; every other member is empty.
struct LayoutResult {
    LayoutRequest request;
    Subgraph subgraph;
    LayerAssignmentResult layering;   ///< Degrees, hop distances, bridges
    Layers layers;                    ///< Crossing-minimized order
    PositionMap positions;
    LayoutStats stats;

    bool isEmpty() const { return subgraph.isEmpty(); }

    bool hasNode(const NodeId& id) const { return positions.count(id) > 0; }

    double degreeOf(const NodeId& id) const { return layering.degreeOf(id); }

    std::optional<Point> positionOf(const NodeId& id) const {
        auto it = positions.find(id);
        if (it == positions.end()) return std::nullopt;
        return it->second;
    }
};

}  // namespace matchgraph
