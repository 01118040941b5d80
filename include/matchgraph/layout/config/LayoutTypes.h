#pragma once

#include "../../core/Types.h"
#include "../../core/ContestGraph.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace matchgraph {

/// One comparison query between two endpoints
struct LayoutRequest {
    NodeId source;
    NodeId destination;
    int maxDegree = 0;          ///< Maximum hop length of retained paths
    EdgeFilter filter;

    /// Fields whose change invalidates a computed layout
    bool operator==(const LayoutRequest& o) const {
        return source == o.source && destination == o.destination &&
               maxDegree == o.maxDegree && filter == o.filter;
    }
    bool operator!=(const LayoutRequest& o) const { return !(*this == o); }
};

/// Bounded comparison subgraph between two endpoints.
///
/// A default-constructed (or cleared) Subgraph is the Empty sentinel:
/// no nodes, no edges, no canonical path. Source and destination are
/// still recorded so callers can render "no connection at this bound".
struct Subgraph {
    std::set<NodeId> nodes;
    std::set<EdgeKeyString> edges;
    NodeId source;
    NodeId destination;
    std::vector<NodeId> canonicalPath;   ///< Minimum-weight path, source first
    double canonicalWeight = 0.0;
    int maxDegree = 0;

    /// Weight / contest details for each key in `edges`
    std::map<EdgeKeyString, WeightedEdge> edgeDetails;

    bool isEmpty() const { return nodes.empty(); }

    /// Hop count of the canonical path (0 when there is none)
    int canonicalHops() const {
        return canonicalPath.empty() ? 0 : static_cast<int>(canonicalPath.size()) - 1;
    }

    static Subgraph empty(const NodeId& source, const NodeId& destination, int maxDegree) {
        Subgraph s;
        s.source = source;
        s.destination = destination;
        s.maxDegree = maxDegree;
        return s;
    }
};

/// Nodes sharing one (possibly fractional) degree, in display order
struct Layer {
    double degree = 0.0;
    std::vector<NodeId> nodes;

    bool operator==(const Layer& o) const { return degree == o.degree && nodes == o.nodes; }
};

/// Layers in ascending degree order
using Layers = std::vector<Layer>;

/// Result of layer assignment
struct LayerAssignmentResult {
    std::map<NodeId, double> degrees;      ///< Node -> assigned degree
    std::map<NodeId, int> hopDistance;     ///< Node -> raw BFS hops from source
    std::set<NodeId> bridges;              ///< Nodes moved to a half-integer degree
    std::map<EdgeKeyString, int> edgeDegree;  ///< min hop distance of the two endpoints
    Layers layers;

    double degreeOf(const NodeId& id) const {
        auto it = degrees.find(id);
        return it != degrees.end() ? it->second : NO_DEGREE;
    }
};

/// Result of crossing minimization
struct CrossingMinimizationResult {
    Layers layers;              ///< Reordered layers
    int initialCrossings = 0;
    int finalCrossings = 0;
    int iterations = 0;
};

/// Final coordinates; ordered so that equal layouts serialize identically
using PositionMap = std::map<NodeId, Point>;

}  // namespace matchgraph
