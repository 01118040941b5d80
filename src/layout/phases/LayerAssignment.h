#pragma once

#include "matchgraph/layout/api/ILayerAssignment.h"
#include "Adjacency.h"

#include <map>
#include <set>
#include <string>

namespace matchgraph {

/// BFS-distance layer assignment with half-integer bridge layers
///
/// Every node gets its unweighted hop distance from the source. The
/// destination is pinned to the hop count of the canonical path, and a
/// node adjacent to the destination that reaches it in fewer hops than
/// the canonical path is placed half a layer to the right of its BFS
/// layer.
class BridgeLayerAssignment : public ILayerAssignment {
public:
    BridgeLayerAssignment() = default;

    const char* algorithmName() const override { return "Bridge"; }

    LayerAssignmentResult assign(const Subgraph& subgraph,
                                 const std::map<NodeId, std::string>& labels,
                                 ILayoutObserver* observer) const override;

    /// Group degrees into ascending layers; nodes inside a layer are
    /// ordered by label, then id
    static Layers groupLayers(const std::map<NodeId, double>& degrees,
                              const std::map<NodeId, std::string>& labels);

private:
    void detectBridges(const Subgraph& subgraph,
                       const Adjacency& adjacency,
                       LayerAssignmentResult& result,
                       ILayoutObserver* observer) const;

    void assignEdgeDegrees(const Subgraph& subgraph,
                           LayerAssignmentResult& result) const;
};

}  // namespace matchgraph
