#pragma once

#include "matchgraph/layout/api/IPositionAssignment.h"

#include <vector>

namespace matchgraph {

/// Column-per-degree coordinate assignment
///
/// x is a linear function of degree. Inside a layer, nodes are spread
/// symmetrically around the canvas midline in layer order, with wider
/// spacing for crowded layers. A bounded collision pass then separates
/// nodes that ended up too close across neighbouring columns.
class LayeredPositionAssignment : public IPositionAssignment {
public:
    LayeredPositionAssignment() = default;

    const char* algorithmName() const override { return "Layered"; }

    PositionMap place(const Layers& layers,
                      const SpacingOptions& spacing) const override;

    /// Vertical distance between consecutive nodes of a layer of `count` nodes
    static double layerSpacing(size_t count, const SpacingOptions& spacing);

private:
    struct Entry {
        NodeId id;
        Point position;
    };

    // Returns the number of nodes moved
    int resolveCollisions(std::vector<Entry>& entries, const SpacingOptions& spacing) const;
};

}  // namespace matchgraph
