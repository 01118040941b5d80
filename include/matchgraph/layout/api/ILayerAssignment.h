#pragma once

#include "../config/LayoutTypes.h"

namespace matchgraph {

class ILayoutObserver;

/// Abstract interface for layer (degree) assignment
class ILayerAssignment {
public:
    virtual ~ILayerAssignment() = default;

    /// Assign a degree to every node of the subgraph reachable from source
    /// @param subgraph Bounded comparison subgraph (may be the Empty sentinel)
    /// @param labels Node labels used for the initial in-layer order
    /// @param observer Optional telemetry sink (may be nullptr)
    virtual LayerAssignmentResult assign(const Subgraph& subgraph,
                                         const std::map<NodeId, std::string>& labels,
                                         ILayoutObserver* observer) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace matchgraph
