#pragma once

#include "../config/LayoutTypes.h"

namespace matchgraph {

struct LayoutResult;

/// Telemetry hooks for the comparison pipeline.
///
/// Every callback has an empty default so observers override only what
/// they need. Callbacks run synchronously on the calling thread.
class ILayoutObserver {
public:
    virtual ~ILayoutObserver() = default;

    virtual void onRequestRejected([[maybe_unused]] const LayoutRequest& request,
                                   [[maybe_unused]] const std::string& reason) {}

    virtual void onSubgraphBuilt([[maybe_unused]] const Subgraph& subgraph) {}

    /// A node was moved from its integer layer to hopDistance + 0.5
    virtual void onBridgeDetected([[maybe_unused]] const NodeId& node,
                                  [[maybe_unused]] int hopDistance,
                                  [[maybe_unused]] int canonicalHops) {}

    virtual void onLayersAssigned([[maybe_unused]] const LayerAssignmentResult& assignment) {}

    /// Called after each sweep iteration with the crossing count it produced
    virtual void onCrossingIteration([[maybe_unused]] int iteration,
                                     [[maybe_unused]] int crossings) {}

    virtual void onPositionsAssigned([[maybe_unused]] const PositionMap& positions) {}

    /// Called once per pipeline run, also for empty results
    virtual void onLayoutComplete([[maybe_unused]] const LayoutResult& result) {}
};

}  // namespace matchgraph
