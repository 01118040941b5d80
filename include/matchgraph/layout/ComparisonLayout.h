#pragma once

#include "../core/ContestGraph.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"

#include <memory>

namespace matchgraph {

// Interfaces
class ISubgraphBuilder;
class ILayerAssignment;
class ICrossingMinimization;
class IPositionAssignment;
class ILayoutObserver;

/// Layered comparison layout between two endpoints
///
/// Runs four phases in order, each producing a new value:
/// 1. Subgraph - every node/edge on a bounded path between the endpoints
/// 2. Layer Assignment - hop-distance degrees with half-integer bridges
/// 3. Crossing Minimization - median sweeps over adjacent layers
/// 4. Position Assignment - x from degree, y centered per layer
///
/// layout() keeps no state between calls; the same graph and request
/// always produce the same result.
class ComparisonLayout {
public:
    ComparisonLayout();
    explicit ComparisonLayout(const LayoutOptions& options);
    ~ComparisonLayout();

    // Non-copyable, movable
    ComparisonLayout(const ComparisonLayout&) = delete;
    ComparisonLayout& operator=(const ComparisonLayout&) = delete;
    ComparisonLayout(ComparisonLayout&&) noexcept;
    ComparisonLayout& operator=(ComparisonLayout&&) noexcept;

    /// @throws std::invalid_argument if options fail validation
    void setOptions(const LayoutOptions& options);
    const LayoutOptions& options() const { return options_; }

    /// Telemetry sink (not owned, may be nullptr)
    void setObserver(ILayoutObserver* observer) { observer_ = observer; }
    ILayoutObserver* observer() const { return observer_; }

    /// Run the pipeline for one request
    LayoutResult layout(const ContestGraph& graph, const LayoutRequest& request) const;

    /// Run the pipeline over an already filtered edge set
    LayoutResult layout(const EdgeSet& edges,
                        const std::map<NodeId, std::string>& labels,
                        const LayoutRequest& request) const;

    /// Algorithm injection (for swapping implementations)
    /// Passing nullptr keeps the current implementation
    void setSubgraphBuilder(std::shared_ptr<ISubgraphBuilder> impl);
    void setLayerAssignment(std::shared_ptr<ILayerAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl);
    void setPositionAssignment(std::shared_ptr<IPositionAssignment> impl);

private:
    LayoutOptions options_;
    ILayoutObserver* observer_ = nullptr;

    std::shared_ptr<ISubgraphBuilder> subgraphBuilder_;
    std::shared_ptr<ILayerAssignment> layerAssignment_;
    std::shared_ptr<ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<IPositionAssignment> positionAssignment_;

    LayoutResult finish(LayoutResult result) const;
};

}  // namespace matchgraph
