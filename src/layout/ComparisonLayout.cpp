#include "matchgraph/layout/ComparisonLayout.h"
#include "matchgraph/layout/api/ISubgraphBuilder.h"
#include "matchgraph/layout/api/ILayerAssignment.h"
#include "matchgraph/layout/api/ICrossingMinimization.h"
#include "matchgraph/layout/api/IPositionAssignment.h"
#include "matchgraph/layout/api/ILayoutObserver.h"
#include "matchgraph/common/Logger.h"
#include "phases/SubgraphBuilder.h"
#include "phases/LayerAssignment.h"
#include "phases/CrossingMinimization.h"
#include "phases/PositionAssignment.h"

namespace matchgraph {

namespace {
    /// Reason a request is rejected before any phase runs (empty = accepted)
    std::string rejectionReason(const LayoutRequest& request) {
        if (request.source.empty() || request.destination.empty()) {
            return "missing endpoint";
        }
        if (request.source == request.destination) {
            return "source equals destination";
        }
        if (request.maxDegree < 0) {
            return "negative maxDegree";
        }
        return {};
    }
}

ComparisonLayout::ComparisonLayout()
    : ComparisonLayout(LayoutOptions{}) {}

ComparisonLayout::ComparisonLayout(const LayoutOptions& options)
    : options_(options)
    , subgraphBuilder_(std::make_shared<BoundedPathSubgraphBuilder>())
    , layerAssignment_(std::make_shared<BridgeLayerAssignment>())
    , crossingMinimization_(std::make_shared<MedianCrossingMinimization>())
    , positionAssignment_(std::make_shared<LayeredPositionAssignment>()) {
    options_.validate();
}

ComparisonLayout::~ComparisonLayout() = default;

ComparisonLayout::ComparisonLayout(ComparisonLayout&&) noexcept = default;
ComparisonLayout& ComparisonLayout::operator=(ComparisonLayout&&) noexcept = default;

void ComparisonLayout::setOptions(const LayoutOptions& options) {
    options.validate();
    options_ = options;
}

void ComparisonLayout::setSubgraphBuilder(std::shared_ptr<ISubgraphBuilder> impl) {
    if (impl) subgraphBuilder_ = std::move(impl);
}

void ComparisonLayout::setLayerAssignment(std::shared_ptr<ILayerAssignment> impl) {
    if (impl) layerAssignment_ = std::move(impl);
}

void ComparisonLayout::setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void ComparisonLayout::setPositionAssignment(std::shared_ptr<IPositionAssignment> impl) {
    if (impl) positionAssignment_ = std::move(impl);
}

LayoutResult ComparisonLayout::layout(const ContestGraph& graph, const LayoutRequest& request) const {
    return layout(graph.buildEdges(request.filter), graph.labels(), request);
}

LayoutResult ComparisonLayout::layout(
    const EdgeSet& edges,
    const std::map<NodeId, std::string>& labels,
    const LayoutRequest& request) const {

    LayoutResult result;
    result.request = request;
    result.subgraph = Subgraph::empty(request.source, request.destination, request.maxDegree);

    std::string reason = rejectionReason(request);
    if (!reason.empty()) {
        LOG_WARN("rejected request '{}' -> '{}': {}", request.source, request.destination, reason);
        if (observer_) {
            observer_->onRequestRejected(request, reason);
        }
        return finish(std::move(result));
    }

    // Phase 1: Subgraph
    result.subgraph = subgraphBuilder_->build(
        request.source, request.destination, request.maxDegree, edges, observer_);

    if (result.subgraph.isEmpty()) {
        LOG_INFO("no connection between '{}' and '{}' within {} hops",
                 request.source, request.destination, request.maxDegree);
        return finish(std::move(result));
    }

    // Phase 2: Layer Assignment
    result.layering = layerAssignment_->assign(result.subgraph, labels, observer_);

    // Phase 3: Crossing Minimization
    const std::set<NodeId> pathNodes(result.subgraph.canonicalPath.begin(),
                                     result.subgraph.canonicalPath.end());
    CrossingMinimizationResult ordering = crossingMinimization_->minimize(
        result.layering.layers, result.subgraph.edges, labels, pathNodes,
        options_.crossing, observer_);

    result.layers = std::move(ordering.layers);
    result.stats.initialCrossings = ordering.initialCrossings;
    result.stats.finalCrossings = ordering.finalCrossings;
    result.stats.crossingIterations = ordering.iterations;

    // Phase 4: Position Assignment
    result.positions = positionAssignment_->place(result.layers, options_.spacing);
    if (observer_) {
        observer_->onPositionsAssigned(result.positions);
    }

    return finish(std::move(result));
}

LayoutResult ComparisonLayout::finish(LayoutResult result) const {
    result.stats.nodeCount = static_cast<int>(result.positions.size());
    result.stats.edgeCount = static_cast<int>(result.subgraph.edges.size());
    result.stats.layerCount = static_cast<int>(result.layers.size());
    result.stats.bridgeCount = static_cast<int>(result.layering.bridges.size());

    LOG_DEBUG("layout '{}' -> '{}' (maxDegree={}): {} nodes, {} layers, {} crossings",
              result.request.source, result.request.destination, result.request.maxDegree,
              result.stats.nodeCount, result.stats.layerCount, result.stats.finalCrossings);

    if (observer_) {
        observer_->onLayoutComplete(result);
    }
    return result;
}

}  // namespace matchgraph
