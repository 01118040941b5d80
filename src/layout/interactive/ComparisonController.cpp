#include "matchgraph/layout/interactive/ComparisonController.h"
#include "matchgraph/common/Logger.h"

namespace matchgraph {

ComparisonController::ComparisonController(const ContestGraph& graph, const LayoutOptions& options)
    : graph_(graph)
    , layout_(options) {}

bool ComparisonController::update(const LayoutRequest& request) {
    if (valid_ && result_.request == request) {
        LOG_TRACE("request '{}' -> '{}' unchanged, keeping layout", request.source, request.destination);
        return false;
    }

    result_ = layout_.layout(graph_, request);
    valid_ = true;
    ++pipelineRuns_;

    LOG_DEBUG("recomputed layout #{} for '{}' -> '{}' (maxDegree={}, category={}, minImportance={})",
              pipelineRuns_, request.source, request.destination, request.maxDegree,
              request.filter.category, request.filter.minImportance);
    return true;
}

void ComparisonController::setOptions(const LayoutOptions& options) {
    layout_.setOptions(options);
    invalidate();
    LOG_DEBUG("layout options changed, next update recomputes");
}

bool ComparisonController::isNodeVisible(const NodeId& id) const {
    if (!valid_ || !result_.hasNode(id)) {
        return false;
    }
    if (id == result_.subgraph.source || id == result_.subgraph.destination) {
        return true;
    }
    if (!displayBound_) {
        return true;
    }
    return result_.degreeOf(id) <= *displayBound_;
}

bool ComparisonController::isEdgeVisible(const EdgeKeyString& key) const {
    if (!valid_ || result_.subgraph.edges.count(key) == 0) {
        return false;
    }
    auto details = result_.subgraph.edgeDetails.find(key);
    if (details != result_.subgraph.edgeDetails.end()) {
        return isNodeVisible(details->second.a) && isNodeVisible(details->second.b);
    }
    auto ids = parseEdgeKey(key);
    return ids && isNodeVisible(ids->first) && isNodeVisible(ids->second);
}

std::vector<NodeId> ComparisonController::visibleNodes() const {
    std::vector<NodeId> nodes;
    for (const auto& [id, pos] : result_.positions) {
        if (isNodeVisible(id)) {
            nodes.push_back(id);
        }
    }
    return nodes;
}

std::vector<EdgeKeyString> ComparisonController::visibleEdges() const {
    std::vector<EdgeKeyString> edges;
    for (const auto& key : result_.subgraph.edges) {
        if (isEdgeVisible(key)) {
            edges.push_back(key);
        }
    }
    return edges;
}

PositionMap ComparisonController::visiblePositions() const {
    PositionMap visible;
    for (const auto& [id, pos] : result_.positions) {
        if (isNodeVisible(id)) {
            visible.emplace(id, pos);
        }
    }
    return visible;
}

}  // namespace matchgraph
