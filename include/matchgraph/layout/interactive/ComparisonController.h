#pragma once

#include "matchgraph/core/ContestGraph.h"
#include "matchgraph/layout/ComparisonLayout.h"
#include "matchgraph/layout/config/LayoutResult.h"

#include <optional>
#include <vector>

namespace matchgraph {

/// Keeps one comparison layout stable while the display changes
///
/// The pipeline runs only when the request (endpoints, maxDegree or edge
/// filter) changes, or after invalidate(). A display bound only hides
/// nodes whose degree exceeds it; positions of visible nodes never move.
///
/// Usage:
///   ComparisonController controller(graph);
///   controller.update({"BOS", "NYY", 3, {}});
///   controller.setDisplayBound(2.0);           // no recomputation
///   for (const auto& id : controller.visibleNodes()) { ... }
///
class ComparisonController {
public:
    /// @param graph Contest universe (must outlive the controller)
    explicit ComparisonController(const ContestGraph& graph,
                                  const LayoutOptions& options = LayoutOptions{});

    // =========================================================================
    // Request
    // =========================================================================

    /// Apply a request; runs the pipeline only if it differs from the last one
    /// @return true if a new layout was computed
    bool update(const LayoutRequest& request);

    /// Force the next update() to recompute (e.g. after the graph changed)
    void invalidate() { valid_ = false; }

    bool hasResult() const { return valid_; }
    const LayoutResult& result() const { return result_; }
    const LayoutRequest& request() const { return result_.request; }

    /// Number of pipeline runs so far
    int pipelineRuns() const { return pipelineRuns_; }

    /// Pipeline used for recomputation
    const ComparisonLayout& layout() const { return layout_; }

    /// Replace the layout options and drop the cached result
    /// @throws std::invalid_argument if the options fail validation
    void setOptions(const LayoutOptions& options);
    const LayoutOptions& options() const { return layout_.options(); }

    /// Observer for subsequent pipeline runs (not owned, may be nullptr)
    void setObserver(ILayoutObserver* observer) { layout_.setObserver(observer); }

    // =========================================================================
    // Display (visibility only)
    // =========================================================================

    /// Hide nodes with degree above `bound`; endpoints stay visible
    void setDisplayBound(double bound) { displayBound_ = bound; }
    void clearDisplayBound() { displayBound_.reset(); }
    std::optional<double> displayBound() const { return displayBound_; }

    bool isNodeVisible(const NodeId& id) const;

    /// Visible iff both endpoints are visible
    bool isEdgeVisible(const EdgeKeyString& key) const;

    std::vector<NodeId> visibleNodes() const;
    std::vector<EdgeKeyString> visibleEdges() const;

    /// Positions of visible nodes, unchanged from the computed layout
    PositionMap visiblePositions() const;

private:
    const ContestGraph& graph_;
    ComparisonLayout layout_;

    LayoutResult result_;
    bool valid_ = false;
    int pipelineRuns_ = 0;
    std::optional<double> displayBound_;
};

}  // namespace matchgraph
