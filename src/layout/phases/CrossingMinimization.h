#pragma once

#include "matchgraph/layout/api/ICrossingMinimization.h"
#include "Adjacency.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace matchgraph {

/// Median-heuristic crossing minimization
///
/// Alternates down-sweeps (layer i ordered by layer i-1) and up-sweeps
/// (layer i ordered by layer i+1). The best ordering seen so far is kept,
/// so the crossing count never increases.
class MedianCrossingMinimization : public ICrossingMinimization {
public:
    MedianCrossingMinimization() = default;

    const char* algorithmName() const override { return "Median"; }

    CrossingMinimizationResult minimize(
        const Layers& layers,
        const std::set<EdgeKeyString>& edges,
        const std::map<NodeId, std::string>& labels,
        const std::set<NodeId>& canonicalPathNodes,
        const CrossingOptions& options,
        ILayoutObserver* observer) const override;

    int countCrossings(const std::vector<NodeId>& first,
                       const std::vector<NodeId>& second,
                       const std::set<EdgeKeyString>& edges) const override;

    int countTotalCrossings(const Layers& layers,
                            const std::set<EdgeKeyString>& edges) const override;

    /// Median of sorted positions; the mean of the middle two for even counts
    static double median(std::vector<int> positions);

private:
    struct SortContext {
        const Adjacency* adjacency;
        const std::map<NodeId, std::string>* labels;
        const std::set<NodeId>* pathNodes;
    };

    void orderLayer(Layer& layer, const Layer& fixed, const SortContext& context) const;

    void sweep(Layers& layers, bool downward, const SortContext& context) const;
};

}  // namespace matchgraph
