#pragma once

#include "../config/LayoutTypes.h"
#include "../config/LayoutOptions.h"

#include <set>
#include <vector>

namespace matchgraph {

class ILayoutObserver;

/// Abstract interface for crossing minimization
///
/// Implementations never modify their inputs; the reordered layers are
/// returned in the result.
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    /// @param layers Layers in ascending degree order
    /// @param edges Canonical edge keys (malformed keys are ignored)
    /// @param labels Node labels for deterministic tie-breaking
    /// @param canonicalPathNodes Nodes that sort first among equal medians
    virtual CrossingMinimizationResult minimize(
        const Layers& layers,
        const std::set<EdgeKeyString>& edges,
        const std::map<NodeId, std::string>& labels,
        const std::set<NodeId>& canonicalPathNodes,
        const CrossingOptions& options,
        ILayoutObserver* observer) const = 0;

    /// Crossings between two adjacent layers
    virtual int countCrossings(const std::vector<NodeId>& first,
                               const std::vector<NodeId>& second,
                               const std::set<EdgeKeyString>& edges) const = 0;

    /// Sum of crossings over every pair of adjacent layers
    virtual int countTotalCrossings(const Layers& layers,
                                    const std::set<EdgeKeyString>& edges) const = 0;

    virtual const char* algorithmName() const = 0;
};

}  // namespace matchgraph
