#pragma once

#include "../config/LayoutTypes.h"

namespace matchgraph {

class ILayoutObserver;

/// Abstract interface for comparison-subgraph extraction
///
/// Implementations receive the predicate-filtered edge universe and return
/// every node and edge lying on a bounded source -> destination path,
/// together with the canonical weighted-shortest path.
class ISubgraphBuilder {
public:
    virtual ~ISubgraphBuilder() = default;

    /// @param source First endpoint
    /// @param destination Second endpoint (must differ from source)
    /// @param maxDegree Hop bound; 0 requests the direct edge only
    /// @param edges Filtered, deduplicated edge universe
    /// @param observer Optional telemetry sink (may be nullptr)
    /// @return Subgraph, or the Empty sentinel when no path fits the bound
    virtual Subgraph build(const NodeId& source,
                           const NodeId& destination,
                           int maxDegree,
                           const EdgeSet& edges,
                           ILayoutObserver* observer) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace matchgraph
