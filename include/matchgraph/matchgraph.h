#pragma once

/// @file matchgraph.h
/// @brief Main header for the matchgraph comparison layout library
///
/// matchgraph lays out the contests connecting two teams as a layered
/// diagram: columns are hop distance from the first team, the second team
/// sits at the length of the strongest connecting path.
///
/// Example usage:
/// @code
/// #include <matchgraph/matchgraph.h>
///
/// matchgraph::ContestGraph graph;
/// graph.addNode("BOS", "Boston");
/// graph.addNode("NYY", "New York");
/// graph.addNode("TOR", "Toronto");
/// graph.addContest({"BOS", "TOR", 1.4});
/// graph.addContest({"TOR", "NYY", 0.8});
///
/// matchgraph::ComparisonLayout layout;
/// auto result = layout.layout(graph, {"BOS", "NYY", 2, {}});
/// for (const auto& [id, pos] : result.positions) { ... }
/// @endcode

// Core module - Contest universe and edge keys
#include "core/Types.h"
#include "core/EdgeKey.h"
#include "core/ContestGraph.h"

// Layout module - Pipeline, results and options
#include "layout/config/LayoutOptions.h"
#include "layout/config/LayoutTypes.h"
#include "layout/config/LayoutResult.h"
#include "layout/api/ILayoutObserver.h"
#include "layout/ComparisonLayout.h"
#include "layout/interactive/ComparisonController.h"
#include "layout/util/LayoutSerializer.h"

#include <string>

namespace matchgraph {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace matchgraph
