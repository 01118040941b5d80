#pragma once

#include <string>

namespace matchgraph {

// Forward declarations
class ContestGraph;
struct LayoutResult;

/// JSON import of schedules and export of layout results
class LayoutSerializer {
public:
    // === Schedule import ===

    /// Build a contest universe from a schedule document
    ///
    /// Expected shape:
    ///   {"teams": [{"id": "...", "name": "..."}],
    ///    "games": [{"id": "...", "home": "...", "away": "...",
    ///               "type": "...", "leverage": 1.2}]}
    /// `home` / `away` may also be objects with an `id` field. Games that
    /// reference unknown teams or carry no positive leverage are skipped.
    /// @throws std::runtime_error if the document is not valid JSON or
    ///         lacks the `teams` / `games` arrays
    static ContestGraph contestGraphFromJson(const std::string& json);

    /// Read and parse a schedule file
    /// @throws std::runtime_error if the file cannot be read or parsed
    static ContestGraph loadContestGraph(const std::string& path);

    // === LayoutResult serialization ===

    /// Serialize a layout result; object keys are emitted in sorted order
    /// so equal results produce identical strings
    static std::string toJson(const LayoutResult& result);

    /// Write toJson(result) to a file
    /// @return true if save succeeded
    static bool saveToFile(const LayoutResult& result, const std::string& path);
};

}  // namespace matchgraph
