#pragma once

#include "Types.h"
#include "EdgeKey.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace matchgraph {

/// Category value that matches every contest
inline constexpr const char* ALL_CATEGORIES = "ALL";

struct NodeData {
    NodeId id;
    std::string label;

    NodeData() = default;
    NodeData(NodeId i, std::string lbl) : id(std::move(i)), label(std::move(lbl)) {}
};

/// One scheduled contest between two nodes
struct ContestRecord {
    NodeId idA;
    NodeId idB;
    double importance = 0.0;   ///< Higher = more important connection
    std::string category;
    std::string contestId;

    ContestRecord() = default;
    ContestRecord(NodeId a, NodeId b, double imp, std::string cat = ALL_CATEGORIES,
                  std::string cid = "")
        : idA(std::move(a)), idB(std::move(b)), importance(imp),
          category(std::move(cat)), contestId(std::move(cid)) {}
};

/// Edge predicate: contest category and minimum importance
struct EdgeFilter {
    std::string category = ALL_CATEGORIES;
    double minImportance = 0.0;

    bool accepts(const ContestRecord& record) const {
        return (category == ALL_CATEGORIES || record.category == category) &&
               record.importance >= minImportance;
    }

    bool operator==(const EdgeFilter& o) const {
        return category == o.category && minImportance == o.minImportance;
    }
    bool operator!=(const EdgeFilter& o) const { return !(*this == o); }
};

/// Deduplicated weighted edge between an unordered node pair
struct WeightedEdge {
    EdgeKeyString key;
    NodeId a;                         ///< Lexicographically smaller id
    NodeId b;
    double weight = 0.0;              ///< Lower = closer
    double meanImportance = 0.0;
    std::vector<std::string> contestIds;

    const NodeId& other(const NodeId& id) const { return id == a ? b : a; }
};

/// Edge universe keyed by canonical edge key (ordered for deterministic iteration)
using EdgeSet = std::map<EdgeKeyString, WeightedEdge>;

/// Entity/contest universe supplied by the data collaborator.
///
/// Contests between the same pair are merged into one WeightedEdge by
/// buildEdges(); the weight is the inverse of the mean importance of the
/// contests that pass the filter.
class ContestGraph {
public:
    ContestGraph() = default;

    // Node operations
    void addNode(const NodeId& id, const std::string& label = "");
    bool hasNode(const NodeId& id) const;
    const NodeData& getNode(const NodeId& id) const;
    std::optional<NodeData> tryGetNode(const NodeId& id) const;

    /// Display label, falling back to the id for unknown nodes
    std::string label(const NodeId& id) const;

    /// Label lookup for every registered node
    std::map<NodeId, std::string> labels() const;

    // Contest operations
    /// Records with an empty or identical endpoint pair are ignored.
    /// Returns false when the record was ignored.
    bool addContest(const ContestRecord& record);

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t contestCount() const { return contests_.size(); }
    std::vector<NodeId> nodes() const;
    const std::vector<ContestRecord>& contests() const { return contests_; }

    /// Build the filtered, deduplicated weighted edge set
    EdgeSet buildEdges(const EdgeFilter& filter) const;

    void clear();

    /// Floor applied to the mean importance before inversion
    static constexpr double MIN_IMPORTANCE = 1e-6;

private:
    std::map<NodeId, NodeData> nodes_;
    std::vector<ContestRecord> contests_;
};

}  // namespace matchgraph
