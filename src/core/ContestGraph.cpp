#include "matchgraph/core/ContestGraph.h"
#include "matchgraph/common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace matchgraph {

void ContestGraph::addNode(const NodeId& id, const std::string& label) {
    nodes_[id] = NodeData(id, label.empty() ? id : label);
}

bool ContestGraph::hasNode(const NodeId& id) const {
    return nodes_.find(id) != nodes_.end();
}

const NodeData& ContestGraph::getNode(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw std::out_of_range("Invalid node ID: " + id);
    }
    return it->second;
}

std::optional<NodeData> ContestGraph::tryGetNode(const NodeId& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ContestGraph::label(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? it->second.label : id;
}

std::map<NodeId, std::string> ContestGraph::labels() const {
    std::map<NodeId, std::string> result;
    for (const auto& [id, data] : nodes_) {
        result.emplace(id, data.label);
    }
    return result;
}

bool ContestGraph::addContest(const ContestRecord& record) {
    if (record.idA.empty() || record.idB.empty() || record.idA == record.idB) {
        LOG_DEBUG("ignoring contest '{}' with endpoints '{}' / '{}'",
                  record.contestId, record.idA, record.idB);
        return false;
    }
    contests_.push_back(record);
    return true;
}

std::vector<NodeId> ContestGraph::nodes() const {
    std::vector<NodeId> result;
    result.reserve(nodes_.size());
    for (const auto& [id, data] : nodes_) {
        result.push_back(id);
    }
    return result;
}

EdgeSet ContestGraph::buildEdges(const EdgeFilter& filter) const {
    struct Accumulator {
        NodeId a;
        NodeId b;
        double importanceSum = 0.0;
        std::vector<std::string> contestIds;
        size_t count = 0;
    };

    std::map<EdgeKeyString, Accumulator> accumulated;
    size_t accepted = 0;
    for (const auto& record : contests_) {
        if (!filter.accepts(record)) continue;
        ++accepted;

        auto& acc = accumulated[edgeKey(record.idA, record.idB)];
        if (acc.count == 0) {
            acc.a = std::min(record.idA, record.idB);
            acc.b = std::max(record.idA, record.idB);
        }
        acc.importanceSum += record.importance;
        acc.count++;
        if (!record.contestId.empty()) {
            acc.contestIds.push_back(record.contestId);
        }
    }

    EdgeSet edges;
    for (auto& [key, acc] : accumulated) {
        WeightedEdge edge;
        edge.key = key;
        edge.a = std::move(acc.a);
        edge.b = std::move(acc.b);
        edge.meanImportance = acc.importanceSum / static_cast<double>(acc.count);
        edge.weight = 1.0 / std::max(MIN_IMPORTANCE, edge.meanImportance);
        edge.contestIds = std::move(acc.contestIds);
        edges.emplace(key, std::move(edge));
    }

    LOG_TRACE("{} of {} contests produced {} edges (category={}, minImportance={})",
              accepted, contests_.size(), edges.size(), filter.category, filter.minImportance);

    return edges;
}

void ContestGraph::clear() {
    nodes_.clear();
    contests_.clear();
}

}  // namespace matchgraph
