#include "matchgraph/core/EdgeKey.h"

namespace matchgraph {

EdgeKeyString edgeKey(const NodeId& a, const NodeId& b) {
    EdgeKeyString key;
    const NodeId& first = a < b ? a : b;
    const NodeId& second = a < b ? b : a;
    key.reserve(first.size() + EDGE_KEY_DELIMITER.size() + second.size());
    key += first;
    key += EDGE_KEY_DELIMITER;
    key += second;
    return key;
}

std::optional<std::pair<NodeId, NodeId>> parseEdgeKey(std::string_view key) {
    size_t pos = key.find(EDGE_KEY_DELIMITER);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view first = key.substr(0, pos);
    std::string_view second = key.substr(pos + EDGE_KEY_DELIMITER.size());

    if (first.empty() || second.empty() ||
        second.find(EDGE_KEY_DELIMITER) != std::string_view::npos) {
        return std::nullopt;
    }

    // "a___b" splits as ("a_", "b") or ("a", "_b"); neither can be trusted
    if (first.back() == '_' || second.front() == '_') {
        return std::nullopt;
    }

    return std::make_pair(NodeId(first), NodeId(second));
}

}  // namespace matchgraph
