#pragma once

#include "Types.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace matchgraph {

/// Delimiter between the two ids of a canonical edge key
inline constexpr std::string_view EDGE_KEY_DELIMITER = "__";

/// Build the canonical key of an unordered pair.
/// edgeKey("b", "a") == edgeKey("a", "b") == "a__b"
EdgeKeyString edgeKey(const NodeId& a, const NodeId& b);

/// Split a canonical key into its two ids.
/// Returns std::nullopt when the key does not contain exactly one delimiter
/// with a non-empty id on each side, or when an id touching the delimiter
/// starts or ends with '_' ("a___b" is either ("a_", "b") or ("a", "_b")).
/// Code that built the key should keep its ids instead of parsing it back.
std::optional<std::pair<NodeId, NodeId>> parseEdgeKey(std::string_view key);

}  // namespace matchgraph
