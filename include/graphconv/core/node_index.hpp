/* Node ordering -> matrix position mapping. */
#pragma once

#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "graphconv/core/graph.hpp"
#include "graphconv/core/types.hpp"

namespace graphconv::core {

class NodeIndex {
public:
  // Assigns positions 0..n-1 in sequence order. Throws
  // AmbiguousOrderingError if the sequence repeats a node.
  [[nodiscard]] static NodeIndex build(std::span<const NodeKey> nodes);

  [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
  [[nodiscard]] bool contains(const NodeKey& n) const { return pos_.count(n) != 0; }
  // std::nullopt for nodes outside the ordering.
  [[nodiscard]] std::optional<Index> position(const NodeKey& n) const;
  [[nodiscard]] std::span<const NodeKey> nodes() const noexcept { return nodes_; }

private:
  std::vector<NodeKey> nodes_ {};
  std::unordered_map<NodeKey, Index, NodeKeyHash> pos_ {};
};

// Builds the index for an explicit ordering, or for g.nodes() when none is
// given.
[[nodiscard]] NodeIndex resolve_ordering(const Graph& g,
                                         const std::optional<std::vector<NodeKey>>& nodelist);

} // namespace graphconv::core
