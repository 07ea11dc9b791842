#include "graphconv/core/node_index.hpp"
#include "graphconv/core/error.hpp"

namespace graphconv::core {

NodeIndex NodeIndex::build(std::span<const NodeKey> nodes) {
  NodeIndex idx;
  idx.nodes_.assign(nodes.begin(), nodes.end());
  idx.pos_.reserve(nodes.size());
  for (std::size_t i = 0; i < nodes.size(); ++i) {
    idx.pos_.emplace(nodes[i], static_cast<Index>(i));
  }
  if (idx.pos_.size() != idx.nodes_.size()) {
    throw AmbiguousOrderingError("Ambiguous ordering: nodelist contained duplicates");
  }
  return idx;
}

std::optional<Index> NodeIndex::position(const NodeKey& n) const {
  auto it = pos_.find(n);
  if (it == pos_.end()) return std::nullopt;
  return it->second;
}

NodeIndex resolve_ordering(const Graph& g, const std::optional<std::vector<NodeKey>>& nodelist) {
  if (nodelist) return NodeIndex::build(*nodelist);
  return NodeIndex::build(g.nodes());
}

} // namespace graphconv::core
