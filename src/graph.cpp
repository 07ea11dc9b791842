/*
  Graph: insertion-ordered attribute graph.

  Edges live in one vector; a pair index maps node positions to the edges
  joining them, which gives simple graphs their merge-on-re-add behaviour
  and multigraphs their per-pair keys.
*/
#include "graphconv/core/graph.hpp"
#include "graphconv/core/error.hpp"

#include <stdexcept>

namespace graphconv::core {

std::size_t Graph::ensure_node(const NodeKey& n) {
  auto it = node_pos_.find(n);
  if (it != node_pos_.end()) return it->second;
  std::size_t pos = nodes_.size();
  nodes_.push_back(n);
  node_attrs_.emplace_back();
  node_pos_.emplace(n, pos);
  return pos;
}

std::pair<std::size_t, std::size_t> Graph::pair_key(std::size_t a, std::size_t b) const noexcept {
  if (!type_.directed && b < a) return {b, a};
  return {a, b};
}

const std::vector<std::size_t>* Graph::find_pair(const NodeKey& u, const NodeKey& v) const {
  auto iu = node_pos_.find(u);
  auto iv = node_pos_.find(v);
  if (iu == node_pos_.end() || iv == node_pos_.end()) return nullptr;
  auto it = pairs_.find(pair_key(iu->second, iv->second));
  if (it == pairs_.end()) return nullptr;
  return &it->second;
}

void Graph::add_node(const NodeKey& n, const AttrMap& attrs) {
  auto pos = ensure_node(n);
  for (const auto& [k, val] : attrs) node_attrs_[pos].insert_or_assign(k, val);
}

std::int64_t Graph::add_edge(const NodeKey& u, const NodeKey& v, const AttrMap& attrs) {
  auto pu = ensure_node(u);
  auto pv = ensure_node(v);
  auto& bucket = pairs_[pair_key(pu, pv)];
  if (!type_.multigraph && !bucket.empty()) {
    // Simple graphs hold one edge per pair; re-adding updates its data.
    auto& existing = edges_[bucket.front()].attrs;
    for (const auto& [k, val] : attrs) existing.insert_or_assign(k, val);
    return 0;
  }
  auto key = static_cast<std::int64_t>(bucket.size());
  bucket.push_back(edges_.size());
  edges_.push_back(Edge{u, v, key, attrs});
  if (pu == pv) ++selfloops_;
  return key;
}

void Graph::add_edges_from(std::span<const Edge> edges) {
  for (const auto& e : edges) (void)add_edge(e.u, e.v, e.attrs);
}

std::vector<Edge> Graph::selfloop_edges() const {
  std::vector<Edge> out;
  out.reserve(static_cast<std::size_t>(selfloops_));
  for (const auto& e : edges_) {
    if (e.u == e.v) out.push_back(e);
  }
  return out;
}

bool Graph::has_edge(const NodeKey& u, const NodeKey& v) const {
  const auto* bucket = find_pair(u, v);
  return bucket != nullptr && !bucket->empty();
}

std::vector<AttrMap> Graph::edge_data(const NodeKey& u, const NodeKey& v) const {
  std::vector<AttrMap> out;
  const auto* bucket = find_pair(u, v);
  if (!bucket) return out;
  out.reserve(bucket->size());
  for (auto idx : *bucket) out.push_back(edges_[idx].attrs);
  return out;
}

const AttrMap& Graph::node_attrs(const NodeKey& n) const {
  auto it = node_pos_.find(n);
  if (it == node_pos_.end()) {
    throw std::out_of_range("node not in graph: " + to_string(n));
  }
  return node_attrs_[it->second];
}

void Graph::set_default_block(std::string_view key, AttrMap attrs) {
  if (key != "graph" && key != "node" && key != "edge") {
    throw ValueError("default block must be one of graph, node, edge; got " + std::string(key));
  }
  default_blocks_.insert_or_assign(std::string(key), std::move(attrs));
}

const AttrMap* Graph::default_block(std::string_view key) const {
  auto it = default_blocks_.find(key);
  if (it == default_blocks_.end()) return nullptr;
  return &it->second;
}

} // namespace graphconv::core
