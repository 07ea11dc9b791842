/* Attribute-bearing graph container (simple or multi, directed or not). */
#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "graphconv/core/types.hpp"

namespace graphconv::core {

// One stored edge. For undirected graphs (u, v) keeps the orientation the
// edge was first added with. key numbers parallel edges between one pair.
struct Edge {
  NodeKey u;
  NodeKey v;
  std::int64_t key {0};
  AttrMap attrs {};
};

// Notes on iteration order:
// - nodes() returns nodes in insertion order.
// - edges() returns edges in insertion order; each undirected edge once.
// Both orders are stable, so conversions over the same graph are
// reproducible.
class Graph {
public:
  explicit Graph(GraphType type = kGraph) : type_(type) {}

  [[nodiscard]] bool is_directed() const noexcept { return type_.directed; }
  [[nodiscard]] bool is_multigraph() const noexcept { return type_.multigraph; }
  [[nodiscard]] GraphType type() const noexcept { return type_; }

  [[nodiscard]] std::span<const NodeKey> nodes() const noexcept { return nodes_; }
  [[nodiscard]] std::span<const Edge> edges() const noexcept { return edges_; }
  [[nodiscard]] std::vector<Edge> selfloop_edges() const;

  [[nodiscard]] std::int64_t number_of_nodes() const noexcept { return static_cast<std::int64_t>(nodes_.size()); }
  [[nodiscard]] std::int64_t number_of_edges() const noexcept { return static_cast<std::int64_t>(edges_.size()); }
  [[nodiscard]] std::int64_t number_of_selfloops() const noexcept { return selfloops_; }

  [[nodiscard]] bool has_node(const NodeKey& n) const { return node_pos_.count(n) != 0; }
  [[nodiscard]] bool has_edge(const NodeKey& u, const NodeKey& v) const;
  // Attributes of every edge joining u and v, in key order. Empty if none.
  [[nodiscard]] std::vector<AttrMap> edge_data(const NodeKey& u, const NodeKey& v) const;
  // Throws std::out_of_range if n is not a node.
  [[nodiscard]] const AttrMap& node_attrs(const NodeKey& n) const;

  // Adding an existing node merges attrs into its attributes.
  void add_node(const NodeKey& n, const AttrMap& attrs = {});
  // Adds missing endpoints. Returns the key of the edge that was written:
  // a fresh key on multigraphs, 0 on simple graphs where an existing edge
  // has attrs merged into it.
  std::int64_t add_edge(const NodeKey& u, const NodeKey& v, const AttrMap& attrs = {});
  void add_edges_from(std::span<const Edge> edges);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }
  [[nodiscard]] const AttrMap& graph_attrs() const noexcept { return graph_attrs_; }
  AttrMap& graph_attrs() noexcept { return graph_attrs_; }

  // Reserved default-attribute blocks "graph", "node" and "edge".
  // set_default_block throws ValueError for any other key.
  void set_default_block(std::string_view key, AttrMap attrs);
  [[nodiscard]] const AttrMap* default_block(std::string_view key) const;

private:
  struct PairHash {
    std::size_t operator()(const std::pair<std::size_t, std::size_t>& p) const noexcept {
      std::size_t h = std::hash<std::size_t>{}(p.first);
      h ^= std::hash<std::size_t>{}(p.second) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
      return h;
    }
  };

  std::size_t ensure_node(const NodeKey& n);
  [[nodiscard]] std::pair<std::size_t, std::size_t> pair_key(std::size_t a, std::size_t b) const noexcept;
  [[nodiscard]] const std::vector<std::size_t>* find_pair(const NodeKey& u, const NodeKey& v) const;

  GraphType type_ {};
  std::vector<NodeKey> nodes_ {};
  std::vector<AttrMap> node_attrs_ {};
  std::unordered_map<NodeKey, std::size_t, NodeKeyHash> node_pos_ {};
  std::vector<Edge> edges_ {};
  // (node position, node position) -> indices into edges_; undirected pairs
  // are stored with the smaller position first.
  std::unordered_map<std::pair<std::size_t, std::size_t>, std::vector<std::size_t>, PairHash> pairs_ {};
  std::int64_t selfloops_ {0};

  std::string name_ {};
  AttrMap graph_attrs_ {};
  std::map<std::string, AttrMap, std::less<>> default_blocks_ {};
};

} // namespace graphconv::core
