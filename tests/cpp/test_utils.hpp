#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <tuple>
#include <vector>
#include "graphconv/core/dense_matrix.hpp"
#include "graphconv/core/graph.hpp"
#include "graphconv/core/types.hpp"

namespace graphconv::core::test {

inline NodeKey key(std::int64_t i) { return NodeKey{i}; }
inline NodeKey skey(const char* s) { return NodeKey{std::string(s)}; }

inline AttrMap weight(double w) { return AttrMap{{"weight", AttrValue{w}}}; }
inline AttrMap weight_int(std::int64_t w) { return AttrMap{{"weight", AttrValue{w}}}; }

// (u, v, attrs) edge list over integer nodes.
using EdgeSpec = std::tuple<std::int64_t, std::int64_t, AttrMap>;

// Graph builders: nodes 0..num_nodes-1 are added first so node order is
// stable regardless of edge order.
inline Graph make_graph(GraphType type, std::int64_t num_nodes, const std::vector<EdgeSpec>& edges) {
  Graph g(type);
  for (std::int64_t i = 0; i < num_nodes; ++i) g.add_node(key(i));
  for (const auto& [u, v, attrs] : edges) (void)g.add_edge(key(u), key(v), attrs);
  return g;
}

inline Graph make_path_graph(std::int64_t n, GraphType type = kGraph) {
  std::vector<EdgeSpec> edges;
  for (std::int64_t i = 0; i + 1 < n; ++i) edges.emplace_back(i, i + 1, AttrMap{});
  return make_graph(type, n, edges);
}

// Multidigraph with 0->1 (weight 2), 1->0 (default), 2->2 (weight 3), 2->2 (default).
inline Graph make_weighted_multidigraph() {
  return make_graph(kMultiDiGraph, 3, {
      {0, 1, weight_int(2)},
      {1, 0, AttrMap{}},
      {2, 2, weight_int(3)},
      {2, 2, AttrMap{}}});
}

// Assertion helpers
template <typename T>
inline void expect_matrix_eq(const DenseMatrix<T>& m, const std::vector<std::vector<T>>& expected) {
  ASSERT_EQ(m.rows(), static_cast<Index>(expected.size()));
  for (Index i = 0; i < m.rows(); ++i) {
    ASSERT_EQ(m.cols(), static_cast<Index>(expected[static_cast<std::size_t>(i)].size()));
    for (Index j = 0; j < m.cols(); ++j) {
      EXPECT_EQ(m.at(i, j), expected[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)])
          << "mismatch at (" << i << ", " << j << ")";
    }
  }
}

// Numeric value of attribute name on the single edge u-v.
inline double single_edge_value(const Graph& g, std::int64_t u, std::int64_t v,
                                const std::string& name = "weight") {
  auto data = g.edge_data(key(u), key(v));
  EXPECT_EQ(data.size(), 1u) << "expected one edge " << u << "-" << v;
  if (data.empty()) return std::nan("");
  const auto& val = data.front().at(name);
  if (const auto* d = std::get_if<double>(&val)) return *d;
  if (const auto* i = std::get_if<std::int64_t>(&val)) return static_cast<double>(*i);
  if (const auto* b = std::get_if<bool>(&val)) return *b ? 1.0 : 0.0;
  ADD_FAILURE() << "edge attribute " << name << " is not real-valued";
  return std::nan("");
}

// Edges as sorted (u, v) integer pairs, for order-insensitive comparison.
inline std::vector<std::pair<std::int64_t, std::int64_t>> edge_pairs(const Graph& g) {
  std::vector<std::pair<std::int64_t, std::int64_t>> out;
  for (const auto& e : g.edges()) {
    out.emplace_back(std::get<std::int64_t>(e.u), std::get<std::int64_t>(e.v));
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace graphconv::core::test
