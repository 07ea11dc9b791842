/*
  Dense adjacency codec.

  Encoding accumulates into a buffer of optional cells: an empty cell is
  "no edge yet", which keeps min/max reduction over parallel edges from
  seeing a false zero and keeps a real zero-weight edge distinct from the
  nonedge value. Empty cells become nonedge in a final sweep.

  Decoding walks cells in row-major order, so edges come out sorted by
  (row, col).
*/
#include "graphconv/core/dense_codec.hpp"
#include "graphconv/core/error.hpp"
#include "graphconv/core/node_index.hpp"
#include "graphconv/core/weights.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace graphconv::core {

namespace {
template <typename T>
T nonedge_value(double nonedge) {
  if constexpr (!std::is_floating_point_v<T> && !is_complex_v<T>) {
    if (!std::isfinite(nonedge)) {
      throw ValueError("nonedge value " + std::to_string(nonedge) +
                       " is not representable in an integer or bool matrix");
    }
  }
  return attr_cast<T>(AttrValue{nonedge});
}
} // namespace

template <typename T>
DenseMatrix<T> to_dense_matrix(const Graph& g, const DenseEncodeOptions& opts) {
  check_reducer(opts.reducer);
  const NodeIndex index = resolve_ordering(g, opts.nodelist);
  const T nonedge = nonedge_value<T>(opts.nonedge);
  const auto n = static_cast<Index>(index.size());
  const auto un = static_cast<std::size_t>(n);
  const bool undirected = !g.is_directed();
  const bool multigraph = g.is_multigraph();

  std::vector<std::optional<T>> acc(un * un);
  for (const auto& e : g.edges()) {
    auto pu = index.position(e.u);
    auto pv = index.position(e.v);
    if (!pu || !pv) continue;  // induced subgraph over the ordering
    auto i = static_cast<std::size_t>(*pu);
    auto j = static_cast<std::size_t>(*pv);
    T w = attr_cast<T>(weight_of(e.attrs, opts.weight));
    auto& cell = acc[i * un + j];
    if (multigraph) {
      cell = combine(cell, w, opts.reducer);
    } else {
      cell = w;
    }
    if (undirected) acc[j * un + i] = cell;
  }

  DenseMatrix<T> m(n, n, nonedge, opts.order);
  for (Index i = 0; i < n; ++i) {
    for (Index j = 0; j < n; ++j) {
      const auto& cell = acc[static_cast<std::size_t>(i) * un + static_cast<std::size_t>(j)];
      if (cell) m.at(i, j) = *cell;
    }
  }
  return m;
}

template <typename T>
Graph from_dense_matrix(const DenseMatrix<T>& a, const DenseDecodeOptions& opts) {
  if (a.rows() != a.cols()) {
    throw NonSquareMatrixError("Adjacency matrix is not square. nx,ny=(" +
                               std::to_string(a.rows()) + ", " + std::to_string(a.cols()) + ")");
  }
  const Index n = a.rows();
  Graph g(opts.create_using);
  for (Index i = 0; i < n; ++i) g.add_node(NodeKey{i});

  const bool expand = is_integer_kind(element_kind_of<T>()) &&
                      g.is_multigraph() && opts.parallel_edges;
  const bool upper_only = g.is_multigraph() && !g.is_directed();

  for (Index i = 0; i < n; ++i) {
    for (Index j = 0; j < n; ++j) {
      const T& value = a.at(i, j);
      if (value == T{}) continue;
      if (upper_only && i > j) continue;
      if (expand) {
        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
          if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
              throw ValueError("parallel edge count must be >= 0 at (" + std::to_string(i) +
                               ", " + std::to_string(j) + ")");
            }
          }
          for (T k = 0; k < value; ++k) {
            (void)g.add_edge(NodeKey{i}, NodeKey{j}, AttrMap{{"weight", AttrValue{std::int64_t{1}}}});
          }
        }
      } else {
        (void)g.add_edge(NodeKey{i}, NodeKey{j}, AttrMap{{"weight", to_attr_value(value)}});
      }
    }
  }
  return g;
}

template DenseMatrix<bool> to_dense_matrix<bool>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<std::int32_t> to_dense_matrix<std::int32_t>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<std::int64_t> to_dense_matrix<std::int64_t>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<std::uint8_t> to_dense_matrix<std::uint8_t>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<std::uint32_t> to_dense_matrix<std::uint32_t>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<std::uint64_t> to_dense_matrix<std::uint64_t>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<float> to_dense_matrix<float>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<double> to_dense_matrix<double>(const Graph&, const DenseEncodeOptions&);
template DenseMatrix<std::complex<double>> to_dense_matrix<std::complex<double>>(const Graph&, const DenseEncodeOptions&);

template Graph from_dense_matrix<bool>(const DenseMatrix<bool>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<std::int32_t>(const DenseMatrix<std::int32_t>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<std::int64_t>(const DenseMatrix<std::int64_t>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<std::uint8_t>(const DenseMatrix<std::uint8_t>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<std::uint32_t>(const DenseMatrix<std::uint32_t>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<std::uint64_t>(const DenseMatrix<std::uint64_t>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<float>(const DenseMatrix<float>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<double>(const DenseMatrix<double>&, const DenseDecodeOptions&);
template Graph from_dense_matrix<std::complex<double>>(const DenseMatrix<std::complex<double>>&, const DenseDecodeOptions&);

} // namespace graphconv::core
