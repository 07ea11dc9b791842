/*
  Sparse adjacency codec.

  Encoding emits the triple list that scipy-style COO construction
  expects; summing duplicates is left to the layout conversion. Decoding
  consumes triples lazily through for_each_triple, so no intermediate
  triple list is built for CSR, CSC, COO or DOK input.
*/
#include "graphconv/core/sparse_codec.hpp"
#include "graphconv/core/error.hpp"
#include "graphconv/core/node_index.hpp"
#include "graphconv/core/weights.hpp"

#include <string>
#include <utility>

namespace graphconv::core {

template <typename T>
CooMatrix<T> to_sparse_triples(const Graph& g, const SparseEncodeOptions& opts) {
  const NodeIndex index = resolve_ordering(g, opts.nodelist);
  if (index.empty()) {
    throw EmptyGraphError("Graph has no nodes or edges");
  }
  const auto n = static_cast<Index>(index.size());
  CooMatrix<T> coo;
  coo.rows = n;
  coo.cols = n;
  if (g.number_of_edges() == 0) return coo;

  for (const auto& e : g.edges()) {
    auto pu = index.position(e.u);
    auto pv = index.position(e.v);
    if (!pu || !pv) continue;
    coo.row.push_back(*pu);
    coo.col.push_back(*pv);
    coo.data.push_back(attr_cast<T>(weight_of(e.attrs, opts.weight)));
  }
  if (g.is_directed()) return coo;

  // Symmetrise: (r, c, d) + (c, r, d).
  const std::size_t m = coo.data.size();
  coo.row.reserve(2 * m);
  coo.col.reserve(2 * m);
  coo.data.reserve(2 * m);
  for (std::size_t k = 0; k < m; ++k) {
    coo.row.push_back(coo.col[k]);
    coo.col.push_back(coo.row[k]);
    coo.data.push_back(static_cast<T>(coo.data[k]));
  }
  // Self-loops were mirrored onto themselves; cancel one copy.
  for (const auto& e : g.selfloop_edges()) {
    auto pu = index.position(e.u);
    if (!pu) continue;
    T w = attr_cast<T>(weight_of(e.attrs, opts.weight));
    coo.row.push_back(*pu);
    coo.col.push_back(*pu);
    if constexpr (std::is_same_v<T, bool>) {
      coo.data.push_back(w);
    } else {
      coo.data.push_back(static_cast<T>(T{} - w));
    }
  }
  return coo;
}

template <typename T>
SparseMatrix<T> to_sparse_matrix(const Graph& g, const SparseEncodeOptions& opts) {
  return as_format(SparseMatrix<T>{to_sparse_triples<T>(g, opts)}, opts.format);
}

template <typename T>
Graph from_sparse_matrix(const SparseMatrix<T>& a, const SparseDecodeOptions& opts) {
  auto [rows, cols] = shape_of(a);
  if (rows != cols) {
    throw NonSquareMatrixError("Adjacency matrix is not square. nx,ny=(" +
                               std::to_string(rows) + ", " + std::to_string(cols) + ")");
  }
  validate_sparse(a);
  Graph g(opts.create_using);
  for (Index i = 0; i < rows; ++i) g.add_node(NodeKey{i});

  const bool expand = is_integer_kind(element_kind_of<T>()) &&
                      g.is_multigraph() && opts.parallel_edges;
  const bool upper_only = g.is_multigraph() && !g.is_directed();
  const std::string& attr = opts.edge_attribute;

  for_each_triple(a, [&](Index r, Index c, T value) {
    if (upper_only && r > c) return;
    if (expand) {
      if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if constexpr (std::is_signed_v<T>) {
          if (value < 0) {
            throw ValueError("parallel edge count must be >= 0 at (" + std::to_string(r) +
                             ", " + std::to_string(c) + ")");
          }
        }
        for (T k = 0; k < value; ++k) {
          (void)g.add_edge(NodeKey{r}, NodeKey{c}, AttrMap{{attr, AttrValue{std::int64_t{1}}}});
        }
      }
      return;
    }
    (void)g.add_edge(NodeKey{r}, NodeKey{c}, AttrMap{{attr, to_attr_value(value)}});
  });
  return g;
}

template CooMatrix<bool> to_sparse_triples<bool>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<std::int32_t> to_sparse_triples<std::int32_t>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<std::int64_t> to_sparse_triples<std::int64_t>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<std::uint8_t> to_sparse_triples<std::uint8_t>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<std::uint32_t> to_sparse_triples<std::uint32_t>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<std::uint64_t> to_sparse_triples<std::uint64_t>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<float> to_sparse_triples<float>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<double> to_sparse_triples<double>(const Graph&, const SparseEncodeOptions&);
template CooMatrix<std::complex<double>> to_sparse_triples<std::complex<double>>(const Graph&, const SparseEncodeOptions&);

template SparseMatrix<bool> to_sparse_matrix<bool>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<std::int32_t> to_sparse_matrix<std::int32_t>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<std::int64_t> to_sparse_matrix<std::int64_t>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<std::uint8_t> to_sparse_matrix<std::uint8_t>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<std::uint32_t> to_sparse_matrix<std::uint32_t>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<std::uint64_t> to_sparse_matrix<std::uint64_t>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<float> to_sparse_matrix<float>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<double> to_sparse_matrix<double>(const Graph&, const SparseEncodeOptions&);
template SparseMatrix<std::complex<double>> to_sparse_matrix<std::complex<double>>(const Graph&, const SparseEncodeOptions&);

template Graph from_sparse_matrix<bool>(const SparseMatrix<bool>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<std::int32_t>(const SparseMatrix<std::int32_t>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<std::int64_t>(const SparseMatrix<std::int64_t>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<std::uint8_t>(const SparseMatrix<std::uint8_t>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<std::uint32_t>(const SparseMatrix<std::uint32_t>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<std::uint64_t>(const SparseMatrix<std::uint64_t>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<float>(const SparseMatrix<float>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<double>(const SparseMatrix<double>&, const SparseDecodeOptions&);
template Graph from_sparse_matrix<std::complex<double>>(const SparseMatrix<std::complex<double>>&, const SparseDecodeOptions&);

} // namespace graphconv::core
