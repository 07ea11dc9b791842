/* Graph <-> sparse adjacency matrix conversion. */
#pragma once

#include "graphconv/core/graph.hpp"
#include "graphconv/core/options.hpp"
#include "graphconv/core/sparse_matrix.hpp"
#include "graphconv/core/types.hpp"

namespace graphconv::core {

// Raw adjacency triples of g over opts.nodelist (or g.nodes()), one per
// edge with both endpoints in the ordering, duplicates kept.
// Undirected graphs get every triple mirrored; since that counts a
// self-loop twice, each self-loop also adds a (i, i, -w) triple so the
// summed diagonal holds w. opts.format is ignored here.
// Throws EmptyGraphError when the ordering is empty and
// AmbiguousOrderingError when it repeats a node.
template <typename T>
[[nodiscard]] CooMatrix<T> to_sparse_triples(const Graph& g, const SparseEncodeOptions& opts = {});

// to_sparse_triples converted to opts.format (duplicates summed except
// for COO output).
template <typename T>
[[nodiscard]] SparseMatrix<T> to_sparse_matrix(const Graph& g, const SparseEncodeOptions& opts = {});

// Graph with nodes 0..n-1 and one edge per stored entry (explicit zeros
// included), its value under opts.edge_attribute. Integer matrices expand
// into unit-weight parallel edges under the same rule as
// from_dense_matrix, and undirected multigraph targets read only
// row <= col.
// Throws NonSquareMatrixError, std::invalid_argument / std::out_of_range
// for a malformed matrix, and ValueError for a negative parallel edge count.
template <typename T>
[[nodiscard]] Graph from_sparse_matrix(const SparseMatrix<T>& a, const SparseDecodeOptions& opts = {});

} // namespace graphconv::core
