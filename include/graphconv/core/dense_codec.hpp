/* Graph <-> dense adjacency matrix conversion. */
#pragma once

#include "graphconv/core/dense_matrix.hpp"
#include "graphconv/core/graph.hpp"
#include "graphconv/core/options.hpp"
#include "graphconv/core/types.hpp"

namespace graphconv::core {

// Dense adjacency matrix of g over opts.nodelist (or g.nodes()).
// - Edges touching nodes outside the ordering are dropped.
// - Multigraph parallel edges combine with opts.reducer; simple graphs
//   take the edge weight as-is.
// - Undirected edges fill both (i, j) and (j, i); a self-loop fills its
//   diagonal cell once, with its weight (not doubled).
// - Cells with no edge hold opts.nonedge. A real edge of weight 0 stays 0.
// Throws AmbiguousOrderingError, UnknownReducerError, TypeError for
// non-numeric weights, and ValueError when opts.nonedge or a weight is out
// of range for T.
// T is one of bool, int32, int64, uint8, uint32, uint64, float, double or
// complex<double> (explicitly instantiated in dense_codec.cpp).
template <typename T>
[[nodiscard]] DenseMatrix<T> to_dense_matrix(const Graph& g, const DenseEncodeOptions& opts = {});

// Graph with nodes 0..n-1 and one edge per nonzero cell, weighted by the
// cell value. With opts.parallel_edges, an integer matrix and a multigraph
// target, a cell of value k becomes k parallel edges of weight 1 instead.
// Undirected multigraph targets read only the upper triangle (row <= col),
// so A must be symmetric for them.
// Throws NonSquareMatrixError, and ValueError for a negative parallel
// edge count.
template <typename T>
[[nodiscard]] Graph from_dense_matrix(const DenseMatrix<T>& a, const DenseDecodeOptions& opts = {});

} // namespace graphconv::core
