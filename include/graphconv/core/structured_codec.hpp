/* Graph <-> structured (record) adjacency matrix conversion. */
#pragma once

#include "graphconv/core/graph.hpp"
#include "graphconv/core/options.hpp"
#include "graphconv/core/structured_matrix.hpp"

namespace graphconv::core {

// Record matrix whose cell (i, j) holds the attributes named by
// opts.fields for the edge (nodes[i], nodes[j]), zeros where there is no
// edge. Undirected edges fill both cells.
// Throws UnsupportedForMultigraphError for multigraphs, MissingFieldError
// when an edge lacks a field, AmbiguousOrderingError for a bad ordering.
[[nodiscard]] StructuredMatrix to_structured_matrix(const Graph& g,
                                                    const StructuredEncodeOptions& opts = {});

// Graph with nodes 0..n-1 and one edge per non-zero record, carrying every
// field as an attribute. opts.parallel_edges is ignored. Undirected
// multigraph targets read only row <= col.
// Throws NonSquareMatrixError.
[[nodiscard]] Graph from_structured_matrix(const StructuredMatrix& a,
                                           const DenseDecodeOptions& opts = {});

} // namespace graphconv::core
