/* Per-call option structs for the matrix and sparse codecs. */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "graphconv/core/types.hpp"

namespace graphconv::core {

// Dense adjacency encode.
struct DenseEncodeOptions {
  // Row/column order; std::nullopt uses Graph::nodes().
  std::optional<std::vector<NodeKey>> nodelist {};
  Reducer reducer { Reducer::Sum };
  // Edge attribute holding the weight; std::nullopt weighs every edge as 1.
  std::optional<std::string> weight { "weight" };
  // Written into every cell with no edge. Cast to the element type.
  double nonedge { 0.0 };
  MatrixOrder order { MatrixOrder::RowMajor };
};

// Dense and structured adjacency decode.
struct DenseDecodeOptions {
  // Integer cells expand into that many unit-weight parallel edges when the
  // target is a multigraph.
  bool parallel_edges { false };
  GraphType create_using { kGraph };
};

// Structured (record) matrix encode. Every edge must carry every field.
struct StructuredEncodeOptions {
  std::optional<std::vector<NodeKey>> nodelist {};
  std::vector<FieldSpec> fields { FieldSpec{"weight", ElementKind::Float} };
  MatrixOrder order { MatrixOrder::RowMajor };
};

struct SparseEncodeOptions {
  std::optional<std::vector<NodeKey>> nodelist {};
  std::optional<std::string> weight { "weight" };
  SparseFormat format { SparseFormat::Csr };
};

struct SparseDecodeOptions {
  bool parallel_edges { false };
  GraphType create_using { kGraph };
  std::string edge_attribute { "weight" };
};

} // namespace graphconv::core
