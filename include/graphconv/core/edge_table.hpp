/* Row-oriented edge tables and labeled adjacency frames. */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "graphconv/core/dense_matrix.hpp"
#include "graphconv/core/graph.hpp"
#include "graphconv/core/options.hpp"
#include "graphconv/core/types.hpp"

namespace graphconv::core {

// Table with named columns; every row holds one cell per column.
struct EdgeTable {
  std::vector<std::string> columns {};
  std::vector<std::vector<AttrValue>> rows {};
};

// Which non-endpoint columns become edge attributes.
struct EdgeAttrSelection {
  enum class Mode { None, All, Named };
  Mode mode { Mode::None };
  std::vector<std::string> names {};

  static EdgeAttrSelection none() { return {}; }
  static EdgeAttrSelection all() { return {Mode::All, {}}; }
  static EdgeAttrSelection named(std::vector<std::string> cols) { return {Mode::Named, std::move(cols)}; }
};

// One edge per row, from the source column's node to the target column's
// node. Source and target cells must be integers or strings.
// Throws UnknownColumnError for a missing column name, ValueError for a
// duplicated column name or a row of the wrong width, TypeError for an
// unusable node cell.
[[nodiscard]] Graph from_edge_table(const EdgeTable& table,
                                    std::string_view source,
                                    std::string_view target,
                                    const EdgeAttrSelection& edge_attr = EdgeAttrSelection::none(),
                                    GraphType create_using = kGraph);

// Adjacency matrix with its node ordering as row and column labels.
struct AdjacencyFrame {
  std::vector<NodeKey> labels {};
  DenseMatrix<double> data {};
};

// Same semantics and errors as to_dense_matrix<double>.
[[nodiscard]] AdjacencyFrame to_adjacency_frame(const Graph& g, const DenseEncodeOptions& opts = {});

} // namespace graphconv::core
