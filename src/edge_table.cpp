#include "graphconv/core/edge_table.hpp"
#include "graphconv/core/dense_codec.hpp"
#include "graphconv/core/error.hpp"

#include <unordered_set>
#include <utility>

namespace graphconv::core {

namespace {
std::size_t column_of(const EdgeTable& table, std::string_view name) {
  for (std::size_t i = 0; i < table.columns.size(); ++i) {
    if (table.columns[i] == name) return i;
  }
  throw UnknownColumnError("no column named " + std::string(name));
}

NodeKey node_from_cell(const AttrValue& cell) {
  if (const auto* i = std::get_if<std::int64_t>(&cell)) return NodeKey{*i};
  if (const auto* s = std::get_if<std::string>(&cell)) return NodeKey{*s};
  throw TypeError("edge table node cells must be integers or strings, got " + to_string(cell));
}
} // namespace

Graph from_edge_table(const EdgeTable& table, std::string_view source, std::string_view target,
                      const EdgeAttrSelection& edge_attr, GraphType create_using) {
  std::unordered_set<std::string> seen;
  for (const auto& c : table.columns) {
    if (!seen.insert(c).second) throw ValueError("duplicate column name: " + c);
  }
  const std::size_t src_i = column_of(table, source);
  const std::size_t tar_i = column_of(table, target);

  // (attribute name, column position)
  std::vector<std::pair<std::string, std::size_t>> attr_cols;
  switch (edge_attr.mode) {
    case EdgeAttrSelection::Mode::None:
      break;
    case EdgeAttrSelection::Mode::All:
      for (std::size_t i = 0; i < table.columns.size(); ++i) {
        if (i != src_i && i != tar_i) attr_cols.emplace_back(table.columns[i], i);
      }
      break;
    case EdgeAttrSelection::Mode::Named:
      for (const auto& name : edge_attr.names) attr_cols.emplace_back(name, column_of(table, name));
      break;
  }

  Graph g(create_using);
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    if (row.size() != table.columns.size()) {
      throw ValueError("row " + std::to_string(r) + " has " + std::to_string(row.size()) +
                       " cells, expected " + std::to_string(table.columns.size()));
    }
    AttrMap attrs;
    for (const auto& [name, i] : attr_cols) attrs.insert_or_assign(name, row[i]);
    (void)g.add_edge(node_from_cell(row[src_i]), node_from_cell(row[tar_i]), attrs);
  }
  return g;
}

AdjacencyFrame to_adjacency_frame(const Graph& g, const DenseEncodeOptions& opts) {
  AdjacencyFrame frame;
  frame.data = to_dense_matrix<double>(g, opts);
  if (opts.nodelist) {
    frame.labels = *opts.nodelist;
  } else {
    auto nodes = g.nodes();
    frame.labels.assign(nodes.begin(), nodes.end());
  }
  return frame;
}

} // namespace graphconv::core
