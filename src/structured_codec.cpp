#include "graphconv/core/structured_codec.hpp"
#include "graphconv/core/error.hpp"
#include "graphconv/core/node_index.hpp"

#include <string>
#include <vector>

namespace graphconv::core {

StructuredMatrix to_structured_matrix(const Graph& g, const StructuredEncodeOptions& opts) {
  if (g.is_multigraph()) {
    throw UnsupportedForMultigraphError("not implemented for multigraph type");
  }
  const NodeIndex index = resolve_ordering(g, opts.nodelist);
  const auto n = static_cast<Index>(index.size());
  StructuredMatrix m(n, n, opts.fields, opts.order);

  std::vector<AttrValue> values;
  values.reserve(opts.fields.size());
  for (const auto& e : g.edges()) {
    auto pu = index.position(e.u);
    auto pv = index.position(e.v);
    if (!pu || !pv) continue;
    values.clear();
    for (const auto& f : opts.fields) {
      auto it = e.attrs.find(f.name);
      if (it == e.attrs.end()) {
        throw MissingFieldError("edge (" + to_string(e.u) + ", " + to_string(e.v) +
                                ") has no attribute '" + f.name + "'");
      }
      values.push_back(it->second);
    }
    m.set_record(*pu, *pv, values);
    if (!g.is_directed()) m.set_record(*pv, *pu, values);
  }
  return m;
}

Graph from_structured_matrix(const StructuredMatrix& a, const DenseDecodeOptions& opts) {
  if (a.rows() != a.cols()) {
    throw NonSquareMatrixError("Adjacency matrix is not square. nx,ny=(" +
                               std::to_string(a.rows()) + ", " + std::to_string(a.cols()) + ")");
  }
  const Index n = a.rows();
  Graph g(opts.create_using);
  for (Index i = 0; i < n; ++i) g.add_node(NodeKey{i});
  const bool upper_only = g.is_multigraph() && !g.is_directed();
  const auto fields = a.fields();

  for (Index i = 0; i < n; ++i) {
    for (Index j = 0; j < n; ++j) {
      if (upper_only && i > j) continue;
      if (a.is_zero(i, j)) continue;
      auto rec = a.record(i, j);
      AttrMap attrs;
      for (std::size_t f = 0; f < fields.size(); ++f) attrs.emplace(fields[f].name, rec[f]);
      (void)g.add_edge(NodeKey{i}, NodeKey{j}, attrs);
    }
  }
  return g;
}

} // namespace graphconv::core
