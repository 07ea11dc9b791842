/*
  DOT reader: parses DOT text with Graphviz cgraph and copies the parsed
  graph into a DotGraph document.
*/
#include "graphconv/core/dot.hpp"
#include "graphconv/core/error.hpp"

#include <graphviz/cgraph.h>

#include <iterator>
#include <memory>

namespace graphconv::core {

namespace {

struct AgraphCloser {
  void operator()(Agraph_t* g) const noexcept { agclose(g); }
};
using AgraphPtr = std::unique_ptr<Agraph_t, AgraphCloser>;

// cgraph names anonymous graphs and nodes with a leading '%'.
std::string object_name(void* obj) {
  const char* name = agnameof(obj);
  if (name == nullptr || name[0] == '%') return {};
  return name;
}

DotAttrs declared_defaults(Agraph_t* g, int kind) {
  DotAttrs out;
  for (Agsym_t* sym = agnxtattr(g, kind, nullptr); sym != nullptr; sym = agnxtattr(g, kind, sym)) {
    if (sym->defval != nullptr && sym->defval[0] != '\0') out.emplace(sym->name, sym->defval);
  }
  return out;
}

// Values set on obj that differ from the declared default.
DotAttrs own_attrs(Agraph_t* g, void* obj, int kind) {
  DotAttrs out;
  for (Agsym_t* sym = agnxtattr(g, kind, nullptr); sym != nullptr; sym = agnxtattr(g, kind, sym)) {
    const char* value = agxget(obj, sym);
    if (value == nullptr || value[0] == '\0') continue;
    if (sym->defval != nullptr && std::string_view(value) == sym->defval) continue;
    out.emplace(sym->name, value);
  }
  return out;
}

} // namespace

DotGraph read_dot(std::string_view text) {
  const std::string buffer(text);
  AgraphPtr g(agmemread(buffer.c_str()));
  if (!g) throw ValueError("DOT text could not be parsed");

  DotGraph d;
  d.name = object_name(g.get());
  d.directed = agisdirected(g.get()) != 0;
  d.strict = agisstrict(g.get()) != 0;

  for (Agsym_t* sym = agnxtattr(g.get(), AGRAPH, nullptr); sym != nullptr;
       sym = agnxtattr(g.get(), AGRAPH, sym)) {
    const char* value = agxget(g.get(), sym);
    if (value != nullptr && value[0] != '\0') d.graph_attrs.emplace(sym->name, value);
  }
  d.node_defaults = declared_defaults(g.get(), AGNODE);
  d.edge_defaults = declared_defaults(g.get(), AGEDGE);

  for (Agnode_t* n = agfstnode(g.get()); n != nullptr; n = agnxtnode(g.get(), n)) {
    d.nodes.push_back(DotNode{agnameof(n), own_attrs(g.get(), n, AGNODE)});
  }
  for (Agnode_t* n = agfstnode(g.get()); n != nullptr; n = agnxtnode(g.get(), n)) {
    for (Agedge_t* e = agfstout(g.get(), n); e != nullptr; e = agnxtout(g.get(), e)) {
      DotEdge de{std::string(agnameof(agtail(e))), std::string(agnameof(aghead(e))),
                 own_attrs(g.get(), e, AGEDGE)};
      auto key = object_name(e);
      if (!key.empty()) de.attrs.insert_or_assign("key", key);
      d.edges.push_back(std::move(de));
    }
  }
  return d;
}

DotGraph read_dot(std::istream& in) {
  std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  return read_dot(text);
}

} // namespace graphconv::core
