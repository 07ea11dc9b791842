/*
  DOT bridge: maps Graph onto a DotGraph document and back, and renders
  the document as DOT text. Parsing DOT text is not handled here.
*/
#include "graphconv/core/dot.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <string_view>

namespace graphconv::core {

namespace {

DotAttrs stringify(const AttrMap& attrs) {
  DotAttrs out;
  for (const auto& [k, v] : attrs) out.emplace(k, to_string(v));
  return out;
}

AttrMap to_attr_map(const DotAttrs& attrs) {
  AttrMap out;
  for (const auto& [k, v] : attrs) out.emplace(k, AttrValue{v});
  return out;
}

std::string strip_quotes(std::string_view s) {
  while (!s.empty() && s.front() == '"') s.remove_prefix(1);
  while (!s.empty() && s.back() == '"') s.remove_suffix(1);
  return std::string(s);
}

std::vector<std::string> endpoint_nodes(const DotEndpoint& ep) {
  if (const auto* name = std::get_if<std::string>(&ep)) return {strip_quotes(*name)};
  std::vector<std::string> out;
  for (const auto& n : std::get<std::vector<std::string>>(ep)) out.push_back(strip_quotes(n));
  return out;
}

bool is_keyword(std::string_view s) {
  static constexpr std::array<std::string_view, 6> kKeywords = {
      "node", "edge", "graph", "digraph", "subgraph", "strict"};
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kKeywords.begin(), kKeywords.end(), lower) != kKeywords.end();
}

bool is_identifier(std::string_view s) {
  if (s.empty()) return false;
  auto c0 = static_cast<unsigned char>(s.front());
  if (!(std::isalpha(c0) || c0 == '_')) return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

bool is_numeral(std::string_view s) {
  if (!s.empty() && s.front() == '-') s.remove_prefix(1);
  if (s.empty()) return false;
  bool digits = false;
  bool dot = false;
  for (char c : s) {
    if (c == '.') {
      if (dot) return false;
      dot = true;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
      digits = true;
    } else {
      return false;
    }
  }
  return digits;
}

std::string quote_id(std::string_view s) {
  if ((is_identifier(s) && !is_keyword(s)) || is_numeral(s)) return std::string(s);
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

void render_attr_list(std::ostream& os, const DotAttrs& attrs) {
  if (attrs.empty()) return;
  os << " [";
  bool first = true;
  for (const auto& [k, v] : attrs) {
    if (!first) os << ", ";
    os << quote_id(k) << '=' << quote_id(v);
    first = false;
  }
  os << ']';
}

void render_endpoint(std::ostream& os, const DotEndpoint& ep) {
  if (const auto* name = std::get_if<std::string>(&ep)) {
    os << quote_id(*name);
    return;
  }
  os << '{';
  const auto& group = std::get<std::vector<std::string>>(ep);
  for (std::size_t i = 0; i < group.size(); ++i) {
    if (i) os << ' ';
    os << quote_id(group[i]);
  }
  os << '}';
}

} // namespace

DotGraph to_dot(const Graph& g) {
  DotGraph d;
  d.name = g.name();
  d.directed = g.is_directed();
  d.strict = g.number_of_selfloops() == 0 && !g.is_multigraph();
  if (const auto* b = g.default_block("graph")) d.graph_attrs = stringify(*b);
  if (const auto* b = g.default_block("node")) d.node_defaults = stringify(*b);
  if (const auto* b = g.default_block("edge")) d.edge_defaults = stringify(*b);

  for (const auto& n : g.nodes()) d.nodes.push_back(DotNode{to_string(n), stringify(g.node_attrs(n))});
  for (const auto& e : g.edges()) {
    DotEdge de{to_string(e.u), to_string(e.v), stringify(e.attrs)};
    if (g.is_multigraph()) de.attrs.insert_or_assign("key", std::to_string(e.key));
    d.edges.push_back(std::move(de));
  }
  return d;
}

Graph from_dot(const DotGraph& d) {
  Graph g(GraphType{d.directed, !d.strict});
  auto name = strip_quotes(d.name);
  if (!name.empty()) g.set_name(name);

  for (const auto& n : d.nodes) {
    auto key = strip_quotes(n.name);
    if (key == "node" || key == "graph" || key == "edge") continue;
    g.add_node(NodeKey{key}, to_attr_map(n.attrs));
  }
  for (const auto& e : d.edges) {
    const auto attrs = to_attr_map(e.attrs);
    for (const auto& s : endpoint_nodes(e.source)) {
      for (const auto& t : endpoint_nodes(e.target)) {
        (void)g.add_edge(NodeKey{s}, NodeKey{t}, attrs);
      }
    }
  }

  g.set_default_block("graph", to_attr_map(d.graph_attrs));
  if (!d.node_defaults.empty()) g.set_default_block("node", to_attr_map(d.node_defaults));
  if (!d.edge_defaults.empty()) g.set_default_block("edge", to_attr_map(d.edge_defaults));
  return g;
}

std::string render_dot(const DotGraph& d) {
  std::ostringstream os;
  if (d.strict) os << "strict ";
  os << (d.directed ? "digraph" : "graph");
  if (!d.name.empty()) os << ' ' << quote_id(d.name);
  os << " {\n";
  for (const auto& [k, v] : d.graph_attrs) os << quote_id(k) << '=' << quote_id(v) << ";\n";
  if (!d.node_defaults.empty()) {
    os << "node";
    render_attr_list(os, d.node_defaults);
    os << ";\n";
  }
  if (!d.edge_defaults.empty()) {
    os << "edge";
    render_attr_list(os, d.edge_defaults);
    os << ";\n";
  }
  for (const auto& n : d.nodes) {
    os << quote_id(n.name);
    render_attr_list(os, n.attrs);
    os << ";\n";
  }
  const char* op = d.directed ? " -> " : " -- ";
  for (const auto& e : d.edges) {
    render_endpoint(os, e.source);
    os << op;
    render_endpoint(os, e.target);
    render_attr_list(os, e.attrs);
    os << ";\n";
  }
  os << "}\n";
  return os.str();
}

void write_dot(const Graph& g, std::ostream& out) {
  out << render_dot(to_dot(g));
}

} // namespace graphconv::core
