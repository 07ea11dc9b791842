/* In-memory DOT document model and its mapping to and from Graph. */
#pragma once

#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "graphconv/core/graph.hpp"

namespace graphconv::core {

using DotAttrs = std::map<std::string, std::string>;

// A node name, or a node group (an anonymous subgraph such as {a b}).
using DotEndpoint = std::variant<std::string, std::vector<std::string>>;

struct DotNode {
  std::string name;
  DotAttrs attrs {};
};

struct DotEdge {
  DotEndpoint source;
  DotEndpoint target;
  DotAttrs attrs {};
};

struct DotGraph {
  std::string name {};
  bool directed { false };
  bool strict { false };
  DotAttrs graph_attrs {};
  DotAttrs node_defaults {};
  DotAttrs edge_defaults {};
  std::vector<DotNode> nodes {};
  std::vector<DotEdge> edges {};
};

// digraph/graph by directedness; strict when g has no self-loops and is not
// a multigraph. Graph attributes and node/edge defaults come from the
// "graph", "node" and "edge" default blocks. Values are stringified;
// multigraph edges also carry their key as attribute "key".
[[nodiscard]] DotGraph to_dot(const Graph& g);

// Multigraph unless d.strict. Surrounding quotes are stripped from names,
// node statements named node, graph or edge are skipped, and group
// endpoints expand to every (source, target) pair. Graph attributes and
// node/edge defaults land in the matching default blocks; the "graph" block
// is always set, empty when d has no graph attributes. Attribute values
// stay strings.
[[nodiscard]] Graph from_dot(const DotGraph& d);

// DOT text for d. Names and values that are not plain identifiers or
// numerals are double-quoted.
[[nodiscard]] std::string render_dot(const DotGraph& d);

void write_dot(const Graph& g, std::ostream& out);

// Parses the first graph of a DOT document with Graphviz cgraph.
// Group endpoints arrive already expanded into one edge per pair. Node and
// edge attributes equal to their declared default are left to the default
// blocks; a named edge (DOT key) carries its name as attribute "key".
// Throws ValueError if the text is not valid DOT.
[[nodiscard]] DotGraph read_dot(std::string_view text);
[[nodiscard]] DotGraph read_dot(std::istream& in);

} // namespace graphconv::core
