/*
  Pybind11 module exposing graphconv-core to Python.

  Notes:
    - Node keys are int or str; edge attributes are bool, int, float,
      complex or str (std::variant casters from pybind11/stl.h).
    - Dense matrices come back as NumPy arrays in C or Fortran order.
    - from_numpy_array dispatches on the array's dtype kind and itemsize;
      unsupported kinds raise TypeError through UnknownElementTypeError.
    - Library errors map to ValueError / TypeError by their base class.
*/
#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <cstring>
#include <type_traits>
#include <variant>

#include "graphconv/core/dense_codec.hpp"
#include "graphconv/core/dot.hpp"
#include "graphconv/core/error.hpp"
#include "graphconv/core/graph.hpp"
#include "graphconv/core/options.hpp"
#include "graphconv/core/sparse_codec.hpp"
#include "graphconv/core/types.hpp"
#include "graphconv/core/weights.hpp"

namespace py = pybind11;
using namespace graphconv::core;

namespace {

std::optional<std::vector<NodeKey>> as_nodelist(const py::object& obj) {
  if (obj.is_none()) return std::nullopt;
  return py::cast<std::vector<NodeKey>>(obj);
}

std::optional<std::string> as_weight_key(const py::object& obj) {
  if (obj.is_none()) return std::nullopt;
  return py::cast<std::string>(obj);
}

MatrixOrder parse_order(const std::string& order) {
  if (order == "C") return MatrixOrder::RowMajor;
  if (order == "F") return MatrixOrder::ColMajor;
  throw py::value_error("order must be 'C' or 'F'");
}

// Copies a 2-D array of T into a row-major DenseMatrix<T> honouring strides.
template <typename T>
DenseMatrix<T> dense_from_buffer(const py::buffer_info& buf) {
  DenseMatrix<T> m(buf.shape[0], buf.shape[1]);
  const auto* base = static_cast<const char*>(buf.ptr);
  for (py::ssize_t i = 0; i < buf.shape[0]; ++i) {
    for (py::ssize_t j = 0; j < buf.shape[1]; ++j) {
      T v;
      std::memcpy(&v, base + i * buf.strides[0] + j * buf.strides[1], sizeof(T));
      m.at(i, j) = v;
    }
  }
  return m;
}

template <typename T>
Graph decode_dense(const py::array& arr, const DenseDecodeOptions& opts) {
  py::array_t<T, py::array::c_style | py::array::forcecast> typed(arr);
  auto buf = typed.request();
  return from_dense_matrix(dense_from_buffer<T>(buf), opts);
}

template <typename T>
py::array_t<T> to_numpy_1d(const std::vector<T>& v) {
  py::array_t<T> out(static_cast<py::ssize_t>(v.size()));
  if (!v.empty()) std::memcpy(out.mutable_data(), v.data(), v.size() * sizeof(T));
  return out;
}

template <typename T>
Graph decode_triples(Index rows, Index cols, const py::array& row, const py::array& col,
                     const py::array& data, const SparseDecodeOptions& opts) {
  auto r = py::array_t<Index, py::array::c_style | py::array::forcecast>(row);
  auto c = py::array_t<Index, py::array::c_style | py::array::forcecast>(col);
  auto d = py::array_t<T, py::array::c_style | py::array::forcecast>(data);
  if (r.ndim() != 1 || c.ndim() != 1 || d.ndim() != 1) {
    throw py::type_error("row, col and data must be 1-D arrays");
  }
  CooMatrix<T> coo;
  coo.rows = rows;
  coo.cols = cols;
  coo.row.assign(r.data(), r.data() + r.size());
  coo.col.assign(c.data(), c.data() + c.size());
  coo.data.assign(d.data(), d.data() + d.size());
  return from_sparse_matrix(SparseMatrix<T>{std::move(coo)}, opts);
}

py::list edges_to_list(const Graph& g, bool data) {
  py::list out;
  for (const auto& e : g.edges()) {
    if (data) out.append(py::make_tuple(e.u, e.v, e.attrs));
    else out.append(py::make_tuple(e.u, e.v));
  }
  return out;
}

} // namespace

PYBIND11_MODULE(_graphconv_core, m) {
  m.doc() = "graphconv-core C++ bindings";

  // Translators run newest-first, so base classes are registered before
  // the specific errors that derive from them.
  py::register_exception<ValueError>(m, "ConvertValueError", PyExc_ValueError);
  py::register_exception<TypeError>(m, "ConvertTypeError", PyExc_TypeError);
  py::register_exception<AmbiguousOrderingError>(m, "AmbiguousOrderingError", PyExc_ValueError);
  py::register_exception<NonSquareMatrixError>(m, "NonSquareMatrixError", PyExc_ValueError);
  py::register_exception<UnsupportedForMultigraphError>(m, "UnsupportedForMultigraphError", PyExc_TypeError);
  py::register_exception<UnknownReducerError>(m, "UnknownReducerError", PyExc_ValueError);
  py::register_exception<EmptyGraphError>(m, "EmptyGraphError", PyExc_ValueError);
  py::register_exception<UnknownElementTypeError>(m, "UnknownElementTypeError", PyExc_TypeError);
  py::register_exception<MissingFieldError>(m, "MissingFieldError", PyExc_KeyError);
  py::register_exception<UnknownFormatError>(m, "UnknownFormatError", PyExc_ValueError);
  py::register_exception<UnknownColumnError>(m, "UnknownColumnError", PyExc_KeyError);

  py::enum_<Reducer>(m, "Reducer")
      .value("SUM", Reducer::Sum)
      .value("MIN", Reducer::Min)
      .value("MAX", Reducer::Max);

  py::class_<Graph>(m, "Graph")
      .def(py::init([](bool directed, bool multigraph) {
        return Graph(GraphType{directed, multigraph});
      }), py::kw_only(), py::arg("directed") = false, py::arg("multigraph") = false)
      .def("is_directed", &Graph::is_directed)
      .def("is_multigraph", &Graph::is_multigraph)
      .def("number_of_nodes", &Graph::number_of_nodes)
      .def("number_of_edges", &Graph::number_of_edges)
      .def("number_of_selfloops", &Graph::number_of_selfloops)
      .def("nodes", [](const Graph& g) {
        return std::vector<NodeKey>(g.nodes().begin(), g.nodes().end());
      })
      .def("edges", &edges_to_list, py::kw_only(), py::arg("data") = false)
      .def("add_node", [](Graph& g, const NodeKey& n, const AttrMap& attrs) { g.add_node(n, attrs); },
           py::arg("n"), py::arg("attrs") = AttrMap{})
      .def("add_edge", &Graph::add_edge, py::arg("u"), py::arg("v"), py::arg("attrs") = AttrMap{})
      .def("has_edge", &Graph::has_edge)
      .def("edge_data", &Graph::edge_data)
      .def_property("name", &Graph::name, &Graph::set_name);

  m.def("to_numpy_array",
        [](const Graph& g, py::object nodelist, const std::string& multigraph_weight,
           py::object weight, double nonedge, const std::string& order) {
          DenseEncodeOptions opts;
          opts.nodelist = as_nodelist(nodelist);
          opts.reducer = parse_reducer(multigraph_weight);
          opts.weight = as_weight_key(weight);
          opts.nonedge = nonedge;
          opts.order = parse_order(order);
          auto mat = to_dense_matrix<double>(g, opts);
          const auto n = static_cast<py::ssize_t>(mat.rows());
          const auto item = static_cast<py::ssize_t>(sizeof(double));
          std::vector<py::ssize_t> strides = (mat.order() == MatrixOrder::RowMajor)
              ? std::vector<py::ssize_t>{n * item, item}
              : std::vector<py::ssize_t>{item, n * item};
          py::array_t<double> out({n, n}, strides);
          auto data = mat.data();
          if (!data.empty()) std::memcpy(out.mutable_data(), data.data(), data.size() * sizeof(double));
          return out;
        },
        py::arg("G"), py::kw_only(), py::arg("nodelist") = py::none(),
        py::arg("multigraph_weight") = "sum", py::arg("weight") = "weight",
        py::arg("nonedge") = 0.0, py::arg("order") = "C");

  m.def("from_numpy_array",
        [](py::array a, bool parallel_edges, bool directed, bool multigraph) {
          if (a.ndim() != 2) throw py::type_error("adjacency matrix must be 2-D");
          DenseDecodeOptions opts;
          opts.parallel_edges = parallel_edges;
          opts.create_using = GraphType{directed, multigraph};
          const auto dt = a.dtype();
          switch (element_kind_from_code(dt.kind())) {
            case ElementKind::Bool: return decode_dense<bool>(a, opts);
            case ElementKind::Int:
              if (dt.itemsize() == 4) return decode_dense<std::int32_t>(a, opts);
              return decode_dense<std::int64_t>(a, opts);
            case ElementKind::UInt:
              if (dt.itemsize() == 1) return decode_dense<std::uint8_t>(a, opts);
              if (dt.itemsize() == 4) return decode_dense<std::uint32_t>(a, opts);
              return decode_dense<std::uint64_t>(a, opts);
            case ElementKind::Float:
              if (dt.itemsize() == 4) return decode_dense<float>(a, opts);
              return decode_dense<double>(a, opts);
            case ElementKind::Complex: return decode_dense<std::complex<double>>(a, opts);
            case ElementKind::Record: break;
          }
          throw py::type_error("structured dtypes are not supported by from_numpy_array");
        },
        py::arg("A"), py::kw_only(), py::arg("parallel_edges") = false,
        py::arg("directed") = false, py::arg("multigraph") = false);

  // Raw (row, col, data) triples, ready for scipy.sparse.coo_matrix.
  m.def("to_sparse_triples",
        [](const Graph& g, py::object nodelist, py::object weight) {
          SparseEncodeOptions opts;
          opts.nodelist = as_nodelist(nodelist);
          opts.weight = as_weight_key(weight);
          auto coo = to_sparse_triples<double>(g, opts);
          return py::make_tuple(to_numpy_1d(coo.row), to_numpy_1d(coo.col), to_numpy_1d(coo.data),
                                py::make_tuple(coo.rows, coo.cols));
        },
        py::arg("G"), py::kw_only(), py::arg("nodelist") = py::none(), py::arg("weight") = "weight");

  // Sparse adjacency in the requested layout as a dict of NumPy arrays:
  // csr/csc -> data, indices, indptr; coo -> data, row, col;
  // dok -> keys [(row, col)], values; lil -> rows, data (lists of lists).
  m.def("to_sparse_matrix",
        [](const Graph& g, py::object nodelist, py::object weight, const std::string& format) {
          SparseEncodeOptions opts;
          opts.nodelist = as_nodelist(nodelist);
          opts.weight = as_weight_key(weight);
          opts.format = parse_sparse_format(format);
          auto mat = to_sparse_matrix<double>(g, opts);
          py::dict out;
          out["format"] = std::string(to_string(format_of(mat)));
          auto [rows, cols] = shape_of(mat);
          out["shape"] = py::make_tuple(rows, cols);
          std::visit([&out](const auto& a) {
            using M = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<M, CsrMatrix<double>> || std::is_same_v<M, CscMatrix<double>>) {
              out["data"] = to_numpy_1d(a.data);
              out["indices"] = to_numpy_1d(a.indices);
              out["indptr"] = to_numpy_1d(a.indptr);
            } else if constexpr (std::is_same_v<M, CooMatrix<double>>) {
              out["data"] = to_numpy_1d(a.data);
              out["row"] = to_numpy_1d(a.row);
              out["col"] = to_numpy_1d(a.col);
            } else if constexpr (std::is_same_v<M, DokMatrix<double>>) {
              py::list keys;
              std::vector<double> values;
              for (const auto& [rc, v] : a.entries) {
                keys.append(py::make_tuple(rc.first, rc.second));
                values.push_back(v);
              }
              out["keys"] = keys;
              out["values"] = to_numpy_1d(values);
            } else {
              out["rows"] = a.row_cols;
              out["data"] = a.row_data;
            }
          }, mat);
          return out;
        },
        py::arg("G"), py::kw_only(), py::arg("nodelist") = py::none(), py::arg("weight") = "weight",
        py::arg("format") = "csr");

  m.def("from_sparse_triples",
        [](Index rows, Index cols, py::array row, py::array col, py::array data,
           bool parallel_edges, bool directed, bool multigraph, const std::string& edge_attribute) {
          SparseDecodeOptions opts;
          opts.parallel_edges = parallel_edges;
          opts.create_using = GraphType{directed, multigraph};
          opts.edge_attribute = edge_attribute;
          switch (element_kind_from_code(data.dtype().kind())) {
            case ElementKind::Int:
            case ElementKind::UInt:
              return decode_triples<std::int64_t>(rows, cols, row, col, data, opts);
            case ElementKind::Bool:
              return decode_triples<bool>(rows, cols, row, col, data, opts);
            case ElementKind::Complex:
              return decode_triples<std::complex<double>>(rows, cols, row, col, data, opts);
            case ElementKind::Float:
              return decode_triples<double>(rows, cols, row, col, data, opts);
            case ElementKind::Record: break;
          }
          throw py::type_error("structured dtypes are not supported by from_sparse_triples");
        },
        py::arg("rows"), py::arg("cols"), py::arg("row"), py::arg("col"), py::arg("data"),
        py::kw_only(), py::arg("parallel_edges") = false, py::arg("directed") = false,
        py::arg("multigraph") = false, py::arg("edge_attribute") = "weight");

  m.def("to_dot_string", [](const Graph& g) { return render_dot(to_dot(g)); }, py::arg("G"));
}
