/* Sparse matrix storage layouts and conversions between them.
 *
 * For Python developers: these mirror scipy.sparse csr/csc/coo/dok/lil.
 * SparseMatrix<T> is a closed std::variant over the five layouts; use
 * std::visit (like a match statement) or the helpers below.
 */
#pragma once

#include <map>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "graphconv/core/dense_matrix.hpp"
#include "graphconv/core/types.hpp"

namespace graphconv::core {

// Row-grouped: entries of row i are [indptr[i], indptr[i+1]) into
// indices (column numbers) and data. indptr has rows+1 entries.
template <typename T>
struct CsrMatrix {
  Index rows {0};
  Index cols {0};
  std::vector<Index> indptr {0};
  std::vector<Index> indices {};
  std::vector<T> data {};
};

// Column-grouped mirror of CsrMatrix: indices hold row numbers.
template <typename T>
struct CscMatrix {
  Index rows {0};
  Index cols {0};
  std::vector<Index> indptr {0};
  std::vector<Index> indices {};
  std::vector<T> data {};
};

// Coordinate triples (row[k], col[k], data[k]). Duplicates are allowed and
// mean the sum of their values.
template <typename T>
struct CooMatrix {
  Index rows {0};
  Index cols {0};
  std::vector<Index> row {};
  std::vector<Index> col {};
  std::vector<T> data {};
};

// (row, col) -> value mapping.
template <typename T>
struct DokMatrix {
  Index rows {0};
  Index cols {0};
  std::map<std::pair<Index, Index>, T> entries {};
};

// Per-row column lists and value lists.
template <typename T>
struct LilMatrix {
  Index rows {0};
  Index cols {0};
  std::vector<std::vector<Index>> row_cols {};
  std::vector<std::vector<T>> row_data {};
};

template <typename T>
using SparseMatrix = std::variant<CsrMatrix<T>, CscMatrix<T>, CooMatrix<T>, DokMatrix<T>, LilMatrix<T>>;

template <typename T>
[[nodiscard]] SparseFormat format_of(const SparseMatrix<T>& a) noexcept {
  return std::visit([](const auto& m) {
    using M = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<M, CsrMatrix<T>>) return SparseFormat::Csr;
    else if constexpr (std::is_same_v<M, CscMatrix<T>>) return SparseFormat::Csc;
    else if constexpr (std::is_same_v<M, CooMatrix<T>>) return SparseFormat::Coo;
    else if constexpr (std::is_same_v<M, DokMatrix<T>>) return SparseFormat::Dok;
    else return SparseFormat::Lil;
  }, a);
}

template <typename T>
[[nodiscard]] std::pair<Index, Index> shape_of(const SparseMatrix<T>& a) noexcept {
  return std::visit([](const auto& m) { return std::pair<Index, Index>{m.rows, m.cols}; }, a);
}

// Throws std::invalid_argument for inconsistent array lengths or offsets
// and std::out_of_range for coordinates outside the shape.
template <typename T>
void validate_sparse(const SparseMatrix<T>& a);

template <typename T>
[[nodiscard]] CooMatrix<T> to_coo(const LilMatrix<T>& a);
template <typename T>
[[nodiscard]] CooMatrix<T> to_coo(const SparseMatrix<T>& a);

// Converts to the requested layout. Conversions out of COO sum duplicate
// coordinates (and sort them); COO -> COO keeps the triples as they are.
template <typename T>
[[nodiscard]] SparseMatrix<T> as_format(const SparseMatrix<T>& a, SparseFormat format);

// Dense copy; duplicate coordinates are summed.
template <typename T>
[[nodiscard]] DenseMatrix<T> to_dense(const SparseMatrix<T>& a);

// Calls fn(row, col, value) for every stored entry without materialising a
// triple list. CSR walks rows, CSC walks columns, COO passes its triples
// through and DOK walks its mapping; any other layout is converted to COO
// first. a must be well-formed (see validate_sparse).
template <typename T, typename F>
void for_each_triple(const SparseMatrix<T>& a, F&& fn) {
  std::visit([&fn](const auto& m) {
    using M = std::decay_t<decltype(m)>;
    if constexpr (std::is_same_v<M, CsrMatrix<T>>) {
      for (Index i = 0; i < m.rows; ++i) {
        auto s = static_cast<std::size_t>(m.indptr[static_cast<std::size_t>(i)]);
        auto e = static_cast<std::size_t>(m.indptr[static_cast<std::size_t>(i) + 1]);
        for (std::size_t k = s; k < e; ++k) fn(i, m.indices[k], static_cast<T>(m.data[k]));
      }
    } else if constexpr (std::is_same_v<M, CscMatrix<T>>) {
      for (Index j = 0; j < m.cols; ++j) {
        auto s = static_cast<std::size_t>(m.indptr[static_cast<std::size_t>(j)]);
        auto e = static_cast<std::size_t>(m.indptr[static_cast<std::size_t>(j) + 1]);
        for (std::size_t k = s; k < e; ++k) fn(m.indices[k], j, static_cast<T>(m.data[k]));
      }
    } else if constexpr (std::is_same_v<M, CooMatrix<T>>) {
      for (std::size_t k = 0; k < m.data.size(); ++k) fn(m.row[k], m.col[k], static_cast<T>(m.data[k]));
    } else if constexpr (std::is_same_v<M, DokMatrix<T>>) {
      for (const auto& [rc, v] : m.entries) fn(rc.first, rc.second, v);
    } else {
      const CooMatrix<T> coo = to_coo(m);
      for (std::size_t k = 0; k < coo.data.size(); ++k) fn(coo.row[k], coo.col[k], static_cast<T>(coo.data[k]));
    }
  }, a);
}

// (row, col, value) triples of a, in for_each_triple order.
template <typename T>
struct Triple {
  Index row {0};
  Index col {0};
  T value {};
};

template <typename T>
[[nodiscard]] std::vector<Triple<T>> sparse_triples(const SparseMatrix<T>& a) {
  std::vector<Triple<T>> out;
  for_each_triple(a, [&out](Index r, Index c, T v) { out.push_back(Triple<T>{r, c, v}); });
  return out;
}

} // namespace graphconv::core
