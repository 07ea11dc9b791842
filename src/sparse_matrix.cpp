/*
  Sparse layouts: validation and conversion.

  Every conversion goes through COO. Compressed layouts are built by a
  stable sort on (major, minor) followed by a merge of equal coordinates,
  so the result has sorted indices and no duplicates.
*/
#include "graphconv/core/sparse_matrix.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace graphconv::core {

namespace {

void check_shape(Index rows, Index cols) {
  if (rows < 0 || cols < 0) throw std::invalid_argument("sparse matrix dimensions must be >= 0");
}

void check_coord(Index r, Index c, Index rows, Index cols) {
  if (r < 0 || c < 0 || r >= rows || c >= cols) {
    throw std::out_of_range("sparse entry (" + std::to_string(r) + ", " + std::to_string(c) +
                            ") out of range of the matrix shape");
  }
}

void check_offsets(const std::vector<Index>& indptr, Index n_major, std::size_t nnz) {
  if (indptr.size() != static_cast<std::size_t>(n_major) + 1) {
    throw std::invalid_argument("indptr must have one entry per row/column plus one");
  }
  if (indptr.front() != 0 || static_cast<std::size_t>(indptr.back()) != nnz) {
    throw std::invalid_argument("indptr must start at 0 and end at the number of entries");
  }
  for (std::size_t i = 1; i < indptr.size(); ++i) {
    if (indptr[i] < indptr[i - 1]) throw std::invalid_argument("indptr must be non-decreasing");
  }
}

// Sorted, duplicate-free (major, minor, value) entries of a COO matrix.
template <typename T>
struct Compressed {
  std::vector<Index> indptr;
  std::vector<Index> indices;
  std::vector<T> data;
};

template <typename T>
Compressed<T> compress(const CooMatrix<T>& coo, bool by_row) {
  const Index n_major = by_row ? coo.rows : coo.cols;
  const auto& maj = by_row ? coo.row : coo.col;
  const auto& mnr = by_row ? coo.col : coo.row;
  const std::size_t m = coo.data.size();

  std::vector<std::size_t> idx(m);
  std::iota(idx.begin(), idx.end(), 0);
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
    if (maj[a] != maj[b]) return maj[a] < maj[b];
    return mnr[a] < mnr[b];
  });

  Compressed<T> out;
  out.indptr.assign(static_cast<std::size_t>(n_major) + 1, 0);
  out.indices.reserve(m);
  out.data.reserve(m);
  for (std::size_t k = 0; k < m;) {
    const auto i = idx[k];
    T sum = coo.data[i];
    std::size_t j = k + 1;
    while (j < m && maj[idx[j]] == maj[i] && mnr[idx[j]] == mnr[i]) {
      sum = static_cast<T>(sum + static_cast<T>(coo.data[idx[j]]));
      ++j;
    }
    out.indices.push_back(mnr[i]);
    out.data.push_back(sum);
    out.indptr[static_cast<std::size_t>(maj[i]) + 1]++;
    k = j;
  }
  for (std::size_t i = 1; i < out.indptr.size(); ++i) out.indptr[i] += out.indptr[i - 1];
  return out;
}

template <typename T>
CooMatrix<T> triples_to_coo(const SparseMatrix<T>& a) {
  auto [rows, cols] = shape_of(a);
  CooMatrix<T> coo;
  coo.rows = rows;
  coo.cols = cols;
  for_each_triple(a, [&coo](Index r, Index c, T v) {
    coo.row.push_back(r);
    coo.col.push_back(c);
    coo.data.push_back(v);
  });
  return coo;
}

} // namespace

template <typename T>
void validate_sparse(const SparseMatrix<T>& a) {
  std::visit([](const auto& m) {
    using M = std::decay_t<decltype(m)>;
    check_shape(m.rows, m.cols);
    if constexpr (std::is_same_v<M, CsrMatrix<T>> || std::is_same_v<M, CscMatrix<T>>) {
      constexpr bool by_row = std::is_same_v<M, CsrMatrix<T>>;
      const Index n_major = by_row ? m.rows : m.cols;
      if (m.indices.size() != m.data.size()) {
        throw std::invalid_argument("indices and data must have the same length");
      }
      check_offsets(m.indptr, n_major, m.data.size());
      for (Index p = 0; p < n_major; ++p) {
        auto s = static_cast<std::size_t>(m.indptr[static_cast<std::size_t>(p)]);
        auto e = static_cast<std::size_t>(m.indptr[static_cast<std::size_t>(p) + 1]);
        for (std::size_t k = s; k < e; ++k) {
          if (by_row) check_coord(p, m.indices[k], m.rows, m.cols);
          else check_coord(m.indices[k], p, m.rows, m.cols);
        }
      }
    } else if constexpr (std::is_same_v<M, CooMatrix<T>>) {
      if (m.row.size() != m.data.size() || m.col.size() != m.data.size()) {
        throw std::invalid_argument("row, col, and data must have the same length");
      }
      for (std::size_t k = 0; k < m.data.size(); ++k) check_coord(m.row[k], m.col[k], m.rows, m.cols);
    } else if constexpr (std::is_same_v<M, DokMatrix<T>>) {
      for (const auto& kv : m.entries) check_coord(kv.first.first, kv.first.second, m.rows, m.cols);
    } else {
      if (m.row_cols.size() != static_cast<std::size_t>(m.rows) ||
          m.row_data.size() != static_cast<std::size_t>(m.rows)) {
        throw std::invalid_argument("lil matrix must have one column list and one data list per row");
      }
      for (std::size_t i = 0; i < m.row_cols.size(); ++i) {
        if (m.row_cols[i].size() != m.row_data[i].size()) {
          throw std::invalid_argument("lil column and data lists must have the same length");
        }
        for (auto c : m.row_cols[i]) check_coord(static_cast<Index>(i), c, m.rows, m.cols);
      }
    }
  }, a);
}

template <typename T>
CooMatrix<T> to_coo(const LilMatrix<T>& a) {
  CooMatrix<T> coo;
  coo.rows = a.rows;
  coo.cols = a.cols;
  for (std::size_t i = 0; i < a.row_cols.size(); ++i) {
    for (std::size_t k = 0; k < a.row_cols[i].size(); ++k) {
      coo.row.push_back(static_cast<Index>(i));
      coo.col.push_back(a.row_cols[i][k]);
      coo.data.push_back(a.row_data[i][k]);
    }
  }
  return coo;
}

template <typename T>
CooMatrix<T> to_coo(const SparseMatrix<T>& a) {
  if (const auto* coo = std::get_if<CooMatrix<T>>(&a)) return *coo;
  if (const auto* lil = std::get_if<LilMatrix<T>>(&a)) return to_coo(*lil);
  return triples_to_coo(a);
}

template <typename T>
SparseMatrix<T> as_format(const SparseMatrix<T>& a, SparseFormat format) {
  CooMatrix<T> coo = to_coo(a);
  switch (format) {
    case SparseFormat::Coo:
      return coo;
    case SparseFormat::Csr: {
      auto c = compress(coo, /*by_row=*/true);
      return CsrMatrix<T>{coo.rows, coo.cols, std::move(c.indptr), std::move(c.indices), std::move(c.data)};
    }
    case SparseFormat::Csc: {
      auto c = compress(coo, /*by_row=*/false);
      return CscMatrix<T>{coo.rows, coo.cols, std::move(c.indptr), std::move(c.indices), std::move(c.data)};
    }
    case SparseFormat::Dok: {
      DokMatrix<T> dok{coo.rows, coo.cols, {}};
      for (std::size_t k = 0; k < coo.data.size(); ++k) {
        auto [it, inserted] = dok.entries.try_emplace({coo.row[k], coo.col[k]}, coo.data[k]);
        if (!inserted) it->second = static_cast<T>(it->second + static_cast<T>(coo.data[k]));
      }
      return dok;
    }
    case SparseFormat::Lil: {
      auto c = compress(coo, /*by_row=*/true);
      LilMatrix<T> lil;
      lil.rows = coo.rows;
      lil.cols = coo.cols;
      lil.row_cols.resize(static_cast<std::size_t>(coo.rows));
      lil.row_data.resize(static_cast<std::size_t>(coo.rows));
      for (std::size_t i = 0; i < lil.row_cols.size(); ++i) {
        auto s = static_cast<std::size_t>(c.indptr[i]);
        auto e = static_cast<std::size_t>(c.indptr[i + 1]);
        lil.row_cols[i].assign(c.indices.begin() + static_cast<std::ptrdiff_t>(s),
                               c.indices.begin() + static_cast<std::ptrdiff_t>(e));
        lil.row_data[i].assign(c.data.begin() + static_cast<std::ptrdiff_t>(s),
                               c.data.begin() + static_cast<std::ptrdiff_t>(e));
      }
      return lil;
    }
  }
  throw std::invalid_argument("unknown sparse format");
}

template <typename T>
DenseMatrix<T> to_dense(const SparseMatrix<T>& a) {
  auto [rows, cols] = shape_of(a);
  DenseMatrix<T> d(rows, cols);
  for_each_triple(a, [&d](Index r, Index c, T v) {
    d.at(r, c) = static_cast<T>(d.at(r, c) + v);
  });
  return d;
}

template void validate_sparse<bool>(const SparseMatrix<bool>&);
template void validate_sparse<std::int32_t>(const SparseMatrix<std::int32_t>&);
template void validate_sparse<std::int64_t>(const SparseMatrix<std::int64_t>&);
template void validate_sparse<std::uint8_t>(const SparseMatrix<std::uint8_t>&);
template void validate_sparse<std::uint32_t>(const SparseMatrix<std::uint32_t>&);
template void validate_sparse<std::uint64_t>(const SparseMatrix<std::uint64_t>&);
template void validate_sparse<float>(const SparseMatrix<float>&);
template void validate_sparse<double>(const SparseMatrix<double>&);
template void validate_sparse<std::complex<double>>(const SparseMatrix<std::complex<double>>&);

template CooMatrix<bool> to_coo<bool>(const LilMatrix<bool>&);
template CooMatrix<std::int32_t> to_coo<std::int32_t>(const LilMatrix<std::int32_t>&);
template CooMatrix<std::int64_t> to_coo<std::int64_t>(const LilMatrix<std::int64_t>&);
template CooMatrix<std::uint8_t> to_coo<std::uint8_t>(const LilMatrix<std::uint8_t>&);
template CooMatrix<std::uint32_t> to_coo<std::uint32_t>(const LilMatrix<std::uint32_t>&);
template CooMatrix<std::uint64_t> to_coo<std::uint64_t>(const LilMatrix<std::uint64_t>&);
template CooMatrix<float> to_coo<float>(const LilMatrix<float>&);
template CooMatrix<double> to_coo<double>(const LilMatrix<double>&);
template CooMatrix<std::complex<double>> to_coo<std::complex<double>>(const LilMatrix<std::complex<double>>&);

template CooMatrix<bool> to_coo<bool>(const SparseMatrix<bool>&);
template CooMatrix<std::int32_t> to_coo<std::int32_t>(const SparseMatrix<std::int32_t>&);
template CooMatrix<std::int64_t> to_coo<std::int64_t>(const SparseMatrix<std::int64_t>&);
template CooMatrix<std::uint8_t> to_coo<std::uint8_t>(const SparseMatrix<std::uint8_t>&);
template CooMatrix<std::uint32_t> to_coo<std::uint32_t>(const SparseMatrix<std::uint32_t>&);
template CooMatrix<std::uint64_t> to_coo<std::uint64_t>(const SparseMatrix<std::uint64_t>&);
template CooMatrix<float> to_coo<float>(const SparseMatrix<float>&);
template CooMatrix<double> to_coo<double>(const SparseMatrix<double>&);
template CooMatrix<std::complex<double>> to_coo<std::complex<double>>(const SparseMatrix<std::complex<double>>&);

template SparseMatrix<bool> as_format<bool>(const SparseMatrix<bool>&, SparseFormat);
template SparseMatrix<std::int32_t> as_format<std::int32_t>(const SparseMatrix<std::int32_t>&, SparseFormat);
template SparseMatrix<std::int64_t> as_format<std::int64_t>(const SparseMatrix<std::int64_t>&, SparseFormat);
template SparseMatrix<std::uint8_t> as_format<std::uint8_t>(const SparseMatrix<std::uint8_t>&, SparseFormat);
template SparseMatrix<std::uint32_t> as_format<std::uint32_t>(const SparseMatrix<std::uint32_t>&, SparseFormat);
template SparseMatrix<std::uint64_t> as_format<std::uint64_t>(const SparseMatrix<std::uint64_t>&, SparseFormat);
template SparseMatrix<float> as_format<float>(const SparseMatrix<float>&, SparseFormat);
template SparseMatrix<double> as_format<double>(const SparseMatrix<double>&, SparseFormat);
template SparseMatrix<std::complex<double>> as_format<std::complex<double>>(const SparseMatrix<std::complex<double>>&, SparseFormat);

template DenseMatrix<bool> to_dense<bool>(const SparseMatrix<bool>&);
template DenseMatrix<std::int32_t> to_dense<std::int32_t>(const SparseMatrix<std::int32_t>&);
template DenseMatrix<std::int64_t> to_dense<std::int64_t>(const SparseMatrix<std::int64_t>&);
template DenseMatrix<std::uint8_t> to_dense<std::uint8_t>(const SparseMatrix<std::uint8_t>&);
template DenseMatrix<std::uint32_t> to_dense<std::uint32_t>(const SparseMatrix<std::uint32_t>&);
template DenseMatrix<std::uint64_t> to_dense<std::uint64_t>(const SparseMatrix<std::uint64_t>&);
template DenseMatrix<float> to_dense<float>(const SparseMatrix<float>&);
template DenseMatrix<double> to_dense<double>(const SparseMatrix<double>&);
template DenseMatrix<std::complex<double>> to_dense<std::complex<double>>(const SparseMatrix<std::complex<double>>&);

} // namespace graphconv::core
