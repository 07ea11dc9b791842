/* Dense 2-D matrix with row-major or column-major storage. */
#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <vector>

#include "graphconv/core/types.hpp"

namespace graphconv::core {

// Storage is a plain heap array rather than std::vector so that
// DenseMatrix<bool> hands out real bool references and contiguous spans.
template <typename T>
class DenseMatrix {
public:
  DenseMatrix() = default;
  DenseMatrix(Index rows, Index cols, T fill = T{}, MatrixOrder order = MatrixOrder::RowMajor)
    : rows_(rows), cols_(cols), order_(order) {
    if (rows < 0 || cols < 0) throw std::invalid_argument("matrix dimensions must be >= 0");
    size_ = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
    data_ = std::make_unique<T[]>(size_);
    std::fill_n(data_.get(), size_, fill);
  }
  DenseMatrix(const DenseMatrix& other)
    : rows_(other.rows_), cols_(other.cols_), order_(other.order_), size_(other.size_),
      data_(std::make_unique<T[]>(other.size_)) {
    std::copy_n(other.data_.get(), size_, data_.get());
  }
  DenseMatrix& operator=(const DenseMatrix& other) {
    if (this != &other) {
      DenseMatrix tmp(other);
      *this = std::move(tmp);
    }
    return *this;
  }
  DenseMatrix(DenseMatrix&&) noexcept = default;
  DenseMatrix& operator=(DenseMatrix&&) noexcept = default;
  ~DenseMatrix() noexcept = default;

  // Builds a row-major matrix from nested rows; all rows must be equal length.
  [[nodiscard]] static DenseMatrix from_rows(const std::vector<std::vector<T>>& rows) {
    Index r = static_cast<Index>(rows.size());
    Index c = rows.empty() ? 0 : static_cast<Index>(rows.front().size());
    DenseMatrix m(r, c);
    for (Index i = 0; i < r; ++i) {
      const auto& row = rows[static_cast<std::size_t>(i)];
      if (static_cast<Index>(row.size()) != c) {
        throw std::invalid_argument("all matrix rows must have the same length");
      }
      for (Index j = 0; j < c; ++j) m.at(i, j) = row[static_cast<std::size_t>(j)];
    }
    return m;
  }

  [[nodiscard]] Index rows() const noexcept { return rows_; }
  [[nodiscard]] Index cols() const noexcept { return cols_; }
  [[nodiscard]] MatrixOrder order() const noexcept { return order_; }
  [[nodiscard]] static constexpr ElementKind element_kind() noexcept { return element_kind_of<T>(); }

  [[nodiscard]] T& at(Index i, Index j) { return data_[offset(i, j)]; }
  [[nodiscard]] const T& at(Index i, Index j) const { return data_[offset(i, j)]; }

  // Raw storage in the matrix's own order.
  [[nodiscard]] std::span<const T> data() const noexcept { return {data_.get(), size_}; }
  [[nodiscard]] std::span<T> mutable_data() noexcept { return {data_.get(), size_}; }

private:
  [[nodiscard]] std::size_t offset(Index i, Index j) const {
    if (i < 0 || j < 0 || i >= rows_ || j >= cols_) {
      throw std::out_of_range("matrix index out of range");
    }
    auto ui = static_cast<std::size_t>(i);
    auto uj = static_cast<std::size_t>(j);
    if (order_ == MatrixOrder::RowMajor) return ui * static_cast<std::size_t>(cols_) + uj;
    return uj * static_cast<std::size_t>(rows_) + ui;
  }

  Index rows_ {0};
  Index cols_ {0};
  MatrixOrder order_ { MatrixOrder::RowMajor };
  std::size_t size_ {0};
  std::unique_ptr<T[]> data_ {};
};

} // namespace graphconv::core
