#include "graphconv/core/structured_matrix.hpp"
#include "graphconv/core/error.hpp"
#include "graphconv/core/weights.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

namespace graphconv::core {

AttrValue cast_to_kind(const AttrValue& v, ElementKind kind) {
  switch (kind) {
    case ElementKind::Bool: return AttrValue{attr_cast<bool>(v)};
    case ElementKind::Int: return AttrValue{attr_cast<std::int64_t>(v)};
    case ElementKind::UInt: return to_attr_value(attr_cast<std::uint64_t>(v));
    case ElementKind::Float: return AttrValue{attr_cast<double>(v)};
    case ElementKind::Complex: return AttrValue{attr_cast<std::complex<double>>(v)};
    case ElementKind::Record: break;
  }
  throw TypeError("record fields cannot nest records");
}

StructuredMatrix::StructuredMatrix(Index rows, Index cols, std::vector<FieldSpec> fields,
                                   MatrixOrder order)
  : rows_(rows), cols_(cols), order_(order), fields_(std::move(fields)) {
  if (rows < 0 || cols < 0) throw std::invalid_argument("matrix dimensions must be >= 0");
  std::unordered_set<std::string> seen;
  zero_.reserve(fields_.size());
  for (const auto& f : fields_) {
    if (f.name.empty()) throw ValueError("record field names must be non-empty");
    if (!seen.insert(f.name).second) throw ValueError("duplicate record field name: " + f.name);
    zero_.push_back(cast_to_kind(AttrValue{std::int64_t{0}}, f.kind));
  }
  auto records = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
  cells_.reserve(records * zero_.size());
  for (std::size_t r = 0; r < records; ++r) {
    cells_.insert(cells_.end(), zero_.begin(), zero_.end());
  }
}

std::size_t StructuredMatrix::offset(Index i, Index j) const {
  if (i < 0 || j < 0 || i >= rows_ || j >= cols_) {
    throw std::out_of_range("matrix index out of range");
  }
  auto ui = static_cast<std::size_t>(i);
  auto uj = static_cast<std::size_t>(j);
  std::size_t rec = (order_ == MatrixOrder::RowMajor)
      ? ui * static_cast<std::size_t>(cols_) + uj
      : uj * static_cast<std::size_t>(rows_) + ui;
  return rec * fields_.size();
}

std::span<const AttrValue> StructuredMatrix::record(Index i, Index j) const {
  return std::span<const AttrValue>(cells_).subspan(offset(i, j), fields_.size());
}

const AttrValue& StructuredMatrix::field(Index i, Index j, std::string_view name) const {
  auto base = offset(i, j);
  for (std::size_t f = 0; f < fields_.size(); ++f) {
    if (fields_[f].name == name) return cells_[base + f];
  }
  throw std::out_of_range("no record field named " + std::string(name));
}

bool StructuredMatrix::is_zero(Index i, Index j) const {
  auto base = offset(i, j);
  for (std::size_t f = 0; f < fields_.size(); ++f) {
    if (cells_[base + f] != zero_[f]) return false;
  }
  return true;
}

void StructuredMatrix::set_record(Index i, Index j, std::span<const AttrValue> values) {
  if (values.size() != fields_.size()) {
    throw std::invalid_argument("record value count does not match field count");
  }
  auto base = offset(i, j);
  // Cast everything first so a failing field leaves the record untouched.
  std::vector<AttrValue> cast;
  cast.reserve(values.size());
  for (std::size_t f = 0; f < fields_.size(); ++f) cast.push_back(cast_to_kind(values[f], fields_[f].kind));
  for (std::size_t f = 0; f < fields_.size(); ++f) cells_[base + f] = std::move(cast[f]);
}

} // namespace graphconv::core
