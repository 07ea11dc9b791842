/* Dense matrix of fixed-shape records with named, typed fields. */
#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "graphconv/core/types.hpp"

namespace graphconv::core {

class StructuredMatrix {
public:
  // Zero-initialised records. Throws ValueError for an empty or duplicated
  // field name and TypeError for a Record-kind field.
  StructuredMatrix(Index rows, Index cols, std::vector<FieldSpec> fields,
                   MatrixOrder order = MatrixOrder::RowMajor);

  [[nodiscard]] Index rows() const noexcept { return rows_; }
  [[nodiscard]] Index cols() const noexcept { return cols_; }
  [[nodiscard]] MatrixOrder order() const noexcept { return order_; }
  [[nodiscard]] std::span<const FieldSpec> fields() const noexcept { return fields_; }
  [[nodiscard]] static constexpr ElementKind element_kind() noexcept { return ElementKind::Record; }

  // Field values of the record at (i, j), in field order.
  [[nodiscard]] std::span<const AttrValue> record(Index i, Index j) const;
  // Throws std::out_of_range for an unknown field name.
  [[nodiscard]] const AttrValue& field(Index i, Index j, std::string_view name) const;
  // True when every field of the record equals its zero value.
  [[nodiscard]] bool is_zero(Index i, Index j) const;

  // Values are cast to their field kinds. Throws std::invalid_argument if
  // values.size() differs from the field count.
  void set_record(Index i, Index j, std::span<const AttrValue> values);

private:
  [[nodiscard]] std::size_t offset(Index i, Index j) const;

  Index rows_ {0};
  Index cols_ {0};
  MatrixOrder order_ { MatrixOrder::RowMajor };
  std::vector<FieldSpec> fields_ {};
  std::vector<AttrValue> zero_ {};
  std::vector<AttrValue> cells_ {};
};

// Casts v to the attribute type of kind (bool, int64, double or complex).
[[nodiscard]] AttrValue cast_to_kind(const AttrValue& v, ElementKind kind);

} // namespace graphconv::core
