/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeKey: int | str (hashable, totally ordered)
 * - AttrValue: bool | int | float | complex | str
 * - AttrMap: an attribute dict (ordered by key for deterministic output)
 * - std::variant<A, B>: tagged union (like typing.Union, but the tag is checked)
 */
#pragma once

#include <complex>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace graphconv::core {

using NodeKey = std::variant<std::int64_t, std::string>;
using AttrValue = std::variant<bool, std::int64_t, double, std::complex<double>, std::string>;
using AttrMap = std::map<std::string, AttrValue>;

// Matrix row/column position assigned to a node.
using Index = std::int64_t;

struct NodeKeyHash {
  std::size_t operator()(const NodeKey& k) const noexcept {
    return std::hash<NodeKey>{}(k);
  }
};

// Graph flavour requested from a decoder (the create_using argument).
struct GraphType {
  bool directed { false };
  bool multigraph { false };

  friend bool operator==(const GraphType&, const GraphType&) = default;
};

inline constexpr GraphType kGraph { false, false };
inline constexpr GraphType kDiGraph { true, false };
inline constexpr GraphType kMultiGraph { false, true };
inline constexpr GraphType kMultiDiGraph { true, true };

// How parallel edge weights collapse into one matrix cell.
enum class Reducer {
  Sum = 1,
  Min = 2,
  Max = 3
};

// Storage order of a dense matrix.
enum class MatrixOrder {
  RowMajor = 1,  // C order
  ColMajor = 2   // Fortran order
};

// Kind of a matrix element, mirroring NumPy dtype kinds.
enum class ElementKind {
  Bool,
  Int,
  UInt,
  Float,
  Complex,
  Record
};

// One named field of a structured matrix record.
struct FieldSpec {
  std::string name;
  ElementKind kind { ElementKind::Float };
};

// Sparse storage layouts.
enum class SparseFormat {
  Csr,  // row-grouped
  Csc,  // column-grouped
  Coo,  // coordinate triples
  Dok,  // (row, col) -> value mapping
  Lil   // per-row lists; converted to COO before triple extraction
};

template <typename T> struct is_complex : std::false_type {};
template <typename T> struct is_complex<std::complex<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_complex_v = is_complex<T>::value;

template <typename T>
constexpr ElementKind element_kind_of() noexcept {
  if constexpr (std::is_same_v<T, bool>) {
    return ElementKind::Bool;
  } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
    return ElementKind::Int;
  } else if constexpr (std::is_integral_v<T>) {
    return ElementKind::UInt;
  } else if constexpr (std::is_floating_point_v<T>) {
    return ElementKind::Float;
  } else {
    static_assert(is_complex_v<T>, "unsupported matrix element type");
    return ElementKind::Complex;
  }
}

[[nodiscard]] constexpr bool is_integer_kind(ElementKind k) noexcept {
  return k == ElementKind::Int || k == ElementKind::UInt;
}

// Maps a NumPy dtype kind character (b, i, u, f, c, V) to an ElementKind.
// Throws UnknownElementTypeError for kinds with no attribute mapping.
[[nodiscard]] ElementKind element_kind_from_code(char code);

[[nodiscard]] std::string_view to_string(SparseFormat f) noexcept;

// Throws UnknownFormatError for names other than csr, csc, coo, dok, lil.
[[nodiscard]] SparseFormat parse_sparse_format(std::string_view name);

// String form used for DOT output and error messages.
[[nodiscard]] std::string to_string(const NodeKey& k);
[[nodiscard]] std::string to_string(const AttrValue& v);

} // namespace graphconv::core
