/*
  Core type helpers: element kind mapping, enum names and string forms of
  node keys and attribute values.
*/
#include "graphconv/core/types.hpp"
#include "graphconv/core/error.hpp"

#include <array>
#include <charconv>
#include <string>

namespace graphconv::core {

namespace {
std::string format_double(double v) {
  std::array<char, 64> buf {};
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
  if (ec != std::errc{}) return std::to_string(v);
  return std::string(buf.data(), ptr);
}
} // namespace

ElementKind element_kind_from_code(char code) {
  switch (code) {
    case 'b': return ElementKind::Bool;
    case 'i': return ElementKind::Int;
    case 'u': return ElementKind::UInt;
    case 'f': return ElementKind::Float;
    case 'c': return ElementKind::Complex;
    case 'V': return ElementKind::Record;
    default:
      throw UnknownElementTypeError(std::string("unknown matrix element kind: '") + code + "'");
  }
}

std::string_view to_string(SparseFormat f) noexcept {
  switch (f) {
    case SparseFormat::Csr: return "csr";
    case SparseFormat::Csc: return "csc";
    case SparseFormat::Coo: return "coo";
    case SparseFormat::Dok: return "dok";
    case SparseFormat::Lil: return "lil";
  }
  return "unknown";
}

SparseFormat parse_sparse_format(std::string_view name) {
  if (name == "csr") return SparseFormat::Csr;
  if (name == "csc") return SparseFormat::Csc;
  if (name == "coo") return SparseFormat::Coo;
  if (name == "dok") return SparseFormat::Dok;
  if (name == "lil") return SparseFormat::Lil;
  throw UnknownFormatError("unknown sparse matrix format: " + std::string(name));
}

std::string to_string(const NodeKey& k) {
  if (const auto* i = std::get_if<std::int64_t>(&k)) return std::to_string(*i);
  return std::get<std::string>(k);
}

std::string to_string(const AttrValue& v) {
  return std::visit([](const auto& x) -> std::string {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, bool>) {
      return x ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
      return std::to_string(x);
    } else if constexpr (std::is_same_v<T, double>) {
      return format_double(x);
    } else if constexpr (std::is_same_v<T, std::complex<double>>) {
      std::string s = "(" + format_double(x.real());
      if (x.imag() >= 0.0) s += "+";
      return s + format_double(x.imag()) + "j)";
    } else {
      return x;
    }
  }, v);
}

} // namespace graphconv::core
