/* Edge weight lookup, attribute <-> element conversion and reducers. */
#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "graphconv/core/error.hpp"
#include "graphconv/core/types.hpp"

namespace graphconv::core {

// attrs[weight_key], or def when weight_key is std::nullopt or missing.
[[nodiscard]] AttrValue weight_of(const AttrMap& attrs,
                                  const std::optional<std::string>& weight_key,
                                  const AttrValue& def = AttrValue{std::int64_t{1}});

// Throws UnknownReducerError for names other than sum, min and max.
[[nodiscard]] Reducer parse_reducer(std::string_view name);

// Throws UnknownReducerError unless r is one of the declared reducers.
void check_reducer(Reducer r);

namespace detail {
// Throws ValueError unless the floating value x truncates into the range of
// the integral type T (NaN included), or is finite and in range for a
// narrower floating T.
template <typename T>
void check_float_range(double x) {
  if constexpr (std::is_integral_v<T>) {
    const double lo = static_cast<double>(std::numeric_limits<T>::min());
    const double hi = std::ldexp(1.0, std::numeric_limits<T>::digits);
    const double t = std::trunc(x);
    if (!(t >= lo && t < hi)) {
      throw ValueError("value " + std::to_string(x) + " is out of range for the matrix element type");
    }
  } else if constexpr (std::is_floating_point_v<T> && sizeof(T) < sizeof(double)) {
    if (std::isfinite(x) && std::fabs(x) > static_cast<double>(std::numeric_limits<T>::max())) {
      throw ValueError("value " + std::to_string(x) + " is out of range for the matrix element type");
    }
  }
}
} // namespace detail

// Casts an attribute value to a matrix element type. Strings never convert;
// complex values convert only to complex elements. Floating values outside
// the range of an integral (or float) element throw ValueError.
template <typename T>
[[nodiscard]] T attr_cast(const AttrValue& v) {
  return std::visit([](const auto& x) -> T {
    using V = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<V, std::string>) {
      throw TypeError("cannot convert string attribute '" + x + "' to a matrix element");
    } else if constexpr (is_complex_v<V>) {
      if constexpr (is_complex_v<T>) {
        return T(x);
      } else if constexpr (std::is_same_v<T, bool>) {
        return x != V{};
      } else {
        throw TypeError("cannot convert complex attribute to a real matrix element");
      }
    } else if constexpr (is_complex_v<T>) {
      return T(static_cast<typename T::value_type>(x), 0);
    } else if constexpr (std::is_same_v<T, bool>) {
      return x != V{};
    } else {
      if constexpr (std::is_same_v<V, double>) detail::check_float_range<T>(x);
      return static_cast<T>(x);
    }
  }, v);
}

// Converts a matrix element to the attribute value type of its kind:
// bool -> bool, integers -> int64, floating -> double, complex -> complex<double>.
// Throws ValueError for an unsigned value above INT64_MAX.
template <typename T>
[[nodiscard]] AttrValue to_attr_value(const T& x) {
  if constexpr (std::is_same_v<T, bool>) {
    return AttrValue{x};
  } else if constexpr (std::is_integral_v<T>) {
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
      if (x > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
        throw ValueError("value " + std::to_string(x) + " does not fit an int64 attribute");
      }
    }
    return AttrValue{static_cast<std::int64_t>(x)};
  } else if constexpr (std::is_floating_point_v<T>) {
    return AttrValue{static_cast<double>(x)};
  } else {
    return AttrValue{std::complex<double>(x)};
  }
}

namespace detail {
// Complex numbers have no natural order; compare real then imaginary parts.
template <typename T>
constexpr bool element_less(const T& a, const T& b) {
  if constexpr (is_complex_v<T>) {
    if (a.real() != b.real()) return a.real() < b.real();
    return a.imag() < b.imag();
  } else {
    return a < b;
  }
}
} // namespace detail

// Folds value into an accumulator cell. An unset accumulator is the
// identity for every reducer, so the first real value always wins as-is.
template <typename T>
[[nodiscard]] T combine(const std::optional<T>& acc, const T& value, Reducer reducer) {
  if (!acc) {
    switch (reducer) {
      case Reducer::Sum:
      case Reducer::Min:
      case Reducer::Max:
        return value;
    }
    throw UnknownReducerError("reducer must be sum, min, or max");
  }
  switch (reducer) {
    case Reducer::Sum: return static_cast<T>(*acc + value);
    case Reducer::Min: return detail::element_less(value, *acc) ? value : *acc;
    case Reducer::Max: return detail::element_less(*acc, value) ? value : *acc;
  }
  throw UnknownReducerError("reducer must be sum, min, or max");
}

// Reduces a sequence, skipping unset entries. std::nullopt if all are unset.
template <typename T>
[[nodiscard]] std::optional<T> combine(const std::vector<std::optional<T>>& values, Reducer reducer) {
  std::optional<T> acc;
  for (const auto& v : values) {
    if (v) acc = combine(acc, *v, reducer);
  }
  return acc;
}

} // namespace graphconv::core
