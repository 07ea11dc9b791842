#pragma once

#include <stdexcept>
#include <string>

namespace graphconv::core {

struct TypeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ValueError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RuntimeError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Node ordering contains the same node more than once.
struct AmbiguousOrderingError : public ValueError {
  using ValueError::ValueError;
};
using DuplicateNodeError = AmbiguousOrderingError;

struct NonSquareMatrixError : public ValueError {
  using ValueError::ValueError;
};

struct UnsupportedForMultigraphError : public TypeError {
  using TypeError::TypeError;
};

struct UnknownReducerError : public ValueError {
  using ValueError::ValueError;
};

struct EmptyGraphError : public ValueError {
  using ValueError::ValueError;
};

struct UnknownElementTypeError : public TypeError {
  using TypeError::TypeError;
};

// Edge lacks an attribute named by a structured field spec.
struct MissingFieldError : public ValueError {
  using ValueError::ValueError;
};

struct UnknownFormatError : public ValueError {
  using ValueError::ValueError;
};

struct UnknownColumnError : public ValueError {
  using ValueError::ValueError;
};

} // namespace graphconv::core
