#include "graphconv/core/weights.hpp"

namespace graphconv::core {

AttrValue weight_of(const AttrMap& attrs, const std::optional<std::string>& weight_key,
                    const AttrValue& def) {
  if (!weight_key) return def;
  auto it = attrs.find(*weight_key);
  if (it == attrs.end()) return def;
  return it->second;
}

Reducer parse_reducer(std::string_view name) {
  if (name == "sum") return Reducer::Sum;
  if (name == "min") return Reducer::Min;
  if (name == "max") return Reducer::Max;
  throw UnknownReducerError("multigraph_weight must be sum, min, or max; got " + std::string(name));
}

void check_reducer(Reducer r) {
  switch (r) {
    case Reducer::Sum:
    case Reducer::Min:
    case Reducer::Max:
      return;
  }
  throw UnknownReducerError("multigraph_weight must be sum, min, or max");
}

} // namespace graphconv::core
