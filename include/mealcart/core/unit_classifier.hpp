#pragma once

#include <mealcart/core/unit_family.hpp>
#include <string>
#include <string_view>

namespace mealcart::core {

/// Classification of one raw unit string.
struct UnitClassification {
  UnitFamily family{Count{}};
  std::string canonical_unit;
  double base_factor{1.0};
};

/// Maps a raw unit string (case-insensitive, surrounding whitespace ignored) to its
/// family, canonical spelling and factor to the family base unit.
/// Total: an unrecognized unit becomes Other(<normalized unit>) with factor 1.
[[nodiscard]] UnitClassification classify(std::string_view unit);

}  // namespace mealcart::core
