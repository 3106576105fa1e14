#pragma once

#include <compare>
#include <string>
#include <variant>

namespace mealcart::core {

/// Volume units; base unit is the teaspoon.
struct Volume {
  auto operator<=>(const Volume&) const = default;
};

/// Weight units; base unit is the ounce.
struct Weight {
  auto operator<=>(const Weight&) const = default;
};

/// Countable items; base unit is "whole".
struct Count {
  auto operator<=>(const Count&) const = default;
};

/// Singleton family for any unit the taxonomy does not know (e.g. "g", "clove").
/// Two Other families are equal only if their normalized unit strings are equal.
struct Other {
  std::string unit;
  auto operator<=>(const Other&) const = default;
};

/// Closed set of unit families; decides merge eligibility.
using UnitFamily = std::variant<Volume, Weight, Count, Other>;

/// Short family name for diagnostics: "volume", "weight", "count" or "other:<unit>".
[[nodiscard]] std::string family_name(const UnitFamily& family);

}  // namespace mealcart::core
