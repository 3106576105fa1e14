#pragma once

#include <mealcart/core/ingredient.hpp>
#include <mealcart/core/unit_family.hpp>
#include <compare>
#include <cstddef>
#include <map>
#include <span>
#include <string>

namespace mealcart::core {

/// Merge identity: lowercase-trimmed item plus unit family.
/// Two ingredient lines merge iff their keys compare equal.
struct AggregationKey {
  std::string item;
  UnitFamily family;

  auto operator<=>(const AggregationKey&) const = default;
};

/// Running total for one key, in the family's base unit (tsp, oz, whole, or the Other unit).
/// display_text and grocery_section come from the first line seen for the key.
struct AggregationBucket {
  AggregationKey key;
  double base_total{0.0};
  std::string display_text;
  std::string grocery_section;
  std::size_t contributions{0};
};

/// Call-scoped bucket map; ordered by key so iteration is deterministic.
using BucketMap = std::map<AggregationKey, AggregationBucket>;

/// Groups lines by AggregationKey and sums quantity * base_factor per key.
/// Sums are not rounded; zero and negative quantities are added as given.
[[nodiscard]] BucketMap aggregate(std::span<const RawIngredientLine> lines);

}  // namespace mealcart::core
