#pragma once

#include <mealcart/core/aggregator.hpp>
#include <mealcart/core/ingredient.hpp>
#include <span>
#include <vector>

namespace mealcart::core {

/// Turns buckets into generated shopping-list lines, one per up-converted amount.
/// Amounts that round to 0.0 or below are not emitted, so a bucket whose total
/// nets to zero produces no line. Output order is the bucket map's order.
[[nodiscard]] std::vector<ShoppingListLine> present(const BucketMap& buckets);

/// Full engine: classify, aggregate, up-convert and present.
/// Pure; safe to call concurrently for independent inputs.
[[nodiscard]] std::vector<ShoppingListLine> build_shopping_lines(
    std::span<const RawIngredientLine> lines);

}  // namespace mealcart::core
