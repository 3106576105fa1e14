#pragma once

#include <string_view>

namespace mealcart::core {

/// Shopping-list error codes; used with std::expected for recoverable failures.
/// The aggregation engine itself is total and never produces one of these.
enum class ShoppingError {
  None = 0,
  InvalidInput,
  LoadFailed,
  RecipeNotFound,
  ItemNotFound,
  InvalidSlot,
};

/// Stable name for diagnostics (e.g. "InvalidInput").
[[nodiscard]] std::string_view to_string(ShoppingError e) noexcept;

}  // namespace mealcart::core
