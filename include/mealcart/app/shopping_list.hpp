#pragma once

#include <mealcart/core/error.hpp>
#include <mealcart/core/ingredient.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace mealcart::app {

using ItemId = std::uint64_t;

/// Stored shopping-list row: a line plus its id and checked state.
struct ShoppingItem {
  ItemId id{0};
  mealcart::core::ShoppingListLine line;
  bool checked{false};
};

/// Shopping list for one week. Generated rows are replaced wholesale on regenerate();
/// manual rows (and their checked state) survive it.
class ShoppingList {
 public:
  explicit ShoppingList(std::string week_start) : week_start_(std::move(week_start)) {}

  [[nodiscard]] const std::string& week_start() const noexcept { return week_start_; }

  /// Drops every generated row, then appends lines as new generated rows.
  /// Returns the number of rows added.
  std::size_t regenerate(std::span<const mealcart::core::ShoppingListLine> lines);

  /// Appends a manual row; grocery_section defaults to "other". Returns its id.
  ItemId add_manual(std::string item, double quantity, std::string unit,
                    std::optional<std::string> grocery_section = std::nullopt);

  /// Flips the checked state; returns the new state or ItemNotFound.
  [[nodiscard]] std::expected<bool, mealcart::core::ShoppingError> toggle_checked(ItemId id);

  [[nodiscard]] std::expected<void, mealcart::core::ShoppingError> remove(ItemId id);

  /// Rows in insertion order.
  [[nodiscard]] const std::vector<ShoppingItem>& items() const noexcept { return items_; }

  /// Rows ordered by grocery section, then item, for display.
  [[nodiscard]] std::vector<ShoppingItem> sorted_view() const;

  [[nodiscard]] std::size_t count(mealcart::core::LineSource source) const noexcept;

 private:
  std::string week_start_;
  std::vector<ShoppingItem> items_;
  ItemId next_id_{1};
};

}  // namespace mealcart::app
