#pragma once

#include <mealcart/app/recipe_book.hpp>
#include <mealcart/core/error.hpp>
#include <mealcart/core/ingredient.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mealcart::app {

/// Meal slot within a day; declaration order is display order.
enum class MealSlot : std::uint8_t {
  Breakfast,
  Lunch,
  Dinner,
  Snack,
};

/// Case-insensitive parse of "breakfast", "lunch", "dinner", "snack".
[[nodiscard]] std::optional<MealSlot> parse_meal_slot(std::string_view name);

[[nodiscard]] const char* to_string(MealSlot slot) noexcept;

inline constexpr unsigned kDaysPerWeek = 7;

/// One recipe assigned to (week, day, slot). day_of_week is 0 (Monday) to 6 (Sunday).
struct MealPlanEntry {
  std::string week_start;
  unsigned day_of_week{0};
  MealSlot slot{MealSlot::Dinner};
  RecipeId recipe_id{0};
};

/// Weekly meal grid. At most one recipe per (week, day, slot); assigning replaces.
class MealPlan {
 public:
  /// Upserts the slot. RecipeNotFound if book has no such recipe; InvalidSlot if day > 6.
  [[nodiscard]] std::expected<void, mealcart::core::ShoppingError> assign(
      const std::string& week_start, unsigned day_of_week, MealSlot slot,
      RecipeId recipe_id, const RecipeBook& book);

  /// Same as above with the slot given by name; InvalidSlot for an unknown name.
  [[nodiscard]] std::expected<void, mealcart::core::ShoppingError> assign(
      const std::string& week_start, unsigned day_of_week, std::string_view slot_name,
      RecipeId recipe_id, const RecipeBook& book);

  /// Returns true if a slot was cleared.
  bool clear(const std::string& week_start, unsigned day_of_week, MealSlot slot);

  /// Drops every slot that references recipe_id; returns how many were dropped.
  std::size_t remove_recipe(RecipeId recipe_id);

  /// Entries of one week ordered by day, then slot.
  [[nodiscard]] std::vector<MealPlanEntry> entries_for_week(
      const std::string& week_start) const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  std::vector<MealPlanEntry> entries_;
};

/// Every ingredient line of every recipe assigned anywhere in the week, duplicates
/// included. Slots whose recipe no longer exists in book contribute nothing.
[[nodiscard]] std::vector<mealcart::core::RawIngredientLine> collect_week_ingredients(
    const RecipeBook& book, const MealPlan& plan, const std::string& week_start);

}  // namespace mealcart::app
