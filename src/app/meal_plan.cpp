#include <mealcart/app/meal_plan.hpp>
#include <mealcart/core/text.hpp>
#include <algorithm>
#include <iterator>

namespace mealcart::app {

using mealcart::core::ShoppingError;

std::optional<MealSlot> parse_meal_slot(std::string_view name) {
  const std::string n = mealcart::core::normalize(name);
  if (n == "breakfast") return MealSlot::Breakfast;
  if (n == "lunch") return MealSlot::Lunch;
  if (n == "dinner") return MealSlot::Dinner;
  if (n == "snack") return MealSlot::Snack;
  return std::nullopt;
}

const char* to_string(MealSlot slot) noexcept {
  switch (slot) {
    case MealSlot::Breakfast:
      return "breakfast";
    case MealSlot::Lunch:
      return "lunch";
    case MealSlot::Dinner:
      return "dinner";
    case MealSlot::Snack:
      return "snack";
  }
  return "unknown";
}

std::expected<void, ShoppingError> MealPlan::assign(const std::string& week_start,
                                                    unsigned day_of_week, MealSlot slot,
                                                    RecipeId recipe_id,
                                                    const RecipeBook& book) {
  if (day_of_week >= kDaysPerWeek) {
    return std::unexpected(ShoppingError::InvalidSlot);
  }
  if (book.find(recipe_id) == nullptr) {
    return std::unexpected(ShoppingError::RecipeNotFound);
  }
  clear(week_start, day_of_week, slot);
  entries_.push_back(MealPlanEntry{week_start, day_of_week, slot, recipe_id});
  return {};
}

std::expected<void, ShoppingError> MealPlan::assign(const std::string& week_start,
                                                    unsigned day_of_week,
                                                    std::string_view slot_name,
                                                    RecipeId recipe_id,
                                                    const RecipeBook& book) {
  const auto slot = parse_meal_slot(slot_name);
  if (!slot) {
    return std::unexpected(ShoppingError::InvalidSlot);
  }
  return assign(week_start, day_of_week, *slot, recipe_id, book);
}

bool MealPlan::clear(const std::string& week_start, unsigned day_of_week, MealSlot slot) {
  const auto removed = std::erase_if(entries_, [&](const MealPlanEntry& e) {
    return e.week_start == week_start && e.day_of_week == day_of_week && e.slot == slot;
  });
  return removed > 0;
}

std::size_t MealPlan::remove_recipe(RecipeId recipe_id) {
  return std::erase_if(entries_,
                       [recipe_id](const MealPlanEntry& e) { return e.recipe_id == recipe_id; });
}

std::vector<MealPlanEntry> MealPlan::entries_for_week(const std::string& week_start) const {
  std::vector<MealPlanEntry> out;
  std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
               [&](const MealPlanEntry& e) { return e.week_start == week_start; });
  std::sort(out.begin(), out.end(), [](const MealPlanEntry& a, const MealPlanEntry& b) {
    if (a.day_of_week != b.day_of_week) return a.day_of_week < b.day_of_week;
    return a.slot < b.slot;
  });
  return out;
}

std::vector<mealcart::core::RawIngredientLine> collect_week_ingredients(
    const RecipeBook& book, const MealPlan& plan, const std::string& week_start) {
  std::vector<mealcart::core::RawIngredientLine> lines;
  for (const auto& entry : plan.entries_for_week(week_start)) {
    const Recipe* recipe = book.find(entry.recipe_id);
    if (!recipe) continue;
    lines.insert(lines.end(), recipe->ingredients.begin(), recipe->ingredients.end());
  }
  return lines;
}

}  // namespace mealcart::app
