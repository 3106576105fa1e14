#pragma once

#include <mealcart/app/meal_plan.hpp>
#include <mealcart/app/recipe_book.hpp>
#include <mealcart/core/ingredient.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef MEALCART_HAS_TBB

namespace mealcart::app {

/// Recipe book and meal plan of one household. Caller keeps ownership.
struct HouseholdData {
  const RecipeBook* book{nullptr};
  const MealPlan* plan{nullptr};
};

/// Callback for each generated (household, week); may be invoked from TBB worker threads.
using HouseholdWeekCallback =
    std::function<void(const std::string& household_id, const std::string& week_start,
                       const std::vector<mealcart::core::ShoppingListLine>& lines)>;

/// Generates a batch of (household_id, week_start) work items in parallel using TBB.
///
/// For each work item the week is generated from that household's book and plan and
/// callback(household_id, week_start, lines) is invoked. Work items naming a household
/// missing from \p households (or with a null book/plan) are skipped.
///
/// Books and plans are only read, so several work items may share a household; the
/// caller must not mutate them while the call is running.
///
/// \param households Map from household id to its data.
/// \param work_items Flat list of (household_id, week_start) pairs.
/// \param callback Invoked once per generated item. Must be thread-safe.
void generate_weeks_tbb(
    const std::unordered_map<std::string, HouseholdData>& households,
    const std::vector<std::pair<std::string, std::string>>& work_items,
    HouseholdWeekCallback callback);

}  // namespace mealcart::app

#endif  // MEALCART_HAS_TBB
