#pragma once

#include <mealcart/app/meal_plan.hpp>
#include <mealcart/app/recipe_book.hpp>
#include <mealcart/app/shopping_list.hpp>
#include <mealcart/core/ingredient.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace mealcart::app {

/// Callback for each generated week: (week_start, generated lines).
/// May be invoked from worker threads; must be thread-safe if using the parallel runner.
using WeekLinesCallback = std::function<void(
    const std::string& week_start, const std::vector<mealcart::core::ShoppingListLine>& lines)>;

/// Collects every ingredient line planned for the week and runs the engine on it.
[[nodiscard]] std::vector<mealcart::core::ShoppingListLine> generate_shopping_list(
    const RecipeBook& book, const MealPlan& plan, const std::string& week_start);

/// Generates list.week_start() and replaces the list's generated rows with the result.
/// Manual rows are kept. Returns the number of generated rows now on the list.
std::size_t regenerate_week(ShoppingList& list, const RecipeBook& book, const MealPlan& plan);

/// Generates each week sequentially; calls callback for each.
void generate_weeks_batch(const RecipeBook& book, const MealPlan& plan,
                          const std::vector<std::string>& weeks, WeekLinesCallback callback);

/// Generates weeks in parallel using a thread pool. book and plan are only read.
/// callback may be invoked from any worker (must be thread-safe).
/// num_workers 0 = use hardware concurrency.
void generate_weeks_batch_parallel(const RecipeBook& book, const MealPlan& plan,
                                   const std::vector<std::string>& weeks,
                                   WeekLinesCallback callback, std::size_t num_workers = 0);

}  // namespace mealcart::app
