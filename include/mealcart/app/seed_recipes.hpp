#pragma once

#include <mealcart/app/recipe_book.hpp>
#include <vector>

namespace mealcart::app {

/// Adds the starter recipes (oatmeal, chicken salad, stir fry, trail mix, mug cake)
/// to an empty book. Does nothing if the book already has recipes.
/// Returns the ids added, in the order listed above.
std::vector<RecipeId> add_seed_recipes(RecipeBook& book);

}  // namespace mealcart::app
