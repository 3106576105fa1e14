#include <mealcart/app/recipe_book.hpp>
#include <utility>

namespace mealcart::app {

RecipeId RecipeBook::add(Recipe recipe) {
  const RecipeId id = next_id_++;
  recipe.id = id;
  recipes_.emplace(id, std::move(recipe));
  return id;
}

const Recipe* RecipeBook::find(RecipeId id) const {
  const auto it = recipes_.find(id);
  return it == recipes_.end() ? nullptr : &it->second;
}

std::expected<void, mealcart::core::ShoppingError> RecipeBook::remove(RecipeId id) {
  if (recipes_.erase(id) == 0) {
    return std::unexpected(mealcart::core::ShoppingError::RecipeNotFound);
  }
  return {};
}

}  // namespace mealcart::app
