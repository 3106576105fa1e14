#pragma once

#include <mealcart/core/error.hpp>
#include <mealcart/core/ingredient.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace mealcart::app {

using RecipeId = std::uint64_t;

/// Recipe as the planner sees it: a title, a category and its ingredient lines.
struct Recipe {
  RecipeId id{0};
  std::string title;
  std::string category;
  std::vector<mealcart::core::RawIngredientLine> ingredients;
};

/// In-memory recipe store. Ids are assigned on add and never reused.
class RecipeBook {
 public:
  /// Stores the recipe (its id field is ignored) and returns the assigned id.
  RecipeId add(Recipe recipe);

  /// nullptr if no recipe has this id.
  [[nodiscard]] const Recipe* find(RecipeId id) const;

  [[nodiscard]] std::expected<void, mealcart::core::ShoppingError> remove(RecipeId id);

  [[nodiscard]] std::size_t size() const noexcept { return recipes_.size(); }

 private:
  std::map<RecipeId, Recipe> recipes_;
  RecipeId next_id_{1};
};

}  // namespace mealcart::app
