#include <mealcart/app/seed_recipes.hpp>
#include <utility>

namespace mealcart::app {

namespace {

using mealcart::core::RawIngredientLine;

Recipe make_recipe(std::string title, std::string category,
                   std::vector<RawIngredientLine> ingredients) {
  Recipe r;
  r.title = std::move(title);
  r.category = std::move(category);
  r.ingredients = std::move(ingredients);
  return r;
}

}  // namespace

std::vector<RecipeId> add_seed_recipes(RecipeBook& book) {
  if (book.size() > 0) return {};

  std::vector<RecipeId> ids;
  ids.push_back(book.add(make_recipe("Classic Oatmeal", "breakfast",
                                     {{"rolled oats", 1.0, "cup", "pantry"},
                                      {"milk", 2.0, "cup", "dairy"},
                                      {"honey", 1.0, "tbsp", "pantry"}})));
  ids.push_back(book.add(make_recipe("Grilled Chicken Salad", "lunch",
                                     {{"chicken breast", 6.0, "oz", "meat"},
                                      {"romaine", 2.0, "cup", "produce"},
                                      {"olive oil", 1.0, "tbsp", "pantry"}})));
  ids.push_back(book.add(make_recipe("Beef Stir Fry", "dinner",
                                     {{"beef strips", 1.0, "lb", "meat"},
                                      {"broccoli", 2.0, "cup", "produce"},
                                      {"soy sauce", 2.0, "tbsp", "pantry"}})));
  ids.push_back(book.add(make_recipe("Trail Mix", "snack",
                                     {{"almonds", 0.5, "cup", "other"},
                                      {"raisins", 0.5, "cup", "produce"},
                                      {"chocolate chips", 0.25, "cup", "pantry"}})));
  ids.push_back(book.add(make_recipe("Chocolate Mug Cake", "dessert",
                                     {{"flour", 4.0, "tbsp", "pantry"},
                                      {"sugar", 3.0, "tbsp", "pantry"},
                                      {"cocoa powder", 2.0, "tbsp", "pantry"},
                                      {"egg", 1.0, "whole", "dairy"}})));
  return ids;
}

}  // namespace mealcart::app
