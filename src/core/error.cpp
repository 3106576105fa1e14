#include <mealcart/core/error.hpp>

namespace mealcart::core {

std::string_view to_string(ShoppingError e) noexcept {
  switch (e) {
    case ShoppingError::None:
      return "None";
    case ShoppingError::InvalidInput:
      return "InvalidInput";
    case ShoppingError::LoadFailed:
      return "LoadFailed";
    case ShoppingError::RecipeNotFound:
      return "RecipeNotFound";
    case ShoppingError::ItemNotFound:
      return "ItemNotFound";
    case ShoppingError::InvalidSlot:
      return "InvalidSlot";
  }
  return "Unknown";
}

}  // namespace mealcart::core
