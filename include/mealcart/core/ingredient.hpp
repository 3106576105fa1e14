#pragma once

#include <cstdint>
#include <string>

namespace mealcart::core {

/// One ingredient requirement as stored on a recipe; quantity is assumed valid and >= 0.
struct RawIngredientLine {
  std::string item;
  double quantity{0.0};
  std::string unit;
  std::string grocery_section{"other"};
};

/// Who produced a shopping-list line.
enum class LineSource : std::uint8_t {
  Generated,
  Manual,
};

/// "generated" or "manual".
[[nodiscard]] const char* to_string(LineSource s) noexcept;

/// Final shopping-list line; quantity is already rounded to one decimal place.
struct ShoppingListLine {
  std::string item;
  double quantity{0.0};
  std::string unit;
  std::string grocery_section{"other"};
  LineSource source{LineSource::Generated};
};

}  // namespace mealcart::core
