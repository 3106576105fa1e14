#pragma once

#include <mealcart/core/error.hpp>
#include <mealcart/core/ingredient.hpp>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mealcart::app {

/// Parses "item,quantity,unit[,grocery_section]" rows. Blank lines, '#' comments and a
/// header row whose first field is "item" are skipped. A row without a section gets
/// default_section.
///
/// This is where raw input is validated before it reaches the engine: a row with
/// fewer than three fields, an empty item, or a quantity that is not a finite
/// non-negative number yields InvalidInput.
[[nodiscard]] std::expected<std::vector<mealcart::core::RawIngredientLine>,
                            mealcart::core::ShoppingError>
parse_ingredient_csv(std::string_view text, const std::string& default_section = "other");

/// Reads path and parses it as above; LoadFailed if the file cannot be opened.
[[nodiscard]] std::expected<std::vector<mealcart::core::RawIngredientLine>,
                            mealcart::core::ShoppingError>
load_ingredient_csv(const std::string& path, const std::string& default_section = "other");

/// One row per line: "item: 1.5 cup [baking] (generated)".
[[nodiscard]] std::string format_shopping_list(
    std::span<const mealcart::core::ShoppingListLine> lines);

}  // namespace mealcart::app
