#include <mealcart/core/presenter.hpp>
#include <mealcart/core/upconverter.hpp>
#include <utility>

namespace mealcart::core {

std::vector<ShoppingListLine> present(const BucketMap& buckets) {
  std::vector<ShoppingListLine> out;
  out.reserve(buckets.size());
  for (const auto& [key, bucket] : buckets) {
    for (auto& amount : upconvert(key.family, bucket.base_total)) {
      if (amount.quantity <= 0.0) continue;
      ShoppingListLine line;
      line.item = bucket.display_text;
      line.quantity = amount.quantity;
      line.unit = std::move(amount.unit);
      line.grocery_section = bucket.grocery_section;
      line.source = LineSource::Generated;
      out.push_back(std::move(line));
    }
  }
  return out;
}

std::vector<ShoppingListLine> build_shopping_lines(
    std::span<const RawIngredientLine> lines) {
  return present(aggregate(lines));
}

}  // namespace mealcart::core
