#include <mealcart/app/shopping_list.hpp>
#include <algorithm>
#include <utility>

namespace mealcart::app {

using mealcart::core::LineSource;
using mealcart::core::ShoppingError;
using mealcart::core::ShoppingListLine;

std::size_t ShoppingList::regenerate(std::span<const ShoppingListLine> lines) {
  std::erase_if(items_, [](const ShoppingItem& it) {
    return it.line.source == LineSource::Generated;
  });
  for (const auto& line : lines) {
    ShoppingItem item;
    item.id = next_id_++;
    item.line = line;
    item.line.source = LineSource::Generated;
    items_.push_back(std::move(item));
  }
  return lines.size();
}

ItemId ShoppingList::add_manual(std::string item, double quantity, std::string unit,
                                std::optional<std::string> grocery_section) {
  ShoppingItem row;
  row.id = next_id_++;
  row.line.item = std::move(item);
  row.line.quantity = quantity;
  row.line.unit = std::move(unit);
  row.line.grocery_section = grocery_section.value_or("other");
  row.line.source = LineSource::Manual;
  items_.push_back(std::move(row));
  return items_.back().id;
}

std::expected<bool, ShoppingError> ShoppingList::toggle_checked(ItemId id) {
  const auto it = std::find_if(items_.begin(), items_.end(),
                               [id](const ShoppingItem& row) { return row.id == id; });
  if (it == items_.end()) {
    return std::unexpected(ShoppingError::ItemNotFound);
  }
  it->checked = !it->checked;
  return it->checked;
}

std::expected<void, ShoppingError> ShoppingList::remove(ItemId id) {
  const auto removed =
      std::erase_if(items_, [id](const ShoppingItem& row) { return row.id == id; });
  if (removed == 0) {
    return std::unexpected(ShoppingError::ItemNotFound);
  }
  return {};
}

std::vector<ShoppingItem> ShoppingList::sorted_view() const {
  std::vector<ShoppingItem> out = items_;
  std::stable_sort(out.begin(), out.end(), [](const ShoppingItem& a, const ShoppingItem& b) {
    if (a.line.grocery_section != b.line.grocery_section) {
      return a.line.grocery_section < b.line.grocery_section;
    }
    return a.line.item < b.line.item;
  });
  return out;
}

std::size_t ShoppingList::count(LineSource source) const noexcept {
  return static_cast<std::size_t>(std::count_if(
      items_.begin(), items_.end(),
      [source](const ShoppingItem& row) { return row.line.source == source; }));
}

}  // namespace mealcart::app
