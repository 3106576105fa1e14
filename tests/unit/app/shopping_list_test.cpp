#include <mealcart/app/shopping_list.hpp>
#include <mealcart/core/error.hpp>
#include <mealcart/core/ingredient.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace ma = mealcart::app;
namespace mc = mealcart::core;

namespace {

mc::ShoppingListLine generated(const char* item, double qty, const char* unit,
                               const char* section) {
  return {item, qty, unit, section, mc::LineSource::Generated};
}

}  // namespace

TEST(ShoppingList, RegenerateReplacesGeneratedOnly) {
  ma::ShoppingList list("2024-01-01");
  std::vector<mc::ShoppingListLine> first = {generated("flour", 3.0, "cup", "baking"),
                                             generated("egg", 2.0, "whole", "dairy")};
  EXPECT_EQ(list.regenerate(first), 2u);
  const auto manual = list.add_manual("paper towels", 1.0, "pack", "household");

  std::vector<mc::ShoppingListLine> second = {generated("milk", 1.0, "cup", "dairy")};
  list.regenerate(second);

  EXPECT_EQ(list.count(mc::LineSource::Generated), 1u);
  EXPECT_EQ(list.count(mc::LineSource::Manual), 1u);
  ASSERT_EQ(list.items().size(), 2u);
  EXPECT_EQ(list.items()[0].id, manual);
  EXPECT_EQ(list.items()[1].line.item, "milk");
}

TEST(ShoppingList, RegenerateForcesGeneratedSource) {
  ma::ShoppingList list("2024-01-01");
  std::vector<mc::ShoppingListLine> lines = {
      {"rice", 2.0, "cup", "pantry", mc::LineSource::Manual}};
  list.regenerate(lines);
  list.regenerate(std::vector<mc::ShoppingListLine>{});
  EXPECT_TRUE(list.items().empty());
}

TEST(ShoppingList, ManualSectionDefaultsToOther) {
  ma::ShoppingList list("2024-01-01");
  list.add_manual("batteries", 4.0, "each");
  ASSERT_EQ(list.items().size(), 1u);
  EXPECT_EQ(list.items()[0].line.grocery_section, "other");
  EXPECT_EQ(list.items()[0].line.source, mc::LineSource::Manual);
  EXPECT_FALSE(list.items()[0].checked);
}

TEST(ShoppingList, CheckedStateOfManualSurvivesRegenerate) {
  ma::ShoppingList list("2024-01-01");
  const auto id = list.add_manual("coffee", 1.0, "bag", "beverages");
  auto toggled = list.toggle_checked(id);
  ASSERT_TRUE(toggled.has_value());
  EXPECT_TRUE(*toggled);

  std::vector<mc::ShoppingListLine> lines = {generated("tea", 1.0, "box", "beverages")};
  list.regenerate(lines);
  ASSERT_EQ(list.count(mc::LineSource::Manual), 1u);
  EXPECT_TRUE(list.items()[0].checked);

  toggled = list.toggle_checked(id);
  ASSERT_TRUE(toggled.has_value());
  EXPECT_FALSE(*toggled);
}

TEST(ShoppingList, UnknownIdsReportItemNotFound) {
  ma::ShoppingList list("2024-01-01");
  const auto toggled = list.toggle_checked(99);
  ASSERT_FALSE(toggled.has_value());
  EXPECT_EQ(toggled.error(), mc::ShoppingError::ItemNotFound);
  const auto removed = list.remove(99);
  ASSERT_FALSE(removed.has_value());
  EXPECT_EQ(removed.error(), mc::ShoppingError::ItemNotFound);
}

TEST(ShoppingList, RemoveDeletesRow) {
  ma::ShoppingList list("2024-01-01");
  const auto id = list.add_manual("foil", 1.0, "roll");
  ASSERT_TRUE(list.remove(id).has_value());
  EXPECT_TRUE(list.items().empty());
}

TEST(ShoppingList, IdsNotReusedAcrossRegenerate) {
  ma::ShoppingList list("2024-01-01");
  std::vector<mc::ShoppingListLine> lines = {generated("salt", 1.0, "tbsp", "spices")};
  list.regenerate(lines);
  const auto first_id = list.items()[0].id;
  list.regenerate(lines);
  EXPECT_NE(list.items()[0].id, first_id);
}

TEST(ShoppingList, SortedViewBySectionThenItem) {
  ma::ShoppingList list("2024-01-01");
  std::vector<mc::ShoppingListLine> lines = {generated("romaine", 4.0, "cup", "produce"),
                                             generated("milk", 2.0, "cup", "dairy"),
                                             generated("broccoli", 2.0, "cup", "produce")};
  list.regenerate(lines);
  list.add_manual("butter", 1.0, "lb", "dairy");

  const auto view = list.sorted_view();
  ASSERT_EQ(view.size(), 4u);
  EXPECT_EQ(view[0].line.item, "butter");
  EXPECT_EQ(view[1].line.item, "milk");
  EXPECT_EQ(view[2].line.item, "broccoli");
  EXPECT_EQ(view[3].line.item, "romaine");
  EXPECT_EQ(list.week_start(), "2024-01-01");
}
