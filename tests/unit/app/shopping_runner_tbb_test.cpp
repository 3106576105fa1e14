#ifdef MEALCART_HAS_TBB

#include <mealcart/app/meal_plan.hpp>
#include <mealcart/app/recipe_book.hpp>
#include <mealcart/app/shopping_runner_tbb.hpp>
#include <mealcart/core/ingredient.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

struct Household {
  mealcart::app::RecipeBook book;
  mealcart::app::MealPlan plan;
};

void plan_flour_week(Household& h, const std::string& week, double cups) {
  mealcart::app::Recipe r;
  r.title = "Bread";
  r.ingredients = {{"flour", cups, "cup", "baking"}};
  const auto id = h.book.add(std::move(r));
  ASSERT_TRUE(h.plan.assign(week, 0, mealcart::app::MealSlot::Dinner, id, h.book).has_value());
}

}  // namespace

TEST(ShoppingRunnerTbbTest, GeneratesEveryWorkItem) {
  Household a;
  Household b;
  plan_flour_week(a, "2024-01-01", 1.0);
  plan_flour_week(b, "2024-01-01", 2.0);

  std::unordered_map<std::string, mealcart::app::HouseholdData> households;
  households["home_a"] = {&a.book, &a.plan};
  households["home_b"] = {&b.book, &b.plan};

  std::vector<std::pair<std::string, std::string>> work_items = {
      {"home_a", "2024-01-01"}, {"home_b", "2024-01-01"}, {"home_c", "2024-01-01"}};

  std::atomic<std::size_t> call_count{0};
  std::vector<std::pair<std::string, double>> cups;
  std::mutex mutex;
  mealcart::app::generate_weeks_tbb(
      households, work_items,
      [&](const std::string& household_id, const std::string& week,
          const std::vector<mealcart::core::ShoppingListLine>& lines) {
        call_count++;
        EXPECT_EQ(week, "2024-01-01");
        ASSERT_EQ(lines.size(), 1u);
        std::lock_guard lock(mutex);
        cups.emplace_back(household_id, lines[0].quantity);
      });

  EXPECT_EQ(call_count.load(), 2u);
  std::sort(cups.begin(), cups.end());
  ASSERT_EQ(cups.size(), 2u);
  EXPECT_EQ(cups[0].first, "home_a");
  EXPECT_DOUBLE_EQ(cups[0].second, 1.0);
  EXPECT_EQ(cups[1].first, "home_b");
  EXPECT_DOUBLE_EQ(cups[1].second, 2.0);
}

TEST(ShoppingRunnerTbbTest, EmptyWorkItemsDoesNotCallCallback) {
  std::unordered_map<std::string, mealcart::app::HouseholdData> households;
  std::vector<std::pair<std::string, std::string>> work_items;
  std::atomic<std::size_t> calls{0};
  mealcart::app::generate_weeks_tbb(
      households, work_items,
      [&calls](const std::string&, const std::string&,
               const std::vector<mealcart::core::ShoppingListLine>&) { calls++; });
  EXPECT_EQ(calls.load(), 0u);
}

#endif  // MEALCART_HAS_TBB
