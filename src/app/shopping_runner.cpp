#include <mealcart/app/shopping_runner.hpp>
#include <mealcart/core/presenter.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>

namespace mealcart::app {

std::vector<mealcart::core::ShoppingListLine> generate_shopping_list(
    const RecipeBook& book, const MealPlan& plan, const std::string& week_start) {
  const auto raw = collect_week_ingredients(book, plan, week_start);
  return mealcart::core::build_shopping_lines(raw);
}

std::size_t regenerate_week(ShoppingList& list, const RecipeBook& book, const MealPlan& plan) {
  const auto lines = generate_shopping_list(book, plan, list.week_start());
  return list.regenerate(lines);
}

void generate_weeks_batch(const RecipeBook& book, const MealPlan& plan,
                          const std::vector<std::string>& weeks, WeekLinesCallback callback) {
  if (!callback) return;
  for (const auto& week : weeks) {
    callback(week, generate_shopping_list(book, plan, week));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void generate_weeks_batch_parallel(const RecipeBook& book, const MealPlan& plan,
                                   const std::vector<std::string>& weeks,
                                   WeekLinesCallback callback, std::size_t num_workers) {
  const std::size_t n = weeks.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    generate_weeks_batch(book, plan, weeks, std::move(callback));
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      callback(weeks[idx], generate_shopping_list(book, plan, weeks[idx]));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace mealcart::app
