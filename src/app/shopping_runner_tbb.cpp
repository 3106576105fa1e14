#include <mealcart/app/shopping_runner_tbb.hpp>

#ifdef MEALCART_HAS_TBB

#include <mealcart/app/shopping_runner.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace mealcart::app {

void generate_weeks_tbb(
    const std::unordered_map<std::string, HouseholdData>& households,
    const std::vector<std::pair<std::string, std::string>>& work_items,
    HouseholdWeekCallback callback) {
  if (work_items.empty() || !callback) return;

  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&households, &work_items, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& household_id = work_items[i].first;
          const std::string& week_start = work_items[i].second;
          auto it = households.find(household_id);
          if (it == households.end()) continue;
          const HouseholdData& data = it->second;
          if (!data.book || !data.plan) continue;
          callback(household_id, week_start,
                   generate_shopping_list(*data.book, *data.plan, week_start));
        }
      });
}

}  // namespace mealcart::app

#endif  // MEALCART_HAS_TBB
