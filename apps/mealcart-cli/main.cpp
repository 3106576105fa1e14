/**
 * mealcart-cli — Aggregate ingredient lines into a shopping list.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/mealcart_cli [--config path] [--input ingredients.csv] [--week YYYY-MM-DD]
 * With --input: also writes the list to <output_dir>/<basename>.txt (same content as terminal).
 * Without --input: plans a demo week from the starter recipes.
 * With --verbose: dumps the aggregation buckets (base-unit totals) to stderr.
 */

#include <mealcart/app/config.hpp>
#include <mealcart/app/ingredient_csv.hpp>
#include <mealcart/app/meal_plan.hpp>
#include <mealcart/app/recipe_book.hpp>
#include <mealcart/app/seed_recipes.hpp>
#include <mealcart/app/shopping_list.hpp>
#include <mealcart/app/shopping_runner.hpp>
#include <mealcart/core/aggregator.hpp>
#include <mealcart/core/error.hpp>
#include <mealcart/core/ingredient.hpp>
#include <mealcart/core/presenter.hpp>
#include <mealcart/core/unit_family.hpp>

#include <exception>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr const char* kDemoWeek = "2024-01-01";

// Breakfast every day, lunch on weekdays, stir fry twice, a snack and a dessert.
bool plan_demo_week(const mealcart::app::RecipeBook& book,
                    const std::vector<mealcart::app::RecipeId>& ids,
                    const std::string& week, mealcart::app::MealPlan& plan) {
  using mealcart::app::MealSlot;
  std::vector<std::expected<void, mealcart::core::ShoppingError>> results;
  for (unsigned day = 0; day < mealcart::app::kDaysPerWeek; ++day) {
    results.push_back(plan.assign(week, day, MealSlot::Breakfast, ids[0], book));
  }
  for (unsigned day = 0; day < 5; ++day) {
    results.push_back(plan.assign(week, day, MealSlot::Lunch, ids[1], book));
  }
  results.push_back(plan.assign(week, 2, MealSlot::Dinner, ids[2], book));
  results.push_back(plan.assign(week, 5, MealSlot::Dinner, ids[2], book));
  results.push_back(plan.assign(week, 4, MealSlot::Snack, ids[3], book));
  results.push_back(plan.assign(week, 6, MealSlot::Snack, ids[4], book));
  for (const auto& r : results) {
    if (!r) {
      std::cerr << "Failed to plan demo week: " << mealcart::core::to_string(r.error()) << "\n";
      return false;
    }
  }
  return true;
}

void dump_buckets(const std::vector<mealcart::core::RawIngredientLine>& raw) {
  for (const auto& [key, bucket] : mealcart::core::aggregate(raw)) {
    std::cerr << "  bucket " << key.item << " " << mealcart::core::family_name(key.family)
              << " base_total=" << bucket.base_total << " lines=" << bucket.contributions
              << "\n";
  }
}

int run(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string week_override;
  bool demo = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--week" && i + 1 < argc) {
      week_override = argv[++i];
    } else if (arg == "--demo") {
      demo = true;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: mealcart_cli [options]\n"
                << "  --config <path>   App config (key=value file); default: built-in\n"
                << "  --input <path>    Ingredient CSV: item,quantity,unit[,grocery_section]\n"
                << "  --week <date>     Week start for the demo plan (default from config)\n"
                << "  --demo            Ignore --input and plan a demo week from starter recipes\n"
                << "  --verbose         Print aggregation buckets to stderr\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  mealcart::app::AppConfig cfg = config_path.empty() ? mealcart::app::default_config()
                                                     : mealcart::app::load_config(config_path);
  if (!week_override.empty()) {
    cfg.week_start = week_override;
  }
  if (demo) {
    input_path.clear();
  }
  const std::string week = cfg.week_start.empty() ? std::string(kDemoWeek) : cfg.week_start;

  mealcart::app::ShoppingList list(week);
  if (!input_path.empty()) {
    auto raw = mealcart::app::load_ingredient_csv(input_path, cfg.default_grocery_section);
    if (!raw) {
      std::cerr << "Failed to read ingredients from " << input_path << ": "
                << mealcart::core::to_string(raw.error()) << "\n";
      return 1;
    }
    if (verbose) dump_buckets(*raw);
    list.regenerate(mealcart::core::build_shopping_lines(*raw));
  } else {
    mealcart::app::RecipeBook book;
    mealcart::app::MealPlan plan;
    const auto ids = mealcart::app::add_seed_recipes(book);
    if (!plan_demo_week(book, ids, week, plan)) {
      return 1;
    }
    if (verbose) dump_buckets(mealcart::app::collect_week_ingredients(book, plan, week));
    mealcart::app::regenerate_week(list, book, plan);
  }

  std::vector<mealcart::core::ShoppingListLine> lines;
  for (const auto& row : list.sorted_view()) {
    lines.push_back(row.line);
  }
  const std::string text = "week=" + list.week_start() + " items=" +
                           std::to_string(lines.size()) + "\n" +
                           mealcart::app::format_shopping_list(lines);
  std::cout << text;

  if (!input_path.empty() && cfg.write_output) {
    std::filesystem::path p(input_path);
    std::filesystem::path out_dir(cfg.output_dir);
    std::filesystem::create_directories(out_dir);
    std::filesystem::path out_file = out_dir / (p.stem().string() + ".txt");
    std::ofstream f(out_file);
    if (f) {
      f << text;
    } else {
      std::cerr << "Warning: could not write " << out_file << "\n";
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    return run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
