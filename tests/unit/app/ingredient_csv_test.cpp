#include <mealcart/app/ingredient_csv.hpp>
#include <mealcart/core/error.hpp>
#include <mealcart/core/ingredient.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ma = mealcart::app;
namespace mc = mealcart::core;

TEST(IngredientCsv, ParsesRowsWithHeaderAndComments) {
  const std::string text =
      "item,quantity,unit,grocery_section\n"
      "# Monday\n"
      "flour, 2, cup, baking\n"
      "\n"
      "egg,1,whole\n"
      "Beef ,0.333,LB,meat\r\n";
  const auto lines = ma::parse_ingredient_csv(text, "misc");
  ASSERT_TRUE(lines.has_value());
  ASSERT_EQ(lines->size(), 3u);
  EXPECT_EQ((*lines)[0].item, "flour");
  EXPECT_DOUBLE_EQ((*lines)[0].quantity, 2.0);
  EXPECT_EQ((*lines)[0].unit, "cup");
  EXPECT_EQ((*lines)[0].grocery_section, "baking");
  EXPECT_EQ((*lines)[1].grocery_section, "misc");
  EXPECT_EQ((*lines)[2].item, "Beef");
  EXPECT_DOUBLE_EQ((*lines)[2].quantity, 0.333);
  EXPECT_EQ((*lines)[2].unit, "LB");
}

TEST(IngredientCsv, EmptyTextGivesNoLines) {
  const auto lines = ma::parse_ingredient_csv("");
  ASSERT_TRUE(lines.has_value());
  EXPECT_TRUE(lines->empty());
}

TEST(IngredientCsv, RejectsMalformedRows) {
  for (const char* text : {"flour,2\n", ",2,cup\n", "flour,two,cup\n", "flour,-1,cup\n",
                           "flour,2x,cup\n", "flour,nan,cup\n", "flour,inf,cup\n"}) {
    const auto lines = ma::parse_ingredient_csv(text);
    ASSERT_FALSE(lines.has_value()) << text;
    EXPECT_EQ(lines.error(), mc::ShoppingError::InvalidInput) << text;
  }
}

TEST(IngredientCsv, ZeroQuantityAccepted) {
  const auto lines = ma::parse_ingredient_csv("water,0,cup\n");
  ASSERT_TRUE(lines.has_value());
  EXPECT_DOUBLE_EQ((*lines)[0].quantity, 0.0);
}

TEST(IngredientCsv, MissingFileIsLoadFailed) {
  const auto lines = ma::load_ingredient_csv("/nonexistent/ingredients.csv");
  ASSERT_FALSE(lines.has_value());
  EXPECT_EQ(lines.error(), mc::ShoppingError::LoadFailed);
}

TEST(IngredientCsv, LoadsFromFile) {
  const auto path = std::filesystem::temp_directory_path() / "mealcart_csv_test.csv";
  {
    std::ofstream f(path);
    f << "salt,2,tsp,spices\nsalt,1,tsp,spices\n";
  }
  const auto lines = ma::load_ingredient_csv(path.string());
  ASSERT_TRUE(lines.has_value());
  EXPECT_EQ(lines->size(), 2u);
  std::filesystem::remove(path);
}

TEST(IngredientCsv, FormatOneRowPerLine) {
  const std::vector<mc::ShoppingListLine> lines = {
      {"flour", 3.0, "cup", "baking", mc::LineSource::Generated},
      {"batteries", 4.0, "each", "other", mc::LineSource::Manual},
  };
  EXPECT_EQ(ma::format_shopping_list(lines),
            "flour: 3.0 cup [baking] (generated)\n"
            "batteries: 4.0 each [other] (manual)\n");
}

TEST(ErrorNames, Stable) {
  EXPECT_EQ(mc::to_string(mc::ShoppingError::InvalidInput), "InvalidInput");
  EXPECT_EQ(mc::to_string(mc::ShoppingError::ItemNotFound), "ItemNotFound");
}
