#include <mealcart/app/ingredient_csv.hpp>
#include <mealcart/core/text.hpp>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace mealcart::app {

using mealcart::core::RawIngredientLine;
using mealcart::core::ShoppingError;

namespace {

std::vector<std::string> split_fields(std::string_view row) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const auto pos = row.find(',', start);
    if (pos == std::string_view::npos) {
      fields.push_back(mealcart::core::trim(row.substr(start)));
      break;
    }
    fields.push_back(mealcart::core::trim(row.substr(start, pos - start)));
    start = pos + 1;
  }
  return fields;
}

bool parse_quantity(const std::string& field, double& out) {
  const char* begin = field.data();
  const char* end = begin + field.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end && std::isfinite(out) && out >= 0.0;
}

}  // namespace

std::expected<std::vector<RawIngredientLine>, ShoppingError> parse_ingredient_csv(
    std::string_view text, const std::string& default_section) {
  std::vector<RawIngredientLine> lines;
  bool first_row = true;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto pos = text.find('\n', start);
    if (pos == std::string_view::npos) pos = text.size();
    const std::string row = mealcart::core::trim(text.substr(start, pos - start));
    start = pos + 1;

    if (row.empty() || row[0] == '#') continue;
    const auto fields = split_fields(row);
    if (first_row && mealcart::core::normalize(fields[0]) == "item") {
      first_row = false;
      continue;
    }
    first_row = false;

    if (fields.size() < 3 || fields[0].empty()) {
      return std::unexpected(ShoppingError::InvalidInput);
    }
    RawIngredientLine line;
    line.item = fields[0];
    if (!parse_quantity(fields[1], line.quantity)) {
      return std::unexpected(ShoppingError::InvalidInput);
    }
    line.unit = fields[2];
    line.grocery_section =
        fields.size() > 3 && !fields[3].empty() ? fields[3] : default_section;
    lines.push_back(std::move(line));
  }
  return lines;
}

std::expected<std::vector<RawIngredientLine>, ShoppingError> load_ingredient_csv(
    const std::string& path, const std::string& default_section) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(ShoppingError::LoadFailed);
  }
  std::ostringstream contents;
  contents << f.rdbuf();
  return parse_ingredient_csv(contents.str(), default_section);
}

std::string format_shopping_list(std::span<const mealcart::core::ShoppingListLine> lines) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1);
  for (const auto& l : lines) {
    out << l.item << ": " << l.quantity << " " << l.unit << " [" << l.grocery_section
        << "] (" << mealcart::core::to_string(l.source) << ")\n";
  }
  return out.str();
}

}  // namespace mealcart::app
