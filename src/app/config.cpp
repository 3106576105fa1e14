#include <mealcart/app/config.hpp>
#include <mealcart/core/text.hpp>
#include <fstream>
#include <string_view>

namespace mealcart::app {

namespace {

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key = mealcart::core::trim(line.substr(0, pos));
  value = mealcart::core::trim(line.substr(pos + 1));
  return !key.empty();
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.default_grocery_section = "other";
  c.output_dir = "output";
  c.week_start = "";
  c.write_output = true;
  return c;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string raw;
  std::string key;
  std::string value;
  while (std::getline(f, raw)) {
    const std::string line = mealcart::core::trim(raw);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "default_grocery_section") {
      if (!value.empty()) c.default_grocery_section = value;
    }
    else if (key == "output_dir") c.output_dir = value;
    else if (key == "week_start") c.week_start = value;
    else if (key == "write_output") {
      if (value == "true" || value == "1") c.write_output = true;
      else if (value == "false" || value == "0") c.write_output = false;
    }
  }
  return c;
}

}  // namespace mealcart::app
