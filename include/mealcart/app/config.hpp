#pragma once

#include <string>

namespace mealcart::app {

/// Application configuration: defaults for boundary input and CLI output.
struct AppConfig {
  std::string default_grocery_section{"other"};  // CSV rows and manual items without a section
  std::string output_dir{"output"};
  std::string week_start;                         // ISO date; empty = demo week
  bool write_output{true};
};

/// Load config from a simple key=value file (one per line, '#' comments) or use defaults.
/// Unknown keys and unrecognized write_output values are ignored.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

}  // namespace mealcart::app
