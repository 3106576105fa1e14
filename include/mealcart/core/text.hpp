#pragma once

#include <string>
#include <string_view>

namespace mealcart::core {

/// Copy of s without leading/trailing whitespace (space, tab, CR, LF).
[[nodiscard]] std::string trim(std::string_view s);

/// Trimmed, ASCII-lowercased copy of s; identity used for item and unit matching.
[[nodiscard]] std::string normalize(std::string_view s);

}  // namespace mealcart::core
