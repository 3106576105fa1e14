#include <mealcart/core/ingredient.hpp>

namespace mealcart::core {

const char* to_string(LineSource s) noexcept {
  switch (s) {
    case LineSource::Generated:
      return "generated";
    case LineSource::Manual:
      return "manual";
  }
  return "generated";
}

}  // namespace mealcart::core
