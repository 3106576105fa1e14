#include <mealcart/core/unit_family.hpp>

namespace mealcart::core {

std::string family_name(const UnitFamily& family) {
  if (std::holds_alternative<Volume>(family)) return "volume";
  if (std::holds_alternative<Weight>(family)) return "weight";
  if (std::holds_alternative<Count>(family)) return "count";
  return "other:" + std::get<Other>(family).unit;
}

}  // namespace mealcart::core
