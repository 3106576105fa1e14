#include <mealcart/core/unit_taxonomy.hpp>

namespace mealcart::core {

const UnitDefinition* find_unit(std::string_view normalized_unit) noexcept {
  for (const auto& def : kUnitTable) {
    if (def.name == normalized_unit) {
      return &def;
    }
  }
  return nullptr;
}

UnitFamily to_family(FamilyKind kind) {
  switch (kind) {
    case FamilyKind::Volume:
      return Volume{};
    case FamilyKind::Weight:
      return Weight{};
    case FamilyKind::Count:
      return Count{};
  }
  return Count{};
}

}  // namespace mealcart::core
