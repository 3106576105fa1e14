#include <mealcart/core/unit_classifier.hpp>
#include <mealcart/core/text.hpp>
#include <mealcart/core/unit_taxonomy.hpp>
#include <utility>

namespace mealcart::core {

UnitClassification classify(std::string_view unit) {
  std::string normalized = normalize(unit);
  if (const UnitDefinition* def = find_unit(normalized)) {
    return UnitClassification{to_family(def->kind), std::string(def->canonical),
                              def->base_factor};
  }
  UnitClassification c;
  c.family = Other{normalized};
  c.canonical_unit = std::move(normalized);
  c.base_factor = 1.0;
  return c;
}

}  // namespace mealcart::core
