#pragma once

#include <mealcart/core/unit_family.hpp>
#include <string>
#include <vector>

namespace mealcart::core {

/// One display amount, e.g. {1.0, "cup"}.
struct UnitQuantity {
  double quantity{0.0};
  std::string unit;
};

/// Rounds half away from zero to one decimal place.
[[nodiscard]] double round_to_tenth(double value) noexcept;

/// Expresses a base-unit total in display units, largest unit first.
///
/// Volume (tsp base): whole cups, then whole tbsp, then a tsp remainder.
/// Weight (oz base): whole lb, then an oz remainder.
/// Count and Other: the rounded total in "whole" or the Other unit.
///
/// Thresholds are inclusive (48 tsp is 1 cup, 3 tsp is 1 tbsp, 16 oz is 1 lb) and a
/// total that reaches a coarser unit is never expressed only in a finer one.
/// Volume and weight totals are rounded to one decimal before they are decomposed,
/// so a remainder never reaches a coarser unit; a remainder below one base unit is dropped.
[[nodiscard]] std::vector<UnitQuantity> upconvert(const UnitFamily& family,
                                                  double base_total);

}  // namespace mealcart::core
