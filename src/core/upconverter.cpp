#include <mealcart/core/upconverter.hpp>
#include <mealcart/core/unit_taxonomy.hpp>
#include <cmath>

namespace mealcart::core {

namespace {

// Absorbs float noise from summing many contributions (e.g. 47.999999999 tsp).
constexpr double kWholeUnitTolerance = 1e-9;

double whole_units(double total, double factor) noexcept {
  return std::floor(total / factor + kWholeUnitTolerance);
}

// tsp is a tenth-rounded amount: a remainder after whole cups, or a total of at least 1 tbsp.
void append_tbsp_and_tsp(std::vector<UnitQuantity>& out, double tsp) {
  const double tbsp = whole_units(tsp, kTspPerTbsp);
  if (tbsp >= 1.0) {
    out.push_back({tbsp, "tbsp"});
    tsp = round_to_tenth(tsp - tbsp * kTspPerTbsp);
  }
  if (tsp >= 1.0) {
    out.push_back({tsp, "tsp"});
  }
}

// The total is rounded once before decomposing, so a remainder can never round up
// to a full coarser unit (95.96 tsp is 2 cups, not 1 cup and 16 tbsp).
std::vector<UnitQuantity> upconvert_volume(double total_tsp) {
  std::vector<UnitQuantity> out;
  const double rounded = round_to_tenth(total_tsp);
  const double cups = whole_units(rounded, kTspPerCup);
  if (cups >= 1.0) {
    out.push_back({cups, "cup"});
    append_tbsp_and_tsp(out, round_to_tenth(rounded - cups * kTspPerCup));
    return out;
  }
  if (whole_units(rounded, kTspPerTbsp) >= 1.0) {
    append_tbsp_and_tsp(out, rounded);
    return out;
  }
  out.push_back({rounded, "tsp"});
  return out;
}

std::vector<UnitQuantity> upconvert_weight(double total_oz) {
  std::vector<UnitQuantity> out;
  const double rounded = round_to_tenth(total_oz);
  const double lb = whole_units(rounded, kOzPerLb);
  if (lb >= 1.0) {
    out.push_back({lb, "lb"});
    const double oz = round_to_tenth(rounded - lb * kOzPerLb);
    if (oz >= 1.0) {
      out.push_back({oz, "oz"});
    }
    return out;
  }
  out.push_back({rounded, "oz"});
  return out;
}

}  // namespace

double round_to_tenth(double value) noexcept {
  return std::round(value * 10.0) / 10.0;
}

std::vector<UnitQuantity> upconvert(const UnitFamily& family, double base_total) {
  if (std::holds_alternative<Volume>(family)) {
    return upconvert_volume(base_total);
  }
  if (std::holds_alternative<Weight>(family)) {
    return upconvert_weight(base_total);
  }
  if (std::holds_alternative<Count>(family)) {
    return {{round_to_tenth(base_total), "whole"}};
  }
  return {{round_to_tenth(base_total), std::get<Other>(family).unit}};
}

}  // namespace mealcart::core
