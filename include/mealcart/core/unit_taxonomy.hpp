#pragma once

#include <mealcart/core/unit_family.hpp>
#include <array>
#include <cstdint>
#include <string_view>

namespace mealcart::core {

/// Families with a conversion ladder. Other is not listed: it has no table entries.
enum class FamilyKind : std::uint8_t {
  Volume,
  Weight,
  Count,
};

/// One recognized unit spelling: which family, its canonical spelling, and its
/// factor to the family's base unit.
struct UnitDefinition {
  std::string_view name;
  std::string_view canonical;
  FamilyKind kind;
  double base_factor;
};

/// Every recognized unit. Factors are exact and non-zero.
inline constexpr std::array<UnitDefinition, 8> kUnitTable{{
    {"tsp", "tsp", FamilyKind::Volume, 1.0},
    {"tbsp", "tbsp", FamilyKind::Volume, 3.0},
    {"cup", "cup", FamilyKind::Volume, 48.0},
    {"oz", "oz", FamilyKind::Weight, 1.0},
    {"lb", "lb", FamilyKind::Weight, 16.0},
    {"whole", "whole", FamilyKind::Count, 1.0},
    {"piece", "whole", FamilyKind::Count, 1.0},
    {"each", "whole", FamilyKind::Count, 1.0},
}};

inline constexpr double kTspPerTbsp = 3.0;
inline constexpr double kTspPerCup = 48.0;
inline constexpr double kOzPerLb = 16.0;

/// Looks up an already-normalized unit spelling; nullptr if unrecognized.
[[nodiscard]] const UnitDefinition* find_unit(std::string_view normalized_unit) noexcept;

/// UnitFamily value for a table family.
[[nodiscard]] UnitFamily to_family(FamilyKind kind);

}  // namespace mealcart::core
