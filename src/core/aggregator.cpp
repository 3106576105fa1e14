#include <mealcart/core/aggregator.hpp>
#include <mealcart/core/text.hpp>
#include <mealcart/core/unit_classifier.hpp>
#include <utility>

namespace mealcart::core {

BucketMap aggregate(std::span<const RawIngredientLine> lines) {
  BucketMap buckets;
  for (const auto& line : lines) {
    UnitClassification unit = classify(line.unit);
    AggregationKey key{normalize(line.item), std::move(unit.family)};

    auto it = buckets.find(key);
    if (it == buckets.end()) {
      AggregationBucket bucket;
      bucket.key = key;
      bucket.display_text = trim(line.item);
      bucket.grocery_section = line.grocery_section;
      it = buckets.emplace(std::move(key), std::move(bucket)).first;
    }
    it->second.base_total += line.quantity * unit.base_factor;
    ++it->second.contributions;
  }
  return buckets;
}

}  // namespace mealcart::core
