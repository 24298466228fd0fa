// Repository: TermReel
// Component: Distance Band Table
// Copyright (c) 2025 TermReel

#include "termreel/sensor/DistanceBandTable.hpp"

#include <algorithm>
#include <utility>

namespace termreel::sensor {

DistanceBandTable::DistanceBandTable(std::vector<DistanceBand> bands, std::string fallback)
    : bands_(std::move(bands)), fallback_(std::move(fallback)) {
  std::stable_sort(bands_.begin(), bands_.end(),
                   [](const DistanceBand& a, const DistanceBand& b) {
                     return a.upper_bound < b.upper_bound;
                   });
}

DistanceBandTable DistanceBandTable::Default(const std::string& idle, const std::string& laugh,
                                             const std::string& curious,
                                             const std::string& annoyed,
                                             const std::string& angry) {
  return DistanceBandTable({{20, laugh}, {40, curious}, {60, annoyed}, {80, angry}}, idle);
}

const std::string& DistanceBandTable::Lookup(double value) const {
  const int truncated = static_cast<int>(value);
  for (const auto& band : bands_) {
    if (truncated < band.upper_bound) {
      return band.identifier;
    }
  }
  return fallback_;
}

}  // namespace termreel::sensor
