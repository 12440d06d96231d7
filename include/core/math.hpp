#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace decision_agent::core {

inline constexpr double clamp_non_negative(const double value) noexcept {
  return value < 0.0 ? 0.0 : value;
}

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

// Linear interpolation between closest ranks; `sorted` must be ascending.
inline double percentile(const std::vector<double>& sorted, const double p) {
  if (sorted.empty()) {
    return 0.0;
  }
  const double rank = (p / 100.0) * static_cast<double>(sorted.size() - 1);
  const auto lower = static_cast<std::size_t>(std::floor(rank));
  const auto upper = static_cast<std::size_t>(std::ceil(rank));
  if (lower == upper) {
    return sorted[lower];
  }
  const double weight = rank - static_cast<double>(lower);
  return (sorted[lower] * (1.0 - weight)) + (sorted[upper] * weight);
}

}  // namespace decision_agent::core
