#ifndef QUORUM_GATESTATS_HPP
#define QUORUM_GATESTATS_HPP
/**
 * @file GateStats.hpp
 * @brief Statistical summaries across gate rounds (exact median, mean, stddev, CV%).
 *
 * The median is the exact order statistic (mean of the two central values for even
 * counts), never an interpolated quantile: recorded baselines were cut with that rule.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace quorum {
namespace gate {

/* --------------------------------- API --------------------------------- */

/**
 * @brief Exact median. Odd count: central value. Even count: mean of the two central values.
 * @param values Samples (taken by value; sorted locally).
 * @return 0.0 for an empty input.
 */
inline double median(std::vector<double> values) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  const std::size_t N = values.size();
  if (N % 2 == 1) {
    return values[N / 2];
  }
  return (values[N / 2 - 1] + values[N / 2]) / 2.0;
}

/** @brief Arithmetic mean; 0.0 for an empty input. */
inline double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const double VAL : values) {
    sum += VAL;
  }
  return sum / static_cast<double>(values.size());
}

/** @brief Population standard deviation; 0.0 for an empty input. */
inline double stddev(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  const double MEAN = mean(values);
  double sumSquaredDiff = 0.0;
  for (const double VAL : values) {
    const double DIFF = VAL - MEAN;
    sumSquaredDiff += DIFF * DIFF;
  }
  return std::sqrt(sumSquaredDiff / static_cast<double>(values.size()));
}

/**
 * @brief Coefficient of variation in percent: stddev / mean * 100.
 * @return 0.0 when empty or when the mean is zero.
 */
inline double cvPercent(const std::vector<double>& values) {
  const double MEAN = mean(values);
  if (values.empty() || MEAN == 0.0) {
    return 0.0;
  }
  return stddev(values) / MEAN * 100.0;
}

} // namespace gate
} // namespace quorum

#endif // QUORUM_GATESTATS_HPP
