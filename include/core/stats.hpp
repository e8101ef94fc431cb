#pragma once

#include <cstddef>
#include <vector>

namespace auditfusion::stats {

/// Arithmetic mean; 0 for empty input.
[[nodiscard]] double mean(const std::vector<double>& values);

/// Sample standard deviation (n-1); 0 when fewer than two values.
[[nodiscard]] double sample_stddev(const std::vector<double>& values);

/// Median; 0 for empty input.
[[nodiscard]] double median(std::vector<double> values);

/**
 * @brief Quantile with linear interpolation between closest ranks.
 * @param q Quantile in [0, 1] (clamped)
 */
[[nodiscard]] double quantile(std::vector<double> values, double q);

/**
 * @brief Percentile rank of each value, ties receive their average rank.
 * Result[i] = average_rank(values[i]) / n, in (0, 1].
 */
[[nodiscard]] std::vector<double> percentile_ranks(const std::vector<double>& values);

/**
 * @brief Robust scaling of a row-major matrix, column-wise:
 * (x - median) / IQR, where IQR == 0 leaves the column centered only.
 */
[[nodiscard]] std::vector<std::vector<double>> robust_scale(
    const std::vector<std::vector<double>>& rows);

[[nodiscard]] double squared_distance(const std::vector<double>& a, const std::vector<double>& b);

} // namespace auditfusion::stats
