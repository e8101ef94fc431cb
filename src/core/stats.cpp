#include "core/stats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace auditfusion::stats {

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double sample_stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double sum_sq = 0.0;
    for (const double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double median(std::vector<double> values) {
    return quantile(std::move(values), 0.5);
}

double quantile(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    q = std::clamp(q, 0.0, 1.0);
    std::sort(values.begin(), values.end());

    const double pos = q * static_cast<double>(values.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(pos));
    const auto hi = static_cast<size_t>(std::ceil(pos));
    const double frac = pos - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

std::vector<double> percentile_ranks(const std::vector<double>& values) {
    const size_t n = values.size();
    std::vector<double> ranks(n, 0.0);
    if (n == 0) return ranks;

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&](size_t a, size_t b) { return values[a] < values[b]; });

    // Walk runs of equal values and assign each the mean of its 1-based ranks
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && values[order[j + 1]] == values[order[i]]) ++j;
        const double avg_rank = (static_cast<double>(i + 1) + static_cast<double>(j + 1)) / 2.0;
        for (size_t k = i; k <= j; ++k) {
            ranks[order[k]] = avg_rank / static_cast<double>(n);
        }
        i = j + 1;
    }
    return ranks;
}

std::vector<std::vector<double>> robust_scale(const std::vector<std::vector<double>>& rows) {
    if (rows.empty()) return {};
    const size_t dims = rows.front().size();
    std::vector<std::vector<double>> scaled = rows;

    std::vector<double> column(rows.size());
    for (size_t d = 0; d < dims; ++d) {
        for (size_t r = 0; r < rows.size(); ++r) {
            column[r] = rows[r][d];
        }
        const double center = median(column);
        const double iqr = quantile(column, 0.75) - quantile(column, 0.25);
        const double scale = (iqr > 0.0) ? iqr : 1.0;
        for (size_t r = 0; r < rows.size(); ++r) {
            scaled[r][d] = (rows[r][d] - center) / scale;
        }
    }
    return scaled;
}

double squared_distance(const std::vector<double>& a, const std::vector<double>& b) {
    double sum = 0.0;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        const double d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

} // namespace auditfusion::stats
