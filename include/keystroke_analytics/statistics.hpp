#pragma once

#include <cmath>
#include <numeric>
#include <optional>
#include <vector>

namespace ks::analytics::stats {

inline std::optional<double> mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Population variance (divides by N).
inline std::optional<double> variance(const std::vector<double>& values) {
    auto avg = mean(values);
    if (!avg) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += (v - *avg) * (v - *avg);
    }
    return sum / static_cast<double>(values.size());
}

inline std::optional<double> standardDeviation(const std::vector<double>& values) {
    auto var = variance(values);
    if (!var) {
        return std::nullopt;
    }
    return std::sqrt(*var);
}

// Halves round towards positive infinity, so -2.5 becomes -2.
inline long roundHalfUp(double value) {
    return static_cast<long>(std::floor(value + 0.5));
}

inline double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::floor(value * scale + 0.5) / scale;
}

}  // namespace ks::analytics::stats
