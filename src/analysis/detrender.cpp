#include "analysis/detrender.h"
#include <algorithm>
#include <cstddef>
#include <numeric>

namespace PulseAnalyzer {
namespace Analysis {

std::vector<double> Detrender::trend(const std::vector<double>& values, int spread) {
    const int n = static_cast<int>(values.size());
    std::vector<double> result(n, 0.0);
    if (n == 0) return result;

    if (spread <= 0 || n < 2 * spread) {
        double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
        std::fill(result.begin(), result.end(), mean);
        return result;
    }

    const int width = 2 * spread;
    const int first = spread;
    const int last = n - spread;

    // Sliding sum over [i - spread, i + spread)
    double sum = std::accumulate(values.begin(), values.begin() + width, 0.0);
    result[first] = sum / width;
    for (int i = first + 1; i <= last; ++i) {
        sum += values[i + spread - 1] - values[i - spread - 1];
        result[i] = sum / width;
    }

    // Edge replication
    for (int i = 0; i < first; ++i) result[i] = result[first];
    for (int i = last + 1; i < n; ++i) result[i] = result[last];

    return result;
}

std::vector<double> Detrender::detrend(const std::vector<double>& values, int spread) {
    std::vector<double> t = trend(values, spread);
    std::vector<double> out(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        out[i] = values[i] - t[i];
    }
    return out;
}

std::vector<double> Detrender::cascade(const std::vector<double>& values,
                                       const std::vector<int>& spreads) {
    std::vector<double> out = values;
    for (int spread : spreads) {
        out = detrend(out, spread);
    }
    return out;
}

} // namespace Analysis
} // namespace PulseAnalyzer
