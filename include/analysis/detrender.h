#pragma once

#include <vector>

namespace PulseAnalyzer {
namespace Analysis {

/**
 * Detrender - subtracts a centered moving average (baseline wander).
 *
 * Trend at interior index i (spread <= i <= n - spread) is the mean of
 * [i - spread, i + spread), kept as a sliding sum. Indices closer to an
 * edge reuse the nearest interior trend. Windows shorter than 2 * spread
 * have no interior index and use the window mean.
 */
class Detrender {
public:
    Detrender() = default;

    // Spreads are applied in order, each on the previous output
    explicit Detrender(const std::vector<int>& spreads) : m_spreads(spreads) {}

    std::vector<double> cascade(const std::vector<double>& values) const {
        return cascade(values, m_spreads);
    }

    static std::vector<double> cascade(const std::vector<double>& values,
                                       const std::vector<int>& spreads);

    static std::vector<double> detrend(const std::vector<double>& values, int spread);

    // Trend line only (same length as values)
    static std::vector<double> trend(const std::vector<double>& values, int spread);

    const std::vector<int>& getSpreads() const { return m_spreads; }

private:
    std::vector<int> m_spreads = {25, 10, 5};
};

} // namespace Analysis
} // namespace PulseAnalyzer
