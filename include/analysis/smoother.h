#pragma once

#include <vector>

namespace PulseAnalyzer {
namespace Analysis {

/**
 * Forward exponential moving average over one window.
 *   ema[0] = v[0]
 *   ema[i] = v[i] * ratio + ema[i-1] * (1 - ratio)
 */
class Smoother {
public:
    explicit Smoother(double ratio) : m_ratio(ratio) {}

    // ratio = emaConstant / (windowLength + 1)
    static Smoother forWindow(double emaConstant, int windowLength) {
        return Smoother(emaConstant / (windowLength + 1));
    }

    std::vector<double> process(const std::vector<double>& values) const;

    double getRatio() const { return m_ratio; }

private:
    double m_ratio;
};

} // namespace Analysis
} // namespace PulseAnalyzer
