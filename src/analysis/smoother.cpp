#include "analysis/smoother.h"
#include <cstddef>

namespace PulseAnalyzer {
namespace Analysis {

std::vector<double> Smoother::process(const std::vector<double>& values) const {
    std::vector<double> ema(values.size());
    if (values.empty()) return ema;

    ema[0] = values[0];
    for (std::size_t i = 1; i < values.size(); ++i) {
        ema[i] = values[i] * m_ratio + ema[i - 1] * (1.0 - m_ratio);
    }
    return ema;
}

} // namespace Analysis
} // namespace PulseAnalyzer
