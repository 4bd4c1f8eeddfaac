#include "analysis/normalizer.h"
#include <algorithm>
#include <cstddef>

namespace PulseAnalyzer {
namespace Analysis {

namespace {

// Fraction of the window range, 0..1. Flat window -> all 0.
std::vector<double> toUnitRange(const std::vector<double>& values) {
    std::vector<double> out(values.size(), 0.0);
    if (values.empty()) return out;

    auto mm = std::minmax_element(values.begin(), values.end());
    double absMin = *mm.first;
    double absMax = *mm.second;
    double range = absMax - absMin;
    if (range <= 0.0) return out;

    for (std::size_t i = 0; i < values.size(); ++i) {
        out[i] = (values[i] - absMin) / range;
    }
    return out;
}

} // namespace

Normalizer::Normalizer(int windowLength, int blockSize)
    : m_windowLength(std::max(1, windowLength)),
      m_blockSize(std::max(1, blockSize)),
      m_invocations(0) {
}

bool Normalizer::nextIsRecalibration() const {
    return (m_invocations + 1) % m_windowLength == 0;
}

std::vector<double> Normalizer::process(const std::vector<double>& values) {
    bool recalibrate = nextIsRecalibration();
    m_invocations++;
    return recalibrate ? rescaleClamped(values, m_blockSize) : rescale(values);
}

std::vector<double> Normalizer::rescale(const std::vector<double>& values) {
    std::vector<double> out = toUnitRange(values);
    for (auto& v : out) v *= SCALE;
    return out;
}

std::vector<double> Normalizer::rescaleClamped(const std::vector<double>& values, int blockSize) {
    std::vector<double> unit = toUnitRange(values);
    if (blockSize <= 0) blockSize = 1;

    // Averaged block extrema; a trailing partial block is ignored
    int numBlocks = static_cast<int>(unit.size()) / blockSize;
    double lo = 0.0;
    double hi = 1.0;
    if (numBlocks > 0) {
        double sumMin = 0.0;
        double sumMax = 0.0;
        for (int b = 0; b < numBlocks; ++b) {
            auto first = unit.begin() + b * blockSize;
            auto mm = std::minmax_element(first, first + blockSize);
            sumMin += *mm.first;
            sumMax += *mm.second;
        }
        lo = sumMin / numBlocks;
        hi = sumMax / numBlocks;
    }

    for (auto& v : unit) {
        v = std::min(std::max(v, lo), hi) * SCALE;
    }
    return unit;
}

} // namespace Analysis
} // namespace PulseAnalyzer
