#pragma once

#include "analysis/frequency_analyzer.h"

namespace PulseAnalyzer {
namespace Analysis {

/**
 * Threshold-crossing strategy (time domain).
 *
 * threshold = (mean + max) / 2. A rising edge is v[i-1] < threshold
 * and v[i] >= threshold. BPM is the average of 60000 / dt over all
 * consecutive edge pairs. Weight measures how regular the edge
 * intervals are: 1 / (1 + stddev / mean).
 */
class ThresholdCrossingAnalyzer : public FrequencyAnalyzer {
public:
    ThresholdCrossingAnalyzer() = default;

    FrequencyEstimate analyze(const std::vector<double>& conditioned,
                              const std::vector<int64_t>& timestampsMs) const override;

    AnalysisStrategy strategy() const override { return AnalysisStrategy::ThresholdCrossing; }

    // Indices of rising edges
    static std::vector<int> findRisingEdges(const std::vector<double>& values, double threshold);

    static double threshold(const std::vector<double>& values);
};

} // namespace Analysis
} // namespace PulseAnalyzer
