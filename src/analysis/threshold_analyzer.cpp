#include "analysis/threshold_analyzer.h"
#include <algorithm>
#include <numeric>
#include <cmath>
#include <string>

namespace PulseAnalyzer {
namespace Analysis {

double ThresholdCrossingAnalyzer::threshold(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double maxVal = *std::max_element(values.begin(), values.end());
    return (mean + maxVal) / 2.0;
}

std::vector<int> ThresholdCrossingAnalyzer::findRisingEdges(const std::vector<double>& values,
                                                            double threshold) {
    std::vector<int> edges;
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1] < threshold && values[i] >= threshold) {
            edges.push_back(static_cast<int>(i));
        }
    }
    return edges;
}

FrequencyEstimate ThresholdCrossingAnalyzer::analyze(const std::vector<double>& conditioned,
                                                     const std::vector<int64_t>& timestampsMs) const {
    if (conditioned.size() < 2 || timestampsMs.size() != conditioned.size()) {
        return FrequencyEstimate::none("window too short");
    }

    std::vector<int> edges = findRisingEdges(conditioned, threshold(conditioned));
    if (edges.size() < 2) {
        return FrequencyEstimate::none(std::to_string(edges.size()) + " rising edges");
    }

    std::vector<double> intervals;
    double bpmSum = 0.0;
    for (size_t e = 1; e < edges.size(); ++e) {
        double dt = static_cast<double>(timestampsMs[edges[e]] - timestampsMs[edges[e - 1]]);
        if (dt <= 0.0) continue;
        intervals.push_back(dt);
        bpmSum += 60000.0 / dt;
    }
    if (intervals.empty()) {
        return FrequencyEstimate::none("rising edges share a timestamp");
    }

    double meanInterval = std::accumulate(intervals.begin(), intervals.end(), 0.0) / intervals.size();
    double var = 0.0;
    for (double dt : intervals) var += (dt - meanInterval) * (dt - meanInterval);
    double cv = std::sqrt(var / intervals.size()) / meanInterval;

    FrequencyEstimate est;
    est.bpm = bpmSum / intervals.size();
    est.weight = 1.0 / (1.0 + cv);
    est.valid = true;
    return est;
}

} // namespace Analysis
} // namespace PulseAnalyzer
