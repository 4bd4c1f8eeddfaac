#include "session/weighted_bpm_average.h"
#include <algorithm>

namespace PulseAnalyzer {

WeightedBpmAverage::WeightedBpmAverage(size_t history, bool squareWeights)
    : m_history(std::max<size_t>(1, history)),
      m_squareWeights(squareWeights) {
}

void WeightedBpmAverage::add(int bpm, double weight) {
    double w = std::min(1.0, std::max(0.0, weight));
    if (m_squareWeights) w *= w;

    m_entries.push_back({bpm, w});
    while (m_entries.size() > m_history) {
        m_entries.pop_front();
    }
}

double WeightedBpmAverage::average() const {
    double sum = 0.0;
    double weights = 0.0;
    for (const auto& e : m_entries) {
        sum += e.bpm * e.weight;
        weights += e.weight;
    }
    return weights > 0.0 ? sum / weights : 0.0;
}

double WeightedBpmAverage::reliability() const {
    if (m_entries.empty()) return 0.0;
    double weights = 0.0;
    for (const auto& e : m_entries) weights += e.weight;
    return weights / m_entries.size();
}

} // namespace PulseAnalyzer
