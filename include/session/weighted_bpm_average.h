#pragma once

#include <deque>
#include <cstddef>

namespace PulseAnalyzer {

/**
 * Consumer-side aggregation of (bpm, weight) readings.
 *
 * Keeps the most recent `history` readings. Weights are squared on
 * insertion so ambiguous readings count super-linearly less.
 *   average()     = sum(bpm * w^2) / sum(w^2)
 *   reliability() = sum(w^2) / count
 */
class WeightedBpmAverage {
public:
    explicit WeightedBpmAverage(size_t history = 50, bool squareWeights = true);

    void add(int bpm, double weight);

    // 0 while empty or while all weights are 0
    double average() const;
    double reliability() const;

    size_t count() const { return m_entries.size(); }
    void clear() { m_entries.clear(); }

private:
    struct Entry {
        int bpm;
        double weight;
    };

    std::deque<Entry> m_entries;
    size_t m_history;
    bool m_squareWeights;
};

} // namespace PulseAnalyzer
