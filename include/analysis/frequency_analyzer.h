#pragma once

#include <vector>
#include <string>
#include <memory>
#include <cstdint>

#include "signal/signal_types.h"
#include "config/analyzer_config.h"

namespace PulseAnalyzer {
namespace Analysis {

/**
 * Result of one analysis cycle.
 * valid == false is the normal "no estimate" outcome, not an error.
 */
struct FrequencyEstimate {
    bool valid;
    double bpm;                         // raw, unsmoothed
    double weight;                      // [0, 1]
    int dominantBin;                    // spectral only, -1 otherwise
    std::vector<double> magnitudes;     // spectral only
    Signal::SampleSeries spectrum;      // (timestamp, magnitude) per bin
    std::string reason;                 // why no estimate

    FrequencyEstimate() : valid(false), bpm(0.0), weight(0.0), dominantBin(-1) {}

    static FrequencyEstimate none(const std::string& why) {
        FrequencyEstimate e;
        e.reason = why;
        return e;
    }
};

/**
 * Dominant pulse frequency of a conditioned window.
 * conditioned and timestampsMs are aligned, oldest first.
 */
class FrequencyAnalyzer {
public:
    virtual ~FrequencyAnalyzer() = default;

    virtual FrequencyEstimate analyze(const std::vector<double>& conditioned,
                                      const std::vector<int64_t>& timestampsMs) const = 0;

    virtual AnalysisStrategy strategy() const = 0;
};

using FrequencyAnalyzerPtr = std::unique_ptr<FrequencyAnalyzer>;

FrequencyAnalyzerPtr createFrequencyAnalyzer(const AnalyzerConfig& config);

} // namespace Analysis
} // namespace PulseAnalyzer
