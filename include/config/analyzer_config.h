#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#include "config/env_config.h"

namespace PulseAnalyzer {

/**
 * Invalid pipeline/session configuration. Thrown at construction time,
 * values are never clamped silently.
 */
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

enum class AnalysisStrategy {
    Spectral,
    ThresholdCrossing
};

std::string strategyToString(AnalysisStrategy strategy);

// Throws ConfigError for unknown names
AnalysisStrategy parseStrategy(const std::string& name);

/**
 * Configuration of one measurement session.
 */
struct AnalyzerConfig {
    int windowLength = 50;                  // N, samples in the rolling window
    int edgeCutoff = 6;                     // trimmed from each edge before the DFT
    std::vector<int> detrendSpreads = {25, 10, 5};
    int normalizeBlock = 10;                // block size for averaged extrema
    double emaConstant = 20.0;              // K, in-window EMA ratio = K / (N + 1)
    double alpha = 0.6;                     // session BPM smoothing, (0, 1]
    int minSampleDelayMs = 50;              // busy time after an accepted sample
    AnalysisStrategy strategy = AnalysisStrategy::Spectral;

    // Finger presence: red > redMin && green < greenMax && blue < blueMax
    double fingerRedMin = 150.0;
    double fingerGreenMax = 100.0;
    double fingerBlueMax = 50.0;

    double emaRatio() const {
        return emaConstant / (windowLength + 1);
    }

    int trimmedLength() const {
        return windowLength - 2 * edgeCutoff;
    }

    // Throws ConfigError describing the first invalid field
    void validate() const;

    std::string toString() const;

    // Keys: WINDOW_LENGTH, EDGE_CUTOFF, DETREND_SPREADS, NORMALIZE_BLOCK,
    // EMA_CONSTANT, BPM_ALPHA, MIN_SAMPLE_DELAY_MS, STRATEGY,
    // FINGER_RED_MIN, FINGER_GREEN_MAX, FINGER_BLUE_MAX.
    // Unparsable numbers keep the default (logged). Not validated here.
    static AnalyzerConfig fromEnv(const EnvConfig& env);
};

} // namespace PulseAnalyzer
