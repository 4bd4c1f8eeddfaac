#pragma once

#include <vector>
#include <string>

#include "config/analyzer_config.h"
#include "signal/signal_types.h"
#include "signal/sample_buffer.h"
#include "analysis/normalizer.h"
#include "analysis/detrender.h"
#include "analysis/smoother.h"
#include "analysis/frequency_analyzer.h"

namespace PulseAnalyzer {
namespace Analysis {

// Session-level BPM smoothing state
struct RunningBpmState {
    double smoothedBpm = 0.0;
    bool valid = false;             // false until the first estimate
    long estimates = 0;
};

// Outcome of one sample through the pipeline
struct CycleResult {
    bool analyzed = false;          // window was full, pipeline ran
    bool emitted = false;           // a BPM estimate is available
    Signal::BpmEstimate estimate;
    double rawBpm = 0.0;
    Signal::SampleSeries conditioned;   // sample timestamps, conditioned values
    Signal::SampleSeries spectrum;      // empty for threshold-crossing
    std::string reason;             // why nothing was emitted
};

/**
 * BpmEstimator - per-sample pipeline for one measurement session.
 *
 *   push -> normalize -> detrend (cascade) -> EMA -> frequency -> weight
 *
 * Nothing runs until the window holds windowLength samples. Every cycle
 * recomputes from a snapshot of the raw window; the only state carried
 * between cycles is the raw window, the normalizer cycle counter and the
 * smoothed BPM.
 */
class BpmEstimator {
public:
    // Throws ConfigError if the configuration is invalid
    explicit BpmEstimator(const AnalyzerConfig& config);

    BpmEstimator(const BpmEstimator&) = delete;
    BpmEstimator& operator=(const BpmEstimator&) = delete;

    CycleResult process(const Signal::Sample& sample);

    // Start a new session: empty window, no smoothed BPM
    void reset();

    // Normalize, detrend and smooth one window of raw values
    std::vector<double> condition(const std::vector<double>& raw);

    // (1 - alpha) * previous + alpha * raw
    static double smooth(double previous, double raw, double alpha);

    const RunningBpmState& getState() const { return m_state; }
    const AnalyzerConfig& getConfig() const { return m_config; }
    const Signal::SampleBuffer& getBuffer() const { return m_buffer; }
    AnalysisStrategy getStrategy() const { return m_analyzer->strategy(); }

private:
    AnalyzerConfig m_config;
    Signal::SampleBuffer m_buffer;
    Normalizer m_normalizer;
    Detrender m_detrender;
    Smoother m_smoother;
    FrequencyAnalyzerPtr m_analyzer;
    RunningBpmState m_state;

    // Validates before any member that depends on the values is built
    static const AnalyzerConfig& validated(const AnalyzerConfig& config);
};

} // namespace Analysis
} // namespace PulseAnalyzer
