#include "analysis/bpm_estimator.h"

#include <cmath>
#include <string>

namespace PulseAnalyzer {
namespace Analysis {

const AnalyzerConfig& BpmEstimator::validated(const AnalyzerConfig& config) {
    config.validate();
    return config;
}

BpmEstimator::BpmEstimator(const AnalyzerConfig& config)
    : m_config(validated(config)),
      m_buffer(m_config.windowLength),
      m_normalizer(m_config.windowLength, m_config.normalizeBlock),
      m_detrender(m_config.detrendSpreads),
      m_smoother(Smoother::forWindow(m_config.emaConstant, m_config.windowLength)),
      m_analyzer(createFrequencyAnalyzer(m_config)) {
}

double BpmEstimator::smooth(double previous, double raw, double alpha) {
    return (1.0 - alpha) * previous + alpha * raw;
}

void BpmEstimator::reset() {
    m_buffer.clear();
    m_normalizer.reset();
    m_state = RunningBpmState{};
}

std::vector<double> BpmEstimator::condition(const std::vector<double>& raw) {
    std::vector<double> values = m_normalizer.process(raw);
    values = m_detrender.cascade(values);
    return m_smoother.process(values);
}

CycleResult BpmEstimator::process(const Signal::Sample& sample) {
    CycleResult result;
    m_buffer.push(sample);

    // Warm-up: the first estimate needs a full window
    if (!m_buffer.isFull()) {
        result.reason = "warm-up " + std::to_string(m_buffer.size()) + "/" +
                        std::to_string(m_buffer.capacity());
        return result;
    }

    Signal::SampleSeries window = m_buffer.snapshot();
    std::vector<double> raw(window.size());
    std::vector<int64_t> timestamps(window.size());
    for (size_t i = 0; i < window.size(); ++i) {
        raw[i] = window[i].value;
        timestamps[i] = window[i].timestampMs;
    }

    std::vector<double> conditioned = condition(raw);
    result.analyzed = true;
    result.conditioned.reserve(window.size());
    for (size_t i = 0; i < window.size(); ++i) {
        result.conditioned.emplace_back(timestamps[i], conditioned[i]);
    }

    FrequencyEstimate freq = m_analyzer->analyze(conditioned, timestamps);
    result.spectrum = std::move(freq.spectrum);

    if (!freq.valid || !std::isfinite(freq.bpm)) {
        result.reason = freq.reason.empty() ? "no estimate" : freq.reason;
        return result;
    }

    // First estimate of a session seeds the running value
    if (m_state.valid) {
        m_state.smoothedBpm = smooth(m_state.smoothedBpm, freq.bpm, m_config.alpha);
    } else {
        m_state.smoothedBpm = freq.bpm;
        m_state.valid = true;
    }
    m_state.estimates++;

    result.rawBpm = freq.bpm;
    result.estimate = Signal::BpmEstimate(static_cast<int>(std::lround(m_state.smoothedBpm)),
                                          freq.weight);
    result.emitted = true;
    return result;
}

} // namespace Analysis
} // namespace PulseAnalyzer
