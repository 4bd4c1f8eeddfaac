#include "session/measurement_session.h"
#include "util/logging.h"

#include <string>

namespace PulseAnalyzer {

namespace {

// Clears the busy flag even if a consumer callback throws
struct ProcessingGuard {
    std::atomic<bool>& flag;
    ~ProcessingGuard() { flag.store(false, std::memory_order_release); }
};

} // namespace

MeasurementSession::MeasurementSession(const AnalyzerConfig& config)
    : m_estimator(config),
      m_fingerPredicate(thresholdPredicate(config.fingerRedMin,
                                           config.fingerGreenMax,
                                           config.fingerBlueMax)) {
    LOG_DEBUG("Session: " + config.toString());
}

MeasurementSession::FingerPredicate
MeasurementSession::thresholdPredicate(double redMin, double greenMax, double blueMax) {
    return [redMin, greenMax, blueMax](const Signal::Rgb& rgb) {
        return rgb.red > redMin && rgb.green < greenMax && rgb.blue < blueMax;
    };
}

bool MeasurementSession::isBusy(int64_t timestampMs) const {
    if (m_processing.load(std::memory_order_acquire)) return true;
    return m_hasAccepted.load(std::memory_order_relaxed) &&
           timestampMs < m_busyUntilMs.load(std::memory_order_relaxed);
}

void MeasurementSession::reset() {
    m_estimator.reset();
    m_hasAccepted.store(false, std::memory_order_relaxed);
    m_busyUntilMs.store(0, std::memory_order_relaxed);
    m_lastBpm.store(0, std::memory_order_relaxed);
    m_lastWeight.store(0.0, std::memory_order_relaxed);
}

Signal::BpmEstimate MeasurementSession::getLastEstimate() const {
    return Signal::BpmEstimate(m_lastBpm.load(std::memory_order_relaxed),
                               m_lastWeight.load(std::memory_order_relaxed));
}

bool MeasurementSession::offer(const Signal::Frame& frame) {
    const int64_t now = frame.sample.timestampMs;

    // A cycle is still running (re-entrant or concurrent offer)
    if (m_processing.exchange(true, std::memory_order_acq_rel)) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    ProcessingGuard guard{m_processing};

    // Frame clock is only written while the flag is held
    if (m_hasAccepted.load(std::memory_order_relaxed) &&
        now < m_busyUntilMs.load(std::memory_order_relaxed)) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    m_busyUntilMs.store(now + getConfig().minSampleDelayMs, std::memory_order_relaxed);
    m_hasAccepted.store(true, std::memory_order_relaxed);
    m_accepted.fetch_add(1, std::memory_order_relaxed);

    if (frame.hasColor && m_qualityCallback) {
        m_qualityCallback(m_fingerPredicate(frame.color));
    }

    Analysis::CycleResult cycle = m_estimator.process(frame.sample);

    if (cycle.analyzed) {
        if (m_rawDataCallback) {
            m_rawDataCallback(cycle.conditioned);
        }
        if (m_spectrumCallback && !cycle.spectrum.empty()) {
            m_spectrumCallback(cycle.spectrum);
        }
    }

    if (cycle.emitted) {
        m_lastBpm.store(cycle.estimate.bpm, std::memory_order_relaxed);
        m_lastWeight.store(cycle.estimate.weight, std::memory_order_relaxed);
        m_emitted.fetch_add(1, std::memory_order_relaxed);
        if (m_bpmCallback) {
            m_bpmCallback(cycle.estimate.bpm, cycle.estimate.weight);
        }
    } else if (cycle.analyzed) {
        LOG_DEBUG("No estimate at t=" + std::to_string(now) + ": " + cycle.reason);
    }

    return true;
}

} // namespace PulseAnalyzer
