#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "config/analyzer_config.h"
#include "signal/signal_types.h"
#include "analysis/bpm_estimator.h"

namespace PulseAnalyzer {

/**
 * MeasurementSession - one heart rate measurement.
 *
 * Owns the estimator (rolling window + smoothed BPM) and enforces
 * back-pressure: after a frame is accepted the session stays busy until
 * minSampleDelayMs has passed on the frame clock. Frames offered while
 * busy are dropped, never queued.
 *
 * Callbacks run synchronously inside offer().
 */
class MeasurementSession {
public:
    using BpmCallback = std::function<void(int bpm, double weight)>;
    using SeriesCallback = std::function<void(const Signal::SampleSeries&)>;
    using SignalQualityCallback = std::function<void(bool present)>;
    using FingerPredicate = std::function<bool(const Signal::Rgb&)>;

    // Throws ConfigError for an invalid configuration
    explicit MeasurementSession(const AnalyzerConfig& config);

    MeasurementSession(const MeasurementSession&) = delete;
    MeasurementSession& operator=(const MeasurementSession&) = delete;

    // true: processed. false: dropped (busy)
    bool offer(const Signal::Frame& frame);

    // Busy at the given frame time?
    bool isBusy(int64_t timestampMs) const;

    // Discard window and running BPM, keep callbacks
    void reset();

    void setBpmCallback(BpmCallback cb) { m_bpmCallback = std::move(cb); }
    void setRawDataCallback(SeriesCallback cb) { m_rawDataCallback = std::move(cb); }
    void setSpectrumCallback(SeriesCallback cb) { m_spectrumCallback = std::move(cb); }
    void setSignalQualityCallback(SignalQualityCallback cb) { m_qualityCallback = std::move(cb); }

    // Replaces the configured red/green/blue thresholds
    void setFingerPredicate(FingerPredicate predicate) { m_fingerPredicate = std::move(predicate); }

    // red > redMin && green < greenMax && blue < blueMax
    static FingerPredicate thresholdPredicate(double redMin, double greenMax, double blueMax);

    uint64_t getAcceptedCount() const { return m_accepted.load(std::memory_order_relaxed); }
    uint64_t getDroppedCount() const { return m_dropped.load(std::memory_order_relaxed); }
    uint64_t getEmittedCount() const { return m_emitted.load(std::memory_order_relaxed); }

    // Last emitted reading (bpm == 0 before the first one)
    Signal::BpmEstimate getLastEstimate() const;

    const AnalyzerConfig& getConfig() const { return m_estimator.getConfig(); }

private:
    Analysis::BpmEstimator m_estimator;

    BpmCallback m_bpmCallback;
    SeriesCallback m_rawDataCallback;
    SeriesCallback m_spectrumCallback;
    SignalQualityCallback m_qualityCallback;
    FingerPredicate m_fingerPredicate;

    std::atomic<bool> m_processing{false};
    std::atomic<bool> m_hasAccepted{false};
    std::atomic<int64_t> m_busyUntilMs{0};

    std::atomic<uint64_t> m_accepted{0};
    std::atomic<uint64_t> m_dropped{0};
    std::atomic<uint64_t> m_emitted{0};
    std::atomic<int> m_lastBpm{0};
    std::atomic<double> m_lastWeight{0.0};
};

} // namespace PulseAnalyzer
