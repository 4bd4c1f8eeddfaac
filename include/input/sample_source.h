#pragma once

#include <istream>
#include <memory>
#include <random>
#include <string>

#include "signal/signal_types.h"

namespace PulseAnalyzer {
namespace Input {

/**
 * Stand-in for the camera capture side: yields one frame per call.
 */
class SampleSource {
public:
    virtual ~SampleSource() = default;

    // false = end of stream
    virtual bool next(Signal::Frame& frame) = 0;

    virtual std::string describe() const = 0;
};

using SampleSourcePtr = std::unique_ptr<SampleSource>;

/**
 * CSV replay: "timestamp_ms,value[,red,green,blue]" per line.
 * Empty lines, '#' comments and a non-numeric header are skipped,
 * malformed lines are counted and skipped.
 */
class CsvSampleSource : public SampleSource {
public:
    explicit CsvSampleSource(std::istream& in, const std::string& name = "stdin");

    bool next(Signal::Frame& frame) override;
    std::string describe() const override { return "csv:" + m_name; }

    int getLineNumber() const { return m_lineNumber; }
    int getMalformedCount() const { return m_malformed; }

    enum class LineKind { Frame, Skip, Malformed };

    static LineKind parseLine(const std::string& line, Signal::Frame& out);

private:
    std::istream& m_in;
    std::string m_name;
    int m_lineNumber = 0;
    int m_malformed = 0;
};

/**
 * Synthetic PPG: two Gaussians per beat (systolic peak + dicrotic wave)
 * on a red-channel baseline, optional noise and slow baseline drift.
 * Frames carry a finger-present color triple.
 */
class SyntheticPulseSource : public SampleSource {
public:
    struct Params {
        double bpm = 72.0;
        double sampleRateHz = 30.0;
        double durationSec = 30.0;
        double baseline = 180.0;
        double amplitude = 4.0;
        double noise = 0.0;             // stddev of additive noise
        double driftAmplitude = 0.0;    // slow baseline wander
        double driftHz = 0.1;
        unsigned seed = 1;
    };

    explicit SyntheticPulseSource(const Params& params);

    bool next(Signal::Frame& frame) override;
    std::string describe() const override;

    // Pulse shape at phase 0..1 of one beat
    static double pulseShape(double phase);

private:
    Params m_params;
    long m_index = 0;
    long m_total;
    std::mt19937 m_rng;
    std::normal_distribution<double> m_noise;
};

} // namespace Input
} // namespace PulseAnalyzer
