#pragma once

/**
 * PulseAnalyzerApp - command line application
 *
 *   SampleSource (CSV / synthetic) -> producer thread -> SampleChannel
 *   -> processing loop -> MeasurementSession -> log + OSC output
 */

#include "config/analyzer_config.h"
#include "config/env_config.h"
#include "input/sample_source.h"
#include "osc/osc_sender.h"
#include "session/measurement_session.h"
#include "session/weighted_bpm_average.h"
#include "signal/sample_channel.h"

#include <atomic>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

namespace PulseAnalyzer {

// Global shutdown flag (set by the signal handler)
extern std::atomic<bool> g_running;

struct AppOptions {
    std::string inputPath;          // "-" = stdin, empty = synthetic
    double syntheticBpm = 72.0;
    double seconds = 30.0;
    double noise = 0.0;
    std::string envPath;            // empty = ".env", "../.env"
    std::string strategy;           // empty = from configuration
    bool quiet = false;             // only the summary
    bool fast = false;              // no real-time pacing, lossless hand-off
};

class PulseAnalyzerApp {
public:
    explicit PulseAnalyzerApp(const AppOptions& options);
    ~PulseAnalyzerApp();

    // Throws ConfigError for an invalid configuration.
    // false: input could not be opened
    bool initialize();

    // Blocks until the source is exhausted or g_running is cleared
    bool run();

    void shutdown();

    const AnalyzerConfig& getConfig() const { return m_config; }

private:
    static constexpr int CHANNEL_SIZE = 1024;

    AppOptions m_options;
    AnalyzerConfig m_config;

    std::ifstream m_file;
    Input::SampleSourcePtr m_source;
    std::unique_ptr<MeasurementSession> m_session;
    OSC::OscSenderPtr m_oscSender;
    WeightedBpmAverage m_average;

    Signal::SampleChannel<CHANNEL_SIZE> m_channel;
    std::thread m_producer;
    std::atomic<bool> m_producerDone{false};
    std::atomic<uint64_t> m_produced{0};

    int m_lastBpm = 0;
    double m_lastWeight = 0.0;
    bool m_lastFingerPresent = false;
    bool m_hasFingerState = false;
    bool m_shutdownDone = false;

    void loadConfig(EnvConfig& env);
    bool openSource();
    void initOscSender(EnvConfig& env);
    void wireCallbacks();

    void producerThreadFunc();
    void printSummary() const;
};

} // namespace PulseAnalyzer
