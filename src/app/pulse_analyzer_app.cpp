#include "app/pulse_analyzer_app.h"
#include "util/logging.h"

#include <chrono>
#include <iostream>
#include <sstream>
#include <iomanip>

namespace PulseAnalyzer {

using namespace PulseAnalyzer::Util;

// ============================================================================
// Constructor / Destructor
// ============================================================================

PulseAnalyzerApp::PulseAnalyzerApp(const AppOptions& options)
    : m_options(options) {
}

PulseAnalyzerApp::~PulseAnalyzerApp() {
    shutdown();
}

// ============================================================================
// Initialisation
// ============================================================================

bool PulseAnalyzerApp::initialize() {
    LOG_INFO("Pulse Analyzer initializing...");

    auto& env = EnvConfig::instance();
    if (!m_options.envPath.empty()) {
        if (env.load(m_options.envPath)) {
            LOG_INFO("Configuration loaded from " + m_options.envPath);
        } else {
            LOG_WARN("Cannot read " + m_options.envPath + ", using defaults");
        }
    } else if (env.load(".env") || env.load("../.env")) {
        LOG_INFO(".env configuration loaded");
    }

    if (m_options.quiet) {
        Logger::setLogLevel(LogLevel::Warning);
    } else {
        Logger::setLogLevel(Logger::parseLevel(env.getString("LOG_LEVEL", "1"), LogLevel::Info));
    }

    loadConfig(env);

    // Throws ConfigError
    m_session = std::make_unique<MeasurementSession>(m_config);
    wireCallbacks();

    if (!openSource()) {
        return false;
    }

    initOscSender(env);

    LOG_INFO("Source: " + m_source->describe());
    LOG_INFO("Config: " + m_config.toString());
    return true;
}

void PulseAnalyzerApp::loadConfig(EnvConfig& env) {
    m_config = AnalyzerConfig::fromEnv(env);
    if (!m_options.strategy.empty()) {
        m_config.strategy = parseStrategy(m_options.strategy);
    }
    m_config.validate();
}

bool PulseAnalyzerApp::openSource() {
    if (m_options.inputPath.empty()) {
        Input::SyntheticPulseSource::Params params;
        params.bpm = m_options.syntheticBpm;
        params.durationSec = m_options.seconds;
        params.noise = m_options.noise;
        m_source = std::make_unique<Input::SyntheticPulseSource>(params);
        return true;
    }

    if (m_options.inputPath == "-") {
        m_source = std::make_unique<Input::CsvSampleSource>(std::cin, "stdin");
        return true;
    }

    m_file.open(m_options.inputPath);
    if (!m_file.is_open()) {
        LOG_ERROR("Cannot open input file: " + m_options.inputPath);
        return false;
    }
    m_source = std::make_unique<Input::CsvSampleSource>(m_file, m_options.inputPath);
    return true;
}

void PulseAnalyzerApp::initOscSender(EnvConfig& env) {
    m_oscSender = std::make_shared<OSC::OscSender>();
    m_oscSender->setErrorCallback([](const std::string& msg) {
        LOG_WARN("OSC: " + msg);
    });

    // Multiple targets: OSC_HOST_<NAME>=host:port
    auto oscHostKeys = env.getKeysWithPrefix("OSC_HOST_");
    if (!oscHostKeys.empty()) {
        for (const auto& key : oscHostKeys) {
            std::string value = env.getString(key, "");
            if (value.empty()) continue;

            std::string host;
            int port = 0;
            if (OSC::OscSender::parseHostPort(value, host, port)) {
                m_oscSender->addTarget(key.substr(9), host, port);
            } else {
                LOG_WARN("Invalid OSC target " + key + "=" + value);
            }
        }
    } else {
        std::string host = env.getString("OSC_HOST", "127.0.0.1");
        std::string portText = env.getString("OSC_PORT", "9000");
        std::string parsedHost;
        int port = 0;
        if (OSC::OscSender::parseHostPort(host + ":" + portText, parsedHost, port)) {
            m_oscSender->addTarget("default", parsedHost, port);
        } else {
            LOG_WARN("Invalid OSC_PORT: " + portText);
        }
    }

    if (!m_oscSender->initialize()) {
        LOG_WARN("OSC sender not initialized - OSC disabled");
    } else {
        LOG_INFO("OSC active with " + std::to_string(m_oscSender->getTargetCount()) + " target(s)");
    }
}

void PulseAnalyzerApp::wireCallbacks() {
    m_session->setBpmCallback([this](int bpm, double weight) {
        m_lastBpm = bpm;
        m_lastWeight = weight;
        m_average.add(bpm, weight);

        std::ostringstream oss;
        oss << "BPM " << bpm << " (weight " << std::fixed << std::setprecision(2) << weight << ")";
        LOG_INFO(oss.str());

        if (m_oscSender) {
            m_oscSender->send(OSC::Messages::bpm(bpm, weight));
            m_oscSender->send(OSC::Messages::average(m_average.average(), m_average.reliability()));
        }
    });

    m_session->setSignalQualityCallback([this](bool present) {
        // Log transitions only, publish every frame
        if (!m_hasFingerState || present != m_lastFingerPresent) {
            LOG_INFO(present ? "Finger detected" : "No finger on sensor");
            m_lastFingerPresent = present;
            m_hasFingerState = true;
        }
        if (m_oscSender) {
            m_oscSender->send(OSC::Messages::signalQuality(present));
        }
    });

    m_session->setSpectrumCallback([](const Signal::SampleSeries& spectrum) {
        LOG_DEBUG("Spectrum: " + std::to_string(spectrum.size()) + " bins");
    });
}

// ============================================================================
// Producer: source -> channel
// ============================================================================

void PulseAnalyzerApp::producerThreadFunc() {
    using Clock = std::chrono::steady_clock;

    Signal::Frame frame;
    bool first = true;
    int64_t firstTs = 0;
    auto start = Clock::now();

    while (g_running && m_source->next(frame)) {
        if (!m_options.fast) {
            // Replay at frame-clock speed
            if (first) {
                firstTs = frame.sample.timestampMs;
                start = Clock::now();
                first = false;
            }
            auto due = start + std::chrono::milliseconds(frame.sample.timestampMs - firstTs);
            while (g_running && Clock::now() < due) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            m_channel.tryPush(frame);
        } else {
            while (g_running && m_channel.isFull()) {
                std::this_thread::yield();
            }
            m_channel.tryPush(frame);
        }
        m_produced.fetch_add(1, std::memory_order_relaxed);
    }

    m_producerDone = true;
}

// ============================================================================
// Processing loop
// ============================================================================

bool PulseAnalyzerApp::run() {
    if (!m_session || !m_source) {
        LOG_ERROR("run() before initialize()");
        return false;
    }

    LOG_INFO("Pulse Analyzer running. Ctrl+C to stop.");

    m_producerDone = false;
    m_producer = std::thread(&PulseAnalyzerApp::producerThreadFunc, this);

    Signal::Frame frame;
    while (g_running) {
        if (m_channel.tryPop(frame)) {
            m_session->offer(frame);
            continue;
        }
        if (m_producerDone && m_channel.isEmpty()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    if (m_producer.joinable()) m_producer.join();

    if (auto* csv = dynamic_cast<Input::CsvSampleSource*>(m_source.get())) {
        if (csv->getMalformedCount() > 0) {
            LOG_WARN(std::to_string(csv->getMalformedCount()) + " malformed input line(s) skipped");
        }
    }
    return true;
}

// ============================================================================
// Shutdown
// ============================================================================

void PulseAnalyzerApp::shutdown() {
    if (m_shutdownDone) return;
    m_shutdownDone = true;

    g_running = false;
    if (m_producer.joinable()) m_producer.join();

    if (m_oscSender) {
        m_oscSender->shutdown();
    }

    if (m_session) {
        printSummary();
    }
    LOG_INFO("Pulse Analyzer stopped");
}

void PulseAnalyzerApp::printSummary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Summary: frames=" << m_produced.load()
        << " accepted=" << m_session->getAcceptedCount()
        << " dropped=" << (m_session->getDroppedCount() + m_channel.dropped())
        << " readings=" << m_session->getEmittedCount();
    if (m_lastBpm > 0) {
        oss << " last=" << m_lastBpm << " (weight " << m_lastWeight << ")"
            << " average=" << m_average.average()
            << " reliability=" << m_average.reliability();
    } else {
        oss << " no reading";
    }
    std::cout << oss.str() << std::endl;
}

} // namespace PulseAnalyzer
