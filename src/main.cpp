/**
 * Pulse Analyzer - main application
 *
 * Heart rate from a PPG sample stream:
 * - Input from CSV (file / stdin) or a synthetic pulse
 * - Rolling window conditioning + spectral / threshold BPM estimation
 * - Log + OSC output (/pulse/bpm, /pulse/quality, /pulse/average)
 */

#include "app/pulse_analyzer_app.h"
#include "util/logging.h"

#include <iostream>
#include <atomic>
#include <csignal>
#include <stdexcept>
#include <string>

using namespace PulseAnalyzer;

// ============================================================================
// Global signal handling
// ============================================================================

std::atomic<bool> PulseAnalyzer::g_running(true);

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

// ============================================================================
// Command line
// ============================================================================

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "  --input <file|->         CSV input: timestamp_ms,value[,r,g,b] ('-' = stdin)\n"
              << "  --synthetic <bpm>        synthetic PPG pulse at <bpm> (default source, 72)\n"
              << "  --seconds <s>            synthetic duration (default 30)\n"
              << "  --noise <stddev>         synthetic additive noise (default 0)\n"
              << "  --env <path>             configuration file (default .env)\n"
              << "  --strategy <name>        spectral | threshold\n"
              << "  --fast                   no real-time pacing\n"
              << "  --quiet                  warnings and summary only\n"
              << "  -h, --help               this help\n";
}

bool parseNumber(const std::string& text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// false: usage error (already reported)
bool parseArguments(int argc, char* argv[], AppOptions& options, bool& showHelp) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            showHelp = true;
            return true;
        }
        if (arg == "--fast") {
            options.fast = true;
            continue;
        }
        if (arg == "--quiet") {
            options.quiet = true;
            continue;
        }

        if (i + 1 >= argc) {
            LOG_ERROR("Missing value for " + arg);
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--input") {
            options.inputPath = value;
        } else if (arg == "--env") {
            options.envPath = value;
        } else if (arg == "--strategy") {
            options.strategy = value;
        } else if (arg == "--synthetic" || arg == "--seconds" || arg == "--noise") {
            double number = 0.0;
            if (!parseNumber(value, number) || number < 0.0) {
                LOG_ERROR("Invalid value for " + arg + ": " + value);
                return false;
            }
            if (arg == "--synthetic") {
                if (number <= 0.0) {
                    LOG_ERROR("--synthetic needs a positive BPM");
                    return false;
                }
                options.syntheticBpm = number;
            } else if (arg == "--seconds") {
                options.seconds = number;
            } else {
                options.noise = number;
            }
        } else {
            LOG_ERROR("Unknown option: " + arg);
            return false;
        }
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    AppOptions options;
    bool showHelp = false;
    if (!parseArguments(argc, argv, options, showHelp)) {
        printUsage(argv[0]);
        return 2;
    }
    if (showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    PulseAnalyzerApp app(options);

    try {
        if (!app.initialize()) {
            LOG_ERROR("Initialization failed");
            return 1;
        }
    } catch (const ConfigError& e) {
        LOG_FATAL(std::string("Invalid configuration: ") + e.what());
        return 1;
    }

    if (!app.run()) {
        LOG_ERROR("Run failed");
        return 1;
    }

    app.shutdown();

    return 0;
}
