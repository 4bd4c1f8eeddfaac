#include "config/analyzer_config.h"
#include "util/logging.h"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace PulseAnalyzer {

// ============================================================================
// Strategy names
// ============================================================================

std::string strategyToString(AnalysisStrategy strategy) {
    switch (strategy) {
        case AnalysisStrategy::Spectral:          return "spectral";
        case AnalysisStrategy::ThresholdCrossing: return "threshold";
    }
    return "unknown";
}

AnalysisStrategy parseStrategy(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (n == "spectral" || n == "fft") return AnalysisStrategy::Spectral;
    if (n == "threshold" || n == "threshold-crossing") return AnalysisStrategy::ThresholdCrossing;
    throw ConfigError("unknown analysis strategy: '" + name + "'");
}

// ============================================================================
// Validation
// ============================================================================

void AnalyzerConfig::validate() const {
    if (windowLength <= 0) {
        throw ConfigError("window length must be positive (got " +
                          std::to_string(windowLength) + ")");
    }
    if (edgeCutoff < 0) {
        throw ConfigError("edge cutoff must not be negative");
    }
    if (trimmedLength() < 3) {
        throw ConfigError("window length " + std::to_string(windowLength) +
                          " leaves fewer than 3 samples after trimming " +
                          std::to_string(edgeCutoff) + " from each edge");
    }
    if (detrendSpreads.empty()) {
        throw ConfigError("at least one detrend spread is required");
    }
    for (int spread : detrendSpreads) {
        if (spread <= 0) {
            throw ConfigError("detrend spreads must be positive (got " +
                              std::to_string(spread) + ")");
        }
    }
    if (normalizeBlock <= 0) {
        throw ConfigError("normalize block size must be positive");
    }
    if (!(emaConstant > 0.0) || emaRatio() > 1.0) {
        throw ConfigError("EMA constant must lie in (0, N + 1]");
    }
    if (!(alpha > 0.0)) {
        throw ConfigError("smoothing factor cannot be 0 or negative");
    }
    if (alpha > 1.0) {
        throw ConfigError("smoothing factor cannot be greater than 1");
    }
    if (minSampleDelayMs < 0) {
        throw ConfigError("minimum sample delay must not be negative");
    }
}

std::string AnalyzerConfig::toString() const {
    std::ostringstream oss;
    oss << "N=" << windowLength
        << " cutoff=" << edgeCutoff
        << " spreads=";
    for (size_t i = 0; i < detrendSpreads.size(); ++i) {
        if (i > 0) oss << ",";
        oss << detrendSpreads[i];
    }
    oss << " block=" << normalizeBlock
        << " K=" << emaConstant
        << " alpha=" << alpha
        << " delay=" << minSampleDelayMs << "ms"
        << " strategy=" << strategyToString(strategy);
    return oss.str();
}

// ============================================================================
// Loading from .env / environment
// ============================================================================

namespace {

int readInt(const EnvConfig& env, const std::string& key, int defaultValue) {
    std::string val = env.getString(key, "");
    if (val.empty()) return defaultValue;
    try {
        size_t used = 0;
        int parsed = std::stoi(val, &used);
        if (used == val.size()) return parsed;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    LOG_WARN(key + ": '" + val + "' is not an integer, using " + std::to_string(defaultValue));
    return defaultValue;
}

double readDouble(const EnvConfig& env, const std::string& key, double defaultValue) {
    std::string val = env.getString(key, "");
    if (val.empty()) return defaultValue;
    try {
        size_t used = 0;
        double parsed = std::stod(val, &used);
        if (used == val.size()) return parsed;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    LOG_WARN(key + ": '" + val + "' is not a number, using " + std::to_string(defaultValue));
    return defaultValue;
}

std::vector<int> readIntList(const EnvConfig& env, const std::string& key,
                             const std::vector<int>& defaultValue) {
    std::string val = env.getString(key, "");
    if (val.empty()) return defaultValue;

    std::vector<int> result;
    std::stringstream ss(val);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            result.push_back(std::stoi(item));
        } catch (const std::exception&) {
            LOG_WARN(key + ": '" + val + "' is not a list of integers, using default");
            return defaultValue;
        }
    }
    return result;
}

} // namespace

AnalyzerConfig AnalyzerConfig::fromEnv(const EnvConfig& env) {
    AnalyzerConfig cfg;

    cfg.windowLength = readInt(env, "WINDOW_LENGTH", cfg.windowLength);
    cfg.edgeCutoff = readInt(env, "EDGE_CUTOFF", cfg.edgeCutoff);
    cfg.detrendSpreads = readIntList(env, "DETREND_SPREADS", cfg.detrendSpreads);
    cfg.normalizeBlock = readInt(env, "NORMALIZE_BLOCK", cfg.normalizeBlock);
    cfg.emaConstant = readDouble(env, "EMA_CONSTANT", cfg.emaConstant);
    cfg.alpha = readDouble(env, "BPM_ALPHA", cfg.alpha);
    cfg.minSampleDelayMs = readInt(env, "MIN_SAMPLE_DELAY_MS", cfg.minSampleDelayMs);

    std::string strategy = env.getString("STRATEGY", "");
    if (!strategy.empty()) {
        // Unknown names are a configuration error, not a default
        cfg.strategy = parseStrategy(strategy);
    }

    cfg.fingerRedMin = readDouble(env, "FINGER_RED_MIN", cfg.fingerRedMin);
    cfg.fingerGreenMax = readDouble(env, "FINGER_GREEN_MAX", cfg.fingerGreenMax);
    cfg.fingerBlueMax = readDouble(env, "FINGER_BLUE_MAX", cfg.fingerBlueMax);

    return cfg;
}

} // namespace PulseAnalyzer
