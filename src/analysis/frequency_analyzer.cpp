#include "analysis/frequency_analyzer.h"
#include "analysis/spectral_analyzer.h"
#include "analysis/threshold_analyzer.h"

namespace PulseAnalyzer {
namespace Analysis {

FrequencyAnalyzerPtr createFrequencyAnalyzer(const AnalyzerConfig& config) {
    switch (config.strategy) {
        case AnalysisStrategy::ThresholdCrossing:
            return std::make_unique<ThresholdCrossingAnalyzer>();
        case AnalysisStrategy::Spectral:
            break;
    }
    return std::make_unique<SpectralAnalyzer>(config.windowLength, config.edgeCutoff);
}

} // namespace Analysis
} // namespace PulseAnalyzer
