#include "input/sample_source.h"
#include "util/logging.h"

#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace PulseAnalyzer {
namespace Input {

namespace {
const double PI = 3.14159265358979323846;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

bool parseDouble(const std::string& text, double& out) {
    std::string t = trim(text);
    if (t.empty()) return false;
    try {
        size_t used = 0;
        out = std::stod(t, &used);
        return used == t.size() && std::isfinite(out);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}
} // namespace

// ============================================================================
// CSV
// ============================================================================

CsvSampleSource::CsvSampleSource(std::istream& in, const std::string& name)
    : m_in(in), m_name(name) {
}

CsvSampleSource::LineKind CsvSampleSource::parseLine(const std::string& line, Signal::Frame& out) {
    std::string t = trim(line);
    if (t.empty() || t[0] == '#') return LineKind::Skip;

    std::vector<std::string> fields;
    std::stringstream ss(t);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }

    std::vector<double> numbers;
    for (const auto& f : fields) {
        double v = 0.0;
        if (!parseDouble(f, v)) {
            // "timestamp_ms,value" header
            bool isHeader = numbers.empty() && !fields.empty() &&
                            std::isalpha(static_cast<unsigned char>(trim(fields[0]).c_str()[0]));
            return isHeader ? LineKind::Skip : LineKind::Malformed;
        }
        numbers.push_back(v);
    }

    if (numbers.size() != 2 && numbers.size() != 5) {
        return LineKind::Malformed;
    }

    Signal::Sample sample(static_cast<int64_t>(std::llround(numbers[0])), numbers[1]);
    if (numbers.size() == 5) {
        out = Signal::Frame(sample, Signal::Rgb(numbers[2], numbers[3], numbers[4]));
    } else {
        out = Signal::Frame(sample);
    }
    return LineKind::Frame;
}

bool CsvSampleSource::next(Signal::Frame& frame) {
    std::string line;
    while (std::getline(m_in, line)) {
        m_lineNumber++;
        switch (parseLine(line, frame)) {
            case LineKind::Frame:
                return true;
            case LineKind::Skip:
                break;
            case LineKind::Malformed:
                m_malformed++;
                LOG_WARN(describe() + ":" + std::to_string(m_lineNumber) +
                         ": malformed line skipped");
                break;
        }
    }
    return false;
}

// ============================================================================
// Synthetic PPG
// ============================================================================

SyntheticPulseSource::SyntheticPulseSource(const Params& params)
    : m_params(params),
      m_total(static_cast<long>(params.durationSec * params.sampleRateHz)),
      m_rng(params.seed),
      m_noise(0.0, params.noise > 0.0 ? params.noise : 1.0) {
}

double SyntheticPulseSource::pulseShape(double phase) {
    const double mu1 = 0.3, sigma1 = 0.15;
    const double mu2 = 0.6, sigma2 = 0.15;
    return 1.0 * std::exp(-std::pow(phase - mu1, 2) / (2.0 * sigma1 * sigma1)) +
           0.5 * std::exp(-std::pow(phase - mu2, 2) / (2.0 * sigma2 * sigma2));
}

bool SyntheticPulseSource::next(Signal::Frame& frame) {
    if (m_index >= m_total || m_params.sampleRateHz <= 0.0) return false;

    double t = m_index / m_params.sampleRateHz;
    double phase = std::fmod(t * m_params.bpm / 60.0, 1.0);

    double value = m_params.baseline + m_params.amplitude * pulseShape(phase);
    if (m_params.driftAmplitude > 0.0) {
        value += m_params.driftAmplitude * std::sin(2.0 * PI * m_params.driftHz * t);
    }
    if (m_params.noise > 0.0) {
        value += m_noise(m_rng);
    }

    Signal::Sample sample(static_cast<int64_t>(std::llround(t * 1000.0)), value);
    frame = Signal::Frame(sample, Signal::Rgb(value, 60.0, 30.0));
    m_index++;
    return true;
}

std::string SyntheticPulseSource::describe() const {
    std::ostringstream oss;
    oss << "synthetic:" << m_params.bpm << "bpm@" << m_params.sampleRateHz << "Hz";
    return oss.str();
}

} // namespace Input
} // namespace PulseAnalyzer
