#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace PulseAnalyzer {
namespace OSC {

/**
 * OSC 1.0 message with typed arguments (i, f, s).
 * serialize() produces the binary UDP payload.
 */
class OscMessage {
public:
    explicit OscMessage(const std::string& path = "") : m_path(path) {}

    OscMessage& addInt(int32_t value);
    OscMessage& addFloat(float value);
    OscMessage& addString(const std::string& value);

    const std::string& getPath() const { return m_path; }

    // ",if" style tag string
    std::string typeTags() const;

    std::vector<char> serialize() const;

    // "/pulse/bpm 72 0.950" for logs
    std::string toString() const;

    static int padLen(int len);  // round up to multiple of 4

private:
    struct Arg {
        char type;
        int32_t i;
        float f;
        std::string s;
    };

    std::string m_path;
    std::vector<Arg> m_args;
};

// Message builders for the pulse outputs
namespace Messages {

// /pulse/bpm ,if  bpm, weight
OscMessage bpm(int bpm, double weight);

// /pulse/quality ,i  1 = finger present
OscMessage signalQuality(bool present);

// /pulse/average ,ff  weighted average bpm, reliability
OscMessage average(double bpm, double reliability);

} // namespace Messages

} // namespace OSC
} // namespace PulseAnalyzer
