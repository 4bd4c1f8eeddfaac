#include "osc/osc_messages.h"
#include <cstring>
#include <sstream>
#include <iomanip>

namespace PulseAnalyzer {
namespace OSC {

namespace {

void appendOscString(std::vector<char>& buf, const std::string& str) {
    int slen = static_cast<int>(str.size());
    int padded = OscMessage::padLen(slen + 1);  // +1 for null terminator
    buf.insert(buf.end(), str.begin(), str.end());
    buf.insert(buf.end(), padded - slen, '\0');
}

// Big-endian int32
void appendInt32(std::vector<char>& buf, int32_t val) {
    uint32_t v = static_cast<uint32_t>(val);
    buf.push_back(static_cast<char>((v >> 24) & 0xFF));
    buf.push_back(static_cast<char>((v >> 16) & 0xFF));
    buf.push_back(static_cast<char>((v >>  8) & 0xFF));
    buf.push_back(static_cast<char>((v      ) & 0xFF));
}

// Big-endian float32
void appendFloat32(std::vector<char>& buf, float val) {
    uint32_t v;
    std::memcpy(&v, &val, 4);
    appendInt32(buf, static_cast<int32_t>(v));
}

} // namespace

int OscMessage::padLen(int len) {
    return (len + 3) & ~3;
}

OscMessage& OscMessage::addInt(int32_t value) {
    m_args.push_back({'i', value, 0.0f, std::string()});
    return *this;
}

OscMessage& OscMessage::addFloat(float value) {
    m_args.push_back({'f', 0, value, std::string()});
    return *this;
}

OscMessage& OscMessage::addString(const std::string& value) {
    m_args.push_back({'s', 0, 0.0f, value});
    return *this;
}

std::string OscMessage::typeTags() const {
    std::string tags = ",";
    for (const auto& arg : m_args) {
        tags += arg.type;
    }
    return tags;
}

std::vector<char> OscMessage::serialize() const {
    std::vector<char> buf;
    appendOscString(buf, m_path);
    appendOscString(buf, typeTags());

    for (const auto& arg : m_args) {
        switch (arg.type) {
            case 'i': appendInt32(buf, arg.i); break;
            case 'f': appendFloat32(buf, arg.f); break;
            case 's': appendOscString(buf, arg.s); break;
            default: break;
        }
    }
    return buf;
}

std::string OscMessage::toString() const {
    std::ostringstream oss;
    oss << m_path;
    for (const auto& arg : m_args) {
        oss << " ";
        switch (arg.type) {
            case 'i': oss << arg.i; break;
            case 'f': oss << std::fixed << std::setprecision(3) << arg.f; break;
            case 's': oss << arg.s; break;
            default: break;
        }
    }
    return oss.str();
}

namespace Messages {

OscMessage bpm(int bpm, double weight) {
    OscMessage msg("/pulse/bpm");
    msg.addInt(bpm).addFloat(static_cast<float>(weight));
    return msg;
}

OscMessage signalQuality(bool present) {
    OscMessage msg("/pulse/quality");
    msg.addInt(present ? 1 : 0);
    return msg;
}

OscMessage average(double bpm, double reliability) {
    OscMessage msg("/pulse/average");
    msg.addFloat(static_cast<float>(bpm)).addFloat(static_cast<float>(reliability));
    return msg;
}

} // namespace Messages

} // namespace OSC
} // namespace PulseAnalyzer
