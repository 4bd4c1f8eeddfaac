#include "signal/sample_buffer.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace PulseAnalyzer {
namespace Signal {

SampleBuffer::SampleBuffer(int capacity)
    : m_capacity(capacity),
      m_readPos(0),
      m_writePos(0),
      m_count(0) {
    if (capacity <= 0) {
        throw std::invalid_argument("SampleBuffer capacity must be positive (got " +
                                    std::to_string(capacity) + ")");
    }
    m_buffer.resize(capacity);
}

void SampleBuffer::push(const Sample& sample) {
    m_buffer[m_writePos] = sample;
    m_writePos = advance(m_writePos, 1);
    m_count++;
    if (m_count > m_capacity) {
        m_count = m_capacity;
        m_readPos = advance(m_readPos, 1);
    }
}

SampleSeries SampleBuffer::snapshot() const {
    SampleSeries out;
    out.reserve(m_count);
    int pos = m_readPos;
    for (int i = 0; i < m_count; ++i) {
        out.push_back(m_buffer[pos]);
        pos = advance(pos, 1);
    }
    return out;
}

const Sample& SampleBuffer::at(int i) const {
    if (i < 0 || i >= m_count) {
        throw std::out_of_range("SampleBuffer index " + std::to_string(i) +
                                " out of range (size " + std::to_string(m_count) + ")");
    }
    return m_buffer[advance(m_readPos, i)];
}

void SampleBuffer::clear() {
    std::fill(m_buffer.begin(), m_buffer.end(), Sample());
    m_readPos = 0;
    m_writePos = 0;
    m_count = 0;
}

} // namespace Signal
} // namespace PulseAnalyzer
