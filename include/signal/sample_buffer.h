#pragma once

#include <vector>
#include "signal_types.h"

namespace PulseAnalyzer {
namespace Signal {

/**
 * Fixed-capacity rolling window of samples.
 * Pushing into a full buffer evicts the oldest sample (FIFO).
 * Single writer; snapshot() hands out an independent copy.
 */
class SampleBuffer {
public:
    // Throws std::invalid_argument for capacity <= 0
    explicit SampleBuffer(int capacity);
    ~SampleBuffer() = default;

    SampleBuffer(const SampleBuffer&) = delete;
    SampleBuffer& operator=(const SampleBuffer&) = delete;

    void push(const Sample& sample);

    // Oldest first
    SampleSeries snapshot() const;

    // i = 0 is the oldest sample
    const Sample& at(int i) const;

    void clear();

    int size() const { return m_count; }
    int capacity() const { return m_capacity; }
    bool isFull() const { return m_count == m_capacity; }
    bool isEmpty() const { return m_count == 0; }

private:
    std::vector<Sample> m_buffer;
    int m_capacity;
    int m_readPos;
    int m_writePos;
    int m_count;

    // Helper for circular access
    int advance(int pos, int count) const {
        return (pos + count) % m_capacity;
    }
};

} // namespace Signal
} // namespace PulseAnalyzer
