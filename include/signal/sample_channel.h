#pragma once

#include <atomic>
#include <cstdint>
#include "signal_types.h"

namespace PulseAnalyzer {
namespace Signal {

/**
 * Lock-free SPSC ring: capture thread -> processing thread.
 *
 * Bounded, never blocks. A push into a full ring drops the frame
 * and counts it; nothing is queued beyond SIZE - 1 frames.
 */
template <int SIZE>
class SampleChannel {
    static_assert(SIZE >= 2 && (SIZE & (SIZE - 1)) == 0, "SIZE must be a power of 2");

public:
    SampleChannel() = default;

    SampleChannel(const SampleChannel&) = delete;
    SampleChannel& operator=(const SampleChannel&) = delete;

    // Producer side. false = dropped (ring full)
    bool tryPush(const Frame& frame) {
        int w = m_wpos.load(std::memory_order_relaxed);
        int next = (w + 1) & MASK;
        if (next == m_rpos.load(std::memory_order_acquire)) {
            m_dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        m_slots[w] = frame;
        m_wpos.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side. false = empty
    bool tryPop(Frame& out) {
        int r = m_rpos.load(std::memory_order_relaxed);
        if (r == m_wpos.load(std::memory_order_acquire)) return false;
        out = m_slots[r];
        m_rpos.store((r + 1) & MASK, std::memory_order_release);
        return true;
    }

    bool isEmpty() const {
        return m_rpos.load(std::memory_order_acquire) ==
               m_wpos.load(std::memory_order_acquire);
    }

    bool isFull() const {
        int next = (m_wpos.load(std::memory_order_acquire) + 1) & MASK;
        return next == m_rpos.load(std::memory_order_acquire);
    }

    uint32_t dropped() const { return m_dropped.load(std::memory_order_relaxed); }

    static constexpr int capacity() { return SIZE - 1; }

private:
    static constexpr int MASK = SIZE - 1;

    Frame m_slots[SIZE];
    alignas(64) std::atomic<int> m_wpos{0};
    alignas(64) std::atomic<int> m_rpos{0};
    std::atomic<uint32_t> m_dropped{0};
};

} // namespace Signal
} // namespace PulseAnalyzer
