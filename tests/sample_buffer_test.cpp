#include <iostream>
#include <cassert>
#include <stdexcept>
#include <thread>
#include "../include/signal/sample_buffer.h"
#include "../include/signal/sample_channel.h"

using namespace PulseAnalyzer::Signal;

void test_sample_types() {
    std::cout << "Testing Sample/Frame types..." << std::endl;

    Sample s(1000, 42.5);
    assert(s.timestampMs == 1000);
    assert(s.value == 42.5);

    Frame plain(s);
    assert(!plain.hasColor);

    Frame colored(s, Rgb(200, 40, 20));
    assert(colored.hasColor);
    assert(colored.color.red == 200);

    BpmEstimate none;
    assert(!none.isValid());
    assert(BpmEstimate(72, 0.9).isValid());

    std::cout << "  ✓ Sample types test passed" << std::endl;
}

void test_buffer_fills_to_capacity() {
    std::cout << "Testing SampleBuffer capacity..." << std::endl;

    SampleBuffer buffer(5);
    assert(buffer.isEmpty());
    assert(buffer.capacity() == 5);

    for (int i = 0; i < 3; ++i) {
        buffer.push(Sample(i * 33, i));
    }
    assert(buffer.size() == 3);
    assert(!buffer.isFull());

    for (int i = 3; i < 20; ++i) {
        buffer.push(Sample(i * 33, i));
        assert(buffer.size() <= 5);
    }
    assert(buffer.size() == 5);
    assert(buffer.isFull());

    std::cout << "  ✓ Buffer holds exactly N after >= N pushes" << std::endl;
}

void test_buffer_fifo_eviction() {
    std::cout << "Testing SampleBuffer FIFO eviction..." << std::endl;

    const int n = 4;
    SampleBuffer buffer(n);
    for (int i = 0; i <= n; ++i) {        // N + 1 pushes
        buffer.push(Sample(i * 10, 100.0 + i));
    }

    SampleSeries snap = buffer.snapshot();
    assert(static_cast<int>(snap.size()) == n);
    // First sample evicted, order preserved
    for (int i = 0; i < n; ++i) {
        assert(snap[i].timestampMs == (i + 1) * 10);
        assert(snap[i].value == 101.0 + i);
        assert(buffer.at(i).value == snap[i].value);
    }

    // Snapshot is a copy
    buffer.push(Sample(999, 0.0));
    assert(snap[0].timestampMs == 10);
    assert(buffer.at(0).timestampMs == 20);

    std::cout << "  ✓ FIFO eviction test passed" << std::endl;
}

void test_buffer_errors_and_clear() {
    std::cout << "Testing SampleBuffer errors..." << std::endl;

    bool thrown = false;
    try {
        SampleBuffer bad(0);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    SampleBuffer buffer(3);
    buffer.push(Sample(0, 1.0));

    thrown = false;
    try {
        buffer.at(1);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);

    buffer.clear();
    assert(buffer.isEmpty());
    assert(buffer.snapshot().empty());

    std::cout << "  ✓ Buffer error handling test passed" << std::endl;
}

void test_channel_drops_when_full() {
    std::cout << "Testing SampleChannel..." << std::endl;

    SampleChannel<8> channel;
    assert(channel.isEmpty());
    assert(SampleChannel<8>::capacity() == 7);

    for (int i = 0; i < 7; ++i) {
        assert(channel.tryPush(Frame(Sample(i, i))));
    }
    assert(channel.isFull());
    assert(!channel.tryPush(Frame(Sample(7, 7))));
    assert(!channel.tryPush(Frame(Sample(8, 8))));
    assert(channel.dropped() == 2);

    Frame out;
    for (int i = 0; i < 7; ++i) {
        assert(channel.tryPop(out));
        assert(out.sample.timestampMs == i);
    }
    assert(!channel.tryPop(out));
    assert(channel.isEmpty());

    std::cout << "  ✓ Channel drop-on-full test passed" << std::endl;
}

void test_channel_threaded() {
    std::cout << "Testing SampleChannel producer/consumer..." << std::endl;

    SampleChannel<64> channel;
    const int total = 10000;

    std::thread producer([&channel]() {
        for (int i = 0; i < total; ++i) {
            while (channel.isFull()) {
                std::this_thread::yield();
            }
            channel.tryPush(Frame(Sample(i, i)));
        }
    });

    int expected = 0;
    Frame out;
    while (expected < total) {
        if (channel.tryPop(out)) {
            assert(out.sample.timestampMs == expected);
            expected++;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    assert(channel.dropped() == 0);

    std::cout << "  ✓ Ordered hand-off across threads" << std::endl;
}

int main() {
    std::cout << "\n=== Pulse Analyzer Buffer Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_sample_types();
        test_buffer_fills_to_capacity();
        test_buffer_fifo_eviction();
        test_buffer_errors_and_clear();
        test_channel_drops_when_full();
        test_channel_threaded();

        std::cout << std::endl;
        std::cout << "=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
