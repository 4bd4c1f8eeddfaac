#pragma once

#include <cstdint>
#include <vector>

namespace PulseAnalyzer {
namespace Signal {

// One intensity reading, timestamp in milliseconds
struct Sample {
    int64_t timestampMs;
    double value;

    Sample(int64_t t = 0, double v = 0.0) : timestampMs(t), value(v) {}
};

using SampleSeries = std::vector<Sample>;

// Mean frame color, 0-255 per channel
struct Rgb {
    double red;
    double green;
    double blue;

    Rgb(double r = 0.0, double g = 0.0, double b = 0.0)
        : red(r), green(g), blue(b) {}
};

// What the capture side delivers per camera frame
struct Frame {
    Sample sample;
    Rgb color;
    bool hasColor;

    Frame() : hasColor(false) {}

    explicit Frame(const Sample& s) : sample(s), hasColor(false) {}

    Frame(const Sample& s, const Rgb& c) : sample(s), color(c), hasColor(true) {}
};

// Reading handed to the consumer
struct BpmEstimate {
    int bpm;
    double weight;      // reliability in [0, 1], not squared

    BpmEstimate(int b = 0, double w = 0.0) : bpm(b), weight(w) {}

    bool isValid() const { return bpm > 0; }
};

} // namespace Signal
} // namespace PulseAnalyzer
