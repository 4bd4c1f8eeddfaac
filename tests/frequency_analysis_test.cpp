#include <iostream>
#include <cassert>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <vector>
#include "../include/analysis/fft.h"
#include "../include/analysis/confidence_scorer.h"
#include "../include/analysis/spectral_analyzer.h"
#include "../include/analysis/threshold_analyzer.h"

using namespace PulseAnalyzer;
using namespace PulseAnalyzer::Analysis;

namespace {
const double PI = 3.14159265358979323846;

ComplexBuffer directDft(const std::vector<double>& x) {
    const int n = static_cast<int>(x.size());
    ComplexBuffer out(n / 2 + 1);
    for (int k = 0; k <= n / 2; ++k) {
        Complex sum(0.0, 0.0);
        for (int t = 0; t < n; ++t) {
            sum += x[t] * std::polar(1.0, -2.0 * PI * k * t / n);
        }
        out[k] = sum;
    }
    return out;
}

std::vector<int64_t> cameraTimestamps(int n) {
    std::vector<int64_t> ts(n);
    for (int i = 0; i < n; ++i) {
        ts[i] = static_cast<int64_t>(std::llround(i * 1000.0 / 30.0));
    }
    return ts;
}
}

void test_fft_matches_direct_dft() {
    std::cout << "Testing RealDFT against direct DFT..." << std::endl;

    // Power of 2 (radix-2) and other sizes (Bluestein)
    for (int n : {1, 2, 7, 16, 26, 32, 50}) {
        std::vector<double> x(n);
        for (int i = 0; i < n; ++i) {
            x[i] = std::sin(0.37 * i) + 0.5 * std::cos(1.3 * i) + 0.1 * i;
        }

        RealDFT dft(n);
        assert(dft.getBinCount() == n / 2 + 1);

        ComplexBuffer fast = dft.forward(x);
        ComplexBuffer slow = directDft(x);
        assert(fast.size() == slow.size());
        for (size_t k = 0; k < fast.size(); ++k) {
            assert(std::abs(fast[k] - slow[k]) < 1e-8 * (n + 1));
        }
    }

    bool thrown = false;
    try {
        FFT bad(12);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    assert(FFT::nextPowerOfTwo(51) == 64);

    std::cout << "  ✓ DFT test passed" << std::endl;
}

void test_fft_roundtrip() {
    std::cout << "Testing FFT inverse..." << std::endl;

    FFT fft(8);
    ComplexBuffer data(8);
    for (int i = 0; i < 8; ++i) data[i] = Complex(i, -i);
    ComplexBuffer original = data;

    fft.forward(data.data());
    fft.inverse(data.data());
    for (int i = 0; i < 8; ++i) {
        assert(std::abs(data[i] - original[i]) < 1e-12);
    }

    std::cout << "  ✓ inverse(forward(x)) == x" << std::endl;
}

void test_confidence_scorer() {
    std::cout << "Testing ConfidenceScorer..." << std::endl;

    // One clean peak
    std::vector<double> single = {0.0, 1.0, 5.0, 1.0, 0.0};
    ConfidenceResult r = ConfidenceScorer::score(single, 2);
    assert(r.valid);
    assert(r.peakCount == 1);
    assert(r.weight == 1.0);

    // Two competing peaks
    std::vector<double> two = {0.0, 4.0, 0.0, 2.0, 0.0};
    r = ConfidenceScorer::score(two, 1);
    assert(r.valid && r.peakCount == 2);
    assert(std::fabs(r.weight - 4.0 / 6.0) < 1e-12);

    // Dominant at the last bin is no peak but counts in the sum
    std::vector<double> edge = {0.0, 1.0, 0.0, 2.0, 3.0};
    r = ConfidenceScorer::score(edge, 4);
    assert(r.valid && r.peakCount == 1);
    assert(std::fabs(r.weight - 0.75) < 1e-12);

    // Flat spectrum: nothing to compare against
    std::vector<double> flat(14, 0.0);
    r = ConfidenceScorer::score(flat, 1);
    assert(!r.valid);
    assert(r.weight == 0.0);

    assert((ConfidenceScorer::findPeaks({1.0, 2.0}).empty()));

    std::cout << "  ✓ Confidence scorer test passed" << std::endl;
}

void test_spectral_bin_aligned_sine() {
    std::cout << "Testing SpectralAnalyzer bin-aligned sine..." << std::endl;

    const int n = 50;
    const int cutoff = 12;
    SpectralAnalyzer analyzer(n, cutoff);
    assert(analyzer.getTrimmedLength() == 26);

    // 40 ms spacing: trimmed window spans 25 * 40 = 1000 ms
    std::vector<int64_t> ts(n);
    for (int i = 0; i < n; ++i) ts[i] = i * 40;

    for (int k : {2, 3, 5}) {
        std::vector<double> values(n);
        for (int i = 0; i < n; ++i) {
            values[i] = std::sin(2.0 * PI * k * (i - cutoff) / 26.0);
        }

        FrequencyEstimate est = analyzer.analyze(values, ts);
        assert(est.valid);
        assert(est.dominantBin == k);
        assert(std::fabs(est.bpm - 60.0 * k) < 1e-9);
        assert(est.weight > 0.999 && est.weight <= 1.0);
        assert(est.spectrum.size() == 14);
        assert(est.spectrum[0].timestampMs == ts[cutoff]);
    }

    std::cout << "  ✓ Dominant bin and BPM match the sine" << std::endl;
}

void test_spectral_never_dc() {
    std::cout << "Testing SpectralAnalyzer DC handling..." << std::endl;

    std::vector<double> mags = {100.0, 3.0, 2.0, 3.0};
    assert(SpectralAnalyzer::dominantBin(mags) == 1);   // tie: lowest index
    assert(SpectralAnalyzer::dominantBin({5.0}) == -1);

    // Strong offset: DC is the largest bin but never chosen
    SpectralAnalyzer analyzer(50, 12);
    std::vector<int64_t> ts = cameraTimestamps(50);
    std::vector<double> values(50);
    for (int i = 0; i < 50; ++i) {
        values[i] = 100.0 + std::sin(2.0 * PI * 1.2 * ts[i] / 1000.0);
    }
    FrequencyEstimate est = analyzer.analyze(values, ts);
    assert(est.dominantBin >= 1);

    // Flat window: zero spectrum, no estimate
    std::vector<double> flat(50, 0.0);
    est = analyzer.analyze(flat, ts);
    assert(!est.valid);
    assert(!est.reason.empty());

    // Wrong length
    est = analyzer.analyze(std::vector<double>(10, 1.0), cameraTimestamps(10));
    assert(!est.valid);

    std::cout << "  ✓ Bin 0 never dominant" << std::endl;
}

void test_spectral_heart_rate() {
    std::cout << "Testing SpectralAnalyzer 1.2 Hz at 30 Hz..." << std::endl;

    SpectralAnalyzer analyzer(50, 12);
    std::vector<int64_t> ts = cameraTimestamps(50);
    std::vector<double> values(50);
    for (int i = 0; i < 50; ++i) {
        values[i] = std::sin(2.0 * PI * 1.2 * ts[i] / 1000.0 + 0.3);
    }

    FrequencyEstimate est = analyzer.analyze(values, ts);
    assert(est.valid);
    assert(est.dominantBin == 1);
    assert(std::fabs(est.bpm - 72.0) < 1.0);
    assert(est.weight > 0.9 && est.weight <= 1.0);

    std::cout << "  ✓ 72 BPM detected" << std::endl;
}

void test_threshold_two_edges() {
    std::cout << "Testing ThresholdCrossingAnalyzer..." << std::endl;

    ThresholdCrossingAnalyzer analyzer;
    assert(analyzer.strategy() == AnalysisStrategy::ThresholdCrossing);

    // Rising edges at samples 5 and 30: 167 ms and 1000 ms
    std::vector<int64_t> ts = cameraTimestamps(50);
    std::vector<double> values(50, 0.0);
    values[5] = values[6] = 1.0;
    values[30] = values[31] = 1.0;

    std::vector<int> edges = ThresholdCrossingAnalyzer::findRisingEdges(
        values, ThresholdCrossingAnalyzer::threshold(values));
    assert(edges.size() == 2);
    assert(edges[0] == 5 && edges[1] == 30);

    FrequencyEstimate est = analyzer.analyze(values, ts);
    assert(est.valid);
    assert(ts[30] - ts[5] == 833);
    assert(std::fabs(est.bpm - 72.0) < 0.1);
    assert(est.weight == 1.0);      // a single interval is perfectly regular

    std::cout << "  ✓ Edges 833 ms apart give 72 BPM" << std::endl;
}

void test_threshold_irregular_and_missing() {
    std::cout << "Testing ThresholdCrossingAnalyzer irregular/missing edges..." << std::endl;

    ThresholdCrossingAnalyzer analyzer;
    std::vector<int64_t> ts = cameraTimestamps(50);

    std::vector<double> irregular(50, 0.0);
    irregular[2] = irregular[12] = irregular[40] = 1.0;
    FrequencyEstimate est = analyzer.analyze(irregular, ts);
    assert(est.valid);
    assert(est.weight > 0.0 && est.weight < 1.0);

    std::vector<double> single(50, 0.0);
    single[20] = 1.0;
    est = analyzer.analyze(single, ts);
    assert(!est.valid);

    std::vector<double> flat(50, 3.0);
    est = analyzer.analyze(flat, ts);
    assert(!est.valid);

    std::cout << "  ✓ Fewer than two edges give no estimate" << std::endl;
}

void test_factory() {
    std::cout << "Testing createFrequencyAnalyzer..." << std::endl;

    AnalyzerConfig config;
    assert(createFrequencyAnalyzer(config)->strategy() == AnalysisStrategy::Spectral);

    config.strategy = AnalysisStrategy::ThresholdCrossing;
    assert(createFrequencyAnalyzer(config)->strategy() == AnalysisStrategy::ThresholdCrossing);

    std::cout << "  ✓ Factory test passed" << std::endl;
}

int main() {
    std::cout << "\n=== Pulse Analyzer Frequency Analysis Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_fft_matches_direct_dft();
        test_fft_roundtrip();
        test_confidence_scorer();
        test_spectral_bin_aligned_sine();
        test_spectral_never_dc();
        test_spectral_heart_rate();
        test_threshold_two_edges();
        test_threshold_irregular_and_missing();
        test_factory();

        std::cout << std::endl;
        std::cout << "=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
