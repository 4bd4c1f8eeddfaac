#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include "../include/analysis/normalizer.h"
#include "../include/analysis/detrender.h"
#include "../include/analysis/smoother.h"

using namespace PulseAnalyzer::Analysis;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}
}

void test_normalizer_range() {
    std::cout << "Testing Normalizer rescale..." << std::endl;

    std::vector<double> values = {180.0, 182.0, 184.0, 181.0, 183.0};
    std::vector<double> out = Normalizer::rescale(values);

    assert(out.size() == values.size());
    assert(near(out[0], 0.0));
    assert(near(out[2], Normalizer::SCALE));
    assert(near(out[1], 5.0));
    for (double v : out) {
        assert(v >= 0.0 && v <= Normalizer::SCALE);
    }

    std::cout << "  ✓ min -> 0, max -> 10" << std::endl;
}

void test_normalizer_flat_window() {
    std::cout << "Testing Normalizer flat window..." << std::endl;

    std::vector<double> flat(50, 100.0);

    std::vector<double> plain = Normalizer::rescale(flat);
    std::vector<double> clamped = Normalizer::rescaleClamped(flat, 10);
    for (size_t i = 0; i < flat.size(); ++i) {
        assert(!std::isnan(plain[i]) && plain[i] == 0.0);
        assert(!std::isnan(clamped[i]) && clamped[i] == 0.0);
    }

    assert(Normalizer::rescale(std::vector<double>()).empty());

    std::cout << "  ✓ Constant window gives zeros, never NaN" << std::endl;
}

void test_normalizer_recalibration_cycle() {
    std::cout << "Testing Normalizer recalibration cycle..." << std::endl;

    Normalizer normalizer(5, 2);
    std::vector<double> values = {0.0, 1.0, 2.0, 3.0, 100.0};

    for (int i = 0; i < 4; ++i) {
        assert(!normalizer.nextIsRecalibration());
        std::vector<double> out = normalizer.process(values);
        assert(near(out[4], Normalizer::SCALE));
    }
    assert(normalizer.nextIsRecalibration());

    // 5th call clamps: the outlier no longer reaches full scale
    std::vector<double> out = normalizer.process(values);
    assert(out[4] < Normalizer::SCALE);
    assert(normalizer.getInvocations() == 5);
    assert(!normalizer.nextIsRecalibration());

    normalizer.reset();
    assert(normalizer.getInvocations() == 0);

    std::cout << "  ✓ Every N-th call recalibrates" << std::endl;
}

void test_normalizer_block_clamp() {
    std::cout << "Testing Normalizer block-averaged clamp..." << std::endl;

    std::vector<double> values = {0, 1, 2, 3, 4, 5, 6, 7, 8, 100};
    std::vector<double> out = Normalizer::rescaleClamped(values, 5);

    // Unit range: blocks [0..0.04] and [0.05..1.0]
    // lo = (0 + 0.05) / 2, hi = (0.04 + 1.0) / 2
    assert(near(out[0], 0.25));
    assert(near(out[3], 0.3));
    assert(near(out[9], 5.2));
    for (double v : out) {
        assert(v >= 0.25 - 1e-9 && v <= 5.2 + 1e-9);
    }

    std::cout << "  ✓ Outlier clamped to averaged extrema" << std::endl;
}

void test_detrender_constant() {
    std::cout << "Testing Detrender constant series..." << std::endl;

    std::vector<double> constant(50, 7.5);

    for (int spread : {5, 10, 25, 40}) {
        std::vector<double> out = Detrender::detrend(constant, spread);
        assert(out.size() == constant.size());
        for (double v : out) {
            assert(near(v, 0.0));
        }
    }

    Detrender detrender;
    assert(detrender.getSpreads().size() == 3);
    for (double v : detrender.cascade(constant)) {
        assert(near(v, 0.0));
    }

    // Each pass runs on the previous output
    std::vector<double> wave(50);
    for (size_t i = 0; i < wave.size(); ++i) {
        wave[i] = 0.3 * static_cast<double>(i) + std::sin(0.8 * static_cast<double>(i));
    }
    std::vector<double> byHand = Detrender::detrend(Detrender::detrend(wave, 10), 5);
    std::vector<double> chained = Detrender::cascade(wave, {10, 5});
    assert(chained.size() == byHand.size());
    for (size_t i = 0; i < chained.size(); ++i) {
        assert(near(chained[i], byHand[i]));
    }
    assert(Detrender(std::vector<int>{10, 5}).cascade(wave) == chained);

    std::cout << "  ✓ Detrending a constant yields zeros" << std::endl;
}

void test_detrender_ramp() {
    std::cout << "Testing Detrender linear ramp..." << std::endl;

    std::vector<double> ramp(40);
    for (size_t i = 0; i < ramp.size(); ++i) {
        ramp[i] = static_cast<double>(i);
    }

    const int spread = 5;
    std::vector<double> t = Detrender::trend(ramp, spread);
    std::vector<double> out = Detrender::detrend(ramp, spread);

    // Mean of [i - 5, i + 5) on a unit ramp is i - 0.5
    for (int i = spread; i <= 40 - spread; ++i) {
        assert(near(t[i], i - 0.5));
        assert(near(out[i], 0.5));
    }
    // Edges reuse the nearest interior trend
    assert(near(t[0], t[spread]));
    assert(near(t[39], t[40 - spread]));

    // Short window: mean trend
    std::vector<double> shortRamp = {1.0, 2.0, 3.0};
    std::vector<double> shortTrend = Detrender::trend(shortRamp, 5);
    for (double v : shortTrend) {
        assert(near(v, 2.0));
    }

    std::cout << "  ✓ Ramp trend follows the centered mean" << std::endl;
}

void test_smoother() {
    std::cout << "Testing Smoother (EMA)..." << std::endl;

    Smoother smoother = Smoother::forWindow(20.0, 50);
    assert(near(smoother.getRatio(), 20.0 / 51.0));

    std::vector<double> constant(10, 3.0);
    for (double v : smoother.process(constant)) {
        assert(near(v, 3.0));
    }

    Smoother half(0.5);
    std::vector<double> step = {0.0, 1.0, 1.0, 1.0};
    std::vector<double> out = half.process(step);
    assert(near(out[0], 0.0));
    assert(near(out[1], 0.5));
    assert(near(out[2], 0.75));
    assert(near(out[3], 0.875));

    assert(half.process(std::vector<double>()).empty());

    std::cout << "  ✓ EMA step response" << std::endl;
}

int main() {
    std::cout << "\n=== Pulse Analyzer Conditioning Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_normalizer_range();
        test_normalizer_flat_window();
        test_normalizer_recalibration_cycle();
        test_normalizer_block_clamp();
        test_detrender_constant();
        test_detrender_ramp();
        test_smoother();

        std::cout << std::endl;
        std::cout << "=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
