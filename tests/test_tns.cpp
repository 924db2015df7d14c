#include "codec/lpc/lpc.hpp"
#include "codec/mdct/mdct.hpp"
#include "codec/tns/tns.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<float> tone_spectrum() {
    std::vector<float> x(480);
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] = 0.5f * static_cast<float>(std::sin(2.0 * kPi * 1000.0 * i / 44100.0));
    }
    Spectral::Mdct mdct(480);
    std::vector<float> overlap(240, 0.0f);
    return mdct.forward(x, overlap);
}

void check_lpc_first_order() {
    // x[n] = 0.9^n, so the error filter is close to 1 - 0.9 z^-1
    std::vector<float> x(200);
    float v = 1.0f;
    for (float& s : x) {
        s = v;
        v *= 0.9f;
    }

    LPC lpc(1);
    std::vector<double> coeffs;
    int used = 0;
    double gain = 0.0;
    assert(lpc.analyze(x, coeffs, &used, &gain));
    assert(used == 1);
    assert(coeffs.size() == 1);
    assert(std::fabs(coeffs[0] + 0.9) < 0.01);
    assert(gain > 4.0);
}

void check_lpc_degenerate() {
    LPC lpc(4);
    std::vector<double> coeffs;
    assert(!lpc.analyze(std::vector<float>(64, 0.0f), coeffs));
    assert(coeffs.size() == 4);
    for (double c : coeffs) assert(c == 0.0);

    assert(!lpc.analyze(std::vector<float>(), coeffs));
    assert(!lpc.analyze(std::vector<float>(1, 1.0f), coeffs));

    int used = -1;
    assert(lpc.analyze(std::vector<float>{1.0f, 0.5f, 0.25f}, coeffs, &used));
    assert(used <= 2);
    assert(coeffs[2] == 0.0 && coeffs[3] == 0.0);

    assert(LPC(99).get_order() == LPC::MAX_ORDER);
    assert(LPC(-3).get_order() == 0);
}

void check_disabled_is_identity() {
    std::vector<float> spectrum = tone_spectrum();
    const std::vector<float> original = spectrum;

    Spectral::TemporalNoiseShaping tns(4, false);
    assert(!tns.is_enabled());
    tns.apply(spectrum);
    assert(spectrum == original);

    Spectral::TemporalNoiseShaping zero_order(0, true);
    zero_order.apply(spectrum);
    assert(spectrum == original);
}

void check_short_input() {
    Spectral::TemporalNoiseShaping tns;
    std::vector<float> spectrum = {1.0f, -2.0f, 3.0f};
    tns.apply(spectrum);
    assert(spectrum[0] == 1.0f && spectrum[1] == -2.0f && spectrum[2] == 3.0f);

    std::vector<float> empty;
    tns.apply(empty);
    assert(empty.empty());
}

void check_silence() {
    Spectral::TemporalNoiseShaping tns;
    std::vector<float> spectrum(240, 0.0f);
    tns.apply(spectrum);
    for (float v : spectrum) assert(v == 0.0f);
    for (double c : tns.get_filter_coeffs()) assert(c == 0.0);
}

void check_tone() {
    std::vector<float> spectrum = tone_spectrum();
    const std::vector<float> original = spectrum;

    Spectral::TemporalNoiseShaping tns;
    assert(tns.get_order() == Spectral::TNS_DEFAULT_ORDER);
    tns.apply(spectrum);

    for (int i = 0; i < tns.get_order(); ++i) {
        assert(spectrum[i] == original[i]);
    }
    size_t changed = 0;
    for (size_t i = 0; i < spectrum.size(); ++i) {
        assert(std::isfinite(spectrum[i]));
        if (spectrum[i] != original[i]) ++changed;
    }
    assert(changed > spectrum.size() / 2);

    bool any_coeff = false;
    for (double c : tns.get_filter_coeffs()) {
        if (c != 0.0) any_coeff = true;
    }
    assert(any_coeff);

    // coefficients do not leak into the next call
    std::vector<float> silent(240, 0.0f);
    tns.apply(silent);
    for (double c : tns.get_filter_coeffs()) assert(c == 0.0);

    tns.set_enabled(false);
    std::vector<float> again = original;
    tns.apply(again);
    assert(again == original);
}

} // namespace

void run_tns_tests() {
    check_lpc_first_order();
    check_lpc_degenerate();
    check_disabled_is_identity();
    check_short_input();
    check_silence();
    check_tone();
    std::cout << "tns tests ok\n";
}
