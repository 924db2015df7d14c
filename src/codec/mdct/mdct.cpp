#include "mdct.hpp"
#include <algorithm>
#include <cmath>

namespace Spectral {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr int kBesselMaxTerms = 20;
constexpr double kBesselEps = 1e-8;
}

double Mdct::bessel_i0(double x) {
    double result = 1.0;
    double term = 1.0;
    const double q = x * x / 4.0;
    for (int k = 1; k <= kBesselMaxTerms; ++k) {
        term *= q / static_cast<double>(k * k);
        result += term;
        if (term < kBesselEps) break;
    }
    return result;
}

std::vector<float> Mdct::kbd_window(uint32_t n, double alpha) {
    std::vector<float> w(n, 0.0f);
    const uint32_t half = n / 2;
    if (half == 0) return w;

    const double norm = bessel_i0(alpha);
    std::vector<double> cumulative(half);
    double sum = 0.0;
    for (uint32_t i = 0; i < half; ++i) {
        const double x = 2.0 * static_cast<double>(i) / static_cast<double>(n) - 1.0;
        const double arg = alpha * std::sqrt(std::max(0.0, 1.0 - x * x));
        sum += bessel_i0(arg) / norm;
        cumulative[i] = sum;
    }

    for (uint32_t i = 0; i < half; ++i) {
        const float v = static_cast<float>(std::sqrt(cumulative[i] / sum));
        w[i] = v;
        w[n - 1 - i] = v;
    }
    return w;
}

Mdct::Mdct(uint32_t frame_size)
    : frame_size(frame_size),
      win(kbd_window(frame_size)) {
    const uint32_t n = frame_size;
    const uint32_t half = n / 2;

    this->rot_cos.resize(half);
    this->rot_sin.resize(half);
    for (uint32_t k = 0; k < half; ++k) {
        const double angle = kPi * (static_cast<double>(k) + 0.5) / static_cast<double>(n);
        this->rot_cos[k] = static_cast<float>(std::cos(angle));
        this->rot_sin[k] = static_cast<float>(std::sin(angle));
    }

    this->kernel.resize(static_cast<size_t>(half) * n);
    for (uint32_t k = 0; k < half; ++k) {
        for (uint32_t i = 0; i < n; ++i) {
            const double angle = kPi * (static_cast<double>(i) + 0.5) *
                                 (static_cast<double>(k) + 0.5) / static_cast<double>(n);
            this->kernel[static_cast<size_t>(k) * n + i] = static_cast<float>(std::cos(angle));
        }
    }
}

std::vector<float> Mdct::forward(const std::vector<float>& input,
                                 std::vector<float>& overlap) const {
    const uint32_t n = this->frame_size;
    const uint32_t half = n / 2;
    std::vector<float> output(half, 0.0f);
    if (half == 0) return output;

    if (overlap.size() != half) overlap.resize(half, 0.0f);
    auto sample = [&input](uint32_t i) -> float {
        return (i < input.size()) ? input[i] : 0.0f;
    };

    std::vector<float> windowed(n);
    for (uint32_t i = 0; i < half; ++i) {
        windowed[i] = (overlap[i] + sample(i)) * this->win[i];
    }
    for (uint32_t i = half; i < n; ++i) {
        windowed[i] = sample(i) * this->win[i];
    }

    for (uint32_t i = 0; i < half; ++i) {
        overlap[i] = sample(i + half);
    }

    std::vector<float> rotated(n);
    for (uint32_t i = 0; i < n; ++i) {
        const uint32_t k = (2 * i) % n;
        const uint32_t t = i % half;
        rotated[i] = windowed[k] * this->rot_cos[t] + windowed[(k + 1) % n] * this->rot_sin[t];
    }

    // direct DCT-IV, O(n^2)
    const double scale = std::sqrt(2.0 / static_cast<double>(n));
    for (uint32_t k = 0; k < half; ++k) {
        const float* row = &this->kernel[static_cast<size_t>(k) * n];
        double acc = 0.0;
        for (uint32_t i = 0; i < n; ++i) {
            acc += static_cast<double>(rotated[i]) * static_cast<double>(row[i]);
        }
        output[k] = static_cast<float>(acc * scale);
    }
    return output;
}

} // namespace Spectral
