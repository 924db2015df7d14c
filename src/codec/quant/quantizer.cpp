#include "quantizer.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include "utils/logger.hpp"

namespace Spectral {

namespace {
constexpr float kThresholdEps = 1e-10f;
constexpr float kAvgDecay = 0.9f;
constexpr int kToleranceDivisor = 20; // 5 %

int16_t clamp_round(double scaled) {
    // NaN falls through to the lower clamp
    if (!(scaled > -static_cast<double>(MAX_QUANT_VALUE))) return -MAX_QUANT_VALUE;
    if (scaled >= static_cast<double>(MAX_QUANT_VALUE)) return MAX_QUANT_VALUE;
    return static_cast<int16_t>(std::round(scaled));
}

uint32_t floor_log2(uint32_t v) {
    uint32_t r = 0;
    while (v >>= 1) ++r;
    return r;
}
}

void RateController::update(uint32_t frame_bits) {
    this->avg_bits = kAvgDecay * this->avg_bits + (1.0f - kAvgDecay) * static_cast<float>(frame_bits);
    const int64_t reservoir = static_cast<int64_t>(this->bit_reservoir) +
                              static_cast<int64_t>(this->target_bits) -
                              static_cast<int64_t>(frame_bits);
    this->bit_reservoir = static_cast<int32_t>(
        std::max<int64_t>(-RESERVOIR_LIMIT, std::min<int64_t>(RESERVOIR_LIMIT, reservoir)));
}

AdaptiveQuantizer::AdaptiveQuantizer(size_t bands, uint32_t bitrate, uint32_t sample_rate, uint32_t frame_size)
    : scale_factors(std::max<size_t>(bands, 1), 0),
      global_gain(INITIAL_GLOBAL_GAIN),
      last_frame_bits(0),
      last_iterations(0) {
    const uint64_t bits = (sample_rate > 0)
        ? (static_cast<uint64_t>(bitrate) * frame_size) / sample_rate
        : 0;
    this->rate.target_bits = static_cast<uint32_t>(bits);
    this->rate.avg_bits = static_cast<float>(bits);
    this->rate.bit_reservoir = 0;
}

uint32_t AdaptiveQuantizer::estimate_bits(int16_t value) {
    const uint32_t magnitude = static_cast<uint32_t>(std::abs(static_cast<int32_t>(value)));
    if (magnitude == 0) return 2;
    if (magnitude < 16) return 4 + (value < 0 ? 1 : 0);
    return 8 + 2 * floor_log2(magnitude); // escape
}

float AdaptiveQuantizer::quality_factor(float quality) {
    return 0.5f + quality * 1.5f;
}

float AdaptiveQuantizer::base_gain(uint8_t global_gain) {
    return std::pow(2.0f, (static_cast<float>(INITIAL_GLOBAL_GAIN) - static_cast<float>(global_gain)) / 4.0f);
}

size_t AdaptiveQuantizer::band_of(size_t bin, size_t bins) const {
    if (bins == 0) return 0;
    const size_t band = (bin * this->scale_factors.size()) / bins;
    return std::min(band, this->scale_factors.size() - 1);
}

float AdaptiveQuantizer::step_scale(size_t band, float threshold, float quality) const {
    const float sf = std::pow(2.0f, static_cast<float>(this->scale_factors[band]) / 4.0f);
    return base_gain(this->global_gain) * sf * quality_factor(quality) / (threshold + kThresholdEps);
}

std::vector<int16_t> AdaptiveQuantizer::quantize(const std::vector<float>& coeffs,
                                                 const std::vector<float>& thresholds,
                                                 float quality,
                                                 std::vector<float>* step_scales) {
    const size_t n = coeffs.size();
    std::vector<int16_t> quantized(n, 0);
    std::vector<float> scales(n, 0.0f);
    const int64_t target = static_cast<int64_t>(this->rate.target_bits);

    int iteration = 0;
    uint32_t total_bits = 0;
    for (;;) {
        total_bits = 0;
        for (size_t i = 0; i < n; ++i) {
            const float threshold = (i < thresholds.size()) ? thresholds[i] : 1.0f;
            const float scale = this->step_scale(this->band_of(i, n), threshold, quality);
            const int16_t q = clamp_round(static_cast<double>(coeffs[i]) * scale);
            quantized[i] = q;
            scales[i] = scale;
            total_bits += estimate_bits(q);
        }

        const int64_t bit_error = static_cast<int64_t>(total_bits) - target;
        const bool converged = std::llabs(bit_error) * kToleranceDivisor <= target;
        if (converged || iteration >= MAX_RATE_ITERATIONS) {
            break;
        }

        // +2 over budget, -1 under budget
        if (bit_error > 0) {
            this->global_gain = static_cast<uint8_t>(std::min(255, this->global_gain + 2));
        } else {
            this->global_gain = static_cast<uint8_t>(std::max(0, this->global_gain - 1));
        }
        ++iteration;
    }

    this->rate.update(total_bits);
    this->last_frame_bits = total_bits;
    this->last_iterations = iteration;
    LDE_TRACE_LOG("[rate] iters=" << iteration << " gain=" << int(this->global_gain)
                  << " bits=" << total_bits << "/" << target
                  << " reservoir=" << this->rate.bit_reservoir << "\n");

    if (step_scales) step_scales->swap(scales);
    return quantized;
}

} // namespace Spectral
