#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Spectral {

constexpr int MAX_RATE_ITERATIONS = 10;
constexpr uint8_t INITIAL_GLOBAL_GAIN = 100;
constexpr int32_t RESERVOIR_LIMIT = 1000;
constexpr int16_t MAX_QUANT_VALUE = 32767;

struct RateController {
    uint32_t target_bits = 0;
    float avg_bits = 0.0f;     // 0.9/0.1 exponential average of frame bits
    int32_t bit_reservoir = 0; // clamped to +-RESERVOIR_LIMIT

    void update(uint32_t frame_bits);
};

// Bit-budget constrained scalar quantizer. Global gain works as a step-size
// exponent: larger gain, coarser steps, fewer bits. Gain and the rate
// controller persist from frame to frame.
class AdaptiveQuantizer {
public:
    AdaptiveQuantizer(size_t bands, uint32_t bitrate, uint32_t sample_rate, uint32_t frame_size);

    // Output has coeffs.size() entries. When step_scales is given it receives
    // the scale applied to each coefficient, so value / scale reconstructs.
    std::vector<int16_t> quantize(const std::vector<float>& coeffs,
                                  const std::vector<float>& thresholds,
                                  float quality,
                                  std::vector<float>* step_scales = nullptr);

    static uint32_t estimate_bits(int16_t value);
    // quality 0..1 -> 0.5..2.0
    static float quality_factor(float quality);
    static float base_gain(uint8_t global_gain);

    uint8_t get_global_gain() const { return this->global_gain; }
    const RateController& get_rate_controller() const { return this->rate; }
    uint32_t get_last_frame_bits() const { return this->last_frame_bits; }
    int get_last_iterations() const { return this->last_iterations; }
    size_t band_count() const { return this->scale_factors.size(); }

private:
    std::vector<uint8_t> scale_factors;
    uint8_t global_gain;
    RateController rate;
    uint32_t last_frame_bits;
    int last_iterations;

    size_t band_of(size_t bin, size_t bins) const;
    float step_scale(size_t band, float threshold, float quality) const;
};

} // namespace Spectral
