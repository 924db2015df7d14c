#pragma once
#include <cstdint>
#include <vector>

namespace Spectral {

constexpr double KBD_ALPHA = 6.0;

// Windowed lapped transform, frame_size samples in, frame_size/2
// coefficients out. The transform itself is stateless; the caller owns one
// overlap buffer per channel and must feed frames in temporal order.
class Mdct {
public:
    explicit Mdct(uint32_t frame_size);

    // overlap holds frame_size/2 samples; on return it holds the trailing
    // half of input.
    std::vector<float> forward(const std::vector<float>& input,
                               std::vector<float>& overlap) const;

    uint32_t get_frame_size() const { return this->frame_size; }
    const std::vector<float>& window() const { return this->win; }

    // Power series, stops once a term drops below 1e-8 or after 20 terms.
    static double bessel_i0(double x);
    static std::vector<float> kbd_window(uint32_t n, double alpha = KBD_ALPHA);

private:
    uint32_t frame_size;
    std::vector<float> win;
    std::vector<float> rot_cos;
    std::vector<float> rot_sin;
    std::vector<float> kernel; // (frame_size/2) x frame_size, row-major
};

} // namespace Spectral
