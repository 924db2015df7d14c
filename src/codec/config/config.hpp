#pragma once
#include <cstddef>
#include <cstdint>
#include "codec/error.hpp"

namespace LDE {

constexpr uint8_t MAX_CHANNELS = 8;
constexpr uint32_t MIN_BITRATE = 8000;
constexpr uint32_t MAX_BITRATE = 320000;

// Validated encoder configuration. frame_size is always derived from the
// sample rate and cannot be set directly.
class Config {
public:
    // 44100 Hz, stereo, 128 kbit/s
    Config();

    static bool create(uint32_t sample_rate,
                       uint8_t channels,
                       uint32_t bitrate,
                       Config& out,
                       Error* err = nullptr);

    // 8000-16000 -> 240, 16001-48000 -> 480, 48001-96000 -> 512
    static bool derive_frame_size(uint32_t sample_rate, uint32_t& frame_size);

    bool validate(Error* err = nullptr) const;

    bool set_quality(float quality, Error* err = nullptr);
    bool set_bitrate(uint32_t bitrate, Error* err = nullptr);
    void set_tns_enabled(bool enabled);
    void set_pns_enabled(bool enabled);

    uint32_t get_sample_rate() const { return this->sample_rate; }
    uint8_t get_channels() const { return this->channels; }
    uint32_t get_frame_size() const { return this->frame_size; }
    uint32_t get_bitrate() const { return this->bitrate; }
    float get_quality() const { return this->quality; }
    bool tns_enabled() const { return this->use_tns; }
    // Accepted and carried, not consumed by any stage.
    bool pns_enabled() const { return this->use_pns; }

    size_t samples_per_frame() const {
        return static_cast<size_t>(this->frame_size) * this->channels;
    }

private:
    uint32_t sample_rate;
    uint8_t channels;
    uint32_t frame_size;
    uint32_t bitrate;
    float quality;
    bool use_tns;
    bool use_pns;
};

} // namespace LDE
