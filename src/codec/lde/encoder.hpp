#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include "codec/config/config.hpp"
#include "codec/error.hpp"
#include "codec/mdct/mdct.hpp"
#include "codec/psycho/psychoacoustic_model.hpp"
#include "codec/quant/quantizer.hpp"
#include "codec/tns/tns.hpp"

namespace LDE {

constexpr uint32_t ENCODER_DELAY_SAMPLES = 64;

struct EncoderStats {
    uint64_t frames_encoded = 0;
    uint64_t total_bits = 0;
    double avg_snr = 0.0; // dB, channel 0
    uint64_t encoding_time_us = 0;
};

// Low-delay encoder for one audio stream. Not safe for concurrent use: the
// overlap buffers and analysis history are updated in place on every frame.
// Use one instance per stream, or SharedEncoder to serialize callers.
class Encoder {
public:
    explicit Encoder(const Config& config);

    // input: frame_size * channels interleaved samples
    bool encode_frame(const float* input, size_t size, std::vector<uint8_t>& out, Error* err = nullptr);
    bool encode_frame(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err = nullptr);

    // input: any whole number of frames; output frames are concatenated
    bool encode_buffer(const float* input, size_t size, std::vector<uint8_t>& out, Error* err = nullptr);
    bool encode_buffer(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err = nullptr);

    const Config& get_config() const;
    const EncoderStats& get_stats() const;
    void reset_stats();

    uint32_t delay_samples() const;
    double frame_duration_ms() const;
    double bitrate_kbps() const;
    size_t recommended_buffer_size() const;
    size_t estimate_memory_usage_kb() const;
    bool is_realtime_capable(double max_latency_ms) const;

    // Read-only view of a channel's rate controller, for diagnostics.
    // channel must be below get_config().get_channels(); unchecked.
    const Spectral::AdaptiveQuantizer& channel_quantizer(size_t channel) const;

private:
    struct ChannelState {
        std::vector<float> overlap;
        Spectral::PsychoacousticModel psycho;
        Spectral::AdaptiveQuantizer quantizer;

        ChannelState(const Config& config, uint32_t channel_bitrate);
    };

    struct ChannelResult {
        std::vector<float> coeffs;
        std::vector<int16_t> quantized;
        std::vector<float> step_scales;
    };

    Config config;
    Spectral::Mdct mdct;
    Spectral::TemporalNoiseShaping tns;
    std::vector<ChannelState> channels;
    EncoderStats stats;

    void encode_channel(const float* input, size_t channel, ChannelResult& result);
    void update_stats(size_t encoded_bytes, const ChannelResult& first, uint64_t elapsed_us);
    static double frame_snr(const ChannelResult& result);
};

} // namespace LDE
