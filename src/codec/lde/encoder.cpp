#include "encoder.hpp"
#include <chrono>
#include <cmath>
#include <string>
#include <utility>
#include "codec/bitstream/bit_writer.hpp"
#include "codec/frame/coefficient_coder.hpp"
#include "codec/frame/frame_header.hpp"
#include "utils/logger.hpp"

namespace LDE {

namespace {
constexpr double kPerfectSnrDb = 100.0;
constexpr double kSnrDecay = 0.9;
constexpr size_t kRecommendedFrames = 4;
}

Encoder::ChannelState::ChannelState(const Config& config, uint32_t channel_bitrate)
    : overlap(config.get_frame_size() / 2, 0.0f),
      psycho(config.get_sample_rate(), config.get_frame_size()),
      quantizer(config.get_frame_size() / 2, channel_bitrate,
                config.get_sample_rate(), config.get_frame_size()) {}

Encoder::Encoder(const Config& config)
    : config(config),
      mdct(config.get_frame_size()),
      tns(Spectral::TNS_DEFAULT_ORDER, config.tns_enabled()) {
    const uint8_t count = config.get_channels();
    const uint32_t channel_bitrate = config.get_bitrate() / (count > 0 ? count : 1);
    this->channels.reserve(count);
    for (uint8_t ch = 0; ch < count; ++ch) {
        this->channels.emplace_back(config, channel_bitrate);
    }
}

void Encoder::encode_channel(const float* input, size_t channel, ChannelResult& result) {
    const size_t frame_size = this->config.get_frame_size();
    const size_t stride = this->config.get_channels();
    ChannelState& state = this->channels[channel];

    std::vector<float> samples(frame_size);
    for (size_t i = 0; i < frame_size; ++i) {
        samples[i] = input[i * stride + channel];
    }

    result.coeffs = this->mdct.forward(samples, state.overlap);
    this->tns.apply(result.coeffs);

    // the real-valued spectrum stands in for a complex one
    const std::vector<float> imag(result.coeffs.size(), 0.0f);
    const std::vector<float> thresholds = state.psycho.analyze(result.coeffs, imag);

    result.quantized = state.quantizer.quantize(result.coeffs, thresholds,
                                                this->config.get_quality(),
                                                &result.step_scales);
}

bool Encoder::encode_frame(const float* input, size_t size, std::vector<uint8_t>& out, Error* err) {
    const auto t0 = std::chrono::steady_clock::now();

    const size_t expected = this->config.samples_per_frame();
    if (size != expected || (input == nullptr && size > 0)) {
        LDE_DEBUG_LOG("[encoder] rejected frame: expected " << expected << " samples, got " << size << "\n");
        return Error::size_mismatch(err, expected, size);
    }

    // header first, so an unmappable rate fails before any state moves
    BitWriter writer;
    FrameHeader hdr;
    if (!hdr.configure(this->config.get_sample_rate(), this->config.get_channels(), err)) {
        LDE_DEBUG_LOG("[encoder] no header index for " << this->config.get_sample_rate() << " Hz\n");
        return false;
    }
    if (!hdr.write(writer, err)) {
        return false;
    }

    const size_t count = this->channels.size();
    ChannelResult first;
    for (size_t ch = 0; ch < count; ++ch) {
        ChannelResult result;
        this->encode_channel(input, ch, result);
        if (!CoefficientCoder::write(writer, result.quantized)) {
            return Error::report(err, ErrorCode::BitstreamError,
                                 "Coefficient write failed on channel " + std::to_string(ch));
        }
        if (ch == 0) first = std::move(result);
    }

    std::vector<uint8_t> bytes = writer.finish();
    if (writer.has_error()) {
        return Error::report(err, ErrorCode::BitstreamError, "Frame finish failed");
    }

    const auto t1 = std::chrono::steady_clock::now();
    const uint64_t elapsed = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count());
    this->update_stats(bytes.size(), first, elapsed);

    LDE_TRACE_LOG("[encoder] frame=" << this->stats.frames_encoded
                  << " bytes=" << bytes.size()
                  << " snr=" << this->stats.avg_snr
                  << " us=" << elapsed << "\n");

    out = std::move(bytes);
    return true;
}

bool Encoder::encode_frame(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err) {
    return this->encode_frame(input.data(), input.size(), out, err);
}

bool Encoder::encode_buffer(const float* input, size_t size, std::vector<uint8_t>& out, Error* err) {
    const size_t frame_total = this->config.samples_per_frame();
    const size_t remainder = size % frame_total;
    if (remainder != 0 || (input == nullptr && size > 0)) {
        LDE_DEBUG_LOG("[encoder] rejected buffer of " << size << " samples (frame is "
                      << frame_total << ")\n");
        return Error::size_mismatch(err, size - remainder, size);
    }

    std::vector<uint8_t> output;
    std::vector<uint8_t> frame;
    for (size_t pos = 0; pos < size; pos += frame_total) {
        if (!this->encode_frame(input + pos, frame_total, frame, err)) {
            return false;
        }
        output.insert(output.end(), frame.begin(), frame.end());
    }

    out = std::move(output);
    return true;
}

bool Encoder::encode_buffer(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err) {
    return this->encode_buffer(input.data(), input.size(), out, err);
}

double Encoder::frame_snr(const ChannelResult& result) {
    double signal_power = 0.0;
    double noise_power = 0.0;
    const size_t n = result.coeffs.size();
    for (size_t i = 0; i < n; ++i) {
        const double orig = result.coeffs[i];
        const double scale = (i < result.step_scales.size()) ? result.step_scales[i] : 0.0;
        const double recon = (scale > 0.0) ? static_cast<double>(result.quantized[i]) / scale : 0.0;
        const double e = orig - recon;
        signal_power += orig * orig;
        noise_power += e * e;
    }

    if (noise_power == 0.0) return kPerfectSnrDb;
    if (signal_power == 0.0) return 0.0;
    return 10.0 * std::log10(signal_power / noise_power);
}

void Encoder::update_stats(size_t encoded_bytes, const ChannelResult& first, uint64_t elapsed_us) {
    const double snr = frame_snr(first);

    this->stats.frames_encoded += 1;
    this->stats.total_bits += static_cast<uint64_t>(encoded_bytes) * 8;
    this->stats.encoding_time_us += elapsed_us;
    if (this->stats.frames_encoded == 1) {
        this->stats.avg_snr = snr;
    } else {
        this->stats.avg_snr = kSnrDecay * this->stats.avg_snr + (1.0 - kSnrDecay) * snr;
    }
}

const Config& Encoder::get_config() const {
    return this->config;
}

const EncoderStats& Encoder::get_stats() const {
    return this->stats;
}

void Encoder::reset_stats() {
    this->stats = EncoderStats();
}

uint32_t Encoder::delay_samples() const {
    return this->config.get_frame_size() / 2 + ENCODER_DELAY_SAMPLES;
}

double Encoder::frame_duration_ms() const {
    return static_cast<double>(this->config.get_frame_size()) * 1000.0 /
           static_cast<double>(this->config.get_sample_rate());
}

double Encoder::bitrate_kbps() const {
    double bits_per_frame = 0.0;
    for (const ChannelState& ch : this->channels) {
        bits_per_frame += ch.quantizer.get_rate_controller().avg_bits;
    }
    const double frames_per_second = static_cast<double>(this->config.get_sample_rate()) /
                                     static_cast<double>(this->config.get_frame_size());
    return bits_per_frame * frames_per_second / 1000.0;
}

size_t Encoder::recommended_buffer_size() const {
    return this->config.samples_per_frame() * kRecommendedFrames;
}

size_t Encoder::estimate_memory_usage_kb() const {
    const size_t frame_size = this->config.get_frame_size();
    const size_t spectrum = frame_size / 2;

    const size_t mdct_bytes = frame_size * 4;
    const size_t psycho_bytes = spectrum * 8;
    const size_t quant_bytes = spectrum * 2;
    const size_t overlap_bytes = spectrum * 4;
    return (mdct_bytes + psycho_bytes + quant_bytes + overlap_bytes) / 1024;
}

bool Encoder::is_realtime_capable(double max_latency_ms) const {
    return this->frame_duration_ms() / 2.0 <= max_latency_ms;
}

const Spectral::AdaptiveQuantizer& Encoder::channel_quantizer(size_t channel) const {
    return this->channels[channel].quantizer;
}

} // namespace LDE
