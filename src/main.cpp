#include <iostream>
#include <vector>
#include <string>
#include <cmath>
#include <chrono>
#include <cstdlib>
#include "codec/config/config.hpp"
#include "codec/lde/encoder.hpp"

static void usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  lde_cli info <sample_rate> <channels> <bitrate>\n";
    std::cerr << "  lde_cli selftest\n";
}

static bool parse_u32(const char* text, uint32_t& out) {
    char* end = nullptr;
    unsigned long v = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || v > 0xFFFFFFFFul) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

static std::vector<float> make_tone(const LDE::Config& cfg, double freq, size_t frames) {
    const double two_pi = 6.28318530717958647692;
    const size_t n = cfg.get_frame_size() * frames;
    const size_t channels = cfg.get_channels();
    std::vector<float> out(n * channels);
    for (size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(cfg.get_sample_rate());
        const float v = static_cast<float>(std::sin(two_pi * freq * t) * 0.5);
        for (size_t ch = 0; ch < channels; ++ch) {
            out[i * channels + ch] = v;
        }
    }
    return out;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string mode = argv[1];

    if (mode == "info") {
        if (argc != 5) {
            usage();
            return 1;
        }
        uint32_t sample_rate = 0;
        uint32_t channels = 0;
        uint32_t bitrate = 0;
        if (!parse_u32(argv[2], sample_rate) || !parse_u32(argv[3], channels) ||
            !parse_u32(argv[4], bitrate) || channels > 255) {
            usage();
            return 1;
        }
        LDE::Config cfg;
        LDE::Error err;
        if (!LDE::Config::create(sample_rate, static_cast<uint8_t>(channels), bitrate, cfg, &err)) {
            std::cerr << err.describe() << "\n";
            return 1;
        }
        LDE::Encoder encoder(cfg);
        std::cout << "frame_size=" << cfg.get_frame_size()
                  << " delay_samples=" << encoder.delay_samples()
                  << " frame_ms=" << encoder.frame_duration_ms()
                  << " buffer=" << encoder.recommended_buffer_size()
                  << " memory_kb=" << encoder.estimate_memory_usage_kb() << "\n";
        return 0;
    }

    if (mode == "selftest") {
        struct Case {
            uint32_t sample_rate;
            uint8_t channels;
            uint32_t bitrate;
        };
        const Case cases[] = {
            {8000, 1, 32000},
            {16000, 1, 64000},
            {44100, 2, 128000},
            {48000, 2, 192000},
            {96000, 1, 256000},
        };

        for (const Case& c : cases) {
            LDE::Config cfg;
            LDE::Error err;
            if (!LDE::Config::create(c.sample_rate, c.channels, c.bitrate, cfg, &err)) {
                std::cerr << "Config failed: " << err.describe() << "\n";
                return 1;
            }
            LDE::Encoder encoder(cfg);
            const std::vector<float> pcm = make_tone(cfg, 1000.0, 10);
            std::vector<uint8_t> bitstream;
            auto t0 = std::chrono::steady_clock::now();
            if (!encoder.encode_buffer(pcm, bitstream, &err)) {
                std::cerr << "Encode failed for sr=" << c.sample_rate << ": " << err.describe() << "\n";
                return 1;
            }
            auto t1 = std::chrono::steady_clock::now();
            auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
            const LDE::EncoderStats& stats = encoder.get_stats();
            std::cout << "Selftest sr=" << c.sample_rate << "Hz ch=" << int(c.channels)
                      << " target=" << c.bitrate / 1000 << "kbps"
                      << " bytes=" << bitstream.size()
                      << " frames=" << stats.frames_encoded
                      << " snr=" << stats.avg_snr << "dB"
                      << " rate=" << encoder.bitrate_kbps() << "kbps"
                      << " (" << us << "us)\n";
        }

        std::cout << "Selftest complete.\n";
        return 0;
    }

    usage();
    return 1;
}
