#include "codec/config/config.hpp"
#include "codec/error.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>

namespace {

void check_frame_size_table() {
    struct Row {
        uint32_t sample_rate;
        uint32_t frame_size;
    };
    const Row rows[] = {
        {8000, 240}, {16000, 240}, {22050, 480}, {24000, 480},
        {32000, 480}, {44100, 480}, {48000, 480}, {96000, 512},
        {16001, 480}, {32001, 480}, {48001, 512},
    };
    for (const Row& row : rows) {
        uint32_t fs = 0;
        assert(LDE::Config::derive_frame_size(row.sample_rate, fs));
        assert(fs == row.frame_size);

        LDE::Config cfg;
        assert(LDE::Config::create(row.sample_rate, 1, 64000, cfg));
        assert(cfg.get_frame_size() == row.frame_size);
    }

    uint32_t fs = 0;
    assert(!LDE::Config::derive_frame_size(7999, fs));
    assert(!LDE::Config::derive_frame_size(96001, fs));
    assert(!LDE::Config::derive_frame_size(192000, fs));
}

void check_bounds() {
    LDE::Config cfg;
    LDE::Error err;

    assert(LDE::Config::create(44100, 2, 128000, cfg, &err));
    assert(err.ok());
    assert(cfg.get_quality() == 0.75f);
    assert(cfg.tns_enabled());
    assert(!cfg.pns_enabled());

    assert(!LDE::Config::create(44100, 0, 128000, cfg, &err));
    assert(err.code == LDE::ErrorCode::InvalidConfig);
    assert(!LDE::Config::create(44100, 9, 128000, cfg, &err));
    assert(err.code == LDE::ErrorCode::InvalidConfig);
    assert(!LDE::Config::create(44100, 2, 1000, cfg, &err));
    assert(!LDE::Config::create(44100, 2, 320001, cfg, &err));
    assert(!LDE::Config::create(1000, 2, 128000, cfg, &err));
    assert(err.code == LDE::ErrorCode::InvalidConfig);

    assert(LDE::Config::create(8000, 1, 8000, cfg));
    assert(LDE::Config::create(96000, 8, 320000, cfg));
    assert(cfg.get_channels() == 8);
    assert(cfg.samples_per_frame() == 512u * 8u);
}

void check_failed_create_leaves_output() {
    LDE::Config cfg;
    assert(LDE::Config::create(16000, 1, 32000, cfg));
    assert(!LDE::Config::create(44100, 0, 128000, cfg));
    assert(cfg.get_sample_rate() == 16000);
    assert(cfg.get_frame_size() == 240);
}

void check_setters() {
    LDE::Config cfg;
    LDE::Error err;
    assert(cfg.validate());
    assert(cfg.get_sample_rate() == 44100 && cfg.get_channels() == 2 && cfg.get_bitrate() == 128000);

    assert(cfg.set_quality(0.0f));
    assert(cfg.set_quality(1.0f));
    assert(!cfg.set_quality(1.01f, &err));
    assert(err.code == LDE::ErrorCode::InvalidConfig);
    assert(!cfg.set_quality(-0.1f));
    assert(!cfg.set_quality(std::numeric_limits<float>::quiet_NaN()));
    assert(cfg.get_quality() == 1.0f);

    assert(cfg.set_bitrate(64000));
    assert(!cfg.set_bitrate(7999));
    assert(cfg.get_bitrate() == 64000);

    cfg.set_tns_enabled(false);
    cfg.set_pns_enabled(true);
    assert(!cfg.tns_enabled());
    assert(cfg.pns_enabled());
    assert(cfg.validate());
}

void check_error_text() {
    LDE::Error err;
    LDE::Error::size_mismatch(&err, 960, 100);
    assert(err.code == LDE::ErrorCode::BufferSizeMismatch);
    assert(err.expected == 960 && err.actual == 100);
    assert(err.describe() == "Buffer size mismatch: expected 960, got 100");

    LDE::Error::report(&err, LDE::ErrorCode::BitstreamError, "x");
    assert(err.expected == 0);
    assert(err.describe() == "Bitstream error: x");
    err.clear();
    assert(err.ok());

    assert(!LDE::Error::report(nullptr, LDE::ErrorCode::EncodingFailed, "ignored"));
}

} // namespace

void run_config_tests() {
    check_frame_size_table();
    check_bounds();
    check_failed_create_leaves_output();
    check_setters();
    check_error_text();
    std::cout << "config tests ok\n";
}
