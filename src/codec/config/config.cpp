#include "config.hpp"
#include <string>
#include "utils/logger.hpp"

namespace LDE {

namespace {
constexpr float kDefaultQuality = 0.75f;

bool quality_in_range(float q) {
    // written so that NaN fails
    return q >= 0.0f && q <= 1.0f;
}
}

Config::Config()
    : sample_rate(44100),
      channels(2),
      frame_size(480),
      bitrate(128000),
      quality(kDefaultQuality),
      use_tns(true),
      use_pns(false) {}

bool Config::derive_frame_size(uint32_t sample_rate, uint32_t& frame_size) {
    if (sample_rate >= 8000 && sample_rate <= 16000) {
        frame_size = 240;
    } else if (sample_rate >= 16001 && sample_rate <= 32000) {
        frame_size = 480;
    } else if (sample_rate >= 32001 && sample_rate <= 48000) {
        frame_size = 480;
    } else if (sample_rate >= 48001 && sample_rate <= 96000) {
        frame_size = 512;
    } else {
        return false;
    }
    return true;
}

bool Config::create(uint32_t sample_rate,
                    uint8_t channels,
                    uint32_t bitrate,
                    Config& out,
                    Error* err) {
    Config cfg;
    if (!derive_frame_size(sample_rate, cfg.frame_size)) {
        LDE_DEBUG_LOG("[config] unsupported sample rate " << sample_rate << "\n");
        return Error::report(err, ErrorCode::InvalidConfig,
                             "Unsupported sample rate: " + std::to_string(sample_rate));
    }
    cfg.sample_rate = sample_rate;
    cfg.channels = channels;
    cfg.bitrate = bitrate;
    if (!cfg.validate(err)) {
        LDE_DEBUG_LOG("[config] rejected sr=" << sample_rate << " ch=" << int(channels)
                      << " br=" << bitrate << "\n");
        return false;
    }
    out = cfg;
    return true;
}

bool Config::validate(Error* err) const {
    uint32_t derived = 0;
    if (!derive_frame_size(this->sample_rate, derived) || derived != this->frame_size) {
        return Error::report(err, ErrorCode::InvalidConfig,
                             "Unsupported sample rate: " + std::to_string(this->sample_rate));
    }
    if (this->channels == 0 || this->channels > MAX_CHANNELS) {
        return Error::report(err, ErrorCode::InvalidConfig, "Invalid channel count");
    }
    if (this->bitrate < MIN_BITRATE || this->bitrate > MAX_BITRATE) {
        return Error::report(err, ErrorCode::InvalidConfig, "Invalid bitrate");
    }
    if (!quality_in_range(this->quality)) {
        return Error::report(err, ErrorCode::InvalidConfig, "Quality must be between 0.0 and 1.0");
    }
    return true;
}

bool Config::set_quality(float quality, Error* err) {
    if (!quality_in_range(quality)) {
        return Error::report(err, ErrorCode::InvalidConfig, "Quality must be between 0.0 and 1.0");
    }
    this->quality = quality;
    return true;
}

bool Config::set_bitrate(uint32_t bitrate, Error* err) {
    if (bitrate < MIN_BITRATE || bitrate > MAX_BITRATE) {
        return Error::report(err, ErrorCode::InvalidConfig, "Invalid bitrate");
    }
    this->bitrate = bitrate;
    return true;
}

void Config::set_tns_enabled(bool enabled) {
    this->use_tns = enabled;
}

void Config::set_pns_enabled(bool enabled) {
    this->use_pns = enabled;
}

} // namespace LDE
