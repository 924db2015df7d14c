#pragma once
#include <mutex>
#include <vector>
#include "codec/lde/encoder.hpp"

namespace LDE {

// One Encoder behind one mutex. Callers on different threads take turns on
// the same stream state; encoding is not parallelized. Independent streams
// should each get their own Encoder instead.
class SharedEncoder {
public:
    explicit SharedEncoder(const Config& config);

    bool encode_frame(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err = nullptr);
    bool encode_buffer(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err = nullptr);

    bool get_stats(EncoderStats& out, Error* err = nullptr) const;
    bool get_config(Config& out, Error* err = nullptr) const;
    bool reset_stats(Error* err = nullptr);

    bool delay_samples(uint32_t& out, Error* err = nullptr) const;
    bool frame_duration_ms(double& out, Error* err = nullptr) const;
    bool bitrate_kbps(double& out, Error* err = nullptr) const;
    bool is_realtime_capable(double max_latency_ms, bool& out, Error* err = nullptr) const;

private:
    mutable std::mutex mutex_;
    Encoder encoder_;

    bool acquire(std::unique_lock<std::mutex>& lock, Error* err) const;
};

} // namespace LDE
