#include "shared_encoder.hpp"
#include <string>
#include <system_error>
#include "utils/logger.hpp"

namespace LDE {

SharedEncoder::SharedEncoder(const Config& config)
    : encoder_(config) {}

bool SharedEncoder::acquire(std::unique_lock<std::mutex>& lock, Error* err) const {
    try {
        lock.lock();
    } catch (const std::system_error& e) {
        LDE_DEBUG_LOG("[shared] lock failed: " << e.what() << "\n");
        return Error::report(err, ErrorCode::EncodingFailed,
                             std::string("Failed to acquire encoder lock: ") + e.what());
    }
    return true;
}

bool SharedEncoder::encode_frame(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    return encoder_.encode_frame(input, out, err);
}

bool SharedEncoder::encode_buffer(const std::vector<float>& input, std::vector<uint8_t>& out, Error* err) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    return encoder_.encode_buffer(input, out, err);
}

bool SharedEncoder::get_stats(EncoderStats& out, Error* err) const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    out = encoder_.get_stats();
    return true;
}

bool SharedEncoder::get_config(Config& out, Error* err) const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    out = encoder_.get_config();
    return true;
}

bool SharedEncoder::reset_stats(Error* err) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    encoder_.reset_stats();
    return true;
}

bool SharedEncoder::delay_samples(uint32_t& out, Error* err) const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    out = encoder_.delay_samples();
    return true;
}

bool SharedEncoder::frame_duration_ms(double& out, Error* err) const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    out = encoder_.frame_duration_ms();
    return true;
}

bool SharedEncoder::bitrate_kbps(double& out, Error* err) const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    out = encoder_.bitrate_kbps();
    return true;
}

bool SharedEncoder::is_realtime_capable(double max_latency_ms, bool& out, Error* err) const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!this->acquire(lock, err)) return false;
    out = encoder_.is_realtime_capable(max_latency_ms);
    return true;
}

} // namespace LDE
