#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include "codec/bitstream/bit_writer.hpp"
#include "codec/bitstream/bit_reader.hpp"
#include "codec/error.hpp"

// Simplified ADTS-like pseudo-header. Not a conformant ADTS header: there is
// no frame length, buffer fullness or raw-block count.
struct FrameHeader {
    static constexpr uint16_t SYNC_WORD = 0xFFF;
    static constexpr uint8_t PROFILE_LOW_DELAY = 23;
    static constexpr size_t HEADER_BITS = 31;

    uint16_t sync;           // 12 bits
    uint8_t id;              // 1 bit
    uint8_t layer;           // 2 bits
    uint8_t protection_absent; // 1 bit
    uint8_t profile;         // 5 bits
    uint8_t sample_rate_idx; // 4 bits
    uint8_t private_bit;     // 1 bit
    uint8_t channel_config;  // 3 bits
    uint8_t original;        // 1 bit
    uint8_t home;            // 1 bit

    FrameHeader()
        : sync(SYNC_WORD),
          id(0),
          layer(0),
          protection_absent(1),
          profile(PROFILE_LOW_DELAY),
          sample_rate_idx(0),
          private_bit(0),
          channel_config(0),
          original(0),
          home(0) {}

    // Fills the rate and channel fields; fails for rates outside the
    // 12-entry index table.
    bool configure(uint32_t sample_rate, uint8_t channels, LDE::Error* err = nullptr) {
        uint8_t idx = 0;
        if (!sample_rate_index(sample_rate, idx)) {
            return LDE::Error::report(err, LDE::ErrorCode::BitstreamError,
                                      "Unsupported sample rate for header: " +
                                      std::to_string(sample_rate));
        }
        this->sample_rate_idx = idx;
        this->channel_config = channel_config_for(channels);
        return true;
    }

    bool write(BitWriter& w, LDE::Error* err = nullptr) const {
        bool ok = w.write_bits(this->sync, 12);
        ok = ok && w.write_bits(this->id, 1);
        ok = ok && w.write_bits(this->layer, 2);
        ok = ok && w.write_bits(this->protection_absent, 1);
        ok = ok && w.write_bits(this->profile, 5);
        ok = ok && w.write_bits(this->sample_rate_idx, 4);
        ok = ok && w.write_bits(this->private_bit, 1);
        ok = ok && w.write_bits(this->channel_config, 3);
        ok = ok && w.write_bits(this->original, 1);
        ok = ok && w.write_bits(this->home, 1);
        if (!ok) {
            return LDE::Error::report(err, LDE::ErrorCode::BitstreamError, "Header write failed");
        }
        return true;
    }

    void read(BitReader& r) {
        this->sync = static_cast<uint16_t>(r.read_bits(12));
        this->id = static_cast<uint8_t>(r.read_bits(1));
        this->layer = static_cast<uint8_t>(r.read_bits(2));
        this->protection_absent = static_cast<uint8_t>(r.read_bits(1));
        this->profile = static_cast<uint8_t>(r.read_bits(5));
        this->sample_rate_idx = static_cast<uint8_t>(r.read_bits(4));
        this->private_bit = static_cast<uint8_t>(r.read_bits(1));
        this->channel_config = static_cast<uint8_t>(r.read_bits(3));
        this->original = static_cast<uint8_t>(r.read_bits(1));
        this->home = static_cast<uint8_t>(r.read_bits(1));
    }

    bool validate() const {
        if (this->sync != SYNC_WORD || this->profile != PROFILE_LOW_DELAY) return false;
        if (this->sample_rate_idx >= kRateTableSize) return false;
        return true;
    }

    uint32_t sample_rate() const {
        return (this->sample_rate_idx < kRateTableSize) ? kRateTable[this->sample_rate_idx] : 0;
    }

    static bool parse(const uint8_t* data, size_t size, FrameHeader& hdr, BitReader* reader = nullptr) {
        BitReader local(data, size);
        BitReader& br = reader ? *reader : local;
        hdr.read(br);
        return !br.has_error() && hdr.validate();
    }

    static bool sample_rate_index(uint32_t sample_rate, uint8_t& idx) {
        for (uint8_t i = 0; i < kRateTableSize; ++i) {
            if (kRateTable[i] == sample_rate) {
                idx = i;
                return true;
            }
        }
        return false;
    }

    // 1-6 channels are signalled directly, 8 channels as config 7 (7.1);
    // 7 channels have no fixed layout and are signalled as 0.
    static uint8_t channel_config_for(uint8_t channels) {
        if (channels >= 1 && channels <= 6) return channels;
        if (channels == 8) return 7;
        return 0;
    }

private:
    static constexpr uint8_t kRateTableSize = 12;
    static constexpr uint32_t kRateTable[kRateTableSize] = {
        96000, 88200, 64000, 48000, 44100, 32000,
        24000, 22050, 16000, 12000, 11025, 8000
    };
};
