#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// MSB-first bit packer. Single use: finish() hands the bytes out and any
// later write fails.
class BitWriter {
public:
    static constexpr int MAX_BITS_PER_WRITE = 32;

    BitWriter();

    bool write_bit(uint32_t bit);
    bool write_bits(uint32_t value, int nbits);
    void flush_to_byte();

    // Pads the partial byte with zeros and moves the buffer out.
    std::vector<uint8_t> finish();

    size_t bits_written() const;
    bool has_error() const;
    bool is_finished() const;

private:
    std::vector<uint8_t> buffer;
    uint8_t current_byte;
    int bit_pos;
    bool finished;
    bool error;
};
