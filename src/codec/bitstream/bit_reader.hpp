#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// MSB-first reader over a finished frame. Reading past the end, or more
// than 32 bits at once, latches the error flag and yields zeros.
class BitReader {
public:
    BitReader(const uint8_t* data, size_t size);
    explicit BitReader(const std::vector<uint8_t>& buf);

    uint32_t read_bit();
    uint32_t read_bits(int nbits);

    size_t bit_position() const;
    size_t bits_remaining() const;
    bool has_error() const;

private:
    const uint8_t* data;
    size_t size_bits;
    size_t pos;
    bool error;
};
