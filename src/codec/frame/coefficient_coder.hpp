#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "codec/bitstream/bit_writer.hpp"
#include "codec/bitstream/bit_reader.hpp"

// Per-channel variable-length code for quantized spectral values:
//   0            -> 00
//   |v| < 16     -> 01 mmmm s
//   otherwise    -> 10 mmmmmmmmmmmmmmmm s
class CoefficientCoder {
public:
    static constexpr uint32_t TAG_ZERO = 0b00u;
    static constexpr uint32_t TAG_SMALL = 0b01u;
    static constexpr uint32_t TAG_LARGE = 0b10u;
    static constexpr int SMALL_LIMIT = 16;

    static bool write(BitWriter& w, const std::vector<int16_t>& values);

    static bool read(BitReader& r, size_t count, std::vector<int16_t>& values);

    // Exact cost of write() in bits.
    static uint64_t coded_bits(const std::vector<int16_t>& values);

private:
    static bool write_value(BitWriter& w, int16_t value);
};
