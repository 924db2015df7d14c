#include "coefficient_coder.hpp"
#include <cstdlib>

bool CoefficientCoder::write_value(BitWriter& w, int16_t value) {
    if (value == 0) {
        return w.write_bits(TAG_ZERO, 2);
    }

    const uint32_t magnitude = static_cast<uint32_t>(std::abs(static_cast<int32_t>(value)));
    const uint32_t sign = (value < 0) ? 1u : 0u;
    if (magnitude < static_cast<uint32_t>(SMALL_LIMIT)) {
        return w.write_bits(TAG_SMALL, 2) &&
               w.write_bits(magnitude, 4) &&
               w.write_bits(sign, 1);
    }
    return w.write_bits(TAG_LARGE, 2) &&
           w.write_bits(magnitude, 16) &&
           w.write_bits(sign, 1);
}

bool CoefficientCoder::write(BitWriter& w, const std::vector<int16_t>& values) {
    for (int16_t v : values) {
        if (!write_value(w, v)) return false;
    }
    return true;
}

bool CoefficientCoder::read(BitReader& r, size_t count, std::vector<int16_t>& values) {
    values.clear();
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        const uint32_t tag = r.read_bits(2);
        if (r.has_error()) return false;

        int32_t magnitude = 0;
        if (tag == TAG_SMALL) {
            magnitude = static_cast<int32_t>(r.read_bits(4));
        } else if (tag == TAG_LARGE) {
            magnitude = static_cast<int32_t>(r.read_bits(16));
        } else if (tag != TAG_ZERO) {
            return false;
        }

        if (tag != TAG_ZERO) {
            const uint32_t sign = r.read_bits(1);
            if (r.has_error() || magnitude > 32767) return false;
            values.push_back(static_cast<int16_t>(sign ? -magnitude : magnitude));
        } else {
            values.push_back(0);
        }
    }
    return true;
}

uint64_t CoefficientCoder::coded_bits(const std::vector<int16_t>& values) {
    uint64_t bits = 0;
    for (int16_t v : values) {
        if (v == 0) {
            bits += 2;
        } else if (std::abs(static_cast<int32_t>(v)) < SMALL_LIMIT) {
            bits += 7;
        } else {
            bits += 19;
        }
    }
    return bits;
}
