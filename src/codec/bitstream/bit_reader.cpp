#include "bit_reader.hpp"

BitReader::BitReader(const uint8_t* data, size_t size)
    : data(data), size_bits(size * 8), pos(0), error(false) {}

BitReader::BitReader(const std::vector<uint8_t>& buf)
    : data(buf.data()), size_bits(buf.size() * 8), pos(0), error(false) {}

uint32_t BitReader::read_bit() {
    return this->read_bits(1);
}

uint32_t BitReader::read_bits(int nbits) {
    if (this->error || nbits < 0 || nbits > 32) {
        this->error = true;
        return 0;
    }
    if (static_cast<size_t>(nbits) > this->bits_remaining()) {
        this->error = true;
        this->pos = this->size_bits;
        return 0;
    }

    uint64_t value = 0;
    int remaining = nbits;
    while (remaining > 0) {
        const size_t byte_index = this->pos >> 3;
        const int offset = static_cast<int>(this->pos & 7u);
        const int avail = 8 - offset;
        const int take = (remaining < avail) ? remaining : avail;
        const uint32_t byte = this->data[byte_index];
        const uint32_t bits = (byte >> (avail - take)) & ((1u << take) - 1u);
        value = (value << take) | bits;
        this->pos += static_cast<size_t>(take);
        remaining -= take;
    }
    return static_cast<uint32_t>(value);
}

size_t BitReader::bit_position() const {
    return this->pos;
}

size_t BitReader::bits_remaining() const {
    return (this->size_bits > this->pos) ? (this->size_bits - this->pos) : 0;
}

bool BitReader::has_error() const {
    return this->error;
}
