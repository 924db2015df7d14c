#include "bit_writer.hpp"

BitWriter::BitWriter() : current_byte(0), bit_pos(0), finished(false), error(false) {}

bool BitWriter::write_bit(uint32_t bit) {
    return this->write_bits(bit ? 1u : 0u, 1);
}

bool BitWriter::write_bits(uint32_t value, int nbits) {
    if (this->finished || nbits < 0 || nbits > MAX_BITS_PER_WRITE) {
        this->error = true;
        return false;
    }

    int remaining = nbits;
    while (remaining > 0) {
        const int room = 8 - this->bit_pos;
        const int take = (remaining < room) ? remaining : room;
        const uint32_t mask = (1u << take) - 1u;
        const uint32_t bits = (value >> (remaining - take)) & mask;

        this->current_byte |= static_cast<uint8_t>(bits << (room - take));
        this->bit_pos += take;
        remaining -= take;

        if (this->bit_pos == 8) {
            this->buffer.push_back(this->current_byte);
            this->current_byte = 0;
            this->bit_pos = 0;
        }
    }
    return true;
}

void BitWriter::flush_to_byte() {
    if (this->bit_pos == 0) return;

    this->buffer.push_back(this->current_byte);
    this->current_byte = 0;
    this->bit_pos = 0;
}

std::vector<uint8_t> BitWriter::finish() {
    if (this->finished) {
        this->error = true;
        return {};
    }
    this->flush_to_byte();
    this->finished = true;
    return std::move(this->buffer);
}

size_t BitWriter::bits_written() const {
    return this->buffer.size() * 8 + static_cast<size_t>(this->bit_pos);
}

bool BitWriter::has_error() const {
    return this->error;
}

bool BitWriter::is_finished() const {
    return this->finished;
}
