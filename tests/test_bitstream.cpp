// bit_writer.hpp first: it must compile without any other header before it
#include "codec/bitstream/bit_writer.hpp"
#include "codec/bitstream/bit_reader.hpp"
#include "codec/frame/coefficient_coder.hpp"
#include "codec/frame/frame_header.hpp"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

namespace {

void check_msb_first_packing() {
    BitWriter w;
    assert(w.write_bits(0xABC, 12));
    assert(w.write_bits(0x1F, 5));
    assert(w.write_bits(0x0, 3));
    assert(w.bits_written() == 20);
    std::vector<uint8_t> bytes = w.finish();
    assert(bytes.size() == 3);
    assert(bytes[0] == 0xAB);
    assert(bytes[1] == 0xCF);
    assert(bytes[2] == 0x80);
}

void check_wide_writes() {
    BitWriter w;
    assert(w.write_bit(1));
    assert(w.write_bits(0xDEADBEEFu, 32));
    assert(w.write_bits(0, 0));
    std::vector<uint8_t> bytes = w.finish();
    assert(bytes.size() == 5);

    BitReader r(bytes);
    assert(r.read_bit() == 1);
    assert(r.read_bits(32) == 0xDEADBEEFu);
    assert(r.read_bits(7) == 0);
    assert(!r.has_error());
    assert(r.bits_remaining() == 0);
    r.read_bit();
    assert(r.has_error());
}

void check_writer_errors() {
    BitWriter w;
    assert(!w.write_bits(1, 33));
    assert(w.has_error());

    BitWriter once;
    assert(once.write_bits(0x3, 2));
    std::vector<uint8_t> bytes = once.finish();
    assert(bytes.size() == 1 && bytes[0] == 0xC0);
    assert(once.is_finished());
    assert(!once.write_bits(1, 1));
    assert(once.has_error());
    assert(once.finish().empty());
}

void check_empty_finish() {
    BitWriter w;
    assert(w.finish().empty());
    assert(!w.has_error());
}

void check_header_fields() {
    FrameHeader hdr;
    LDE::Error err;
    assert(hdr.configure(44100, 2, &err));
    BitWriter w;
    assert(hdr.write(w));
    assert(w.bits_written() == FrameHeader::HEADER_BITS);
    std::vector<uint8_t> bytes = w.finish();
    assert(bytes.size() == 4);
    assert(bytes[0] == 0xFF);
    assert((bytes[1] & 0xF0) == 0xF0);

    FrameHeader parsed;
    assert(FrameHeader::parse(bytes.data(), bytes.size(), parsed));
    assert(parsed.sync == 0xFFF);
    assert(parsed.id == 0 && parsed.layer == 0 && parsed.protection_absent == 1);
    assert(parsed.profile == 23);
    assert(parsed.sample_rate_idx == 4);
    assert(parsed.sample_rate() == 44100);
    assert(parsed.channel_config == 2);

    assert(!FrameHeader::parse(bytes.data(), 2, parsed));
}

void check_rate_index_table() {
    const uint32_t rates[] = {96000, 88200, 64000, 48000, 44100, 32000,
                              24000, 22050, 16000, 12000, 11025, 8000};
    for (uint8_t i = 0; i < 12; ++i) {
        uint8_t idx = 0xFF;
        assert(FrameHeader::sample_rate_index(rates[i], idx));
        assert(idx == i);
    }

    uint8_t idx = 0;
    assert(!FrameHeader::sample_rate_index(40000, idx));
    assert(!FrameHeader::sample_rate_index(192000, idx));

    FrameHeader hdr;
    LDE::Error err;
    assert(!hdr.configure(40000, 1, &err));
    assert(err.code == LDE::ErrorCode::BitstreamError);
}

void check_channel_config() {
    for (uint8_t ch = 1; ch <= 6; ++ch) {
        assert(FrameHeader::channel_config_for(ch) == ch);
    }
    assert(FrameHeader::channel_config_for(7) == 0);
    assert(FrameHeader::channel_config_for(8) == 7);
}

void check_coefficient_code() {
    const std::vector<int16_t> values = {0, 1, -1, 15, -15, 16, -16, 32767, -32767, 0, 300};
    BitWriter w;
    assert(CoefficientCoder::write(w, values));
    const uint64_t expected_bits = 2 + 7 * 4 + 19 * 4 + 2 + 19;
    assert(CoefficientCoder::coded_bits(values) == expected_bits);
    assert(w.bits_written() == expected_bits);
    std::vector<uint8_t> bytes = w.finish();

    BitReader r(bytes);
    std::vector<int16_t> decoded;
    assert(CoefficientCoder::read(r, values.size(), decoded));
    assert(decoded == values);

    // first symbol is a bare zero tag, second a small value
    BitReader peek(bytes);
    assert(peek.read_bits(2) == CoefficientCoder::TAG_ZERO);
    assert(peek.read_bits(2) == CoefficientCoder::TAG_SMALL);
    assert(peek.read_bits(4) == 1);
    assert(peek.read_bits(1) == 0);

    BitReader short_reader(bytes.data(), 1);
    assert(!CoefficientCoder::read(short_reader, values.size(), decoded));
}

} // namespace

void run_bitstream_tests() {
    check_msb_first_packing();
    check_wide_writes();
    check_writer_errors();
    check_empty_finish();
    check_header_fields();
    check_rate_index_table();
    check_channel_config();
    check_coefficient_code();
    std::cout << "bitstream tests ok\n";
}
