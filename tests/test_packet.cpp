#include <doctest/doctest.h>
#include "bitflash/packet.hpp"
#include "bitflash/control_chars.hpp"

#include <numeric>
#include <string>

using namespace bitflash;

static std::vector<uint8_t> counting_bytes(std::size_t n, uint8_t start = 0) {
    std::vector<uint8_t> v(n);
    std::iota(v.begin(), v.end(), start);
    return v;
}

TEST_CASE("Packet serializes to SOH | id | len | payload | checksum") {
    Packet p(2, std::vector<uint8_t>{0x10, 0x20});
    auto wire = p.serialize();

    std::vector<uint8_t> expected{0x01, 0x00, 0x02, 0x00, 0x02, 0x10, 0x20, 0x30};
    CHECK(wire == expected);
}

TEST_CASE("Multi-byte fields are big-endian") {
    Packet p(0xBEEF, counting_bytes(0x0102)); // oversized on purpose; not validated
    auto wire = p.serialize();
    CHECK(wire[1] == 0xBE);
    CHECK(wire[2] == 0xEF);
    CHECK(wire[3] == 0x01);
    CHECK(wire[4] == 0x02);
}

TEST_CASE("Empty payload still yields a full frame") {
    Packet p(0, std::vector<uint8_t>{});
    auto wire = p.serialize();
    REQUIRE(wire.size() == Packet::OVERHEAD);
    CHECK(wire[0] == byte_of(ControlChar::StartOfHeader));
    CHECK(wire[3] == 0x00);
    CHECK(wire[4] == 0x00);
    CHECK(wire[5] == 0x00); // checksum of nothing
}

TEST_CASE("Checksum is the payload sum modulo 256") {
    std::vector<uint8_t> payload(Packet::MAX_SIZE, 0xFF);
    CHECK(checksum(payload) == 0x00); // 0xFF * 256 = 0xFF00

    auto ramp = counting_bytes(256);
    // 0+1+...+255 = 32640 = 0x7F80
    CHECK(checksum(ramp) == 0x80);

    Packet p(1, ramp);
    CHECK(p.serialize().back() == 0x80);
}

TEST_CASE("set_block_id changes the encoded id") {
    Packet p(1, std::vector<uint8_t>{0xAA});
    p.set_block_id(0x1234);
    auto d = decode_packet(p.serialize());
    REQUIRE(d.has_value());
    CHECK(d->block_id == 0x1234);
}

TEST_CASE("decode_packet inverts serialize across sizes and ids") {
    const std::size_t sizes[] = {0, 1, 88, 255, 256};
    const uint16_t ids[] = {0, 1, 255, 256, 0xFFFF};

    for (std::size_t n : sizes) {
        for (uint16_t id : ids) {
            auto payload = counting_bytes(n, static_cast<uint8_t>(id));
            std::size_t used = 0;
            auto d = decode_packet(Packet(id, payload).serialize(), &used);
            REQUIRE(d.has_value());
            CHECK(d->block_id == id);
            CHECK(d->payload == payload);
            CHECK(d->checksum_ok);
            CHECK(d->checksum == checksum(payload));
            CHECK(used == n + Packet::OVERHEAD);
        }
    }
}

TEST_CASE("decode_packet rejects malformed frames") {
    auto wire = Packet(7, counting_bytes(10)).serialize();

    SUBCASE("wrong start byte") {
        wire[0] = 0x02;
        CHECK_FALSE(decode_packet(wire).has_value());
    }
    SUBCASE("truncated checksum") {
        wire.pop_back();
        CHECK_FALSE(decode_packet(wire).has_value());
    }
    SUBCASE("length claims more than is there") {
        wire[4] = 0x20;
        CHECK_FALSE(decode_packet(wire).has_value());
    }
    SUBCASE("header only") {
        wire.resize(3);
        CHECK_FALSE(decode_packet(wire).has_value());
    }
}

TEST_CASE("decode_packet flags a corrupted checksum but still decodes") {
    auto wire = Packet(3, counting_bytes(4)).serialize();
    wire.back() ^= 0x01;
    auto d = decode_packet(wire);
    REQUIRE(d.has_value());
    CHECK_FALSE(d->checksum_ok);
}

TEST_CASE("encode_be truncates to the requested width") {
    CHECK(encode_be(0x00000003u, 4) == std::vector<uint8_t>{0x00, 0x00, 0x00, 0x03});
    CHECK(encode_be(0x12345678u, 2) == std::vector<uint8_t>{0x56, 0x78});
    CHECK(encode_be(0x1FFu, 1) == std::vector<uint8_t>{0xFF});
}

TEST_CASE("Control characters have their wire values") {
    CHECK(byte_of(ControlChar::Ack) == 0x06);
    CHECK(byte_of(ControlChar::Nak) == 0x15);
    CHECK(byte_of(ControlChar::StartOfHeader) == 0x01);
    CHECK(byte_of(ControlChar::EndOfTransmission) == 0x04);
    CHECK(byte_of(ControlChar::Cancel) == 0x18);
    CHECK(byte_of(ControlChar::ModeC) == 'C');
    CHECK(byte_of(ControlChar::StartTransmission) == '1');

    CHECK(to_bytes({ControlChar::EndOfTransmission, ControlChar::Ack}) == std::vector<uint8_t>{0x04, 0x06});
    CHECK(std::string(control_name(0x15)) == "NAK");
    CHECK(std::string(control_name(0x99)) == "?");
}
