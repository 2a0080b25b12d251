#include <doctest/doctest.h>
#include "bitflash/transmitter.hpp"
#include "scripted_stream.hpp"

#include <sstream>
#include <string>

using namespace bitflash;
using bitflash::test::ScriptedStream;

namespace {

std::vector<uint8_t> make_file(std::size_t n) {
    std::vector<uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 7 + 3) & 0xFF);
    return v;
}

// Device that says 'C', acks every frame, then acks EOT.
void script_happy_device(ScriptedStream& s, std::size_t frames) {
    s.reply(ControlChar::ModeC);
    s.reply(ControlChar::Ack, frames);
    s.reply(ControlChar::Ack);
}

// Decode writes()[first..last) as packet frames.
std::vector<DecodedPacket> frames_of(const ScriptedStream& s, std::size_t first, std::size_t last) {
    std::vector<DecodedPacket> out;
    for (std::size_t i = first; i < last; ++i) {
        auto d = decode_packet(s.writes()[i]);
        REQUIRE(d.has_value());
        out.push_back(*d);
    }
    return out;
}

} // namespace

TEST_CASE("packets_required is ceil(len / 256)") {
    CHECK(Transmitter::packets_required(0) == 0);
    CHECK(Transmitter::packets_required(1) == 1);
    CHECK(Transmitter::packets_required(255) == 1);
    CHECK(Transmitter::packets_required(256) == 1);
    CHECK(Transmitter::packets_required(257) == 2);
    CHECK(Transmitter::packets_required(600) == 3);
    CHECK(Transmitter::packets_required(1024) == 4);
}

TEST_CASE("Metadata payload is BE32 address followed by BE32 count") {
    auto m = Transmitter::metadata_payload(0xA1B2C3D4, 0x00010203);
    CHECK(m == std::vector<uint8_t>{0xA1, 0xB2, 0xC3, 0xD4, 0x00, 0x01, 0x02, 0x03});
}

TEST_CASE("600-byte file to address 0x03 goes out as metadata + 256 + 256 + 88") {
    ScriptedStream s;
    script_happy_device(s, 4);
    TransferProtocol proto(s);
    Transmitter tx(proto);

    auto file = make_file(600);
    UploadReport rep = tx.upload(file, 0x03);

    CHECK(rep.ok());
    CHECK(rep.mode == Mode::Crc);
    CHECK(rep.packet_count == 3);
    CHECK(rep.packets_sent == 4);
    CHECK(rep.bytes_sent == 600);
    CHECK(rep.naks == 0);

    // '1', 4 frames, EOT
    REQUIRE(s.writes().size() == 6);
    CHECK(s.writes().front() == std::vector<uint8_t>{'1'});
    CHECK(s.writes().back() == std::vector<uint8_t>{0x04});

    auto frames = frames_of(s, 1, 5);
    CHECK(frames[0].block_id == 0);
    CHECK(frames[0].payload == std::vector<uint8_t>{0, 0, 0, 3, 0, 0, 0, 3});

    CHECK(frames[1].block_id == 1);
    CHECK(frames[1].payload == std::vector<uint8_t>(file.begin(), file.begin() + 256));
    CHECK(frames[2].block_id == 2);
    CHECK(frames[2].payload == std::vector<uint8_t>(file.begin() + 256, file.begin() + 512));
    CHECK(frames[3].block_id == 3);
    CHECK(frames[3].payload.size() == 88);
    CHECK(frames[3].payload == std::vector<uint8_t>(file.begin() + 512, file.end()));

    for (const auto& f : frames) CHECK(f.checksum_ok);
    CHECK(s.unread() == 0);
}

TEST_CASE("Chunking reassembles to the original file for awkward lengths") {
    const std::size_t lengths[] = {1, 255, 256, 257, 511, 512, 513, 4096 + 17};
    for (std::size_t len : lengths) {
        CAPTURE(len);
        ScriptedStream s;
        const std::size_t n = Transmitter::packets_required(len);
        script_happy_device(s, n + 1);
        TransferProtocol proto(s);
        Transmitter tx(proto);

        auto file = make_file(len);
        REQUIRE(tx.upload(file, 0).ok());

        auto frames = frames_of(s, 2, 2 + n);
        std::vector<uint8_t> joined;
        for (std::size_t i = 0; i < frames.size(); ++i) {
            CHECK(frames[i].block_id == i + 1);
            CHECK(frames[i].payload.size() <= Packet::MAX_SIZE);
            joined.insert(joined.end(), frames[i].payload.begin(), frames[i].payload.end());
        }
        CHECK(joined == file);
    }
}

TEST_CASE("Empty file sends metadata with count 0, then EOT") {
    ScriptedStream s;
    script_happy_device(s, 1);
    TransferProtocol proto(s);
    Transmitter tx(proto);

    UploadReport rep = tx.upload({}, 0x10);
    CHECK(rep.ok());
    CHECK(rep.packet_count == 0);
    CHECK(rep.packets_sent == 1);
    CHECK(rep.bytes_sent == 0);

    REQUIRE(s.writes().size() == 3);
    auto meta = decode_packet(s.writes()[1]);
    REQUIRE(meta.has_value());
    CHECK(meta->block_id == 0);
    CHECK(meta->payload == std::vector<uint8_t>{0, 0, 0, 0x10, 0, 0, 0, 0});
    CHECK(s.writes()[2] == std::vector<uint8_t>{0x04});
}

TEST_CASE("A NAK does not stop the default transmitter") {
    ScriptedStream s;
    s.reply(ControlChar::Nak);   // checksum-mode handshake
    s.reply(ControlChar::Ack);   // metadata
    s.reply(ControlChar::Nak);   // body 1 rejected
    s.reply(ControlChar::Ack);   // body 2
    s.reply(ControlChar::Ack);   // EOT
    TransferProtocol proto(s);
    std::ostringstream logbuf;
    Log log(logbuf, LogLevel::Info);
    Transmitter tx(proto, {}, log);

    UploadReport rep = tx.upload(make_file(300), 7);
    CHECK(rep.ok());
    CHECK(rep.mode == Mode::Checksum);
    CHECK(rep.naks == 1);
    CHECK(rep.packets_sent == 3);
    CHECK(rep.bytes_sent == 300);
    CHECK(s.writes().back() == std::vector<uint8_t>{0x04});
    CHECK(logbuf.str().find("warning=nak_ignored packet=1") != std::string::npos);
}

TEST_CASE("Progress log prints the target address in lowercase hex") {
    ScriptedStream s;
    script_happy_device(s, 2);
    TransferProtocol proto(s);
    std::ostringstream logbuf;
    Log log(logbuf, LogLevel::Info);
    Transmitter tx(proto, {}, log);

    REQUIRE(tx.upload(make_file(10), 0xA1B2).ok());
    CHECK(logbuf.str().find("writing 1 packets to address 0xa1b2\n") != std::string::npos);
}

TEST_CASE("Strict mode aborts on the first NAK without sending EOT") {
    ScriptedStream s;
    s.reply(ControlChar::ModeC);
    s.reply(ControlChar::Ack);   // metadata
    s.reply(ControlChar::Nak);   // body 1 rejected
    TransferProtocol proto(s);
    TransmitterOptions opts;
    opts.strict = true;
    Transmitter tx(proto, opts);

    UploadReport rep = tx.upload(make_file(600), 3);
    CHECK(rep.status == LinkStatus::Nak);
    CHECK(rep.naks == 1);
    CHECK(rep.packets_sent == 2);
    CHECK(rep.bytes_sent == 0);

    // '1', metadata, body 1 — nothing after
    REQUIRE(s.writes().size() == 3);
    CHECK(s.writes().back() != std::vector<uint8_t>{0x04});
}

TEST_CASE("Timeouts and transport errors abort the upload") {
    SUBCASE("no handshake reply") {
        ScriptedStream s;
        s.set_read_timeout(10);
        TransferProtocol proto(s);
        Transmitter tx(proto);
        UploadReport rep = tx.upload(make_file(10), 0);
        CHECK(rep.status == LinkStatus::Timeout);
        CHECK(rep.packets_sent == 0);
        CHECK(s.writes().size() == 1);
    }
    SUBCASE("device goes silent mid-transfer") {
        ScriptedStream s;
        s.reply(ControlChar::ModeC);
        s.reply(ControlChar::Ack, 2);  // metadata + body 1, then nothing
        TransferProtocol proto(s);
        Transmitter tx(proto);
        UploadReport rep = tx.upload(make_file(700), 0);
        CHECK(rep.status == LinkStatus::Timeout);
        CHECK(rep.packets_sent == 3);
        CHECK(rep.bytes_sent == 256);
    }
    SUBCASE("write fails on the second body packet") {
        ScriptedStream s;
        script_happy_device(s, 4);
        s.fail_write_at = 3;           // '1', meta, body 1, [body 2]
        TransferProtocol proto(s);
        Transmitter tx(proto);
        UploadReport rep = tx.upload(make_file(600), 0);
        CHECK(rep.status == LinkStatus::Error);
        CHECK(rep.bytes_sent == 256);
        CHECK(s.writes().size() == 3);
    }
}

TEST_CASE("Progress lines are logged per packet") {
    ScriptedStream s;
    script_happy_device(s, 3);
    TransferProtocol proto(s);
    std::ostringstream logbuf;
    Log log(logbuf, LogLevel::Info);
    Transmitter tx(proto, {}, log);

    REQUIRE(tx.upload(make_file(400), 0x20).ok());
    const std::string out = logbuf.str();
    CHECK(out.find("writing 2 packets to address 0x20") != std::string::npos);
    CHECK(out.find("sending packet 1 of 2") != std::string::npos);
    CHECK(out.find("sending packet 2 of 2") != std::string::npos);
}
