/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2024, kcenon
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#include <gtest/gtest.h>

#include "internal/protocols/quic/header.h"
#include "quicwire/protocols/quic/packet.h"

#include <array>

namespace quicwire::protocols::quic
{
namespace
{

auto make_cid(std::initializer_list<uint8_t> bytes) -> connection_id
{
    std::vector<uint8_t> data(bytes);
    return connection_id(data);
}

auto frames_of(const packet& p) -> std::vector<frame>
{
    return std::vector<frame>(p.frames().begin(), p.frames().end());
}

/*!
 * \brief Sink that records every datagram it is given
 */
class recording_sink : public transport::datagram_sink
{
public:
    auto send_datagram(std::span<const uint8_t> datagram,
                       const transport::endpoint_info& destination) -> VoidResult override
    {
        if (fail)
        {
            return error_void(error_codes::common_errors::network_error, "send failed");
        }
        datagrams.emplace_back(datagram.begin(), datagram.end());
        destinations.push_back(destination);
        return ok();
    }

    bool fail{false};
    std::vector<std::vector<uint8_t>> datagrams;
    std::vector<transport::endpoint_info> destinations;
};

/*!
 * \brief Protection that appends a 16-byte marker in place of an AEAD tag
 */
class tag_appending_protection : public packet_protection
{
public:
    auto protect(std::vector<uint8_t>& packet, size_t header_length) -> VoidResult override
    {
        last_header_length = header_length;
        packet.insert(packet.end(), 16, 0xEE);
        return ok();
    }

    auto unprotect(std::vector<uint8_t>& datagram) -> VoidResult override
    {
        if (datagram.size() < 16)
        {
            return error_void(error_codes::codec::buffer_too_small, "missing tag");
        }
        datagram.resize(datagram.size() - 16);
        return ok();
    }

    size_t last_header_length{0};
};

class PacketTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        one_rtt_.dest_conn_id = make_cid({1, 2, 3, 4, 5, 6, 7, 8});
        one_rtt_.packet_number = 42;

        initial_.type = packet_type::initial;
        initial_.dest_conn_id = make_cid({0xd1, 0xd2, 0xd3, 0xd4});
        initial_.src_conn_id = make_cid({0x51});
        initial_.packet_number = 0;
        initial_.packet_number_length = 1;

        handshake_ = initial_;
        handshake_.type = packet_type::handshake;
        handshake_.packet_number = 1;
    }

    static auto make_ack() -> ack_frame
    {
        ack_frame f;
        f.largest_acknowledged = 3;
        f.first_ack_range = 3;
        return f;
    }

    short_header one_rtt_;
    long_header initial_;
    long_header handshake_;
};

// ============================================================================
// Construction and Append Tests
// ============================================================================

TEST_F(PacketTest, CreateIsEmpty)
{
    auto p = packet::create(one_rtt_);

    EXPECT_EQ(p.frame_count(), 0);
    EXPECT_EQ(p.capacity(), 0);
    EXPECT_FALSE(p.is_released());
    EXPECT_EQ(std::get<short_header>(p.header()), one_rtt_);
}

TEST_F(PacketTest, InitialCapacityIsReserved)
{
    packet p(one_rtt_, 16);

    EXPECT_EQ(p.frame_count(), 0);
    EXPECT_GE(p.capacity(), 16);
}

TEST_F(PacketTest, StorageGrowsToFourThenDoubles)
{
    auto p = packet::create(one_rtt_);

    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    EXPECT_EQ(p.capacity(), 4);

    for (int i = 0; i < 3; ++i)
    {
        ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    }
    EXPECT_EQ(p.capacity(), 4);

    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    EXPECT_EQ(p.capacity(), 8);
}

TEST_F(PacketTest, AppendPreservesOrder)
{
    auto p = packet::create(one_rtt_);
    const std::vector<frame> appended = {
        ping_frame{}, padding_frame{2}, make_ack(), stream_frame{0, 0, {'a'}, true}, ping_frame{}};

    for (const auto& f : appended)
    {
        ASSERT_TRUE(p.append(f).is_ok());
    }

    EXPECT_EQ(p.frame_count(), 5);
    EXPECT_EQ(frames_of(p), appended);
}

TEST_F(PacketTest, CreateFromConfigAppliesPacketNumberLength)
{
    auto cfg = config::codec_config::production();
    cfg.packet_number_length = 2;

    auto created = packet::create(one_rtt_, cfg);

    ASSERT_TRUE(created.is_ok());
    EXPECT_EQ(std::get<short_header>(created.value().header()).packet_number_length, 2);
    EXPECT_GE(created.value().capacity(), cfg.initial_frame_capacity);

    auto bytes = created.value().to_bytes();
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value().size(), 1 + 8 + 2);
    EXPECT_EQ(bytes.value()[0] & 0x03, 0x01);
}

TEST_F(PacketTest, CreateFromConfigLeavesRetryUntouched)
{
    retry_header retry;
    retry.dest_conn_id = make_cid({1});

    auto created = packet::create(retry, config::codec_config::testing());

    ASSERT_TRUE(created.is_ok());
    EXPECT_EQ(std::get<retry_header>(created.value().header()), retry);
}

TEST_F(PacketTest, CreateFromInvalidConfigFails)
{
    config::codec_config cfg;
    cfg.packet_number_length = 0;

    auto created = packet::create(initial_, cfg);

    ASSERT_TRUE(created.is_err());
    EXPECT_EQ(created.error().code, error_codes::common_errors::invalid_argument);
}

// ============================================================================
// Size Tests
// ============================================================================

TEST_F(PacketTest, SizeIsHeaderPlusFrames)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    ASSERT_TRUE(p.append(padding_frame{10}).is_ok());

    const size_t header_size = header_builder::encoded_size(one_rtt_);

    EXPECT_EQ(header_size, 13);
    EXPECT_EQ(p.payload_size(), 11);
    EXPECT_EQ(p.size(), header_size + 11);
}

TEST_F(PacketTest, SizeTracksHeaderChanges)
{
    auto p = packet::create(initial_);
    ASSERT_TRUE(p.append(padding_frame{100}).is_ok());
    const size_t before = p.size();

    ASSERT_TRUE(p.update_length().is_ok());

    // Length 101 needs a two-byte varint
    EXPECT_EQ(std::get<long_header>(p.header()).length, 101);
    EXPECT_EQ(p.size(), before + 1);
}

// ============================================================================
// Serialize Tests
// ============================================================================

TEST_F(PacketTest, SerializeWritesHeaderThenFrames)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    ASSERT_TRUE(p.append(padding_frame{3}).is_ok());

    std::vector<uint8_t> buffer(p.size());
    auto written = p.serialize(buffer);

    ASSERT_TRUE(written.is_ok());
    EXPECT_EQ(written.value(), p.size());

    auto header_bytes = header_builder::build(one_rtt_);
    ASSERT_TRUE(header_bytes.is_ok());
    std::vector<uint8_t> expected = header_bytes.value();
    expected.insert(expected.end(), {0x01, 0x00, 0x00, 0x00});
    EXPECT_EQ(buffer, expected);
}

TEST_F(PacketTest, ShortBufferIsTooSmall)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(make_ack()).is_ok());

    std::vector<uint8_t> buffer(p.size() - 1);
    auto written = p.serialize(buffer);

    ASSERT_TRUE(written.is_err());
    EXPECT_EQ(written.error().code, error_codes::codec::buffer_too_small);
}

TEST_F(PacketTest, PlaceholderFrameFailsSerialize)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    ASSERT_TRUE(p.append(unsupported_frame{frame_type::crypto}).is_ok());

    auto bytes = p.to_bytes();

    ASSERT_TRUE(bytes.is_err());
    EXPECT_EQ(bytes.error().code, error_codes::codec::not_implemented);
}

TEST_F(PacketTest, UpdateLengthNeedsLongHeader)
{
    auto p = packet::create(one_rtt_);

    auto result = p.update_length();

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, error_codes::common_errors::invalid_argument);
}

TEST_F(PacketTest, UpdateLengthIncludesTrailer)
{
    auto p = packet::create(handshake_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());

    ASSERT_TRUE(p.update_length(16).is_ok());

    EXPECT_EQ(std::get<long_header>(p.header()).length, 1 + 1 + 16);
}

// ============================================================================
// Release Tests
// ============================================================================

TEST_F(PacketTest, ReleaseFreesStorageAndIsIdempotent)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());

    p.release();
    EXPECT_TRUE(p.is_released());
    EXPECT_EQ(p.frame_count(), 0);
    EXPECT_EQ(p.capacity(), 0);
    EXPECT_EQ(p.size(), header_builder::encoded_size(one_rtt_));

    p.release();
    EXPECT_TRUE(p.is_released());
}

TEST_F(PacketTest, ReleasedPacketRejectsUse)
{
    auto p = packet::create(one_rtt_);
    p.release();

    auto appended = p.append(ping_frame{});
    ASSERT_TRUE(appended.is_err());
    EXPECT_EQ(appended.error().code, error_codes::codec::packet_released);

    std::vector<uint8_t> buffer(64);
    auto written = p.serialize(buffer);
    ASSERT_TRUE(written.is_err());
    EXPECT_EQ(written.error().code, error_codes::codec::packet_released);
}

// ============================================================================
// Parse Tests
// ============================================================================

TEST_F(PacketTest, ShortHeaderPacketParsesBack)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(make_ack()).is_ok());
    ASSERT_TRUE(p.append(stream_frame{4, 0, {'x', 'y'}, false}).is_ok());
    ASSERT_TRUE(p.append(padding_frame{10}).is_ok());

    auto bytes = p.to_bytes();
    ASSERT_TRUE(bytes.is_ok());

    auto parsed = packet::parse(bytes.value(), 8);

    ASSERT_TRUE(parsed.is_ok());
    auto& [decoded, consumed] = parsed.value();
    EXPECT_EQ(consumed, bytes.value().size());
    EXPECT_EQ(std::get<short_header>(decoded.header()), one_rtt_);
    EXPECT_EQ(frames_of(decoded), frames_of(p));
}

TEST_F(PacketTest, LongHeaderLengthBoundsPacket)
{
    auto p = packet::create(initial_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    ASSERT_TRUE(p.update_length().is_ok());

    auto bytes = p.to_bytes();
    ASSERT_TRUE(bytes.is_ok());
    const size_t packet_size = bytes.value().size();
    bytes.value().push_back(0xFF); // start of something else

    auto parsed = packet::parse(bytes.value(), 8);

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().second, packet_size);
    EXPECT_EQ(parsed.value().first.frame_count(), 1);
}

TEST_F(PacketTest, LongHeaderLengthBeyondDataIsTooSmall)
{
    auto p = packet::create(initial_);
    ASSERT_TRUE(p.append(padding_frame{20}).is_ok());
    ASSERT_TRUE(p.update_length().is_ok());

    auto bytes = p.to_bytes();
    ASSERT_TRUE(bytes.is_ok());
    bytes.value().resize(bytes.value().size() - 5);

    auto parsed = packet::parse(bytes.value(), 8);

    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().code, error_codes::codec::buffer_too_small);
}

TEST_F(PacketTest, CoalescedDatagramSplitsInOrder)
{
    auto first = packet::create(initial_);
    ASSERT_TRUE(first.append(ping_frame{}).is_ok());
    ASSERT_TRUE(first.append(padding_frame{5}).is_ok());
    ASSERT_TRUE(first.update_length().is_ok());

    auto second = packet::create(handshake_);
    ASSERT_TRUE(second.append(make_ack()).is_ok());
    ASSERT_TRUE(second.update_length().is_ok());

    auto third = packet::create(one_rtt_);
    ASSERT_TRUE(third.append(stream_frame{0, 0, {'z'}, true}).is_ok());

    std::vector<uint8_t> datagram;
    for (const packet* p : {&first, &second, &third})
    {
        auto bytes = p->to_bytes();
        ASSERT_TRUE(bytes.is_ok());
        datagram.insert(datagram.end(), bytes.value().begin(), bytes.value().end());
    }

    auto parsed = packet::parse_datagram(datagram, 8);

    ASSERT_TRUE(parsed.is_ok());
    ASSERT_EQ(parsed.value().size(), 3);
    EXPECT_EQ(get_packet_type(parsed.value()[0].header()), packet_type::initial);
    EXPECT_EQ(get_packet_type(parsed.value()[1].header()), packet_type::handshake);
    EXPECT_EQ(get_packet_type(parsed.value()[2].header()), packet_type::one_rtt);
    EXPECT_EQ(frames_of(parsed.value()[0]), frames_of(first));
    EXPECT_EQ(frames_of(parsed.value()[1]), frames_of(second));
    EXPECT_EQ(frames_of(parsed.value()[2]), frames_of(third));
}

TEST_F(PacketTest, VersionNegotiationPacketHasNoFrames)
{
    version_negotiation_header vn;
    vn.dest_conn_id = make_cid({1});
    vn.supported_versions = {quic_version::version_1};
    auto p = packet::create(vn);

    auto bytes = p.to_bytes();
    ASSERT_TRUE(bytes.is_ok());

    auto parsed = packet::parse(bytes.value(), 8);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().first.frame_count(), 0);
    EXPECT_EQ(std::get<version_negotiation_header>(parsed.value().first.header()), vn);
}

TEST_F(PacketTest, MalformedPayloadFailsDatagram)
{
    auto p = packet::create(one_rtt_);
    auto bytes = p.to_bytes();
    ASSERT_TRUE(bytes.is_ok());
    bytes.value().push_back(0x1f);

    auto parsed = packet::parse_datagram(bytes.value(), 8);

    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().code, error_codes::codec::unknown_discriminator);
}

// ============================================================================
// Send Tests
// ============================================================================

TEST_F(PacketTest, SendHandsBytesToSink)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    recording_sink sink;
    const transport::endpoint_info peer("127.0.0.1", 4433);

    auto sent = p.send(sink, peer);

    ASSERT_TRUE(sent.is_ok());
    EXPECT_EQ(sent.value(), p.size());
    ASSERT_EQ(sink.datagrams.size(), 1);
    EXPECT_EQ(sink.datagrams[0], p.to_bytes().value());
    EXPECT_EQ(sink.destinations[0], peer);
}

TEST_F(PacketTest, SendAppliesProtection)
{
    auto p = packet::create(one_rtt_);
    ASSERT_TRUE(p.append(ping_frame{}).is_ok());
    recording_sink sink;
    tag_appending_protection protection;

    auto sent = p.send(sink, {"::1", 4433}, &protection);

    ASSERT_TRUE(sent.is_ok());
    EXPECT_EQ(sent.value(), p.size() + 16);
    EXPECT_EQ(protection.last_header_length, header_builder::encoded_size(one_rtt_));
}

TEST_F(PacketTest, SendReportsSinkFailure)
{
    auto p = packet::create(one_rtt_);
    recording_sink sink;
    sink.fail = true;

    auto sent = p.send(sink, {"127.0.0.1", 4433});

    ASSERT_TRUE(sent.is_err());
    EXPECT_EQ(sent.error().code, error_codes::common_errors::network_error);
}

TEST(NullProtectionTest, PassesBytesThrough)
{
    null_protection protection;
    std::vector<uint8_t> bytes = {1, 2, 3};

    EXPECT_TRUE(protection.protect(bytes, 2).is_ok());
    EXPECT_TRUE(protection.unprotect(bytes).is_ok());
    EXPECT_EQ(bytes, (std::vector<uint8_t>{1, 2, 3}));

    auto bad = protection.protect(bytes, 4);
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code, error_codes::common_errors::invalid_argument);
}

} // namespace
} // namespace quicwire::protocols::quic
