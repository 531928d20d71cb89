/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/


#include "quicwire/transport/datagram_decoder.h"
#include "../helpers/mock_logger.h"
#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace quic = quicwire::protocols::quic;
namespace transport = quicwire::transport;

/**
 * @file datagram_decoder_test.cpp
 * @brief Unit tests for datagram_decoder
 *
 * Tests validate:
 * - Coalesced packets reach the handler in wire order
 * - Oversized, malformed and unprotectable datagrams are dropped whole
 * - Received/decoded/dropped counters
 * - Drops are logged at debug level
 */

namespace
{

/**
 * @brief Protection that rejects datagrams not ending in a marker byte
 */
class marker_protection : public quic::packet_protection
{
public:
	auto protect(std::vector<uint8_t>& packet, size_t /*header_length*/)
		-> quicwire::VoidResult override
	{
		packet.push_back(marker);
		return quicwire::ok();
	}

	auto unprotect(std::vector<uint8_t>& datagram) -> quicwire::VoidResult override
	{
		if (datagram.empty() || datagram.back() != marker)
		{
			return quicwire::error_void(quicwire::error_codes::codec::malformed_field,
			                            "authentication failed");
		}
		datagram.pop_back();
		return quicwire::ok();
	}

	static constexpr uint8_t marker = 0xA5;
};

auto make_cid(size_t length, uint8_t fill) -> quic::connection_id
{
	std::vector<uint8_t> bytes(length, fill);
	return quic::connection_id(bytes);
}

} // namespace

class DatagramDecoderTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		config_ = quicwire::config::codec_config::testing();
		peer_ = transport::endpoint_info("192.0.2.1", 4433);
	}

	auto make_decoder(std::shared_ptr<quic::packet_protection> protection = nullptr)
		-> std::unique_ptr<transport::datagram_decoder>
	{
		return std::make_unique<transport::datagram_decoder>(
			config_, std::move(protection),
			[this](quic::packet&& pkt, const transport::endpoint_info& source)
			{
				sources_.push_back(source);
				received_.push_back(std::move(pkt));
			});
	}

	auto make_coalesced_datagram() -> std::vector<uint8_t>
	{
		quic::long_header initial;
		initial.dest_conn_id = make_cid(8, 0x11);
		initial.src_conn_id = make_cid(4, 0x22);
		initial.packet_number_length = 2;

		auto first = quic::packet::create(initial);
		EXPECT_TRUE(first.append(quic::ping_frame{}).is_ok());
		EXPECT_TRUE(first.update_length().is_ok());

		quic::short_header one_rtt;
		one_rtt.dest_conn_id = make_cid(config_.short_header_dcid_length, 0x33);
		one_rtt.packet_number = 7;

		auto second = quic::packet::create(one_rtt);
		EXPECT_TRUE(second.append(quic::stream_frame{0, 0, {'o', 'k'}, true}).is_ok());

		std::vector<uint8_t> datagram = first.to_bytes().value();
		auto tail = second.to_bytes().value();
		datagram.insert(datagram.end(), tail.begin(), tail.end());
		return datagram;
	}

	quicwire::config::codec_config config_;
	transport::endpoint_info peer_;
	std::vector<quic::packet> received_;
	std::vector<transport::endpoint_info> sources_;
};

// ============================================================================
// Dispatch Tests
// ============================================================================

TEST_F(DatagramDecoderTest, DispatchesPacketsInWireOrder)
{
	auto decoder = make_decoder();
	auto datagram = make_coalesced_datagram();

	auto result = decoder->on_datagram(datagram, peer_);

	ASSERT_TRUE(result.is_ok());
	ASSERT_EQ(received_.size(), 2);
	EXPECT_EQ(quic::get_packet_type(received_[0].header()), quic::packet_type::initial);
	EXPECT_EQ(quic::get_packet_type(received_[1].header()), quic::packet_type::one_rtt);
	EXPECT_TRUE(std::holds_alternative<quic::stream_frame>(received_[1].frames()[0]));
	EXPECT_EQ(sources_[0], peer_);
	EXPECT_EQ(sources_[1], peer_);

	EXPECT_EQ(decoder->datagrams_received(), 1);
	EXPECT_EQ(decoder->packets_decoded(), 2);
	EXPECT_EQ(decoder->datagrams_dropped(), 0);
}

TEST_F(DatagramDecoderTest, WorksWithoutHandler)
{
	transport::datagram_decoder decoder(config_, nullptr, nullptr);
	auto datagram = make_coalesced_datagram();

	EXPECT_TRUE(decoder.on_datagram(datagram, peer_).is_ok());
	EXPECT_EQ(decoder.packets_decoded(), 2);
}

TEST_F(DatagramDecoderTest, RemovesProtectionBeforeParsing)
{
	auto decoder = make_decoder(std::make_shared<marker_protection>());
	auto datagram = make_coalesced_datagram();
	datagram.push_back(marker_protection::marker);

	ASSERT_TRUE(decoder->on_datagram(datagram, peer_).is_ok());
	EXPECT_EQ(received_.size(), 2);
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST_F(DatagramDecoderTest, CreateRejectsInvalidConfig)
{
	auto zero_size = config_;
	zero_size.max_datagram_size = 0;
	auto long_dcid = config_;
	long_dcid.short_header_dcid_length = 30;

	auto first = transport::datagram_decoder::create(zero_size, nullptr, nullptr);
	auto second = transport::datagram_decoder::create(long_dcid, nullptr, nullptr);

	ASSERT_TRUE(first.is_err());
	EXPECT_EQ(first.error().code, quicwire::error_codes::common_errors::invalid_argument);
	ASSERT_TRUE(second.is_err());
	EXPECT_EQ(second.error().code, quicwire::error_codes::common_errors::invalid_argument);
}

TEST_F(DatagramDecoderTest, CreateWithValidConfigDecodes)
{
	size_t packets = 0;
	auto created = transport::datagram_decoder::create(
		config_, nullptr,
		[&packets](quic::packet&&, const transport::endpoint_info&) { ++packets; });
	ASSERT_TRUE(created.is_ok());
	auto datagram = make_coalesced_datagram();

	EXPECT_TRUE(created.value()->on_datagram(datagram, peer_).is_ok());
	EXPECT_EQ(packets, 2);
}

// ============================================================================
// Drop Tests
// ============================================================================

TEST_F(DatagramDecoderTest, DropsOversizedDatagram)
{
	auto decoder = make_decoder();
	std::vector<uint8_t> datagram(config_.max_datagram_size + 1, 0x00);

	auto result = decoder->on_datagram(datagram, peer_);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, quicwire::error_codes::codec::value_out_of_range);
	EXPECT_TRUE(received_.empty());
	EXPECT_EQ(decoder->datagrams_dropped(), 1);
}

TEST_F(DatagramDecoderTest, DropsWholeDatagramOnMalformedPacket)
{
	auto decoder = make_decoder();
	auto datagram = make_coalesced_datagram();
	datagram.push_back(0x1f); // unknown frame type in the 1-RTT payload

	auto result = decoder->on_datagram(datagram, peer_);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, quicwire::error_codes::codec::unknown_discriminator);
	EXPECT_TRUE(received_.empty());
	EXPECT_EQ(decoder->packets_decoded(), 0);
	EXPECT_EQ(decoder->datagrams_dropped(), 1);
}

TEST_F(DatagramDecoderTest, DropsDatagramFailingUnprotect)
{
	auto decoder = make_decoder(std::make_shared<marker_protection>());
	auto datagram = make_coalesced_datagram();

	auto result = decoder->on_datagram(datagram, peer_);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, quicwire::error_codes::codec::malformed_field);
	EXPECT_TRUE(received_.empty());
}

TEST_F(DatagramDecoderTest, DropsEmptyDatagram)
{
	auto decoder = make_decoder();

	auto result = decoder->on_datagram({}, peer_);

	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.error().code, quicwire::error_codes::codec::buffer_too_small);
}

TEST_F(DatagramDecoderTest, CountersAccumulate)
{
	auto decoder = make_decoder();
	auto good = make_coalesced_datagram();
	std::vector<uint8_t> bad = {0x40};

	EXPECT_TRUE(decoder->on_datagram(good, peer_).is_ok());
	EXPECT_TRUE(decoder->on_datagram(bad, peer_).is_err());
	EXPECT_TRUE(decoder->on_datagram(good, peer_).is_ok());

	EXPECT_EQ(decoder->datagrams_received(), 3);
	EXPECT_EQ(decoder->packets_decoded(), 4);
	EXPECT_EQ(decoder->datagrams_dropped(), 1);
}

TEST_F(DatagramDecoderTest, KeepsConfiguration)
{
	auto decoder = make_decoder();

	EXPECT_EQ(decoder->get_config().max_datagram_size, config_.max_datagram_size);
}

#ifndef QUICWIRE_WITH_COMMON_SYSTEM

TEST_F(DatagramDecoderTest, DropIsLoggedAtDebug)
{
	quicwire::testing::scoped_mock_logger logger;
	auto decoder = make_decoder();
	std::vector<uint8_t> bad = {0x40};

	EXPECT_TRUE(decoder->on_datagram(bad, peer_).is_err());

	EXPECT_EQ(logger->count(quicwire::integration::log_level::debug), 1);
	EXPECT_TRUE(logger->contains("192.0.2.1:4433"));
}

#endif // QUICWIRE_WITH_COMMON_SYSTEM

// ============================================================================
// endpoint_info Tests
// ============================================================================

TEST(EndpointInfoTest, FormatsAddresses)
{
	EXPECT_EQ(transport::endpoint_info("10.0.0.1", 443).to_string(), "10.0.0.1:443");
	EXPECT_EQ(transport::endpoint_info("::1", 443).to_string(), "[::1]:443");
}

TEST(EndpointInfoTest, Validity)
{
	EXPECT_FALSE(transport::endpoint_info().is_valid());
	EXPECT_FALSE(transport::endpoint_info("10.0.0.1", 0).is_valid());
	EXPECT_TRUE(transport::endpoint_info("10.0.0.1", 1).is_valid());
}
