/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, 🍀☀🌕🌥 🌊
All rights reserved.
*****************************************************************************/


#include "quicwire/transport/udp_transport.h"
#include "quicwire/transport/datagram_decoder.h"
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

namespace quic = quicwire::protocols::quic;
namespace transport = quicwire::transport;

/**
 * @file udp_transport_test.cpp
 * @brief Loopback tests for udp_transport
 */

class UdpTransportTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
			asio::make_work_guard(io_context_));
		io_thread_ = std::thread([this]() { io_context_.run(); });
	}

	void TearDown() override
	{
		work_guard_.reset();
		io_context_.stop();
		if (io_thread_.joinable())
		{
			io_thread_.join();
		}
	}

	asio::io_context io_context_;
	std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
	std::thread io_thread_;
};

TEST_F(UdpTransportTest, BindsEphemeralPort)
{
	auto opened = transport::udp_transport::open(io_context_, {"127.0.0.1", 0});

	ASSERT_TRUE(opened.is_ok());
	auto local = opened.value()->local_endpoint();
	EXPECT_EQ(local.address, "127.0.0.1");
	EXPECT_NE(local.port, 0);

	opened.value()->close();
}

TEST_F(UdpTransportTest, RejectsInvalidAddress)
{
	auto opened = transport::udp_transport::open(io_context_, {"not-an-address", 0});

	ASSERT_TRUE(opened.is_err());
	EXPECT_EQ(opened.error().code, quicwire::error_codes::common_errors::invalid_argument);
}

TEST_F(UdpTransportTest, DeliversPacketThroughDecoder)
{
	auto receiver = transport::udp_transport::open(io_context_, {"127.0.0.1", 0});
	auto sender = transport::udp_transport::open(io_context_, {"127.0.0.1", 0});
	ASSERT_TRUE(receiver.is_ok());
	ASSERT_TRUE(sender.is_ok());

	std::promise<quic::packet> delivered;
	auto config = quicwire::config::codec_config::testing();
	transport::datagram_decoder decoder(
		config, nullptr,
		[&delivered](quic::packet&& pkt, const transport::endpoint_info&)
		{ delivered.set_value(std::move(pkt)); });

	receiver.value()->set_receive_callback(
		[&decoder](std::span<const uint8_t> data, const transport::endpoint_info& from)
		{
			auto decoded = decoder.on_datagram(data, from);
			EXPECT_TRUE(decoded.is_ok());
		});
	receiver.value()->start_receive();

	quic::short_header header;
	std::vector<uint8_t> dcid(config.short_header_dcid_length, 0x42);
	header.dest_conn_id = quic::connection_id(dcid);
	header.packet_number = 1;
	auto pkt = quic::packet::create(header);
	ASSERT_TRUE(pkt.append(quic::stream_frame{0, 0, {'h', 'i'}, true}).is_ok());

	auto sent = pkt.send(*sender.value(), receiver.value()->local_endpoint());
	ASSERT_TRUE(sent.is_ok());
	EXPECT_EQ(sent.value(), pkt.size());

	auto future = delivered.get_future();
	ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
	auto received = future.get();
	ASSERT_EQ(received.frame_count(), 1);
	EXPECT_EQ(std::get<quic::stream_frame>(received.frames()[0]),
	          (quic::stream_frame{0, 0, {'h', 'i'}, true}));
	EXPECT_EQ(decoder.datagrams_received(), 1);

	receiver.value()->close();
	sender.value()->close();
}

TEST_F(UdpTransportTest, SendFailsAfterClose)
{
	auto opened = transport::udp_transport::open(io_context_, {"127.0.0.1", 0});
	ASSERT_TRUE(opened.is_ok());
	auto destination = opened.value()->local_endpoint();
	opened.value()->close();

	std::vector<uint8_t> datagram = {0x40};
	auto result = opened.value()->send_datagram(datagram, destination);

	EXPECT_TRUE(result.is_err());
}
