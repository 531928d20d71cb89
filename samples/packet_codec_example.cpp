/**
 * BSD 3-Clause License
 * Copyright (c) 2025, quicwire Project
 *
 * Packet Codec Example
 *
 * This example builds a datagram holding an Initial packet coalesced with a
 * 1-RTT packet, prints its bytes, and decodes it again through
 * datagram_decoder.
 *
 * Key features demonstrated:
 * - Building long and short header packets
 * - Fixing up the long header Length field
 * - Coalescing packets into one datagram
 * - Decoding with per-packet callbacks
 */

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "quicwire/config/codec_config.h"
#include "quicwire/protocols/quic/packet.h"
#include "quicwire/transport/datagram_decoder.h"

using namespace quicwire;
namespace quic = quicwire::protocols::quic;

namespace
{
	void print_hex(const std::vector<uint8_t>& bytes)
	{
		for (size_t i = 0; i < bytes.size(); ++i)
		{
			std::cout << std::hex << std::setw(2) << std::setfill('0')
					  << static_cast<unsigned>(bytes[i]) << ((i % 16 == 15) ? "\n" : " ");
		}
		std::cout << std::dec << std::endl;
	}

	std::string describe(const quic::frame& f)
	{
		return std::visit(
			[](const auto& value) -> std::string
			{
				using T = std::decay_t<decltype(value)>;
				if constexpr (std::is_same_v<T, quic::padding_frame>)
				{
					return "PADDING x" + std::to_string(value.count);
				}
				else if constexpr (std::is_same_v<T, quic::ping_frame>)
				{
					return "PING";
				}
				else if constexpr (std::is_same_v<T, quic::ack_frame>)
				{
					return "ACK largest=" + std::to_string(value.largest_acknowledged);
				}
				else if constexpr (std::is_same_v<T, quic::stream_frame>)
				{
					return "STREAM id=" + std::to_string(value.stream_id) + " data=\""
						   + std::string(value.data.begin(), value.data.end()) + "\""
						   + (value.fin ? " FIN" : "");
				}
				else
				{
					return "UNSUPPORTED";
				}
			},
			f);
	}

	bool append_bytes(const quic::packet& pkt, std::vector<uint8_t>& datagram)
	{
		auto bytes = pkt.to_bytes();
		if (bytes.is_err())
		{
			std::cerr << "Failed to encode packet: " << bytes.error().message << std::endl;
			return false;
		}
		datagram.insert(datagram.end(), bytes.value().begin(), bytes.value().end());
		return true;
	}
}

int main()
{
	std::cout << "=== Packet Codec Example ===" << std::endl;

	auto config = config::codec_config::development();
	config::apply_logger_config(config.logger);

	auto dcid = quic::connection_id::generate(config.short_header_dcid_length);
	auto scid = quic::connection_id::generate(4);
	if (dcid.is_err() || scid.is_err())
	{
		std::cerr << "Failed to generate connection IDs" << std::endl;
		return 1;
	}

	// Initial packet carrying a PING, padded up
	quic::long_header initial;
	initial.dest_conn_id = dcid.value();
	initial.src_conn_id = scid.value();

	auto first_created = quic::packet::create(initial, config);
	if (first_created.is_err())
	{
		std::cerr << "Invalid configuration: " << first_created.error().message << std::endl;
		return 1;
	}
	auto& first = first_created.value();
	if (first.append(quic::ping_frame{}).is_err() ||
		first.append(quic::padding_frame{32}).is_err() || first.update_length().is_err())
	{
		std::cerr << "Failed to build Initial packet" << std::endl;
		return 1;
	}

	// 1-RTT packet acknowledging 0..2 and carrying stream data
	quic::short_header one_rtt;
	one_rtt.dest_conn_id = dcid.value();
	one_rtt.packet_number = 3;

	quic::ack_frame ack;
	ack.largest_acknowledged = 2;
	ack.first_ack_range = 2;

	auto second_created = quic::packet::create(one_rtt, config);
	if (second_created.is_err())
	{
		std::cerr << "Invalid configuration: " << second_created.error().message << std::endl;
		return 1;
	}
	auto& second = second_created.value();
	if (second.append(ack).is_err() ||
		second.append(quic::stream_frame{0, 0, {'h', 'e', 'l', 'l', 'o'}, true}).is_err())
	{
		std::cerr << "Failed to build 1-RTT packet" << std::endl;
		return 1;
	}

	std::vector<uint8_t> datagram;
	if (!append_bytes(first, datagram) || !append_bytes(second, datagram))
	{
		return 1;
	}

	std::cout << "Datagram (" << datagram.size() << " bytes):" << std::endl;
	print_hex(datagram);

	auto decoder_created = transport::datagram_decoder::create(
		config, std::make_shared<quic::null_protection>(),
		[](quic::packet&& pkt, const transport::endpoint_info& source)
		{
			std::cout << "Packet from " << source.to_string() << ", "
					  << pkt.frame_count() << " frame(s), " << pkt.size() << " bytes"
					  << std::endl;
			for (const auto& f : pkt.frames())
			{
				std::cout << "  " << describe(f) << std::endl;
			}
		});
	if (decoder_created.is_err())
	{
		std::cerr << "Failed to create decoder: " << decoder_created.error().message << std::endl;
		return 1;
	}
	auto& decoder = *decoder_created.value();

	auto decoded = decoder.on_datagram(datagram, {"127.0.0.1", 4433});
	if (decoded.is_err())
	{
		std::cerr << "Decode failed: " << decoded.error().message << std::endl;
		return 1;
	}

	std::cout << "Decoded " << decoder.packets_decoded() << " packet(s)" << std::endl;
	return 0;
}
