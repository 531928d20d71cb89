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

#include "quicwire/transport/udp_transport.h"
#include "quicwire/integration/logger_integration.h"

namespace quicwire::transport
{
	namespace
	{
		constexpr const char* source = "transport::udp_transport";

		auto to_endpoint_info(const asio::ip::udp::endpoint& endpoint) -> endpoint_info
		{
			return endpoint_info(endpoint.address().to_string(), endpoint.port());
		}

		auto to_asio_endpoint(const endpoint_info& info, std::error_code& ec)
			-> asio::ip::udp::endpoint
		{
			auto address = asio::ip::make_address(info.address, ec);
			if (ec)
			{
				return {};
			}
			return asio::ip::udp::endpoint(address, info.port);
		}
	} // namespace

	udp_transport::udp_transport(asio::io_context& io_context)
		: socket_(io_context)
	{
	}

	udp_transport::~udp_transport()
	{
		close();
	}

	auto udp_transport::open(asio::io_context& io_context, const endpoint_info& local)
		-> Result<std::shared_ptr<udp_transport>>
	{
		auto transport = std::make_shared<udp_transport>(io_context);
		auto bound = transport->bind(local);
		if (bound.is_err())
		{
			return forward_error<std::shared_ptr<udp_transport>>(bound, source);
		}
		return ok(std::move(transport));
	}

	auto udp_transport::bind(const endpoint_info& local) -> VoidResult
	{
		std::error_code ec;
		auto endpoint = to_asio_endpoint(local, ec);
		if (ec)
		{
			return error_void(error_codes::common_errors::invalid_argument,
			                  "Invalid local address", source, local.address);
		}

		socket_.open(endpoint.protocol(), ec);
		if (!ec)
		{
			socket_.bind(endpoint, ec);
		}
		if (ec)
		{
			QUICWIRE_LOG_ERROR("Failed to bind UDP socket to " + local.to_string() + ": " +
			                   ec.message());
			return error_void(error_codes::common_errors::network_error,
			                  "Failed to bind UDP socket", source, ec.message());
		}

		QUICWIRE_LOG_INFO("UDP transport bound to " + local_endpoint().to_string());
		return ok();
	}

	auto udp_transport::local_endpoint() const -> endpoint_info
	{
		std::error_code ec;
		auto endpoint = socket_.local_endpoint(ec);
		if (ec)
		{
			return {};
		}
		return to_endpoint_info(endpoint);
	}

	auto udp_transport::set_receive_callback(receive_callback callback) -> void
	{
		std::lock_guard<std::mutex> lock(callback_mutex_);
		receive_callback_ = std::move(callback);
	}

	auto udp_transport::set_error_callback(error_callback callback) -> void
	{
		std::lock_guard<std::mutex> lock(callback_mutex_);
		error_callback_ = std::move(callback);
	}

	auto udp_transport::start_receive() -> void
	{
		if (is_receiving_.exchange(true))
		{
			return;
		}
		do_receive();
	}

	auto udp_transport::stop_receive() -> void
	{
		if (!is_receiving_.exchange(false))
		{
			return;
		}
		std::error_code ec;
		socket_.cancel(ec);
		if (ec)
		{
			QUICWIRE_LOG_WARN("Failed to cancel UDP receive: " + ec.message());
		}
	}

	auto udp_transport::close() -> void
	{
		is_receiving_.store(false);
		if (!socket_.is_open())
		{
			return;
		}
		std::error_code ec;
		socket_.close(ec);
		if (ec)
		{
			QUICWIRE_LOG_WARN("Failed to close UDP socket: " + ec.message());
		}
	}

	auto udp_transport::send_datagram(std::span<const uint8_t> datagram,
	                                  const endpoint_info& destination) -> VoidResult
	{
		std::error_code ec;
		auto endpoint = to_asio_endpoint(destination, ec);
		if (ec)
		{
			return error_void(error_codes::common_errors::invalid_argument,
			                  "Invalid destination address", source, destination.address);
		}

		auto sent = socket_.send_to(asio::buffer(datagram.data(), datagram.size()), endpoint, 0, ec);
		if (ec)
		{
			QUICWIRE_LOG_DEBUG("UDP send to " + destination.to_string() + " failed: " +
			                   ec.message());
			return error_void(error_codes::common_errors::network_error,
			                  "UDP send failed", source, ec.message());
		}
		if (sent != datagram.size())
		{
			return error_void(error_codes::common_errors::io_error,
			                  "Datagram truncated on send", source,
			                  "sent=" + std::to_string(sent));
		}
		return ok();
	}

	auto udp_transport::do_receive() -> void
	{
		if (!is_receiving_.load())
		{
			return;
		}

		auto self = shared_from_this();
		socket_.async_receive_from(
			asio::buffer(read_buffer_),
			sender_endpoint_,
			[this, self](std::error_code ec, std::size_t bytes_transferred)
			{
				if (!is_receiving_.load())
				{
					return;
				}

				if (ec)
				{
					if (ec != asio::error::operation_aborted)
					{
						is_receiving_.store(false);
						QUICWIRE_LOG_ERROR("UDP receive failed: " + ec.message());
						std::lock_guard<std::mutex> lock(callback_mutex_);
						if (error_callback_)
						{
							error_callback_(ec);
						}
					}
					return;
				}

				{
					std::lock_guard<std::mutex> lock(callback_mutex_);
					if (receive_callback_)
					{
						receive_callback_(std::span<const uint8_t>(read_buffer_.data(), bytes_transferred),
						                  to_endpoint_info(sender_endpoint_));
					}
				}

				do_receive();
			});
	}
} // namespace quicwire::transport
