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

#pragma once

#include <asio.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <system_error>

#include "quicwire/transport/datagram_sink.h"
#include "quicwire/types/result.h"

namespace quicwire::transport
{
	/*!
	 * \class udp_transport
	 * \brief A \c datagram_sink backed by an \c asio::ip::udp::socket, with an
	 *        asynchronous receive loop.
	 *
	 * ### Key Features
	 * - \c open() binds a socket to a local endpoint.
	 * - \c send_datagram() sends synchronously with \c send_to().
	 * - \c start_receive() begins an ongoing loop of \c async_receive_from();
	 *   every datagram is handed to the receive callback, typically
	 *   \c datagram_decoder::on_datagram().
	 * - Socket errors other than cancellation go to the error callback and
	 *   end the receive loop.
	 *
	 * ### Thread Safety
	 * - Callback registration is protected by callback_mutex_.
	 * - Callbacks run on the thread running the io_context.
	 */
	class udp_transport : public datagram_sink,
	                      public std::enable_shared_from_this<udp_transport>
	{
	public:
		using receive_callback =
			std::function<void(std::span<const uint8_t>, const endpoint_info&)>;
		using error_callback = std::function<void(std::error_code)>;

		/*!
		 * \brief Constructs a transport around an unopened socket.
		 * \param io_context The io_context that runs the receive loop.
		 */
		explicit udp_transport(asio::io_context& io_context);

		~udp_transport() override;

		/*!
		 * \brief Creates a transport bound to \p local.
		 * \param io_context The io_context that runs the receive loop.
		 * \param local Local address and port; port 0 picks an ephemeral port.
		 * \return The bound transport, or \c network_error on socket failure.
		 */
		[[nodiscard]] static auto open(asio::io_context& io_context, const endpoint_info& local)
			-> Result<std::shared_ptr<udp_transport>>;

		/*!
		 * \brief Opens and binds the socket.
		 */
		[[nodiscard]] auto bind(const endpoint_info& local) -> VoidResult;

		/*!
		 * \brief Returns the bound local endpoint, or an empty one if unbound.
		 */
		[[nodiscard]] auto local_endpoint() const -> endpoint_info;

		auto set_receive_callback(receive_callback callback) -> void;

		auto set_error_callback(error_callback callback) -> void;

		/*!
		 * \brief Begins the continuous asynchronous receive loop.
		 */
		auto start_receive() -> void;

		/*!
		 * \brief Stops the receive loop; pending operations are cancelled.
		 */
		auto stop_receive() -> void;

		/*!
		 * \brief Stops receiving and closes the socket.
		 */
		auto close() -> void;

		[[nodiscard]] auto send_datagram(std::span<const uint8_t> datagram,
		                                 const endpoint_info& destination) -> VoidResult override;

	private:
		auto do_receive() -> void;

	private:
		asio::ip::udp::socket socket_;

		std::array<uint8_t, 65536> read_buffer_{};
		asio::ip::udp::endpoint sender_endpoint_;

		std::mutex callback_mutex_;
		receive_callback receive_callback_;
		error_callback error_callback_;

		std::atomic<bool> is_receiving_{false};
	};
} // namespace quicwire::transport
