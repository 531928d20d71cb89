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

#include "quicwire/config/codec_config.h"
#include "quicwire/protocols/quic/packet.h"
#include "quicwire/protocols/quic/protection.h"
#include "quicwire/transport/datagram_sink.h"
#include "quicwire/types/result.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>

namespace quicwire::transport {

/**
 * @class datagram_decoder
 * @brief Turns received UDP datagrams into parsed packets
 *
 * Each datagram is size checked, unprotected, split into its coalesced
 * packets and handed to the packet handler in wire order. A datagram that
 * fails any step is dropped as a whole and counted; the error is returned
 * to the caller and logged at debug level.
 *
 * ### Thread Safety
 * Counters may be read from any thread. on_datagram() must not be called
 * concurrently.
 */
class datagram_decoder {
public:
    using packet_handler =
        std::function<void(protocols::quic::packet&& pkt, const endpoint_info& source)>;

    /**
     * @param config Codec configuration
     * @param protection Protection to remove before parsing, or nullptr
     * @param handler Invoked once per decoded packet
     */
    datagram_decoder(config::codec_config config,
                     std::shared_ptr<protocols::quic::packet_protection> protection,
                     packet_handler handler);

    /**
     * @brief Create a decoder after validating its configuration
     * @return Result containing the decoder, or invalid_argument naming the
     *         first bad configuration field
     */
    [[nodiscard]] static auto create(config::codec_config config,
                                     std::shared_ptr<protocols::quic::packet_protection> protection,
                                     packet_handler handler)
        -> Result<std::shared_ptr<datagram_decoder>>;

    /**
     * @brief Decode one datagram and dispatch its packets
     * @param datagram Received bytes
     * @param source Sender endpoint
     * @return VoidResult; the error explains why the datagram was dropped
     */
    [[nodiscard]] auto on_datagram(std::span<const uint8_t> datagram,
                                   const endpoint_info& source) -> VoidResult;

    [[nodiscard]] auto datagrams_received() const noexcept -> uint64_t;

    [[nodiscard]] auto packets_decoded() const noexcept -> uint64_t;

    [[nodiscard]] auto datagrams_dropped() const noexcept -> uint64_t;

    [[nodiscard]] auto get_config() const noexcept -> const config::codec_config&;

private:
    auto drop(const endpoint_info& source, const VoidResult& reason) -> VoidResult;

    config::codec_config config_;
    std::shared_ptr<protocols::quic::packet_protection> protection_;
    packet_handler handler_;

    std::atomic<uint64_t> datagrams_received_{0};
    std::atomic<uint64_t> packets_decoded_{0};
    std::atomic<uint64_t> datagrams_dropped_{0};
};

} // namespace quicwire::transport
