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
#include "quicwire/protocols/quic/frame_types.h"
#include "quicwire/protocols/quic/header_types.h"
#include "quicwire/protocols/quic/protection.h"
#include "quicwire/transport/datagram_sink.h"
#include "quicwire/types/result.h"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace quicwire::protocols::quic
{

/*!
 * \class packet
 * \brief A QUIC packet: one header followed by an ordered list of frames
 *
 * The packet owns its frames. Frame storage starts at the requested
 * capacity and grows to 4, then doubles whenever it is full.
 *
 * A packet is open until release() is called. Releasing frees the frame
 * storage and is permanent; append() and serialize() on a released packet
 * fail with error_codes::codec::packet_released.
 *
 * \code
 * packet p(short_header{dcid, 7});
 * p.append(ping_frame{});
 * p.append(padding_frame{10});
 * std::vector<uint8_t> wire(p.size());
 * auto written = p.serialize(wire);
 * \endcode
 */
class packet
{
public:
    /*!
     * \brief Create an empty packet
     * \param header Packet header
     * \param initial_capacity Number of frames to reserve space for
     */
    explicit packet(packet_header header, size_t initial_capacity = 0);

    /*!
     * \brief Create an empty packet with no reserved frame storage
     */
    [[nodiscard]] static auto create(packet_header header) -> packet;

    /*!
     * \brief Create an empty packet for outgoing traffic
     *
     * Short and long headers take the configured packet number length;
     * frame storage is reserved for initial_frame_capacity frames.
     *
     * \return Result containing the packet, or invalid_argument if the
     *         configuration does not validate
     */
    [[nodiscard]] static auto create(packet_header header, const config::codec_config& config)
        -> Result<packet>;

    /*!
     * \brief Append a frame
     * \return VoidResult; packet_released if release() was called
     */
    [[nodiscard]] auto append(frame f) -> VoidResult;

    [[nodiscard]] auto frames() const noexcept -> std::span<const frame>;

    [[nodiscard]] auto frame_count() const noexcept -> size_t;

    /*!
     * \brief Number of frames that fit before storage grows
     */
    [[nodiscard]] auto capacity() const noexcept -> size_t;

    [[nodiscard]] auto header() const noexcept -> const packet_header&;

    [[nodiscard]] auto header() noexcept -> packet_header&;

    /*!
     * \brief Encoded size of the header plus all frames
     */
    [[nodiscard]] auto size() const noexcept -> size_t;

    /*!
     * \brief Encoded size of the frames only
     */
    [[nodiscard]] auto payload_size() const noexcept -> size_t;

    /*!
     * \brief Serialize header then frames in order into buffer
     * \return Bytes written, or the first error encountered. Bytes written
     *         before a failure are left in the buffer.
     */
    [[nodiscard]] auto serialize(std::span<uint8_t> buffer) const -> Result<size_t>;

    /*!
     * \brief Serialize into a new vector of exactly size() bytes
     */
    [[nodiscard]] auto to_bytes() const -> Result<std::vector<uint8_t>>;

    /*!
     * \brief Set a long header's Length field from the current payload
     * \param trailer Extra bytes added after serialization (e.g. an AEAD tag)
     * \return VoidResult; invalid_argument for headers without a Length field
     */
    [[nodiscard]] auto update_length(size_t trailer = 0) -> VoidResult;

    /*!
     * \brief Free frame storage; the packet can no longer be modified
     *
     * Calling release() more than once has no further effect.
     */
    auto release() noexcept -> void;

    [[nodiscard]] auto is_released() const noexcept -> bool;

    /*!
     * \brief Parse one packet from the start of data
     * \param data Unprotected datagram bytes
     * \param short_dcid_length Destination connection ID length for short headers
     * \return Result containing (packet, bytes_consumed) or error. Long header
     *         packets end where their Length field says; everything else
     *         consumes the rest of data.
     */
    [[nodiscard]] static auto parse(std::span<const uint8_t> data, size_t short_dcid_length)
        -> Result<std::pair<packet, size_t>>;

    /*!
     * \brief Parse every packet coalesced into one datagram (RFC 9000 Section 12.2)
     */
    [[nodiscard]] static auto parse_datagram(std::span<const uint8_t> data,
                                             size_t short_dcid_length)
        -> Result<std::vector<packet>>;

    /*!
     * \brief Serialize, optionally protect, and hand the packet to a sink
     * \param sink Datagram destination
     * \param destination Remote endpoint
     * \param protection Protection to apply, or nullptr to send plaintext
     * \return Number of bytes handed to the sink
     */
    [[nodiscard]] auto send(transport::datagram_sink& sink,
                            const transport::endpoint_info& destination,
                            packet_protection* protection = nullptr) const -> Result<size_t>;

private:
    packet_header header_;
    std::vector<frame> frames_;
    bool released_{false};
};

} // namespace quicwire::protocols::quic
