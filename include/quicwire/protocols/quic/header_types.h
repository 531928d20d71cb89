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

#include "quicwire/protocols/quic/connection_id.h"

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace quicwire::protocols::quic
{

// ============================================================================
// QUIC Versions
// ============================================================================

/*!
 * \brief Well-known QUIC version numbers
 */
namespace quic_version
{
    //! QUIC version 1 (RFC 9000)
    constexpr uint32_t version_1 = 0x00000001;

    //! QUIC version 2 (RFC 9369)
    constexpr uint32_t version_2 = 0x6b3343cf;

    //! Version Negotiation (special value)
    constexpr uint32_t negotiation = 0x00000000;
} // namespace quic_version

// ============================================================================
// Packet Types
// ============================================================================

/*!
 * \brief QUIC packet types (RFC 9000 Section 17)
 *
 * The first four values are the long packet type bits of the first byte.
 * version_negotiation and one_rtt have no type bits on the wire.
 */
enum class packet_type : uint8_t
{
    initial = 0x00,
    zero_rtt = 0x01,
    handshake = 0x02,
    retry = 0x03,
    version_negotiation = 0xFE,
    one_rtt = 0xFF,
};

/*!
 * \brief Convert packet type to string for debugging
 */
[[nodiscard]] auto packet_type_to_string(packet_type type) -> std::string;

// ============================================================================
// Header Structures
// ============================================================================

/*!
 * \struct short_header
 * \brief QUIC Short Header (1-RTT) format (RFC 9000 Section 17.3)
 *
 * Format:
 * +-+-+-+-+-+-+-+-+
 * |0|1|S|R|R|K|P P|  Header Form (0), Fixed Bit (1), Spin Bit,
 * +-+-+-+-+-+-+-+-+  Reserved, Key Phase, Packet Number Length - 1
 * |Destination Connection ID (0..160)|
 * |Packet Number (8..32)             |
 *
 * The destination connection ID carries no length prefix; the receiver
 * must know its length.
 */
struct short_header
{
    connection_id dest_conn_id;        //!< Destination Connection ID
    uint64_t packet_number{0};         //!< Truncated packet number as sent on the wire
    size_t packet_number_length{4};    //!< Packet number length (1-4 bytes)
    bool spin_bit{false};              //!< Latency spin bit
    bool key_phase{false};             //!< Key phase bit

    auto operator==(const short_header&) const -> bool = default;
};

/*!
 * \struct long_header
 * \brief QUIC Long Header for Initial, 0-RTT and Handshake packets
 *        (RFC 9000 Section 17.2)
 *
 * Format:
 * +-+-+-+-+-+-+-+-+
 * |1|1|T T|R R|P P|  Header Form (1), Fixed Bit (1), Long Packet Type,
 * +-+-+-+-+-+-+-+-+  Reserved, Packet Number Length - 1
 * |   Version (32)               |
 * |DCID Len (8)| DCID (0..160)   |
 * |SCID Len (8)| SCID (0..160)   |
 * |Token Length (i)| Token (*)   |  Initial only
 * |Length (i)                    |
 * |Packet Number (8..32)         |
 *
 * type is restricted to initial, zero_rtt and handshake, and token must
 * be empty unless type is initial.
 */
struct long_header
{
    packet_type type{packet_type::initial};    //!< Long packet type
    uint32_t version{quic_version::version_1}; //!< QUIC version
    connection_id dest_conn_id;                //!< Destination Connection ID
    connection_id src_conn_id;                 //!< Source Connection ID
    std::vector<uint8_t> token;                //!< Address validation token (Initial only)
    uint64_t length{0};                        //!< Packet number + payload length
    uint64_t packet_number{0};                 //!< Truncated packet number as sent on the wire
    size_t packet_number_length{4};            //!< Packet number length (1-4 bytes)

    auto operator==(const long_header&) const -> bool = default;
};

/*!
 * \struct version_negotiation_header
 * \brief Version Negotiation packet (RFC 9000 Section 17.2.1)
 *
 * A long header with version 0 followed by the list of versions the
 * server supports. The list is the whole packet body.
 */
struct version_negotiation_header
{
    connection_id dest_conn_id;              //!< Destination Connection ID
    connection_id src_conn_id;               //!< Source Connection ID
    std::vector<uint32_t> supported_versions; //!< Supported versions (non-empty)

    auto operator==(const version_negotiation_header&) const -> bool = default;
};

/*!
 * \struct retry_header
 * \brief Retry packet (RFC 9000 Section 17.2.5)
 *
 * The integrity tag is carried opaquely; computing and verifying it is the
 * job of the packet protection layer.
 */
struct retry_header
{
    uint32_t version{quic_version::version_1}; //!< QUIC version
    connection_id dest_conn_id;                //!< Destination Connection ID
    connection_id src_conn_id;                 //!< Source Connection ID
    std::vector<uint8_t> token;                //!< Retry token
    std::array<uint8_t, 16> integrity_tag{};   //!< Retry Integrity Tag

    auto operator==(const retry_header&) const -> bool = default;
};

/*!
 * \brief Variant type for packet headers
 */
using packet_header = std::variant<short_header, long_header,
                                   version_negotiation_header, retry_header>;

/*!
 * \brief Get the packet type of a header
 */
[[nodiscard]] auto get_packet_type(const packet_header& header) -> packet_type;

/*!
 * \brief Check whether a header uses the long header form
 */
[[nodiscard]] auto is_long_header(const packet_header& header) noexcept -> bool;

} // namespace quicwire::protocols::quic
