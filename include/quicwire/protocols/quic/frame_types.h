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

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace quicwire::protocols::quic
{

/*!
 * \brief QUIC frame types as defined in RFC 9000 Section 12.4
 *
 * Frame types indicate which fields are present in a frame. STREAM frames
 * use the low-order bits of 0x08-0x0f to encode flags.
 */
enum class frame_type : uint64_t
{
    padding = 0x00,
    ping = 0x01,
    ack = 0x02,
    ack_ecn = 0x03,
    reset_stream = 0x04,
    stop_sending = 0x05,
    crypto = 0x06,
    new_token = 0x07,
    // STREAM frames: 0x08-0x0f (use stream_base and flags)
    stream_base = 0x08,
    max_data = 0x10,
    max_stream_data = 0x11,
    max_streams_bidi = 0x12,
    max_streams_uni = 0x13,
    data_blocked = 0x14,
    stream_data_blocked = 0x15,
    streams_blocked_bidi = 0x16,
    streams_blocked_uni = 0x17,
    new_connection_id = 0x18,
    retire_connection_id = 0x19,
    path_challenge = 0x1a,
    path_response = 0x1b,
    connection_close = 0x1c,
    connection_close_app = 0x1d,
    handshake_done = 0x1e,
};

/*!
 * \brief STREAM frame type flags (bits 0-2 of type byte)
 *
 * When the frame type is in range 0x08-0x0f:
 * - Bit 0 (0x01): FIN - Stream is complete
 * - Bit 1 (0x02): LEN - Length field is present
 * - Bit 2 (0x04): OFF - Offset field is present
 */
namespace stream_flags
{
    constexpr uint8_t fin = 0x01;    //!< Stream is finished
    constexpr uint8_t len = 0x02;    //!< Length field present
    constexpr uint8_t off = 0x04;    //!< Offset field present
    constexpr uint8_t mask = 0x07;   //!< Mask for all flags
    constexpr uint8_t base = 0x08;   //!< Base type for STREAM frames
} // namespace stream_flags

/*!
 * \brief Check if a frame type value represents a STREAM frame
 */
[[nodiscard]] constexpr auto is_stream_frame(uint64_t type) noexcept -> bool
{
    return (type >= 0x08 && type <= 0x0f);
}

/*!
 * \brief Check if a frame type value belongs to the RFC 9000 taxonomy
 *
 * Known types include the ones this codec cannot encode; callers use this
 * to tell a local feature gap from a protocol violation.
 */
[[nodiscard]] constexpr auto is_known_frame_type(uint64_t type) noexcept -> bool
{
    return type <= static_cast<uint64_t>(frame_type::handshake_done);
}

/*!
 * \brief Extract STREAM flags from frame type
 */
[[nodiscard]] constexpr auto get_stream_flags(uint64_t type) noexcept -> uint8_t
{
    return static_cast<uint8_t>(type & stream_flags::mask);
}

/*!
 * \brief Build STREAM frame type from flags
 */
[[nodiscard]] constexpr auto make_stream_type(bool has_fin, bool has_length,
                                               bool has_offset) noexcept -> uint8_t
{
    uint8_t type = stream_flags::base;
    if (has_fin) type |= stream_flags::fin;
    if (has_length) type |= stream_flags::len;
    if (has_offset) type |= stream_flags::off;
    return type;
}

// ============================================================================
// Frame Structures (RFC 9000 Section 19)
// ============================================================================

/*!
 * \brief PADDING frame (RFC 9000 Section 19.1)
 *
 * Each padding byte is a one-byte frame of type 0x00. A run of them is
 * carried as a single value with a byte count.
 */
struct padding_frame
{
    size_t count{1}; //!< Number of padding bytes

    auto operator==(const padding_frame&) const -> bool = default;
};

/*!
 * \brief PING frame (RFC 9000 Section 19.2)
 */
struct ping_frame
{
    auto operator==(const ping_frame&) const -> bool = default;
};

/*!
 * \brief ACK Range for ACK frames
 */
struct ack_range
{
    uint64_t gap{0};    //!< Number of contiguous unacknowledged packets
    uint64_t length{0}; //!< Number of contiguous acknowledged packets

    auto operator==(const ack_range&) const -> bool = default;
};

/*!
 * \brief ACK frame (RFC 9000 Section 19.3)
 *
 * Wire order: type, Largest Acknowledged, ACK Delay, ACK Range Count,
 * First ACK Range, then (Gap, ACK Range Length) pairs.
 */
struct ack_frame
{
    uint64_t largest_acknowledged{0}; //!< Largest packet number acknowledged
    uint64_t ack_delay{0};            //!< Encoded ACK delay
    uint64_t first_ack_range{0};      //!< Packets acknowledged below largest_acknowledged
    std::vector<ack_range> ranges;    //!< Additional ACK ranges

    auto operator==(const ack_frame&) const -> bool = default;
};

/*!
 * \brief STREAM frame (RFC 9000 Section 19.8)
 *
 * Always encoded with an explicit Length field; the Offset field is present
 * only when offset is non-zero.
 */
struct stream_frame
{
    uint64_t stream_id{0};         //!< Stream identifier
    uint64_t offset{0};            //!< Byte offset in stream (0 if not present)
    std::vector<uint8_t> data;     //!< Stream data
    bool fin{false};               //!< True if this is the final data

    auto operator==(const stream_frame&) const -> bool = default;
};

/*!
 * \brief Placeholder for frame types this codec does not encode
 *
 * Carries only the discriminator. Serializing or parsing one fails with
 * error_codes::codec::not_implemented.
 */
struct unsupported_frame
{
    frame_type type{frame_type::handshake_done};

    auto operator==(const unsupported_frame&) const -> bool = default;
};

// ============================================================================
// Frame Variant
// ============================================================================

/*!
 * \brief Variant type holding any QUIC frame
 */
using frame = std::variant<
    padding_frame,
    ping_frame,
    ack_frame,
    stream_frame,
    unsupported_frame
>;

/*!
 * \brief Get the frame type for a frame variant
 *
 * STREAM frames report stream_base regardless of their flags.
 */
[[nodiscard]] auto get_frame_type(const frame& f) -> frame_type;

/*!
 * \brief Get string name for a frame type
 */
[[nodiscard]] auto frame_type_to_string(frame_type type) -> std::string;

} // namespace quicwire::protocols::quic
