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

#include "quicwire/protocols/quic/header_types.h"
#include "quicwire/types/result.h"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace quicwire::protocols::quic
{

// ============================================================================
// Packet Number Encoding
// ============================================================================

/*!
 * \class packet_number
 * \brief QUIC packet number utilities (RFC 9000 Section 17.1)
 *
 * Packet numbers are sent truncated to 1-4 bytes; the receiver recovers
 * the full value from the largest packet number it has seen.
 */
class packet_number
{
public:
    /*!
     * \brief Get the minimum number of bytes needed to encode a packet number
     * \param full_pn Full packet number
     * \param largest_acked Largest acknowledged packet number
     * \return Number of bytes (1-4)
     */
    [[nodiscard]] static auto encoded_length(uint64_t full_pn,
                                             uint64_t largest_acked) noexcept -> size_t;

    /*!
     * \brief Truncate a full packet number to its wire width
     */
    [[nodiscard]] static auto truncate(uint64_t full_pn, size_t pn_length) noexcept
        -> uint64_t;

    /*!
     * \brief Decode a packet number from received data (RFC 9000 Appendix A.3)
     * \param truncated_pn Truncated packet number from packet
     * \param pn_length Length of the truncated packet number (1-4)
     * \param largest_pn Largest packet number received so far
     * \return Full recovered packet number; truncated_pn unchanged when
     *         pn_length is outside 1-4
     */
    [[nodiscard]] static auto decode(uint64_t truncated_pn, size_t pn_length,
                                     uint64_t largest_pn) noexcept -> uint64_t;
};

// ============================================================================
// Header Parser
// ============================================================================

/*!
 * \class header_parser
 * \brief Parser for QUIC packet headers (RFC 9000 Section 17)
 *
 * Parses the unprotected header format; header protection must be removed
 * before the packet number bits can be trusted.
 */
class header_parser
{
public:
    /*!
     * \brief Check if a packet has a long header
     */
    [[nodiscard]] static constexpr auto is_long_header(uint8_t first_byte) noexcept -> bool
    {
        return (first_byte & 0x80) != 0;
    }

    /*!
     * \brief Check if the fixed bit is set (required by RFC 9000)
     */
    [[nodiscard]] static constexpr auto has_valid_fixed_bit(uint8_t first_byte) noexcept -> bool
    {
        return (first_byte & 0x40) != 0;
    }

    /*!
     * \brief Get the packet type from a long header's first byte
     */
    [[nodiscard]] static constexpr auto get_long_packet_type(uint8_t first_byte) noexcept
        -> packet_type
    {
        return static_cast<packet_type>((first_byte >> 4) & 0x03);
    }

    /*!
     * \brief Parse any packet header
     * \param data Input buffer starting at the first byte of a packet
     * \param short_dcid_length Destination connection ID length to assume
     *        for short headers
     * \return Result containing (header, header_length) or error
     */
    [[nodiscard]] static auto parse(std::span<const uint8_t> data, size_t short_dcid_length)
        -> Result<std::pair<packet_header, size_t>>;

    /*!
     * \brief Parse an Initial, 0-RTT or Handshake long header
     * \return Result containing (header, header_length) or error
     */
    [[nodiscard]] static auto parse_long(std::span<const uint8_t> data)
        -> Result<std::pair<long_header, size_t>>;

    /*!
     * \brief Parse a short header
     * \param data Input buffer
     * \param conn_id_length Expected destination connection ID length
     * \return Result containing (header, header_length) or error
     */
    [[nodiscard]] static auto parse_short(std::span<const uint8_t> data,
                                          size_t conn_id_length)
        -> Result<std::pair<short_header, size_t>>;

    /*!
     * \brief Parse a Version Negotiation packet
     * \return Result containing (header, bytes_consumed); the version list
     *         extends to the end of data
     */
    [[nodiscard]] static auto parse_version_negotiation(std::span<const uint8_t> data)
        -> Result<std::pair<version_negotiation_header, size_t>>;

    /*!
     * \brief Parse a Retry packet
     * \return Result containing (header, bytes_consumed); the integrity tag
     *         is the final 16 bytes of data
     */
    [[nodiscard]] static auto parse_retry(std::span<const uint8_t> data)
        -> Result<std::pair<retry_header, size_t>>;

    /*!
     * \brief Check if this is a version negotiation packet
     * \param data Input buffer (at least 5 bytes)
     */
    [[nodiscard]] static auto is_version_negotiation(std::span<const uint8_t> data) noexcept
        -> bool;
};

// ============================================================================
// Header Builder
// ============================================================================

/*!
 * \class header_builder
 * \brief Serializer for QUIC packet headers (RFC 9000 Section 17)
 *
 * Header protection must be applied after serializing.
 */
class header_builder
{
public:
    /*!
     * \brief Number of bytes the header occupies on the wire
     */
    [[nodiscard]] static auto encoded_size(const packet_header& header) noexcept -> size_t;

    /*!
     * \brief Serialize a header into a caller-provided buffer
     * \param header Header to serialize
     * \param buffer Destination buffer
     * \return Result containing bytes written (== encoded_size(header)) or
     *         buffer_too_small, value_out_of_range or malformed_field
     */
    [[nodiscard]] static auto serialize(const packet_header& header,
                                        std::span<uint8_t> buffer) -> Result<size_t>;

    /*!
     * \brief Serialize a header into a new byte vector
     */
    [[nodiscard]] static auto build(const packet_header& header)
        -> Result<std::vector<uint8_t>>;

private:
    [[nodiscard]] static auto serialize_short(const short_header& h,
                                              std::span<uint8_t> buffer) -> Result<size_t>;
    [[nodiscard]] static auto serialize_long(const long_header& h,
                                             std::span<uint8_t> buffer) -> Result<size_t>;
    [[nodiscard]] static auto serialize_version_negotiation(
        const version_negotiation_header& h, std::span<uint8_t> buffer) -> Result<size_t>;
    [[nodiscard]] static auto serialize_retry(const retry_header& h,
                                              std::span<uint8_t> buffer) -> Result<size_t>;
};

} // namespace quicwire::protocols::quic
