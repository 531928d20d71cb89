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

#include "quicwire/protocols/quic/frame_types.h"
#include "quicwire/types/result.h"

#include <span>
#include <utility>
#include <vector>

namespace quicwire::protocols::quic
{

/*!
 * \class frame_parser
 * \brief Parser for QUIC frames (RFC 9000 Section 12)
 *
 * Parses untrusted bytes into frame values. Every read is bounds checked;
 * truncated input yields buffer_too_small, an unknown discriminator yields
 * unknown_discriminator and a known but unsupported one not_implemented.
 */
class frame_parser
{
public:
    /*!
     * \brief Parse a single frame from buffer
     * \param data Input buffer starting at the frame type
     * \return Result containing (parsed_frame, bytes_consumed) or error
     */
    [[nodiscard]] static auto parse(std::span<const uint8_t> data)
        -> Result<std::pair<frame, size_t>>;

    /*!
     * \brief Parse the body of a frame whose type was already read
     * \param data Input buffer starting right after the frame type
     * \param type Frame type discriminator
     * \param type_length Bytes the type occupied on the wire; PADDING counts
     *        them so a non-minimal type encoding keeps its size
     * \return Result containing (parsed_frame, body_bytes_consumed) or error
     */
    [[nodiscard]] static auto parse_payload(std::span<const uint8_t> data, uint64_t type,
                                            size_t type_length = 1)
        -> Result<std::pair<frame, size_t>>;

    /*!
     * \brief Parse all frames from buffer
     * \param data Input buffer containing one or more frames
     * \return Result containing vector of parsed frames or the first error
     */
    [[nodiscard]] static auto parse_all(std::span<const uint8_t> data)
        -> Result<std::vector<frame>>;

    /*!
     * \brief Get the frame type from raw data without full parsing
     * \param data Input buffer
     * \return Result containing (frame_type_value, bytes_consumed) or error
     */
    [[nodiscard]] static auto peek_type(std::span<const uint8_t> data)
        -> Result<std::pair<uint64_t, size_t>>;

private:
    [[nodiscard]] static auto parse_padding(std::span<const uint8_t> data, size_t type_length)
        -> Result<std::pair<frame, size_t>>;

    [[nodiscard]] static auto parse_ack(std::span<const uint8_t> data)
        -> Result<std::pair<frame, size_t>>;

    [[nodiscard]] static auto parse_stream(std::span<const uint8_t> data, uint8_t flags)
        -> Result<std::pair<frame, size_t>>;
};

/*!
 * \class frame_builder
 * \brief Serializer for QUIC frames (RFC 9000 Section 12)
 *
 * encoded_size() is exactly the number of bytes serialize() writes for
 * every supported frame.
 */
class frame_builder
{
public:
    /*!
     * \brief Number of bytes the frame occupies on the wire
     * \param f Frame to measure
     * \return Encoded size; 0 for unsupported_frame
     */
    [[nodiscard]] static auto encoded_size(const frame& f) noexcept -> size_t;

    /*!
     * \brief Serialize a frame into a caller-provided buffer
     * \param f Frame to serialize
     * \param buffer Destination buffer
     * \return Result containing bytes written (== encoded_size(f)) or
     *         buffer_too_small, value_out_of_range, malformed_field or
     *         not_implemented
     */
    [[nodiscard]] static auto serialize(const frame& f, std::span<uint8_t> buffer)
        -> Result<size_t>;

    /*!
     * \brief Serialize a frame into a new byte vector
     */
    [[nodiscard]] static auto build(const frame& f) -> Result<std::vector<uint8_t>>;

private:
    [[nodiscard]] static auto ack_size(const ack_frame& f) noexcept -> size_t;
    [[nodiscard]] static auto stream_size(const stream_frame& f) noexcept -> size_t;

    [[nodiscard]] static auto serialize_padding(const padding_frame& f,
                                                std::span<uint8_t> buffer) -> Result<size_t>;
    [[nodiscard]] static auto serialize_ping(std::span<uint8_t> buffer) -> Result<size_t>;
    [[nodiscard]] static auto serialize_ack(const ack_frame& f,
                                            std::span<uint8_t> buffer) -> Result<size_t>;
    [[nodiscard]] static auto serialize_stream(const stream_frame& f,
                                               std::span<uint8_t> buffer) -> Result<size_t>;

    // Helper to write a varint at offset and advance it
    [[nodiscard]] static auto append_varint(std::span<uint8_t> buffer, size_t& offset,
                                            uint64_t value) -> VoidResult;
};

} // namespace quicwire::protocols::quic
