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

#include "quicwire/types/result.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace quicwire::protocols::quic
{

/*!
 * \class connection_id
 * \brief QUIC Connection ID (RFC 9000 Section 5.1)
 *
 * A connection ID routes packets to the correct connection. The codec
 * treats it as an opaque value of 0 to 20 bytes.
 *
 * Key properties (RFC 9000):
 * - Length: 0 to 20 bytes (max_length = 20)
 * - Zero-length connection IDs are valid
 * - Connection IDs should be unpredictable to avoid linkability
 */
class connection_id
{
public:
    //! Maximum length of a connection ID (RFC 9000)
    static constexpr size_t max_length = 20;

    /*!
     * \brief Default constructor creates an empty connection ID
     */
    connection_id() = default;

    /*!
     * \brief Construct from raw bytes
     * \param data Span of bytes (max 20)
     * \note If data is longer than max_length, only the first max_length bytes
     *       are used. Use from_bytes() to reject oversized input instead.
     */
    explicit connection_id(std::span<const uint8_t> data);

    /*!
     * \brief Construct from raw bytes, rejecting oversized input
     * \param data Span of bytes
     * \return Result containing the connection ID, or value_out_of_range if
     *         data is longer than max_length
     */
    [[nodiscard]] static auto from_bytes(std::span<const uint8_t> data) -> Result<connection_id>;

    /*!
     * \brief Generate a random connection ID
     * \param length Desired length (1-20, clamped to max_length)
     * \return Result containing the generated ID, or an error if the
     *         random source failed
     */
    [[nodiscard]] static auto generate(size_t length = 8) -> Result<connection_id>;

    [[nodiscard]] auto data() const -> std::span<const uint8_t>;

    [[nodiscard]] auto length() const noexcept -> size_t;

    [[nodiscard]] auto empty() const noexcept -> bool;

    [[nodiscard]] auto operator==(const connection_id& other) const noexcept -> bool;

    [[nodiscard]] auto operator!=(const connection_id& other) const noexcept -> bool;

    /*!
     * \brief Less-than comparison for use in ordered containers
     *
     * Orders by length first, then by content.
     */
    [[nodiscard]] auto operator<(const connection_id& other) const noexcept -> bool;

    /*!
     * \brief Convert to hexadecimal string for debugging
     * \return Hexadecimal representation, or "<empty>"
     */
    [[nodiscard]] auto to_string() const -> std::string;

private:
    std::array<uint8_t, max_length> data_{};
    uint8_t length_{0};
};

} // namespace quicwire::protocols::quic
