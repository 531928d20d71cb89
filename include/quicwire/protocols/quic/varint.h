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

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace quicwire::protocols::quic
{
    /*!
     * \brief Maximum value that can be encoded in QUIC variable-length integer
     *
     * This is 2^62 - 1, the maximum 62-bit unsigned integer.
     */
    constexpr uint64_t varint_max = 4611686018427387903ULL;

    /*!
     * \class varint
     * \brief QUIC variable-length integer encoding/decoding (RFC 9000 Section 16)
     *
     * QUIC uses a variable-length integer encoding with 2-bit length prefix:
     *
     * | 2-Bit Value | Length  | Usable Bits | Range                    |
     * |-------------|---------|-------------|--------------------------|
     * | 0b00        | 1 byte  | 6           | 0-63                     |
     * | 0b01        | 2 bytes | 14          | 0-16383                  |
     * | 0b10        | 4 bytes | 30          | 0-1073741823             |
     * | 0b11        | 8 bytes | 62          | 0-4611686018427387903    |
     *
     * Encoders always pick the smallest length (canonical form). The decoder
     * accepts any of the four lengths for any value.
     */
    class varint
    {
    public:
        /*!
         * \brief Encode a value into a caller-provided buffer
         * \param value Value to encode
         * \param buffer Destination buffer
         * \return Result containing the number of bytes written, or
         *         value_out_of_range if value > varint_max, or
         *         buffer_too_small if the canonical encoding does not fit
         * \note Nothing is written past the reported length, and nothing at
         *       all on failure.
         */
        [[nodiscard]] static auto encode(uint64_t value, std::span<uint8_t> buffer)
            -> Result<size_t>;

        /*!
         * \brief Encode a value to a freshly allocated byte vector
         * \param value Value to encode
         * \return Result containing encoded bytes or value_out_of_range
         */
        [[nodiscard]] static auto encode(uint64_t value) -> Result<std::vector<uint8_t>>;

        /*!
         * \brief Encode with a forced length
         * \param value Value to encode
         * \param length Encoded length (1, 2, 4, or 8)
         * \param buffer Destination buffer
         * \return Result containing bytes written (== length) or error if the
         *         length is invalid, the value doesn't fit, or the buffer is
         *         too small
         *
         * Used for fields reserved at a fixed width before their final value
         * is known (e.g. the Length field of a long header).
         */
        [[nodiscard]] static auto encode_with_length(uint64_t value, size_t length,
                                                     std::span<uint8_t> buffer)
            -> Result<size_t>;

        /*!
         * \brief Decode variable-length integer from buffer
         * \param data Input buffer
         * \return Result containing (decoded_value, bytes_consumed) or
         *         buffer_too_small for empty or truncated input
         */
        [[nodiscard]] static auto decode(std::span<const uint8_t> data)
            -> Result<std::pair<uint64_t, size_t>>;

        /*!
         * \brief Get the number of bytes needed to encode a value
         * \param value Value to check
         * \return Encoded length in bytes (1, 2, 4, or 8)
         */
        [[nodiscard]] static constexpr auto encoded_length(uint64_t value) noexcept -> size_t
        {
            if (value <= max_1byte)
            {
                return 1;
            }
            if (value <= max_2byte)
            {
                return 2;
            }
            if (value <= max_4byte)
            {
                return 4;
            }
            return 8;
        }

        /*!
         * \brief Get encoded length from the first byte's prefix
         * \param first_byte First byte of encoded varint
         * \return Encoded length in bytes (1, 2, 4, or 8)
         */
        [[nodiscard]] static constexpr auto length_from_prefix(uint8_t first_byte) noexcept -> size_t
        {
            return size_t{1} << (first_byte >> 6);
        }

        /*!
         * \brief Check if a value can be encoded as a varint
         * \param value Value to check
         * \return true if value <= varint_max
         */
        [[nodiscard]] static constexpr auto is_valid(uint64_t value) noexcept -> bool
        {
            return value <= varint_max;
        }

        /*!
         * \brief Maximum value for each encoded length
         */
        static constexpr uint64_t max_1byte = 63;
        static constexpr uint64_t max_2byte = 16383;
        static constexpr uint64_t max_4byte = 1073741823;
        static constexpr uint64_t max_8byte = varint_max;

    private:
        static auto max_for_length(size_t length) noexcept -> uint64_t;

        static auto write(uint64_t value, size_t length, std::span<uint8_t> buffer) noexcept
            -> void;

        static constexpr uint8_t prefix_1byte = 0x00;
        static constexpr uint8_t prefix_2byte = 0x40;
        static constexpr uint8_t prefix_4byte = 0x80;
        static constexpr uint8_t prefix_8byte = 0xC0;
        static constexpr uint8_t prefix_mask = 0xC0;
        static constexpr uint8_t value_mask = 0x3F;
    };

} // namespace quicwire::protocols::quic
