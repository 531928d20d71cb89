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

#include "quicwire/protocols/quic/varint.h"

namespace quicwire::protocols::quic
{

namespace
{
    constexpr const char* source = "quic::varint";
} // namespace

auto varint::max_for_length(size_t length) noexcept -> uint64_t
{
    switch (length)
    {
        case 1: return max_1byte;
        case 2: return max_2byte;
        case 4: return max_4byte;
        case 8: return max_8byte;
        default: return 0;
    }
}

auto varint::write(uint64_t value, size_t length, std::span<uint8_t> buffer) noexcept -> void
{
    uint8_t prefix = prefix_1byte;
    switch (length)
    {
        case 2: prefix = prefix_2byte; break;
        case 4: prefix = prefix_4byte; break;
        case 8: prefix = prefix_8byte; break;
        default: break;
    }

    // Big-endian, length-class bits in the top of the first byte
    for (size_t i = 0; i < length; ++i)
    {
        buffer[length - 1 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    buffer[0] = static_cast<uint8_t>((buffer[0] & value_mask) | prefix);
}

auto varint::encode(uint64_t value, std::span<uint8_t> buffer) -> Result<size_t>
{
    if (!is_valid(value))
    {
        return error<size_t>(
            error_codes::codec::value_out_of_range,
            "Value exceeds maximum",
            source,
            "Value exceeds 2^62 - 1");
    }

    const size_t length = encoded_length(value);
    if (buffer.size() < length)
    {
        return error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for encoded length",
            source,
            "need=" + std::to_string(length) + " have=" + std::to_string(buffer.size()));
    }

    write(value, length, buffer);
    return ok(length);
}

auto varint::encode(uint64_t value) -> Result<std::vector<uint8_t>>
{
    std::vector<uint8_t> bytes(encoded_length(value));
    auto written = encode(value, bytes);
    if (written.is_err())
    {
        return forward_error<std::vector<uint8_t>>(written, source);
    }
    return ok(std::move(bytes));
}

auto varint::encode_with_length(uint64_t value, size_t length, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    if (length != 1 && length != 2 && length != 4 && length != 8)
    {
        return error<size_t>(
            error_codes::common_errors::invalid_argument,
            "Invalid length",
            source,
            "length must be 1, 2, 4, or 8");
    }

    if (value > max_for_length(length))
    {
        return error<size_t>(
            error_codes::codec::value_out_of_range,
            "Value does not fit the requested length",
            source,
            "length=" + std::to_string(length));
    }

    if (buffer.size() < length)
    {
        return error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for encoded length",
            source,
            "need=" + std::to_string(length) + " have=" + std::to_string(buffer.size()));
    }

    write(value, length, buffer);
    return ok(length);
}

auto varint::decode(std::span<const uint8_t> data)
    -> Result<std::pair<uint64_t, size_t>>
{
    if (data.empty())
    {
        return error<std::pair<uint64_t, size_t>>(
            error_codes::codec::buffer_too_small,
            "Empty buffer",
            source,
            "Cannot decode from empty buffer");
    }

    const uint8_t first_byte = data[0];
    const size_t length = length_from_prefix(first_byte);

    if (data.size() < length)
    {
        return error<std::pair<uint64_t, size_t>>(
            error_codes::codec::buffer_too_small,
            "Insufficient data",
            source,
            "Buffer too small for encoded length");
    }

    uint64_t value = first_byte & value_mask;

    for (size_t i = 1; i < length; ++i)
    {
        value = (value << 8) | data[i];
    }

    return ok(std::make_pair(value, length));
}

} // namespace quicwire::protocols::quic
