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

#include "internal/protocols/quic/frame.h"
#include "quicwire/protocols/quic/varint.h"

#include <algorithm>

namespace quicwire::protocols::quic
{

namespace
{
    constexpr const char* source = "quic::frame";

    // Error helper
    template<typename T>
    auto make_error(int code, const std::string& message,
                    const std::string& details = "") -> Result<T>
    {
        return error<T>(code, message, source, details);
    }

    using parse_result = Result<std::pair<frame, size_t>>;
} // namespace

// ============================================================================
// frame_types.h implementations
// ============================================================================

auto get_frame_type(const frame& f) -> frame_type
{
    return std::visit([](const auto& fr) -> frame_type {
        using T = std::decay_t<decltype(fr)>;
        if constexpr (std::is_same_v<T, padding_frame>)
            return frame_type::padding;
        else if constexpr (std::is_same_v<T, ping_frame>)
            return frame_type::ping;
        else if constexpr (std::is_same_v<T, ack_frame>)
            return frame_type::ack;
        else if constexpr (std::is_same_v<T, stream_frame>)
            return frame_type::stream_base;
        else
            return fr.type;
    }, f);
}

auto frame_type_to_string(frame_type type) -> std::string
{
    switch (type)
    {
        case frame_type::padding: return "PADDING";
        case frame_type::ping: return "PING";
        case frame_type::ack: return "ACK";
        case frame_type::ack_ecn: return "ACK_ECN";
        case frame_type::reset_stream: return "RESET_STREAM";
        case frame_type::stop_sending: return "STOP_SENDING";
        case frame_type::crypto: return "CRYPTO";
        case frame_type::new_token: return "NEW_TOKEN";
        case frame_type::stream_base: return "STREAM";
        case frame_type::max_data: return "MAX_DATA";
        case frame_type::max_stream_data: return "MAX_STREAM_DATA";
        case frame_type::max_streams_bidi: return "MAX_STREAMS_BIDI";
        case frame_type::max_streams_uni: return "MAX_STREAMS_UNI";
        case frame_type::data_blocked: return "DATA_BLOCKED";
        case frame_type::stream_data_blocked: return "STREAM_DATA_BLOCKED";
        case frame_type::streams_blocked_bidi: return "STREAMS_BLOCKED_BIDI";
        case frame_type::streams_blocked_uni: return "STREAMS_BLOCKED_UNI";
        case frame_type::new_connection_id: return "NEW_CONNECTION_ID";
        case frame_type::retire_connection_id: return "RETIRE_CONNECTION_ID";
        case frame_type::path_challenge: return "PATH_CHALLENGE";
        case frame_type::path_response: return "PATH_RESPONSE";
        case frame_type::connection_close: return "CONNECTION_CLOSE";
        case frame_type::connection_close_app: return "CONNECTION_CLOSE_APP";
        case frame_type::handshake_done: return "HANDSHAKE_DONE";
        default:
            if (is_stream_frame(static_cast<uint64_t>(type)))
            {
                return "STREAM";
            }
            return "UNKNOWN";
    }
}

// ============================================================================
// frame_parser implementations
// ============================================================================

auto frame_parser::peek_type(std::span<const uint8_t> data)
    -> Result<std::pair<uint64_t, size_t>>
{
    return varint::decode(data);
}

auto frame_parser::parse(std::span<const uint8_t> data) -> parse_result
{
    if (data.empty())
    {
        return make_error<std::pair<frame, size_t>>(
            error_codes::codec::buffer_too_small,
            "Empty frame data");
    }

    auto type_result = varint::decode(data);
    if (type_result.is_err())
    {
        return make_error<std::pair<frame, size_t>>(
            type_result.error().code,
            "Failed to decode frame type",
            type_result.error().message);
    }

    auto [type_value, type_len] = type_result.value();

    auto result = parse_payload(data.subspan(type_len), type_value, type_len);
    if (result.is_err()) return result;
    auto& [f, consumed] = result.value();
    return ok(std::make_pair(std::move(f), type_len + consumed));
}

auto frame_parser::parse_payload(std::span<const uint8_t> data, uint64_t type,
                                 size_t type_length) -> parse_result
{
    if (is_stream_frame(type))
    {
        return parse_stream(data, get_stream_flags(type));
    }

    if (!is_known_frame_type(type))
    {
        return make_error<std::pair<frame, size_t>>(
            error_codes::codec::unknown_discriminator,
            "Unknown frame type",
            "type=" + std::to_string(type));
    }

    switch (static_cast<frame_type>(type))
    {
        case frame_type::padding:
            return parse_padding(data, type_length);

        case frame_type::ping:
            // PING frame has no payload after type
            return ok(std::make_pair(frame{ping_frame{}}, size_t{0}));

        case frame_type::ack:
            return parse_ack(data);

        default:
            return make_error<std::pair<frame, size_t>>(
                error_codes::codec::not_implemented,
                "Frame type not implemented",
                frame_type_to_string(static_cast<frame_type>(type)));
    }
}

auto frame_parser::parse_all(std::span<const uint8_t> data)
    -> Result<std::vector<frame>>
{
    std::vector<frame> frames;
    size_t offset = 0;

    while (offset < data.size())
    {
        auto result = parse(data.subspan(offset));
        if (result.is_err())
        {
            return make_error<std::vector<frame>>(
                result.error().code,
                "Failed to parse frame at offset " + std::to_string(offset),
                result.error().message);
        }

        auto& [f, consumed] = result.value();
        frames.push_back(std::move(f));
        offset += consumed;
    }

    return ok(std::move(frames));
}

auto frame_parser::parse_padding(std::span<const uint8_t> data, size_t type_length)
    -> parse_result
{
    // The type bytes are padding too; absorb the run of zeros that follows
    size_t run = 0;
    while (run < data.size() && data[run] == 0x00)
    {
        ++run;
    }

    padding_frame f;
    f.count = type_length + run;
    return ok(std::make_pair(frame{f}, run));
}

auto frame_parser::parse_ack(std::span<const uint8_t> data) -> parse_result
{
    size_t offset = 0;
    ack_frame f;

    // Largest Acknowledged
    auto largest = varint::decode(data.subspan(offset));
    if (largest.is_err()) return make_error<std::pair<frame, size_t>>(
        largest.error().code, "Failed to parse largest acknowledged");
    f.largest_acknowledged = largest.value().first;
    offset += largest.value().second;

    // ACK Delay
    auto delay = varint::decode(data.subspan(offset));
    if (delay.is_err()) return make_error<std::pair<frame, size_t>>(
        delay.error().code, "Failed to parse ack delay");
    f.ack_delay = delay.value().first;
    offset += delay.value().second;

    // ACK Range Count
    auto range_count = varint::decode(data.subspan(offset));
    if (range_count.is_err()) return make_error<std::pair<frame, size_t>>(
        range_count.error().code, "Failed to parse ack range count");
    offset += range_count.value().second;

    // First ACK Range
    auto first_range = varint::decode(data.subspan(offset));
    if (first_range.is_err()) return make_error<std::pair<frame, size_t>>(
        first_range.error().code, "Failed to parse first ack range");
    f.first_ack_range = first_range.value().first;
    offset += first_range.value().second;

    if (f.first_ack_range > f.largest_acknowledged)
    {
        return make_error<std::pair<frame, size_t>>(
            error_codes::codec::malformed_field,
            "First ack range exceeds largest acknowledged");
    }

    // Each range must stay above packet number zero
    uint64_t smallest = f.largest_acknowledged - f.first_ack_range;

    for (uint64_t i = 0; i < range_count.value().first; ++i)
    {
        ack_range range;

        auto gap = varint::decode(data.subspan(offset));
        if (gap.is_err()) return make_error<std::pair<frame, size_t>>(
            gap.error().code, "Failed to parse ack gap");
        range.gap = gap.value().first;
        offset += gap.value().second;

        auto length = varint::decode(data.subspan(offset));
        if (length.is_err()) return make_error<std::pair<frame, size_t>>(
            length.error().code, "Failed to parse ack range length");
        range.length = length.value().first;
        offset += length.value().second;

        if (range.gap + 2 > smallest)
        {
            return make_error<std::pair<frame, size_t>>(
                error_codes::codec::malformed_field,
                "Ack gap underflows packet number space",
                "range=" + std::to_string(i));
        }
        const uint64_t range_largest = smallest - range.gap - 2;
        if (range.length > range_largest)
        {
            return make_error<std::pair<frame, size_t>>(
                error_codes::codec::malformed_field,
                "Ack range length underflows packet number space",
                "range=" + std::to_string(i));
        }
        smallest = range_largest - range.length;

        f.ranges.push_back(range);
    }

    return ok(std::make_pair(frame{std::move(f)}, offset));
}

auto frame_parser::parse_stream(std::span<const uint8_t> data, uint8_t flags)
    -> parse_result
{
    size_t offset = 0;
    stream_frame f;

    auto stream_id = varint::decode(data.subspan(offset));
    if (stream_id.is_err()) return make_error<std::pair<frame, size_t>>(
        stream_id.error().code, "Failed to parse stream id");
    f.stream_id = stream_id.value().first;
    offset += stream_id.value().second;

    if ((flags & stream_flags::off) != 0)
    {
        auto stream_offset = varint::decode(data.subspan(offset));
        if (stream_offset.is_err()) return make_error<std::pair<frame, size_t>>(
            stream_offset.error().code, "Failed to parse stream offset");
        f.offset = stream_offset.value().first;
        offset += stream_offset.value().second;
    }

    uint64_t length = 0;
    if ((flags & stream_flags::len) != 0)
    {
        auto length_result = varint::decode(data.subspan(offset));
        if (length_result.is_err()) return make_error<std::pair<frame, size_t>>(
            length_result.error().code, "Failed to parse stream length");
        length = length_result.value().first;
        offset += length_result.value().second;

        if (data.size() - offset < length)
        {
            return make_error<std::pair<frame, size_t>>(
                error_codes::codec::buffer_too_small,
                "Insufficient stream data",
                "length=" + std::to_string(length));
        }
    }
    else
    {
        // Without LEN the data runs to the end of the packet
        length = data.size() - offset;
    }

    if (f.offset > varint_max - length)
    {
        return make_error<std::pair<frame, size_t>>(
            error_codes::codec::malformed_field,
            "Stream offset plus length exceeds 2^62 - 1");
    }

    f.data.assign(data.begin() + static_cast<ptrdiff_t>(offset),
                  data.begin() + static_cast<ptrdiff_t>(offset + length));
    offset += length;
    f.fin = (flags & stream_flags::fin) != 0;

    return ok(std::make_pair(frame{std::move(f)}, offset));
}

// ============================================================================
// frame_builder implementations
// ============================================================================

auto frame_builder::append_varint(std::span<uint8_t> buffer, size_t& offset,
                                  uint64_t value) -> VoidResult
{
    auto written = varint::encode(value, buffer.subspan(offset));
    if (written.is_err())
    {
        return error_void(written.error().code, written.error().message, source,
                          error_details(written.error()));
    }
    offset += written.value();
    return ok();
}

auto frame_builder::ack_size(const ack_frame& f) noexcept -> size_t
{
    size_t size = 1;
    size += varint::encoded_length(f.largest_acknowledged);
    size += varint::encoded_length(f.ack_delay);
    size += varint::encoded_length(f.ranges.size());
    size += varint::encoded_length(f.first_ack_range);
    for (const auto& range : f.ranges)
    {
        size += varint::encoded_length(range.gap);
        size += varint::encoded_length(range.length);
    }
    return size;
}

auto frame_builder::stream_size(const stream_frame& f) noexcept -> size_t
{
    size_t size = 1;
    size += varint::encoded_length(f.stream_id);
    if (f.offset > 0)
    {
        size += varint::encoded_length(f.offset);
    }
    size += varint::encoded_length(f.data.size());
    size += f.data.size();
    return size;
}

auto frame_builder::encoded_size(const frame& f) noexcept -> size_t
{
    return std::visit([](const auto& fr) -> size_t {
        using T = std::decay_t<decltype(fr)>;
        if constexpr (std::is_same_v<T, padding_frame>)
            return fr.count;
        else if constexpr (std::is_same_v<T, ping_frame>)
            return 1;
        else if constexpr (std::is_same_v<T, ack_frame>)
            return ack_size(fr);
        else if constexpr (std::is_same_v<T, stream_frame>)
            return stream_size(fr);
        else
            return 0;
    }, f);
}

auto frame_builder::serialize(const frame& f, std::span<uint8_t> buffer) -> Result<size_t>
{
    return std::visit([buffer](const auto& fr) -> Result<size_t> {
        using T = std::decay_t<decltype(fr)>;
        if constexpr (std::is_same_v<T, padding_frame>)
            return serialize_padding(fr, buffer);
        else if constexpr (std::is_same_v<T, ping_frame>)
            return serialize_ping(buffer);
        else if constexpr (std::is_same_v<T, ack_frame>)
            return serialize_ack(fr, buffer);
        else if constexpr (std::is_same_v<T, stream_frame>)
            return serialize_stream(fr, buffer);
        else
            return make_error<size_t>(
                error_codes::codec::not_implemented,
                "Frame type not implemented",
                frame_type_to_string(fr.type));
    }, f);
}

auto frame_builder::build(const frame& f) -> Result<std::vector<uint8_t>>
{
    std::vector<uint8_t> buffer(encoded_size(f));
    auto written = serialize(f, buffer);
    if (written.is_err())
    {
        return forward_error<std::vector<uint8_t>>(written, source);
    }
    buffer.resize(written.value());
    return ok(std::move(buffer));
}

auto frame_builder::serialize_padding(const padding_frame& f, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    if (f.count == 0)
    {
        return make_error<size_t>(
            error_codes::codec::malformed_field,
            "Padding frame must cover at least one byte");
    }
    if (buffer.size() < f.count)
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for PADDING frame",
            "need=" + std::to_string(f.count));
    }

    std::fill_n(buffer.begin(), f.count, uint8_t{0x00});
    return ok(f.count);
}

auto frame_builder::serialize_ping(std::span<uint8_t> buffer) -> Result<size_t>
{
    if (buffer.empty())
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for PING frame");
    }

    buffer[0] = static_cast<uint8_t>(frame_type::ping);
    return ok(size_t{1});
}

auto frame_builder::serialize_ack(const ack_frame& f, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    bool in_range = varint::is_valid(f.largest_acknowledged) &&
                    varint::is_valid(f.ack_delay) &&
                    varint::is_valid(f.first_ack_range);
    for (const auto& range : f.ranges)
    {
        in_range = in_range && varint::is_valid(range.gap) && varint::is_valid(range.length);
    }
    if (!in_range)
    {
        return make_error<size_t>(
            error_codes::codec::value_out_of_range,
            "ACK field exceeds 2^62 - 1");
    }
    if (f.first_ack_range > f.largest_acknowledged)
    {
        return make_error<size_t>(
            error_codes::codec::malformed_field,
            "First ack range exceeds largest acknowledged");
    }

    const size_t needed = ack_size(f);
    if (buffer.size() < needed)
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for ACK frame",
            "need=" + std::to_string(needed));
    }

    size_t offset = 0;
    std::vector<uint64_t> fields;
    fields.reserve(5 + f.ranges.size() * 2);
    fields.push_back(static_cast<uint64_t>(frame_type::ack));
    fields.push_back(f.largest_acknowledged);
    fields.push_back(f.ack_delay);
    fields.push_back(f.ranges.size());
    fields.push_back(f.first_ack_range);
    for (const auto& range : f.ranges)
    {
        fields.push_back(range.gap);
        fields.push_back(range.length);
    }

    for (uint64_t value : fields)
    {
        auto appended = append_varint(buffer, offset, value);
        if (appended.is_err())
        {
            return make_error<size_t>(appended.error().code, appended.error().message);
        }
    }

    return ok(offset);
}

auto frame_builder::serialize_stream(const stream_frame& f, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    if (!varint::is_valid(f.stream_id) || !varint::is_valid(f.offset) ||
        f.offset > varint_max - f.data.size())
    {
        return make_error<size_t>(
            error_codes::codec::value_out_of_range,
            "STREAM field exceeds 2^62 - 1");
    }

    const size_t needed = stream_size(f);
    if (buffer.size() < needed)
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for STREAM frame",
            "need=" + std::to_string(needed));
    }

    size_t offset = 0;

    // Length is always explicit so the frame can be followed by others
    buffer[offset++] = make_stream_type(f.fin, true, f.offset > 0);

    auto id = append_varint(buffer, offset, f.stream_id);
    if (id.is_err()) return make_error<size_t>(id.error().code, id.error().message);

    if (f.offset > 0)
    {
        auto off = append_varint(buffer, offset, f.offset);
        if (off.is_err()) return make_error<size_t>(off.error().code, off.error().message);
    }

    auto len = append_varint(buffer, offset, f.data.size());
    if (len.is_err()) return make_error<size_t>(len.error().code, len.error().message);

    std::copy(f.data.begin(), f.data.end(), buffer.begin() + static_cast<ptrdiff_t>(offset));
    offset += f.data.size();

    return ok(offset);
}

} // namespace quicwire::protocols::quic
