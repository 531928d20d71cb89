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

#include "internal/protocols/quic/header.h"
#include "quicwire/protocols/quic/varint.h"

#include <algorithm>

namespace quicwire::protocols::quic
{

namespace
{
    constexpr const char* source = "quic::header";

    template<typename T>
    auto make_error(int code, const std::string& message,
                    const std::string& details = "") -> Result<T>
    {
        return error<T>(code, message, source, details);
    }

    // Header form bits
    constexpr uint8_t header_form_long = 0x80;
    constexpr uint8_t fixed_bit = 0x40;

    // Long header type bits
    constexpr uint8_t long_packet_type_shift = 4;

    // Short header bits
    constexpr uint8_t spin_bit_mask = 0x20;
    constexpr uint8_t key_phase_mask = 0x04;
    constexpr uint8_t pn_length_mask = 0x03;

    constexpr size_t retry_tag_length = 16;

    auto read_u32(std::span<const uint8_t> data) noexcept -> uint32_t
    {
        return (static_cast<uint32_t>(data[0]) << 24) |
               (static_cast<uint32_t>(data[1]) << 16) |
               (static_cast<uint32_t>(data[2]) << 8) |
               static_cast<uint32_t>(data[3]);
    }

    auto write_u32(std::span<uint8_t> buffer, size_t& offset, uint32_t value) noexcept -> void
    {
        buffer[offset++] = static_cast<uint8_t>(value >> 24);
        buffer[offset++] = static_cast<uint8_t>(value >> 16);
        buffer[offset++] = static_cast<uint8_t>(value >> 8);
        buffer[offset++] = static_cast<uint8_t>(value);
    }

    auto write_bytes(std::span<uint8_t> buffer, size_t& offset,
                     std::span<const uint8_t> bytes) noexcept -> void
    {
        std::copy(bytes.begin(), bytes.end(), buffer.begin() + static_cast<ptrdiff_t>(offset));
        offset += bytes.size();
    }

    // Length byte followed by the connection ID
    auto write_cid(std::span<uint8_t> buffer, size_t& offset,
                   const connection_id& cid) noexcept -> void
    {
        buffer[offset++] = static_cast<uint8_t>(cid.length());
        write_bytes(buffer, offset, cid.data());
    }

    auto write_varint(std::span<uint8_t> buffer, size_t& offset, uint64_t value) -> VoidResult
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

    auto write_packet_number(std::span<uint8_t> buffer, size_t& offset,
                             uint64_t pn, size_t pn_length) noexcept -> void
    {
        for (size_t i = 0; i < pn_length; ++i)
        {
            buffer[offset + pn_length - 1 - i] = static_cast<uint8_t>(pn >> (i * 8));
        }
        offset += pn_length;
    }

    auto packet_number_fits(uint64_t pn, size_t pn_length) noexcept -> bool
    {
        return pn_length >= 1 && pn_length <= 4 && (pn >> (pn_length * 8)) == 0;
    }

    auto cid_field_size(const connection_id& cid) noexcept -> size_t
    {
        return 1 + cid.length();
    }

    auto header_size(const short_header& h) noexcept -> size_t
    {
        return 1 + h.dest_conn_id.length() + h.packet_number_length;
    }

    auto header_size(const long_header& h) noexcept -> size_t
    {
        size_t size = 1 + 4 + cid_field_size(h.dest_conn_id) + cid_field_size(h.src_conn_id);
        if (h.type == packet_type::initial)
        {
            size += varint::encoded_length(h.token.size()) + h.token.size();
        }
        size += varint::encoded_length(h.length);
        size += h.packet_number_length;
        return size;
    }

    auto header_size(const version_negotiation_header& h) noexcept -> size_t
    {
        return 1 + 4 + cid_field_size(h.dest_conn_id) + cid_field_size(h.src_conn_id) +
               4 * h.supported_versions.size();
    }

    auto header_size(const retry_header& h) noexcept -> size_t
    {
        return 1 + 4 + cid_field_size(h.dest_conn_id) + cid_field_size(h.src_conn_id) +
               h.token.size() + retry_tag_length;
    }

    /*!
     * \brief Fields shared by every long header form
     */
    struct long_prefix
    {
        uint8_t first_byte{0};
        uint32_t version{0};
        connection_id dest_conn_id;
        connection_id src_conn_id;
        size_t length{0};
    };

    auto read_cid(std::span<const uint8_t> data, size_t& offset, const char* name)
        -> Result<connection_id>
    {
        if (data.size() < offset + 1)
        {
            return make_error<connection_id>(
                error_codes::codec::buffer_too_small,
                std::string("Insufficient data for ") + name + " length");
        }
        const size_t cid_len = data[offset++];
        if (cid_len > connection_id::max_length)
        {
            return make_error<connection_id>(
                error_codes::codec::malformed_field,
                std::string(name) + " length exceeds maximum",
                "length=" + std::to_string(cid_len));
        }
        if (data.size() < offset + cid_len)
        {
            return make_error<connection_id>(
                error_codes::codec::buffer_too_small,
                std::string("Insufficient data for ") + name);
        }
        connection_id cid(data.subspan(offset, cid_len));
        offset += cid_len;
        return ok(std::move(cid));
    }

    auto parse_long_prefix(std::span<const uint8_t> data) -> Result<long_prefix>
    {
        // First byte + version
        if (data.size() < 5)
        {
            return make_error<long_prefix>(
                error_codes::codec::buffer_too_small,
                "Insufficient data for long header");
        }

        long_prefix prefix;
        size_t offset = 0;
        prefix.first_byte = data[offset++];

        if ((prefix.first_byte & header_form_long) == 0)
        {
            return make_error<long_prefix>(
                error_codes::codec::invalid_prefix,
                "Not a long header packet");
        }

        prefix.version = read_u32(data.subspan(offset));
        offset += 4;

        auto dcid = read_cid(data, offset, "DCID");
        if (dcid.is_err())
        {
            return forward_error<long_prefix>(dcid, source);
        }
        prefix.dest_conn_id = std::move(dcid.value());

        auto scid = read_cid(data, offset, "SCID");
        if (scid.is_err())
        {
            return forward_error<long_prefix>(scid, source);
        }
        prefix.src_conn_id = std::move(scid.value());

        prefix.length = offset;
        return ok(std::move(prefix));
    }
} // namespace

// ============================================================================
// header_types.h implementations
// ============================================================================

auto packet_type_to_string(packet_type type) -> std::string
{
    switch (type)
    {
        case packet_type::initial: return "Initial";
        case packet_type::zero_rtt: return "0-RTT";
        case packet_type::handshake: return "Handshake";
        case packet_type::retry: return "Retry";
        case packet_type::version_negotiation: return "VersionNegotiation";
        case packet_type::one_rtt: return "1-RTT";
        default: return "Unknown";
    }
}

auto get_packet_type(const packet_header& header) -> packet_type
{
    return std::visit([](const auto& h) -> packet_type {
        using T = std::decay_t<decltype(h)>;
        if constexpr (std::is_same_v<T, short_header>)
            return packet_type::one_rtt;
        else if constexpr (std::is_same_v<T, long_header>)
            return h.type;
        else if constexpr (std::is_same_v<T, version_negotiation_header>)
            return packet_type::version_negotiation;
        else
            return packet_type::retry;
    }, header);
}

auto is_long_header(const packet_header& header) noexcept -> bool
{
    return !std::holds_alternative<short_header>(header);
}

// ============================================================================
// packet_number
// ============================================================================

auto packet_number::encoded_length(uint64_t full_pn, uint64_t largest_acked) noexcept -> size_t
{
    // Twice the distance to the largest acknowledged packet must be representable
    uint64_t num_unacked = (full_pn > largest_acked) ? (full_pn - largest_acked) : 1;

    if (num_unacked < (1ULL << 7))
    {
        return 1;
    }
    if (num_unacked < (1ULL << 15))
    {
        return 2;
    }
    if (num_unacked < (1ULL << 23))
    {
        return 3;
    }
    return 4;
}

auto packet_number::truncate(uint64_t full_pn, size_t pn_length) noexcept -> uint64_t
{
    if (pn_length >= 8)
    {
        return full_pn;
    }
    return full_pn & ((1ULL << (pn_length * 8)) - 1);
}

auto packet_number::decode(uint64_t truncated_pn, size_t pn_length,
                           uint64_t largest_pn) noexcept -> uint64_t
{
    if (pn_length == 0 || pn_length > 4)
    {
        return truncated_pn;
    }

    // RFC 9000 Appendix A.3
    uint64_t expected_pn = largest_pn + 1;
    uint64_t pn_win = 1ULL << (pn_length * 8);
    uint64_t pn_hwin = pn_win / 2;
    uint64_t pn_mask = pn_win - 1;

    uint64_t candidate_pn = (expected_pn & ~pn_mask) | truncated_pn;

    if (expected_pn >= pn_hwin && candidate_pn <= expected_pn - pn_hwin &&
        candidate_pn < (1ULL << 62) - pn_win)
    {
        return candidate_pn + pn_win;
    }
    if (candidate_pn > expected_pn + pn_hwin && candidate_pn >= pn_win)
    {
        return candidate_pn - pn_win;
    }
    return candidate_pn;
}

// ============================================================================
// header_parser
// ============================================================================

auto header_parser::is_version_negotiation(std::span<const uint8_t> data) noexcept -> bool
{
    if (data.size() < 5)
    {
        return false;
    }
    if (!is_long_header(data[0]))
    {
        return false;
    }
    return read_u32(data.subspan(1)) == quic_version::negotiation;
}

auto header_parser::parse(std::span<const uint8_t> data, size_t short_dcid_length)
    -> Result<std::pair<packet_header, size_t>>
{
    if (data.empty())
    {
        return make_error<std::pair<packet_header, size_t>>(
            error_codes::codec::buffer_too_small,
            "Empty packet data");
    }

    if (!is_long_header(data[0]))
    {
        auto result = parse_short(data, short_dcid_length);
        if (result.is_err())
        {
            return forward_error<std::pair<packet_header, size_t>>(result, source);
        }
        auto& [header, len] = result.value();
        return ok(std::make_pair(packet_header{std::move(header)}, len));
    }

    if (data.size() < 5)
    {
        return make_error<std::pair<packet_header, size_t>>(
            error_codes::codec::buffer_too_small,
            "Insufficient data for long header");
    }

    // Version Negotiation ignores every bit but the header form
    if (is_version_negotiation(data))
    {
        auto result = parse_version_negotiation(data);
        if (result.is_err())
        {
            return forward_error<std::pair<packet_header, size_t>>(result, source);
        }
        auto& [header, len] = result.value();
        return ok(std::make_pair(packet_header{std::move(header)}, len));
    }

    if (!has_valid_fixed_bit(data[0]))
    {
        return make_error<std::pair<packet_header, size_t>>(
            error_codes::codec::invalid_prefix,
            "Invalid fixed bit in long header");
    }

    if (get_long_packet_type(data[0]) == packet_type::retry)
    {
        auto result = parse_retry(data);
        if (result.is_err())
        {
            return forward_error<std::pair<packet_header, size_t>>(result, source);
        }
        auto& [header, len] = result.value();
        return ok(std::make_pair(packet_header{std::move(header)}, len));
    }

    auto result = parse_long(data);
    if (result.is_err())
    {
        return forward_error<std::pair<packet_header, size_t>>(result, source);
    }
    auto& [header, len] = result.value();
    return ok(std::make_pair(packet_header{std::move(header)}, len));
}

auto header_parser::parse_long(std::span<const uint8_t> data)
    -> Result<std::pair<long_header, size_t>>
{
    auto prefix_result = parse_long_prefix(data);
    if (prefix_result.is_err())
    {
        return forward_error<std::pair<long_header, size_t>>(prefix_result, source);
    }
    auto& prefix = prefix_result.value();

    if (!has_valid_fixed_bit(prefix.first_byte))
    {
        return make_error<std::pair<long_header, size_t>>(
            error_codes::codec::invalid_prefix,
            "Invalid fixed bit in long header");
    }
    if (prefix.version == quic_version::negotiation)
    {
        return make_error<std::pair<long_header, size_t>>(
            error_codes::codec::malformed_field,
            "Version Negotiation packet is not a long header packet");
    }

    long_header header;
    header.type = get_long_packet_type(prefix.first_byte);
    if (header.type == packet_type::retry)
    {
        return make_error<std::pair<long_header, size_t>>(
            error_codes::codec::malformed_field,
            "Retry packet is not a long header packet");
    }
    header.version = prefix.version;
    header.dest_conn_id = std::move(prefix.dest_conn_id);
    header.src_conn_id = std::move(prefix.src_conn_id);
    header.packet_number_length = static_cast<size_t>(prefix.first_byte & pn_length_mask) + 1;

    size_t offset = prefix.length;

    if (header.type == packet_type::initial)
    {
        // Token Length (varint) + Token
        auto token_len = varint::decode(data.subspan(offset));
        if (token_len.is_err())
        {
            return make_error<std::pair<long_header, size_t>>(
                token_len.error().code, "Failed to parse token length");
        }
        offset += token_len.value().second;

        if (data.size() - offset < token_len.value().first)
        {
            return make_error<std::pair<long_header, size_t>>(
                error_codes::codec::buffer_too_small,
                "Insufficient data for token");
        }
        const auto token_size = static_cast<size_t>(token_len.value().first);
        header.token.assign(data.begin() + static_cast<ptrdiff_t>(offset),
                            data.begin() + static_cast<ptrdiff_t>(offset + token_size));
        offset += token_size;
    }

    // Length (varint)
    auto length = varint::decode(data.subspan(offset));
    if (length.is_err())
    {
        return make_error<std::pair<long_header, size_t>>(
            length.error().code, "Failed to parse length field");
    }
    header.length = length.value().first;
    offset += length.value().second;

    if (header.length < header.packet_number_length)
    {
        return make_error<std::pair<long_header, size_t>>(
            error_codes::codec::malformed_field,
            "Length field shorter than packet number",
            "length=" + std::to_string(header.length));
    }

    // Packet Number
    if (data.size() - offset < header.packet_number_length)
    {
        return make_error<std::pair<long_header, size_t>>(
            error_codes::codec::buffer_too_small,
            "Insufficient data for packet number");
    }
    for (size_t i = 0; i < header.packet_number_length; ++i)
    {
        header.packet_number = (header.packet_number << 8) | data[offset++];
    }

    return ok(std::make_pair(std::move(header), offset));
}

auto header_parser::parse_short(std::span<const uint8_t> data, size_t conn_id_length)
    -> Result<std::pair<short_header, size_t>>
{
    if (conn_id_length > connection_id::max_length)
    {
        return make_error<std::pair<short_header, size_t>>(
            error_codes::common_errors::invalid_argument,
            "Connection ID length exceeds maximum",
            "length=" + std::to_string(conn_id_length));
    }
    if (data.empty())
    {
        return make_error<std::pair<short_header, size_t>>(
            error_codes::codec::buffer_too_small,
            "Empty packet data");
    }

    const uint8_t first_byte = data[0];
    if (is_long_header(first_byte))
    {
        return make_error<std::pair<short_header, size_t>>(
            error_codes::codec::invalid_prefix,
            "Not a short header packet");
    }
    if (!has_valid_fixed_bit(first_byte))
    {
        return make_error<std::pair<short_header, size_t>>(
            error_codes::codec::invalid_prefix,
            "Invalid fixed bit in short header");
    }

    short_header header;
    header.spin_bit = (first_byte & spin_bit_mask) != 0;
    header.key_phase = (first_byte & key_phase_mask) != 0;
    header.packet_number_length = static_cast<size_t>(first_byte & pn_length_mask) + 1;

    const size_t total = 1 + conn_id_length + header.packet_number_length;
    if (data.size() < total)
    {
        return make_error<std::pair<short_header, size_t>>(
            error_codes::codec::buffer_too_small,
            "Insufficient data for short header",
            "need=" + std::to_string(total) + " have=" + std::to_string(data.size()));
    }

    size_t offset = 1;
    header.dest_conn_id = connection_id(data.subspan(offset, conn_id_length));
    offset += conn_id_length;

    for (size_t i = 0; i < header.packet_number_length; ++i)
    {
        header.packet_number = (header.packet_number << 8) | data[offset++];
    }

    return ok(std::make_pair(std::move(header), offset));
}

auto header_parser::parse_version_negotiation(std::span<const uint8_t> data)
    -> Result<std::pair<version_negotiation_header, size_t>>
{
    auto prefix_result = parse_long_prefix(data);
    if (prefix_result.is_err())
    {
        return forward_error<std::pair<version_negotiation_header, size_t>>(
            prefix_result, source);
    }
    auto& prefix = prefix_result.value();

    if (prefix.version != quic_version::negotiation)
    {
        return make_error<std::pair<version_negotiation_header, size_t>>(
            error_codes::codec::malformed_field,
            "Version Negotiation packet must carry version 0");
    }

    const size_t remaining = data.size() - prefix.length;
    if (remaining == 0 || remaining % 4 != 0)
    {
        return make_error<std::pair<version_negotiation_header, size_t>>(
            error_codes::codec::malformed_field,
            "Supported version list is not a non-empty multiple of 4 bytes",
            "bytes=" + std::to_string(remaining));
    }

    version_negotiation_header header;
    header.dest_conn_id = std::move(prefix.dest_conn_id);
    header.src_conn_id = std::move(prefix.src_conn_id);
    header.supported_versions.reserve(remaining / 4);
    for (size_t offset = prefix.length; offset < data.size(); offset += 4)
    {
        header.supported_versions.push_back(read_u32(data.subspan(offset)));
    }

    return ok(std::make_pair(std::move(header), data.size()));
}

auto header_parser::parse_retry(std::span<const uint8_t> data)
    -> Result<std::pair<retry_header, size_t>>
{
    auto prefix_result = parse_long_prefix(data);
    if (prefix_result.is_err())
    {
        return forward_error<std::pair<retry_header, size_t>>(prefix_result, source);
    }
    auto& prefix = prefix_result.value();

    if (!has_valid_fixed_bit(prefix.first_byte))
    {
        return make_error<std::pair<retry_header, size_t>>(
            error_codes::codec::invalid_prefix,
            "Invalid fixed bit in Retry packet");
    }
    if (get_long_packet_type(prefix.first_byte) != packet_type::retry)
    {
        return make_error<std::pair<retry_header, size_t>>(
            error_codes::codec::malformed_field,
            "Not a Retry packet");
    }

    const size_t remaining = data.size() - prefix.length;
    if (remaining < retry_tag_length)
    {
        return make_error<std::pair<retry_header, size_t>>(
            error_codes::codec::buffer_too_small,
            "Insufficient data for Retry integrity tag");
    }

    retry_header header;
    header.version = prefix.version;
    header.dest_conn_id = std::move(prefix.dest_conn_id);
    header.src_conn_id = std::move(prefix.src_conn_id);

    const size_t tag_offset = data.size() - retry_tag_length;
    header.token.assign(data.begin() + static_cast<ptrdiff_t>(prefix.length),
                        data.begin() + static_cast<ptrdiff_t>(tag_offset));
    std::copy(data.begin() + static_cast<ptrdiff_t>(tag_offset), data.end(),
              header.integrity_tag.begin());

    return ok(std::make_pair(std::move(header), data.size()));
}

// ============================================================================
// header_builder
// ============================================================================

auto header_builder::encoded_size(const packet_header& header) noexcept -> size_t
{
    return std::visit([](const auto& h) -> size_t { return header_size(h); }, header);
}

auto header_builder::serialize(const packet_header& header, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    return std::visit([buffer](const auto& h) -> Result<size_t> {
        using T = std::decay_t<decltype(h)>;
        if constexpr (std::is_same_v<T, short_header>)
            return serialize_short(h, buffer);
        else if constexpr (std::is_same_v<T, long_header>)
            return serialize_long(h, buffer);
        else if constexpr (std::is_same_v<T, version_negotiation_header>)
            return serialize_version_negotiation(h, buffer);
        else
            return serialize_retry(h, buffer);
    }, header);
}

auto header_builder::build(const packet_header& header) -> Result<std::vector<uint8_t>>
{
    std::vector<uint8_t> buffer(encoded_size(header));
    auto written = serialize(header, buffer);
    if (written.is_err())
    {
        return forward_error<std::vector<uint8_t>>(written, source);
    }
    buffer.resize(written.value());
    return ok(std::move(buffer));
}

auto header_builder::serialize_short(const short_header& h, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    if (!packet_number_fits(h.packet_number, h.packet_number_length))
    {
        return make_error<size_t>(
            error_codes::codec::value_out_of_range,
            "Packet number does not fit its length",
            "pn_length=" + std::to_string(h.packet_number_length));
    }

    const size_t needed = header_size(h);
    if (buffer.size() < needed)
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for short header",
            "need=" + std::to_string(needed) + " have=" + std::to_string(buffer.size()));
    }

    size_t offset = 0;

    // First byte: Short header (0) + Fixed bit (1) + Spin + Reserved (00) + Key phase + PN Length
    uint8_t first_byte = fixed_bit | static_cast<uint8_t>(h.packet_number_length - 1);
    if (h.spin_bit) first_byte |= spin_bit_mask;
    if (h.key_phase) first_byte |= key_phase_mask;
    buffer[offset++] = first_byte;

    write_bytes(buffer, offset, h.dest_conn_id.data());
    write_packet_number(buffer, offset, h.packet_number, h.packet_number_length);

    return ok(offset);
}

auto header_builder::serialize_long(const long_header& h, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    if (h.type != packet_type::initial && h.type != packet_type::zero_rtt &&
        h.type != packet_type::handshake)
    {
        return make_error<size_t>(
            error_codes::codec::malformed_field,
            "Long header type must be Initial, 0-RTT or Handshake",
            packet_type_to_string(h.type));
    }
    if (h.type != packet_type::initial && !h.token.empty())
    {
        return make_error<size_t>(
            error_codes::codec::malformed_field,
            "Token is only allowed on Initial packets",
            packet_type_to_string(h.type));
    }
    if (h.version == quic_version::negotiation)
    {
        return make_error<size_t>(
            error_codes::codec::malformed_field,
            "Long header cannot carry the Version Negotiation version");
    }
    if (!varint::is_valid(h.length))
    {
        return make_error<size_t>(
            error_codes::codec::value_out_of_range,
            "Length field exceeds 2^62 - 1");
    }
    if (!packet_number_fits(h.packet_number, h.packet_number_length))
    {
        return make_error<size_t>(
            error_codes::codec::value_out_of_range,
            "Packet number does not fit its length",
            "pn_length=" + std::to_string(h.packet_number_length));
    }

    const size_t needed = header_size(h);
    if (buffer.size() < needed)
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for long header",
            "need=" + std::to_string(needed) + " have=" + std::to_string(buffer.size()));
    }

    size_t offset = 0;

    // First byte: Long header (1) + Fixed bit (1) + Type + Reserved (00) + PN Length
    buffer[offset++] = header_form_long | fixed_bit |
                       static_cast<uint8_t>(static_cast<uint8_t>(h.type) << long_packet_type_shift) |
                       static_cast<uint8_t>(h.packet_number_length - 1);

    write_u32(buffer, offset, h.version);
    write_cid(buffer, offset, h.dest_conn_id);
    write_cid(buffer, offset, h.src_conn_id);

    if (h.type == packet_type::initial)
    {
        auto token_len = write_varint(buffer, offset, h.token.size());
        if (token_len.is_err())
        {
            return make_error<size_t>(token_len.error().code, token_len.error().message);
        }
        write_bytes(buffer, offset, h.token);
    }

    auto length = write_varint(buffer, offset, h.length);
    if (length.is_err())
    {
        return make_error<size_t>(length.error().code, length.error().message);
    }

    write_packet_number(buffer, offset, h.packet_number, h.packet_number_length);

    return ok(offset);
}

auto header_builder::serialize_version_negotiation(const version_negotiation_header& h,
                                                   std::span<uint8_t> buffer)
    -> Result<size_t>
{
    if (h.supported_versions.empty())
    {
        return make_error<size_t>(
            error_codes::codec::malformed_field,
            "Version Negotiation packet needs at least one version");
    }

    const size_t needed = header_size(h);
    if (buffer.size() < needed)
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for Version Negotiation packet",
            "need=" + std::to_string(needed) + " have=" + std::to_string(buffer.size()));
    }

    size_t offset = 0;

    // Only the header form bit is meaningful; the fixed bit is set for middleboxes
    buffer[offset++] = header_form_long | fixed_bit;
    write_u32(buffer, offset, quic_version::negotiation);
    write_cid(buffer, offset, h.dest_conn_id);
    write_cid(buffer, offset, h.src_conn_id);

    for (uint32_t version : h.supported_versions)
    {
        write_u32(buffer, offset, version);
    }

    return ok(offset);
}

auto header_builder::serialize_retry(const retry_header& h, std::span<uint8_t> buffer)
    -> Result<size_t>
{
    if (h.version == quic_version::negotiation)
    {
        return make_error<size_t>(
            error_codes::codec::malformed_field,
            "Retry packet cannot carry the Version Negotiation version");
    }

    const size_t needed = header_size(h);
    if (buffer.size() < needed)
    {
        return make_error<size_t>(
            error_codes::codec::buffer_too_small,
            "Buffer too small for Retry packet",
            "need=" + std::to_string(needed) + " have=" + std::to_string(buffer.size()));
    }

    size_t offset = 0;

    // First byte: Long header (1) + Fixed bit (1) + Type (11) + Unused (0000)
    buffer[offset++] = header_form_long | fixed_bit |
                       static_cast<uint8_t>(static_cast<uint8_t>(packet_type::retry)
                                            << long_packet_type_shift);

    write_u32(buffer, offset, h.version);
    write_cid(buffer, offset, h.dest_conn_id);
    write_cid(buffer, offset, h.src_conn_id);
    write_bytes(buffer, offset, h.token);
    write_bytes(buffer, offset, h.integrity_tag);

    return ok(offset);
}

} // namespace quicwire::protocols::quic
