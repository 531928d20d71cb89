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

#include "quicwire/protocols/quic/packet.h"
#include "internal/protocols/quic/frame.h"
#include "internal/protocols/quic/header.h"
#include "quicwire/protocols/quic/varint.h"

#include <type_traits>

namespace quicwire::protocols::quic
{

namespace
{
    constexpr const char* source = "quic::packet";

    // First growth step for frame storage
    constexpr size_t initial_growth = 4;
} // namespace

packet::packet(packet_header header, size_t initial_capacity)
    : header_(std::move(header))
{
    frames_.reserve(initial_capacity);
}

auto packet::create(packet_header header) -> packet
{
    return packet(std::move(header));
}

auto packet::create(packet_header header, const config::codec_config& config) -> Result<packet>
{
    auto valid = config.validate();
    if (valid.is_err())
    {
        return forward_error<packet>(valid, source);
    }

    std::visit([&config](auto& h) {
        using T = std::decay_t<decltype(h)>;
        if constexpr (std::is_same_v<T, short_header> || std::is_same_v<T, long_header>)
        {
            h.packet_number_length = config.packet_number_length;
        }
    }, header);

    return ok(packet(std::move(header), config.initial_frame_capacity));
}

auto packet::append(frame f) -> VoidResult
{
    if (released_)
    {
        return error_void(error_codes::codec::packet_released,
                          "Cannot append to a released packet", source);
    }

    if (frames_.size() == frames_.capacity())
    {
        const size_t current = frames_.capacity();
        frames_.reserve(current == 0 ? initial_growth : current * 2);
    }
    frames_.push_back(std::move(f));
    return ok();
}

auto packet::frames() const noexcept -> std::span<const frame>
{
    return frames_;
}

auto packet::frame_count() const noexcept -> size_t
{
    return frames_.size();
}

auto packet::capacity() const noexcept -> size_t
{
    return frames_.capacity();
}

auto packet::header() const noexcept -> const packet_header&
{
    return header_;
}

auto packet::header() noexcept -> packet_header&
{
    return header_;
}

auto packet::size() const noexcept -> size_t
{
    return header_builder::encoded_size(header_) + payload_size();
}

auto packet::payload_size() const noexcept -> size_t
{
    size_t total = 0;
    for (const auto& f : frames_)
    {
        total += frame_builder::encoded_size(f);
    }
    return total;
}

auto packet::serialize(std::span<uint8_t> buffer) const -> Result<size_t>
{
    if (released_)
    {
        return error<size_t>(error_codes::codec::packet_released,
                             "Cannot serialize a released packet", source);
    }

    auto header_written = header_builder::serialize(header_, buffer);
    if (header_written.is_err())
    {
        return forward_error<size_t>(header_written, source);
    }
    size_t offset = header_written.value();

    for (size_t i = 0; i < frames_.size(); ++i)
    {
        auto written = frame_builder::serialize(frames_[i], buffer.subspan(offset));
        if (written.is_err())
        {
            return error<size_t>(written.error().code,
                                 "Failed to serialize frame " + std::to_string(i),
                                 source, written.error().message);
        }
        offset += written.value();
    }

    return ok(offset);
}

auto packet::to_bytes() const -> Result<std::vector<uint8_t>>
{
    std::vector<uint8_t> bytes(size());
    auto written = serialize(bytes);
    if (written.is_err())
    {
        return forward_error<std::vector<uint8_t>>(written, source);
    }
    bytes.resize(written.value());
    return ok(std::move(bytes));
}

auto packet::update_length(size_t trailer) -> VoidResult
{
    auto* long_hdr = std::get_if<long_header>(&header_);
    if (long_hdr == nullptr)
    {
        return error_void(error_codes::common_errors::invalid_argument,
                          "Only Initial, 0-RTT and Handshake headers carry a Length field",
                          source, packet_type_to_string(get_packet_type(header_)));
    }

    const uint64_t length = long_hdr->packet_number_length + payload_size() + trailer;
    if (!varint::is_valid(length))
    {
        return error_void(error_codes::codec::value_out_of_range,
                          "Length field exceeds 2^62 - 1", source);
    }
    long_hdr->length = length;
    return ok();
}

auto packet::release() noexcept -> void
{
    if (released_)
    {
        return;
    }
    std::vector<frame>().swap(frames_);
    released_ = true;
}

auto packet::is_released() const noexcept -> bool
{
    return released_;
}

auto packet::parse(std::span<const uint8_t> data, size_t short_dcid_length)
    -> Result<std::pair<packet, size_t>>
{
    auto header_result = header_parser::parse(data, short_dcid_length);
    if (header_result.is_err())
    {
        return forward_error<std::pair<packet, size_t>>(header_result, source);
    }
    auto& [hdr, header_length] = header_result.value();

    size_t packet_end = data.size();
    if (const auto* long_hdr = std::get_if<long_header>(&hdr))
    {
        // Length covers the packet number, which the header parser consumed
        const uint64_t payload_length = long_hdr->length - long_hdr->packet_number_length;
        if (data.size() - header_length < payload_length)
        {
            return error<std::pair<packet, size_t>>(
                error_codes::codec::buffer_too_small,
                "Packet shorter than its Length field", source,
                "length=" + std::to_string(long_hdr->length));
        }
        packet_end = header_length + static_cast<size_t>(payload_length);
    }

    auto frames = frame_parser::parse_all(data.subspan(header_length, packet_end - header_length));
    if (frames.is_err())
    {
        return forward_error<std::pair<packet, size_t>>(frames, source);
    }

    packet result(std::move(hdr));
    result.frames_ = std::move(frames.value());
    return ok(std::make_pair(std::move(result), packet_end));
}

auto packet::parse_datagram(std::span<const uint8_t> data, size_t short_dcid_length)
    -> Result<std::vector<packet>>
{
    if (data.empty())
    {
        return error<std::vector<packet>>(error_codes::codec::buffer_too_small,
                                          "Empty datagram", source);
    }

    std::vector<packet> packets;
    size_t offset = 0;

    while (offset < data.size())
    {
        auto parsed = parse(data.subspan(offset), short_dcid_length);
        if (parsed.is_err())
        {
            return error<std::vector<packet>>(
                parsed.error().code,
                "Failed to parse packet " + std::to_string(packets.size()) +
                " at offset " + std::to_string(offset),
                source, parsed.error().message);
        }

        auto& [p, consumed] = parsed.value();
        packets.push_back(std::move(p));
        offset += consumed;
    }

    return ok(std::move(packets));
}

auto packet::send(transport::datagram_sink& sink,
                  const transport::endpoint_info& destination,
                  packet_protection* protection) const -> Result<size_t>
{
    auto bytes = to_bytes();
    if (bytes.is_err())
    {
        return forward_error<size_t>(bytes, source);
    }

    if (protection != nullptr)
    {
        auto protected_result = protection->protect(bytes.value(),
                                                    header_builder::encoded_size(header_));
        if (protected_result.is_err())
        {
            return forward_error<size_t>(protected_result, source);
        }
    }

    auto sent = sink.send_datagram(bytes.value(), destination);
    if (sent.is_err())
    {
        return forward_error<size_t>(sent, source);
    }

    return ok(bytes.value().size());
}

} // namespace quicwire::protocols::quic
