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

#include "quicwire/transport/datagram_decoder.h"
#include "quicwire/integration/logger_integration.h"

#include <vector>

namespace quicwire::transport {

namespace {
    constexpr const char* source_name = "transport::datagram_decoder";
} // namespace

datagram_decoder::datagram_decoder(config::codec_config config,
                                   std::shared_ptr<protocols::quic::packet_protection> protection,
                                   packet_handler handler)
    : config_(std::move(config))
    , protection_(std::move(protection))
    , handler_(std::move(handler)) {}

auto datagram_decoder::create(config::codec_config config,
                              std::shared_ptr<protocols::quic::packet_protection> protection,
                              packet_handler handler)
    -> Result<std::shared_ptr<datagram_decoder>> {
    auto valid = config.validate();
    if (valid.is_err()) {
        QUICWIRE_LOG_ERROR("Rejected decoder configuration: " + valid.error().message);
        return forward_error<std::shared_ptr<datagram_decoder>>(valid, source_name);
    }
    return ok(std::make_shared<datagram_decoder>(std::move(config), std::move(protection),
                                                 std::move(handler)));
}

auto datagram_decoder::on_datagram(std::span<const uint8_t> datagram,
                                   const endpoint_info& source) -> VoidResult {
    datagrams_received_.fetch_add(1, std::memory_order_relaxed);

    if (datagram.size() > config_.max_datagram_size) {
        return drop(source, error_void(error_codes::codec::value_out_of_range,
                                       "Datagram exceeds max_datagram_size", source_name,
                                       "size=" + std::to_string(datagram.size())));
    }

    std::vector<uint8_t> plaintext(datagram.begin(), datagram.end());
    if (protection_) {
        auto unprotected = protection_->unprotect(plaintext);
        if (unprotected.is_err()) {
            return drop(source, unprotected);
        }
    }

    auto packets = protocols::quic::packet::parse_datagram(plaintext,
                                                           config_.short_header_dcid_length);
    if (packets.is_err()) {
        return drop(source, error_void(packets.error().code, packets.error().message,
                                       source_name, error_details(packets.error())));
    }

    packets_decoded_.fetch_add(packets.value().size(), std::memory_order_relaxed);
    QUICWIRE_LOG_TRACE("Decoded " + std::to_string(packets.value().size()) +
                       " packet(s) from " + source.to_string());

    if (handler_) {
        for (auto& pkt : packets.value()) {
            handler_(std::move(pkt), source);
        }
    }
    return ok();
}

auto datagram_decoder::drop(const endpoint_info& source, const VoidResult& reason) -> VoidResult {
    datagrams_dropped_.fetch_add(1, std::memory_order_relaxed);
    QUICWIRE_LOG_DEBUG("Dropped datagram from " + source.to_string() + ": " +
                       reason.error().message + " (code " +
                       std::to_string(reason.error().code) + ")");
    return reason;
}

auto datagram_decoder::datagrams_received() const noexcept -> uint64_t {
    return datagrams_received_.load(std::memory_order_relaxed);
}

auto datagram_decoder::packets_decoded() const noexcept -> uint64_t {
    return packets_decoded_.load(std::memory_order_relaxed);
}

auto datagram_decoder::datagrams_dropped() const noexcept -> uint64_t {
    return datagrams_dropped_.load(std::memory_order_relaxed);
}

auto datagram_decoder::get_config() const noexcept -> const config::codec_config& {
    return config_;
}

} // namespace quicwire::transport
