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
#include <string>

namespace quicwire::transport {

/**
 * @struct endpoint_info
 * @brief Network endpoint (IP address and UDP port)
 */
struct endpoint_info {
    std::string address;   ///< IPv4 or IPv6 address literal
    uint16_t port = 0;     ///< UDP port

    endpoint_info() = default;

    endpoint_info(const std::string& a, uint16_t p) : address(a), port(p) {}

    endpoint_info(const char* a, uint16_t p) : address(a), port(p) {}

    /**
     * @brief Checks if the endpoint is usable (non-empty address, non-zero port)
     */
    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !address.empty() && port != 0;
    }

    /**
     * @brief "address:port", with IPv6 addresses in brackets
     */
    [[nodiscard]] auto to_string() const -> std::string {
        if (address.find(':') != std::string::npos) {
            return "[" + address + "]:" + std::to_string(port);
        }
        return address + ":" + std::to_string(port);
    }

    auto operator==(const endpoint_info&) const -> bool = default;
};

/**
 * @interface datagram_sink
 * @brief Destination for outgoing datagrams
 *
 * Implemented by udp_transport and by test doubles.
 */
class datagram_sink {
public:
    virtual ~datagram_sink() = default;

    datagram_sink(const datagram_sink&) = delete;
    datagram_sink& operator=(const datagram_sink&) = delete;

    /**
     * @brief Send one datagram
     * @param datagram Bytes to send; borrowed for the duration of the call
     * @param destination Remote endpoint
     * @return VoidResult indicating success or failure
     */
    [[nodiscard]] virtual auto send_datagram(std::span<const uint8_t> datagram,
                                             const endpoint_info& destination)
        -> VoidResult = 0;

protected:
    datagram_sink() = default;
};

} // namespace quicwire::transport
