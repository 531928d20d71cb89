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

/**
 * @file codec_config.h
 * @brief Configuration for the quicwire codec and datagram decoder
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "quicwire/integration/logger_integration.h"
#include "quicwire/protocols/quic/connection_id.h"
#include "quicwire/types/result.h"

namespace quicwire::config {

/**
 * @struct logger_config
 * @brief Configuration for logging
 */
struct logger_config {
    /// Minimum log level to record
    integration::log_level min_level = integration::log_level::info;
};

/**
 * @struct codec_config
 * @brief Complete configuration for decoding and encoding packets
 */
struct codec_config {
    /// Destination connection ID length assumed for short headers
    size_t short_header_dcid_length = 8;

    /// Packet number length used for outgoing packets (1-4)
    size_t packet_number_length = 4;

    /// Frame capacity reserved by newly created packets
    size_t initial_frame_capacity = 0;

    /// Largest datagram accepted by the decoder
    size_t max_datagram_size = 1500;

    /// Logger configuration
    logger_config logger;

    /// Smallest datagram size every QUIC path must support (RFC 9000 Section 14)
    static constexpr size_t min_datagram_size = 1200;

    /// Largest UDP payload (RFC 9000 Section 18.2)
    static constexpr size_t max_udp_payload_size = 65527;

    /**
     * @brief Check that every field is within protocol limits
     * @return VoidResult, invalid_argument naming the first bad field
     */
    [[nodiscard]] VoidResult validate() const {
        if (short_header_dcid_length > protocols::quic::connection_id::max_length) {
            return error_void(error_codes::common_errors::invalid_argument,
                              "short_header_dcid_length exceeds 20", "config::codec_config",
                              std::to_string(short_header_dcid_length));
        }
        if (packet_number_length < 1 || packet_number_length > 4) {
            return error_void(error_codes::common_errors::invalid_argument,
                              "packet_number_length must be 1-4", "config::codec_config",
                              std::to_string(packet_number_length));
        }
        if (max_datagram_size < min_datagram_size || max_datagram_size > max_udp_payload_size) {
            return error_void(error_codes::common_errors::invalid_argument,
                              "max_datagram_size must be within 1200-65527",
                              "config::codec_config", std::to_string(max_datagram_size));
        }
        return ok();
    }

    /**
     * @brief Create development configuration
     * @return Configuration with verbose logging
     */
    static codec_config development() {
        codec_config cfg;
        cfg.logger.min_level = integration::log_level::debug;
        return cfg;
    }

    /**
     * @brief Create production configuration
     * @return Configuration with preallocated frame storage
     */
    static codec_config production() {
        codec_config cfg;
        cfg.logger.min_level = integration::log_level::info;
        cfg.initial_frame_capacity = 4;
        return cfg;
    }

    /**
     * @brief Create testing configuration
     * @return Configuration with the smallest legal datagram size
     */
    static codec_config testing() {
        codec_config cfg;
        cfg.logger.min_level = integration::log_level::warn;
        cfg.max_datagram_size = min_datagram_size;
        return cfg;
    }
};

/**
 * @brief Install a console logger honouring cfg.min_level
 *
 * With common_system the application configures GlobalLoggerRegistry
 * itself and this is a no-op.
 */
inline void apply_logger_config(const logger_config& cfg) {
#ifndef QUICWIRE_WITH_COMMON_SYSTEM
    integration::logger_integration_manager::instance().set_logger(
        std::make_shared<integration::basic_logger>(cfg.min_level));
#else
    (void)cfg;
#endif
}

} // namespace quicwire::config
