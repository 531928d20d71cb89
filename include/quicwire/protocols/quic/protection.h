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
#include <vector>

namespace quicwire::protocols::quic
{

/*!
 * \class packet_protection
 * \brief Seam for packet and header protection (RFC 9001 Section 5)
 *
 * The codec works on plaintext packets. An implementation of this class
 * sits between the codec and the network and is responsible for AEAD
 * payload protection, header protection and Retry integrity tags.
 */
class packet_protection
{
public:
    virtual ~packet_protection() = default;

    /*!
     * \brief Protect a serialized packet in place
     * \param packet Plaintext packet; may grow to make room for an AEAD tag
     * \param header_length Number of leading bytes that form the header
     * \return VoidResult indicating success or failure
     */
    [[nodiscard]] virtual auto protect(std::vector<uint8_t>& packet, size_t header_length)
        -> VoidResult = 0;

    /*!
     * \brief Remove protection from a received datagram in place
     * \param datagram Protected datagram; rewritten to plaintext
     * \return VoidResult indicating success or failure
     */
    [[nodiscard]] virtual auto unprotect(std::vector<uint8_t>& datagram) -> VoidResult = 0;
};

/*!
 * \class null_protection
 * \brief Pass-through protection for tests and plaintext links
 */
class null_protection final : public packet_protection
{
public:
    [[nodiscard]] auto protect(std::vector<uint8_t>& packet, size_t header_length)
        -> VoidResult override;

    [[nodiscard]] auto unprotect(std::vector<uint8_t>& datagram) -> VoidResult override;
};

} // namespace quicwire::protocols::quic
