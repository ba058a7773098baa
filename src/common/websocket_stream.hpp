/*
   Part of the websockets project, under the MIT License
   SPDX-License-Identifier: MIT

   Copyright (c) 2024-2025 Mikhail Smirnov

   Permission is hereby granted, free of charge, to any person obtaining a copy
   of this software and associated documentation files (the "Software"), to deal
   in the Software without restriction, including without limitation the rights
   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
   copies of the Software, and to permit persons to whom the Software is
   furnished to do so, subject to the following conditions:

   The above copyright notice and this permission notice shall be included in all
   copies or substantial portions of the Software.

   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
   SOFTWARE.
*/

#pragma once

#include <cstddef> ///< for std::byte
#include <memory> ///< for std::unique_ptr
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

/// Byte stream layered over the TCP connection: plaintext passes through, TLS encrypts
class websocket_stream
{
public:
   websocket_stream(websocket_stream &&) = delete;
   websocket_stream(websocket_stream const &) = delete;
   virtual ~websocket_stream() = default;

   websocket_stream &operator = (websocket_stream &&) = delete;
   websocket_stream &operator = (websocket_stream const &) = delete;

   /// Appends the bytes opening the stream, once the TCP connection is established
   [[nodiscard]] virtual std::error_code start(std::vector<std::byte> &outboundBytes) = 0;
   /// True once plaintext can flow both ways
   [[nodiscard]] virtual bool ready() const noexcept = 0;
   /// Appends plaintext of inbound bytes, and any bytes the stream must answer with
   [[nodiscard]] virtual std::error_code decode(
      std::span<std::byte const> inboundBytes,
      std::vector<std::byte> &plaintextBytes,
      std::vector<std::byte> &outboundBytes
   ) = 0;
   [[nodiscard]] virtual std::error_code encode(std::span<std::byte const> plaintextBytes, std::vector<std::byte> &outboundBytes) = 0;
   /// Appends the bytes closing the outbound direction
   virtual void shutdown(std::vector<std::byte> &outboundBytes) = 0;
   /// True once the peer closed its direction inside the stream
   [[nodiscard]] virtual bool peer_closed() const noexcept = 0;

protected:
   [[nodiscard]] websocket_stream() noexcept = default;
};

[[nodiscard]] std::unique_ptr<websocket_stream> make_plain_websocket_stream();

}
