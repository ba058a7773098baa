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


#include "common/sec_websocket_accept.hpp" ///< for websockets::sec_websocket_accept
#include "common/utility.hpp" ///< for websockets::as_bytes
#include "openssl/sha1.hpp" ///< for websockets::sha1_context, websockets::sha1_digest_size

#include <span> ///< for std::span
#include <string_view> ///< for std::string_view

namespace websockets
{

static_assert(sha1_digest_size == 20);

sec_websocket_accept make_sec_websocket_accept(std::string_view const &secWebSocketKey, sha1_context &sha1Context)
{
   constexpr std::string_view handshakeGuid{"258EAFA5-E914-47DA-95CA-C5AB0DC85B11",};
   auto const digest{sha1Context.digest(as_bytes(secWebSocketKey), as_bytes(handshakeGuid)),};
   return sec_websocket_accept{std::span<std::byte const, sha1_digest_size>{digest},};
}

}
