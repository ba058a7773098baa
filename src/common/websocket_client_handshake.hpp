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

#include "common/sec_websocket_accept.hpp" ///< for websockets::sec_websocket_accept
#include "common/sec_websocket_key.hpp" ///< for websockets::generate_sec_websocket_key
#include "websockets/websocket_client_config.hpp" ///< for websockets::websocket_client_config

#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint8_t
#include <memory> ///< for std::unique_ptr
#include <span> ///< for std::span
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

class sha1_context;

enum struct websocket_handshake_state : uint8_t
{
   not_started,
   request_sent,
   validating,
   complete,
   failed,
};

/// Opening handshake of a client: builds the upgrade request and validates the upgrade response
class websocket_client_handshake final
{
public:
   static constexpr size_t response_size_limit{16 * 1024,};

   [[nodiscard]] websocket_client_handshake();
   websocket_client_handshake(websocket_client_handshake &&) = delete;
   websocket_client_handshake(websocket_client_handshake const &) = delete;
   ~websocket_client_handshake();

   websocket_client_handshake &operator = (websocket_client_handshake &&) = delete;
   websocket_client_handshake &operator = (websocket_client_handshake const &) = delete;

   /// Appends the request bytes with a freshly generated key
   void build_request(websocket_client_config const &config, std::vector<std::byte> &requestBytes)
   {
      build_request(config, requestBytes, generate_sec_websocket_key().value());
   }

   void build_request(websocket_client_config const &config, std::vector<std::byte> &requestBytes, std::string_view const &secWebSocketKey);

   /// Accumulates response bytes until the header block ends, then validates it.
   /// Returns the number of bytes consumed, bytes following the header block belong to the first frames.
   [[nodiscard]] size_t handle_response(std::span<std::byte const> bytes, std::error_code &errorCode);

   [[maybe_unused, nodiscard]] websocket_handshake_state state() const noexcept
   {
      return m_state;
   }

   [[maybe_unused, nodiscard]] std::string const &subprotocol() const noexcept
   {
      return m_subprotocol;
   }

private:
   class response_parser;

   std::vector<std::string> m_offeredSubprotocols{};
   std::string m_responseBytes{};
   std::string m_subprotocol{};
   sec_websocket_accept m_expectedSecWebSocketAccept{};
   std::unique_ptr<sha1_context> const m_sha1Context;
   std::unique_ptr<response_parser> const m_responseParser;
   websocket_handshake_state m_state{websocket_handshake_state::not_started,};

   [[nodiscard]] std::error_code validate_response();
};

/// llhttp error of a malformed upgrade response
[[nodiscard]] std::error_code make_http_error_code(int value);

}
