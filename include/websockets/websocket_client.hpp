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

#include "websockets/websocket_client_config.hpp" ///< for websockets::websocket_client_config
#include "websockets/websocket_frame.hpp" ///< for websockets::websocket_frame
#include "websockets/websocket_message.hpp" ///< for websockets::websocket_close_code, websockets::websocket_message
#include "websockets/websocket_state.hpp" ///< for websockets::websocket_state
#include "websockets/websocket_thread.hpp" ///< for websockets::websocket_thread

#include <cstdint> ///< for uint16_t
#include <future> ///< for std::future
#include <memory> ///< for std::shared_ptr
#include <optional> ///< for std::optional
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code
#include <utility> ///< for std::pair

namespace websockets
{

/// Either a message, or the error code ending the stream of messages
struct websocket_receive_result final
{
   std::error_code errorCode{};
   websocket_message message{};
};

/// Client side of one websocket connection served by a websocket_thread.
/// Every method may be called from any thread, sends are written in call order.
/// Destroying the client, or both of its halves, drops the connection without a close handshake.
class websocket_client final
{
private:
   class websocket_connection;

public:
   class read_half;
   class write_half;

   websocket_client() = delete;
   [[nodiscard]] websocket_client(websocket_client &&rhs) noexcept;
   websocket_client(websocket_client const &) = delete;
   [[nodiscard]] explicit websocket_client(websocket_thread websocketThread);
   ~websocket_client();

   websocket_client &operator = (websocket_client &&) = delete;
   websocket_client &operator = (websocket_client const &) = delete;

   /// Resolved once the opening handshake completed or failed
   [[nodiscard]] std::future<std::error_code> connect(websocket_client_config const &config);

   [[nodiscard]] std::future<std::error_code> send(websocket_message message);
   /// Sends a frame as is, masked with a fresh key; fragmentation is up to the caller
   [[nodiscard]] std::future<std::error_code> send(websocket_frame frame);

   [[nodiscard]] std::future<websocket_receive_result> receive();

   /// Starts the close handshake, resolved with an empty error code once the handshake completed
   [[nodiscard]] std::future<std::error_code> close(
      std::optional<uint16_t> code = static_cast<uint16_t>(websocket_close_code::normal),
      std::string_view const &reason = std::string_view{"",}
   );
   /// Drops the connection without a close handshake
   [[nodiscard]] std::future<std::error_code> shutdown();

   [[nodiscard]] websocket_state state() const noexcept;
   /// Empty until the connection is open, or when the server selected no subprotocol
   [[nodiscard]] std::string subprotocol() const;

   /// Consumes the client
   [[nodiscard]] std::pair<read_half, write_half> split() &&;

private:
   std::shared_ptr<websocket_connection> m_connection;
};

class websocket_client::read_half final
{
public:
   read_half() = delete;
   [[nodiscard]] read_half(read_half &&rhs) noexcept;
   read_half(read_half const &) = delete;
   ~read_half();

   read_half &operator = (read_half &&) = delete;
   read_half &operator = (read_half const &) = delete;

   [[nodiscard]] std::future<websocket_receive_result> receive();
   [[nodiscard]] websocket_state state() const noexcept;

private:
   friend class websocket_client;

   std::shared_ptr<websocket_connection> m_connection;

   [[nodiscard]] explicit read_half(std::shared_ptr<websocket_connection> connection) noexcept;
};

class websocket_client::write_half final
{
public:
   write_half() = delete;
   [[nodiscard]] write_half(write_half &&rhs) noexcept;
   write_half(write_half const &) = delete;
   ~write_half();

   write_half &operator = (write_half &&) = delete;
   write_half &operator = (write_half const &) = delete;

   [[nodiscard]] std::future<std::error_code> send(websocket_message message);
   [[nodiscard]] std::future<std::error_code> send(websocket_frame frame);
   [[nodiscard]] std::future<std::error_code> close(
      std::optional<uint16_t> code = static_cast<uint16_t>(websocket_close_code::normal),
      std::string_view const &reason = std::string_view{"",}
   );
   [[nodiscard]] std::future<std::error_code> shutdown();
   [[nodiscard]] websocket_state state() const noexcept;

private:
   friend class websocket_client;

   std::shared_ptr<websocket_connection> m_connection;

   [[nodiscard]] explicit write_half(std::shared_ptr<websocket_connection> connection) noexcept;
};

}
