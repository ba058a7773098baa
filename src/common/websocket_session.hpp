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

#include "common/websocket_client_handshake.hpp" ///< for websockets::websocket_client_handshake
#include "common/websocket_message_assembler.hpp" ///< for websockets::websocket_message_assembler
#include "linux/random_generator.hpp" ///< for websockets::random_generator
#include "websockets/time.hpp" ///< for websockets::steady_time
#include "websockets/websocket_client_config.hpp" ///< for websockets::websocket_client_config
#include "websockets/websocket_frame.hpp" ///< for websockets::websocket_frame, websockets::websocket_opcode
#include "websockets/websocket_message.hpp" ///< for websockets::websocket_close_message, websockets::websocket_message
#include "websockets/websocket_state.hpp" ///< for websockets::websocket_state

#include <atomic> ///< for std::atomic
#include <cstddef> ///< for std::byte
#include <cstdint> ///< for uint16_t
#include <optional> ///< for std::nullopt, std::optional
#include <span> ///< for std::span
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

/// Connection state machine of a client, free of any I/O.
/// The transport feeds it with received bytes and stream events, it answers through the io_* hooks.
/// Every method, except state(), must be called from one thread.
class websocket_session
{
public:
   websocket_session(websocket_session &&) = delete;
   websocket_session(websocket_session const &) = delete;

   websocket_session &operator = (websocket_session &&) = delete;
   websocket_session &operator = (websocket_session const &) = delete;

   /// Deadline of the handshake while connecting, of the peer close frame while closing
   [[nodiscard]] std::optional<steady_time> deadline() const noexcept
   {
      return m_deadline;
   }

   [[nodiscard]] websocket_state state() const noexcept
   {
      return m_state.load(std::memory_order_acquire);
   }

   /// Set once before the state becomes open, never modified afterwards
   [[nodiscard]] std::string const &subprotocol() const noexcept
   {
      return m_subprotocol;
   }

protected:
   [[nodiscard]] websocket_session() noexcept;
   virtual ~websocket_session();

   /// Starts the handshake timer, the transport connects after it
   void start_connecting(websocket_client_config const &config);
   /// Appends the upgrade request once the transport is connected
   void start_handshake(std::vector<std::byte> &outboundBytes);

   void handle_bytes_received(std::span<std::byte const> bytes);
   /// End of the inbound stream, errorCode is empty on an orderly end
   void handle_stream_closed(std::error_code const &errorCode);
   void handle_timeout();

   [[nodiscard]] std::error_code send_message(websocket_message const &message, std::vector<std::byte> &outboundBytes);
   /// Sends a frame as is, except for the mask key generated for it
   [[nodiscard]] std::error_code send_frame(websocket_frame const &frame, std::vector<std::byte> &outboundBytes);
   [[nodiscard]] std::error_code close(
      std::optional<uint16_t> code,
      std::string_view const &reason,
      std::vector<std::byte> &outboundBytes
   );
   /// Closed without a close handshake
   void abort(std::error_code const &errorCode);

private:
   websocket_client_handshake m_handshake{};
   random_generator m_randomGenerator{};
   std::optional<websocket_message_assembler> m_assembler{std::nullopt,};
   std::optional<websocket_client_config> m_config{std::nullopt,};
   std::vector<std::byte> m_inboundBytes{};
   std::string m_subprotocol{};
   std::optional<steady_time> m_deadline{std::nullopt,};
   std::error_code m_failure{};
   std::atomic<websocket_state> m_state{websocket_state::connecting,};
   bool m_closeSent{false,};
   bool m_closeReceived{false,};

   virtual void io_closed(std::error_code const &errorCode) = 0;
   /// Frames the session sends on its own: pong, close echo, close on a protocol violation
   virtual void io_frame_to_send(std::vector<std::byte> &&bytes) = 0;
   virtual void io_handshake_completed(std::error_code const &errorCode) = 0;
   virtual void io_message_received(websocket_message &&message) = 0;
   /// Close frames went both ways or the connection failed: flush pending bytes, then end the outbound stream
   virtual void io_ready_to_shutdown() = 0;

   [[nodiscard]] std::error_code check_sendable() const noexcept;
   [[nodiscard]] std::error_code encode_frame(
      websocket_opcode opcode,
      std::span<std::byte const> payload,
      bool fin,
      std::vector<std::byte> &outboundBytes
   );
   void fail_connection(std::error_code const &errorCode);
   void finish(std::error_code const &errorCode);
   void handle_close_received(websocket_close_message &&closeMessage);
   void handle_frames();
   void handle_message(websocket_message &&message);
   void set_state(websocket_state value) noexcept;
};

}
