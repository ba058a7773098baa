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

#include "common/logger.hpp" ///< for websockets::log_error, websockets::log_error_code
#include "common/utf8_validator.hpp" ///< for websockets::is_valid_utf8
#include "common/utility.hpp" ///< for websockets::as_bytes, websockets::to_underlying, websockets::unreachable
#include "common/websocket_frame_codec.hpp" ///< for websockets::decode_websocket_frame, websockets::encode_websocket_frame
#include "common/websocket_frame_mask.hpp" ///< for websockets::generate_websocket_frame_mask
#include "common/websocket_message_assembler.hpp" ///< for websockets::is_valid_close_code, websockets::parse_websocket_close_payload
#include "common/websocket_session.hpp" ///< for websockets::websocket_session
#include "websockets/time.hpp" ///< for websockets::steady_clock
#include "websockets/websocket_error.hpp" ///< for websockets::make_error_code, websockets::websocket_error
#include "websockets/websocket_frame.hpp" ///< for websockets::is_data_opcode, websockets::websocket_frame, websockets::websocket_opcode
#include "websockets/websocket_message.hpp" ///< for websockets::websocket_close_code, websockets::websocket_message
#include "websockets/websocket_state.hpp" ///< for websockets::websocket_state

#include <cassert> ///< for assert
#include <chrono> ///< for std::chrono::duration_cast, std::chrono::milliseconds
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint8_t, uint16_t
#include <optional> ///< for std::optional
#include <source_location> ///< for std::source_location
#include <span> ///< for std::span
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code
#include <type_traits> ///< for std::decay_t, std::is_same_v
#include <utility> ///< for std::move
#include <variant> ///< for std::get_if, std::visit
#include <vector> ///< for std::vector

namespace websockets
{

namespace
{

[[nodiscard]] websocket_close_code close_code_of(std::error_code const &errorCode) noexcept
{
   if (
      false
      || (make_error_code(websocket_error::message_invalid_utf8) == errorCode)
      || (make_error_code(websocket_error::close_reason_invalid_utf8) == errorCode)
   )
   {
      return websocket_close_code::invalid_payload;
   }
   if (make_error_code(websocket_error::message_too_big) == errorCode)
   {
      return websocket_close_code::message_too_big;
   }
   return websocket_close_code::protocol_error;
}

/// Close frame payload: 2 bytes of code in network byte order, then the reason
[[nodiscard]] std::vector<std::byte> make_close_payload(std::optional<uint16_t> const code, std::string_view const &reason)
{
   std::vector<std::byte> payload{};
   if (true == code.has_value())
   {
      payload.reserve(sizeof(uint16_t) + reason.size());
      payload.push_back(std::byte{static_cast<uint8_t>(code.value() >> 8),});
      payload.push_back(std::byte{static_cast<uint8_t>(code.value()),});
      auto const reasonBytes{as_bytes(reason),};
      payload.insert(payload.end(), reasonBytes.begin(), reasonBytes.end());
   }
   return payload;
}

}

websocket_session::websocket_session() noexcept = default;

websocket_session::~websocket_session() = default;

void websocket_session::start_connecting(websocket_client_config const &config)
{
   assert(websocket_state::connecting == state());
   assert(false == m_config.has_value());
   m_config.emplace(config);
   m_assembler.emplace(config.max_message_size());
   m_deadline = steady_clock::now() + config.handshake_timeout();
}

void websocket_session::start_handshake(std::vector<std::byte> &outboundBytes)
{
   assert(websocket_state::connecting == state());
   assert(true == m_config.has_value());
   m_handshake.build_request(*m_config, outboundBytes);
}

void websocket_session::handle_bytes_received(std::span<std::byte const> bytes)
{
   if (websocket_state::connecting == state())
   {
      assert(websocket_handshake_state::request_sent == m_handshake.state());
      std::error_code errorCode{};
      auto const bytesConsumed{m_handshake.handle_response(bytes, errorCode),};
      if (true == bool{errorCode,}) [[unlikely]]
      {
         abort(errorCode);
         return;
      }
      if (websocket_handshake_state::complete != m_handshake.state())
      {
         return;
      }
      m_subprotocol = m_handshake.subprotocol();
      m_deadline.reset();
      set_state(websocket_state::open);
      io_handshake_completed(std::error_code{});
      bytes = bytes.subspan(bytesConsumed);
   }
   if (
      false
      || (true == bytes.empty())
      || (websocket_state::closed == state())
      || (true == m_closeReceived)
      || (true == bool{m_failure,})
   )
   {
      return;
   }
   m_inboundBytes.insert(m_inboundBytes.end(), bytes.begin(), bytes.end());
   handle_frames();
}

void websocket_session::handle_stream_closed(std::error_code const &errorCode)
{
   switch (state())
   {
   case websocket_state::connecting:
   {
      abort((true == bool{errorCode,}) ? errorCode : make_error_code(websocket_error::handshake_connection_closed));
   }
   break;

   case websocket_state::open:
   {
      if (true == bool{errorCode,})
      {
         finish(errorCode);
      }
      else if ((false == m_inboundBytes.empty()) || (true == m_assembler->in_progress()))
      {
         finish(make_error_code(websocket_error::frame_truncated));
      }
      else
      {
         finish(make_error_code(websocket_error::connection_lost));
      }
   }
   break;

   case websocket_state::closing:
   {
      if (true == bool{m_failure,})
      {
         finish(m_failure);
      }
      else if ((true == bool{errorCode,}) && (false == m_closeReceived))
      {
         finish(errorCode);
      }
      else
      {
         finish(make_error_code(websocket_error::connection_closed));
      }
   }
   break;

   case websocket_state::closed:
   break;
   }
}

void websocket_session::handle_timeout()
{
   switch (state())
   {
   case websocket_state::connecting:
   {
      log_error(
         std::source_location::current(),
         "[websocket_client] websocket handshake timed out after {} ms",
         std::chrono::duration_cast<std::chrono::milliseconds>(m_config->handshake_timeout()).count()
      );
      abort(make_error_code(websocket_error::handshake_timeout));
   }
   break;

   case websocket_state::closing:
   {
      finish(make_error_code(websocket_error::close_timeout));
   }
   break;

   case websocket_state::open: [[fallthrough]];
   case websocket_state::closed:
   break;
   }
}

std::error_code websocket_session::send_message(websocket_message const &message, std::vector<std::byte> &outboundBytes)
{
   if (auto const *closeMessage{std::get_if<websocket_close_message>(&message),}; nullptr != closeMessage)
   {
      return close(closeMessage->code, closeMessage->reason, outboundBytes);
   }
   if (auto const errorCode{check_sendable(),}; true == bool{errorCode,})
   {
      return errorCode;
   }
   return std::visit(
      [this, &outboundBytes] (auto const &value) -> std::error_code
      {
         using message_type = std::decay_t<decltype(value)>;
         if constexpr (true == std::is_same_v<message_type, websocket_text_message>)
         {
            return encode_frame(websocket_opcode::text, as_bytes(value.text), true, outboundBytes);
         }
         else if constexpr (true == std::is_same_v<message_type, websocket_binary_message>)
         {
            return encode_frame(websocket_opcode::binary, value.bytes, true, outboundBytes);
         }
         else if constexpr (true == std::is_same_v<message_type, websocket_ping_message>)
         {
            return encode_frame(websocket_opcode::ping, value.payload, true, outboundBytes);
         }
         else if constexpr (true == std::is_same_v<message_type, websocket_pong_message>)
         {
            return encode_frame(websocket_opcode::pong, value.payload, true, outboundBytes);
         }
         else
         {
            unreachable();
         }
      },
      message
   );
}

std::error_code websocket_session::send_frame(websocket_frame const &frame, std::vector<std::byte> &outboundBytes)
{
   if (websocket_opcode::close == frame.opcode)
   {
      websocket_close_message closeMessage{};
      if (auto const errorCode{parse_websocket_close_payload(frame.payload, closeMessage),}; true == bool{errorCode,})
      {
         return errorCode;
      }
      return close(closeMessage.code, closeMessage.reason, outboundBytes);
   }
   if (auto const errorCode{check_sendable(),}; true == bool{errorCode,})
   {
      return errorCode;
   }
   return encode_frame(frame.opcode, frame.payload, frame.fin, outboundBytes);
}

std::error_code websocket_session::close(
   std::optional<uint16_t> const code,
   std::string_view const &reason,
   std::vector<std::byte> &outboundBytes
)
{
   if (auto const errorCode{check_sendable(),}; true == bool{errorCode,})
   {
      return errorCode;
   }
   if (true == code.has_value())
   {
      if (false == is_valid_close_code(code.value())) [[unlikely]]
      {
         return make_error_code(websocket_error::close_code_invalid);
      }
   }
   else if (false == reason.empty()) [[unlikely]]
   {
      return make_error_code(websocket_error::close_payload_invalid);
   }
   if (websocket_control_frame_payload_limit < (sizeof(uint16_t) + reason.size())) [[unlikely]]
   {
      return make_error_code(websocket_error::frame_control_payload_too_large);
   }
   if (false == is_valid_utf8(reason)) [[unlikely]]
   {
      return make_error_code(websocket_error::close_reason_invalid_utf8);
   }
   if (
      auto const errorCode{encode_frame(websocket_opcode::close, make_close_payload(code, reason), true, outboundBytes),};
      true == bool{errorCode,}
   ) [[unlikely]]
   {
      return errorCode;
   }
   m_closeSent = true;
   m_deadline = steady_clock::now() + m_config->close_timeout();
   set_state(websocket_state::closing);
   return std::error_code{};
}

void websocket_session::abort(std::error_code const &errorCode)
{
   assert(true == bool{errorCode,});
   switch (state())
   {
   case websocket_state::connecting:
   {
      m_deadline.reset();
      set_state(websocket_state::closed);
      io_handshake_completed(errorCode);
      io_closed(errorCode);
   }
   break;

   case websocket_state::open: [[fallthrough]];
   case websocket_state::closing:
   {
      finish(errorCode);
   }
   break;

   case websocket_state::closed:
   break;
   }
}

std::error_code websocket_session::check_sendable() const noexcept
{
   switch (state())
   {
   case websocket_state::open:
   return std::error_code{};

   case websocket_state::closing:
   return make_error_code(websocket_error::connection_closing);

   case websocket_state::connecting: [[fallthrough]];
   case websocket_state::closed:
   break;
   }
   return make_error_code(websocket_error::connection_not_open);
}

std::error_code websocket_session::encode_frame(
   websocket_opcode const opcode,
   std::span<std::byte const> const payload,
   bool const fin,
   std::vector<std::byte> &outboundBytes
)
{
   websocket_frame const frame
   {
      .payload = std::vector<std::byte>{payload.begin(), payload.end(),},
      .mask = generate_websocket_frame_mask(m_randomGenerator),
      .opcode = opcode,
      .fin = fin,
   };
   return encode_websocket_frame(frame, outboundBytes);
}

void websocket_session::fail_connection(std::error_code const &errorCode)
{
   assert(true == bool{errorCode,});
   assert(false == bool{m_failure,});
   log_error_code("[websocket_client] closing websocket connection on protocol violation", errorCode);
   m_failure = errorCode;
   m_inboundBytes.clear();
   if (false == m_closeSent)
   {
      std::vector<std::byte> closeFrame{};
      if (
         auto const encodeErrorCode
         {
            encode_frame(
               websocket_opcode::close,
               make_close_payload(to_underlying(close_code_of(errorCode)), std::string_view{"",}),
               true,
               closeFrame
            ),
         };
         true == bool{encodeErrorCode,}
      ) [[unlikely]]
      {
         log_error_code("[websocket_client] failed to encode close frame", encodeErrorCode);
         unreachable();
      }
      m_closeSent = true;
      m_deadline = steady_clock::now() + m_config->close_timeout();
      set_state(websocket_state::closing);
      io_frame_to_send(std::move(closeFrame));
   }
   io_ready_to_shutdown();
}

void websocket_session::finish(std::error_code const &errorCode)
{
   assert(true == bool{errorCode,});
   assert(websocket_state::closed != state());
   m_deadline.reset();
   m_inboundBytes.clear();
   set_state(websocket_state::closed);
   io_closed(errorCode);
}

void websocket_session::handle_close_received(websocket_close_message &&closeMessage)
{
   assert(false == m_closeReceived);
   m_closeReceived = true;
   if (websocket_state::open == state())
   {
      /// The echo repeats the status code, an empty close frame is echoed empty
      std::vector<std::byte> closeFrame{};
      if (
         auto const errorCode
         {
            encode_frame(websocket_opcode::close, make_close_payload(closeMessage.code, std::string_view{"",}), true, closeFrame),
         };
         true == bool{errorCode,}
      ) [[unlikely]]
      {
         log_error_code("[websocket_client] failed to encode close frame", errorCode);
         unreachable();
      }
      m_closeSent = true;
      m_deadline = steady_clock::now() + m_config->close_timeout();
      set_state(websocket_state::closing);
      io_frame_to_send(std::move(closeFrame));
   }
   io_message_received(websocket_message{std::move(closeMessage),});
   io_ready_to_shutdown();
}

void websocket_session::handle_frames()
{
   size_t bytesConsumed{0,};
   while (
      true
      && (m_inboundBytes.size() > bytesConsumed)
      && (websocket_state::closed != state())
      && (false == m_closeReceived)
      && (false == bool{m_failure,})
   )
   {
      auto result
      {
         decode_websocket_frame(
            std::span<std::byte const>{m_inboundBytes,}.subspan(bytesConsumed),
            m_config->max_message_size()
         ),
      };
      if (websocket_decode_status::incomplete == result.status)
      {
         break;
      }
      if (websocket_decode_status::failed == result.status) [[unlikely]]
      {
         fail_connection(result.errorCode);
         return;
      }
      bytesConsumed += result.bytesConsumed;
      if ((websocket_state::closing == state()) && (true == is_data_opcode(result.frame.opcode)))
      {
         continue;
      }
      std::optional<websocket_message> message{};
      if (auto const errorCode{m_assembler->assemble(std::move(result.frame), message),}; true == bool{errorCode,}) [[unlikely]]
      {
         fail_connection(errorCode);
         return;
      }
      if (true == message.has_value())
      {
         handle_message(std::move(message.value()));
      }
   }
   if ((true == m_closeReceived) || (websocket_state::closed == state()))
   {
      m_inboundBytes.clear();
   }
   else
   {
      m_inboundBytes.erase(m_inboundBytes.begin(), m_inboundBytes.begin() + static_cast<std::ptrdiff_t>(bytesConsumed));
   }
}

void websocket_session::handle_message(websocket_message &&message)
{
   if (auto *closeMessage{std::get_if<websocket_close_message>(&message),}; nullptr != closeMessage)
   {
      handle_close_received(std::move(*closeMessage));
      return;
   }
   if (auto const *pingMessage{std::get_if<websocket_ping_message>(&message),}; (nullptr != pingMessage) && (websocket_state::open == state()))
   {
      std::vector<std::byte> pongFrame{};
      if (auto const errorCode{encode_frame(websocket_opcode::pong, pingMessage->payload, true, pongFrame),}; true == bool{errorCode,}) [[unlikely]]
      {
         log_error_code("[websocket_client] failed to encode pong frame", errorCode);
         unreachable();
      }
      io_frame_to_send(std::move(pongFrame));
   }
   io_message_received(std::move(message));
}

void websocket_session::set_state(websocket_state const value) noexcept
{
   m_state.store(value, std::memory_order_release);
}

}
