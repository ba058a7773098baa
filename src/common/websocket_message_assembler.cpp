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

#include "common/utf8_validator.hpp" ///< for websockets::is_valid_utf8
#include "common/utility.hpp" ///< for websockets::as_string_view
#include "common/websocket_message_assembler.hpp" ///< for websockets::websocket_message_assembler
#include "websockets/websocket_error.hpp" ///< for websockets::make_error_code, websockets::websocket_error
#include "websockets/websocket_frame.hpp" ///< for websockets::websocket_frame, websockets::websocket_opcode
#include "websockets/websocket_message.hpp" ///< for websockets::websocket_binary_message, websockets::websocket_close_message, websockets::websocket_message, websockets::websocket_ping_message, websockets::websocket_pong_message, websockets::websocket_text_message

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint16_t
#include <optional> ///< for std::optional
#include <span> ///< for std::span
#include <string> ///< for std::string
#include <system_error> ///< for std::error_code
#include <utility> ///< for std::move

namespace websockets
{

websocket_message_assembler::websocket_message_assembler(size_t const maxMessageSize) noexcept :
   m_maxMessageSize{maxMessageSize,}
{
   assert(0 < m_maxMessageSize);
}

std::error_code websocket_message_assembler::assemble(websocket_frame &&frame, std::optional<websocket_message> &message)
{
   message.reset();
   switch (frame.opcode)
   {
   case websocket_opcode::close:
   {
      assert(true == frame.fin);
      websocket_close_message closeMessage{};
      if (auto const errorCode{parse_websocket_close_payload(frame.payload, closeMessage),}; true == bool{errorCode,}) [[unlikely]]
      {
         return errorCode;
      }
      message.emplace(std::move(closeMessage));
   }
   return std::error_code{};

   case websocket_opcode::ping:
   {
      assert(true == frame.fin);
      message.emplace(websocket_ping_message{.payload = std::move(frame.payload),});
   }
   return std::error_code{};

   case websocket_opcode::pong:
   {
      assert(true == frame.fin);
      message.emplace(websocket_pong_message{.payload = std::move(frame.payload),});
   }
   return std::error_code{};

   case websocket_opcode::text: [[fallthrough]];
   case websocket_opcode::binary:
   {
      if (true == in_progress()) [[unlikely]]
      {
         return make_error_code(websocket_error::frame_expected_continuation);
      }
      if (m_maxMessageSize < frame.payload.size()) [[unlikely]]
      {
         return make_error_code(websocket_error::message_too_big);
      }
      m_opcode = frame.opcode;
      m_payload = std::move(frame.payload);
   }
   break;

   case websocket_opcode::continuation:
   {
      if (false == in_progress()) [[unlikely]]
      {
         return make_error_code(websocket_error::frame_unexpected_continuation);
      }
      if ((m_maxMessageSize - m_payload.size()) < frame.payload.size()) [[unlikely]]
      {
         return make_error_code(websocket_error::message_too_big);
      }
      m_payload.insert(m_payload.end(), frame.payload.begin(), frame.payload.end());
   }
   break;

   [[unlikely]] default:
   return make_error_code(websocket_error::frame_reserved_opcode);
   }
   if (false == frame.fin)
   {
      return std::error_code{};
   }
   return complete(message);
}

std::error_code websocket_message_assembler::complete(std::optional<websocket_message> &message)
{
   assert(true == in_progress());
   auto const opcode{m_opcode.value(),};
   auto payload{std::move(m_payload),};
   reset();
   if (websocket_opcode::binary == opcode)
   {
      message.emplace(websocket_binary_message{.bytes = std::move(payload),});
      return std::error_code{};
   }
   assert(websocket_opcode::text == opcode);
   if (false == is_valid_utf8(std::span<std::byte const>{payload,})) [[unlikely]]
   {
      return make_error_code(websocket_error::message_invalid_utf8);
   }
   message.emplace(websocket_text_message{.text = std::string{as_string_view(payload),},});
   return std::error_code{};
}

void websocket_message_assembler::reset() noexcept
{
   m_opcode.reset();
   m_payload.clear();
}

bool is_valid_close_code(uint16_t const code) noexcept
{
   return (
      false
      || ((1000 <= code) && (1003 >= code))
      || ((1007 <= code) && (1014 >= code))
      || ((3000 <= code) && (4999 >= code))
   );
}

std::error_code parse_websocket_close_payload(std::span<std::byte const> const payload, websocket_close_message &closeMessage)
{
   closeMessage = websocket_close_message{};
   if (true == payload.empty())
   {
      return std::error_code{};
   }
   if (sizeof(uint16_t) > payload.size()) [[unlikely]]
   {
      return make_error_code(websocket_error::close_payload_invalid);
   }
   auto const code{static_cast<uint16_t>((std::to_integer<uint16_t>(payload[0]) << 8) | std::to_integer<uint16_t>(payload[1])),};
   if (false == is_valid_close_code(code)) [[unlikely]]
   {
      return make_error_code(websocket_error::close_code_invalid);
   }
   auto const reason{payload.subspan(sizeof(uint16_t)),};
   if (false == is_valid_utf8(reason)) [[unlikely]]
   {
      return make_error_code(websocket_error::close_reason_invalid_utf8);
   }
   closeMessage.code = code;
   closeMessage.reason = std::string{as_string_view(reason),};
   return std::error_code{};
}

}
