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

#include "websockets/websocket_frame.hpp" ///< for websockets::websocket_frame, websockets::websocket_opcode
#include "websockets/websocket_message.hpp" ///< for websockets::websocket_close_message, websockets::websocket_message

#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint16_t
#include <optional> ///< for std::nullopt, std::optional
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

/// Turns decoded frames into messages: concatenates fragments, passes control frames through untouched
class websocket_message_assembler final
{
public:
   websocket_message_assembler() = delete;
   websocket_message_assembler(websocket_message_assembler &&) = delete;
   websocket_message_assembler(websocket_message_assembler const &) = delete;

   [[nodiscard]] explicit websocket_message_assembler(size_t maxMessageSize) noexcept;

   websocket_message_assembler &operator = (websocket_message_assembler &&) = delete;
   websocket_message_assembler &operator = (websocket_message_assembler const &) = delete;

   /// Leaves message empty while a fragmented message is still incomplete
   [[nodiscard]] std::error_code assemble(websocket_frame &&frame, std::optional<websocket_message> &message);

   [[nodiscard]] bool in_progress() const noexcept
   {
      return true == m_opcode.has_value();
   }

   void reset() noexcept;

private:
   size_t const m_maxMessageSize;
   std::optional<websocket_opcode> m_opcode{std::nullopt,};
   std::vector<std::byte> m_payload{};

   [[nodiscard]] std::error_code complete(std::optional<websocket_message> &message);
};

[[nodiscard]] bool is_valid_close_code(uint16_t code) noexcept;

[[nodiscard]] std::error_code parse_websocket_close_payload(std::span<std::byte const> payload, websocket_close_message &closeMessage);

}
