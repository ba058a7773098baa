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

#include <array> ///< for std::array
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint8_t, uint32_t
#include <optional> ///< for std::nullopt, std::optional
#include <vector> ///< for std::vector

namespace websockets
{

enum struct websocket_opcode : uint8_t
{
   continuation = 0x0,
   text = 0x1,
   binary = 0x2,
   close = 0x8,
   ping = 0x9,
   pong = 0xA,
};

/// Payload limit of close, ping and pong frames
constexpr size_t websocket_control_frame_payload_limit{125,};

[[nodiscard]] constexpr bool is_control_opcode(websocket_opcode const opcode) noexcept
{
   return (
      false
      || (websocket_opcode::close == opcode)
      || (websocket_opcode::ping == opcode)
      || (websocket_opcode::pong == opcode)
   );
}

[[nodiscard]] constexpr bool is_data_opcode(websocket_opcode const opcode) noexcept
{
   return (
      false
      || (websocket_opcode::continuation == opcode)
      || (websocket_opcode::text == opcode)
      || (websocket_opcode::binary == opcode)
   );
}

struct websocket_frame_mask final
{
   static constexpr size_t sizeof_value{4,};
   static_assert(sizeof(uint32_t) == sizeof_value);

   std::array<std::byte, sizeof_value> bytes{std::byte{0,},};

   [[nodiscard]] bool operator == (websocket_frame_mask const &) const noexcept = default;
};

struct websocket_frame final
{
   std::vector<std::byte> payload{};
   std::optional<websocket_frame_mask> mask{std::nullopt,};
   websocket_opcode opcode{websocket_opcode::text,};
   bool fin{true,};

   [[nodiscard]] bool operator == (websocket_frame const &) const = default;
};

}
