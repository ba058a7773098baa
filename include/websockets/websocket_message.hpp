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
#include <cstdint> ///< for uint16_t
#include <optional> ///< for std::nullopt, std::optional
#include <string> ///< for std::string
#include <variant> ///< for std::variant
#include <vector> ///< for std::vector

namespace websockets
{

enum struct websocket_close_code : uint16_t
{
   normal = 1000,
   going_away = 1001,
   protocol_error = 1002,
   unsupported_data = 1003,
   no_status = 1005,
   abnormal = 1006,
   invalid_payload = 1007,
   policy_violation = 1008,
   message_too_big = 1009,
   extension_required = 1010,
   internal_error = 1011,
};

struct websocket_text_message final
{
   std::string text{};

   [[nodiscard]] bool operator == (websocket_text_message const &) const = default;
};

struct websocket_binary_message final
{
   std::vector<std::byte> bytes{};

   [[nodiscard]] bool operator == (websocket_binary_message const &) const = default;
};

struct websocket_close_message final
{
   /// No code means the peer sent an empty close frame (status 1005)
   std::optional<uint16_t> code{std::nullopt,};
   std::string reason{};

   [[nodiscard]] bool operator == (websocket_close_message const &) const = default;
};

struct websocket_ping_message final
{
   std::vector<std::byte> payload{};

   [[nodiscard]] bool operator == (websocket_ping_message const &) const = default;
};

struct websocket_pong_message final
{
   std::vector<std::byte> payload{};

   [[nodiscard]] bool operator == (websocket_pong_message const &) const = default;
};

using websocket_message = std::variant<
   websocket_text_message,
   websocket_binary_message,
   websocket_close_message,
   websocket_ping_message,
   websocket_pong_message
>;

}
