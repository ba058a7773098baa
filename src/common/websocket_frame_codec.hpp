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

#include "websockets/websocket_frame.hpp" ///< for websockets::websocket_frame

#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint8_t
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

enum struct websocket_decode_status : uint8_t
{
   complete,
   incomplete,
   failed,
};

struct websocket_decode_result final
{
   websocket_frame frame{};
   /// Valid for the complete status
   size_t bytesConsumed{0,};
   /// Lower bound of the bytes still missing, valid for the incomplete status
   size_t bytesNeeded{0,};
   std::error_code errorCode{};
   websocket_decode_status status{websocket_decode_status::incomplete,};
};

/// Largest possible frame header: 2 bytes, 8 bytes of extended length and 4 bytes of mask key
constexpr size_t websocket_frame_header_size_limit{14,};

/// Appends the wire representation of the frame, the payload gets masked when the frame carries a mask key
[[nodiscard]] std::error_code encode_websocket_frame(websocket_frame const &frame, std::vector<std::byte> &bytes);

[[nodiscard]] websocket_decode_result decode_websocket_frame(std::span<std::byte const> bytes, size_t maxPayloadSize);

}
