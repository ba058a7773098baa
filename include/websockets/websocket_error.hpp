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

#include <system_error> ///< for std::error_code, std::error_condition, std::is_error_code_enum, std::is_error_condition_enum
#include <type_traits> ///< for std::true_type

namespace websockets
{

enum struct websocket_error : int
{
   handshake_no_connection_header_value = 1,
   handshake_no_sec_websocket_accept_header_value,
   handshake_no_upgrade_header_value,
   handshake_wrong_connection_header_value,
   handshake_wrong_sec_websocket_accept,
   handshake_wrong_status_code,
   handshake_wrong_upgrade_header_value,
   handshake_unexpected_subprotocol,
   handshake_unexpected_extension,
   handshake_response_too_large,
   handshake_timeout,
   handshake_connection_closed,

   frame_reserved_bits_set,
   frame_reserved_opcode,
   frame_control_payload_too_large,
   frame_control_not_finalized,
   frame_payload_length_invalid,
   frame_unexpected_continuation,
   frame_expected_continuation,
   frame_truncated,

   message_too_big,
   message_invalid_utf8,

   close_payload_invalid,
   close_code_invalid,
   close_reason_invalid_utf8,

   connection_not_open,
   connection_closing,
   connection_closed,
   connection_lost,
   close_timeout,
};

/// Error kinds a caller can test any error code against
enum struct websocket_error_kind : int
{
   handshake = 1,
   protocol,
   io,
   state,
   closed,
};

[[nodiscard]] std::error_code make_error_code(websocket_error code) noexcept;
[[nodiscard]] std::error_condition make_error_condition(websocket_error_kind kind) noexcept;

}

template<>
struct std::is_error_code_enum<websockets::websocket_error> : std::true_type
{};

template<>
struct std::is_error_condition_enum<websockets::websocket_error_kind> : std::true_type
{};
