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

#include "common/logger.hpp" ///< for websockets::format_string, websockets::log_system_error
#include "common/utility.hpp" ///< for websockets::unreachable

#include <cstdint> ///< for uint32_t, uint8_t
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string
#include <system_error> ///< for std::error_code

namespace websockets
{

enum struct socket_operation_type : uint8_t
{
   none,
   socket,
   setopt_tcp_nodelay,
   connect,
   recv,
   send,
   shutdown,
   cancel,
   close,
};

[[nodiscard]] constexpr format_string<uint32_t, std::string> socket_error_message(socket_operation_type const socketOperationType)
{
   switch (socketOperationType)
   {
   case socket_operation_type::none: break;
   case socket_operation_type::socket: return "[websocket_thread] failed to create TCP socket: ({}) - {}";
   case socket_operation_type::setopt_tcp_nodelay: return "[websocket_thread] failed to set TCP_NODELAY socket option: ({}) - {}";
   case socket_operation_type::connect: return "[websocket_thread] failed to connect TCP socket: ({}) - {}";
   case socket_operation_type::recv: return "[websocket_thread] failed to recv from TCP socket: ({}) - {}";
   case socket_operation_type::send: return "[websocket_thread] failed to send to TCP socket: ({}) - {}";
   case socket_operation_type::shutdown: return "[websocket_thread] failed to shutdown TCP socket: ({}) - {}";
   case socket_operation_type::cancel: return "[websocket_thread] failed to cancel operations of TCP socket: ({}) - {}";
   case socket_operation_type::close: return "[websocket_thread] failed to close TCP socket: ({}) - {}";
   }
   unreachable();
}

inline void log_socket_error(
   socket_operation_type const socketOperationType,
   std::error_code const &errorCode,
   std::source_location const &sourceLocation = std::source_location::current()
)
{
   log_system_error(socket_error_message(socketOperationType), errorCode, sourceLocation);
}

class websocket_socket;

/// Userdata of one in-flight ring task, owned by its socket
struct socket_operation final
{
   websocket_socket *const socket;
   socket_operation_type const type;
};

}
