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

#include <sys/socket.h> ///< for sockaddr_storage, socklen_t

#include <cstdint> ///< for uint16_t
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

struct resolved_socket_address final
{
   sockaddr_storage address;
   socklen_t addressLength;
};

/// Blocking name resolution of TCP endpoints, IPv4 and IPv6 in resolver order
[[nodiscard]] std::error_code resolve_socket_addresses(
   std::string_view const &host,
   uint16_t port,
   std::vector<resolved_socket_address> &addresses
);

}
