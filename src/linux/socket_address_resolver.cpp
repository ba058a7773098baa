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

#include "common/logger.hpp" ///< for websockets::log_error
#include "linux/resolver_error.hpp" ///< for websockets::make_resolver_error_code
#include "linux/socket_address_resolver.hpp" ///< for websockets::resolved_socket_address

#include <netdb.h> ///< for addrinfo, AI_NUMERICSERV, freeaddrinfo, getaddrinfo
#include <netinet/in.h> ///< for IPPROTO_TCP
#include <sys/socket.h> ///< for AF_INET, AF_INET6, AF_UNSPEC, sockaddr_storage, SOCK_STREAM

#include <cstdint> ///< for uint16_t
#include <cstring> ///< for std::memcpy, std::memset
#include <memory> ///< for std::addressof
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string, std::to_string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code, std::errc, std::make_error_code
#include <vector> ///< for std::vector

namespace websockets
{

std::error_code resolve_socket_addresses(
   std::string_view const &host,
   uint16_t const port,
   std::vector<resolved_socket_address> &addresses
)
{
   std::string const nodeName{host,};
   auto const service{std::to_string(port),};
   addrinfo const hints
   {
      .ai_flags = AI_NUMERICSERV,
      .ai_family = AF_UNSPEC,
      .ai_socktype = SOCK_STREAM,
      .ai_protocol = IPPROTO_TCP,
      .ai_addrlen = 0,
      .ai_addr = nullptr,
      .ai_canonname = nullptr,
      .ai_next = nullptr,
   };
   addrinfo *result{nullptr,};
   if (
      auto const returnCode{getaddrinfo(nodeName.c_str(), service.c_str(), std::addressof(hints), std::addressof(result)),};
      0 != returnCode
   ) [[unlikely]]
   {
      auto const errorCode{make_resolver_error_code(returnCode),};
      log_error(std::source_location::current(), "[websocket_client] failed to resolve {}: ({}) - {}", host, errorCode.value(), errorCode.message());
      return errorCode;
   }
   for (auto const *address{result,}; nullptr != address; address = address->ai_next)
   {
      if (
         true
         && ((AF_INET == address->ai_family) || (AF_INET6 == address->ai_family))
         && (sizeof(sockaddr_storage) >= address->ai_addrlen)
      )
      {
         resolved_socket_address resolvedAddress;
         std::memset(std::addressof(resolvedAddress.address), 0, sizeof(resolvedAddress.address));
         std::memcpy(std::addressof(resolvedAddress.address), address->ai_addr, address->ai_addrlen);
         resolvedAddress.addressLength = address->ai_addrlen;
         addresses.push_back(resolvedAddress);
      }
   }
   freeaddrinfo(result);
   if (true == addresses.empty()) [[unlikely]]
   {
      log_error(std::source_location::current(), "[websocket_client] no TCP address found for {}", host);
      return std::make_error_code(std::errc::address_not_available);
   }
   return std::error_code{};
}

}
