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

#include "websockets/time.hpp" ///< for websockets::time_duration
#include "websockets/tls_client_config.hpp" ///< for websockets::tls_client_config

#include <cassert> ///< for assert
#include <chrono> ///< for std::chrono::seconds
#include <cstddef> ///< for size_t
#include <cstdint> ///< for uint16_t
#include <optional> ///< for std::nullopt, std::optional
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <utility> ///< for std::move, std::pair
#include <vector> ///< for std::erase_if, std::vector

namespace websockets
{

using websocket_header = std::pair<std::string, std::string>;

class websocket_client_config final
{
public:
   static constexpr size_t default_max_message_size{64 * 1024 * 1024,};
   static constexpr size_t default_max_pending_messages{1024,};
   static constexpr std::chrono::seconds default_handshake_timeout{10,};
   static constexpr std::chrono::seconds default_close_timeout{5,};

   websocket_client_config() = delete;
   [[maybe_unused, nodiscard]] websocket_client_config(websocket_client_config &&) noexcept = default;
   [[maybe_unused, nodiscard]] websocket_client_config(websocket_client_config const &) = default;

   [[maybe_unused, nodiscard]] websocket_client_config(std::string_view const &host, uint16_t const port, std::string_view const &target = "/") :
      m_host{host,},
      m_target{target,},
      m_port{port,}
   {
      assert(false == m_host.empty());
      assert(false == m_target.empty());
   }

   [[maybe_unused]] websocket_client_config &operator = (websocket_client_config &&) noexcept = default;
   [[maybe_unused]] websocket_client_config &operator = (websocket_client_config const &) = default;

   [[maybe_unused, nodiscard]] time_duration close_timeout() const noexcept
   {
      return m_closeTimeout;
   }

   [[maybe_unused, nodiscard]] time_duration handshake_timeout() const noexcept
   {
      return m_handshakeTimeout;
   }

   [[maybe_unused, nodiscard]] std::vector<websocket_header> const &headers() const noexcept
   {
      return m_headers;
   }

   [[maybe_unused, nodiscard]] std::string const &host() const noexcept
   {
      return m_host;
   }

   [[maybe_unused, nodiscard]] size_t max_message_size() const noexcept
   {
      return m_maxMessageSize;
   }

   /// Received messages not taken by receive() yet, reading from the socket pauses at this count
   [[maybe_unused, nodiscard]] size_t max_pending_messages() const noexcept
   {
      return m_maxPendingMessages;
   }

   [[maybe_unused, nodiscard]] uint16_t port() const noexcept
   {
      return m_port;
   }

   [[maybe_unused, nodiscard]] std::vector<std::string> const &subprotocols() const noexcept
   {
      return m_subprotocols;
   }

   [[maybe_unused, nodiscard]] std::string const &target() const noexcept
   {
      return m_target;
   }

   [[maybe_unused, nodiscard]] std::optional<tls_client_config> const &tls() const noexcept
   {
      return m_tls;
   }

   [[maybe_unused, nodiscard]] websocket_client_config with_close_timeout(time_duration const value) const
   {
      auto config{*this,};
      config.m_closeTimeout = value;
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config with_handshake_timeout(time_duration const value) const
   {
      auto config{*this,};
      config.m_handshakeTimeout = value;
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config with_header(std::string_view const &name, std::string_view const &value) const
   {
      assert(false == name.empty());
      auto config{*this,};
      config.m_headers.emplace_back(std::string{name,}, std::string{value,});
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config with_max_message_size(size_t const value) const
   {
      assert(0 < value);
      auto config{*this,};
      config.m_maxMessageSize = value;
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config with_max_pending_messages(size_t const value) const
   {
      assert(0 < value);
      auto config{*this,};
      config.m_maxPendingMessages = value;
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config with_subprotocol(std::string_view const &value) const
   {
      assert(false == value.empty());
      auto config{*this,};
      config.m_subprotocols.emplace_back(value);
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config with_tls(tls_client_config value) const
   {
      auto config{*this,};
      config.m_tls = std::move(value);
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config without_header(std::string_view const &name) const
   {
      auto config{*this,};
      std::erase_if(config.m_headers, [&name] (auto const &header) { return header.first == name; });
      return config;
   }

   [[maybe_unused, nodiscard]] websocket_client_config without_subprotocol(std::string_view const &value) const
   {
      auto config{*this,};
      std::erase_if(config.m_subprotocols, [&value] (auto const &subprotocol) { return subprotocol == value; });
      return config;
   }

private:
   std::string m_host;
   std::string m_target;
   std::vector<websocket_header> m_headers{};
   std::vector<std::string> m_subprotocols{};
   std::optional<tls_client_config> m_tls{std::nullopt,};
   size_t m_maxMessageSize{default_max_message_size,};
   size_t m_maxPendingMessages{default_max_pending_messages,};
   time_duration m_handshakeTimeout{default_handshake_timeout,};
   time_duration m_closeTimeout{default_close_timeout,};
   uint16_t m_port;
};

}
