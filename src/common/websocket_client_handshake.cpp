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
#include "common/sec_websocket_accept.hpp" ///< for websockets::make_sec_websocket_accept
#include "common/utility.hpp" ///< for websockets::as_string_view, websockets::equal_case_insensitive
#include "common/websocket_client_handshake.hpp" ///< for websockets::websocket_client_handshake
#include "openssl/sha1.hpp" ///< for websockets::sha1_context
#include "websockets/websocket_client_config.hpp" ///< for websockets::websocket_client_config
#include "websockets/websocket_error.hpp" ///< for websockets::make_error_code, websockets::websocket_error

/// for
///   llhttp_errno,
///   llhttp_errno_name,
///   llhttp_errno_t,
///   llhttp_execute,
///   llhttp_get_error_reason,
///   llhttp_get_status_code,
///   llhttp_init,
///   llhttp_settings_init,
///   llhttp_settings_t,
///   llhttp_t,
///   llhttp_type_t
#include <llhttp.h>

#include <algorithm> ///< for std::find
#include <bit> ///< for std::bit_cast
#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <format> ///< for std::format_to
#include <iterator> ///< for std::back_inserter
#include <memory> ///< for std::make_unique, std::unique_ptr
#include <source_location> ///< for std::source_location
#include <span> ///< for std::span
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_category, std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

namespace
{

constexpr std::byte has_connection_header{0x1,};
constexpr std::byte has_connection_upgrade_token{0x2,};
constexpr std::byte has_sec_websocket_accept_header{0x4,};
constexpr std::byte has_upgrade_header{0x8,};
constexpr std::string_view header_block_terminator{"\r\n\r\n",};

[[nodiscard]] std::string_view trim(std::string_view value) noexcept
{
   while ((false == value.empty()) && ((' ' == value.front()) || ('\t' == value.front())))
   {
      value.remove_prefix(1);
   }
   while ((false == value.empty()) && ((' ' == value.back()) || ('\t' == value.back())))
   {
      value.remove_suffix(1);
   }
   return value;
}

/// Connection is a comma separated token list, e.g. "keep-alive, Upgrade"
[[nodiscard]] bool has_upgrade_token(std::string_view headerValue) noexcept
{
   while (false == headerValue.empty())
   {
      auto const separatorPosition{headerValue.find(','),};
      if (true == equal_case_insensitive(trim(headerValue.substr(0, separatorPosition)), "upgrade"))
      {
         return true;
      }
      if (std::string_view::npos == separatorPosition)
      {
         break;
      }
      headerValue.remove_prefix(separatorPosition + 1);
   }
   return false;
}

struct llhttp_error_category final
{
private:
   class llhttp_error_category_impl final : public std::error_category
   {
   public:
      [[nodiscard]] constexpr llhttp_error_category_impl() noexcept = default;
      llhttp_error_category_impl(llhttp_error_category_impl &&) = delete;
      llhttp_error_category_impl(llhttp_error_category_impl const &) = delete;

      llhttp_error_category_impl &operator = (llhttp_error_category_impl &&) = delete;
      llhttp_error_category_impl &operator = (llhttp_error_category_impl const &) = delete;

      [[nodiscard]] const char *name() const noexcept override
      {
         return "http";
      }

      [[nodiscard]] std::string message(int const value) const override
      {
         return std::string{llhttp_errno_name(static_cast<llhttp_errno_t>(value)),};
      }
   };

   static inline llhttp_error_category_impl impl{};

public:
   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      return impl;
   }
};

}

std::error_code make_http_error_code(int const value)
{
   return std::error_code{value, llhttp_error_category::instance(),};
}

/// Validates the header block of the upgrade response with llhttp, a 101 response carries no body
class websocket_client_handshake::response_parser final
{
public:
   [[nodiscard]] response_parser() :
      m_llhttpSettings{make_llhttp_settings(),},
      m_llhttp{std::make_unique<llhttp_t>(),}
   {
      llhttp_init(m_llhttp.get(), llhttp_type_t::HTTP_RESPONSE, m_llhttpSettings.get());
      m_llhttp->data = this;
   }

   response_parser(response_parser &&) = delete;
   response_parser(response_parser const &) = delete;

   response_parser &operator = (response_parser &&) = delete;
   response_parser &operator = (response_parser const &) = delete;

   /// Expects the whole header block in one call
   [[nodiscard]] std::error_code parse(std::string_view const &headerBlock)
   {
      assert(false == headerBlock.empty());
      auto const returnCode{llhttp_execute(m_llhttp.get(), headerBlock.data(), headerBlock.size()),};
      switch (returnCode)
      {
      case llhttp_errno::HPE_OK: [[fallthrough]];
      case llhttp_errno::HPE_PAUSED_UPGRADE:
      {
         assert(false == bool{m_errorCode,});
      }
      return std::error_code{};

      case llhttp_errno::HPE_PAUSED:
      {
         assert(true == bool{m_errorCode,});
      }
      return m_errorCode;

      default:
      {
         log_error(
            std::source_location::current(),
            "[websocket_client] websocket handshake failed: malformed HTTP response: ({}) - {}",
            std::string_view{llhttp_errno_name(returnCode),},
            std::string_view{llhttp_get_error_reason(m_llhttp.get()),}
         );
      }
      }
      return make_http_error_code(static_cast<int>(returnCode));
   }

   [[nodiscard]] std::string_view const &sec_websocket_accept() const noexcept
   {
      return m_secWebSocketAccept;
   }

   [[nodiscard]] std::string_view const &sec_websocket_protocol() const noexcept
   {
      return m_secWebSocketProtocol;
   }

private:
   std::unique_ptr<llhttp_settings_t> const m_llhttpSettings;
   std::unique_ptr<llhttp_t> const m_llhttp;
   std::error_code m_errorCode{};
   std::string_view m_headerField{};
   std::string_view m_status{};
   std::string_view m_connectionHeaderValue{};
   std::string_view m_secWebSocketAccept{};
   std::string_view m_secWebSocketProtocol{};
   std::byte m_validityMask{0,};

   [[nodiscard]] std::error_code handle_header(std::string_view const &headerField, std::string_view const &headerValue)
   {
      assert(false == headerField.empty());
      if (true == equal_case_insensitive("Connection", headerField))
      {
         /// The header may be repeated, any of its lines may carry the token
         m_validityMask |= has_connection_header;
         if (true == has_upgrade_token(headerValue))
         {
            m_validityMask |= has_connection_upgrade_token;
         }
         else
         {
            m_connectionHeaderValue = headerValue;
         }
      }
      else if (true == equal_case_insensitive("Sec-WebSocket-Accept", headerField))
      {
         m_secWebSocketAccept = trim(headerValue);
         m_validityMask |= has_sec_websocket_accept_header;
      }
      else if (true == equal_case_insensitive("Sec-WebSocket-Extensions", headerField))
      {
         log_error(
            std::source_location::current(),
            "[websocket_client] websocket handshake failed: extension '{}' was not offered",
            headerValue
         );
         return make_error_code(websocket_error::handshake_unexpected_extension);
      }
      else if (true == equal_case_insensitive("Sec-WebSocket-Protocol", headerField))
      {
         m_secWebSocketProtocol = trim(headerValue);
      }
      else if (true == equal_case_insensitive("Upgrade", headerField))
      {
         if (false == equal_case_insensitive("websocket", trim(headerValue))) [[unlikely]]
         {
            log_error(
               std::source_location::current(),
               "[websocket_client] websocket handshake failed: wrong HTTP header value 'Upgrade: {}'",
               headerValue
            );
            return make_error_code(websocket_error::handshake_wrong_upgrade_header_value);
         }
         m_validityMask |= has_upgrade_header;
      }
      return std::error_code{};
   }

   [[nodiscard]] std::error_code handle_headers_complete() const
   {
      if (has_connection_header != (has_connection_header & m_validityMask)) [[unlikely]]
      {
         return make_error_code(websocket_error::handshake_no_connection_header_value);
      }
      if (has_connection_upgrade_token != (has_connection_upgrade_token & m_validityMask)) [[unlikely]]
      {
         log_error(
            std::source_location::current(),
            "[websocket_client] websocket handshake failed: wrong HTTP header value 'Connection: {}'",
            m_connectionHeaderValue
         );
         return make_error_code(websocket_error::handshake_wrong_connection_header_value);
      }
      if (has_sec_websocket_accept_header != (has_sec_websocket_accept_header & m_validityMask)) [[unlikely]]
      {
         return make_error_code(websocket_error::handshake_no_sec_websocket_accept_header_value);
      }
      if (has_upgrade_header != (has_upgrade_header & m_validityMask)) [[unlikely]]
      {
         return make_error_code(websocket_error::handshake_no_upgrade_header_value);
      }
      return std::error_code{};
   }

   [[nodiscard]] std::error_code handle_status(int const statusCode) const
   {
      if (101 == statusCode) [[likely]]
      {
         return std::error_code{};
      }
      log_error(
         std::source_location::current(),
         "[websocket_client] websocket handshake failed: wrong HTTP status '{} {}', expected '101 Switching Protocols'",
         statusCode,
         m_status
      );
      return make_error_code(websocket_error::handshake_wrong_status_code);
   }

   [[nodiscard]] static response_parser &from(llhttp_t *llhttp) noexcept
   {
      assert(nullptr != llhttp);
      assert(nullptr != llhttp->data);
      return *static_cast<response_parser *>(llhttp->data);
   }

   /// Pauses llhttp on the first error, parse() then reports it
   [[nodiscard]] int store(std::error_code const &errorCode) noexcept
   {
      m_errorCode = errorCode;
      return (true == bool{m_errorCode,}) ? llhttp_errno::HPE_PAUSED : llhttp_errno::HPE_OK;
   }

   [[nodiscard]] static std::unique_ptr<llhttp_settings_t> make_llhttp_settings()
   {
      auto llhttpSettings{std::make_unique<llhttp_settings_t>(),};
      llhttp_settings_init(llhttpSettings.get());
      llhttpSettings->on_status = [] (llhttp_t *llhttp, char const *at, size_t const length) -> int
      {
         from(llhttp).m_status = std::string_view{at, length,};
         return llhttp_errno::HPE_OK;
      };
      /// The reason phrase is optional, so on_status may never be called
      llhttpSettings->on_status_complete = [] (llhttp_t *llhttp) -> int
      {
         auto &parser{from(llhttp),};
         return parser.store(parser.handle_status(llhttp_get_status_code(llhttp)));
      };
      llhttpSettings->on_header_field = [] (llhttp_t *llhttp, char const *at, size_t const length) -> int
      {
         from(llhttp).m_headerField = std::string_view{at, length,};
         return llhttp_errno::HPE_OK;
      };
      llhttpSettings->on_header_value = [] (llhttp_t *llhttp, char const *at, size_t const length) -> int
      {
         auto &parser{from(llhttp),};
         return parser.store(parser.handle_header(parser.m_headerField, std::string_view{at, length,}));
      };
      llhttpSettings->on_headers_complete = [] (llhttp_t *llhttp) -> int
      {
         auto &parser{from(llhttp),};
         return parser.store(parser.handle_headers_complete());
      };
      return llhttpSettings;
   }
};

websocket_client_handshake::websocket_client_handshake() :
   m_sha1Context{std::make_unique<sha1_context>(),},
   m_responseParser{std::make_unique<response_parser>(),}
{}

websocket_client_handshake::~websocket_client_handshake() = default;

void websocket_client_handshake::build_request(
   websocket_client_config const &config,
   std::vector<std::byte> &requestBytes,
   std::string_view const &secWebSocketKey
)
{
   assert(websocket_handshake_state::not_started == m_state);
   assert(false == config.host().empty());
   assert(false == config.target().empty());
   std::string request{};
   std::format_to(
      std::back_inserter(request),
      "GET {} HTTP/1.1\r\n"
      "Host: {}:{}\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Key: {}\r\n"
      "Sec-WebSocket-Version: 13\r\n",
      config.target(),
      config.host(),
      config.port(),
      secWebSocketKey
   );
   m_offeredSubprotocols = config.subprotocols();
   if (false == m_offeredSubprotocols.empty())
   {
      request.append("Sec-WebSocket-Protocol: ");
      for (auto const &subprotocol : m_offeredSubprotocols)
      {
         if (&subprotocol != &m_offeredSubprotocols.front())
         {
            request.append(", ");
         }
         request.append(subprotocol);
      }
      request.append("\r\n");
   }
   for (auto const &[headerName, headerValue] : config.headers())
   {
      std::format_to(std::back_inserter(request), "{}: {}\r\n", headerName, headerValue);
   }
   request.append("\r\n");
   auto const *requestBegin{std::bit_cast<std::byte const *>(request.data()),};
   requestBytes.insert(requestBytes.end(), requestBegin, requestBegin + request.size());
   m_expectedSecWebSocketAccept = make_sec_websocket_accept(secWebSocketKey, *m_sha1Context);
   m_state = websocket_handshake_state::request_sent;
}

size_t websocket_client_handshake::handle_response(std::span<std::byte const> const bytes, std::error_code &errorCode)
{
   assert(websocket_handshake_state::request_sent == m_state);
   auto const previousSize{m_responseBytes.size(),};
   m_responseBytes.append(as_string_view(bytes));
   auto const searchFrom{(header_block_terminator.size() < previousSize) ? previousSize - header_block_terminator.size() + 1 : 0,};
   auto const terminatorPosition{m_responseBytes.find(header_block_terminator, searchFrom),};
   if (std::string_view::npos == terminatorPosition)
   {
      if (response_size_limit < m_responseBytes.size()) [[unlikely]]
      {
         log_error(
            std::source_location::current(),
            "[websocket_client] websocket handshake failed: response header block exceeds {} bytes",
            response_size_limit
         );
         m_state = websocket_handshake_state::failed;
         errorCode = make_error_code(websocket_error::handshake_response_too_large);
      }
      return bytes.size();
   }
   auto const headerBlockSize{terminatorPosition + header_block_terminator.size(),};
   m_responseBytes.resize(headerBlockSize);
   m_state = websocket_handshake_state::validating;
   errorCode = validate_response();
   m_state = (true == bool{errorCode,}) ? websocket_handshake_state::failed : websocket_handshake_state::complete;
   return headerBlockSize - previousSize;
}

std::error_code websocket_client_handshake::validate_response()
{
   if (auto const errorCode{m_responseParser->parse(m_responseBytes),}; true == bool{errorCode,})
   {
      return errorCode;
   }
   if (m_expectedSecWebSocketAccept.value() != m_responseParser->sec_websocket_accept()) [[unlikely]]
   {
      log_error(
         std::source_location::current(),
         "[websocket_client] websocket handshake failed: 'Sec-WebSocket-Accept: {}', expected '{}'",
         m_responseParser->sec_websocket_accept(),
         m_expectedSecWebSocketAccept.value()
      );
      return make_error_code(websocket_error::handshake_wrong_sec_websocket_accept);
   }
   if (auto const &subprotocol{m_responseParser->sec_websocket_protocol(),}; false == subprotocol.empty())
   {
      if (m_offeredSubprotocols.end() == std::find(m_offeredSubprotocols.begin(), m_offeredSubprotocols.end(), subprotocol)) [[unlikely]]
      {
         log_error(
            std::source_location::current(),
            "[websocket_client] websocket handshake failed: subprotocol '{}' was not offered",
            subprotocol
         );
         return make_error_code(websocket_error::handshake_unexpected_subprotocol);
      }
      m_subprotocol = subprotocol;
   }
   return std::error_code{};
}

}
