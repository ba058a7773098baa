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

#include "common/utility.hpp" ///< for websockets::to_underlying
#include "websockets/websocket_error.hpp" ///< for websockets::websocket_error, websockets::websocket_error_kind

#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_category, std::error_code, std::error_condition

namespace websockets
{

namespace
{

[[nodiscard]] constexpr websocket_error_kind kind_of(websocket_error const code) noexcept
{
   switch (code)
   {
   case websocket_error::handshake_no_connection_header_value: [[fallthrough]];
   case websocket_error::handshake_no_sec_websocket_accept_header_value: [[fallthrough]];
   case websocket_error::handshake_no_upgrade_header_value: [[fallthrough]];
   case websocket_error::handshake_wrong_connection_header_value: [[fallthrough]];
   case websocket_error::handshake_wrong_sec_websocket_accept: [[fallthrough]];
   case websocket_error::handshake_wrong_status_code: [[fallthrough]];
   case websocket_error::handshake_wrong_upgrade_header_value: [[fallthrough]];
   case websocket_error::handshake_unexpected_subprotocol: [[fallthrough]];
   case websocket_error::handshake_unexpected_extension: [[fallthrough]];
   case websocket_error::handshake_response_too_large: [[fallthrough]];
   case websocket_error::handshake_timeout: [[fallthrough]];
   case websocket_error::handshake_connection_closed:
   return websocket_error_kind::handshake;

   case websocket_error::frame_reserved_bits_set: [[fallthrough]];
   case websocket_error::frame_reserved_opcode: [[fallthrough]];
   case websocket_error::frame_control_payload_too_large: [[fallthrough]];
   case websocket_error::frame_control_not_finalized: [[fallthrough]];
   case websocket_error::frame_payload_length_invalid: [[fallthrough]];
   case websocket_error::frame_unexpected_continuation: [[fallthrough]];
   case websocket_error::frame_expected_continuation: [[fallthrough]];
   case websocket_error::message_too_big: [[fallthrough]];
   case websocket_error::message_invalid_utf8: [[fallthrough]];
   case websocket_error::close_payload_invalid: [[fallthrough]];
   case websocket_error::close_code_invalid: [[fallthrough]];
   case websocket_error::close_reason_invalid_utf8:
   return websocket_error_kind::protocol;

   case websocket_error::frame_truncated: [[fallthrough]];
   case websocket_error::connection_lost:
   return websocket_error_kind::io;

   case websocket_error::connection_not_open: [[fallthrough]];
   case websocket_error::connection_closing:
   return websocket_error_kind::state;

   case websocket_error::connection_closed: [[fallthrough]];
   case websocket_error::close_timeout:
   return websocket_error_kind::closed;
   }
   return websocket_error_kind::io;
}

struct websocket_error_category final
{
private:
   class websocket_error_category_impl final : public std::error_category
   {
   public:
      [[nodiscard]] constexpr websocket_error_category_impl() noexcept = default;
      websocket_error_category_impl(websocket_error_category_impl &&) = delete;
      websocket_error_category_impl(websocket_error_category_impl const &) = delete;

      websocket_error_category_impl &operator = (websocket_error_category_impl &&) = delete;
      websocket_error_category_impl &operator = (websocket_error_category_impl const &) = delete;

      [[nodiscard]] const char *name() const noexcept override
      {
         return "websocket";
      }

      [[nodiscard]] std::error_condition default_error_condition(int const value) const noexcept override
      {
         return make_error_condition(kind_of(static_cast<websocket_error>(value)));
      }

      [[nodiscard]] std::string message(int const value) const override
      {
         switch (static_cast<websocket_error>(value))
         {
         case websocket_error::handshake_no_connection_header_value:
         return std::string{"HTTP header 'Connection' not found",};

         case websocket_error::handshake_no_sec_websocket_accept_header_value:
         return std::string{"HTTP header 'Sec-WebSocket-Accept' not found",};

         case websocket_error::handshake_no_upgrade_header_value:
         return std::string{"HTTP header 'Upgrade' not found",};

         case websocket_error::handshake_wrong_connection_header_value:
         return std::string{"Wrong HTTP header value 'Connection', expected 'Upgrade'",};

         case websocket_error::handshake_wrong_sec_websocket_accept:
         return std::string{"Failed to match HTTP response header 'Sec-WebSocket-Accept' against HTTP request header 'Sec-WebSocket-Key'",};

         case websocket_error::handshake_wrong_status_code:
         return std::string{"Wrong HTTP status code, expected '101 Switching Protocols'",};

         case websocket_error::handshake_wrong_upgrade_header_value:
         return std::string{"Wrong HTTP header value 'Upgrade', expected 'websocket'",};

         case websocket_error::handshake_unexpected_subprotocol:
         return std::string{"Server selected a subprotocol that was not requested",};

         case websocket_error::handshake_unexpected_extension:
         return std::string{"Server selected an extension that was not requested",};

         case websocket_error::handshake_response_too_large:
         return std::string{"HTTP handshake response is too large",};

         case websocket_error::handshake_timeout:
         return std::string{"Opening handshake timed out",};

         case websocket_error::handshake_connection_closed:
         return std::string{"Connection closed before the opening handshake completed",};

         case websocket_error::frame_reserved_bits_set:
         return std::string{"Frame reserved bits set",};

         case websocket_error::frame_reserved_opcode:
         return std::string{"Frame opcode is reserved",};

         case websocket_error::frame_control_payload_too_large:
         return std::string{"Control frame payload exceeds 125 bytes",};

         case websocket_error::frame_control_not_finalized:
         return std::string{"Control frame is fragmented",};

         case websocket_error::frame_payload_length_invalid:
         return std::string{"Frame payload length has the most significant bit set",};

         case websocket_error::frame_unexpected_continuation:
         return std::string{"Continuation frame without a message in progress",};

         case websocket_error::frame_expected_continuation:
         return std::string{"Data frame received while a fragmented message is in progress",};

         case websocket_error::frame_truncated:
         return std::string{"Stream ended in the middle of a frame",};

         case websocket_error::message_too_big:
         return std::string{"Message exceeds the maximum message size",};

         case websocket_error::message_invalid_utf8:
         return std::string{"Text message is not valid UTF-8",};

         case websocket_error::close_payload_invalid:
         return std::string{"Close frame payload is one byte long",};

         case websocket_error::close_code_invalid:
         return std::string{"Close frame carries an invalid status code",};

         case websocket_error::close_reason_invalid_utf8:
         return std::string{"Close frame reason is not valid UTF-8",};

         case websocket_error::connection_not_open:
         return std::string{"Connection is not open yet",};

         case websocket_error::connection_closing:
         return std::string{"Connection is closing",};

         case websocket_error::connection_closed:
         return std::string{"Connection closed",};

         case websocket_error::connection_lost:
         return std::string{"Connection lost without a closing handshake",};

         case websocket_error::close_timeout:
         return std::string{"Closing handshake timed out",};

         [[unlikely]] default: return std::string{"Unknown error, it must be a bug",};
         }
      }
   };

   static inline websocket_error_category_impl impl{};

public:
   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      return impl;
   }
};

struct websocket_error_kind_category final
{
private:
   class websocket_error_kind_category_impl final : public std::error_category
   {
   public:
      [[nodiscard]] constexpr websocket_error_kind_category_impl() noexcept = default;
      websocket_error_kind_category_impl(websocket_error_kind_category_impl &&) = delete;
      websocket_error_kind_category_impl(websocket_error_kind_category_impl const &) = delete;

      websocket_error_kind_category_impl &operator = (websocket_error_kind_category_impl &&) = delete;
      websocket_error_kind_category_impl &operator = (websocket_error_kind_category_impl const &) = delete;

      [[nodiscard]] const char *name() const noexcept override
      {
         return "websocket_kind";
      }

      [[nodiscard]] bool equivalent(std::error_code const &errorCode, int const value) const noexcept override
      {
         if (false == bool{errorCode,})
         {
            return false;
         }
         auto const kind{static_cast<websocket_error_kind>(value),};
         if (websocket_error_category::instance() == errorCode.category())
         {
            return kind_of(static_cast<websocket_error>(errorCode.value())) == kind;
         }
         /// llhttp rejected the upgrade response
         if (std::string_view{"http",} == std::string_view{errorCode.category().name(),})
         {
            return websocket_error_kind::handshake == kind;
         }
         return websocket_error_kind::io == kind;
      }

      [[nodiscard]] std::string message(int const value) const override
      {
         switch (static_cast<websocket_error_kind>(value))
         {
         case websocket_error_kind::handshake: return std::string{"Handshake error",};
         case websocket_error_kind::protocol: return std::string{"Protocol error",};
         case websocket_error_kind::io: return std::string{"I/O error",};
         case websocket_error_kind::state: return std::string{"State error",};
         case websocket_error_kind::closed: return std::string{"Connection closed",};
         [[unlikely]] default: return std::string{"Unknown error kind, it must be a bug",};
         }
      }
   };

   static inline websocket_error_kind_category_impl impl{};

public:
   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      return impl;
   }
};

}

std::error_code make_error_code(websocket_error const code) noexcept
{
   return std::error_code{to_underlying(code), websocket_error_category::instance(),};
}

std::error_condition make_error_condition(websocket_error_kind const kind) noexcept
{
   return std::error_condition{to_underlying(kind), websocket_error_kind_category::instance(),};
}

}
