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

#if (defined(WEBSOCKETS_OPENSSL))
#include "common/logger.hpp" ///< for websockets::log_error
#include "openssl/error.hpp" ///< for websockets::log_openssl_errors, websockets::make_ssl_error_code, websockets::make_tls_error_code, websockets::make_x509_error_code

/// for
///   ERR_get_error_all,
///   ERR_GET_LIB,
///   ERR_GET_REASON,
///   ERR_lib_error_string,
///   ERR_peek_last_error,
///   ERR_reason_error_string,
///   ERR_TXT_STRING
#include <openssl/err.h>
#include <openssl/ssl.h> ///< for SSL, SSL_ERROR_NONE, SSL_ERROR_SSL, SSL_ERROR_SYSCALL, SSL_get_error, SSL_get_verify_result, SSL_R_CERTIFICATE_VERIFY_FAILED
#include <openssl/x509.h> ///< for X509_V_OK, X509_verify_cert_error_string

#include <cstdint> ///< for uint32_t
#include <format> ///< for std::format, std::format_to
#include <iterator> ///< for std::back_inserter
#include <memory> ///< for std::addressof
#include <source_location> ///< for std::source_location
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_category, std::error_code

namespace websockets
{

void log_openssl_errors(std::string_view const &prefix, std::source_location const &sourceLocation)
{
   std::string details{};
   unsigned long errorCode{0,};
   char const *errorLocationFilePath{"",};
   int errorLocationFileLine{0,};
   char const *errorLocationFunctionName{"",};
   char const *errorData{"",};
   int errorFlags{0,};
   while (
      (
         errorCode = ERR_get_error_all(
            std::addressof(errorLocationFilePath),
            std::addressof(errorLocationFileLine),
            std::addressof(errorLocationFunctionName),
            std::addressof(errorData),
            std::addressof(errorFlags)
         )
      ) != 0
   )
   {
      auto const *libraryName{ERR_lib_error_string(errorCode),};
      auto const *errorReason{ERR_reason_error_string(errorCode),};
      std::format_to(
         std::back_inserter(details),
         "\n\t[{}@{}:{}:{}] {}: ({:x})",
         (nullptr == libraryName) ? std::format("lib({})", static_cast<uint32_t>(ERR_GET_LIB(errorCode))) : std::string{libraryName,},
         std::string_view{errorLocationFilePath,},
         std::string_view{errorLocationFunctionName,},
         errorLocationFileLine,
         (nullptr == errorReason) ? std::format("reason({})", static_cast<uint32_t>(ERR_GET_REASON(errorCode))) : std::string{errorReason,},
         errorCode
      );
      if (
         true
         && (nullptr != errorData)
         && (0 != errorData[0])
         && (ERR_TXT_STRING == (ERR_TXT_STRING & errorFlags))
      )
      {
         std::format_to(std::back_inserter(details), " - {}", std::string_view{errorData,});
      }
   }
   log_error(sourceLocation, "{}{}", prefix, details);
}

namespace
{

using error_message_builder = std::string (*)(int value);

[[nodiscard]] std::string openssl_error_message(int const value)
{
   auto const *errorReason{ERR_reason_error_string(static_cast<unsigned long>(value)),};
   return (nullptr == errorReason)
      ? std::format("reason({})", static_cast<uint32_t>(ERR_GET_REASON(static_cast<unsigned long>(value))))
      : std::string{errorReason,}
   ;
}

[[nodiscard]] std::string ssl_error_message(int const value)
{
   switch (value)
   {
   case SSL_ERROR_ZERO_RETURN: return std::string{"TLS connection closed by peer",};
   case SSL_ERROR_WANT_READ: return std::string{"TLS needs more input",};
   case SSL_ERROR_WANT_WRITE: return std::string{"TLS needs to flush output",};
   case SSL_ERROR_SYSCALL: return std::string{"TLS transport failure",};
   case SSL_ERROR_SSL: return std::string{"TLS protocol failure",};
   }
   return std::format("SSL_get_error({})", value);
}

[[nodiscard]] std::string x509_error_message(int const value)
{
   return std::string{X509_verify_cert_error_string(value),};
}

constexpr char openssl_category_name[]{"openssl",};
constexpr char ssl_category_name[]{"ssl",};
constexpr char x509_category_name[]{"x509",};

/// Every OpenSSL error family is a category of its own, all of them are io errors for the caller
template<char const *category_name, error_message_builder build_message>
class openssl_family_category final : public std::error_category
{
public:
   [[nodiscard]] constexpr openssl_family_category() noexcept = default;
   openssl_family_category(openssl_family_category &&) = delete;
   openssl_family_category(openssl_family_category const &) = delete;

   openssl_family_category &operator = (openssl_family_category &&) = delete;
   openssl_family_category &operator = (openssl_family_category const &) = delete;

   [[nodiscard]] static std::error_category const &instance() noexcept
   {
      static openssl_family_category const category{};
      return category;
   }

   [[nodiscard]] const char *name() const noexcept override
   {
      return category_name;
   }

   [[nodiscard]] std::string message(int const value) const override
   {
      return build_message(value);
   }
};

using openssl_error_category = openssl_family_category<openssl_category_name, openssl_error_message>;
using ssl_error_category = openssl_family_category<ssl_category_name, ssl_error_message>;
using x509_error_category = openssl_family_category<x509_category_name, x509_error_message>;

}

std::error_code make_ssl_error_code(int const value)
{
   return std::error_code{value, ssl_error_category::instance(),};
}

std::error_code make_ssl_error_code(SSL &ssl, int const returnCode)
{
   auto const value{SSL_get_error(std::addressof(ssl), returnCode),};
   if (SSL_ERROR_NONE == value) [[likely]]
   {
      return std::error_code{};
   }
   auto const errorCode{ERR_peek_last_error(),};
   if ((SSL_ERROR_SSL == value) && (ERR_LIB_SSL == ERR_GET_LIB(errorCode)) && (SSL_R_CERTIFICATE_VERIFY_FAILED == ERR_GET_REASON(errorCode)))
   {
      if (auto const verifyResult{SSL_get_verify_result(std::addressof(ssl)),}; X509_V_OK != verifyResult)
      {
         return make_x509_error_code(static_cast<int>(verifyResult));
      }
   }
   if (((SSL_ERROR_SSL == value) || (SSL_ERROR_SYSCALL == value)) && (0 != errorCode))
   {
      return make_tls_error_code(static_cast<int>(errorCode));
   }
   /// SSL_ERROR_SYSCALL with an empty error queue is an unexpected end of the TLS stream
   return make_ssl_error_code(value);
}

std::error_code make_tls_error_code(int const value)
{
   return std::error_code{value, openssl_error_category::instance(),};
}

std::error_code make_x509_error_code(int const value)
{
   return std::error_code{value, x509_error_category::instance(),};
}

}
#endif
