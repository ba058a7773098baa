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

#include <netdb.h> ///< for EAI_*, gai_strerror

#include <cerrno> ///< for errno
#include <string> ///< for std::string
#include <system_error> ///< for std::errc, std::error_category, std::error_code, std::error_condition, std::generic_category

namespace websockets
{

/// getaddrinfo return codes, the system ones are reported through errno instead
class resolver_error_category final : public std::error_category
{
public:
   [[nodiscard]] constexpr resolver_error_category() noexcept = default;
   resolver_error_category(resolver_error_category &&) = delete;
   resolver_error_category(resolver_error_category const &) = delete;

   resolver_error_category &operator = (resolver_error_category &&) = delete;
   resolver_error_category &operator = (resolver_error_category const &) = delete;

   [[nodiscard]] static resolver_error_category const &instance() noexcept
   {
      static resolver_error_category const category{};
      return category;
   }

   [[nodiscard]] const char *name() const noexcept override
   {
      return "resolver";
   }

   [[nodiscard]] std::string message(int const value) const override
   {
      return std::string{gai_strerror(value),};
   }

   [[nodiscard]] std::error_condition default_error_condition(int const value) const noexcept override
   {
      switch (value)
      {
      case EAI_AGAIN: return std::errc::resource_unavailable_try_again;
      case EAI_MEMORY: return std::errc::not_enough_memory;
      case EAI_FAMILY: return std::errc::address_family_not_supported;
      case EAI_NONAME: [[fallthrough]];
      case EAI_NODATA: return std::errc::address_not_available;
      }
      return std::error_condition{value, *this,};
   }
};

[[nodiscard]] inline std::error_code make_resolver_error_code(int const returnCode) noexcept
{
   if (EAI_SYSTEM == returnCode)
   {
      return std::error_code{errno, std::generic_category(),};
   }
   return std::error_code{returnCode, resolver_error_category::instance(),};
}

}
