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

#include <cstddef> ///< for std::byte
#include <cstdint> ///< for uint8_t
#include <span> ///< for std::span
#include <string_view> ///< for std::string_view

namespace websockets
{

/// Streaming UTF-8 validator (RFC 3629): rejects overlong forms, surrogates and code points above U+10FFFF
class utf8_validator final
{
public:
   [[nodiscard]] utf8_validator() noexcept = default;
   utf8_validator(utf8_validator &&) = delete;
   utf8_validator(utf8_validator const &) = delete;

   utf8_validator &operator = (utf8_validator &&) = delete;
   utf8_validator &operator = (utf8_validator const &) = delete;

   [[nodiscard]] bool is_complete() const noexcept
   {
      return 0 == m_expectedContinuations;
   }

   void reset() noexcept;

   [[nodiscard]] bool validate_chunk(std::span<std::byte const> bytes) noexcept;

private:
   uint8_t m_expectedContinuations{0,};
   uint8_t m_lowerBound{0x80,};
   uint8_t m_upperBound{0xBF,};
};

[[nodiscard]] bool is_valid_utf8(std::span<std::byte const> bytes) noexcept;
[[nodiscard]] bool is_valid_utf8(std::string_view const &text) noexcept;

}
