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

#include "common/utf8_validator.hpp" ///< for websockets::utf8_validator
#include "common/utility.hpp" ///< for websockets::as_bytes

#include <cstddef> ///< for std::byte
#include <cstdint> ///< for uint8_t
#include <span> ///< for std::span
#include <string_view> ///< for std::string_view

namespace websockets
{

namespace
{

constexpr uint8_t continuation_lower_bound{0x80,};
constexpr uint8_t continuation_upper_bound{0xBF,};

}

void utf8_validator::reset() noexcept
{
   m_expectedContinuations = 0;
   m_lowerBound = continuation_lower_bound;
   m_upperBound = continuation_upper_bound;
}

bool utf8_validator::validate_chunk(std::span<std::byte const> const bytes) noexcept
{
   for (auto const byte : bytes)
   {
      auto const value{std::to_integer<uint8_t>(byte),};
      if (0 == m_expectedContinuations)
      {
         if (0x80 > value)
         {
            continue;
         }
         m_lowerBound = continuation_lower_bound;
         m_upperBound = continuation_upper_bound;
         if ((0xC2 <= value) && (0xDF >= value))
         {
            m_expectedContinuations = 1;
         }
         else if ((0xE0 <= value) && (0xEF >= value))
         {
            if (0xE0 == value)
            {
               m_lowerBound = 0xA0; ///< overlong
            }
            else if (0xED == value)
            {
               m_upperBound = 0x9F; ///< surrogates
            }
            m_expectedContinuations = 2;
         }
         else if ((0xF0 <= value) && (0xF4 >= value))
         {
            if (0xF0 == value)
            {
               m_lowerBound = 0x90; ///< overlong
            }
            else if (0xF4 == value)
            {
               m_upperBound = 0x8F; ///< above U+10FFFF
            }
            m_expectedContinuations = 3;
         }
         else [[unlikely]]
         {
            return false;
         }
         continue;
      }
      if ((m_lowerBound > value) || (m_upperBound < value)) [[unlikely]]
      {
         return false;
      }
      m_lowerBound = continuation_lower_bound;
      m_upperBound = continuation_upper_bound;
      --m_expectedContinuations;
   }
   return true;
}

bool is_valid_utf8(std::span<std::byte const> const bytes) noexcept
{
   utf8_validator utf8Validator{};
   return (true == utf8Validator.validate_chunk(bytes)) && (true == utf8Validator.is_complete());
}

bool is_valid_utf8(std::string_view const &text) noexcept
{
   return is_valid_utf8(as_bytes(text));
}

}
