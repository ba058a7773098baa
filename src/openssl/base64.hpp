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

#include <openssl/evp.h> ///< for EVP_EncodeBlock

#include <array> ///< for std::array
#include <bit> ///< for std::bit_cast
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint8_t
#include <span> ///< for std::span
#include <string_view> ///< for std::string_view

namespace websockets
{

/// Padded base64 text of a fixed size binary value
template<size_t binary_size>
class base64_text final
{
public:
   static constexpr size_t text_size{4 * ((binary_size + 2) / 3),};

   [[nodiscard]] base64_text() noexcept = default;

   [[nodiscard]] explicit base64_text(std::span<std::byte const, binary_size> const binary) noexcept
   {
      /// EVP_EncodeBlock appends a null terminator, the output of a valid length never fails
      [[maybe_unused]] auto const encodedSize
      {
         EVP_EncodeBlock(
            std::bit_cast<uint8_t *>(m_characters.data()),
            std::bit_cast<uint8_t const *>(binary.data()),
            static_cast<int>(binary_size)
         ),
      };
      m_length = (static_cast<int>(text_size) == encodedSize) ? text_size : 0;
   }

   [[nodiscard]] std::string_view value() const noexcept
   {
      return std::string_view{m_characters.data(), m_length,};
   }

private:
   std::array<char, text_size + 1> m_characters{'\0',};
   size_t m_length{0,};
};

}
