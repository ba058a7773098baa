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

#include "common/logger.hpp" ///< for websockets::log_system_error
#include "common/utility.hpp" ///< for websockets::unreachable

#include <sys/random.h> ///< for getrandom

#include <algorithm> ///< for std::min
#include <bit> ///< for std::bit_cast
#include <cassert> ///< for assert
#include <cerrno> ///< for errno
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint64_t
#include <cstring> ///< for std::memcpy
#include <memory> ///< for std::addressof
#include <random> ///< for std::mt19937_64

namespace websockets
{

/// Per-connection generator: seeded once from the kernel, then masks come from the engine
class random_generator final
{
public:
   [[nodiscard]] random_generator() :
      m_engine{seed(),}
   {}

   random_generator(random_generator &&) = delete;
   random_generator(random_generator const &) = delete;

   random_generator &operator = (random_generator &&) = delete;
   random_generator &operator = (random_generator const &) = delete;

   void generate(std::byte *bytes, size_t const bytesLength)
   {
      assert(nullptr != bytes);
      assert(0 < bytesLength);
      size_t bytesGenerated{0,};
      while (bytesLength > bytesGenerated)
      {
         uint64_t const value{m_engine(),};
         auto const bytesToCopy{std::min(sizeof(value), bytesLength - bytesGenerated),};
         std::memcpy(bytes + bytesGenerated, std::addressof(value), bytesToCopy);
         bytesGenerated += bytesToCopy;
      }
   }

   static void generate_secure(std::byte *bytes, size_t const bytesLength)
   {
      assert(nullptr != bytes);
      assert(0 < bytesLength);
      size_t bytesGenerated{0,};
      while (bytesLength > bytesGenerated)
      {
         auto const returnCode{getrandom(bytes + bytesGenerated, bytesLength - bytesGenerated, 0),};
         if (-1 == returnCode) [[unlikely]]
         {
            if (EINTR == errno)
            {
               continue;
            }
            log_system_error("[random] failed to generate random sequence: ({}) - {}", errno);
            unreachable();
         }
         bytesGenerated += static_cast<size_t>(returnCode);
      }
   }

private:
   std::mt19937_64 m_engine;

   [[nodiscard]] static uint64_t seed()
   {
      uint64_t value{0,};
      generate_secure(std::bit_cast<std::byte *>(std::addressof(value)), sizeof(value));
      return value;
   }
};

}
