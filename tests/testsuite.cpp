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


#include "testsuite.hpp"

#include <sched.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <memory>
#include <system_error>

namespace websockets::tests
{

cpu_id testsuite::first_cpu()
{
   cpu_set_t processAffinityMask{};
   CPU_ZERO(std::addressof(processAffinityMask));
   EXPECT_EQ(0, sched_getaffinity(getpid(), sizeof(processAffinityMask), std::addressof(processAffinityMask)))
      << std::error_code{errno, std::generic_category(),}
   ;
   for (uint32_t cpuIndex{0,}; CPU_SETSIZE > cpuIndex; ++cpuIndex)
   {
      if (CPU_ISSET(cpuIndex, std::addressof(processAffinityMask)))
      {
         return cpu_id{cpuIndex,};
      }
   }
   return cpu_id{0,};
}

std::vector<std::byte> testsuite::to_bytes(std::string_view const &value)
{
   std::vector<std::byte> bytes{};
   bytes.reserve(value.size());
   std::transform(
      value.begin(),
      value.end(),
      std::back_inserter(bytes),
      [] (char const character)
      {
         return std::byte{static_cast<uint8_t>(character),};
      }
   );
   return bytes;
}

std::vector<std::byte> testsuite::random_bytes(size_t const length)
{
   std::vector<std::byte> randomBytes;
   randomBytes.reserve(length);
   std::generate_n(
      std::back_inserter(randomBytes),
      length,
      [this] ()
      {
         return std::byte{random_number<uint8_t>(0, 255),};
      }
   );
   return randomBytes;
}

std::vector<size_t> testsuite::random_chunk_sizes(size_t const totalSize)
{
   std::vector<size_t> chunkSizes{};
   for (size_t offset{0,}; totalSize > offset;)
   {
      auto const chunkSize{random_number<size_t>(1, totalSize - offset),};
      chunkSizes.push_back(chunkSize);
      offset += chunkSize;
   }
   return chunkSizes;
}

std::string testsuite::random_utf8_text(size_t const codePointsCount)
{
   std::string randomText{};
   randomText.reserve(codePointsCount * 4);
   for (size_t index{0,}; codePointsCount > index; ++index)
   {
      auto const codePoint{random_code_point(),};
      if (0x80 > codePoint)
      {
         randomText.push_back(static_cast<char>(codePoint));
      }
      else if (0x800 > codePoint)
      {
         randomText.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
         randomText.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
      else if (0x10000 > codePoint)
      {
         randomText.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
         randomText.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
         randomText.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
      else
      {
         randomText.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
         randomText.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
         randomText.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
         randomText.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
      }
   }
   return randomText;
}

uint32_t testsuite::random_code_point()
{
   switch (random_number(0, 3))
   {
   case 0: return random_number<uint32_t>(0x20, 0x7E);
   case 1: return random_number<uint32_t>(0x80, 0x7FF);
   case 2:
   {
      /// Surrogates are not scalar values
      auto const codePoint{random_number<uint32_t>(0x800, 0xFFFF - 0x800),};
      return (0xD800 > codePoint) ? codePoint : codePoint + 0x800;
   }
   }
   return random_number<uint32_t>(0x10000, 0x10FFFF);
}

void testsuite::SetUp()
{
   super::SetUp();

   m_randomEngine.seed(std::chrono::system_clock::now().time_since_epoch().count());
}

}
