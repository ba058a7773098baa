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

#include <websockets/thread_config.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace websockets::tests
{

/// Shared fixture, seeds a fresh random engine per test
class testsuite : public testing::Test
{
private:
   using super = testing::Test;

public:
   testsuite() = default;
   testsuite(testsuite &&) = delete;
   testsuite(testsuite const &) = delete;

   testsuite &operator = (testsuite &&) = delete;
   testsuite &operator = (testsuite const &) = delete;

   /// First CPU the process is allowed to run on
   [[nodiscard]] static cpu_id first_cpu();

   [[nodiscard]] static std::vector<std::byte> to_bytes(std::string_view const &value);

   [[nodiscard]] bool random_bool()
   {
      return 1 == random_number(0, 1);
   }

   [[nodiscard]] std::vector<std::byte> random_bytes(size_t length);

   [[nodiscard]] std::vector<std::byte> random_bytes(size_t const minLength, size_t const maxLength)
   {
      return random_bytes(random_number(minLength, maxLength));
   }

   /// Sizes of consecutive non-empty chunks adding up to totalSize
   [[nodiscard]] std::vector<size_t> random_chunk_sizes(size_t totalSize);

   template<typename type>
   [[nodiscard]] type random_number(type const lowerBound, type const upperBound)
      requires((true == std::is_integral_v<type>) && (sizeof(type) < sizeof(int)))
   {
      static_assert(false == std::is_same_v<bool, type>, "Please call random_bool instead");
      return static_cast<type>(std::uniform_int_distribution<int>{lowerBound, upperBound}(m_randomEngine));
   }

   template<typename type>
   [[nodiscard]] type random_number(type const lowerBound, type const upperBound)
      requires((true == std::is_integral_v<type>) && (sizeof(type) >= sizeof(int)))
   {
      return std::uniform_int_distribution<type>{lowerBound, upperBound}(m_randomEngine);
   }

   /// Well-formed UTF-8 mixing one to four byte sequences
   [[nodiscard]] std::string random_utf8_text(size_t codePointsCount);

   [[nodiscard]] std::string random_utf8_text(size_t const minCodePointsCount, size_t const maxCodePointsCount)
   {
      return random_utf8_text(random_number(minCodePointsCount, maxCodePointsCount));
   }

protected:
   void SetUp() override;

private:
   std::mt19937_64 m_randomEngine{};

   [[nodiscard]] uint32_t random_code_point();
};

}
