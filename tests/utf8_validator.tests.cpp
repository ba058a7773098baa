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

#include "common/utf8_validator.hpp"
#include "common/utility.hpp"
#include "testsuite.hpp"

#include <gmock/gmock.h>

#include <cstddef>
#include <span>
#include <string_view>

namespace websockets::tests
{

using utf8_validator_test = testsuite;

TEST_F(utf8_validator_test, valid_sequences)
{
   EXPECT_TRUE(is_valid_utf8(std::string_view{"",}));
   EXPECT_TRUE(is_valid_utf8(std::string_view{"Hello, World!",}));
   EXPECT_TRUE(is_valid_utf8(std::string_view{"\xC2\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80",}));
   EXPECT_TRUE(is_valid_utf8(std::string_view{"\xED\x9F\xBF",}));
   EXPECT_TRUE(is_valid_utf8(std::string_view{"\xF4\x8F\xBF\xBF",}));
   EXPECT_TRUE(is_valid_utf8(random_utf8_text(0, 1024)));
}

TEST_F(utf8_validator_test, invalid_sequences)
{
   /// Lone continuation byte
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\x80",}));
   /// Overlong encodings
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xC0\xAF",}));
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xE0\x80\xAF",}));
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xF0\x80\x80\xAF",}));
   /// UTF-16 surrogates
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xED\xA0\x80",}));
   /// Above U+10FFFF
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xF4\x90\x80\x80",}));
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xF5\x80\x80\x80",}));
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xFF",}));
   /// Truncated sequence
   EXPECT_FALSE(is_valid_utf8(std::string_view{"\xE2\x82",}));
}

TEST_F(utf8_validator_test, sequence_split_across_chunks)
{
   constexpr std::string_view testText{"\xF0\x9F\x98\x80\xE2\x82\xAC",};
   for (size_t testSplit{0,}; testText.size() >= testSplit; ++testSplit)
   {
      utf8_validator testValidator{};
      EXPECT_TRUE(testValidator.validate_chunk(as_bytes(testText.substr(0, testSplit))));
      EXPECT_TRUE(testValidator.validate_chunk(as_bytes(testText.substr(testSplit))));
      EXPECT_TRUE(testValidator.is_complete());
   }
   utf8_validator testValidator{};
   EXPECT_TRUE(testValidator.validate_chunk(as_bytes(testText.substr(0, 2))));
   EXPECT_FALSE(testValidator.is_complete());
   EXPECT_FALSE(testValidator.validate_chunk(as_bytes(std::string_view{"A",})));
   testValidator.reset();
   EXPECT_TRUE(testValidator.is_complete());
}

}
