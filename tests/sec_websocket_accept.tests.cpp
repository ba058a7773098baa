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

#include "common/sec_websocket_accept.hpp"
#include "common/sec_websocket_key.hpp"
#include "openssl/sha1.hpp"
#include "testsuite.hpp"

#include <gmock/gmock.h>

#include <set>
#include <string>
#include <string_view>

namespace websockets::tests
{

using sec_websocket_handshake_keys = testsuite;

TEST_F(sec_websocket_handshake_keys, accept_matches_known_answer)
{
   sha1_context testSha1Context{};
   EXPECT_EQ(
      (std::string_view{"s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",}),
      make_sec_websocket_accept("dGhlIHNhbXBsZSBub25jZQ==", testSha1Context).value()
   );
   /// Context is reusable after a digest
   EXPECT_EQ(
      (std::string_view{"s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",}),
      make_sec_websocket_accept("dGhlIHNhbXBsZSBub25jZQ==", testSha1Context).value()
   );
   EXPECT_NE(
      (std::string_view{"s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",}),
      make_sec_websocket_accept("AQIDBAUGBwgJCgsMDQ4PEA==", testSha1Context).value()
   );
}

TEST_F(sec_websocket_handshake_keys, generated_keys_are_fresh)
{
   std::set<std::string> testKeys{};
   for (int testIteration{0,}; 32 > testIteration; ++testIteration)
   {
      auto const testKey{generate_sec_websocket_key(),};
      ASSERT_EQ(24, testKey.value().size());
      EXPECT_EQ("==", testKey.value().substr(22));
      testKeys.emplace(testKey.value());
   }
   EXPECT_EQ(32, testKeys.size());
}

}
