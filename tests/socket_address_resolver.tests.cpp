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


#include "linux/socket_address_resolver.hpp"
#include "testsuite.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <gmock/gmock.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace websockets::tests
{

using socket_address_resolver_test = testsuite;

TEST_F(socket_address_resolver_test, numeric_host)
{
   std::vector<resolved_socket_address> testAddresses{};
   ASSERT_FALSE(resolve_socket_addresses("127.0.0.1", 8443, testAddresses));
   ASSERT_EQ(1, testAddresses.size());
   ASSERT_EQ(AF_INET, testAddresses.front().address.ss_family);
   EXPECT_EQ(sizeof(sockaddr_in), testAddresses.front().addressLength);
   auto const *testInetAddress{reinterpret_cast<sockaddr_in const *>(std::addressof(testAddresses.front().address)),};
   EXPECT_EQ(htons(8443), testInetAddress->sin_port);
   EXPECT_EQ(htonl(INADDR_LOOPBACK), testInetAddress->sin_addr.s_addr);
}

TEST_F(socket_address_resolver_test, host_name)
{
   std::vector<resolved_socket_address> testAddresses{};
   ASSERT_FALSE(resolve_socket_addresses("localhost", 80, testAddresses));
   ASSERT_FALSE(testAddresses.empty());
   for (auto const &testAddress : testAddresses)
   {
      EXPECT_THAT(static_cast<int>(testAddress.address.ss_family), testing::AnyOf(AF_INET, AF_INET6));
   }
}

}
