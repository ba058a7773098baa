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

#include "common/utility.hpp"
#include "common/websocket_client_handshake.hpp"
#include "testsuite.hpp"

#include <websockets/websocket_client_config.hpp>
#include <websockets/websocket_error.hpp>

#include <gmock/gmock.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

namespace websockets::tests
{

namespace
{

constexpr std::string_view test_sec_websocket_key{"dGhlIHNhbXBsZSBub25jZQ==",};
constexpr std::string_view test_sec_websocket_accept{"s3pPLMBiTxaQ9kYGzzhZRbK+xOo=",};

[[nodiscard]] std::string make_test_response(std::string_view const &extraHeaders)
{
   std::string response{"HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\nSec-WebSocket-Accept: ",};
   response.append(test_sec_websocket_accept);
   response.append("\r\n");
   response.append(extraHeaders);
   response.append("\r\n");
   return response;
}

}

class websocket_client_handshake_test : public testsuite
{
protected:
   websocket_client_handshake testHandshake{};

   void send_request(websocket_client_config const &testConfig)
   {
      std::vector<std::byte> testRequestBytes{};
      testHandshake.build_request(testConfig, testRequestBytes, test_sec_websocket_key);
      ASSERT_EQ(websocket_handshake_state::request_sent, testHandshake.state());
   }

   [[nodiscard]] std::error_code receive_response(std::string_view const &testResponse)
   {
      std::error_code testErrorCode{};
      auto const testBytesConsumed{testHandshake.handle_response(as_bytes(testResponse), testErrorCode),};
      EXPECT_EQ(testResponse.size(), testBytesConsumed);
      return testErrorCode;
   }
};

TEST_F(websocket_client_handshake_test, request_layout)
{
   auto const testConfig
   {
      websocket_client_config{"example.com", 8080, "/chat?room=1",}
         .with_subprotocol("chat")
         .with_subprotocol("superchat")
         .with_header("Origin", "http://example.com")
   };
   std::vector<std::byte> testRequestBytes{};
   testHandshake.build_request(testConfig, testRequestBytes, test_sec_websocket_key);
   std::string const testRequest{as_string_view(testRequestBytes),};
   EXPECT_THAT(testRequest, testing::StartsWith("GET /chat?room=1 HTTP/1.1\r\n"));
   EXPECT_THAT(testRequest, testing::HasSubstr("\r\nHost: example.com:8080\r\n"));
   EXPECT_THAT(testRequest, testing::HasSubstr("\r\nUpgrade: websocket\r\n"));
   EXPECT_THAT(testRequest, testing::HasSubstr("\r\nConnection: Upgrade\r\n"));
   EXPECT_THAT(testRequest, testing::HasSubstr("\r\nSec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"));
   EXPECT_THAT(testRequest, testing::HasSubstr("\r\nSec-WebSocket-Version: 13\r\n"));
   EXPECT_THAT(testRequest, testing::HasSubstr("\r\nSec-WebSocket-Protocol: chat, superchat\r\n"));
   EXPECT_THAT(testRequest, testing::HasSubstr("\r\nOrigin: http://example.com\r\n"));
   EXPECT_THAT(testRequest, testing::EndsWith("\r\n\r\n"));
   EXPECT_THAT(testRequest, testing::Not(testing::HasSubstr("Sec-WebSocket-Extensions")));
}

TEST_F(websocket_client_handshake_test, request_keys_are_fresh)
{
   websocket_client_config const testConfig{"localhost", 80,};
   std::vector<std::byte> testRequestBytes{};
   testHandshake.build_request(testConfig, testRequestBytes);
   websocket_client_handshake testOtherHandshake{};
   std::vector<std::byte> testOtherRequestBytes{};
   testOtherHandshake.build_request(testConfig, testOtherRequestBytes);
   EXPECT_NE(testRequestBytes, testOtherRequestBytes);
}

TEST_F(websocket_client_handshake_test, accepted)
{
   send_request(websocket_client_config{"localhost", 80,});
   EXPECT_FALSE(receive_response(make_test_response("")));
   EXPECT_EQ(websocket_handshake_state::complete, testHandshake.state());
   EXPECT_TRUE(testHandshake.subprotocol().empty());
}

TEST_F(websocket_client_handshake_test, accepted_with_frames_after_header_block)
{
   send_request(websocket_client_config{"localhost", 80,});
   auto const testResponse{make_test_response(""),};
   auto const testBytes{testResponse + std::string{"\x81\x02hi",},};
   std::error_code testErrorCode{};
   EXPECT_EQ(testResponse.size(), testHandshake.handle_response(as_bytes(testBytes), testErrorCode));
   EXPECT_FALSE(testErrorCode) << testErrorCode.message();
   EXPECT_EQ(websocket_handshake_state::complete, testHandshake.state());
}

TEST_F(websocket_client_handshake_test, accepted_byte_by_byte)
{
   send_request(websocket_client_config{"localhost", 80,});
   auto const testResponse{make_test_response("connection: keep-alive, upgrade\r\n"),};
   std::error_code testErrorCode{};
   for (size_t testOffset{0,}; testResponse.size() > testOffset; ++testOffset)
   {
      ASSERT_NE(websocket_handshake_state::complete, testHandshake.state());
      EXPECT_EQ(1, testHandshake.handle_response(as_bytes(std::string_view{testResponse}.substr(testOffset, 1)), testErrorCode));
      ASSERT_FALSE(testErrorCode) << testErrorCode.message();
   }
   EXPECT_EQ(websocket_handshake_state::complete, testHandshake.state());
}

TEST_F(websocket_client_handshake_test, subprotocol_selected)
{
   send_request(websocket_client_config{"localhost", 80,}.with_subprotocol("chat").with_subprotocol("superchat"));
   EXPECT_FALSE(receive_response(make_test_response("Sec-WebSocket-Protocol: superchat\r\n")));
   EXPECT_EQ("superchat", testHandshake.subprotocol());
}

TEST_F(websocket_client_handshake_test, subprotocol_not_offered)
{
   send_request(websocket_client_config{"localhost", 80,}.with_subprotocol("chat"));
   EXPECT_EQ(make_error_code(websocket_error::handshake_unexpected_subprotocol), receive_response(make_test_response("Sec-WebSocket-Protocol: mqtt\r\n")));
   EXPECT_EQ(websocket_handshake_state::failed, testHandshake.state());
}

TEST_F(websocket_client_handshake_test, extension_not_offered)
{
   send_request(websocket_client_config{"localhost", 80,});
   auto const testErrorCode{receive_response(make_test_response("Sec-WebSocket-Extensions: permessage-deflate\r\n")),};
   EXPECT_EQ(make_error_code(websocket_error::handshake_unexpected_extension), testErrorCode);
   EXPECT_EQ(websocket_error_kind::handshake, testErrorCode);
}

TEST_F(websocket_client_handshake_test, wrong_status)
{
   send_request(websocket_client_config{"localhost", 80,});
   EXPECT_EQ(
      make_error_code(websocket_error::handshake_wrong_status_code),
      receive_response("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n")
   );
   EXPECT_EQ(websocket_handshake_state::failed, testHandshake.state());
}

TEST_F(websocket_client_handshake_test, wrong_sec_websocket_accept)
{
   send_request(websocket_client_config{"localhost", 80,});
   EXPECT_EQ(
      make_error_code(websocket_error::handshake_wrong_sec_websocket_accept),
      receive_response(
         "HTTP/1.1 101 Switching Protocols\r\n"
         "Upgrade: websocket\r\n"
         "Connection: Upgrade\r\n"
         "Sec-WebSocket-Accept: AAAAAAAAAAAAAAAAAAAAAAAAAAA=\r\n"
         "\r\n"
      )
   );
}

TEST_F(websocket_client_handshake_test, connection_header_repeated)
{
   send_request(websocket_client_config{"localhost", 80,});
   EXPECT_FALSE(
      receive_response(
         "HTTP/1.1 101 Switching Protocols\r\n"
         "Upgrade: websocket\r\n"
         "Connection: keep-alive\r\n"
         "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"
         "Connection: Upgrade\r\n"
         "\r\n"
      )
   );
   EXPECT_EQ(websocket_handshake_state::complete, testHandshake.state());
}

TEST_F(websocket_client_handshake_test, malformed_response)
{
   send_request(websocket_client_config{"localhost", 80,});
   auto const testErrorCode{receive_response("HTTP/1.1 abc Switching Protocols\r\n\r\n"),};
   ASSERT_TRUE(testErrorCode);
   EXPECT_STREQ("http", testErrorCode.category().name());
   EXPECT_EQ(websocket_error_kind::handshake, testErrorCode);
   EXPECT_EQ(websocket_handshake_state::failed, testHandshake.state());
}

TEST_F(websocket_client_handshake_test, missing_headers)
{
   struct test_case final
   {
      std::string_view response;
      websocket_error expectedError;
   };
   test_case const testCases[] =
   {
      {
         "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nSec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n",
         websocket_error::handshake_no_connection_header_value,
      },
      {
         "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n",
         websocket_error::handshake_no_sec_websocket_accept_header_value,
      },
      {
         "HTTP/1.1 101 Switching Protocols\r\nConnection: Upgrade\r\nSec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n",
         websocket_error::handshake_no_upgrade_header_value,
      },
      {
         "HTTP/1.1 101 Switching Protocols\r\nUpgrade: h2c\r\nConnection: Upgrade\r\nSec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n",
         websocket_error::handshake_wrong_upgrade_header_value,
      },
      {
         "HTTP/1.1 101 Switching Protocols\r\nConnection: close\r\nUpgrade: websocket\r\nSec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n",
         websocket_error::handshake_wrong_connection_header_value,
      },
      {
         "HTTP/1.1 101 Switching Protocols\r\nConnection: keep-alive\r\nConnection: close\r\nUpgrade: websocket\r\nSec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n",
         websocket_error::handshake_wrong_connection_header_value,
      },
   };
   for (auto const &testCase : testCases)
   {
      websocket_client_handshake testCaseHandshake{};
      std::vector<std::byte> testRequestBytes{};
      testCaseHandshake.build_request(websocket_client_config{"localhost", 80,}, testRequestBytes, test_sec_websocket_key);
      std::error_code testErrorCode{};
      std::ignore = testCaseHandshake.handle_response(as_bytes(testCase.response), testErrorCode);
      EXPECT_EQ(make_error_code(testCase.expectedError), testErrorCode) << testCase.response;
      EXPECT_EQ(websocket_handshake_state::failed, testCaseHandshake.state());
   }
}

TEST_F(websocket_client_handshake_test, response_too_large)
{
   send_request(websocket_client_config{"localhost", 80,});
   std::string const testResponse
   {
      std::string{"HTTP/1.1 101 Switching Protocols\r\nX-Padding: ",} + std::string(websocket_client_handshake::response_size_limit, 'x'),
   };
   EXPECT_EQ(make_error_code(websocket_error::handshake_response_too_large), receive_response(testResponse));
   EXPECT_EQ(websocket_handshake_state::failed, testHandshake.state());
}

}
