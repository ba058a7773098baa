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
#include "common/utility.hpp"
#include "common/websocket_frame_codec.hpp"
#include "common/websocket_session.hpp"
#include "openssl/sha1.hpp"
#include "testsuite.hpp"

#include <websockets/websocket_client_config.hpp>
#include <websockets/websocket_error.hpp>
#include <websockets/websocket_frame.hpp>
#include <websockets/websocket_message.hpp>
#include <websockets/websocket_state.hpp>

#include <gmock/gmock.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
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

constexpr size_t test_max_message_size{4096,};

class test_websocket_session : public websocket_session
{
public:
   [[nodiscard]] test_websocket_session() = default;

   using websocket_session::abort;
   using websocket_session::close;
   using websocket_session::handle_bytes_received;
   using websocket_session::handle_stream_closed;
   using websocket_session::handle_timeout;
   using websocket_session::send_frame;
   using websocket_session::send_message;
   using websocket_session::start_connecting;
   using websocket_session::start_handshake;

   MOCK_METHOD(void, io_closed, (std::error_code const &errorCode), (override));
   MOCK_METHOD(void, io_frame_to_send, (std::vector<std::byte> &&bytes), (override));
   MOCK_METHOD(void, io_handshake_completed, (std::error_code const &errorCode), (override));
   MOCK_METHOD(void, io_message_received, (websocket_message &&message), (override));
   MOCK_METHOD(void, io_ready_to_shutdown, (), (override));
};

[[nodiscard]] std::vector<std::byte> make_server_frame(websocket_opcode const opcode, std::span<std::byte const> const payload, bool const fin = true)
{
   std::vector<std::byte> frameBytes{};
   EXPECT_FALSE(
      encode_websocket_frame(
         websocket_frame{.payload = std::vector<std::byte>{payload.begin(), payload.end(),}, .opcode = opcode, .fin = fin,},
         frameBytes
      )
   );
   return frameBytes;
}

[[nodiscard]] std::vector<std::byte> make_server_frame(websocket_opcode const opcode, std::string_view const &payload, bool const fin = true)
{
   return make_server_frame(opcode, as_bytes(payload), fin);
}

[[nodiscard]] std::vector<std::byte> make_close_payload(uint16_t const code, std::string_view const &reason)
{
   std::vector<std::byte> payload{std::byte{static_cast<uint8_t>(code >> 8),}, std::byte{static_cast<uint8_t>(code),},};
   auto const reasonBytes{as_bytes(reason),};
   payload.insert(payload.end(), reasonBytes.begin(), reasonBytes.end());
   return payload;
}

/// Frames sent by a client are always masked
[[nodiscard]] websocket_frame decode_client_frame(std::span<std::byte const> const bytes)
{
   auto const decodeResult{decode_websocket_frame(bytes, test_max_message_size),};
   EXPECT_EQ(websocket_decode_status::complete, decodeResult.status);
   EXPECT_EQ(bytes.size(), decodeResult.bytesConsumed);
   EXPECT_TRUE(decodeResult.frame.mask.has_value());
   return decodeResult.frame;
}

}

class websocket_session_test : public testsuite
{
protected:
   testing::StrictMock<test_websocket_session> testSession{};

   [[nodiscard]] static websocket_client_config test_config()
   {
      return websocket_client_config{"localhost", 8080, "/session",}
         .with_max_message_size(test_max_message_size)
         .with_handshake_timeout(std::chrono::seconds{1,})
         .with_close_timeout(std::chrono::seconds{1,})
      ;
   }

   /// 101 response matching the key of the request the session sent
   [[nodiscard]] std::string make_handshake_response()
   {
      testSession.start_connecting(test_config());
      EXPECT_EQ(websocket_state::connecting, testSession.state());
      EXPECT_TRUE(testSession.deadline().has_value());
      std::vector<std::byte> testRequestBytes{};
      testSession.start_handshake(testRequestBytes);
      std::string const testRequest{as_string_view(testRequestBytes),};
      constexpr std::string_view testKeyHeader{"Sec-WebSocket-Key: ",};
      auto const testKeyPosition{testRequest.find(testKeyHeader),};
      EXPECT_NE(std::string::npos, testKeyPosition);
      auto const testKey{testRequest.substr(testKeyPosition + testKeyHeader.size(), 24),};
      sha1_context testSha1Context{};
      std::string testResponse
      {
         "HTTP/1.1 101 Switching Protocols\r\n"
         "Upgrade: websocket\r\n"
         "Connection: Upgrade\r\n"
         "Sec-WebSocket-Accept: ",
      };
      testResponse.append(make_sec_websocket_accept(testKey, testSha1Context).value());
      testResponse.append("\r\n\r\n");
      return testResponse;
   }

   void open_session()
   {
      auto const testResponse{make_handshake_response(),};
      EXPECT_CALL(testSession, io_handshake_completed(std::error_code{})).Times(1);
      testSession.handle_bytes_received(as_bytes(testResponse));
      ASSERT_EQ(websocket_state::open, testSession.state());
      EXPECT_FALSE(testSession.deadline().has_value());
      testing::Mock::VerifyAndClearExpectations(&testSession);
   }

   void receive(std::vector<std::byte> const &testBytes)
   {
      testSession.handle_bytes_received(testBytes);
   }
};

TEST_F(websocket_session_test, handshake_completed)
{
   open_session();
   EXPECT_TRUE(testSession.subprotocol().empty());
}

TEST_F(websocket_session_test, handshake_response_split_with_first_frame)
{
   auto const testResponse{make_handshake_response(),};
   auto testBytes{to_bytes(testResponse),};
   auto const testFrame{make_server_frame(websocket_opcode::text, "early"),};
   testBytes.insert(testBytes.end(), testFrame.begin(), testFrame.end());
   testing::InSequence const testSequence{};
   EXPECT_CALL(testSession, io_handshake_completed(std::error_code{})).Times(1);
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_text_message{.text = "early",},})).Times(1);
   auto const testSplit{random_number<size_t>(1, testBytes.size() - 1),};
   testSession.handle_bytes_received(std::span<std::byte const>{testBytes}.first(testSplit));
   testSession.handle_bytes_received(std::span<std::byte const>{testBytes}.subspan(testSplit));
   EXPECT_EQ(websocket_state::open, testSession.state());
}

TEST_F(websocket_session_test, handshake_rejected)
{
   std::ignore = make_handshake_response();
   auto const testErrorCode{make_error_code(websocket_error::handshake_wrong_status_code),};
   testing::InSequence const testSequence{};
   EXPECT_CALL(testSession, io_handshake_completed(testErrorCode)).Times(1);
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.handle_bytes_received(as_bytes(std::string_view{"HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n",}));
   EXPECT_EQ(websocket_state::closed, testSession.state());
   EXPECT_FALSE(testSession.deadline().has_value());
}

TEST_F(websocket_session_test, handshake_timeout)
{
   std::ignore = make_handshake_response();
   auto const testErrorCode{make_error_code(websocket_error::handshake_timeout),};
   EXPECT_CALL(testSession, io_handshake_completed(testErrorCode)).Times(1);
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.handle_timeout();
   EXPECT_EQ(websocket_state::closed, testSession.state());
   EXPECT_EQ(websocket_error_kind::handshake, testErrorCode);
}

TEST_F(websocket_session_test, handshake_connection_closed)
{
   std::ignore = make_handshake_response();
   auto const testErrorCode{make_error_code(websocket_error::handshake_connection_closed),};
   EXPECT_CALL(testSession, io_handshake_completed(testErrorCode)).Times(1);
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.handle_stream_closed(std::error_code{});
   EXPECT_EQ(websocket_state::closed, testSession.state());
}

TEST_F(websocket_session_test, messages_received)
{
   open_session();
   auto const testBinary{random_bytes(1, test_max_message_size),};
   std::vector<std::vector<std::byte>> const testFrames
   {
      make_server_frame(websocket_opcode::text, "Hel", false),
      make_server_frame(websocket_opcode::continuation, "lo", true),
      make_server_frame(websocket_opcode::binary, testBinary),
      make_server_frame(websocket_opcode::pong, "pong"),
   };
   std::vector<std::byte> testBytes{};
   for (auto const &testFrame : testFrames)
   {
      testBytes.insert(testBytes.end(), testFrame.begin(), testFrame.end());
   }
   testing::InSequence const testSequence{};
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_text_message{.text = "Hello",},})).Times(1);
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_binary_message{.bytes = testBinary,},})).Times(1);
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_pong_message{.payload = to_bytes("pong"),},})).Times(1);
   /// Delivered in arbitrary chunks
   size_t testOffset{0,};
   for (auto const testChunkSize : random_chunk_sizes(testBytes.size()))
   {
      testSession.handle_bytes_received(std::span<std::byte const>{testBytes}.subspan(testOffset, testChunkSize));
      testOffset += testChunkSize;
   }
   EXPECT_EQ(websocket_state::open, testSession.state());
}

TEST_F(websocket_session_test, ping_answered_with_pong)
{
   open_session();
   std::vector<std::byte> testPongBytes{};
   testing::InSequence const testSequence{};
   EXPECT_CALL(testSession, io_frame_to_send(testing::_))
      .WillOnce(
         [&testPongBytes] (std::vector<std::byte> const &testBytes)
         {
            testPongBytes = testBytes;
         }
      )
   ;
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_ping_message{.payload = to_bytes("hello"),},})).Times(1);
   receive(make_server_frame(websocket_opcode::ping, "hello"));
   auto const testPongFrame{decode_client_frame(testPongBytes),};
   EXPECT_EQ(websocket_opcode::pong, testPongFrame.opcode);
   EXPECT_TRUE(testPongFrame.fin);
   EXPECT_EQ("hello", as_string_view(testPongFrame.payload));
}

TEST_F(websocket_session_test, messages_sent_masked)
{
   open_session();
   auto const testBinary{random_bytes(0, 1024),};
   std::vector<std::byte> testBytes{};
   ASSERT_FALSE(testSession.send_message(websocket_text_message{.text = "Hello",}, testBytes));
   auto testFrame{decode_client_frame(testBytes),};
   EXPECT_EQ(websocket_opcode::text, testFrame.opcode);
   EXPECT_EQ("Hello", as_string_view(testFrame.payload));

   testBytes.clear();
   ASSERT_FALSE(testSession.send_message(websocket_binary_message{.bytes = testBinary,}, testBytes));
   testFrame = decode_client_frame(testBytes);
   EXPECT_EQ(websocket_opcode::binary, testFrame.opcode);
   EXPECT_EQ(testBinary, testFrame.payload);

   testBytes.clear();
   ASSERT_FALSE(
      testSession.send_frame(websocket_frame{.payload = to_bytes("AB"), .opcode = websocket_opcode::text, .fin = false,}, testBytes)
   );
   testFrame = decode_client_frame(testBytes);
   EXPECT_EQ(websocket_opcode::text, testFrame.opcode);
   EXPECT_FALSE(testFrame.fin);

   testBytes.clear();
   EXPECT_EQ(
      make_error_code(websocket_error::frame_control_payload_too_large),
      testSession.send_message(websocket_ping_message{.payload = std::vector<std::byte>(126),}, testBytes)
   );
   EXPECT_TRUE(testBytes.empty());
}

TEST_F(websocket_session_test, send_before_open)
{
   std::vector<std::byte> testBytes{};
   EXPECT_EQ(make_error_code(websocket_error::connection_not_open), testSession.send_message(websocket_text_message{.text = "x",}, testBytes));
   EXPECT_EQ(websocket_error_kind::state, testSession.send_message(websocket_text_message{.text = "x",}, testBytes));
   EXPECT_TRUE(testBytes.empty());
}

TEST_F(websocket_session_test, close_initiated_by_client)
{
   open_session();
   std::vector<std::byte> testBytes{};
   ASSERT_FALSE(testSession.close(1000, "bye", testBytes));
   EXPECT_EQ(websocket_state::closing, testSession.state());
   EXPECT_TRUE(testSession.deadline().has_value());
   auto const testCloseFrame{decode_client_frame(testBytes),};
   EXPECT_EQ(websocket_opcode::close, testCloseFrame.opcode);
   EXPECT_EQ(make_close_payload(1000, "bye"), testCloseFrame.payload);

   testBytes.clear();
   EXPECT_EQ(make_error_code(websocket_error::connection_closing), testSession.send_message(websocket_text_message{.text = "x",}, testBytes));
   EXPECT_EQ(make_error_code(websocket_error::connection_closing), testSession.close(1000, "", testBytes));
   EXPECT_TRUE(testBytes.empty());

   testing::InSequence const testSequence{};
   /// Data frames are dropped once the close frame went out
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_close_message{.code = 1000, .reason = "ok",},})).Times(1);
   EXPECT_CALL(testSession, io_ready_to_shutdown()).Times(1);
   auto testServerBytes{make_server_frame(websocket_opcode::text, "late"),};
   auto const testServerClose{make_server_frame(websocket_opcode::close, make_close_payload(1000, "ok")),};
   testServerBytes.insert(testServerBytes.end(), testServerClose.begin(), testServerClose.end());
   receive(testServerBytes);
   EXPECT_EQ(websocket_state::closing, testSession.state());

   auto const testErrorCode{make_error_code(websocket_error::connection_closed),};
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.handle_stream_closed(std::error_code{});
   EXPECT_EQ(websocket_state::closed, testSession.state());
   EXPECT_EQ(websocket_error_kind::closed, testErrorCode);

   EXPECT_EQ(make_error_code(websocket_error::connection_not_open), testSession.send_message(websocket_text_message{.text = "x",}, testBytes));
}

TEST_F(websocket_session_test, close_initiated_by_server)
{
   open_session();
   std::vector<std::byte> testEchoBytes{};
   testing::InSequence const testSequence{};
   EXPECT_CALL(testSession, io_frame_to_send(testing::_))
      .WillOnce(
         [&testEchoBytes] (std::vector<std::byte> const &testBytes)
         {
            testEchoBytes = testBytes;
         }
      )
   ;
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_close_message{.code = 1001, .reason = "going away",},})).Times(1);
   EXPECT_CALL(testSession, io_ready_to_shutdown()).Times(1);
   receive(make_server_frame(websocket_opcode::close, make_close_payload(1001, "going away")));
   EXPECT_EQ(websocket_state::closing, testSession.state());
   auto const testEchoFrame{decode_client_frame(testEchoBytes),};
   EXPECT_EQ(websocket_opcode::close, testEchoFrame.opcode);
   EXPECT_EQ(make_close_payload(1001, ""), testEchoFrame.payload);

   EXPECT_CALL(testSession, io_closed(make_error_code(websocket_error::connection_closed))).Times(1);
   testSession.handle_stream_closed(std::error_code{});
   EXPECT_EQ(websocket_state::closed, testSession.state());
}

TEST_F(websocket_session_test, empty_close_echoed_empty)
{
   open_session();
   std::vector<std::byte> testEchoBytes{};
   testing::InSequence const testSequence{};
   EXPECT_CALL(testSession, io_frame_to_send(testing::_))
      .WillOnce(
         [&testEchoBytes] (std::vector<std::byte> const &testBytes)
         {
            testEchoBytes = testBytes;
         }
      )
   ;
   EXPECT_CALL(testSession, io_message_received(websocket_message{websocket_close_message{},})).Times(1);
   EXPECT_CALL(testSession, io_ready_to_shutdown()).Times(1);
   receive(make_server_frame(websocket_opcode::close, ""));
   EXPECT_TRUE(decode_client_frame(testEchoBytes).payload.empty());
}

TEST_F(websocket_session_test, close_timeout)
{
   open_session();
   std::vector<std::byte> testBytes{};
   ASSERT_FALSE(testSession.close(std::nullopt, "", testBytes));
   EXPECT_TRUE(decode_client_frame(testBytes).payload.empty());
   auto const testErrorCode{make_error_code(websocket_error::close_timeout),};
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.handle_timeout();
   EXPECT_EQ(websocket_state::closed, testSession.state());
   EXPECT_FALSE(testSession.deadline().has_value());
}

TEST_F(websocket_session_test, close_arguments_validated)
{
   open_session();
   std::vector<std::byte> testBytes{};
   EXPECT_EQ(make_error_code(websocket_error::close_code_invalid), testSession.close(1005, "", testBytes));
   EXPECT_EQ(make_error_code(websocket_error::close_code_invalid), testSession.close(999, "", testBytes));
   EXPECT_EQ(make_error_code(websocket_error::close_payload_invalid), testSession.close(std::nullopt, "reason", testBytes));
   EXPECT_EQ(make_error_code(websocket_error::frame_control_payload_too_large), testSession.close(1000, std::string(124, 'x'), testBytes));
   EXPECT_EQ(make_error_code(websocket_error::close_reason_invalid_utf8), testSession.close(1000, "\xFF", testBytes));
   EXPECT_TRUE(testBytes.empty());
   EXPECT_EQ(websocket_state::open, testSession.state());
   ASSERT_FALSE(testSession.close(4000, std::string(123, 'x'), testBytes));
   EXPECT_EQ(websocket_state::closing, testSession.state());
}

TEST_F(websocket_session_test, protocol_violation_fails_connection)
{
   struct test_case final
   {
      std::vector<std::byte> bytes;
      websocket_error expectedError;
      uint16_t expectedCloseCode;
   };
   std::vector<test_case> const testCases
   {
      test_case
      {
         .bytes = {std::byte{0xC1,}, std::byte{0x00,},},
         .expectedError = websocket_error::frame_reserved_bits_set,
         .expectedCloseCode = 1002,
      },
      test_case
      {
         .bytes = make_server_frame(websocket_opcode::continuation, "x"),
         .expectedError = websocket_error::frame_unexpected_continuation,
         .expectedCloseCode = 1002,
      },
      test_case
      {
         .bytes = make_server_frame(websocket_opcode::text, "\xC0\xAF"),
         .expectedError = websocket_error::message_invalid_utf8,
         .expectedCloseCode = 1007,
      },
      test_case
      {
         .bytes = make_server_frame(websocket_opcode::binary, std::vector<std::byte>(test_max_message_size + 1)),
         .expectedError = websocket_error::message_too_big,
         .expectedCloseCode = 1009,
      },
      test_case
      {
         .bytes = make_server_frame(websocket_opcode::close, make_close_payload(1004, "")),
         .expectedError = websocket_error::close_code_invalid,
         .expectedCloseCode = 1002,
      },
   };
   for (auto const &testCase : testCases)
   {
      testing::StrictMock<test_websocket_session> testCaseSession{};
      testCaseSession.start_connecting(test_config());
      std::vector<std::byte> testRequestBytes{};
      testCaseSession.start_handshake(testRequestBytes);
      std::string const testRequest{as_string_view(testRequestBytes),};
      auto const testKeyPosition{testRequest.find("Sec-WebSocket-Key: "),};
      ASSERT_NE(std::string::npos, testKeyPosition);
      sha1_context testSha1Context{};
      std::string testResponse{"HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\nSec-WebSocket-Accept: ",};
      testResponse.append(make_sec_websocket_accept(testRequest.substr(testKeyPosition + 19, 24), testSha1Context).value());
      testResponse.append("\r\n\r\n");
      EXPECT_CALL(testCaseSession, io_handshake_completed(std::error_code{})).Times(1);
      testCaseSession.handle_bytes_received(as_bytes(testResponse));

      std::vector<std::byte> testCloseBytes{};
      testing::InSequence const testSequence{};
      EXPECT_CALL(testCaseSession, io_frame_to_send(testing::_))
         .WillOnce(
            [&testCloseBytes] (std::vector<std::byte> const &testBytes)
            {
               testCloseBytes = testBytes;
            }
         )
      ;
      EXPECT_CALL(testCaseSession, io_ready_to_shutdown()).Times(1);
      testCaseSession.handle_bytes_received(testCase.bytes);
      EXPECT_EQ(websocket_state::closing, testCaseSession.state());
      auto const testCloseFrame{decode_client_frame(testCloseBytes),};
      EXPECT_EQ(websocket_opcode::close, testCloseFrame.opcode);
      EXPECT_EQ(make_close_payload(testCase.expectedCloseCode, ""), testCloseFrame.payload);

      /// Whatever follows the violation is ignored
      testCaseSession.handle_bytes_received(make_server_frame(websocket_opcode::text, "ignored"));
      auto const testErrorCode{make_error_code(testCase.expectedError),};
      EXPECT_CALL(testCaseSession, io_closed(testErrorCode)).Times(1);
      testCaseSession.handle_stream_closed(std::error_code{});
      EXPECT_EQ(websocket_state::closed, testCaseSession.state());
      EXPECT_EQ(websocket_error_kind::protocol, testErrorCode);
   }
}

TEST_F(websocket_session_test, connection_lost)
{
   open_session();
   auto const testErrorCode{make_error_code(websocket_error::connection_lost),};
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.handle_stream_closed(std::error_code{});
   EXPECT_EQ(websocket_state::closed, testSession.state());
   EXPECT_EQ(websocket_error_kind::io, testErrorCode);
}

TEST_F(websocket_session_test, connection_lost_mid_frame)
{
   open_session();
   auto const testFrame{make_server_frame(websocket_opcode::binary, random_bytes(100)),};
   testSession.handle_bytes_received(std::span<std::byte const>{testFrame}.first(50));
   EXPECT_CALL(testSession, io_closed(make_error_code(websocket_error::frame_truncated))).Times(1);
   testSession.handle_stream_closed(std::error_code{});
}

TEST_F(websocket_session_test, connection_reset)
{
   open_session();
   auto const testErrorCode{std::make_error_code(std::errc::connection_reset),};
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.handle_stream_closed(testErrorCode);
   EXPECT_EQ(websocket_state::closed, testSession.state());
}

TEST_F(websocket_session_test, aborted)
{
   open_session();
   auto const testErrorCode{make_error_code(websocket_error::connection_closed),};
   EXPECT_CALL(testSession, io_closed(testErrorCode)).Times(1);
   testSession.abort(testErrorCode);
   EXPECT_EQ(websocket_state::closed, testSession.state());
   /// Closed is terminal
   testSession.abort(testErrorCode);
   testSession.handle_stream_closed(std::error_code{});
   testSession.handle_timeout();
}

}
