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

#include <websockets/websocket_frame.hpp>

#if (not defined(__clang__) && defined(__GNUC__) && defined(NDEBUG))
#  pragma GCC diagnostic push
#  pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#if (not defined(__clang__) && defined(__GNUC__) && defined(NDEBUG))
#  pragma GCC diagnostic pop
#endif

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace websockets::tests
{

/// Plain TCP peer for the behaviours a conforming server never shows: it runs one script against the first accepted connection
class [[nodiscard]] test_raw_tcp_server final
{
public:
   using test_script = std::function<void(boost::asio::ip::tcp::socket &testSocket)>;

   test_raw_tcp_server() = delete;
   test_raw_tcp_server(test_raw_tcp_server &&) = delete;
   test_raw_tcp_server(test_raw_tcp_server const &) = delete;
   [[nodiscard]] explicit test_raw_tcp_server(test_script testScript);
   ~test_raw_tcp_server();

   test_raw_tcp_server &operator = (test_raw_tcp_server &&) = delete;
   test_raw_tcp_server &operator = (test_raw_tcp_server const &) = delete;

   [[nodiscard]] uint16_t local_port() const;

private:
   boost::asio::io_context m_ioContext{1,};
   boost::asio::ip::tcp::acceptor m_acceptor;
   test_script const m_script;
   std::thread m_thread{};

   void thread_handler();
};

/// Reads the upgrade request, the header block only
[[nodiscard]] std::string read_http_request(boost::asio::ip::tcp::socket &testSocket);
/// Reads the upgrade request and answers 101 Switching Protocols, extra headers must end with CRLF
std::string accept_websocket(boost::asio::ip::tcp::socket &testSocket, std::string_view const &testExtraHeaders = "");
void write_bytes(boost::asio::ip::tcp::socket &testSocket, std::vector<std::byte> const &testBytes);
void write_frame(boost::asio::ip::tcp::socket &testSocket, websocket_frame const &testFrame);
/// Blocks until a whole frame arrived, the frame of a client must be masked
[[nodiscard]] websocket_frame read_frame(boost::asio::ip::tcp::socket &testSocket, std::vector<std::byte> &testInboundBytes);
/// Reads until the client ends its outbound stream
void read_until_eof(boost::asio::ip::tcp::socket &testSocket);

}
