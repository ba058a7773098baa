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

#include "linux/socket_address_resolver.hpp" ///< for websockets::resolved_socket_address
#include "linux/socket_operation.hpp" ///< for websockets::socket_operation, websockets::socket_operation_type
#include "websockets/time.hpp" ///< for websockets::steady_time

#include <array> ///< for std::array
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for int32_t, uint32_t, uint8_t
#include <optional> ///< for std::optional
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

enum struct socket_status : uint8_t
{
   none,
   connect,
   ready,
   close,
};

/// TCP connection driven by websocket_thread_worker, every io_* hook is called on the worker thread
class websocket_socket
{
public:
   static constexpr size_t recv_buffer_size{16 * 1024,};

   websocket_socket(websocket_socket &&) = delete;
   websocket_socket(websocket_socket const &) = delete;
   virtual ~websocket_socket() = default;

   websocket_socket &operator = (websocket_socket &&) = delete;
   websocket_socket &operator = (websocket_socket const &) = delete;

protected:
   [[nodiscard]] websocket_socket() noexcept = default;

private:
   friend class websocket_thread_worker;

   socket_operation m_connectOperation{this, socket_operation_type::connect,};
   socket_operation m_recvOperation{this, socket_operation_type::recv,};
   socket_operation m_sendOperation{this, socket_operation_type::send,};
   socket_operation m_shutdownOperation{this, socket_operation_type::shutdown,};
   socket_operation m_cancelOperation{this, socket_operation_type::cancel,};
   socket_operation m_closeOperation{this, socket_operation_type::close,};
   std::vector<resolved_socket_address> m_addresses{};
   size_t m_addressIndex{0,};
   std::error_code m_connectErrorCode{};
   std::array<std::byte, recv_buffer_size> m_recvBuffer;
   /// Bytes of the send task in flight, then bytes queued behind it
   std::vector<std::byte> m_sendBytes{};
   size_t m_sendOffset{0,};
   std::vector<std::byte> m_queuedBytes{};
   int32_t m_socket{-1,};
   uint32_t m_operationsCount{0,};
   socket_status m_status{socket_status::none,};
   bool m_sendActive{false,};
   bool m_recvPaused{false,};
   bool m_shutdownRequested{false,};
   bool m_cancelActive{false,};

   /// Aborts the connection, the worker is stopping
   virtual void io_aborted(std::error_code const &errorCode) = 0;
   /// Connected to one of the addresses, or failed to connect to any of them
   virtual void io_connected(std::error_code const &errorCode) = 0;
   [[nodiscard]] virtual std::optional<steady_time> io_deadline() const noexcept = 0;
   virtual void io_received(std::span<std::byte const> bytes) = 0;
   /// Checked after every received chunk, recv is not rearmed until websocket_thread_worker::resume_recv
   [[nodiscard]] virtual bool io_recv_paused() const noexcept = 0;
   /// End of the inbound stream, errorCode is empty when the peer shut down gracefully
   virtual void io_recv_closed(std::error_code const &errorCode) = 0;
   /// Every queued byte has been written, or writing failed
   virtual void io_sent(std::error_code const &errorCode) = 0;
   virtual void io_socket_closed() = 0;
   virtual void io_timeout() = 0;
};

}
