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

#include "linux/socket_operation.hpp" ///< for websockets::socket_operation
#include "websockets/thread_config.hpp" ///< for websockets::thread_config

#include <linux/time_types.h> ///< for __kernel_timespec
#include <signal.h> ///< for sigset_t
#include <sys/socket.h> ///< for sockaddr, socklen_t

#include <cstddef> ///< for std::byte
#include <cstdint> ///< for int32_t, intptr_t
#include <memory> ///< for std::unique_ptr
#include <span> ///< for std::span

namespace websockets
{

class websocket_uring
{
public:
   /// Receives the completions drained by poll
   class completion_handler
   {
   public:
      completion_handler(completion_handler &&) = delete;
      completion_handler(completion_handler const &) = delete;

      completion_handler &operator = (completion_handler &&) = delete;
      completion_handler &operator = (completion_handler const &) = delete;

      /// Another thread woke the ring up
      virtual void handle_wakeup() = 0;
      virtual void handle_completion(socket_operation &socketOperation, int32_t result) = 0;

   protected:
      [[nodiscard]] completion_handler() noexcept = default;
      ~completion_handler() = default;
   };

   websocket_uring(websocket_uring &&) = delete;
   websocket_uring(websocket_uring const &) = delete;
   virtual ~websocket_uring() = default;

   websocket_uring &operator = (websocket_uring &&) = delete;
   websocket_uring &operator = (websocket_uring const &) = delete;

   /// Cancels every task in flight on the socket
   virtual void prep_cancel(socket_operation &socketOperation, int32_t socket) = 0;
   virtual void prep_close(socket_operation &socketOperation, int32_t socket) = 0;
   virtual void prep_connect(socket_operation &socketOperation, int32_t socket, sockaddr const &socketAddress, socklen_t socketAddressLength) = 0;
   virtual void prep_recv(socket_operation &socketOperation, int32_t socket, std::span<std::byte> buffer) = 0;
   virtual void prep_send(socket_operation &socketOperation, int32_t socket, std::span<std::byte const> bytes) = 0;
   virtual void prep_shutdown(socket_operation &socketOperation, int32_t socket, int32_t how) = 0;

   /// Returns the number of tasks still in flight, the eventfd read included
   [[nodiscard]] virtual intptr_t poll(completion_handler &completionHandler, __kernel_timespec *timeout, sigset_t &sigmask) = 0;
   virtual void stop() = 0;
   virtual void wake() = 0;

   [[nodiscard]] static std::unique_ptr<websocket_uring> construct(thread_config const &threadConfig);

protected:
   [[nodiscard]] websocket_uring() noexcept = default;
};

}
