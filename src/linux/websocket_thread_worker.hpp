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

#include "common/logger.hpp" ///< for websockets::log_error, websockets::log_system_error
#include "common/thread_task.hpp" ///< for websockets::thread_task
#include "common/utility.hpp" ///< for websockets::unreachable
#include "linux/socket_address_resolver.hpp" ///< for websockets::resolved_socket_address
#include "linux/socket_operation.hpp" ///< for websockets::log_socket_error, websockets::socket_operation, websockets::socket_operation_type
#include "linux/thread_affinity.hpp" ///< for websockets::set_thread_affinity
#include "linux/uring_command_queue.hpp" ///< for websockets::uring_command, websockets::uring_command_queue, websockets::uring_command_type
#include "linux/websocket_socket.hpp" ///< for websockets::socket_status, websockets::websocket_socket
#include "linux/websocket_uring.hpp" ///< for websockets::websocket_uring
#include "websockets/thread_config.hpp" ///< for websockets::thread_config
#include "websockets/time.hpp" ///< for websockets::steady_clock, websockets::steady_time

#include <linux/time_types.h> ///< for __kernel_timespec
#include <netinet/in.h> ///< for IPPROTO_TCP
#include <netinet/tcp.h> ///< for TCP_NODELAY
#include <signal.h> ///< for sigfillset, sigset_t
#include <sys/socket.h> ///< for setsockopt, SHUT_WR, SOCK_CLOEXEC, SOCK_NONBLOCK, SOCK_STREAM, socket, sockaddr
#include <unistd.h> ///< for close

#include <algorithm> ///< for std::max, std::min
#include <bit> ///< for std::bit_cast
#include <cassert> ///< for assert
#include <cerrno> ///< for ECANCELED, ENOENT, ENOTCONN, errno
#include <chrono> ///< for std::chrono::duration_cast, std::chrono::nanoseconds, std::chrono::seconds
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for int32_t, intptr_t
#include <functional> ///< for std::function
#include <future> ///< for std::promise
#include <memory> ///< for std::addressof, std::make_shared, std::make_unique, std::shared_ptr, std::unique_ptr
#include <optional> ///< for std::nullopt, std::optional
#include <source_location> ///< for std::source_location
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code, std::errc, std::generic_category, std::make_error_code
#include <thread> ///< for std::jthread, std::this_thread
#include <unordered_map> ///< for std::unordered_map
#include <utility> ///< for std::move, std::swap
#include <vector> ///< for std::vector

namespace websockets
{

class websocket_thread_worker final : public websocket_uring::completion_handler
{
public:
   websocket_thread_worker() = delete;
   websocket_thread_worker(websocket_thread_worker &&) = delete;
   websocket_thread_worker(websocket_thread_worker const &) = delete;

   [[nodiscard]] explicit websocket_thread_worker(std::unique_ptr<websocket_uring> websocketUring) :
      m_websocketUring{std::move(websocketUring),}
   {
      assert(nullptr != m_websocketUring);
   }

   ~websocket_thread_worker() override
   {
      assert(true == m_sockets.empty());
   }

   websocket_thread_worker &operator = (websocket_thread_worker &&) = delete;
   websocket_thread_worker &operator = (websocket_thread_worker const &) = delete;

   /// Runs the routine on the worker thread and waits for it
   void execute(std::function<void()> const &ioRoutine)
   {
      assert(true == bool{ioRoutine,});
      if (std::this_thread::get_id() == m_threadId)
      {
         ioRoutine();
      }
      else
      {
         thread_task ioTask{.routine{ioRoutine},};
         m_uringCommandQueue.push(uring_command{.type = uring_command_type::execute, .task = std::addressof(ioTask),});
         m_websocketUring->wake();
         ioTask.completionFuture.wait();
      }
   }

   /// Runs the routine on the worker thread later, never inline
   void post(std::function<void()> ioRoutine)
   {
      assert(true == bool{ioRoutine,});
      m_uringCommandQueue.push(
         uring_command
         {
            .type = uring_command_type::post,
            .ownedTask = std::make_unique<thread_task>(thread_task{.routine{std::move(ioRoutine),},}),
         }
      );
      m_websocketUring->wake();
   }

   void stop()
   {
      m_uringCommandQueue.push(uring_command{.type = uring_command_type::stop,});
      m_websocketUring->wake();
   }

   [[nodiscard]] bool is_worker_thread() const noexcept
   {
      return std::this_thread::get_id() == m_threadId;
   }

   /// Tries the addresses in order until one accepts the connection
   void connect(std::shared_ptr<websocket_socket> const &socket, std::vector<resolved_socket_address> addresses)
   {
      assert(true == is_worker_thread());
      assert(nullptr != socket);
      assert(socket_status::none == socket->m_status);
      assert(false == addresses.empty());
      if (false == m_running) [[unlikely]]
      {
         socket->io_connected(std::make_error_code(std::errc::operation_canceled));
         return;
      }
      m_sockets.emplace(socket.get(), socket);
      socket->m_addresses = std::move(addresses);
      socket->m_addressIndex = 0;
      socket->m_status = socket_status::connect;
      connect_next_address(*socket);
   }

   void send(websocket_socket &socket, std::span<std::byte const> const bytes)
   {
      assert(true == is_worker_thread());
      if ((socket_status::ready != socket.m_status) || (true == socket.m_shutdownRequested) || (true == bytes.empty())) [[unlikely]]
      {
         return;
      }
      socket.m_queuedBytes.insert(socket.m_queuedBytes.end(), bytes.begin(), bytes.end());
      if (false == socket.m_sendActive)
      {
         send_queued_bytes(socket);
      }
   }

   /// Rearms recv paused by websocket_socket::io_recv_paused
   void resume_recv(websocket_socket &socket)
   {
      assert(true == is_worker_thread());
      if ((true == socket.m_recvPaused) && (socket_status::ready == socket.m_status))
      {
         socket.m_recvPaused = false;
         prep_recv(socket);
      }
   }

   /// Ends the outbound direction once every queued byte is written
   void shutdown_write(websocket_socket &socket)
   {
      assert(true == is_worker_thread());
      if ((socket_status::ready != socket.m_status) || (true == socket.m_shutdownRequested))
      {
         return;
      }
      socket.m_shutdownRequested = true;
      if (false == socket.m_sendActive)
      {
         prep_shutdown_write(socket);
      }
   }

   /// Cancels every task in flight and closes the socket, io_socket_closed follows
   void close(websocket_socket &socket)
   {
      assert(true == is_worker_thread());
      switch (socket.m_status)
      {
      case socket_status::none:
      {
         socket.io_socket_closed();
      }
      return;

      case socket_status::connect: [[fallthrough]];
      case socket_status::ready:
      {
         socket.m_status = socket_status::close;
         close_when_idle(socket);
      }
      return;

      case socket_status::close:
      return;
      }
      unreachable();
   }

   [[nodiscard]] static std::jthread start(thread_config const &threadConfig, std::promise<std::shared_ptr<websocket_thread_worker>> &workerPromise)
   {
      return std::jthread
      {
         [&threadConfig, &workerPromise] ()
         {
            if (true == threadConfig.worker_affinity().has_value())
            {
               if (auto const returnCode{set_thread_affinity(threadConfig.worker_affinity().value()),}; 0 != returnCode)
               {
                  log_system_error("[websocket_thread] failed to pin thread to cpu core: ({}) - {}", returnCode);
                  unreachable();
               }
            }
            auto const threadWorker{std::make_shared<websocket_thread_worker>(websocket_uring::construct(threadConfig)),};
            workerPromise.set_value(threadWorker);
            threadWorker->run();
         }
      };
   }

private:
   std::thread::id const m_threadId{std::this_thread::get_id(),};
   uring_command_queue m_uringCommandQueue{};
   std::unique_ptr<websocket_uring> const m_websocketUring;
   std::unordered_map<websocket_socket *, std::shared_ptr<websocket_socket>> m_sockets{};
   bool m_running{true,};

   void close_when_idle(websocket_socket &socket)
   {
      assert(socket_status::close == socket.m_status);
      if (0 < socket.m_operationsCount)
      {
         if ((false == socket.m_cancelActive) && (-1 != socket.m_socket))
         {
            socket.m_cancelActive = true;
            prep(socket, socket.m_cancelOperation, [&socket] (auto &uring, auto &operation) { uring.prep_cancel(operation, socket.m_socket); });
         }
         return;
      }
      if (-1 != socket.m_socket)
      {
         prep(socket, socket.m_closeOperation, [&socket] (auto &uring, auto &operation) { uring.prep_close(operation, socket.m_socket); });
         socket.m_socket = -1;
         return;
      }
      release_socket(socket);
   }

   void connect_next_address(websocket_socket &socket)
   {
      assert(socket_status::connect == socket.m_status);
      assert(-1 == socket.m_socket);
      while (socket.m_addresses.size() > socket.m_addressIndex)
      {
         auto const &resolvedAddress{socket.m_addresses[socket.m_addressIndex],};
         auto const tcpSocket{::socket(resolvedAddress.address.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP),};
         if (-1 == tcpSocket) [[unlikely]]
         {
            socket.m_connectErrorCode = std::error_code{errno, std::generic_category(),};
            log_socket_error(socket_operation_type::socket, socket.m_connectErrorCode);
            ++socket.m_addressIndex;
            continue;
         }
         int const tcpNoDelay{1,};
         if (-1 == setsockopt(tcpSocket, IPPROTO_TCP, TCP_NODELAY, std::addressof(tcpNoDelay), sizeof(tcpNoDelay))) [[unlikely]]
         {
            log_socket_error(socket_operation_type::setopt_tcp_nodelay, std::error_code{errno, std::generic_category(),});
         }
         socket.m_socket = tcpSocket;
         prep(
            socket,
            socket.m_connectOperation,
            [&socket, &resolvedAddress] (auto &uring, auto &operation)
            {
               uring.prep_connect(
                  operation,
                  socket.m_socket,
                  *std::bit_cast<sockaddr const *>(std::addressof(resolvedAddress.address)),
                  resolvedAddress.addressLength
               );
            }
         );
         return;
      }
      assert(true == bool{socket.m_connectErrorCode,});
      socket.m_status = socket_status::close;
      socket.io_connected(socket.m_connectErrorCode);
      close_when_idle(socket);
   }

   void handle_connect_completion(websocket_socket &socket, int32_t const result)
   {
      if (socket_status::close == socket.m_status)
      {
         close_when_idle(socket);
         return;
      }
      assert(socket_status::connect == socket.m_status);
      if (0 > result)
      {
         socket.m_connectErrorCode = std::error_code{-result, std::generic_category(),};
         log_socket_error(socket_operation_type::connect, socket.m_connectErrorCode);
         if (-1 == ::close(socket.m_socket)) [[unlikely]]
         {
            log_socket_error(socket_operation_type::close, std::error_code{errno, std::generic_category(),});
         }
         socket.m_socket = -1;
         ++socket.m_addressIndex;
         connect_next_address(socket);
         return;
      }
      socket.m_status = socket_status::ready;
      socket.m_addresses.clear();
      prep_recv(socket);
      socket.io_connected(std::error_code{});
   }

   void handle_recv_completion(websocket_socket &socket, int32_t const result)
   {
      if (socket_status::close == socket.m_status)
      {
         close_when_idle(socket);
         return;
      }
      if (0 < result) [[likely]]
      {
         socket.io_received(std::span<std::byte const>{socket.m_recvBuffer.data(), static_cast<size_t>(result),});
         if ((socket_status::ready == socket.m_status) && (true == socket.io_recv_paused()))
         {
            socket.m_recvPaused = true;
         }
         else if (socket_status::ready == socket.m_status)
         {
            prep_recv(socket);
         }
         else if (socket_status::close == socket.m_status)
         {
            close_when_idle(socket);
         }
         return;
      }
      std::error_code errorCode{};
      if (0 > result)
      {
         errorCode.assign(-result, std::generic_category());
         log_socket_error(socket_operation_type::recv, errorCode);
      }
      socket.io_recv_closed(errorCode);
      if (socket_status::close == socket.m_status)
      {
         close_when_idle(socket);
      }
   }

   void handle_send_completion(websocket_socket &socket, int32_t const result)
   {
      if (socket_status::close == socket.m_status)
      {
         socket.m_sendActive = false;
         close_when_idle(socket);
         return;
      }
      if (0 > result) [[unlikely]]
      {
         std::error_code const errorCode{-result, std::generic_category(),};
         log_socket_error(socket_operation_type::send, errorCode);
         socket.m_sendActive = false;
         socket.m_sendBytes.clear();
         socket.m_queuedBytes.clear();
         socket.io_sent(errorCode);
         if (socket_status::close == socket.m_status)
         {
            close_when_idle(socket);
         }
         return;
      }
      socket.m_sendOffset += static_cast<size_t>(result);
      assert(socket.m_sendBytes.size() >= socket.m_sendOffset);
      if (socket.m_sendBytes.size() > socket.m_sendOffset)
      {
         prep_send(socket);
         return;
      }
      socket.m_sendActive = false;
      if (false == socket.m_queuedBytes.empty())
      {
         send_queued_bytes(socket);
         return;
      }
      if (true == socket.m_shutdownRequested)
      {
         prep_shutdown_write(socket);
      }
      socket.io_sent(std::error_code{});
      if (socket_status::close == socket.m_status)
      {
         close_when_idle(socket);
      }
   }

   void handle_wakeup() override
   {
      assert(true == is_worker_thread());
      m_uringCommandQueue.handle(
         [this] (uring_command &uringCommand)
         {
            switch (uringCommand.type)
            {
            case uring_command_type::execute:
            {
               assert(nullptr != uringCommand.task);
               handle_thread_task(*uringCommand.task);
            }
            break;

            case uring_command_type::post:
            {
               assert(nullptr != uringCommand.ownedTask);
               handle_thread_task(*uringCommand.ownedTask);
            }
            break;

            [[unlikely]] case uring_command_type::stop:
            {
               handle_stop();
            }
            break;
            }
         }
      );
   }

   void handle_stop()
   {
      if (false == m_running)
      {
         return;
      }
      m_running = false;
      std::vector<std::shared_ptr<websocket_socket>> sockets{};
      sockets.reserve(m_sockets.size());
      for (auto const &registeredSocket : m_sockets)
      {
         sockets.push_back(registeredSocket.second);
      }
      for (auto const &socket : sockets)
      {
         socket->io_aborted(std::make_error_code(std::errc::operation_canceled));
         close(*socket);
      }
      m_websocketUring->stop();
   }

   void handle_completion(socket_operation &socketOperation, int32_t const result) override
   {
      assert(true == is_worker_thread());
      assert(nullptr != socketOperation.socket);
      auto const socketIterator{m_sockets.find(socketOperation.socket),};
      assert(m_sockets.end() != socketIterator);
      /// Keeps the socket alive while its hooks run
      auto const socket{socketIterator->second,};
      assert(0 < socket->m_operationsCount);
      --socket->m_operationsCount;
      switch (socketOperation.type)
      {
      case socket_operation_type::connect:
      {
         handle_connect_completion(*socket, result);
      }
      return;

      case socket_operation_type::recv:
      {
         handle_recv_completion(*socket, result);
      }
      return;

      case socket_operation_type::send:
      {
         handle_send_completion(*socket, result);
      }
      return;

      case socket_operation_type::shutdown:
      {
         if ((0 > result) && (ENOTCONN != -result) && (ECANCELED != -result)) [[unlikely]]
         {
            log_socket_error(socket_operation_type::shutdown, std::error_code{-result, std::generic_category(),});
         }
         if (socket_status::close == socket->m_status)
         {
            close_when_idle(*socket);
         }
      }
      return;

      case socket_operation_type::cancel:
      {
         if ((0 > result) && (ENOENT != -result)) [[unlikely]]
         {
            log_socket_error(socket_operation_type::cancel, std::error_code{-result, std::generic_category(),});
         }
         socket->m_cancelActive = false;
         close_when_idle(*socket);
      }
      return;

      case socket_operation_type::close:
      {
         if (0 > result) [[unlikely]]
         {
            log_socket_error(socket_operation_type::close, std::error_code{-result, std::generic_category(),});
         }
         close_when_idle(*socket);
      }
      return;

      [[unlikely]] case socket_operation_type::none: [[fallthrough]];
      [[unlikely]] case socket_operation_type::socket: [[fallthrough]];
      [[unlikely]] case socket_operation_type::setopt_tcp_nodelay:
      break;
      }
      log_error(std::source_location::current(), "[websocket_thread] unexpected completion of socket operation, it must be a bug");
      unreachable();
   }

   void handle_thread_task(thread_task &task)
   {
      assert(task.routine);
      task.routine();
      task.completionPromise.set_value();
   }

   void handle_timeouts()
   {
      auto const now{steady_clock::now(),};
      std::vector<std::shared_ptr<websocket_socket>> expiredSockets{};
      for (auto const &registeredSocket : m_sockets)
      {
         if (auto const deadline{registeredSocket.second->io_deadline(),}; (true == deadline.has_value()) && (now >= deadline.value()))
         {
            expiredSockets.push_back(registeredSocket.second);
         }
      }
      for (auto const &socket : expiredSockets)
      {
         socket->io_timeout();
      }
   }

   [[nodiscard]] std::optional<steady_time> nearest_deadline() const
   {
      std::optional<steady_time> nearestDeadline{std::nullopt,};
      for (auto const &registeredSocket : m_sockets)
      {
         if (auto const deadline{registeredSocket.second->io_deadline(),}; true == deadline.has_value())
         {
            nearestDeadline = (true == nearestDeadline.has_value()) ? std::min(nearestDeadline.value(), deadline.value()) : deadline.value();
         }
      }
      return nearestDeadline;
   }

   template<typename prep_routine>
   void prep(websocket_socket &socket, socket_operation &socketOperation, prep_routine &&prepRoutine)
   {
      assert(std::addressof(socket) == socketOperation.socket);
      prepRoutine(*m_websocketUring, socketOperation);
      ++socket.m_operationsCount;
   }

   void prep_recv(websocket_socket &socket)
   {
      prep(
         socket,
         socket.m_recvOperation,
         [&socket] (auto &uring, auto &operation)
         {
            uring.prep_recv(operation, socket.m_socket, std::span<std::byte>{socket.m_recvBuffer,});
         }
      );
   }

   void prep_send(websocket_socket &socket)
   {
      assert(socket.m_sendBytes.size() > socket.m_sendOffset);
      prep(
         socket,
         socket.m_sendOperation,
         [&socket] (auto &uring, auto &operation)
         {
            uring.prep_send(operation, socket.m_socket, std::span<std::byte const>{socket.m_sendBytes,}.subspan(socket.m_sendOffset));
         }
      );
   }

   void prep_shutdown_write(websocket_socket &socket)
   {
      prep(socket, socket.m_shutdownOperation, [&socket] (auto &uring, auto &operation) { uring.prep_shutdown(operation, socket.m_socket, SHUT_WR); });
   }

   void release_socket(websocket_socket &socket)
   {
      assert(0 == socket.m_operationsCount);
      assert(-1 == socket.m_socket);
      auto const socketIterator{m_sockets.find(std::addressof(socket)),};
      if (m_sockets.end() == socketIterator)
      {
         socket.io_socket_closed();
         return;
      }
      auto const releasedSocket{std::move(socketIterator->second),};
      m_sockets.erase(socketIterator);
      releasedSocket->io_socket_closed();
   }

   void run()
   {
      __kernel_timespec ioTimeout{};
      intptr_t tasksCount{0,};
      sigset_t sigmask{};
      if (-1 == sigfillset(std::addressof(sigmask))) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to initialize sigmask: ({}) - {}", errno);
         unreachable();
      }
      do
      {
         handle_timeouts();
         if (auto const deadline{nearest_deadline(),}; true == deadline.has_value())
         {
            auto const now{steady_clock::now(),};
            std::chrono::nanoseconds const timeoutNanoseconds{std::max(deadline.value(), now) - now,};
            auto const timeoutSeconds{std::chrono::duration_cast<std::chrono::seconds>(timeoutNanoseconds),};
            ioTimeout.tv_sec = timeoutSeconds.count();
            ioTimeout.tv_nsec = (timeoutNanoseconds - timeoutSeconds).count();
            tasksCount = m_websocketUring->poll(*this, std::addressof(ioTimeout), sigmask);
         }
         else
         {
            tasksCount = m_websocketUring->poll(*this, nullptr, sigmask);
         }
      } while (tasksCount > 0);
   }

   void send_queued_bytes(websocket_socket &socket)
   {
      assert(false == socket.m_sendActive);
      assert(false == socket.m_queuedBytes.empty());
      socket.m_sendBytes.clear();
      std::swap(socket.m_sendBytes, socket.m_queuedBytes);
      socket.m_sendOffset = 0;
      socket.m_sendActive = true;
      prep_send(socket);
   }
};

}
