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

#if (defined(__linux__))
#include "common/logger.hpp" ///< for websockets::log_error, websockets::log_system_error
#include "common/utility.hpp" ///< for websockets::to_underlying, websockets::unreachable
#include "linux/socket_operation.hpp" ///< for websockets::socket_operation
#include "linux/websocket_uring.hpp" ///< for websockets::websocket_uring
#include "websockets/thread_config.hpp" ///< for websockets::thread_config

/// for
///   io_uring,
///   io_uring_cq_advance,
///   io_uring_cqe,
///   io_uring_cqe_get_data,
///   io_uring_for_each_cqe,
///   io_uring_get_sqe,
///   io_uring_params,
///   io_uring_prep_cancel_fd,
///   io_uring_prep_close,
///   io_uring_prep_connect,
///   io_uring_prep_read,
///   io_uring_prep_recv,
///   io_uring_prep_send,
///   io_uring_prep_shutdown,
///   io_uring_queue_exit,
///   io_uring_queue_init_params,
///   io_uring_register_ring_fd,
///   io_uring_ring_dontfork,
///   io_uring_sqe_set_data,
///   io_uring_submit,
///   io_uring_submit_and_wait_timeout,
///   io_uring_unregister_ring_fd,
///   IORING_ASYNC_CANCEL_ALL,
///   IORING_CQE_F_MORE,
///   IORING_FEAT_SINGLE_MMAP,
///   IORING_SETUP_CQSIZE,
///   IORING_SETUP_SQ_AFF,
///   IORING_SETUP_SQPOLL
#include <liburing.h>
#include <linux/time_types.h> ///< for __kernel_timespec
#include <signal.h> ///< for sigset_t
#include <sys/eventfd.h> ///< for EFD_CLOEXEC, EFD_NONBLOCK, eventfd, eventfd_t, eventfd_write
#include <sys/socket.h> ///< for MSG_NOSIGNAL, sockaddr, socklen_t
#include <unistd.h> ///< for close

#include <cassert> ///< for assert
#include <cerrno> ///< for EAGAIN, errno, ETIME
#include <cstddef> ///< for std::byte
#include <cstdint> ///< for int32_t, intptr_t, uint32_t
#include <cstring> ///< for std::memset
#include <memory> ///< for std::addressof, std::make_unique, std::unique_ptr
#include <source_location> ///< for std::source_location
#include <span> ///< for std::span

namespace websockets
{

class websocket_uring_impl final : public websocket_uring
{
private:
   using super = websocket_uring;

public:
   websocket_uring_impl() = delete;
   websocket_uring_impl(websocket_uring_impl &&) = delete;
   websocket_uring_impl(websocket_uring_impl const &) = delete;

   [[nodiscard]] explicit websocket_uring_impl(thread_config const &threadConfig) :
      super{}
   {
      auto const ringCapacity{threadConfig.ring_capacity(),};
      assert(0 < ringCapacity);
      io_uring_params ioRingParams;
      std::memset(std::addressof(ioRingParams), 0, sizeof(ioRingParams));
      ioRingParams.cq_entries = ringCapacity * 2 + 1;
      ioRingParams.flags = IORING_SETUP_CQSIZE;
      if (auto const kernelThreadAffinity{threadConfig.kernel_thread_affinity(),}; true == kernelThreadAffinity.has_value())
      {
         ioRingParams.flags |= IORING_SETUP_SQPOLL | IORING_SETUP_SQ_AFF;
         ioRingParams.sq_thread_cpu = to_underlying(kernelThreadAffinity.value());
         ioRingParams.sq_thread_idle = 100;
      }
      ioRingParams.features = IORING_FEAT_SINGLE_MMAP;
      if (
         auto const returnCode{io_uring_queue_init_params(ringCapacity + 1, std::addressof(m_ring), std::addressof(ioRingParams)),};
         0 > returnCode
      ) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to initialize the ring: ({}) - {}", -returnCode);
         unreachable();
      }
      if (auto const returnCode{io_uring_register_ring_fd(std::addressof(m_ring)),}; 0 > returnCode) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to register ring descriptor: ({}) - {}", -returnCode);
      }
      if (auto const returnCode{io_uring_ring_dontfork(std::addressof(m_ring)),}; 0 > returnCode) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to disable inheriting of the ring mappings: ({}) - {}", -returnCode);
      }
      if (-1 == (m_eventfd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC))) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to create eventfd: ({}) - {}", errno);
         unreachable();
      }
      prep_read_eventfd();
   }

   ~websocket_uring_impl() override
   {
      assert(-1 != m_eventfd);
      if (-1 == close(m_eventfd)) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to destroy eventfd: ({}) - {}", errno);
      }
      if (auto const returnCode{io_uring_unregister_ring_fd(std::addressof(m_ring)),}; 0 > returnCode) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to unregister ring descriptor: ({}) - {}", -returnCode);
      }
      io_uring_queue_exit(std::addressof(m_ring));
   }

   websocket_uring_impl &operator = (websocket_uring_impl &&) = delete;
   websocket_uring_impl &operator = (websocket_uring_impl const &) = delete;

   void prep_cancel(socket_operation &socketOperation, int32_t const socket) override
   {
      assert(-1 != socket);
      io_uring_prep_cancel_fd(std::addressof(submission_queue_entry(std::addressof(socketOperation))), socket, IORING_ASYNC_CANCEL_ALL);
   }

   void prep_close(socket_operation &socketOperation, int32_t const socket) override
   {
      assert(-1 != socket);
      io_uring_prep_close(std::addressof(submission_queue_entry(std::addressof(socketOperation))), socket);
   }

   void prep_connect(
      socket_operation &socketOperation,
      int32_t const socket,
      sockaddr const &socketAddress,
      socklen_t const socketAddressLength
   ) override
   {
      assert(-1 != socket);
      io_uring_prep_connect(
         std::addressof(submission_queue_entry(std::addressof(socketOperation))),
         socket,
         std::addressof(socketAddress),
         socketAddressLength
      );
   }

   void prep_recv(socket_operation &socketOperation, int32_t const socket, std::span<std::byte> const buffer) override
   {
      assert(-1 != socket);
      assert(false == buffer.empty());
      io_uring_prep_recv(
         std::addressof(submission_queue_entry(std::addressof(socketOperation))),
         socket,
         buffer.data(),
         buffer.size(),
         0
      );
   }

   void prep_send(socket_operation &socketOperation, int32_t const socket, std::span<std::byte const> const bytes) override
   {
      assert(-1 != socket);
      assert(false == bytes.empty());
      io_uring_prep_send(
         std::addressof(submission_queue_entry(std::addressof(socketOperation))),
         socket,
         bytes.data(),
         bytes.size(),
         MSG_NOSIGNAL
      );
   }

   void prep_shutdown(socket_operation &socketOperation, int32_t const socket, int32_t const how) override
   {
      assert(-1 != socket);
      io_uring_prep_shutdown(std::addressof(submission_queue_entry(std::addressof(socketOperation))), socket, how);
   }

   [[nodiscard]] intptr_t poll(completion_handler &completionHandler, __kernel_timespec *timeout, sigset_t &sigmask) override
   {
      io_uring_cqe *completionQueueEntry{nullptr,};
      if (
         auto const returnCode{io_uring_submit_and_wait_timeout(std::addressof(m_ring), std::addressof(completionQueueEntry), 1, timeout, std::addressof(sigmask)),};
         (0 > returnCode) && (ETIME != -returnCode)
      ) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to submit prepared tasks: ({}) - {}", -returnCode);
         unreachable();
      }
      uint32_t completionQueueHead;
      uint32_t numberOfCompletionQueueEntriesRemoved{0,};
      io_uring_for_each_cqe(std::addressof(m_ring), completionQueueHead, completionQueueEntry)
      {
         assert(0 < m_tasksCount);
         if (IORING_CQE_F_MORE != (IORING_CQE_F_MORE & completionQueueEntry->flags))
         {
            --m_tasksCount;
         }
         auto *userdata{io_uring_cqe_get_data(completionQueueEntry),};
         assert(nullptr != userdata);
         if (this == userdata)
         {
            if ((0 > completionQueueEntry->res) && (EAGAIN != -completionQueueEntry->res)) [[unlikely]]
            {
               log_system_error("[websocket_thread] failed to read eventfd: ({}) - {}", -completionQueueEntry->res);
               unreachable();
            }
            completionHandler.handle_wakeup();
            if (true == m_running) [[likely]]
            {
               prep_read_eventfd();
            }
         }
         else
         {
            completionHandler.handle_completion(*static_cast<socket_operation *>(userdata), completionQueueEntry->res);
         }
         ++numberOfCompletionQueueEntriesRemoved;
      }
      io_uring_cq_advance(std::addressof(m_ring), numberOfCompletionQueueEntriesRemoved);
      return m_tasksCount;
   }

   void stop() override
   {
      assert(true == m_running);
      m_running = false;
   }

   void wake() override
   {
      assert(-1 != m_eventfd);
      if (-1 == eventfd_write(m_eventfd, 1)) [[unlikely]]
      {
         log_system_error("[websocket_thread] failed to raise eventfd: ({}) - {}", errno);
         unreachable();
      }
   }

private:
   io_uring m_ring{};
   intptr_t m_tasksCount{0,};
   int m_eventfd{-1,};
   bool m_running{true,};
   eventfd_t m_eventfdValue{0,};

   void prep_read_eventfd()
   {
      io_uring_prep_read(
         std::addressof(submission_queue_entry(this)),
         m_eventfd,
         std::addressof(m_eventfdValue),
         sizeof(m_eventfdValue),
         0
      );
   }

   [[nodiscard]] io_uring_sqe &submission_queue_entry(void *userdata)
   {
      assert(nullptr != userdata);
      auto *submissionQueueEntry{io_uring_get_sqe(std::addressof(m_ring)),};
      if (nullptr == submissionQueueEntry) [[unlikely]]
      {
         /// Submission queue is full, flush it and try again
         if (auto const returnCode{io_uring_submit(std::addressof(m_ring)),}; 0 > returnCode) [[unlikely]]
         {
            log_system_error("[websocket_thread] failed to submit prepared tasks: ({}) - {}", -returnCode);
            unreachable();
         }
         submissionQueueEntry = io_uring_get_sqe(std::addressof(m_ring));
      }
      if (nullptr == submissionQueueEntry) [[unlikely]]
      {
         log_error(std::source_location::current(), "[websocket_thread] failed to get submission queue entry, please increase ring capacity");
         unreachable();
      }
      io_uring_sqe_set_data(submissionQueueEntry, userdata);
      ++m_tasksCount;
      return *submissionQueueEntry;
   }
};

std::unique_ptr<websocket_uring> websocket_uring::construct(thread_config const &threadConfig)
{
   return std::make_unique<websocket_uring_impl>(threadConfig);
}

}
#endif
