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

#include "linux/websocket_thread_worker.hpp" ///< for websockets::websocket_thread_worker
#include "websockets/thread_config.hpp" ///< for websockets::thread_config
#include "websockets/websocket_thread.hpp" ///< for websockets::websocket_thread

#include <cassert> ///< for assert
#include <future> ///< for std::future, std::promise
#include <memory> ///< for std::shared_ptr
#include <thread> ///< for std::jthread

namespace websockets
{

class websocket_thread::websocket_thread_impl final
{
public:
   websocket_thread_impl() = delete;
   websocket_thread_impl(websocket_thread_impl &&) = delete;
   websocket_thread_impl(websocket_thread_impl const &) = delete;

   [[nodiscard]] explicit websocket_thread_impl(thread_config const &threadConfig)
   {
      std::promise<std::shared_ptr<websocket_thread_worker>> workerPromise{};
      auto workerFuture{workerPromise.get_future(),};
      m_thread = websocket_thread_worker::start(threadConfig, workerPromise);
      m_worker = workerFuture.get();
   }

   ~websocket_thread_impl()
   {
      m_thread.request_stop();
      m_worker->stop();
      m_worker.reset();
      m_thread.join();
   }

   websocket_thread_impl &operator = (websocket_thread_impl &&) = delete;
   websocket_thread_impl &operator = (websocket_thread_impl const &) = delete;

   [[nodiscard]] websocket_thread_worker &worker() const noexcept
   {
      assert(nullptr != m_worker);
      return *m_worker;
   }

private:
   std::shared_ptr<websocket_thread_worker> m_worker{nullptr,};
   std::jthread m_thread{};
};

}
