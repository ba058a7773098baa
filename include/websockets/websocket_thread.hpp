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

#include "websockets/thread_config.hpp" ///< for websockets::thread_config

#include <functional> ///< for std::function
#include <memory> ///< for std::shared_ptr

namespace websockets
{

/// I/O thread multiplexing any number of websocket clients over one io_uring instance.
/// Copies share the same thread, which stops once the last copy is destroyed.
class websocket_thread final
{
public:
   websocket_thread() = delete;
   [[nodiscard]] websocket_thread(websocket_thread &&rhs) noexcept;
   [[nodiscard]] websocket_thread(websocket_thread const &rhs) noexcept;
   [[nodiscard]] explicit websocket_thread(thread_config const &threadConfig);
   ~websocket_thread();

   websocket_thread &operator = (websocket_thread &&) = delete;
   websocket_thread &operator = (websocket_thread const &) = delete;

   /// Runs the routine on the I/O thread and waits for it to return
   void execute(std::function<void()> const &ioRoutine) const;

private:
   friend class websocket_client;

   class websocket_thread_impl;
   std::shared_ptr<websocket_thread_impl> const m_impl;
};

}
