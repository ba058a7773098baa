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

#include "websockets/thread_config.hpp" ///< for websockets::thread_config
#include "websockets/websocket_thread.hpp" ///< for websockets::websocket_thread
#include "websocket_thread_impl.hpp" ///< for websockets::websocket_thread::websocket_thread_impl

#include <cassert> ///< for assert
#include <functional> ///< for std::function
#include <memory> ///< for std::make_shared

namespace websockets
{

websocket_thread::websocket_thread(websocket_thread &&rhs) noexcept = default;
websocket_thread::websocket_thread(websocket_thread const &rhs) noexcept = default;

websocket_thread::websocket_thread(thread_config const &threadConfig) :
   m_impl{std::make_shared<websocket_thread_impl>(threadConfig),}
{}

websocket_thread::~websocket_thread() = default;

void websocket_thread::execute(std::function<void()> const &ioRoutine) const
{
   assert(true == (bool{ioRoutine,}));
   m_impl->worker().execute(ioRoutine);
}

}
