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

#include "common/thread_task.hpp" ///< for websockets::thread_task

#include <cstdint> ///< for uint8_t
#include <memory> ///< for std::unique_ptr
#include <mutex> ///< for std::mutex, std::scoped_lock
#include <utility> ///< for std::move, std::swap
#include <vector> ///< for std::vector

namespace websockets
{

enum struct uring_command_type : uint8_t
{
   /// The caller waits for completion and owns the task
   execute,
   /// The queue owns the task
   post,
   stop,
};

struct uring_command final
{
   uring_command_type type;
   thread_task *task{nullptr,};
   std::unique_ptr<thread_task> ownedTask{nullptr,};
};

/// Commands pushed by any thread, handled by the ring thread in push order
class uring_command_queue final
{
public:
   [[nodiscard]] uring_command_queue() = default;
   uring_command_queue(uring_command_queue &&) = delete;
   uring_command_queue(uring_command_queue const &) = delete;

   uring_command_queue &operator = (uring_command_queue &&) = delete;
   uring_command_queue &operator = (uring_command_queue const &) = delete;

   template<typename handler_type>
   void handle(handler_type &&handler)
   {
      {
         [[maybe_unused]] std::scoped_lock const uringCommandsGuard{m_uringCommandsLock,};
         std::swap(m_uringCommands, m_pendingUringCommands);
      }
      for (auto &uringCommand : m_pendingUringCommands)
      {
         handler(uringCommand);
      }
      m_pendingUringCommands.clear();
   }

   void push(uring_command uringCommand)
   {
      [[maybe_unused]] std::scoped_lock const uringCommandsGuard{m_uringCommandsLock,};
      m_uringCommands.push_back(std::move(uringCommand));
   }

private:
   std::mutex m_uringCommandsLock{};
   std::vector<uring_command> m_uringCommands{};
   std::vector<uring_command> m_pendingUringCommands{};
};

}
