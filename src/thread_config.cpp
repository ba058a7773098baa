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

#include "websockets/thread_config.hpp" ///< for websockets::cpu_id, websockets::thread_config

#include <cassert> ///< for assert
#include <cstdint> ///< for uint32_t

namespace websockets
{

thread_config thread_config::with_kernel_thread_affinity(cpu_id const value) const noexcept
{
   thread_config threadConfig{*this,};
   threadConfig.m_kernelThreadAffinity.emplace(value);
   return threadConfig;
}

thread_config thread_config::with_ring_capacity(uint32_t const value) const noexcept
{
   assert(0 < value);
   thread_config threadConfig{*this,};
   threadConfig.m_ringCapacity = value;
   return threadConfig;
}

thread_config thread_config::with_worker_affinity(cpu_id const value) const noexcept
{
   thread_config threadConfig{*this,};
   threadConfig.m_workerAffinity.emplace(value);
   return threadConfig;
}

}
