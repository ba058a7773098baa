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

#include <cstdint> ///< for uint32_t
#include <optional> ///< for std::nullopt, std::optional

namespace websockets
{

enum struct cpu_id : uint32_t
{};

class thread_config final
{
public:
   static constexpr uint32_t default_ring_capacity{256,};

   [[maybe_unused, nodiscard]] thread_config() noexcept = default;
   [[maybe_unused, nodiscard]] thread_config(thread_config &&rhs) noexcept = default;
   [[maybe_unused, nodiscard]] thread_config(thread_config const &rhs) noexcept = default;

   [[maybe_unused]] thread_config &operator = (thread_config &&rhs) noexcept = default;
   [[maybe_unused]] thread_config &operator = (thread_config const &rhs) noexcept = default;

   [[maybe_unused, nodiscard]] std::optional<cpu_id> kernel_thread_affinity() const noexcept
   {
      return m_kernelThreadAffinity;
   }

   [[maybe_unused, nodiscard]] uint32_t ring_capacity() const noexcept
   {
      return m_ringCapacity;
   }

   [[maybe_unused, nodiscard]] std::optional<cpu_id> worker_affinity() const noexcept
   {
      return m_workerAffinity;
   }

   /// Enables a kernel submission polling thread pinned to the given core
   [[nodiscard]] thread_config with_kernel_thread_affinity(cpu_id value) const noexcept;
   [[nodiscard]] thread_config with_ring_capacity(uint32_t value) const noexcept;
   [[nodiscard]] thread_config with_worker_affinity(cpu_id value) const noexcept;

private:
   std::optional<cpu_id> m_workerAffinity{std::nullopt,};
   std::optional<cpu_id> m_kernelThreadAffinity{std::nullopt,};
   uint32_t m_ringCapacity{default_ring_capacity,};
};

}
