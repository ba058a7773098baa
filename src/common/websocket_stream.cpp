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

#include "common/websocket_stream.hpp" ///< for websockets::websocket_stream

#include <cstddef> ///< for std::byte
#include <memory> ///< for std::make_unique, std::unique_ptr
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

namespace
{

class plain_websocket_stream final : public websocket_stream
{
public:
   [[nodiscard]] plain_websocket_stream() noexcept = default;

   [[nodiscard]] std::error_code start(std::vector<std::byte> &) override
   {
      return std::error_code{};
   }

   [[nodiscard]] bool ready() const noexcept override
   {
      return true;
   }

   [[nodiscard]] std::error_code decode(
      std::span<std::byte const> const inboundBytes,
      std::vector<std::byte> &plaintextBytes,
      std::vector<std::byte> &
   ) override
   {
      plaintextBytes.insert(plaintextBytes.end(), inboundBytes.begin(), inboundBytes.end());
      return std::error_code{};
   }

   [[nodiscard]] std::error_code encode(std::span<std::byte const> const plaintextBytes, std::vector<std::byte> &outboundBytes) override
   {
      outboundBytes.insert(outboundBytes.end(), plaintextBytes.begin(), plaintextBytes.end());
      return std::error_code{};
   }

   void shutdown(std::vector<std::byte> &) override
   {}

   [[nodiscard]] bool peer_closed() const noexcept override
   {
      return false;
   }
};

}

std::unique_ptr<websocket_stream> make_plain_websocket_stream()
{
   return std::make_unique<plain_websocket_stream>();
}

}
