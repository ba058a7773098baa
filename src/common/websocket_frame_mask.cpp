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

#include "common/websocket_frame_mask.hpp" ///< for websockets::apply_websocket_frame_mask, websockets::generate_websocket_frame_mask
#include "linux/random_generator.hpp" ///< for websockets::random_generator
#include "websockets/websocket_frame.hpp" ///< for websockets::websocket_frame_mask

#include <cstddef> ///< for size_t, std::byte
#include <span> ///< for std::span

namespace websockets
{

void apply_websocket_frame_mask(std::span<std::byte> const bytes, websocket_frame_mask const &websocketFrameMask, size_t const offset) noexcept
{
   for (size_t index{0,}; bytes.size() > index; ++index)
   {
      bytes[index] ^= websocketFrameMask.bytes[(offset + index) % websocket_frame_mask::sizeof_value];
   }
}

websocket_frame_mask generate_websocket_frame_mask(random_generator &randomGenerator)
{
   websocket_frame_mask websocketFrameMask{};
   randomGenerator.generate(websocketFrameMask.bytes.data(), websocketFrameMask.bytes.size());
   return websocketFrameMask;
}

}
