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


#include "common/sec_websocket_key.hpp" ///< for websockets::sec_websocket_key
#include "linux/random_generator.hpp" ///< for websockets::random_generator

#include <array> ///< for std::array
#include <cstddef> ///< for std::byte
#include <span> ///< for std::span

namespace websockets
{

sec_websocket_key generate_sec_websocket_key()
{
   std::array<std::byte, sec_websocket_key_nonce_size> nonce{std::byte{0,},};
   random_generator::generate_secure(nonce.data(), nonce.size());
   return sec_websocket_key{std::span<std::byte const, sec_websocket_key_nonce_size>{nonce},};
}

}
