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

#include "common/websocket_frame_codec.hpp" ///< for websockets::websocket_decode_result, websockets::websocket_decode_status
#include "common/websocket_frame_mask.hpp" ///< for websockets::apply_websocket_frame_mask
#include "common/utility.hpp" ///< for websockets::to_underlying
#include "websockets/websocket_error.hpp" ///< for websockets::make_error_code, websockets::websocket_error
#include "websockets/websocket_frame.hpp" ///< for websockets::is_control_opcode, websockets::websocket_frame, websockets::websocket_opcode

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint8_t, uint16_t, uint64_t
#include <limits> ///< for std::numeric_limits
#include <span> ///< for std::span
#include <system_error> ///< for std::error_code
#include <vector> ///< for std::vector

namespace websockets
{

namespace
{

constexpr std::byte fin_bit{0x80,};
constexpr std::byte reserved_bits{0x70,};
constexpr std::byte opcode_bits{0x0F,};
constexpr std::byte mask_bit{0x80,};
constexpr std::byte length_bits{0x7F,};
constexpr uint8_t length_16bit_marker{126,};
constexpr uint8_t length_64bit_marker{127,};

[[nodiscard]] constexpr bool is_known_opcode(uint8_t const value) noexcept
{
   switch (static_cast<websocket_opcode>(value))
   {
   case websocket_opcode::continuation: [[fallthrough]];
   case websocket_opcode::text: [[fallthrough]];
   case websocket_opcode::binary: [[fallthrough]];
   case websocket_opcode::close: [[fallthrough]];
   case websocket_opcode::ping: [[fallthrough]];
   case websocket_opcode::pong:
   return true;
   }
   return false;
}

[[nodiscard]] websocket_decode_result decode_failure(websocket_error const code)
{
   return websocket_decode_result{.errorCode = make_error_code(code), .status = websocket_decode_status::failed,};
}

[[nodiscard]] websocket_decode_result decode_incomplete(size_t const bytesNeeded)
{
   assert(0 < bytesNeeded);
   return websocket_decode_result{.bytesNeeded = bytesNeeded, .status = websocket_decode_status::incomplete,};
}

}

std::error_code encode_websocket_frame(websocket_frame const &frame, std::vector<std::byte> &bytes)
{
   if (true == is_control_opcode(frame.opcode))
   {
      if (websocket_control_frame_payload_limit < frame.payload.size()) [[unlikely]]
      {
         return make_error_code(websocket_error::frame_control_payload_too_large);
      }
      if (false == frame.fin) [[unlikely]]
      {
         return make_error_code(websocket_error::frame_control_not_finalized);
      }
   }
   auto const payloadSize{static_cast<uint64_t>(frame.payload.size()),};
   bytes.reserve(bytes.size() + websocket_frame_header_size_limit + frame.payload.size());
   bytes.push_back(((true == frame.fin) ? fin_bit : std::byte{0,}) | std::byte{to_underlying(frame.opcode),});
   auto const maskBit{(true == frame.mask.has_value()) ? mask_bit : std::byte{0,},};
   if (length_16bit_marker > payloadSize)
   {
      bytes.push_back(maskBit | std::byte{static_cast<uint8_t>(payloadSize),});
   }
   else if (std::numeric_limits<uint16_t>::max() >= payloadSize)
   {
      bytes.push_back(maskBit | std::byte{length_16bit_marker,});
      bytes.push_back(std::byte{static_cast<uint8_t>(payloadSize >> 8),});
      bytes.push_back(std::byte{static_cast<uint8_t>(payloadSize),});
   }
   else
   {
      bytes.push_back(maskBit | std::byte{length_64bit_marker,});
      for (int shift{56,}; 0 <= shift; shift -= 8)
      {
         bytes.push_back(std::byte{static_cast<uint8_t>(payloadSize >> shift),});
      }
   }
   if (true == frame.mask.has_value())
   {
      bytes.insert(bytes.end(), frame.mask->bytes.begin(), frame.mask->bytes.end());
      auto const payloadOffset{bytes.size(),};
      bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());
      apply_websocket_frame_mask(std::span<std::byte>{bytes}.subspan(payloadOffset), *frame.mask);
   }
   else
   {
      bytes.insert(bytes.end(), frame.payload.begin(), frame.payload.end());
   }
   return std::error_code{};
}

websocket_decode_result decode_websocket_frame(std::span<std::byte const> const bytes, size_t const maxPayloadSize)
{
   if (2 > bytes.size())
   {
      return decode_incomplete(2 - bytes.size());
   }
   auto const firstByte{bytes[0],};
   auto const secondByte{bytes[1],};
   if (std::byte{0,} != (reserved_bits & firstByte)) [[unlikely]]
   {
      return decode_failure(websocket_error::frame_reserved_bits_set);
   }
   auto const opcodeValue{std::to_integer<uint8_t>(opcode_bits & firstByte),};
   if (false == is_known_opcode(opcodeValue)) [[unlikely]]
   {
      return decode_failure(websocket_error::frame_reserved_opcode);
   }
   auto const opcode{static_cast<websocket_opcode>(opcodeValue),};
   bool const fin{fin_bit == (fin_bit & firstByte),};
   bool const masked{mask_bit == (mask_bit & secondByte),};
   auto const lengthField{std::to_integer<uint8_t>(length_bits & secondByte),};
   if (true == is_control_opcode(opcode))
   {
      if (false == fin) [[unlikely]]
      {
         return decode_failure(websocket_error::frame_control_not_finalized);
      }
      if (websocket_control_frame_payload_limit < lengthField) [[unlikely]]
      {
         return decode_failure(websocket_error::frame_control_payload_too_large);
      }
   }
   size_t headerSize{2,};
   if (length_16bit_marker == lengthField)
   {
      headerSize += sizeof(uint16_t);
   }
   else if (length_64bit_marker == lengthField)
   {
      headerSize += sizeof(uint64_t);
   }
   if (true == masked)
   {
      headerSize += websocket_frame_mask::sizeof_value;
   }
   if (headerSize > bytes.size())
   {
      return decode_incomplete(headerSize - bytes.size());
   }
   uint64_t payloadSize{lengthField,};
   size_t offset{2,};
   if (length_16bit_marker == lengthField)
   {
      payloadSize = (std::to_integer<uint64_t>(bytes[2]) << 8) | std::to_integer<uint64_t>(bytes[3]);
      offset += sizeof(uint16_t);
   }
   else if (length_64bit_marker == lengthField)
   {
      payloadSize = 0;
      for (size_t index{0,}; sizeof(uint64_t) > index; ++index)
      {
         payloadSize = (payloadSize << 8) | std::to_integer<uint64_t>(bytes[offset + index]);
      }
      if (0 != (payloadSize >> 63)) [[unlikely]]
      {
         return decode_failure(websocket_error::frame_payload_length_invalid);
      }
      offset += sizeof(uint64_t);
   }
   if (static_cast<uint64_t>(maxPayloadSize) < payloadSize) [[unlikely]]
   {
      return decode_failure(websocket_error::message_too_big);
   }
   websocket_decode_result decodeResult{};
   decodeResult.frame.opcode = opcode;
   decodeResult.frame.fin = fin;
   if (true == masked)
   {
      websocket_frame_mask websocketFrameMask{};
      for (size_t index{0,}; websocket_frame_mask::sizeof_value > index; ++index)
      {
         websocketFrameMask.bytes[index] = bytes[offset + index];
      }
      decodeResult.frame.mask = websocketFrameMask;
      offset += websocket_frame_mask::sizeof_value;
   }
   assert(headerSize == offset);
   auto const frameSize{headerSize + static_cast<size_t>(payloadSize),};
   if (frameSize > bytes.size())
   {
      return decode_incomplete(frameSize - bytes.size());
   }
   decodeResult.frame.payload.assign(bytes.begin() + headerSize, bytes.begin() + frameSize);
   if (true == decodeResult.frame.mask.has_value())
   {
      apply_websocket_frame_mask(decodeResult.frame.payload, *decodeResult.frame.mask);
   }
   decodeResult.bytesConsumed = frameSize;
   decodeResult.status = websocket_decode_status::complete;
   return decodeResult;
}

}
