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

#include "common/utility.hpp" ///< for websockets::unreachable
#include "openssl/error.hpp" ///< for websockets::log_openssl_errors

/// for
///   EVP_DigestFinal_ex,
///   EVP_DigestInit_ex,
///   EVP_DigestUpdate,
///   EVP_MD_CTX,
///   EVP_MD_CTX_free,
///   EVP_MD_CTX_new,
///   EVP_sha1
#include <openssl/evp.h>

#include <array> ///< for std::array
#include <bit> ///< for std::bit_cast
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint8_t
#include <memory> ///< for std::unique_ptr
#include <span> ///< for std::span

namespace websockets
{

constexpr size_t sha1_digest_size{20,};
using sha1_digest = std::array<std::byte, sha1_digest_size>;

/// Reusable SHA-1 digest context, OpenSSL failures here mean the library is unusable
class sha1_context final
{
public:
   [[nodiscard]] sha1_context() :
      m_context{EVP_MD_CTX_new(),}
   {
      if (nullptr == m_context) [[unlikely]]
      {
         log_openssl_errors("[sha1] failed to create digest context");
         unreachable();
      }
   }

   sha1_context(sha1_context &&) = delete;
   sha1_context(sha1_context const &) = delete;

   sha1_context &operator = (sha1_context &&) = delete;
   sha1_context &operator = (sha1_context const &) = delete;

   /// Digest of the concatenated parts
   template<typename... parts>
   [[nodiscard]] sha1_digest digest(parts const &...partBytes)
   {
      if (0 == EVP_DigestInit_ex(m_context.get(), EVP_sha1(), nullptr)) [[unlikely]]
      {
         log_openssl_errors("[sha1] failed to initialize digest");
         unreachable();
      }
      (update(std::span<std::byte const>{partBytes,}), ...);
      sha1_digest digestBytes{};
      if (0 == EVP_DigestFinal_ex(m_context.get(), std::bit_cast<uint8_t *>(digestBytes.data()), nullptr)) [[unlikely]]
      {
         log_openssl_errors("[sha1] failed to finalize digest");
         unreachable();
      }
      return digestBytes;
   }

private:
   struct context_deleter final
   {
      void operator () (EVP_MD_CTX *context) const noexcept
      {
         EVP_MD_CTX_free(context);
      }
   };

   std::unique_ptr<EVP_MD_CTX, context_deleter> const m_context;

   void update(std::span<std::byte const> const bytes)
   {
      if (0 == EVP_DigestUpdate(m_context.get(), bytes.data(), bytes.size())) [[unlikely]]
      {
         log_openssl_errors("[sha1] failed to update digest");
         unreachable();
      }
   }
};

}
