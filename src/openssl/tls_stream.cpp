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

#include "common/utility.hpp" ///< for websockets::unreachable
#include "common/websocket_stream.hpp" ///< for websockets::websocket_stream
#include "openssl/error.hpp" ///< for websockets::log_openssl_errors, websockets::make_ssl_error_code, websockets::make_tls_error_code
#include "openssl/tls_stream.hpp" ///< for websockets::make_tls_websocket_stream
#include "websockets/tls_client_config.hpp" ///< for websockets::tls_client_config, websockets::tls_version

/// for
///   BIO,
///   BIO_ctrl_pending,
///   BIO_free,
///   BIO_new,
///   BIO_new_mem_buf,
///   BIO_read,
///   BIO_s_mem,
///   BIO_write
#include <openssl/bio.h>
#include <openssl/err.h> ///< for ERR_clear_error, ERR_peek_last_error
#include <openssl/pem.h> ///< for PEM_X509_INFO_read_bio
/// for
///   SSL,
///   SSL_connect,
///   SSL_CTX,
///   SSL_CTX_free,
///   SSL_CTX_new,
///   SSL_free,
///   SSL_is_init_finished,
///   SSL_new,
///   SSL_read_ex,
///   SSL_set_bio,
///   SSL_shutdown,
///   SSL_write_ex
#include <openssl/ssl.h>
#include <openssl/x509_vfy.h> ///< for X509_STORE_add_cert, X509_STORE_load_locations, X509_STORE_set_default_paths, X509_VERIFY_PARAM_set1_ip_asc
#include <arpa/inet.h> ///< for inet_pton
#include <netinet/in.h> ///< for in6_addr

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <memory> ///< for std::addressof, std::make_unique, std::unique_ptr
#include <span> ///< for std::span
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::error_code
#include <utility> ///< for std::move
#include <vector> ///< for std::vector

template<>
struct std::default_delete<SSL_CTX>
{
   constexpr default_delete() noexcept = default;
   constexpr default_delete(default_delete &&) noexcept = default;
   constexpr default_delete(default_delete const &) noexcept = default;

   constexpr default_delete &operator = (default_delete &&) noexcept = default;
   constexpr default_delete &operator = (default_delete const &) noexcept = default;

   void operator () (SSL_CTX *sslContext) const
   {
      SSL_CTX_free(sslContext);
   }
};

template<>
struct std::default_delete<SSL>
{
   constexpr default_delete() noexcept = default;
   constexpr default_delete(default_delete &&) noexcept = default;
   constexpr default_delete(default_delete const &) noexcept = default;

   constexpr default_delete &operator = (default_delete &&) noexcept = default;
   constexpr default_delete &operator = (default_delete const &) noexcept = default;

   void operator () (SSL *ssl) const
   {
      SSL_free(ssl);
   }
};

namespace websockets
{

namespace
{

/// Largest TLS record plaintext
constexpr size_t tls_record_size_limit{16 * 1024,};

[[nodiscard]] int to_openssl_version(tls_version const value)
{
   switch (value)
   {
   case tls_version::tls1_0: return TLS1_VERSION;
   case tls_version::tls1_1: return TLS1_1_VERSION;
   case tls_version::tls1_2: return TLS1_2_VERSION;
   case tls_version::tls1_3: return TLS1_3_VERSION;
   }
   unreachable();
}

[[nodiscard]] std::error_code make_last_tls_error_code(std::string_view const &prefix)
{
   auto const errorCode{make_tls_error_code(static_cast<int>(ERR_peek_last_error())),};
   log_openssl_errors(prefix);
   return errorCode;
}

[[nodiscard]] bool add_pem_certificates(X509_STORE *x509Store, std::string_view const &pemData)
{
   assert(nullptr != x509Store);
   auto *bio{BIO_new_mem_buf(pemData.data(), static_cast<int>(pemData.size())),};
   if (nullptr == bio) [[unlikely]]
   {
      return false;
   }
   auto *x509InfoStack{PEM_X509_INFO_read_bio(bio, nullptr, nullptr, nullptr),};
   BIO_free(bio);
   if (nullptr == x509InfoStack) [[unlikely]]
   {
      return false;
   }
   bool certificateAdded{false,};
   for (int x509InfoIndex{0,}; sk_X509_INFO_num(x509InfoStack) > x509InfoIndex; ++x509InfoIndex)
   {
      if (auto *x509Info{sk_X509_INFO_value(x509InfoStack, x509InfoIndex),}; (nullptr != x509Info) && (nullptr != x509Info->x509))
      {
         if (0 == X509_STORE_add_cert(x509Store, x509Info->x509)) [[unlikely]]
         {
            sk_X509_INFO_pop_free(x509InfoStack, X509_INFO_free);
            return false;
         }
         certificateAdded = true;
      }
   }
   sk_X509_INFO_pop_free(x509InfoStack, X509_INFO_free);
   return certificateAdded;
}

[[nodiscard]] std::unique_ptr<SSL_CTX> create_ssl_context(tls_client_config const &config, std::error_code &errorCode)
{
   std::unique_ptr<SSL_CTX> sslContext{SSL_CTX_new(TLS_client_method()),};
   if (nullptr == sslContext) [[unlikely]]
   {
      errorCode = make_last_tls_error_code("[tls_stream] failed to create SSL context");
      return nullptr;
   }
   auto *x509Store{SSL_CTX_get_cert_store(sslContext.get()),};
   assert(nullptr != x509Store);
   if ((true == config.caDirectoryPath.empty()) && (true == config.caFilePath.empty()))
   {
      if (0 == X509_STORE_set_default_paths(x509Store)) [[unlikely]]
      {
         errorCode = make_last_tls_error_code("[tls_stream] failed to load from default CA paths");
         return nullptr;
      }
   }
   else
   {
      auto const caFilePath{config.caFilePath.string(),};
      auto const caDirectoryPath{config.caDirectoryPath.string(),};
      if (
         0 == X509_STORE_load_locations(
            x509Store,
            (true == caFilePath.empty()) ? nullptr : caFilePath.c_str(),
            (true == caDirectoryPath.empty()) ? nullptr : caDirectoryPath.c_str()
         )
      ) [[unlikely]]
      {
         errorCode = make_last_tls_error_code("[tls_stream] failed to load from custom CA path");
         return nullptr;
      }
   }
   for (auto const &rootCertificatePem : config.rootCertificatesPem)
   {
      if (false == add_pem_certificates(x509Store, rootCertificatePem)) [[unlikely]]
      {
         errorCode = make_last_tls_error_code("[tls_stream] failed to add PEM root certificate");
         return nullptr;
      }
   }
   if (false == config.certificateChainFilePath.empty())
   {
      if (1 != SSL_CTX_use_certificate_chain_file(sslContext.get(), config.certificateChainFilePath.string().c_str())) [[unlikely]]
      {
         errorCode = make_last_tls_error_code("[tls_stream] failed to load client certificate chain");
         return nullptr;
      }
   }
   if (false == config.privateKeyFilePath.empty())
   {
      if (1 != SSL_CTX_use_PrivateKey_file(sslContext.get(), config.privateKeyFilePath.string().c_str(), SSL_FILETYPE_PEM)) [[unlikely]]
      {
         errorCode = make_last_tls_error_code("[tls_stream] failed to load client private key");
         return nullptr;
      }
      if (1 != SSL_CTX_check_private_key(sslContext.get())) [[unlikely]]
      {
         errorCode = make_last_tls_error_code("[tls_stream] client private key does not match certificate");
         return nullptr;
      }
   }
   SSL_CTX_set_min_proto_version(sslContext.get(), to_openssl_version(config.minVersion.value_or(tls_version::tls1_2)));
   if (true == config.maxVersion.has_value())
   {
      SSL_CTX_set_max_proto_version(sslContext.get(), to_openssl_version(config.maxVersion.value()));
   }
   SSL_CTX_set_options(sslContext.get(), SSL_OP_NO_COMPRESSION);
   SSL_CTX_set_mode(sslContext.get(), SSL_MODE_AUTO_RETRY | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
   SSL_CTX_set_verify(sslContext.get(), (true == config.verifyPeer) ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
   return sslContext;
}

class tls_websocket_stream final : public websocket_stream
{
public:
   tls_websocket_stream() = delete;

   [[nodiscard]] tls_websocket_stream(std::unique_ptr<SSL_CTX> sslContext, std::unique_ptr<SSL> ssl) :
      m_sslContext{std::move(sslContext),},
      m_ssl{std::move(ssl),},
      m_rbio{BIO_new(BIO_s_mem()),},
      m_wbio{BIO_new(BIO_s_mem()),}
   {
      assert(nullptr != m_sslContext);
      assert(nullptr != m_ssl);
      if ((nullptr == m_rbio) || (nullptr == m_wbio)) [[unlikely]]
      {
         log_openssl_errors("[tls_stream] failed to create memory BIO");
         unreachable();
      }
      /// The session owns both BIOs from now on
      SSL_set_bio(m_ssl.get(), m_rbio, m_wbio);
   }

   [[nodiscard]] std::error_code start(std::vector<std::byte> &outboundBytes) override
   {
      ERR_clear_error();
      if (auto const returnCode{SSL_connect(m_ssl.get()),}; 0 >= returnCode)
      {
         if (auto const errorCode{make_ssl_error_code(*m_ssl, returnCode),}; false == is_pending(errorCode)) [[unlikely]]
         {
            log_openssl_errors("[tls_stream] failed to start TLS handshake");
            return errorCode;
         }
      }
      drain_wbio(outboundBytes);
      return std::error_code{};
   }

   [[nodiscard]] bool ready() const noexcept override
   {
      return 1 == SSL_is_init_finished(m_ssl.get());
   }

   [[nodiscard]] std::error_code decode(
      std::span<std::byte const> const inboundBytes,
      std::vector<std::byte> &plaintextBytes,
      std::vector<std::byte> &outboundBytes
   ) override
   {
      ERR_clear_error();
      if (false == inboundBytes.empty())
      {
         [[maybe_unused]] auto const bytesWritten{BIO_write(m_rbio, inboundBytes.data(), static_cast<int>(inboundBytes.size())),};
         assert(static_cast<int>(inboundBytes.size()) == bytesWritten);
      }
      if (false == ready())
      {
         if (auto const returnCode{SSL_connect(m_ssl.get()),}; 0 >= returnCode)
         {
            if (auto const errorCode{make_ssl_error_code(*m_ssl, returnCode),}; false == is_pending(errorCode))
            {
               log_openssl_errors("[tls_stream] TLS handshake failed");
               drain_wbio(outboundBytes);
               return errorCode;
            }
         }
         drain_wbio(outboundBytes);
         if (false == ready())
         {
            return std::error_code{};
         }
      }
      while (false == m_peerClosed)
      {
         auto const plaintextOffset{plaintextBytes.size(),};
         plaintextBytes.resize(plaintextOffset + tls_record_size_limit);
         size_t bytesRead{0,};
         auto const returnCode{SSL_read_ex(m_ssl.get(), plaintextBytes.data() + plaintextOffset, tls_record_size_limit, std::addressof(bytesRead)),};
         plaintextBytes.resize(plaintextOffset + bytesRead);
         if (1 == returnCode)
         {
            continue;
         }
         auto const errorCode{make_ssl_error_code(*m_ssl, returnCode),};
         if (make_ssl_error_code(SSL_ERROR_ZERO_RETURN) == errorCode)
         {
            m_peerClosed = true;
         }
         else if (false == is_pending(errorCode)) [[unlikely]]
         {
            log_openssl_errors("[tls_stream] failed to decrypt");
            drain_wbio(outboundBytes);
            return errorCode;
         }
         break;
      }
      drain_wbio(outboundBytes);
      return std::error_code{};
   }

   [[nodiscard]] std::error_code encode(std::span<std::byte const> plaintextBytes, std::vector<std::byte> &outboundBytes) override
   {
      assert(true == ready());
      ERR_clear_error();
      while (false == plaintextBytes.empty())
      {
         size_t bytesWritten{0,};
         if (auto const returnCode{SSL_write_ex(m_ssl.get(), plaintextBytes.data(), plaintextBytes.size(), std::addressof(bytesWritten)),}; 1 != returnCode) [[unlikely]]
         {
            auto const errorCode{make_ssl_error_code(*m_ssl, returnCode),};
            log_openssl_errors("[tls_stream] failed to encrypt");
            return errorCode;
         }
         plaintextBytes = plaintextBytes.subspan(bytesWritten);
      }
      drain_wbio(outboundBytes);
      return std::error_code{};
   }

   void shutdown(std::vector<std::byte> &outboundBytes) override
   {
      if (true == ready())
      {
         ERR_clear_error();
         /// Sends close_notify, the peer one is not awaited here
         if (auto const returnCode{SSL_shutdown(m_ssl.get()),}; 0 > returnCode) [[unlikely]]
         {
            log_openssl_errors("[tls_stream] failed to send close_notify");
         }
      }
      drain_wbio(outboundBytes);
   }

   [[nodiscard]] bool peer_closed() const noexcept override
   {
      return m_peerClosed;
   }

private:
   std::unique_ptr<SSL_CTX> const m_sslContext;
   std::unique_ptr<SSL> const m_ssl;
   BIO *const m_rbio;
   BIO *const m_wbio;
   bool m_peerClosed{false,};

   void drain_wbio(std::vector<std::byte> &outboundBytes)
   {
      auto const bytesPending{BIO_ctrl_pending(m_wbio),};
      if (0 == bytesPending)
      {
         return;
      }
      auto const outboundOffset{outboundBytes.size(),};
      outboundBytes.resize(outboundOffset + bytesPending);
      [[maybe_unused]] auto const bytesRead{BIO_read(m_wbio, outboundBytes.data() + outboundOffset, static_cast<int>(bytesPending)),};
      assert(static_cast<int>(bytesPending) == bytesRead);
   }

   [[nodiscard]] static bool is_pending(std::error_code const &errorCode)
   {
      return (
         false
         || (make_ssl_error_code(SSL_ERROR_WANT_READ) == errorCode)
         || (make_ssl_error_code(SSL_ERROR_WANT_WRITE) == errorCode)
      );
   }
};

}

std::unique_ptr<websocket_stream> make_tls_websocket_stream(
   tls_client_config const &config,
   std::string_view const &host,
   std::error_code &errorCode
)
{
   assert(false == host.empty());
   errorCode.clear();
   auto sslContext{create_ssl_context(config, errorCode),};
   if (nullptr == sslContext) [[unlikely]]
   {
      return nullptr;
   }
   std::unique_ptr<SSL> ssl{SSL_new(sslContext.get()),};
   if (nullptr == ssl) [[unlikely]]
   {
      errorCode = make_last_tls_error_code("[tls_stream] failed to create SSL structure");
      return nullptr;
   }
   std::string const hostname{host,};
   in6_addr ipAddress{};
   /// IP literals are never sent as SNI, they are verified against IP SANs
   bool const isIpAddress
   {
      false
      || (1 == inet_pton(AF_INET, hostname.c_str(), std::addressof(ipAddress)))
      || (1 == inet_pton(AF_INET6, hostname.c_str(), std::addressof(ipAddress)))
   };
   if ((true == config.useSni) && (false == isIpAddress) && (1 != SSL_set_tlsext_host_name(ssl.get(), hostname.c_str()))) [[unlikely]]
   {
      errorCode = make_last_tls_error_code("[tls_stream] failed to set SNI hostname");
      return nullptr;
   }
   if ((true == config.verifyPeer) && (true == config.verifyHostname))
   {
      if (true == isIpAddress)
      {
         if (1 != X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl.get()), hostname.c_str())) [[unlikely]]
         {
            errorCode = make_last_tls_error_code("[tls_stream] failed to set IP address to verify");
            return nullptr;
         }
      }
      else if (1 != SSL_set1_host(ssl.get(), hostname.c_str())) [[unlikely]]
      {
         errorCode = make_last_tls_error_code("[tls_stream] failed to set DNS hostname");
         return nullptr;
      }
   }
   return std::make_unique<tls_websocket_stream>(std::move(sslContext), std::move(ssl));
}

}
