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

#include "common/websocket_session.hpp" ///< for websockets::websocket_session
#include "common/websocket_stream.hpp" ///< for websockets::make_plain_websocket_stream, websockets::websocket_stream
#include "linux/socket_address_resolver.hpp" ///< for websockets::resolve_socket_addresses, websockets::resolved_socket_address
#include "linux/websocket_socket.hpp" ///< for websockets::websocket_socket
#include "linux/websocket_thread_worker.hpp" ///< for websockets::websocket_thread_worker
#include "openssl/tls_stream.hpp" ///< for websockets::make_tls_websocket_stream
#include "websocket_thread_impl.hpp" ///< for websockets::websocket_thread::websocket_thread_impl
#include "websockets/time.hpp" ///< for websockets::steady_time
#include "websockets/websocket_client.hpp" ///< for websockets::websocket_client, websockets::websocket_receive_result
#include "websockets/websocket_client_config.hpp" ///< for websockets::websocket_client_config
#include "websockets/websocket_error.hpp" ///< for websockets::make_error_code, websockets::websocket_error
#include "websockets/websocket_frame.hpp" ///< for websockets::websocket_frame
#include "websockets/websocket_message.hpp" ///< for websockets::websocket_close_message, websockets::websocket_message
#include "websockets/websocket_state.hpp" ///< for websockets::websocket_state
#include "websockets/websocket_thread.hpp" ///< for websockets::websocket_thread

#include <cassert> ///< for assert
#include <cstddef> ///< for size_t, std::byte
#include <cstdint> ///< for uint16_t, uint8_t
#include <deque> ///< for std::deque
#include <future> ///< for std::future, std::promise
#include <memory> ///< for std::enable_shared_from_this, std::make_shared, std::shared_ptr
#include <optional> ///< for std::nullopt, std::optional
#include <span> ///< for std::span
#include <string> ///< for std::string
#include <string_view> ///< for std::string_view
#include <system_error> ///< for std::errc, std::error_code, std::make_error_code
#include <utility> ///< for std::move, std::pair
#include <variant> ///< for std::holds_alternative
#include <vector> ///< for std::vector

namespace websockets
{

namespace
{

enum struct outbound_request_type : uint8_t
{
   message,
   frame,
   close,
   /// Frame encoded by the session itself
   encoded_frame,
};

struct outbound_request final
{
   outbound_request_type type;
   std::optional<websocket_message> message{std::nullopt,};
   std::optional<websocket_frame> frame{std::nullopt,};
   std::optional<uint16_t> closeCode{std::nullopt,};
   std::string closeReason{};
   std::vector<std::byte> encodedFrame{};
   std::optional<std::promise<std::error_code>> completionPromise{std::nullopt,};
};

/// Outcome of a close request once the connection is closed
[[nodiscard]] std::error_code close_result(std::error_code const &errorCode)
{
   return (make_error_code(websocket_error::connection_closed) == errorCode) ? std::error_code{} : errorCode;
}

template<typename value_type>
[[nodiscard]] std::shared_ptr<std::promise<value_type>> make_shared_promise()
{
   return std::make_shared<std::promise<value_type>>();
}

}

class websocket_client_impl final :
   public websocket_session,
   public websocket_socket,
   public std::enable_shared_from_this<websocket_client_impl>
{
public:
   websocket_client_impl() = delete;
   websocket_client_impl(websocket_client_impl &&) = delete;
   websocket_client_impl(websocket_client_impl const &) = delete;

   [[nodiscard]] explicit websocket_client_impl(websocket_thread_worker &worker) noexcept :
      websocket_session{},
      websocket_socket{},
      m_worker{worker,}
   {}

   ~websocket_client_impl() override = default;

   websocket_client_impl &operator = (websocket_client_impl &&) = delete;
   websocket_client_impl &operator = (websocket_client_impl const &) = delete;

   void handle_close_request(std::optional<uint16_t> const code, std::string_view const &reason, std::promise<std::error_code> completionPromise)
   {
      if (websocket_state::closed == state())
      {
         completionPromise.set_value(close_result(terminal_error_code()));
         return;
      }
      push_request(
         outbound_request
         {
            .type = outbound_request_type::close,
            .closeCode = code,
            .closeReason = std::string{reason,},
            .completionPromise = std::move(completionPromise),
         }
      );
   }

   void handle_connect_request(
      websocket_client_config const &config,
      std::vector<resolved_socket_address> addresses,
      std::error_code const &resolveErrorCode,
      std::promise<std::error_code> completionPromise
   )
   {
      if (true == m_connectRequested)
      {
         completionPromise.set_value(std::make_error_code(std::errc::already_connected));
         return;
      }
      if (websocket_state::closed == state()) [[unlikely]]
      {
         completionPromise.set_value(make_error_code(websocket_error::connection_closed));
         return;
      }
      m_connectRequested = true;
      m_maxPendingMessages = config.max_pending_messages();
      m_connectPromise.emplace(std::move(completionPromise));
      start_connecting(config);
      if (true == bool{resolveErrorCode,})
      {
         abort(resolveErrorCode);
         return;
      }
      if (true == config.tls().has_value())
      {
         std::error_code errorCode{};
         m_stream = make_tls_websocket_stream(config.tls().value(), config.host(), errorCode);
         if (nullptr == m_stream) [[unlikely]]
         {
            assert(true == bool{errorCode,});
            abort(errorCode);
            return;
         }
      }
      else
      {
         m_stream = make_plain_websocket_stream();
      }
      m_worker.connect(shared_from_this(), std::move(addresses));
   }

   void handle_receive_request(std::promise<websocket_receive_result> resultPromise)
   {
      if (false == m_receivedMessages.empty())
      {
         resultPromise.set_value(websocket_receive_result{.errorCode = std::error_code{}, .message = std::move(m_receivedMessages.front()),});
         m_receivedMessages.pop_front();
         resume_recv_when_drained();
      }
      else if (websocket_state::closed == state())
      {
         resultPromise.set_value(websocket_receive_result{.errorCode = terminal_error_code(),});
      }
      else
      {
         m_pendingReceives.push_back(std::move(resultPromise));
      }
   }

   void handle_send_request(websocket_frame frame, std::promise<std::error_code> completionPromise)
   {
      push_request(
         outbound_request
         {
            .type = outbound_request_type::frame,
            .frame = std::move(frame),
            .completionPromise = std::move(completionPromise),
         }
      );
   }

   void handle_send_request(websocket_message message, std::promise<std::error_code> completionPromise)
   {
      push_request(
         outbound_request
         {
            .type = outbound_request_type::message,
            .message = std::move(message),
            .completionPromise = std::move(completionPromise),
         }
      );
   }

   void handle_shutdown_request(std::error_code const &errorCode)
   {
      if (websocket_state::closed != state())
      {
         abort(errorCode);
      }
   }

private:
   websocket_thread_worker &m_worker;
   std::unique_ptr<websocket_stream> m_stream{nullptr,};
   std::optional<std::promise<std::error_code>> m_connectPromise{std::nullopt,};
   std::deque<outbound_request> m_outboundRequests{};
   std::optional<std::promise<std::error_code>> m_sendPromise{std::nullopt,};
   std::vector<std::promise<std::error_code>> m_closePromises{};
   std::deque<websocket_message> m_receivedMessages{};
   std::deque<std::promise<websocket_receive_result>> m_pendingReceives{};
   std::error_code m_closedErrorCode{};
   size_t m_maxPendingMessages{websocket_client_config::default_max_pending_messages,};
   bool m_connectRequested{false,};
   bool m_handshakeStarted{false,};
   bool m_sendActive{false,};
   bool m_readyToShutdown{false,};
   bool m_shutdownStarted{false,};

   void io_aborted(std::error_code const &errorCode) override
   {
      abort(errorCode);
   }

   void io_closed(std::error_code const &errorCode) override
   {
      assert(true == bool{errorCode,});
      m_closedErrorCode = errorCode;
      if (true == m_connectPromise.has_value()) [[unlikely]]
      {
         m_connectPromise->set_value(errorCode);
         m_connectPromise.reset();
      }
      if (true == m_sendPromise.has_value())
      {
         m_sendPromise->set_value(errorCode);
         m_sendPromise.reset();
      }
      for (auto &outboundRequest : m_outboundRequests)
      {
         if (true == outboundRequest.completionPromise.has_value())
         {
            outboundRequest.completionPromise->set_value(
               (outbound_request_type::close == outboundRequest.type) ? close_result(errorCode) : errorCode
            );
         }
      }
      m_outboundRequests.clear();
      for (auto &closePromise : m_closePromises)
      {
         closePromise.set_value(close_result(errorCode));
      }
      m_closePromises.clear();
      for (auto &pendingReceive : m_pendingReceives)
      {
         pendingReceive.set_value(websocket_receive_result{.errorCode = errorCode,});
      }
      m_pendingReceives.clear();
      m_worker.close(*this);
   }

   void io_connected(std::error_code const &errorCode) override
   {
      if (true == bool{errorCode,})
      {
         abort(errorCode);
         return;
      }
      if (websocket_state::closed == state()) [[unlikely]]
      {
         return;
      }
      std::vector<std::byte> outboundBytes{};
      if (auto const startErrorCode{m_stream->start(outboundBytes),}; true == bool{startErrorCode,}) [[unlikely]]
      {
         abort(startErrorCode);
         return;
      }
      send_bytes(outboundBytes);
      start_handshake_when_ready();
   }

   [[nodiscard]] std::optional<steady_time> io_deadline() const noexcept override
   {
      return deadline();
   }

   void io_frame_to_send(std::vector<std::byte> &&bytes) override
   {
      push_request(outbound_request{.type = outbound_request_type::encoded_frame, .encodedFrame = std::move(bytes),});
   }

   void io_handshake_completed(std::error_code const &errorCode) override
   {
      /// No promise when the client is shut down before connecting
      if (true == m_connectPromise.has_value())
      {
         m_connectPromise->set_value(errorCode);
         m_connectPromise.reset();
      }
   }

   void io_message_received(websocket_message &&message) override
   {
      if (true == std::holds_alternative<websocket_close_message>(message))
      {
         /// Requests not written yet would be rejected by the session, fail them now
         for (auto &outboundRequest : m_outboundRequests)
         {
            if ((outbound_request_type::encoded_frame != outboundRequest.type) && (true == outboundRequest.completionPromise.has_value()))
            {
               if (outbound_request_type::close == outboundRequest.type)
               {
                  m_closePromises.push_back(std::move(outboundRequest.completionPromise.value()));
               }
               else
               {
                  outboundRequest.completionPromise->set_value(make_error_code(websocket_error::connection_closing));
               }
               outboundRequest.completionPromise.reset();
            }
         }
         std::erase_if(
            m_outboundRequests,
            [] (auto const &outboundRequest)
            {
               return outbound_request_type::encoded_frame != outboundRequest.type;
            }
         );
      }
      if (false == m_pendingReceives.empty())
      {
         m_pendingReceives.front().set_value(websocket_receive_result{.errorCode = std::error_code{}, .message = std::move(message),});
         m_pendingReceives.pop_front();
      }
      else
      {
         m_receivedMessages.push_back(std::move(message));
      }
   }

   void io_ready_to_shutdown() override
   {
      m_readyToShutdown = true;
      send_requests();
   }

   void io_received(std::span<std::byte const> const bytes) override
   {
      if (websocket_state::closed == state()) [[unlikely]]
      {
         return;
      }
      std::vector<std::byte> plaintextBytes{};
      std::vector<std::byte> outboundBytes{};
      if (auto const errorCode{m_stream->decode(bytes, plaintextBytes, outboundBytes),}; true == bool{errorCode,}) [[unlikely]]
      {
         abort(errorCode);
         return;
      }
      send_bytes(outboundBytes);
      start_handshake_when_ready();
      if ((false == plaintextBytes.empty()) && (true == m_handshakeStarted))
      {
         handle_bytes_received(plaintextBytes);
      }
      if ((true == m_stream->peer_closed()) && (websocket_state::closed != state()))
      {
         handle_stream_closed(std::error_code{});
      }
   }

   [[nodiscard]] bool io_recv_paused() const noexcept override
   {
      /// The closing handshake waits for the Close frame of the peer, keep reading once the connection is not open
      return (websocket_state::open == state()) && (m_maxPendingMessages <= m_receivedMessages.size());
   }

   void io_recv_closed(std::error_code const &errorCode) override
   {
      handle_stream_closed(errorCode);
   }

   void io_sent(std::error_code const &errorCode) override
   {
      if (true == bool{errorCode,})
      {
         abort(errorCode);
         return;
      }
      m_sendActive = false;
      if (true == m_sendPromise.has_value())
      {
         m_sendPromise->set_value(std::error_code{});
         m_sendPromise.reset();
      }
      send_requests();
   }

   void io_socket_closed() override
   {
      m_stream.reset();
   }

   void io_timeout() override
   {
      handle_timeout();
   }

   void push_request(outbound_request outboundRequest)
   {
      /// Nothing is written once closed, and no later event would resolve a queued request
      if (websocket_state::closed == state()) [[unlikely]]
      {
         if (true == outboundRequest.completionPromise.has_value())
         {
            outboundRequest.completionPromise->set_value(make_error_code(websocket_error::connection_not_open));
         }
         return;
      }
      m_outboundRequests.push_back(std::move(outboundRequest));
      send_requests();
   }

   void send_bytes(std::vector<std::byte> const &bytes)
   {
      if (false == bytes.empty())
      {
         m_sendActive = true;
         m_worker.send(*this, bytes);
      }
   }

   /// Writes one request at a time, in request order
   void send_requests()
   {
      while ((false == m_sendActive) && (websocket_state::closed != state()))
      {
         if (true == m_outboundRequests.empty())
         {
            if ((true == m_readyToShutdown) && (false == m_shutdownStarted))
            {
               m_shutdownStarted = true;
               std::vector<std::byte> outboundBytes{};
               m_stream->shutdown(outboundBytes);
               send_bytes(outboundBytes);
               m_worker.shutdown_write(*this);
            }
            return;
         }
         auto outboundRequest{std::move(m_outboundRequests.front()),};
         m_outboundRequests.pop_front();
         std::vector<std::byte> frameBytes{};
         std::error_code errorCode{};
         switch (outboundRequest.type)
         {
         case outbound_request_type::message:
         {
            errorCode = send_message(outboundRequest.message.value(), frameBytes);
         }
         break;

         case outbound_request_type::frame:
         {
            errorCode = send_frame(outboundRequest.frame.value(), frameBytes);
         }
         break;

         case outbound_request_type::close:
         {
            errorCode = close(outboundRequest.closeCode, outboundRequest.closeReason, frameBytes);
            if (make_error_code(websocket_error::connection_closing) == errorCode)
            {
               /// Already closing, resolved together with the close in progress
               m_closePromises.push_back(std::move(outboundRequest.completionPromise.value()));
               continue;
            }
            if (false == bool{errorCode,})
            {
               m_closePromises.push_back(std::move(outboundRequest.completionPromise.value()));
               outboundRequest.completionPromise.reset();
            }
         }
         break;

         case outbound_request_type::encoded_frame:
         {
            frameBytes = std::move(outboundRequest.encodedFrame);
         }
         break;
         }
         if (true == bool{errorCode,})
         {
            assert(true == outboundRequest.completionPromise.has_value());
            outboundRequest.completionPromise->set_value(errorCode);
            continue;
         }
         assert(false == frameBytes.empty());
         std::vector<std::byte> outboundBytes{};
         if (auto const encodeErrorCode{m_stream->encode(frameBytes, outboundBytes),}; true == bool{encodeErrorCode,}) [[unlikely]]
         {
            if (true == outboundRequest.completionPromise.has_value())
            {
               outboundRequest.completionPromise->set_value(encodeErrorCode);
            }
            abort(encodeErrorCode);
            return;
         }
         m_sendPromise = std::move(outboundRequest.completionPromise);
         send_bytes(outboundBytes);
         resume_recv_when_drained();
      }
   }

   void resume_recv_when_drained()
   {
      if (false == io_recv_paused())
      {
         m_worker.resume_recv(*this);
      }
   }

   void start_handshake_when_ready()
   {
      if ((false == m_handshakeStarted) && (websocket_state::connecting == state()) && (true == m_stream->ready()))
      {
         m_handshakeStarted = true;
         std::vector<std::byte> requestBytes{};
         start_handshake(requestBytes);
         std::vector<std::byte> outboundBytes{};
         if (auto const errorCode{m_stream->encode(requestBytes, outboundBytes),}; true == bool{errorCode,}) [[unlikely]]
         {
            abort(errorCode);
            return;
         }
         send_bytes(outboundBytes);
      }
   }

   [[nodiscard]] std::error_code terminal_error_code() const
   {
      return (true == m_connectRequested) ? m_closedErrorCode : make_error_code(websocket_error::connection_not_open);
   }
};

class websocket_client::websocket_connection final
{
public:
   websocket_connection() = delete;
   websocket_connection(websocket_connection &&) = delete;
   websocket_connection(websocket_connection const &) = delete;

   [[nodiscard]] websocket_connection(websocket_thread websocketThread, websocket_thread_worker &worker) :
      m_websocketThread{std::move(websocketThread),},
      m_worker{worker,},
      m_impl{std::make_shared<websocket_client_impl>(worker),}
   {}

   ~websocket_connection()
   {
      m_worker.post(
         [impl = m_impl] ()
         {
            impl->handle_shutdown_request(make_error_code(websocket_error::connection_closed));
         }
      );
   }

   websocket_connection &operator = (websocket_connection &&) = delete;
   websocket_connection &operator = (websocket_connection const &) = delete;

   [[nodiscard]] std::future<std::error_code> close(std::optional<uint16_t> const code, std::string_view const &reason)
   {
      auto const completionPromise{make_shared_promise<std::error_code>(),};
      auto completionFuture{completionPromise->get_future(),};
      m_worker.post(
         [impl = m_impl, code, reason = std::string{reason,}, completionPromise] ()
         {
            impl->handle_close_request(code, reason, std::move(*completionPromise));
         }
      );
      return completionFuture;
   }

   [[nodiscard]] std::future<std::error_code> connect(websocket_client_config const &config)
   {
      auto const completionPromise{make_shared_promise<std::error_code>(),};
      auto completionFuture{completionPromise->get_future(),};
      /// Name resolution blocks, it runs on the calling thread rather than on the I/O thread
      std::vector<resolved_socket_address> addresses{};
      auto const resolveErrorCode{resolve_socket_addresses(config.host(), config.port(), addresses),};
      m_worker.post(
         [impl = m_impl, config, addresses = std::move(addresses), resolveErrorCode, completionPromise] ()
         {
            impl->handle_connect_request(config, addresses, resolveErrorCode, std::move(*completionPromise));
         }
      );
      return completionFuture;
   }

   [[nodiscard]] std::future<websocket_receive_result> receive()
   {
      auto const resultPromise{make_shared_promise<websocket_receive_result>(),};
      auto resultFuture{resultPromise->get_future(),};
      m_worker.post(
         [impl = m_impl, resultPromise] ()
         {
            impl->handle_receive_request(std::move(*resultPromise));
         }
      );
      return resultFuture;
   }

   template<typename outbound_type>
   [[nodiscard]] std::future<std::error_code> send(outbound_type outbound)
   {
      auto const completionPromise{make_shared_promise<std::error_code>(),};
      auto completionFuture{completionPromise->get_future(),};
      m_worker.post(
         [impl = m_impl, outbound = std::move(outbound), completionPromise] ()
         {
            impl->handle_send_request(outbound, std::move(*completionPromise));
         }
      );
      return completionFuture;
   }

   [[nodiscard]] std::future<std::error_code> shutdown()
   {
      auto const completionPromise{make_shared_promise<std::error_code>(),};
      auto completionFuture{completionPromise->get_future(),};
      m_worker.post(
         [impl = m_impl, completionPromise] ()
         {
            impl->handle_shutdown_request(make_error_code(websocket_error::connection_closed));
            completionPromise->set_value(std::error_code{});
         }
      );
      return completionFuture;
   }

   [[nodiscard]] websocket_state state() const noexcept
   {
      return m_impl->state();
   }

   [[nodiscard]] std::string subprotocol() const
   {
      return (websocket_state::connecting == m_impl->state()) ? std::string{} : m_impl->subprotocol();
   }

private:
   websocket_thread const m_websocketThread;
   websocket_thread_worker &m_worker;
   std::shared_ptr<websocket_client_impl> const m_impl;
};

websocket_client::websocket_client(websocket_client &&rhs) noexcept = default;

websocket_client::websocket_client(websocket_thread websocketThread) :
   m_connection{std::make_shared<websocket_connection>(websocketThread, websocketThread.m_impl->worker()),}
{}

websocket_client::~websocket_client() = default;

std::future<std::error_code> websocket_client::close(std::optional<uint16_t> const code, std::string_view const &reason)
{
   assert(nullptr != m_connection);
   return m_connection->close(code, reason);
}

std::future<std::error_code> websocket_client::connect(websocket_client_config const &config)
{
   assert(nullptr != m_connection);
   return m_connection->connect(config);
}

std::future<websocket_receive_result> websocket_client::receive()
{
   assert(nullptr != m_connection);
   return m_connection->receive();
}

std::future<std::error_code> websocket_client::send(websocket_frame frame)
{
   assert(nullptr != m_connection);
   return m_connection->send(std::move(frame));
}

std::future<std::error_code> websocket_client::send(websocket_message message)
{
   assert(nullptr != m_connection);
   return m_connection->send(std::move(message));
}

std::future<std::error_code> websocket_client::shutdown()
{
   assert(nullptr != m_connection);
   return m_connection->shutdown();
}

std::pair<websocket_client::read_half, websocket_client::write_half> websocket_client::split() &&
{
   assert(nullptr != m_connection);
   auto connection{std::move(m_connection),};
   return std::pair<read_half, write_half>{read_half{connection,}, write_half{std::move(connection),},};
}

websocket_state websocket_client::state() const noexcept
{
   assert(nullptr != m_connection);
   return m_connection->state();
}

std::string websocket_client::subprotocol() const
{
   assert(nullptr != m_connection);
   return m_connection->subprotocol();
}

websocket_client::read_half::read_half(read_half &&rhs) noexcept = default;

websocket_client::read_half::read_half(std::shared_ptr<websocket_connection> connection) noexcept :
   m_connection{std::move(connection),}
{}

websocket_client::read_half::~read_half() = default;

std::future<websocket_receive_result> websocket_client::read_half::receive()
{
   assert(nullptr != m_connection);
   return m_connection->receive();
}

websocket_state websocket_client::read_half::state() const noexcept
{
   assert(nullptr != m_connection);
   return m_connection->state();
}

websocket_client::write_half::write_half(write_half &&rhs) noexcept = default;

websocket_client::write_half::write_half(std::shared_ptr<websocket_connection> connection) noexcept :
   m_connection{std::move(connection),}
{}

websocket_client::write_half::~write_half() = default;

std::future<std::error_code> websocket_client::write_half::close(std::optional<uint16_t> const code, std::string_view const &reason)
{
   assert(nullptr != m_connection);
   return m_connection->close(code, reason);
}

std::future<std::error_code> websocket_client::write_half::send(websocket_frame frame)
{
   assert(nullptr != m_connection);
   return m_connection->send(std::move(frame));
}

std::future<std::error_code> websocket_client::write_half::send(websocket_message message)
{
   assert(nullptr != m_connection);
   return m_connection->send(std::move(message));
}

std::future<std::error_code> websocket_client::write_half::shutdown()
{
   assert(nullptr != m_connection);
   return m_connection->shutdown();
}

websocket_state websocket_client::write_half::state() const noexcept
{
   assert(nullptr != m_connection);
   return m_connection->state();
}

}
