// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gateway/Transport.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <memory>

namespace gatelink
{

/// @brief RFC 6455 client transport over Boost.Asio, plain (ws://) or TLS (wss://).
///
/// All I/O is asynchronous on the given io_context; handlers run on its thread. The
/// connection state outlives this object until outstanding operations have completed.
class WebSocketTransport final: public Transport
{
  public:
    WebSocketTransport(boost::asio::io_context& io, boost::asio::ssl::context& tls);
    ~WebSocketTransport() override;

    void open(std::string_view url, TransportHandler handler) override;
    [[nodiscard]] auto send(std::string_view text) -> VoidResult override;
    [[nodiscard]] auto ping() -> VoidResult override;
    void close() override;
    void terminate() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    /// @brief Returns a factory creating one WebSocketTransport per connection attempt.
    [[nodiscard]] static auto factory(boost::asio::io_context& io, boost::asio::ssl::context& tls)
        -> TransportFactory;

    /// @brief Creates a TLS client context that verifies peers against the system trust store.
    [[nodiscard]] static auto makeTlsContext() -> boost::asio::ssl::context;

  private:
    class Connection;
    std::shared_ptr<Connection> _connection;
};

} // namespace gatelink
