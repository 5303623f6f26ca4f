// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace gatelink
{

/// @brief Callbacks a transport uses to report remote-originated activity.
///
/// All callbacks are invoked on the scheduler thread, one at a time.
struct TransportHandler
{
    /// @brief The connection is established and ready for send().
    std::function<void()> onOpen;

    /// @brief A complete text message arrived.
    std::function<void(std::string_view text)> onMessage;

    /// @brief A liveness probe sent with ping() was acknowledged.
    std::function<void()> onPong;

    /// @brief The connection failed. No onClose follows an onError.
    std::function<void(Error error)> onError;

    /// @brief The remote side closed the connection.
    std::function<void()> onClose;
};

/// @brief Abstract interface for one non-blocking message transport connection.
///
/// A transport is used for exactly one connection attempt. Handlers are only invoked
/// for remote-originated events: after close() or terminate() returns, none of them
/// fires again.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Starts connecting to the given endpoint.
    /// @param url The endpoint URL (e.g. ws://host:port/path).
    /// @param handler Callbacks for connection activity.
    virtual void open(std::string_view url, TransportHandler handler) = 0;

    /// @brief Queues a text message for sending.
    /// @param text The message text.
    /// @return Success or a TransportError if the connection is not open.
    [[nodiscard]] virtual auto send(std::string_view text) -> VoidResult = 0;

    /// @brief Sends a transport-level liveness probe; the answer is reported via onPong.
    [[nodiscard]] virtual auto ping() -> VoidResult = 0;

    /// @brief Closes the connection gracefully.
    virtual void close() = 0;

    /// @brief Drops the connection immediately without a closing handshake.
    virtual void terminate() = 0;

    /// @brief Returns true if the connection is open for sending.
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;
};

/// @brief Creates a fresh transport for every connection attempt.
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace gatelink
