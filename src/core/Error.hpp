// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace gatelink
{

/// @brief Error codes for categorizing failures across the engine.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    KeyError,
    TransportError,
    HandshakeError,
    CommandTimeout,
    CommandRejected,
    Disconnected,
    ParseError,
};

/// @brief Returns a short human readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::KeyError: return "key";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::HandshakeError: return "handshake";
        case ErrorCode::CommandTimeout: return "command-timeout";
        case ErrorCode::CommandRejected: return "command-rejected";
        case ErrorCode::Disconnected: return "disconnected";
        case ErrorCode::ParseError: return "parse";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace gatelink

template <>
struct std::formatter<gatelink::Error>: std::formatter<std::string>
{
    auto format(const gatelink::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", gatelink::errorCodeName(error.code), error.message), ctx);
    }
};
