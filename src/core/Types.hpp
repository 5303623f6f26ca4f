// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string_view>

namespace gatelink
{

/// @brief Connectivity state of one gateway session.
enum class ConnectionState : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
    Error,
};

/// @brief Converts a ConnectionState to its string representation.
[[nodiscard]] constexpr auto connectionStateToString(ConnectionState state) -> std::string_view
{
    switch (state)
    {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Error: return "error";
    }
    return "unknown";
}

/// @brief The role a session declares to the gateway.
enum class SessionRole : std::uint8_t
{
    Operator,
    Node,
};

/// @brief Converts a SessionRole to the role name used on the wire.
[[nodiscard]] constexpr auto roleToString(SessionRole role) -> std::string_view
{
    switch (role)
    {
        case SessionRole::Operator: return "operator";
        case SessionRole::Node: return "node";
    }
    return "unknown";
}

} // namespace gatelink
