// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gatelink::ws
{

/// @brief RFC 6455 frame opcodes.
enum class Opcode : std::uint8_t
{
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA,
};

/// @brief Largest payload accepted from the server.
constexpr auto MaxPayloadSize = std::size_t { 16 } * 1024 * 1024;

/// @brief Status code sent in a normal closure frame.
constexpr auto NormalClosure = std::uint16_t { 1000 };

using MaskKey = std::array<std::uint8_t, 4>;

/// @brief One decoded frame.
struct Frame
{
    bool fin = true;
    Opcode opcode = Opcode::Text;
    std::vector<std::uint8_t> payload;
};

/// @brief A frame decoded from the front of a buffer.
struct Decoded
{
    Frame frame;
    std::size_t consumed = 0;
};

/// @brief Encodes a single final client frame, masked with @p mask.
[[nodiscard]] auto encodeFrame(Opcode opcode, std::span<const std::uint8_t> payload, const MaskKey& mask)
    -> std::vector<std::uint8_t>;

/// @brief Decodes one frame from the front of @p buffer.
/// @return The frame and the number of bytes it occupied, std::nullopt if the buffer does
///         not yet hold a complete frame, or a TransportError for protocol violations.
[[nodiscard]] auto decodeFrame(std::span<const std::uint8_t> buffer) -> Result<std::optional<Decoded>>;

/// @brief Builds the payload of a close frame (status code, big endian).
[[nodiscard]] auto closePayload(std::uint16_t code) -> std::vector<std::uint8_t>;

/// @brief Draws a fresh masking key from the system CSPRNG.
[[nodiscard]] auto randomMask() -> Result<MaskKey>;

/// @brief Draws a random base64 encoded 16-byte `Sec-WebSocket-Key`.
[[nodiscard]] auto randomHandshakeKey() -> Result<std::string>;

/// @brief Computes the `Sec-WebSocket-Accept` value the server must answer with.
[[nodiscard]] auto computeAcceptKey(std::string_view clientKey) -> std::string;

/// @brief A parsed `ws://` or `wss://` endpoint.
struct Url
{
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

/// @brief Parses a WebSocket URL. The port defaults to 80 (ws) or 443 (wss).
[[nodiscard]] auto parseUrl(std::string_view url) -> Result<Url>;

/// @brief Builds the HTTP/1.1 upgrade request.
[[nodiscard]] auto buildUpgradeRequest(const Url& url, std::string_view clientKey) -> std::string;

/// @brief Checks the server's upgrade response headers.
/// @param response The status line and headers, up to and including the empty line.
/// @param clientKey The key sent in the request.
[[nodiscard]] auto validateUpgradeResponse(std::string_view response, std::string_view clientKey) -> VoidResult;

} // namespace gatelink::ws
