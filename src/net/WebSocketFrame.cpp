// SPDX-License-Identifier: Apache-2.0
#include "WebSocketFrame.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <format>

namespace gatelink::ws
{

namespace
{
    constexpr auto AcceptMagic = std::string_view { "258EAFA5-E914-47DA-95CA-C5AB0DC85B11" };

    auto base64Encode(std::span<const std::uint8_t> data) -> std::string
    {
        auto encoded = std::string(4 * ((data.size() + 2) / 3) + 1, '\0');
        auto const length = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(encoded.data()), data.data(), static_cast<int>(data.size()));
        encoded.resize(static_cast<std::size_t>(length));
        return encoded;
    }

    auto isKnownOpcode(std::uint8_t value) -> bool
    {
        switch (static_cast<Opcode>(value))
        {
            case Opcode::Continuation:
            case Opcode::Text:
            case Opcode::Binary:
            case Opcode::Close:
            case Opcode::Ping:
            case Opcode::Pong: return true;
        }
        return false;
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(
            result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    /// Returns the value of a header (name matched case-insensitively).
    auto headerValue(std::string_view response, std::string_view name) -> std::optional<std::string_view>
    {
        auto const wanted = toLower(name);
        auto pos = response.find("\r\n");
        while (pos != std::string_view::npos)
        {
            auto const start = pos + 2;
            auto const end = response.find("\r\n", start);
            auto const line = response.substr(start, end == std::string_view::npos ? end : end - start);
            if (auto const colon = line.find(':'); colon != std::string_view::npos)
            {
                if (toLower(trim(line.substr(0, colon))) == wanted)
                    return trim(line.substr(colon + 1));
            }
            pos = end;
        }
        return std::nullopt;
    }
} // namespace

auto encodeFrame(Opcode opcode, std::span<const std::uint8_t> payload, const MaskKey& mask) -> std::vector<std::uint8_t>
{
    auto frame = std::vector<std::uint8_t> {};
    frame.reserve(2 + 8 + mask.size() + payload.size());
    frame.push_back(static_cast<std::uint8_t>(0x80 | static_cast<std::uint8_t>(opcode)));

    auto const length = payload.size();
    if (length < 126)
        frame.push_back(static_cast<std::uint8_t>(0x80 | length));
    else if (length <= 0xFFFF)
    {
        frame.push_back(0x80 | 126);
        frame.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
        frame.push_back(static_cast<std::uint8_t>(length & 0xFF));
    }
    else
    {
        frame.push_back(0x80 | 127);
        for (auto i = 7; i >= 0; --i)
            frame.push_back(static_cast<std::uint8_t>((static_cast<std::uint64_t>(length) >> (i * 8)) & 0xFF));
    }

    frame.insert(frame.end(), mask.begin(), mask.end());
    for (auto i = std::size_t { 0 }; i < length; ++i)
        frame.push_back(static_cast<std::uint8_t>(payload[i] ^ mask[i % 4]));
    return frame;
}

auto decodeFrame(std::span<const std::uint8_t> buffer) -> Result<std::optional<Decoded>>
{
    if (buffer.size() < 2)
        return std::nullopt;

    auto const fin = (buffer[0] & 0x80) != 0;
    auto const opcodeValue = static_cast<std::uint8_t>(buffer[0] & 0x0F);
    auto const masked = (buffer[1] & 0x80) != 0;
    auto length = static_cast<std::uint64_t>(buffer[1] & 0x7F);

    if ((buffer[0] & 0x70) != 0)
        return makeError(ErrorCode::TransportError, "WebSocket frame uses reserved bits");
    if (!isKnownOpcode(opcodeValue))
        return makeError(ErrorCode::TransportError, std::format("Unknown WebSocket opcode {:#x}", opcodeValue));

    auto const opcode = static_cast<Opcode>(opcodeValue);
    auto const isControl = (opcodeValue & 0x08) != 0;
    if (isControl && (!fin || length > 125))
        return makeError(ErrorCode::TransportError, "Invalid WebSocket control frame");

    auto offset = std::size_t { 2 };
    if (length == 126)
    {
        if (buffer.size() < offset + 2)
            return std::nullopt;
        length = (static_cast<std::uint64_t>(buffer[2]) << 8) | buffer[3];
        offset += 2;
    }
    else if (length == 127)
    {
        if (buffer.size() < offset + 8)
            return std::nullopt;
        length = 0;
        for (auto i = std::size_t { 0 }; i < 8; ++i)
            length = (length << 8) | buffer[offset + i];
        offset += 8;
    }

    if (length > MaxPayloadSize)
        return makeError(ErrorCode::TransportError, std::format("WebSocket payload of {} bytes is too large", length));

    auto mask = MaskKey {};
    if (masked)
    {
        if (buffer.size() < offset + mask.size())
            return std::nullopt;
        std::copy_n(buffer.begin() + static_cast<std::ptrdiff_t>(offset), mask.size(), mask.begin());
        offset += mask.size();
    }

    auto const size = static_cast<std::size_t>(length);
    if (buffer.size() < offset + size)
        return std::nullopt;

    auto payload = std::vector<std::uint8_t>(buffer.begin() + static_cast<std::ptrdiff_t>(offset),
                                             buffer.begin() + static_cast<std::ptrdiff_t>(offset + size));
    if (masked)
    {
        for (auto i = std::size_t { 0 }; i < payload.size(); ++i)
            payload[i] ^= mask[i % 4];
    }

    return Decoded {
        .frame = Frame { .fin = fin, .opcode = opcode, .payload = std::move(payload) },
        .consumed = offset + size,
    };
}

auto closePayload(std::uint16_t code) -> std::vector<std::uint8_t>
{
    return { static_cast<std::uint8_t>(code >> 8), static_cast<std::uint8_t>(code & 0xFF) };
}

auto randomMask() -> Result<MaskKey>
{
    auto mask = MaskKey {};
    if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1)
        return makeError(ErrorCode::TransportError, "System random generator failed");
    return mask;
}

auto randomHandshakeKey() -> Result<std::string>
{
    auto nonce = std::array<std::uint8_t, 16> {};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1)
        return makeError(ErrorCode::TransportError, "System random generator failed");
    return base64Encode(nonce);
}

auto computeAcceptKey(std::string_view clientKey) -> std::string
{
    auto const merged = std::string(clientKey) + std::string(AcceptMagic);
    auto digest = std::array<std::uint8_t, EVP_MAX_MD_SIZE> {};
    auto digestSize = 0u;
    if (EVP_Digest(merged.data(), merged.size(), digest.data(), &digestSize, EVP_sha1(), nullptr) != 1)
        return {};
    return base64Encode(std::span(digest.data(), digestSize));
}

auto parseUrl(std::string_view url) -> Result<Url>
{
    auto result = Url {};
    if (url.starts_with("ws://"))
        url.remove_prefix(5);
    else if (url.starts_with("wss://"))
    {
        url.remove_prefix(6);
        result.secure = true;
    }
    else
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported URL scheme: {}", url));

    auto const slash = url.find_first_of("/?");
    auto const authority = url.substr(0, slash);
    if (slash != std::string_view::npos)
    {
        result.target = std::string(url.substr(slash));
        if (result.target.front() == '?')
            result.target.insert(0, "/");
    }

    auto hostPart = authority;
    auto portPart = std::string_view {};
    if (authority.starts_with('['))
    {
        auto const close = authority.find(']');
        if (close == std::string_view::npos)
            return makeError(ErrorCode::InvalidArgument, "Unterminated IPv6 address in URL");
        hostPart = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            portPart = authority.substr(close + 2);
    }
    else if (auto const colon = authority.rfind(':'); colon != std::string_view::npos)
    {
        hostPart = authority.substr(0, colon);
        portPart = authority.substr(colon + 1);
    }

    if (hostPart.empty())
        return makeError(ErrorCode::InvalidArgument, "URL has no host");
    if (!std::ranges::all_of(portPart, [](unsigned char c) { return std::isdigit(c) != 0; }))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid port '{}'", portPart));

    result.host = std::string(hostPart);
    result.port = portPart.empty() ? (result.secure ? "443" : "80") : std::string(portPart);
    return result;
}

auto buildUpgradeRequest(const Url& url, std::string_view clientKey) -> std::string
{
    auto const host = url.host.find(':') != std::string::npos ? std::format("[{}]", url.host) : url.host;
    return std::format("GET {} HTTP/1.1\r\n"
                       "Host: {}:{}\r\n"
                       "Upgrade: websocket\r\n"
                       "Connection: Upgrade\r\n"
                       "Sec-WebSocket-Key: {}\r\n"
                       "Sec-WebSocket-Version: 13\r\n"
                       "\r\n",
                       url.target,
                       host,
                       url.port,
                       clientKey);
}

auto validateUpgradeResponse(std::string_view response, std::string_view clientKey) -> VoidResult
{
    auto const statusLine = response.substr(0, response.find("\r\n"));
    if (!statusLine.starts_with("HTTP/1.1 101") && !statusLine.starts_with("HTTP/1.0 101"))
        return makeError(ErrorCode::TransportError, std::format("WebSocket upgrade rejected: {}", statusLine));

    auto const accept = headerValue(response, "Sec-WebSocket-Accept");
    if (!accept)
        return makeError(ErrorCode::TransportError, "WebSocket upgrade response lacks Sec-WebSocket-Accept");
    if (*accept != computeAcceptKey(clientKey))
        return makeError(ErrorCode::TransportError, "WebSocket upgrade response has a wrong Sec-WebSocket-Accept");
    return {};
}

} // namespace gatelink::ws
