// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gatelink
{

/// @brief Long-lived Ed25519 device identity supplied by the embedding application.
///
/// Immutable after construction; copies share the underlying key, so one identity can
/// be handed to several sessions.
class Identity
{
  public:
    /// @brief Loads an identity from hex encoded key material.
    /// @param publicKeyHex Raw 32-byte Ed25519 public key, hex encoded.
    /// @param privateKeyDerHex PKCS#8 DER private key, hex encoded.
    /// @return The identity, or a KeyError if the material is malformed or inconsistent.
    [[nodiscard]] static auto fromHex(std::string_view publicKeyHex, std::string_view privateKeyDerHex)
        -> Result<Identity>;

    /// @brief Lowercase hex SHA-256 of the raw public key.
    [[nodiscard]] auto fingerprint() const -> const std::string& { return _fingerprint; }

    /// @brief The raw 32-byte public key.
    [[nodiscard]] auto publicKey() const -> std::span<const std::uint8_t> { return _publicKey; }

    /// @brief Signs a message with the private key.
    /// @param message The bytes to sign.
    /// @return The 64-byte Ed25519 signature or a KeyError.
    [[nodiscard]] auto sign(std::string_view message) const -> Result<std::vector<std::uint8_t>>;

  private:
    struct Key;

    Identity(std::vector<std::uint8_t> publicKey, std::shared_ptr<const Key> key);

    std::vector<std::uint8_t> _publicKey;
    std::string _fingerprint;
    std::shared_ptr<const Key> _key;
};

/// @brief Connection-attempt parameters bound into a device assertion.
struct AssertionParams
{
    std::string clientId;
    std::string clientMode;
    std::string role;
    std::vector<std::string> scopes;
    std::int64_t signedAtMs = 0;
    std::optional<std::string> token;
    std::optional<std::string> nonce;
};

/// @brief A signed device assertion, sent as the `device` field of the handshake.
struct DeviceAssertion
{
    std::string id;
    std::string publicKey;
    std::string signature;
    std::int64_t signedAt = 0;
    std::optional<std::string> nonce;

    /// @brief Serializes the assertion into its wire representation.
    [[nodiscard]] auto toJson() const -> nlohmann::ordered_json;
};

/// @brief Builds the canonical string that is signed for a connection attempt.
///
/// `v1|fingerprint|clientId|clientMode|role|scopes|signedAtMs|token` without a nonce,
/// `v2|...|token|nonce` with one.
[[nodiscard]] auto buildSigningPayload(std::string_view fingerprint, const AssertionParams& params)
    -> std::string;

/// @brief Signs the canonical payload and assembles the device assertion.
[[nodiscard]] auto createDeviceAssertion(const Identity& identity, const AssertionParams& params)
    -> Result<DeviceAssertion>;

/// @brief Computes the lowercase hex SHA-256 fingerprint of a raw public key.
[[nodiscard]] auto computeFingerprint(std::span<const std::uint8_t> publicKey) -> std::string;

/// @brief Base64url encoding without padding.
[[nodiscard]] auto base64UrlEncode(std::span<const std::uint8_t> data) -> std::string;

/// @brief Decodes a hex string (upper or lower case, even length).
[[nodiscard]] auto decodeHex(std::string_view hex) -> Result<std::vector<std::uint8_t>>;

/// @brief Generates a random RFC 4122 version 4 UUID from the system CSPRNG.
[[nodiscard]] auto randomUuid() -> Result<std::string>;

} // namespace gatelink
