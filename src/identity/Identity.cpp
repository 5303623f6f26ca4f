// SPDX-License-Identifier: Apache-2.0
#include "Identity.hpp"

#include <core/Log.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

#include <algorithm>
#include <array>
#include <format>

namespace gatelink
{

namespace
{
    constexpr auto Ed25519PublicKeySize = std::size_t { 32 };

    struct PkeyDeleter
    {
        void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
    };

    struct MdCtxDeleter
    {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    auto hexDigit(char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }
} // namespace

struct Identity::Key
{
    std::unique_ptr<EVP_PKEY, PkeyDeleter> pkey;
};

Identity::Identity(std::vector<std::uint8_t> publicKey, std::shared_ptr<const Key> key):
    _publicKey(std::move(publicKey)), _fingerprint(computeFingerprint(_publicKey)), _key(std::move(key))
{
}

auto Identity::fromHex(std::string_view publicKeyHex, std::string_view privateKeyDerHex) -> Result<Identity>
{
    auto publicKey = decodeHex(publicKeyHex);
    if (!publicKey)
        return makeError(ErrorCode::KeyError, std::format("Invalid public key: {}", publicKey.error().message));
    if (publicKey->size() != Ed25519PublicKeySize)
        return makeError(ErrorCode::KeyError,
                         std::format("Public key must be {} bytes, got {}", Ed25519PublicKeySize, publicKey->size()));

    auto const der = decodeHex(privateKeyDerHex);
    if (!der)
        return makeError(ErrorCode::KeyError, std::format("Invalid private key: {}", der.error().message));

    auto const* cursor = der->data();
    auto pkey = std::unique_ptr<EVP_PKEY, PkeyDeleter>(
        d2i_AutoPrivateKey(nullptr, &cursor, static_cast<long>(der->size())));
    if (!pkey)
        return makeError(ErrorCode::KeyError, "Private key is not valid PKCS#8 DER");
    if (EVP_PKEY_id(pkey.get()) != EVP_PKEY_ED25519)
        return makeError(ErrorCode::KeyError, "Private key is not an Ed25519 key");

    auto derived = std::array<std::uint8_t, Ed25519PublicKeySize> {};
    auto derivedSize = derived.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), derived.data(), &derivedSize) != 1
        || derivedSize != Ed25519PublicKeySize)
        return makeError(ErrorCode::KeyError, "Cannot derive public key from private key");
    if (!std::ranges::equal(derived, *publicKey))
        return makeError(ErrorCode::KeyError, "Public key does not match private key");

    auto key = std::make_shared<Key>();
    key->pkey = std::move(pkey);
    return Identity(std::move(*publicKey), std::move(key));
}

auto Identity::sign(std::string_view message) const -> Result<std::vector<std::uint8_t>>
{
    auto ctx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>(EVP_MD_CTX_new());
    if (!ctx)
        return makeError(ErrorCode::KeyError, "Cannot allocate signing context");

    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, _key->pkey.get()) != 1)
        return makeError(ErrorCode::KeyError, "Cannot initialize signing");

    auto const* data = reinterpret_cast<const unsigned char*>(message.data());
    auto signatureSize = std::size_t { 0 };
    if (EVP_DigestSign(ctx.get(), nullptr, &signatureSize, data, message.size()) != 1)
        return makeError(ErrorCode::KeyError, "Cannot determine signature size");

    auto signature = std::vector<std::uint8_t>(signatureSize);
    if (EVP_DigestSign(ctx.get(), signature.data(), &signatureSize, data, message.size()) != 1)
        return makeError(ErrorCode::KeyError, "Signing failed");

    signature.resize(signatureSize);
    return signature;
}

auto DeviceAssertion::toJson() const -> nlohmann::ordered_json
{
    auto result = nlohmann::ordered_json {
        { "id", id },
        { "publicKey", publicKey },
        { "signature", signature },
        { "signedAt", signedAt },
    };
    if (nonce)
        result["nonce"] = *nonce;
    return result;
}

auto buildSigningPayload(std::string_view fingerprint, const AssertionParams& params) -> std::string
{
    auto const hasNonce = params.nonce.has_value() && !params.nonce->empty();

    auto scopes = std::string {};
    for (auto const& scope: params.scopes)
    {
        if (!scopes.empty())
            scopes += ',';
        scopes += scope;
    }

    auto payload = std::format("{}|{}|{}|{}|{}|{}|{}|{}",
                               hasNonce ? "v2" : "v1",
                               fingerprint,
                               params.clientId,
                               params.clientMode,
                               params.role,
                               scopes,
                               params.signedAtMs,
                               params.token.value_or(""));
    if (hasNonce)
        payload += std::format("|{}", *params.nonce);
    return payload;
}

auto createDeviceAssertion(const Identity& identity, const AssertionParams& params) -> Result<DeviceAssertion>
{
    auto const payload = buildSigningPayload(identity.fingerprint(), params);
    log::trace("Signing device payload: {}", payload);

    return identity.sign(payload).transform([&](const std::vector<std::uint8_t>& signature) {
        auto assertion = DeviceAssertion {
            .id = identity.fingerprint(),
            .publicKey = base64UrlEncode(identity.publicKey()),
            .signature = base64UrlEncode(signature),
            .signedAt = params.signedAtMs,
            .nonce = std::nullopt,
        };
        if (params.nonce && !params.nonce->empty())
            assertion.nonce = params.nonce;
        return assertion;
    });
}

auto computeFingerprint(std::span<const std::uint8_t> publicKey) -> std::string
{
    auto digest = std::array<unsigned char, EVP_MAX_MD_SIZE> {};
    auto digestSize = 0u;
    if (EVP_Digest(publicKey.data(), publicKey.size(), digest.data(), &digestSize, EVP_sha256(), nullptr) != 1)
        return {};

    auto result = std::string {};
    result.reserve(digestSize * 2);
    for (auto const byte: std::span(digest.data(), digestSize))
        result += std::format("{:02x}", byte);
    return result;
}

auto base64UrlEncode(std::span<const std::uint8_t> data) -> std::string
{
    auto encoded = std::string(4 * ((data.size() + 2) / 3) + 1, '\0');
    auto const length = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()), data.data(), static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(length));

    std::ranges::replace(encoded, '+', '-');
    std::ranges::replace(encoded, '/', '_');
    while (!encoded.empty() && encoded.back() == '=')
        encoded.pop_back();
    return encoded;
}

auto decodeHex(std::string_view hex) -> Result<std::vector<std::uint8_t>>
{
    if (hex.size() % 2 != 0)
        return makeError(ErrorCode::InvalidArgument, "Hex string has odd length");

    auto bytes = std::vector<std::uint8_t> {};
    bytes.reserve(hex.size() / 2);
    for (auto i = std::size_t { 0 }; i < hex.size(); i += 2)
    {
        auto const high = hexDigit(hex[i]);
        auto const low = hexDigit(hex[i + 1]);
        if (high < 0 || low < 0)
            return makeError(ErrorCode::InvalidArgument, std::format("Invalid hex digit at offset {}", i));
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return bytes;
}

auto randomUuid() -> Result<std::string>
{
    auto bytes = std::array<unsigned char, 16> {};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
        return makeError(ErrorCode::KeyError, "System random generator failed");

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    auto uuid = std::string {};
    uuid.reserve(36);
    for (auto i = std::size_t { 0 }; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            uuid += '-';
        uuid += std::format("{:02x}", bytes[i]);
    }
    return uuid;
}

} // namespace gatelink
