// SPDX-License-Identifier: Apache-2.0
#include <identity/Identity.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <set>

using namespace gatelink;

namespace
{
    // RFC 8032 section 7.1, test 1.
    constexpr auto PublicKeyHex = "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";
    constexpr auto PrivateKeyDerHex = "302e020100300506032b657004220420"
                                      "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
    constexpr auto Fingerprint = "21fe31dfa154a261626bf854046fd2271b7bed4b6abe45aa58877ef47f9721b9";
} // namespace

TEST_CASE("Identity loads matching Ed25519 key material", "[identity]")
{
    auto identity = Identity::fromHex(PublicKeyHex, PrivateKeyDerHex);
    REQUIRE(identity.has_value());
    CHECK(identity->fingerprint() == Fingerprint);
    CHECK(identity->publicKey().size() == 32);
}

TEST_CASE("Identity rejects malformed key material", "[identity]")
{
    SECTION("odd length hex")
    {
        auto identity = Identity::fromHex("abc", PrivateKeyDerHex);
        REQUIRE(!identity);
        CHECK(identity.error().code == ErrorCode::KeyError);
    }

    SECTION("wrong public key size")
    {
        auto identity = Identity::fromHex("d75a9801", PrivateKeyDerHex);
        REQUIRE(!identity);
        CHECK(identity.error().code == ErrorCode::KeyError);
    }

    SECTION("private key is not DER")
    {
        auto identity = Identity::fromHex(PublicKeyHex, "00112233");
        REQUIRE(!identity);
        CHECK(identity.error().code == ErrorCode::KeyError);
    }

    SECTION("public key of another key pair")
    {
        auto identity =
            Identity::fromHex("3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c", PrivateKeyDerHex);
        REQUIRE(!identity);
        CHECK(identity.error().message == "Public key does not match private key");
    }
}

TEST_CASE("Identity signatures are deterministic Ed25519", "[identity]")
{
    auto identity = Identity::fromHex(PublicKeyHex, PrivateKeyDerHex);
    REQUIRE(identity.has_value());

    auto signature = identity->sign("hello");
    REQUIRE(signature.has_value());
    CHECK(signature->size() == 64);
    CHECK(base64UrlEncode(*signature)
          == "URykl8TUJwsJixr9WuTjuVGl2iydpunAUo9XYYg2duffbkwPDhtaCkRE9CmLGILdgi-xEzy9Sav7mWyHzVuFBg");
}

TEST_CASE("buildSigningPayload", "[identity]")
{
    auto params = AssertionParams {
        .clientId = "cli",
        .clientMode = "cli",
        .role = "operator",
        .scopes = { "operator.admin", "operator.approvals" },
        .signedAtMs = 1700000000000,
        .token = std::nullopt,
        .nonce = std::nullopt,
    };

    SECTION("v1 without nonce, empty token")
    {
        CHECK(buildSigningPayload("fp", params)
              == "v1|fp|cli|cli|operator|operator.admin,operator.approvals|1700000000000|");
    }

    SECTION("v2 with nonce and token")
    {
        params.token = "secret";
        params.nonce = "abc";
        CHECK(buildSigningPayload("fp", params)
              == "v2|fp|cli|cli|operator|operator.admin,operator.approvals|1700000000000|secret|abc");
    }

    SECTION("empty nonce counts as absent")
    {
        params.nonce = "";
        CHECK(buildSigningPayload("fp", params).starts_with("v1|"));
    }
}

TEST_CASE("createDeviceAssertion", "[identity]")
{
    auto identity = Identity::fromHex(PublicKeyHex, PrivateKeyDerHex);
    REQUIRE(identity.has_value());

    auto assertion = createDeviceAssertion(*identity,
                                           AssertionParams {
                                               .clientId = "cli",
                                               .clientMode = "cli",
                                               .role = "node",
                                               .scopes = {},
                                               .signedAtMs = 42,
                                               .token = "t",
                                               .nonce = "n1",
                                           });
    REQUIRE(assertion.has_value());
    CHECK(assertion->id == Fingerprint);
    CHECK(assertion->publicKey == "11qYAYKxCrfVS_7TyWQHOg7hcvPapiMlrwIaaPcHURo");
    CHECK(assertion->signedAt == 42);
    CHECK(assertion->nonce == "n1");

    auto const payload = buildSigningPayload(Fingerprint,
                                             AssertionParams {
                                                 .clientId = "cli",
                                                 .clientMode = "cli",
                                                 .role = "node",
                                                 .scopes = {},
                                                 .signedAtMs = 42,
                                                 .token = "t",
                                                 .nonce = "n1",
                                             });
    auto const expected = identity->sign(payload);
    REQUIRE(expected.has_value());
    CHECK(assertion->signature == base64UrlEncode(*expected));

    auto const wire = assertion->toJson();
    CHECK(wire["id"] == Fingerprint);
    CHECK(wire["signedAt"] == 42);
    CHECK(wire["nonce"] == "n1");
}

TEST_CASE("computeFingerprint hashes the raw key", "[identity]")
{
    auto const zeros = std::array<std::uint8_t, 32> {};
    CHECK(computeFingerprint(zeros) == "66687aadf862bd776c8fc18b8e9f8e20089714856ee233b3902a591d0d5f2925");
}

TEST_CASE("base64UrlEncode omits padding", "[identity]")
{
    auto const hello = std::array<std::uint8_t, 5> { 'h', 'e', 'l', 'l', 'o' };
    CHECK(base64UrlEncode(hello) == "aGVsbG8");

    auto const special = std::array<std::uint8_t, 3> { 0xfb, 0xff, 0xfe };
    CHECK(base64UrlEncode(special) == "-__-");
}

TEST_CASE("decodeHex", "[identity]")
{
    auto bytes = decodeHex("00Ff7a");
    REQUIRE(bytes.has_value());
    CHECK(*bytes == std::vector<std::uint8_t> { 0x00, 0xff, 0x7a });
    CHECK(!decodeHex("0g"));
}

TEST_CASE("randomUuid produces distinct version 4 ids", "[identity]")
{
    auto seen = std::set<std::string> {};
    for (auto i = 0; i < 16; ++i)
    {
        auto uuid = randomUuid();
        REQUIRE(uuid.has_value());
        REQUIRE(uuid->size() == 36);
        CHECK((*uuid)[8] == '-');
        CHECK((*uuid)[14] == '4');
        CHECK(std::string_view("89ab").find((*uuid)[19]) != std::string_view::npos);
        seen.insert(*uuid);
    }
    CHECK(seen.size() == 16);
}
