#include <catch2/catch_test_macros.hpp>

#include "auth/argon2_hasher.hpp"
#include "crypto/aesgcm256.hpp"
#include "crypto/utils.hpp"

#include <array>
#include <string_view>
#include <vector>
#include <span>

using namespace crypto;

namespace
{

std::span<const uint8_t> as_bytes(std::string_view sv)
{
    return {reinterpret_cast<const uint8_t*>(sv.data()), sv.size()};
}

}

TEST_CASE("AES256GCM encrypt produces ciphertext with tag")
{
    std::array<uint8_t, 32> key{};
    std::array<uint8_t, 12> nonce{};
    std::vector<uint8_t> plaintext{0x01, 0x02, 0x03, 0x04};

    key.fill(0xAB);
    nonce.fill(0xCD);

    auto ct = AES256GCM::encrypt(key, nonce, plaintext);

    REQUIRE(ct.has_value());
    CHECK(ct->data.size() == plaintext.size());
    CHECK(ct->tag.size() == AES256GCM::tag_sz);
}

TEST_CASE("AES256GCM decrypt detects tampered tag")
{
    std::array<uint8_t, 32> key{};
    std::array<uint8_t, 12> nonce{};
    std::vector<uint8_t> plaintext{0x01, 0x02, 0x03};

    key.fill(0x89);
    nonce.fill(0xAB);

    auto ct = AES256GCM::encrypt(key, nonce, plaintext);
    REQUIRE(ct.has_value());

    ct->tag[0] ^= 0xFF;

    auto recovered = AES256GCM::decrypt(key, nonce, *ct);

    CHECK(!recovered.has_value());
}

TEST_CASE("AES256GCM rejects a key of the wrong size")
{
    std::array<uint8_t, 16> short_key{};
    std::array<uint8_t, 12> nonce{};
    std::vector<uint8_t> plaintext{0x01};

    CHECK(!AES256GCM::encrypt(short_key, nonce, plaintext).has_value());
}

TEST_CASE("AES256GCM seal prefixes a fresh nonce and opens back")
{
    AES256GCM::key_t key{};
    key.fill(0x21);

    auto a = AES256GCM::seal(key, as_bytes("session.credentials value"), as_bytes("session.credentials"));
    auto b = AES256GCM::seal(key, as_bytes("session.credentials value"), as_bytes("session.credentials"));
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    CHECK(a->size() == AES256GCM::nonce_sz + 25 + AES256GCM::tag_sz);
    CHECK(*a != *b);

    auto opened = AES256GCM::open(key, *a, as_bytes("session.credentials"));
    REQUIRE(opened.has_value());
    CHECK(std::string(opened->begin(), opened->end()) == "session.credentials value");
}

TEST_CASE("AES256GCM open refuses a blob bound to another key name")
{
    AES256GCM::key_t key{};
    key.fill(0x42);

    auto sealed = AES256GCM::seal(key, as_bytes("{\"hash\":\"x\"}"), as_bytes("pin.record"));
    REQUIRE(sealed.has_value());

    CHECK(!AES256GCM::open(key, *sealed, as_bytes("biometric.binding")).has_value());
}

TEST_CASE("AES256GCM open refuses tampered or truncated blobs")
{
    AES256GCM::key_t key{};
    key.fill(0x77);

    auto sealed = AES256GCM::seal(key, as_bytes("payload"), {});
    REQUIRE(sealed.has_value());

    auto flipped = *sealed;
    flipped[AES256GCM::nonce_sz] ^= 0x01;
    CHECK(!AES256GCM::open(key, flipped, {}).has_value());

    std::vector<uint8_t> truncated(sealed->begin(), sealed->begin() + AES256GCM::nonce_sz);
    CHECK(!AES256GCM::open(key, truncated, {}).has_value());

    AES256GCM::key_t other{};
    other.fill(0x78);
    CHECK(!AES256GCM::open(other, *sealed, {}).has_value());
}

TEST_CASE("crypto::to_hex renders lowercase pairs")
{
    std::vector<uint8_t> data{0x00, 0x0F, 0xA5, 0xFF};

    CHECK(to_hex(data) == "000fa5ff");
}

TEST_CASE("crypto::random_bytes returns the requested length")
{
    auto a = random_bytes(32);
    auto b = random_bytes(32);

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->size() == 32);
    CHECK(*a != *b);
}

TEST_CASE("Argon2Hasher verifies the right secret only")
{
    auto hashed = auth::Argon2Hasher::hash("2468");

    REQUIRE(hashed.has_value());
    CHECK(hashed->encoded.starts_with("$argon2id$"));
    CHECK(auth::Argon2Hasher::verify("2468", hashed->encoded) == true);
    CHECK(auth::Argon2Hasher::verify("2469", hashed->encoded) == false);
}

TEST_CASE("Argon2Hasher salts every hash")
{
    auto a = auth::Argon2Hasher::hash("same secret");
    auto b = auth::Argon2Hasher::hash("same secret");

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->encoded != b->encoded);
}

TEST_CASE("Argon2Hasher rejects malformed hashes")
{
    CHECK(auth::Argon2Hasher::verify("2468", "") == false);
    CHECK(auth::Argon2Hasher::verify("2468", "not-a-hash") == false);
}

TEST_CASE("check_password enforces the minimum length")
{
    CHECK(auth::check_password("1234567", 8) == false);
    CHECK(auth::check_password("12345678", 8) == true);
}
