#include "auth/argon2_hasher.hpp"

#include <sodium.h>
#include <array>

namespace auth
{

bool Argon2Hasher::ensure_init()
{
    static const bool ok = sodium_init() >= 0;
    return ok;
}

std::expected<Argon2Hasher::HashResult, std::string> Argon2Hasher::hash(std::string_view secret)
{
    if (!ensure_init())
    {
        return std::unexpected("Failed to initialize libsodium");
    }

    std::array<char, crypto_pwhash_STRBYTES> encoded{};
    int result = crypto_pwhash_str(
        encoded.data(),
        secret.data(), secret.size(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE
    );

    if (result != 0)
    {
        return std::unexpected("Failed to hash secret");
    }

    HashResult out{std::string(encoded.data())};
    sodium_memzero(encoded.data(), encoded.size());
    return out;
}

bool Argon2Hasher::verify(std::string_view secret, std::string_view encoded_hash)
{
    if (!ensure_init() || encoded_hash.empty() || encoded_hash.size() >= crypto_pwhash_STRBYTES)
    {
        return false;
    }

    // libsodium reads the encoded form as a C string.
    std::array<char, crypto_pwhash_STRBYTES> encoded{};
    encoded_hash.copy(encoded.data(), encoded_hash.size());

    return crypto_pwhash_str_verify(encoded.data(), secret.data(), secret.size()) == 0;
}

bool check_password(std::string_view password, size_t min_length)
{
    return password.size() >= min_length;
}

}
