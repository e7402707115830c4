#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <cstddef>

namespace auth
{

// Argon2id via libsodium. The encoded string carries algorithm, cost
// parameters and the random salt, so it is the whole salted hash.
class Argon2Hasher
{
public:
    struct HashResult
    {
        std::string encoded;
    };

    [[nodiscard]] static std::expected<HashResult, std::string> hash(std::string_view secret);
    [[nodiscard]] static bool verify(std::string_view secret, std::string_view encoded_hash);

private:
    [[nodiscard]] static bool ensure_init();
};

[[nodiscard]] bool check_password(std::string_view password, size_t min_length = 8);

}
