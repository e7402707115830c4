#pragma once
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace crypto
{

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        OPENSSL_cleanse(cont.data(), cont.size() * sizeof(*cont.data()));
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

inline std::optional<std::vector<uint8_t>> random_bytes(size_t n)
{
    std::vector<uint8_t> out(n);
    if (n > 0 && RAND_bytes(out.data(), static_cast<int>(n)) != 1)
    {
        return std::nullopt;
    }
    return out;
}

inline std::string to_hex(std::span<const uint8_t> bytes)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes)
    {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace crypto
