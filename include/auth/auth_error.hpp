#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

enum class AuthErrc : uint8_t
{
    Validation,          // malformed or empty input
    Connectivity,        // backend unreachable or timed out
    InvalidCredentials,  // wrong password/PIN/biometric, or duplicate account
    NotConfigured,       // biometric or PIN never set up
    LockedOut,           // too many failed attempts
    NotAuthenticated,    // needs an existing session or refresh token
    Storage,             // vault fault, failed closed
    Busy,                // a biometric prompt is already in flight
};

[[nodiscard]] std::string_view to_string(AuthErrc code);

// Enough for a caller to render "2 attempts left" or "try again at ..." without
// re-reading any counters.
struct LockoutDetails
{
    uint32_t remaining_attempts = 0;
    std::optional<std::chrono::system_clock::time_point> unlock_at;
    bool pin_fallback_available = false;
};

struct AuthError
{
    AuthErrc code;
    std::string message;
    std::optional<LockoutDetails> lockout;

    [[nodiscard]] static AuthError make(AuthErrc c, std::string msg)
    {
        return AuthError{c, std::move(msg), std::nullopt};
    }
};

template<class T>
using AuthResult = std::expected<T, AuthError>;

[[nodiscard]] inline std::unexpected<AuthError> fail(AuthErrc c, std::string msg)
{
    return std::unexpected(AuthError::make(c, std::move(msg)));
}

[[nodiscard]] inline std::unexpected<AuthError> fail(AuthErrc c, std::string msg, LockoutDetails details)
{
    return std::unexpected(AuthError{c, std::move(msg), details});
}

} // namespace auth
