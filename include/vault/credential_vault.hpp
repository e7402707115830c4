#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vault
{

/**
 * Opaque string key/value store with encryption at rest.
 * Single-key operations are atomic. Nothing spans keys: callers that need a
 * consistent multi-field record store it under one key.
 * Implementations report faults by throwing; SecureStore normalizes them.
 */
class CredentialVault
{
public:
    virtual ~CredentialVault() = default;

    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) = 0;
    virtual void set(std::string_view key, std::string_view value) = 0;
    virtual void remove(std::string_view key) = 0;
    virtual void clear() = 0;
};

} // namespace vault
