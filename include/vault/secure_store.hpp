#pragma once

#include "vault/credential_vault.hpp"

#include <boost/json.hpp>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vault
{

namespace keys
{
inline constexpr std::string_view credentials = "session.credentials";
inline constexpr std::string_view biometric_binding = "biometric.binding";
inline constexpr std::string_view biometric_attempts = "biometric.attempts";
inline constexpr std::string_view pin_record = "pin.record";
inline constexpr std::string_view lockout_state = "app.lockout";
inline constexpr std::string_view device_id = "device.id";
}

/**
 * Unrecoverable vault fault. The only error in the engine that is thrown
 * rather than returned; whoever catches it must fail closed.
 */
class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Boundary between a CredentialVault and the auth services.
 * Every fault raised by the vault, whatever its type, leaves here as
 * StorageError. Records are stored as one JSON document per key, so a record
 * is always replaced by a single write.
 */
class SecureStore
{
public:
    explicit SecureStore(CredentialVault& v);

    [[nodiscard]] std::optional<std::string> get(std::string_view key);
    void set(std::string_view key, std::string_view value);
    void remove(std::string_view key);
    void clear();

    // Absent key -> nullopt. Present but unparsable -> StorageError.
    [[nodiscard]] std::optional<boost::json::object> get_object(std::string_view key);
    void set_object(std::string_view key, const boost::json::object& obj);

    // Typed records via Boost.JSON value_from / value_to customizations.
    template<class T>
    [[nodiscard]] std::optional<T> get_record(std::string_view key)
    {
        auto obj = get_object(key);
        if (!obj)
        {
            return std::nullopt;
        }
        try
        {
            return boost::json::value_to<T>(boost::json::value(std::move(*obj)));
        }
        catch (const std::exception& e)
        {
            throw StorageError(std::string("Vault record '") + std::string(key) + "' is malformed: " + e.what());
        }
    }

    template<class T>
    void set_record(std::string_view key, const T& rec)
    {
        set(key, boost::json::serialize(boost::json::value_from(rec)));
    }

private:
    template<class Fn>
    decltype(auto) guarded(std::string_view op, std::string_view key, Fn&& fn);

    std::reference_wrapper<CredentialVault> vlt;
};

} // namespace vault
