#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

enum class AuthMethod : uint8_t
{
    Password,
    Biometric,
    Pin,
};

[[nodiscard]] std::string_view to_string(AuthMethod m);
[[nodiscard]] std::optional<AuthMethod> auth_method_from(std::string_view s);

// Identity a shortcut factor hands back: enough to resurrect a session that
// was previously issued, nothing more.
struct BoundIdentity
{
    std::string email;
    std::string token;
    std::string user_id;
    std::string name;

    bool operator==(const BoundIdentity&) const = default;
};

// The session. The password is kept in the clear for auto-login
// re-presentation; the vault encrypts it at rest.
struct CredentialRecord
{
    std::string email;
    std::string password;
    std::string name;
    std::string user_id;
    std::string access_token;
    std::string refresh_token;
    bool logged_in = false;
    AuthMethod auth_method = AuthMethod::Password;

    [[nodiscard]] BoundIdentity identity() const
    {
        return BoundIdentity{email, access_token, user_id, name};
    }

    bool operator==(const CredentialRecord&) const = default;
};

struct BiometricBinding
{
    bool enabled = false;
    BoundIdentity identity;
};

struct LockoutState
{
    bool is_locked = false;
    bool was_authenticated = false;

    bool operator==(const LockoutState&) const = default;
};

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const CredentialRecord& rec);
CredentialRecord tag_invoke(boost::json::value_to_tag<CredentialRecord>, const boost::json::value& jv);

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const BiometricBinding& b);
BiometricBinding tag_invoke(boost::json::value_to_tag<BiometricBinding>, const boost::json::value& jv);

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const LockoutState& s);
LockoutState tag_invoke(boost::json::value_to_tag<LockoutState>, const boost::json::value& jv);

}
