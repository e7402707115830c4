#include "auth/credential_record.hpp"
#include "fundamentals/json_utils.hpp"

namespace json = boost::json;
using namespace json_utils;

namespace auth
{

std::string_view to_string(AuthMethod m)
{
    switch (m)
    {
        case AuthMethod::Biometric: return "biometric";
        case AuthMethod::Pin:       return "pin";
        default:                    return "password";
    }
}

std::optional<AuthMethod> auth_method_from(std::string_view s)
{
    if (s == "password") return AuthMethod::Password;
    if (s == "biometric") return AuthMethod::Biometric;
    if (s == "pin") return AuthMethod::Pin;
    return std::nullopt;
}

void tag_invoke(json::value_from_tag, json::value& jv, const CredentialRecord& rec)
{
    jv = json::object{
        {"email", rec.email},
        {"password", rec.password},
        {"name", rec.name},
        {"user_id", rec.user_id},
        {"access_token", rec.access_token},
        {"refresh_token", rec.refresh_token},
        {"logged_in", rec.logged_in},
        {"auth_method", to_string(rec.auth_method)}
    };
}

CredentialRecord tag_invoke(json::value_to_tag<CredentialRecord>, const json::value& jv)
{
    const auto& obj = jv.as_object();
    CredentialRecord rec;
    rec.email = str_or(obj, "email");
    rec.password = str_or(obj, "password");
    rec.name = str_or(obj, "name");
    rec.user_id = str_or(obj, "user_id");
    rec.access_token = str_or(obj, "access_token");
    rec.refresh_token = str_or(obj, "refresh_token");
    rec.logged_in = bool_or(obj, "logged_in");
    rec.auth_method = auth_method_from(str_or(obj, "auth_method")).value_or(AuthMethod::Password);
    return rec;
}

void tag_invoke(json::value_from_tag, json::value& jv, const BiometricBinding& b)
{
    jv = json::object{
        {"enabled", b.enabled},
        {"email", b.identity.email},
        {"token", b.identity.token},
        {"user_id", b.identity.user_id},
        {"name", b.identity.name}
    };
}

BiometricBinding tag_invoke(json::value_to_tag<BiometricBinding>, const json::value& jv)
{
    const auto& obj = jv.as_object();
    BiometricBinding b;
    b.enabled = bool_or(obj, "enabled");
    b.identity.email = str_or(obj, "email");
    b.identity.token = str_or(obj, "token");
    b.identity.user_id = str_or(obj, "user_id");
    b.identity.name = str_or(obj, "name");
    return b;
}

void tag_invoke(json::value_from_tag, json::value& jv, const LockoutState& s)
{
    jv = json::object{
        {"is_locked", s.is_locked},
        {"was_authenticated", s.was_authenticated}
    };
}

LockoutState tag_invoke(json::value_to_tag<LockoutState>, const json::value& jv)
{
    // Strict: a mistyped lock flag must not read as unlocked.
    const auto& obj = jv.as_object();
    return LockoutState{obj.at("is_locked").as_bool(), obj.at("was_authenticated").as_bool()};
}

}
