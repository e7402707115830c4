#include "auth/auth_orchestrator.hpp"
#include "auth/argon2_hasher.hpp"
#include "auth/storage_guard.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <regex>

namespace json = boost::json;

namespace auth
{

namespace
{

// Some backends nest the user under "user", others flatten it into data.
const json::object& user_object(const json::object& data)
{
    if (auto it = data.find("user"); it != data.end() && it->value().is_object())
    {
        return it->value().as_object();
    }
    return data;
}

std::optional<std::string> pick(const json::object& data, std::initializer_list<std::string_view> keys)
{
    if (auto v = json_utils::first_str(user_object(data), keys))
    {
        return v;
    }
    return json_utils::first_str(data, keys);
}

bool valid_email(std::string_view email)
{
    static const std::regex pattern(R"(^[A-Za-z0-9._%+\-]+@[A-Za-z0-9.\-]+\.[A-Za-z]{2,}$)");
    return std::regex_match(email.begin(), email.end(), pattern);
}

bool mentions_exists(std::string_view msg)
{
    std::string lower(msg);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("exists") != std::string::npos;
}

std::optional<std::string> local_token()
{
    auto bytes = crypto::random_bytes(32);
    if (!bytes)
    {
        return std::nullopt;
    }
    return crypto::to_hex(*bytes);
}

} // namespace

AuthOrchestrator::AuthOrchestrator(vault::SecureStore& s, IdentityBackend& be, BiometricGate& g,
                                   PinFallback& p, DeviceIdentity& d, AuthMetrics& m, Settings settings)
    : store(s)
    , backend(be)
    , gate(g)
    , pin(p)
    , device(d)
    , metrics(m)
    , cfg(settings)
{
}

AuthResult<CredentialRecord> AuthOrchestrator::record_from(const BackendResponse& res, std::string_view email,
                                                           std::string_view password, std::string_view name)
{
    CredentialRecord rec;
    rec.user_id = pick(res.data, {"user_id", "userId", "id"}).value_or("");
    if (rec.user_id.empty())
    {
        LOG_WARN("Backend answered {} without a user id", res.status);
        return fail(AuthErrc::Connectivity, "Invalid response from server");
    }
    rec.email = pick(res.data, {"email"}).value_or(std::string(email));
    rec.name = pick(res.data, {"name"}).value_or(std::string(name));
    rec.password = std::string(password);
    rec.access_token = json_utils::first_str(res.data, {"token", "access_token"}).value_or("");
    rec.refresh_token = json_utils::first_str(res.data, {"refresh_token"}).value_or("");

    // Backends without a token scheme still need a session to bind factors to.
    if (rec.access_token.empty() || rec.refresh_token.empty())
    {
        auto access = local_token();
        auto refresh = local_token();
        if (!access || !refresh)
        {
            return fail(AuthErrc::Storage, "Failed to create a session token");
        }
        if (rec.access_token.empty())
        {
            rec.access_token = std::move(*access);
        }
        if (rec.refresh_token.empty())
        {
            rec.refresh_token = std::move(*refresh);
        }
    }

    rec.logged_in = true;
    rec.auth_method = AuthMethod::Password;
    return rec;
}

AuthResult<CredentialRecord> AuthOrchestrator::sign_in(std::string_view email, std::string_view password)
{
    if (email.empty() || password.empty())
    {
        return fail(AuthErrc::Validation, "Please enter both email and password");
    }

    if (cfg.probe_connectivity && !backend.get().reachable())
    {
        metrics.get().sign_ins_failed++;
        return fail(AuthErrc::Connectivity, "Unable to reach the server. Please check your connection.");
    }

    auto res = backend.get().login(email, password, device.get().device_id());
    if (res.status == 0)
    {
        metrics.get().sign_ins_failed++;
        return fail(AuthErrc::Connectivity, res.message.empty() ? std::string("Network error") : res.message);
    }
    if (!res.success)
    {
        metrics.get().sign_ins_failed++;
        LOG_INFO("Sign-in rejected by backend ({})", res.status);
        return fail(AuthErrc::InvalidCredentials,
                    res.message.empty() ? std::string("Invalid email or password") : res.message);
    }

    auto rec = record_from(res, email, password, "");
    if (!rec)
    {
        metrics.get().sign_ins_failed++;
        return rec;
    }

    return storage_guarded("Sign-in", [&]() -> AuthResult<CredentialRecord> {
        store.get().set_record(vault::keys::credentials, *rec);
        metrics.get().sign_ins_successful++;
        LOG_INFO("User {} signed in", rec->user_id);
        return *rec;
    });
}

AuthResult<CredentialRecord> AuthOrchestrator::sign_up(std::string_view email, std::string_view password,
                                                       std::string_view name)
{
    if (email.empty() || password.empty() || name.empty())
    {
        return fail(AuthErrc::Validation, "Please fill in all fields");
    }
    if (!valid_email(email))
    {
        return fail(AuthErrc::Validation, "Please enter a valid email address");
    }
    if (!check_password(password, cfg.password_min_length))
    {
        return fail(AuthErrc::Validation,
                    std::format("Password must be at least {} characters", cfg.password_min_length));
    }

    auto res = backend.get().register_user(name, email, password);
    if (res.status == 0)
    {
        return fail(AuthErrc::Connectivity, res.message.empty() ? std::string("Network error") : res.message);
    }
    if (!res.success)
    {
        if (res.status == 409 || mentions_exists(res.message))
        {
            return fail(AuthErrc::InvalidCredentials, "An account with this email already exists");
        }
        return fail(AuthErrc::InvalidCredentials,
                    res.message.empty() ? std::string("Failed to create account") : res.message);
    }

    auto rec = record_from(res, email, password, name);
    if (!rec)
    {
        return rec;
    }

    // The previous occupant's shortcuts go before the new identity lands.
    if (auto cleared = gate.get().reset_for_new_user(); !cleared)
    {
        return std::unexpected(cleared.error());
    }
    if (auto cleared = pin.get().reset_for_new_user(); !cleared)
    {
        return std::unexpected(cleared.error());
    }

    return storage_guarded("Sign-up", [&]() -> AuthResult<CredentialRecord> {
        store.get().set_record(vault::keys::credentials, *rec);
        metrics.get().sign_ups++;
        LOG_INFO("User {} registered and signed in", rec->user_id);
        return *rec;
    });
}

AuthResult<void> AuthOrchestrator::sign_out()
{
    return storage_guarded("Sign-out", [&]() -> AuthResult<void> {
        store.get().remove(vault::keys::credentials);
        store.get().remove(vault::keys::lockout_state);
        metrics.get().sign_outs++;
        LOG_INFO("Signed out");
        return {};
    });
}

void count_factor_failure(AuthMetrics& m, const AuthError& err,
                          std::atomic<uint64_t>& failed, std::atomic<uint64_t>& lockouts)
{
    switch (err.code)
    {
        case AuthErrc::LockedOut: lockouts++; break;
        case AuthErrc::InvalidCredentials: failed++; break;
        case AuthErrc::Storage: m.storage_errors++; break;
        default: break;
    }
}

AuthResult<CredentialRecord> AuthOrchestrator::adopt(const BoundIdentity& identity, AuthMethod method)
{
    return storage_guarded("Session adoption", [&]() -> AuthResult<CredentialRecord> {
        CredentialRecord rec;
        rec.email = identity.email;
        rec.name = identity.name;
        rec.user_id = identity.user_id;
        rec.access_token = identity.token;

        // Auto-login material survives only for the same account.
        if (auto prev = store.get().get_record<CredentialRecord>(vault::keys::credentials);
            prev && prev->email == identity.email)
        {
            rec.password = prev->password;
            rec.refresh_token = prev->refresh_token;
        }

        rec.logged_in = true;
        rec.auth_method = method;
        store.get().set_record(vault::keys::credentials, rec);
        LOG_INFO("User {} signed in via {}", rec.user_id, to_string(method));
        return rec;
    });
}

AuthResult<CredentialRecord> AuthOrchestrator::sign_in_with_biometric()
{
    auto identity = gate.get().authenticate();
    if (!identity)
    {
        auto& m = metrics.get();
        count_factor_failure(m, identity.error(), m.biometric_failed, m.biometric_lockouts);
        return std::unexpected(identity.error());
    }

    metrics.get().biometric_successful++;
    return adopt(*identity, AuthMethod::Biometric);
}

AuthResult<CredentialRecord> AuthOrchestrator::sign_in_with_pin(std::string_view code)
{
    auto identity = pin.get().verify(code);
    if (!identity)
    {
        auto& m = metrics.get();
        count_factor_failure(m, identity.error(), m.pin_failed, m.pin_lockouts);
        return std::unexpected(identity.error());
    }

    metrics.get().pin_successful++;
    return adopt(*identity, AuthMethod::Pin);
}

AuthResult<void> AuthOrchestrator::refresh_token()
{
    return storage_guarded("Token refresh", [&]() -> AuthResult<void> {
        auto rec = store.get().get_record<CredentialRecord>(vault::keys::credentials);
        if (!rec || rec->refresh_token.empty())
        {
            return fail(AuthErrc::NotAuthenticated, "No refresh token available");
        }

        auto res = backend.get().refresh(rec->refresh_token, device.get().device_id());
        if (res.status == 0)
        {
            return fail(AuthErrc::Connectivity, res.message.empty() ? std::string("Network error") : res.message);
        }
        if (!res.success)
        {
            LOG_INFO("Token refresh rejected ({})", res.status);
            return fail(AuthErrc::NotAuthenticated, "Session expired. Please sign in again.");
        }

        auto access = json_utils::first_str(res.data, {"token", "access_token"});
        if (!access || access->empty())
        {
            return fail(AuthErrc::Connectivity, "Invalid response from server");
        }
        rec->access_token = std::move(*access);
        if (auto next = json_utils::first_str(res.data, {"refresh_token"}); next && !next->empty())
        {
            rec->refresh_token = std::move(*next);
        }

        store.get().set_record(vault::keys::credentials, *rec);
        metrics.get().token_refreshes++;
        LOG_INFO("Tokens refreshed for user {}", rec->user_id);
        return {};
    });
}

AuthResult<CredentialRecord> AuthOrchestrator::auto_login()
{
    auto stored = storage_guarded("Auto-login", [&]() -> AuthResult<CredentialRecord> {
        auto rec = store.get().get_record<CredentialRecord>(vault::keys::credentials);
        if (!rec || rec->email.empty() || rec->password.empty())
        {
            return fail(AuthErrc::NotAuthenticated, "No stored credentials");
        }
        return *rec;
    });
    if (!stored)
    {
        return stored;
    }
    return sign_in(stored->email, stored->password);
}

AuthResult<void> AuthOrchestrator::enable_biometric()
{
    auto rec = current_record();
    if (!rec || !rec->logged_in || rec->auth_method != AuthMethod::Password)
    {
        return fail(AuthErrc::NotAuthenticated,
                    "Please sign in with your email and password to enable biometric authentication");
    }
    return gate.get().enable(rec->identity());
}

AuthResult<json::object> AuthOrchestrator::fetch_profile()
{
    auto rec = current_record();
    if (!rec || !rec->logged_in || rec->user_id.empty())
    {
        return fail(AuthErrc::NotAuthenticated, "Please sign in first");
    }

    auto res = backend.get().get_user(rec->user_id);
    if (res.status == 0)
    {
        return fail(AuthErrc::Connectivity, res.message.empty() ? std::string("Network error") : res.message);
    }
    if (!res.success)
    {
        return fail(AuthErrc::NotAuthenticated, res.message.empty() ? std::string("User not found") : res.message);
    }

    if (auto name = pick(res.data, {"name"}); name && *name != rec->name)
    {
        rec->name = *name;
        auto saved = storage_guarded("Profile update", [&]() -> AuthResult<void> {
            store.get().set_record(vault::keys::credentials, *rec);
            return {};
        });
        if (!saved)
        {
            return std::unexpected(saved.error());
        }
    }
    return res.data;
}

AuthResult<void> AuthOrchestrator::store_credentials(std::string_view email, std::string_view password,
                                                     std::string_view name, std::string_view user_id,
                                                     std::string_view access_token,
                                                     std::string_view refresh_token)
{
    CredentialRecord rec{
        std::string(email), std::string(password), std::string(name), std::string(user_id),
        std::string(access_token), std::string(refresh_token), true, AuthMethod::Password
    };
    return storage_guarded("Credential store", [&]() -> AuthResult<void> {
        store.get().set_record(vault::keys::credentials, rec);
        return {};
    });
}

AuthResult<CredentialRecord> AuthOrchestrator::stored_credentials()
{
    return storage_guarded("Credential read", [&]() -> AuthResult<CredentialRecord> {
        auto rec = store.get().get_record<CredentialRecord>(vault::keys::credentials);
        if (!rec)
        {
            return fail(AuthErrc::NotAuthenticated, "No stored credentials");
        }
        return *rec;
    });
}

std::optional<CredentialRecord> AuthOrchestrator::current_record()
{
    try
    {
        return store.get().get_record<CredentialRecord>(vault::keys::credentials);
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("Credential record unreadable: {}", e.what());
        metrics.get().storage_errors++;
        return std::nullopt;
    }
}

bool AuthOrchestrator::is_logged_in()
{
    auto rec = current_record();
    return rec && rec->logged_in;
}

}
