#include "auth/biometric_gate.hpp"
#include "auth/storage_guard.hpp"
#include "logger.hpp"

#include <format>

namespace auth
{

namespace
{
constexpr std::string_view prompt_reason = "Authenticate to access your account";
}

std::string_view display_name(BiometricType t)
{
    switch (t)
    {
        case BiometricType::Fingerprint: return "Fingerprint";
        case BiometricType::Face: return "Face Recognition";
        case BiometricType::Iris: return "Iris";
        case BiometricType::Strong: return "Strong Biometric";
        case BiometricType::Weak: return "Weak Biometric";
    }
    return "Biometric";
}

BiometricGate::BiometricGate(vault::SecureStore& s, BiometricPlatform& p, PinFallback& pf,
                             ThreadPool& tp, const clk::Clock& clock, Settings settings)
    : store(s)
    , platform(p)
    , pin(pf)
    , pool(tp)
    , cfg(settings)
    , counter(s, std::string(vault::keys::biometric_attempts), clock, settings.reset_window)
{
}

bool BiometricGate::is_available()
{
    try
    {
        auto& plat = platform.get();
        return plat.is_device_supported() && plat.can_check_biometrics() && !plat.available_types().empty();
    }
    catch (const std::exception& e)
    {
        LOG_WARN("Biometric availability check failed: {}", e.what());
        return false;
    }
}

std::set<BiometricType> BiometricGate::available_types()
{
    try
    {
        return platform.get().available_types();
    }
    catch (const std::exception& e)
    {
        LOG_WARN("Listing biometric types failed: {}", e.what());
        return {};
    }
}

std::string BiometricGate::primary_type_name()
{
    auto types = available_types();
    if (types.empty())
    {
        return "Biometric";
    }
    if (types.contains(BiometricType::Fingerprint))
    {
        return std::string(display_name(BiometricType::Fingerprint));
    }
    if (types.contains(BiometricType::Face))
    {
        return std::string(display_name(BiometricType::Face));
    }
    return std::string(display_name(*types.begin()));
}

std::optional<BiometricBinding> BiometricGate::binding()
{
    return store.get().get_record<BiometricBinding>(vault::keys::biometric_binding);
}

bool BiometricGate::is_enabled()
{
    try
    {
        auto b = binding();
        return b && b->enabled;
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("Biometric binding unreadable: {}", e.what());
        return false;
    }
}

BiometricSetupStatus BiometricGate::setup_status()
{
    if (!is_available())
    {
        return BiometricSetupStatus::NotAvailable;
    }
    try
    {
        auto b = binding();
        return b && b->enabled ? BiometricSetupStatus::Ready : BiometricSetupStatus::AvailableButNotEnabled;
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("Biometric setup status unavailable: {}", e.what());
        return BiometricSetupStatus::Error;
    }
}

AuthResult<void> BiometricGate::enable(const BoundIdentity& identity)
{
    if (identity.email.empty() || identity.user_id.empty() || identity.token.empty())
    {
        return fail(AuthErrc::Validation, "A signed-in identity is required to enable biometrics");
    }
    if (!is_available())
    {
        return fail(AuthErrc::NotConfigured, "Biometric authentication is not available on this device");
    }

    return storage_guarded("Biometric enable", [&]() -> AuthResult<void> {
        BiometricBinding next{true, identity};
        if (auto cur = binding(); cur && cur->enabled && cur->identity == identity)
        {
            return {};
        }
        store.get().set_record(vault::keys::biometric_binding, next);
        LOG_INFO("Biometric sign-in enabled for user {}", identity.user_id);
        return {};
    });
}

AuthResult<void> BiometricGate::disable()
{
    return storage_guarded("Biometric disable", [&]() -> AuthResult<void> {
        if (!store.get().get(vault::keys::biometric_binding))
        {
            return {};
        }
        store.get().remove(vault::keys::biometric_binding);
        LOG_INFO("Biometric sign-in disabled");
        return {};
    });
}

std::optional<bool> BiometricGate::prompt()
{
    auto task = [&plat = platform.get(), flag = in_flight] {
        try
        {
            bool ok = plat.authenticate(prompt_reason, PromptOptions{});
            flag->store(false);
            return ok;
        }
        catch (...)
        {
            flag->store(false);
            throw;
        }
    };

    std::expected<bool, ThreadPool::errc> res;
    try
    {
        res = pool.get().submit_for(std::move(task), cfg.prompt_timeout);
    }
    catch (const std::exception& e)
    {
        LOG_WARN("Biometric prompt failed: {}", e.what());
        return false;
    }

    if (res)
    {
        return *res;
    }

    if (res.error() == ThreadPool::errc::stopped)
    {
        in_flight->store(false);
        LOG_ERROR("Biometric prompt not started: {}", to_string(res.error()));
        return std::nullopt;
    }

    LOG_WARN("Biometric prompt timed out after {}ms", cfg.prompt_timeout.count());
    try
    {
        platform.get().stop_authentication();
    }
    catch (const std::exception& e)
    {
        LOG_WARN("Stopping the biometric prompt failed: {}", e.what());
    }
    return false;
}

AuthError BiometricGate::lockout_error(const AttemptCount& count)
{
    bool pin_available = pin.get().is_enabled();
    auto msg = pin_available
        ? std::string("Too many failed biometric attempts. Please use your PIN to continue.")
        : std::string("Too many failed biometric attempts. Please sign in with your email and password.");
    return AuthError{AuthErrc::LockedOut, std::move(msg), LockoutDetails{0, count.reset_at, pin_available}};
}

AuthResult<BoundIdentity> BiometricGate::authenticate()
{
    return storage_guarded("Biometric authentication", [&]() -> AuthResult<BoundIdentity> {
        auto bound = binding();
        if (!bound || !bound->enabled)
        {
            return fail(AuthErrc::NotConfigured, "Biometric authentication is not enabled");
        }
        if (!is_available())
        {
            return fail(AuthErrc::NotConfigured, "Biometric authentication is not available on this device");
        }

        if (auto cur = counter.current(); cur.count >= cfg.max_attempts)
        {
            return std::unexpected(lockout_error(cur));
        }

        if (in_flight->exchange(true))
        {
            return fail(AuthErrc::Busy, "A biometric prompt is already in progress");
        }

        auto verdict = prompt();
        if (!verdict)
        {
            return fail(AuthErrc::Busy, "Biometric prompt could not be started");
        }

        if (!*verdict)
        {
            auto after = counter.increment();
            LOG_INFO("Biometric attempt failed ({}/{})", after.count, cfg.max_attempts);
            if (after.count >= cfg.max_attempts)
            {
                return std::unexpected(lockout_error(after));
            }
            auto remaining = cfg.max_attempts - after.count;
            return fail(AuthErrc::InvalidCredentials,
                        std::format("Biometric authentication failed. {} attempts remaining", remaining),
                        LockoutDetails{remaining, std::nullopt, false});
        }

        counter.reset();
        LOG_INFO("Biometric authentication succeeded for user {}", bound->identity.user_id);
        return bound->identity;
    });
}

uint32_t BiometricGate::remaining_attempts()
{
    try
    {
        auto cur = counter.current();
        return cur.count >= cfg.max_attempts ? 0 : cfg.max_attempts - cur.count;
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("Biometric attempt counter unreadable: {}", e.what());
        return 0;
    }
}

AuthResult<void> BiometricGate::reset_attempts()
{
    return storage_guarded("Biometric attempt reset", [&]() -> AuthResult<void> {
        counter.reset();
        return {};
    });
}

AuthResult<void> BiometricGate::reset_for_new_user()
{
    return storage_guarded("Biometric reset", [&]() -> AuthResult<void> {
        store.get().remove(vault::keys::biometric_binding);
        counter.reset();
        LOG_INFO("Biometric binding cleared for new user");
        return {};
    });
}

}
