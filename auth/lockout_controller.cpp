#include "auth/lockout_controller.hpp"
#include "auth/storage_guard.hpp"
#include "logger.hpp"

namespace auth
{

std::string_view to_string(AppLifecycleState s)
{
    switch (s)
    {
        case AppLifecycleState::Resumed: return "resumed";
        case AppLifecycleState::Inactive: return "inactive";
        case AppLifecycleState::Hidden: return "hidden";
        case AppLifecycleState::Paused: return "paused";
        case AppLifecycleState::Detached: return "detached";
    }
    return "unknown";
}

std::string_view to_string(SessionState s)
{
    switch (s)
    {
        case SessionState::SignedOut: return "signed_out";
        case SessionState::SignedIn: return "signed_in";
        case SessionState::Locked: return "locked";
    }
    return "unknown";
}

LockoutController::LockoutController(vault::SecureStore& s, AuthOrchestrator& o, BiometricGate& g,
                                     PinFallback& p, AuthMetrics& m)
    : store(s)
    , orchestrator(o)
    , gate(g)
    , pin(p)
    , metrics(m)
{
}

LockoutState LockoutController::read_persisted()
{
    return store.get().get_record<LockoutState>(vault::keys::lockout_state).value_or(LockoutState{});
}

AuthResult<void> LockoutController::write_lock(bool locked)
{
    return storage_guarded(locked ? "App lock" : "App unlock", [&]() -> AuthResult<void> {
        LockoutState next{locked, true};
        store.get().set_record(vault::keys::lockout_state, next);
        std::lock_guard lock(mtx);
        cached = next;
        return {};
    });
}

LockoutState LockoutController::initialize()
{
    bool logged_in = orchestrator.get().is_logged_in();
    LockoutState loaded;
    try
    {
        loaded = read_persisted();
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("Lockout state unreadable at start-up: {}", e.what());
        loaded.is_locked = logged_in;
    }
    loaded.was_authenticated = loaded.was_authenticated || logged_in;

    std::lock_guard lock(mtx);
    cached = loaded;
    LOG_INFO("Lockout initialized: authenticated={}, locked={}", cached.was_authenticated, cached.is_locked);
    return cached;
}

LockoutState LockoutController::handle_lifecycle_event(AppLifecycleState state)
{
    {
        std::lock_guard lock(mtx);
        lifecycle = state;
    }
    LOG_DEBUG("Lifecycle event: {}", to_string(state));

    switch (state)
    {
        case AppLifecycleState::Paused:
        case AppLifecycleState::Detached:
            if (orchestrator.get().is_logged_in())
            {
                if (auto locked = write_lock(true); !locked)
                {
                    // Best effort: the next Resumed re-read is authoritative.
                    LOG_ERROR("Lock on {} not persisted: {}", to_string(state), locked.error().message);
                    std::lock_guard lock(mtx);
                    cached = LockoutState{true, true};
                }
                metrics.get().app_locks++;
                LOG_INFO("App locked on {}", to_string(state));
            }
            break;

        case AppLifecycleState::Resumed:
            try
            {
                auto persisted = read_persisted();
                std::lock_guard lock(mtx);
                cached = persisted;
            }
            catch (const vault::StorageError& e)
            {
                LOG_ERROR("Lockout state unreadable on resume: {}", e.what());
                std::lock_guard lock(mtx);
                cached.is_locked = cached.is_locked || cached.was_authenticated;
            }
            break;

        case AppLifecycleState::Inactive:
        case AppLifecycleState::Hidden:
            break;
    }

    auto snapshot = lockout_state();
    notify(state, snapshot);
    return snapshot;
}

AuthResult<void> LockoutController::lock_app()
{
    if (!orchestrator.get().is_logged_in())
    {
        return fail(AuthErrc::NotAuthenticated, "No signed-in session to lock");
    }
    auto locked = write_lock(true);
    if (locked)
    {
        metrics.get().app_locks++;
    }
    return locked;
}

AuthResult<void> LockoutController::unlock_app()
{
    auto unlocked = write_lock(false);
    if (unlocked)
    {
        metrics.get().app_unlocks++;
        LOG_INFO("App unlocked");
    }
    return unlocked;
}

bool LockoutController::is_app_locked()
{
    try
    {
        auto persisted = read_persisted();
        std::lock_guard lock(mtx);
        cached = persisted;
        return persisted.is_locked;
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("Lockout state unreadable: {}", e.what());
        return true;
    }
}

AuthResult<void> LockoutController::unlock_with_biometric()
{
    auto identity = gate.get().authenticate();
    if (!identity)
    {
        auto& m = metrics.get();
        count_factor_failure(m, identity.error(), m.biometric_failed, m.biometric_lockouts);
        return std::unexpected(identity.error());
    }
    metrics.get().biometric_successful++;

    auto rec = orchestrator.get().current_record();
    if (!rec || rec->user_id != identity->user_id)
    {
        LOG_WARN("Biometric identity does not match the locked session");
        return fail(AuthErrc::NotAuthenticated, "Biometric identity does not match the signed-in account");
    }
    return unlock_app();
}

AuthResult<void> LockoutController::unlock_with_credentials(std::string_view email, std::string_view password)
{
    auto rec = orchestrator.get().sign_in(email, password);
    if (!rec)
    {
        return std::unexpected(rec.error());
    }
    return unlock_app();
}

AuthResult<void> LockoutController::unlock_with_pin(std::string_view code)
{
    auto identity = pin.get().verify(code);
    if (!identity)
    {
        auto& m = metrics.get();
        count_factor_failure(m, identity.error(), m.pin_failed, m.pin_lockouts);
        return std::unexpected(identity.error());
    }
    metrics.get().pin_successful++;
    return unlock_app();
}

AuthResult<void> LockoutController::sign_out()
{
    auto out = orchestrator.get().sign_out();
    if (out)
    {
        std::lock_guard lock(mtx);
        cached = LockoutState{};
    }
    return out;
}

SessionState LockoutController::state()
{
    if (!orchestrator.get().is_logged_in())
    {
        return SessionState::SignedOut;
    }
    return is_app_locked() ? SessionState::Locked : SessionState::SignedIn;
}

std::optional<AppLifecycleState> LockoutController::current_lifecycle() const
{
    std::lock_guard lock(mtx);
    return lifecycle;
}

LockoutState LockoutController::lockout_state() const
{
    std::lock_guard lock(mtx);
    return cached;
}

void LockoutController::subscribe(Listener listener)
{
    std::lock_guard lock(mtx);
    listeners.push_back(std::move(listener));
}

void LockoutController::notify(AppLifecycleState state, const LockoutState& snapshot)
{
    std::vector<Listener> targets;
    {
        std::lock_guard lock(mtx);
        targets = listeners;
    }
    for (auto& fn : targets)
    {
        fn(state, snapshot);
    }
}

}
