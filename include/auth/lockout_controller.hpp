#pragma once

#include "auth/auth_error.hpp"
#include "auth/auth_orchestrator.hpp"
#include "auth/biometric_gate.hpp"
#include "auth/credential_record.hpp"
#include "auth/pin_fallback.hpp"
#include "logger/metrics.hpp"
#include "vault/secure_store.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace auth
{

enum class AppLifecycleState : uint8_t
{
    Resumed,
    Inactive,
    Hidden,
    Paused,
    Detached,
};

enum class SessionState : uint8_t
{
    SignedOut,
    SignedIn,
    Locked,
};

[[nodiscard]] std::string_view to_string(AppLifecycleState s);
[[nodiscard]] std::string_view to_string(SessionState s);

/**
 * Re-locks the session when the host app is backgrounded.
 *
 * Paused and Detached write the lock before handle_lifecycle_event returns,
 * since the process may be killed right after. Resumed only re-reads the
 * persisted state. Inactive and Hidden are transient and never lock.
 *
 * Unlock operations clear the lock only after the delegated factor
 * succeeds; a failure leaves the lock in place and is returned unchanged.
 */
class LockoutController
{
public:
    using Listener = std::function<void(AppLifecycleState, const LockoutState&)>;

    LockoutController(vault::SecureStore& store, AuthOrchestrator& orchestrator, BiometricGate& gate,
                      PinFallback& pin, AuthMetrics& metrics);

    // Loads the persisted lock and login status; call once at start-up.
    LockoutState initialize();

    LockoutState handle_lifecycle_event(AppLifecycleState state);

    [[nodiscard]] AuthResult<void> lock_app();
    [[nodiscard]] AuthResult<void> unlock_app();
    // Re-reads the vault. A vault fault reads as locked.
    [[nodiscard]] bool is_app_locked();

    [[nodiscard]] AuthResult<void> unlock_with_biometric();
    [[nodiscard]] AuthResult<void> unlock_with_credentials(std::string_view email, std::string_view password);
    [[nodiscard]] AuthResult<void> unlock_with_pin(std::string_view pin);

    [[nodiscard]] AuthResult<void> sign_out();

    [[nodiscard]] SessionState state();
    [[nodiscard]] std::optional<AppLifecycleState> current_lifecycle() const;
    [[nodiscard]] LockoutState lockout_state() const;

    void subscribe(Listener listener);

private:
    [[nodiscard]] LockoutState read_persisted();
    [[nodiscard]] AuthResult<void> write_lock(bool locked);
    void notify(AppLifecycleState state, const LockoutState& snapshot);

    std::reference_wrapper<vault::SecureStore> store;
    std::reference_wrapper<AuthOrchestrator> orchestrator;
    std::reference_wrapper<BiometricGate> gate;
    std::reference_wrapper<PinFallback> pin;
    std::reference_wrapper<AuthMetrics> metrics;

    mutable std::mutex mtx;
    LockoutState cached;
    std::optional<AppLifecycleState> lifecycle;
    std::vector<Listener> listeners;
};

}
