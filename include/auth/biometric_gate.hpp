#pragma once

#include "auth/attempt_counter.hpp"
#include "auth/auth_error.hpp"
#include "auth/biometric_platform.hpp"
#include "auth/credential_record.hpp"
#include "auth/pin_fallback.hpp"
#include "fundamentals/clock.hpp"
#include "threadpool/threadpool.hpp"
#include "vault/secure_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace auth
{

enum class BiometricSetupStatus : uint8_t
{
    NotAvailable,
    AvailableButNotEnabled,
    Ready,
    Error,
};

/**
 * Biometric shortcut factor.
 *
 * A successful prompt re-presents the identity bound at enable() time; it
 * never establishes trust on its own. Failures (mismatch, platform error or
 * prompt timeout alike) feed a persistent AttemptCounter; reaching
 * max_attempts within the reset window locks the factor until the window
 * lapses or the counter is reset.
 *
 * At most one prompt is in flight. A prompt that outlives its timeout is
 * asked to stop, counted as a failure, and keeps the gate busy until the
 * platform call actually returns.
 *
 * The platform must outlive the thread pool the prompts run on.
 */
class BiometricGate
{
public:
    struct Settings
    {
        uint32_t max_attempts = 3;
        std::chrono::hours reset_window{24};
        std::chrono::milliseconds prompt_timeout{3000};
    };

    BiometricGate(vault::SecureStore& store, BiometricPlatform& platform, PinFallback& pin,
                  ThreadPool& pool, const clk::Clock& clock, Settings settings);

    [[nodiscard]] bool is_available();
    [[nodiscard]] bool is_enabled();
    [[nodiscard]] BiometricSetupStatus setup_status();
    [[nodiscard]] std::set<BiometricType> available_types();
    [[nodiscard]] std::string primary_type_name();

    [[nodiscard]] AuthResult<void> enable(const BoundIdentity& identity);
    [[nodiscard]] AuthResult<void> disable();

    [[nodiscard]] AuthResult<BoundIdentity> authenticate();

    [[nodiscard]] uint32_t remaining_attempts();
    [[nodiscard]] AuthResult<void> reset_attempts();

    // Sign-up only: forgets the binding and the failure streak.
    [[nodiscard]] AuthResult<void> reset_for_new_user();

    [[nodiscard]] const Settings& settings() const { return cfg; }

private:
    [[nodiscard]] std::optional<BiometricBinding> binding();
    // nullopt when no prompt could be started.
    [[nodiscard]] std::optional<bool> prompt();
    [[nodiscard]] AuthError lockout_error(const AttemptCount& count);

    std::reference_wrapper<vault::SecureStore> store;
    std::reference_wrapper<BiometricPlatform> platform;
    std::reference_wrapper<PinFallback> pin;
    std::reference_wrapper<ThreadPool> pool;
    Settings cfg;
    AttemptCounter counter;
    std::shared_ptr<std::atomic<bool>> in_flight = std::make_shared<std::atomic<bool>>(false);
};

}
