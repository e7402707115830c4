#pragma once

#include "auth/auth_error.hpp"
#include "auth/credential_record.hpp"
#include "fundamentals/clock.hpp"
#include "vault/secure_store.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

struct PinStatus
{
    bool enabled = false;
    bool locked = false;
    uint32_t remaining_attempts = 0;
    std::chrono::seconds lockout_remaining{0};
};

/**
 * PIN factor with its own lockout, independent of the biometric counter.
 *
 * The PIN is stored only as an Argon2id salted hash. After max_attempts
 * consecutive mismatches the PIN locks for lockout_duration; the lock is
 * written by the same verify() call that hits the limit.
 *
 * Callers must not issue overlapping verify() calls; attempt accounting is
 * not guarded against concurrent use.
 */
class PinFallback
{
public:
    struct Settings
    {
        uint32_t max_attempts = 5;
        std::chrono::seconds lockout_duration{300};
        size_t min_length = 4;
        size_t max_length = 8;
    };

    PinFallback(vault::SecureStore& store, const clk::Clock& clock, Settings settings);

    // Pure reads. On a vault fault they answer as if locked and disabled.
    [[nodiscard]] bool is_enabled();
    [[nodiscard]] bool is_locked();
    [[nodiscard]] uint32_t remaining_attempts();
    [[nodiscard]] std::chrono::seconds lockout_time_remaining();
    [[nodiscard]] PinStatus status();

    [[nodiscard]] AuthResult<void> setup(std::string_view pin);

    // On success returns the identity of the primary Credential Record.
    [[nodiscard]] AuthResult<BoundIdentity> verify(std::string_view pin);

    [[nodiscard]] AuthResult<void> change(std::string_view current_pin, std::string_view new_pin);
    [[nodiscard]] AuthResult<void> disable(std::string_view current_pin);

    // Sign-up only: drops the previous occupant's PIN without asking for it.
    [[nodiscard]] AuthResult<void> reset_for_new_user();

    [[nodiscard]] const Settings& settings() const { return cfg; }

private:
    struct PinRecord
    {
        std::string hash;
        uint32_t attempts = 0;
        std::optional<clk::time_point> lock_until;
    };

    [[nodiscard]] std::optional<PinRecord> load();
    void save(const PinRecord& rec);
    [[nodiscard]] AuthResult<void> validate_format(std::string_view pin) const;
    [[nodiscard]] AuthResult<void> check(std::string_view pin);
    [[nodiscard]] PinStatus status_of(const std::optional<PinRecord>& rec) const;

    std::reference_wrapper<vault::SecureStore> store;
    std::reference_wrapper<const clk::Clock> clock;
    Settings cfg;
};

}
