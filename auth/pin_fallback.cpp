#include "auth/pin_fallback.hpp"
#include "auth/argon2_hasher.hpp"
#include "auth/storage_guard.hpp"
#include "fundamentals/iso_time.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>

namespace json = boost::json;
using namespace std::chrono;

namespace auth
{

PinFallback::PinFallback(vault::SecureStore& s, const clk::Clock& c, Settings settings)
    : store(s)
    , clock(c)
    , cfg(settings)
{
}

std::optional<PinFallback::PinRecord> PinFallback::load()
{
    auto obj = store.get().get_object(vault::keys::pin_record);
    if (!obj)
    {
        return std::nullopt;
    }

    PinRecord rec;
    rec.hash = json_utils::str_or(*obj, "hash");
    if (rec.hash.empty())
    {
        throw vault::StorageError("PIN record has no hash");
    }
    auto attempts = json_utils::int_or(*obj, "attempts");
    rec.attempts = attempts > 0 ? static_cast<uint32_t>(attempts) : 0;
    if (auto ts = json_utils::str_or(*obj, "lock_until"); !ts.empty())
    {
        rec.lock_until = iso_time::parse(ts);
        if (!rec.lock_until)
        {
            throw vault::StorageError("PIN record has a malformed lock time");
        }
    }
    return rec;
}

void PinFallback::save(const PinRecord& rec)
{
    json::object obj{
        {"hash", rec.hash},
        {"attempts", rec.attempts}
    };
    if (rec.lock_until)
    {
        obj["lock_until"] = iso_time::format_deadline(*rec.lock_until);
    }
    store.get().set_object(vault::keys::pin_record, obj);
}

PinStatus PinFallback::status_of(const std::optional<PinRecord>& rec) const
{
    PinStatus st;
    if (!rec)
    {
        st.remaining_attempts = cfg.max_attempts;
        return st;
    }

    st.enabled = true;
    auto now = clock.get().now();
    if (rec->lock_until && now < *rec->lock_until)
    {
        st.locked = true;
        st.remaining_attempts = 0;
        st.lockout_remaining = ceil<seconds>(*rec->lock_until - now);
        return st;
    }

    // An elapsed lock grants a full set of attempts, even before verify() rewrites it.
    uint32_t used = rec->lock_until ? 0 : rec->attempts;
    st.remaining_attempts = used >= cfg.max_attempts ? 0 : cfg.max_attempts - used;
    return st;
}

PinStatus PinFallback::status()
{
    try
    {
        return status_of(load());
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("PIN status unavailable: {}", e.what());
        return PinStatus{false, true, 0, seconds{0}};
    }
}

bool PinFallback::is_enabled()
{
    return status().enabled;
}

bool PinFallback::is_locked()
{
    return status().locked;
}

uint32_t PinFallback::remaining_attempts()
{
    return status().remaining_attempts;
}

seconds PinFallback::lockout_time_remaining()
{
    return status().lockout_remaining;
}

AuthResult<void> PinFallback::validate_format(std::string_view pin) const
{
    if (pin.size() < cfg.min_length)
    {
        return fail(AuthErrc::Validation, std::format("PIN must be at least {} digits", cfg.min_length));
    }
    if (pin.size() > cfg.max_length)
    {
        return fail(AuthErrc::Validation, std::format("PIN must be no more than {} digits", cfg.max_length));
    }
    if (!std::ranges::all_of(pin, [](char c) { return c >= '0' && c <= '9'; }))
    {
        return fail(AuthErrc::Validation, "PIN must contain digits only");
    }
    return {};
}

AuthResult<void> PinFallback::setup(std::string_view pin)
{
    if (auto valid = validate_format(pin); !valid)
    {
        return valid;
    }

    auto hashed = Argon2Hasher::hash(pin);
    if (!hashed)
    {
        LOG_ERROR("PIN hashing failed: {}", hashed.error());
        return fail(AuthErrc::Storage, "Failed to set up PIN");
    }

    return storage_guarded("PIN setup", [&]() -> AuthResult<void> {
        save(PinRecord{hashed->encoded, 0, std::nullopt});
        LOG_INFO("PIN configured");
        return {};
    });
}

AuthResult<void> PinFallback::check(std::string_view pin)
{
    if (pin.empty())
    {
        return fail(AuthErrc::Validation, "Please enter your PIN");
    }

    auto rec = load();
    if (!rec)
    {
        return fail(AuthErrc::NotConfigured, "PIN authentication is not enabled. Please set up PIN in settings.");
    }

    auto now = clock.get().now();
    bool stale = rec->attempts != 0 || rec->lock_until.has_value();
    if (rec->lock_until)
    {
        if (now < *rec->lock_until)
        {
            auto left = ceil<seconds>(*rec->lock_until - now);
            return fail(AuthErrc::LockedOut,
                        std::format("PIN is locked. Try again in {}s", left.count()),
                        LockoutDetails{0, rec->lock_until, false});
        }
        rec->attempts = 0;
        rec->lock_until.reset();
    }

    if (!Argon2Hasher::verify(pin, rec->hash))
    {
        ++rec->attempts;
        if (rec->attempts >= cfg.max_attempts)
        {
            rec->lock_until = now + cfg.lockout_duration;
            save(*rec);
            LOG_WARN("PIN locked after {} failed attempts", rec->attempts);
            return fail(AuthErrc::LockedOut,
                        std::format("PIN locked due to too many failed attempts. Try again in {}s",
                                    cfg.lockout_duration.count()),
                        LockoutDetails{0, rec->lock_until, false});
        }
        save(*rec);
        auto remaining = cfg.max_attempts - rec->attempts;
        LOG_INFO("PIN mismatch, {} attempts remaining", remaining);
        return fail(AuthErrc::InvalidCredentials,
                    std::format("Incorrect PIN. {} attempts remaining", remaining),
                    LockoutDetails{remaining, std::nullopt, false});
    }

    // A clean record stays untouched on success.
    if (stale)
    {
        save(PinRecord{rec->hash, 0, std::nullopt});
    }
    return {};
}

AuthResult<BoundIdentity> PinFallback::verify(std::string_view pin)
{
    return storage_guarded("PIN verification", [&]() -> AuthResult<BoundIdentity> {
        if (auto ok = check(pin); !ok)
        {
            return std::unexpected(ok.error());
        }

        auto cred = store.get().get_record<CredentialRecord>(vault::keys::credentials);
        if (!cred || cred->email.empty() || cred->user_id.empty() || cred->access_token.empty())
        {
            return fail(AuthErrc::NotAuthenticated,
                        "User credentials not found. Please sign in with email and password first.");
        }
        LOG_INFO("PIN verified for user {}", cred->user_id);
        return cred->identity();
    });
}

AuthResult<void> PinFallback::change(std::string_view current_pin, std::string_view new_pin)
{
    if (auto valid = validate_format(new_pin); !valid)
    {
        return valid;
    }
    auto checked = storage_guarded("PIN change", [&] { return check(current_pin); });
    if (!checked)
    {
        return checked;
    }
    return setup(new_pin);
}

AuthResult<void> PinFallback::disable(std::string_view current_pin)
{
    return storage_guarded("PIN disable", [&]() -> AuthResult<void> {
        if (auto ok = check(current_pin); !ok)
        {
            return ok;
        }
        store.get().remove(vault::keys::pin_record);
        LOG_INFO("PIN disabled");
        return {};
    });
}

AuthResult<void> PinFallback::reset_for_new_user()
{
    return storage_guarded("PIN reset", [&]() -> AuthResult<void> {
        store.get().remove(vault::keys::pin_record);
        LOG_INFO("PIN record cleared for new user");
        return {};
    });
}

}
