#include <catch2/catch_test_macros.hpp>

#include "auth/attempt_counter.hpp"
#include "auth/biometric_gate.hpp"
#include "test_doubles.hpp"

#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace auth;
using namespace std::chrono_literals;

namespace
{

const BoundIdentity ada{"ada@example.com", "access-1", "u-1", "Ada"};

struct GateRig
{
    explicit GateRig(BiometricGate::Settings settings = {})
        : gate(store, platform, pin, pool, clock, settings)
    {
    }

    testing::FaultyVault vlt;
    vault::SecureStore store{vlt};
    testing::ManualClock clock;
    testing::FakePlatform platform;
    ThreadPool pool{1};
    PinFallback pin{store, clock, PinFallback::Settings{}};
    BiometricGate gate;
};

// A timed-out prompt keeps the gate busy until the platform returns.
AuthResult<BoundIdentity> authenticate_when_idle(BiometricGate& gate)
{
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (true)
    {
        auto res = gate.authenticate();
        if (res || res.error().code != AuthErrc::Busy || std::chrono::steady_clock::now() > deadline)
        {
            return res;
        }
        std::this_thread::sleep_for(5ms);
    }
}

} // namespace

TEST_CASE("BiometricGate refuses to prompt when not enabled")
{
    GateRig rig;

    auto res = rig.gate.authenticate();

    REQUIRE(!res.has_value());
    CHECK(res.error().code == AuthErrc::NotConfigured);
    CHECK(res.error().message.find("not enabled") != std::string::npos);
    CHECK(rig.platform.prompts.load() == 0);
}

TEST_CASE("BiometricGate availability needs hardware and an enrollment")
{
    GateRig rig;
    CHECK(rig.gate.is_available() == true);

    rig.platform.enrolled = false;
    CHECK(rig.gate.is_available() == false);

    rig.platform.enrolled = true;
    rig.platform.supported = false;
    CHECK(rig.gate.is_available() == false);

    auto res = rig.gate.enable(ada);
    REQUIRE(!res.has_value());
    CHECK(res.error().code == AuthErrc::NotConfigured);
    CHECK(rig.gate.is_enabled() == false);
}

TEST_CASE("BiometricGate enable is idempotent and disable leaves the session alone")
{
    GateRig rig;
    CredentialRecord rec{"ada@example.com", "pw", "Ada", "u-1", "access-1", "refresh-1", true, AuthMethod::Password};
    rig.store.set_record(vault::keys::credentials, rec);

    REQUIRE(rig.gate.enable(ada).has_value());
    REQUIRE(rig.gate.enable(ada).has_value());
    CHECK(rig.gate.is_enabled() == true);

    REQUIRE(rig.gate.disable().has_value());
    CHECK(rig.gate.is_enabled() == false);
    CHECK(rig.store.get_record<CredentialRecord>(vault::keys::credentials) == rec);
}

TEST_CASE("BiometricGate disable on a disabled binding is a no-op")
{
    GateRig rig;

    auto first = rig.gate.disable();
    auto second = rig.gate.disable();

    CHECK(first.has_value());
    CHECK(second.has_value());
    CHECK(rig.vlt.inner.size() == 0);
}

TEST_CASE("BiometricGate success returns the bound identity and resets the counter")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());
    rig.platform.script({false, true});

    auto miss = rig.gate.authenticate();
    REQUIRE(!miss.has_value());
    CHECK(miss.error().code == AuthErrc::InvalidCredentials);
    CHECK(rig.gate.remaining_attempts() == 2);

    auto hit = rig.gate.authenticate();
    REQUIRE(hit.has_value());
    CHECK(*hit == ada);
    CHECK(rig.gate.remaining_attempts() == 3);
    CHECK(rig.platform.prompts.load() == 2);
}

TEST_CASE("BiometricGate locks out on the third mismatch")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());

    auto first = rig.gate.authenticate();
    REQUIRE(!first.has_value());
    REQUIRE(first.error().lockout.has_value());
    CHECK(first.error().lockout->remaining_attempts == 2);

    auto second = rig.gate.authenticate();
    REQUIRE(!second.has_value());
    CHECK(second.error().lockout->remaining_attempts == 1);

    auto third = rig.gate.authenticate();
    REQUIRE(!third.has_value());
    CHECK(third.error().code == AuthErrc::LockedOut);
    REQUIRE(third.error().lockout.has_value());
    CHECK(third.error().lockout->pin_fallback_available == false);
    CHECK(third.error().message.find("password") != std::string::npos);

    // Locked: no further prompts until the window lapses.
    auto fourth = rig.gate.authenticate();
    REQUIRE(!fourth.has_value());
    CHECK(fourth.error().code == AuthErrc::LockedOut);
    CHECK(rig.platform.prompts.load() == 3);
}

TEST_CASE("BiometricGate lockout offers the PIN when one is set")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());
    REQUIRE(rig.pin.setup("2468").has_value());

    AuthResult<BoundIdentity> res;
    for (int i = 0; i < 3; ++i)
    {
        res = rig.gate.authenticate();
    }

    REQUIRE(!res.has_value());
    CHECK(res.error().code == AuthErrc::LockedOut);
    CHECK(res.error().lockout->pin_fallback_available == true);
    CHECK(res.error().message.find("PIN") != std::string::npos);
}

TEST_CASE("BiometricGate counts prompt timeouts as failures")
{
    GateRig rig(BiometricGate::Settings{3, 24h, 20ms});
    REQUIRE(rig.gate.enable(ada).has_value());
    rig.platform.delay = 100ms;
    rig.platform.default_verdict = true;

    auto first = authenticate_when_idle(rig.gate);
    REQUIRE(!first.has_value());
    CHECK(first.error().code == AuthErrc::InvalidCredentials);

    auto second = authenticate_when_idle(rig.gate);
    REQUIRE(!second.has_value());
    CHECK(second.error().code == AuthErrc::InvalidCredentials);

    auto third = authenticate_when_idle(rig.gate);
    REQUIRE(!third.has_value());
    CHECK(third.error().code == AuthErrc::LockedOut);

    CHECK(rig.platform.prompts.load() == 3);
    CHECK(rig.platform.stops.load() == 3);
}

TEST_CASE("BiometricGate mixes timeouts and mismatches in one streak")
{
    GateRig rig(BiometricGate::Settings{3, 24h, 20ms});
    REQUIRE(rig.gate.enable(ada).has_value());

    rig.platform.delay = 100ms;
    auto timed_out = authenticate_when_idle(rig.gate);
    REQUIRE(!timed_out.has_value());

    rig.platform.delay = 0ms;
    rig.platform.default_verdict = false;
    auto mismatch = authenticate_when_idle(rig.gate);
    REQUIRE(!mismatch.has_value());
    CHECK(mismatch.error().code == AuthErrc::InvalidCredentials);

    auto last = authenticate_when_idle(rig.gate);
    REQUIRE(!last.has_value());
    CHECK(last.error().code == AuthErrc::LockedOut);
}

TEST_CASE("BiometricGate counts a platform error as a failure")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());
    rig.platform.throw_on_prompt = true;

    auto res = rig.gate.authenticate();

    REQUIRE(!res.has_value());
    CHECK(res.error().code == AuthErrc::InvalidCredentials);
    CHECK(rig.gate.remaining_attempts() == 2);
}

TEST_CASE("BiometricGate refuses a second prompt while one is in flight")
{
    GateRig rig(BiometricGate::Settings{3, 24h, 2000ms});
    REQUIRE(rig.gate.enable(ada).has_value());
    rig.platform.delay = 300ms;
    rig.platform.default_verdict = true;

    auto first = std::async(std::launch::async, [&] { return rig.gate.authenticate(); });
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (rig.platform.prompts == 0 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(rig.platform.prompts.load() == 1);

    auto second = rig.gate.authenticate();
    REQUIRE(!second.has_value());
    CHECK(second.error().code == AuthErrc::Busy);

    auto first_res = first.get();
    CHECK(first_res.has_value());
    CHECK(rig.platform.prompts.load() == 1);
    CHECK(rig.gate.remaining_attempts() == 3);
}

TEST_CASE("BiometricGate counter clears at the end of the window, not before")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());

    for (int i = 0; i < 3; ++i)
    {
        (void)rig.gate.authenticate();
    }
    REQUIRE(rig.gate.remaining_attempts() == 0);

    rig.clock.advance(23h + 59min);
    auto still_locked = rig.gate.authenticate();
    REQUIRE(!still_locked.has_value());
    CHECK(still_locked.error().code == AuthErrc::LockedOut);
    CHECK(rig.platform.prompts.load() == 3);

    rig.clock.advance(1min);
    CHECK(rig.gate.remaining_attempts() == 3);
    rig.platform.script({true});
    CHECK(rig.gate.authenticate().has_value());
}

TEST_CASE("BiometricGate reset_attempts lifts the lockout")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());
    for (int i = 0; i < 3; ++i)
    {
        (void)rig.gate.authenticate();
    }

    REQUIRE(rig.gate.reset_attempts().has_value());

    CHECK(rig.gate.remaining_attempts() == 3);
}

TEST_CASE("BiometricGate reset_for_new_user drops the binding and the streak")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());
    (void)rig.gate.authenticate();

    REQUIRE(rig.gate.reset_for_new_user().has_value());

    CHECK(rig.gate.is_enabled() == false);
    CHECK(!rig.vlt.inner.get(vault::keys::biometric_attempts).has_value());
    auto res = rig.gate.authenticate();
    REQUIRE(!res.has_value());
    CHECK(res.error().code == AuthErrc::NotConfigured);
}

TEST_CASE("BiometricGate reports setup status and type names")
{
    GateRig rig;
    CHECK(rig.gate.setup_status() == BiometricSetupStatus::AvailableButNotEnabled);
    CHECK(rig.gate.primary_type_name() == "Fingerprint");

    REQUIRE(rig.gate.enable(ada).has_value());
    CHECK(rig.gate.setup_status() == BiometricSetupStatus::Ready);

    rig.platform.types = {BiometricType::Face, BiometricType::Iris};
    CHECK(rig.gate.primary_type_name() == "Face Recognition");

    rig.platform.types = {BiometricType::Iris};
    CHECK(rig.gate.primary_type_name() == "Iris");

    rig.platform.enrolled = false;
    CHECK(rig.gate.setup_status() == BiometricSetupStatus::NotAvailable);
    CHECK(rig.gate.primary_type_name() == "Biometric");
}

TEST_CASE("BiometricGate fails closed on a vault fault")
{
    GateRig rig;
    REQUIRE(rig.gate.enable(ada).has_value());
    rig.vlt.fail_reads = true;

    CHECK(rig.gate.is_enabled() == false);
    CHECK(rig.gate.remaining_attempts() == 0);
    CHECK(rig.gate.setup_status() == BiometricSetupStatus::Error);

    auto res = rig.gate.authenticate();
    REQUIRE(!res.has_value());
    CHECK(res.error().code == AuthErrc::Storage);
    CHECK(rig.platform.prompts.load() == 0);
}

TEST_CASE("AttemptCounter window opens on the first failure and is not extended")
{
    testing::FaultyVault vlt;
    vault::SecureStore store{vlt};
    testing::ManualClock clock;
    AttemptCounter counter(store, "test.attempts", clock, 24h);

    auto start = clock.now();
    auto first = counter.increment();
    CHECK(first.count == 1);
    REQUIRE(first.reset_at.has_value());
    CHECK(*first.reset_at == start + 24h);

    clock.advance(12h);
    auto second = counter.increment();
    CHECK(second.count == 2);
    CHECK(*second.reset_at == start + 24h);

    clock.set(start + 23h + 59min);
    CHECK(counter.current().count == 2);

    clock.set(start + 24h);
    CHECK(counter.current().count == 0);
    CHECK(!vlt.inner.get("test.attempts").has_value());
}

TEST_CASE("AttemptCounter keeps a sub-millisecond window start until the full window")
{
    testing::FaultyVault vlt;
    vault::SecureStore store{vlt};
    testing::ManualClock clock;
    clock.advance(900us);
    AttemptCounter counter(store, "test.attempts", clock, 24h);

    auto start = clock.now();
    (void)counter.increment();

    clock.set(start + 24h - 500us);
    CHECK(counter.current().count == 1);
    CHECK(vlt.inner.get("test.attempts").has_value());

    clock.set(start + 24h + 1ms);
    CHECK(counter.current().count == 0);
}
