#include <catch2/catch_test_macros.hpp>

#include "auth/lockout_controller.hpp"
#include "test_doubles.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace auth;

namespace
{

struct LockoutRig
{
    testing::FaultyVault vlt;
    vault::SecureStore store{vlt};
    testing::ManualClock clock;
    testing::FakePlatform platform;
    testing::FakeBackend backend;
    AuthMetrics metrics;
    ThreadPool pool{1};
    PinFallback pin{store, clock, PinFallback::Settings{}};
    BiometricGate gate{store, platform, pin, pool, clock, BiometricGate::Settings{}};
    DeviceIdentity device{store};
    AuthOrchestrator orch{store, backend, gate, pin, device, metrics, AuthOrchestrator::Settings{}};
    LockoutController ctrl{store, orch, gate, pin, metrics};

    void sign_in_and_pause()
    {
        REQUIRE(orch.sign_in("ada@example.com", "correct horse").has_value());
        (void)ctrl.initialize();
        (void)ctrl.handle_lifecycle_event(AppLifecycleState::Paused);
        REQUIRE(ctrl.is_app_locked());
    }

    size_t lock_writes() const
    {
        return static_cast<size_t>(std::ranges::count(vlt.journal, std::string("set:app.lockout")));
    }
};

} // namespace

TEST_CASE("LockoutController pause then resume reports the lock without rewriting it")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());
    (void)rig.ctrl.initialize();

    auto paused = rig.ctrl.handle_lifecycle_event(AppLifecycleState::Paused);
    CHECK(paused.is_locked == true);
    CHECK(paused.was_authenticated == true);
    CHECK(rig.lock_writes() == 1);
    CHECK(rig.store.get_record<LockoutState>(vault::keys::lockout_state) == LockoutState{true, true});

    auto resumed = rig.ctrl.handle_lifecycle_event(AppLifecycleState::Resumed);
    CHECK(resumed.is_locked == true);
    CHECK(rig.lock_writes() == 1);
    CHECK(rig.ctrl.state() == SessionState::Locked);
    CHECK(rig.ctrl.current_lifecycle() == AppLifecycleState::Resumed);
}

TEST_CASE("LockoutController detached locks like paused")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());

    auto detached = rig.ctrl.handle_lifecycle_event(AppLifecycleState::Detached);

    CHECK(detached.is_locked == true);
    CHECK(rig.ctrl.is_app_locked() == true);
}

TEST_CASE("LockoutController transient lifecycle events never lock")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());

    (void)rig.ctrl.handle_lifecycle_event(AppLifecycleState::Inactive);
    (void)rig.ctrl.handle_lifecycle_event(AppLifecycleState::Hidden);

    CHECK(rig.lock_writes() == 0);
    CHECK(rig.ctrl.is_app_locked() == false);
    CHECK(rig.ctrl.state() == SessionState::SignedIn);
}

TEST_CASE("LockoutController does not lock a signed-out app")
{
    LockoutRig rig;

    auto paused = rig.ctrl.handle_lifecycle_event(AppLifecycleState::Paused);

    CHECK(paused.is_locked == false);
    CHECK(rig.lock_writes() == 0);
    CHECK(rig.ctrl.state() == SessionState::SignedOut);

    auto locked = rig.ctrl.lock_app();
    REQUIRE(!locked.has_value());
    CHECK(locked.error().code == AuthErrc::NotAuthenticated);
}

TEST_CASE("LockoutController unlock with wrong credentials leaves the lock in place")
{
    LockoutRig rig;
    rig.sign_in_and_pause();
    rig.backend.login_response = BackendResponse::error(401, "Invalid email or password");

    auto res = rig.ctrl.unlock_with_credentials("ada@example.com", "wrong");

    REQUIRE(!res.has_value());
    CHECK(res.error().code == AuthErrc::InvalidCredentials);
    CHECK(res.error().message == "Invalid email or password");
    CHECK(rig.ctrl.is_app_locked() == true);
}

TEST_CASE("LockoutController unlock with credentials clears the lock")
{
    LockoutRig rig;
    rig.sign_in_and_pause();

    REQUIRE(rig.ctrl.unlock_with_credentials("ada@example.com", "correct horse").has_value());

    CHECK(rig.ctrl.is_app_locked() == false);
    CHECK(rig.ctrl.state() == SessionState::SignedIn);
    CHECK(rig.metrics.app_unlocks.load() == 1);
}

TEST_CASE("LockoutController unlock with PIN surfaces the factor's error")
{
    LockoutRig rig;
    rig.sign_in_and_pause();
    REQUIRE(rig.pin.setup("2468").has_value());

    auto wrong = rig.ctrl.unlock_with_pin("0000");
    REQUIRE(!wrong.has_value());
    CHECK(wrong.error().code == AuthErrc::InvalidCredentials);
    CHECK(wrong.error().message == "Incorrect PIN. 4 attempts remaining");
    CHECK(rig.ctrl.is_app_locked() == true);

    REQUIRE(rig.ctrl.unlock_with_pin("2468").has_value());
    CHECK(rig.ctrl.is_app_locked() == false);
}

TEST_CASE("LockoutController factor unlocks are tallied in the auth metrics")
{
    LockoutRig rig;
    rig.sign_in_and_pause();
    REQUIRE(rig.pin.setup("2468").has_value());
    REQUIRE(rig.orch.enable_biometric().has_value());

    (void)rig.ctrl.unlock_with_pin("0000");
    REQUIRE(rig.ctrl.unlock_with_pin("2468").has_value());
    CHECK(rig.metrics.pin_failed.load() == 1);
    CHECK(rig.metrics.pin_successful.load() == 1);

    (void)rig.ctrl.handle_lifecycle_event(AppLifecycleState::Paused);
    for (int i = 0; i < 5; ++i)
    {
        (void)rig.ctrl.unlock_with_pin("0000");
    }
    CHECK(rig.metrics.pin_failed.load() == 5);
    CHECK(rig.metrics.pin_lockouts.load() == 1);

    rig.platform.script({false, true});
    (void)rig.ctrl.unlock_with_biometric();
    REQUIRE(rig.ctrl.unlock_with_biometric().has_value());
    CHECK(rig.metrics.biometric_failed.load() == 1);
    CHECK(rig.metrics.biometric_successful.load() == 1);
}

TEST_CASE("LockoutController unlock with biometric requires the matching account")
{
    LockoutRig rig;
    rig.sign_in_and_pause();
    REQUIRE(rig.orch.enable_biometric().has_value());

    SECTION("mismatch keeps the lock")
    {
        rig.platform.script({false});
        auto res = rig.ctrl.unlock_with_biometric();
        REQUIRE(!res.has_value());
        CHECK(res.error().code == AuthErrc::InvalidCredentials);
        CHECK(rig.ctrl.is_app_locked() == true);
    }

    SECTION("match clears the lock")
    {
        rig.platform.script({true});
        REQUIRE(rig.ctrl.unlock_with_biometric().has_value());
        CHECK(rig.ctrl.is_app_locked() == false);
    }

    SECTION("a binding for another account does not unlock")
    {
        REQUIRE(rig.orch.store_credentials("eve@example.com", "pw", "Eve", "u-7", "tok", "ref").has_value());
        rig.platform.script({true});
        auto res = rig.ctrl.unlock_with_biometric();
        REQUIRE(!res.has_value());
        CHECK(res.error().code == AuthErrc::NotAuthenticated);
        CHECK(rig.ctrl.is_app_locked() == true);
    }
}

TEST_CASE("LockoutController explicit lock and unlock")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());

    REQUIRE(rig.ctrl.lock_app().has_value());
    CHECK(rig.ctrl.state() == SessionState::Locked);

    REQUIRE(rig.ctrl.unlock_app().has_value());
    CHECK(rig.ctrl.state() == SessionState::SignedIn);
    CHECK(rig.metrics.app_locks.load() == 1);
}

TEST_CASE("LockoutController initialize restores a persisted lock")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());
    rig.store.set_record(vault::keys::lockout_state, LockoutState{true, true});

    auto loaded = rig.ctrl.initialize();

    CHECK(loaded.is_locked == true);
    CHECK(loaded.was_authenticated == true);
    CHECK(rig.ctrl.lockout_state() == loaded);
}

TEST_CASE("LockoutController fails closed when the vault breaks on resume")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());
    (void)rig.ctrl.initialize();
    rig.vlt.fail_reads = true;

    auto resumed = rig.ctrl.handle_lifecycle_event(AppLifecycleState::Resumed);

    CHECK(resumed.is_locked == true);
    CHECK(rig.ctrl.is_app_locked() == true);
}

TEST_CASE("LockoutController keeps the lock in memory when the write fails")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());
    rig.vlt.fail_writes = true;

    auto paused = rig.ctrl.handle_lifecycle_event(AppLifecycleState::Paused);

    CHECK(paused.is_locked == true);
    CHECK(rig.ctrl.lockout_state().is_locked == true);
}

TEST_CASE("LockoutController notifies listeners with the resulting state")
{
    LockoutRig rig;
    REQUIRE(rig.orch.sign_in("ada@example.com", "correct horse").has_value());
    std::vector<std::pair<AppLifecycleState, bool>> seen;
    rig.ctrl.subscribe([&](AppLifecycleState s, const LockoutState& st) { seen.emplace_back(s, st.is_locked); });

    (void)rig.ctrl.handle_lifecycle_event(AppLifecycleState::Inactive);
    (void)rig.ctrl.handle_lifecycle_event(AppLifecycleState::Paused);

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == std::pair{AppLifecycleState::Inactive, false});
    CHECK(seen[1] == std::pair{AppLifecycleState::Paused, true});
}

TEST_CASE("LockoutController sign_out clears the lock and the session")
{
    LockoutRig rig;
    rig.sign_in_and_pause();

    REQUIRE(rig.ctrl.sign_out().has_value());

    CHECK(rig.ctrl.state() == SessionState::SignedOut);
    CHECK(rig.ctrl.is_app_locked() == false);
    CHECK(rig.ctrl.lockout_state() == LockoutState{});
}

TEST_CASE("Lifecycle and session states have stable names")
{
    CHECK(to_string(AppLifecycleState::Paused) == "paused");
    CHECK(to_string(AppLifecycleState::Detached) == "detached");
    CHECK(to_string(SessionState::Locked) == "locked");
    CHECK(to_string(SessionState::SignedOut) == "signed_out");
}
