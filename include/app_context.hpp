#pragma once

#include "auth/auth_orchestrator.hpp"
#include "auth/biometric_gate.hpp"
#include "auth/biometric_platform.hpp"
#include "auth/device_identity.hpp"
#include "auth/identity_backend.hpp"
#include "auth/lockout_controller.hpp"
#include "auth/pin_fallback.hpp"
#include "config.hpp"
#include "fundamentals/clock.hpp"
#include "logger/metrics.hpp"
#include "threadpool/threadpool.hpp"
#include "vault/credential_vault.hpp"
#include "vault/secure_store.hpp"

#include <expected>
#include <memory>
#include <string>

/**
 * Owns and wires one instance of every engine component.
 * Member order is construction order; the biometric platform is declared
 * before the prompt pool so it outlives any prompt still running there.
 */
class AppContext
{
    struct private_tag
    {
        explicit private_tag() = default;
    };

public:
    [[nodiscard]] static std::expected<std::unique_ptr<AppContext>, std::string>
    create(const Config& config, std::unique_ptr<auth::BiometricPlatform> platform);

    ~AppContext();

    // Only create() can name private_tag.
    AppContext(private_tag, Config config, std::unique_ptr<vault::CredentialVault> v,
               std::unique_ptr<auth::IdentityBackend> backend,
               std::unique_ptr<auth::BiometricPlatform> platform);

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    [[nodiscard]] auth::AuthOrchestrator& orchestrator() { return *orch; }
    [[nodiscard]] auth::LockoutController& lockout() { return *ctrl; }
    [[nodiscard]] auth::BiometricGate& biometric() { return *gate; }
    [[nodiscard]] auth::PinFallback& pin() { return *pin_fb; }
    [[nodiscard]] auth::DeviceIdentity& device() { return *dev; }
    [[nodiscard]] AuthMetrics& metrics() { return stats; }
    [[nodiscard]] const Config& config() const { return cfg; }

private:
    Config cfg;
    AuthMetrics stats;
    clk::SystemClock clock;
    std::unique_ptr<vault::CredentialVault> vlt;
    std::unique_ptr<vault::SecureStore> store;
    std::unique_ptr<auth::IdentityBackend> backend;
    std::unique_ptr<auth::BiometricPlatform> platform;
    std::unique_ptr<ThreadPool> prompt_pool;
    std::unique_ptr<auth::DeviceIdentity> dev;
    std::unique_ptr<auth::PinFallback> pin_fb;
    std::unique_ptr<auth::BiometricGate> gate;
    std::unique_ptr<auth::AuthOrchestrator> orch;
    std::unique_ptr<auth::LockoutController> ctrl;
};
