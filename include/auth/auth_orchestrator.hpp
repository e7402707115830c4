#pragma once

#include "auth/auth_error.hpp"
#include "auth/biometric_gate.hpp"
#include "auth/credential_record.hpp"
#include "auth/device_identity.hpp"
#include "auth/identity_backend.hpp"
#include "auth/pin_fallback.hpp"
#include "logger/metrics.hpp"
#include "vault/secure_store.hpp"

#include <boost/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

/**
 * Entry point for every way of establishing a session.
 *
 * Owns the Credential Record. Password sign-in and sign-up go through the
 * IdentityBackend; the biometric and PIN factors only resurrect an identity
 * the backend issued earlier and are never re-validated against it.
 *
 * None of the sign-in paths touch the Lockout State; unlocking is the
 * LockoutController's business.
 */
class AuthOrchestrator
{
public:
    struct Settings
    {
        size_t password_min_length = 8;
        bool probe_connectivity = false;
    };

    AuthOrchestrator(vault::SecureStore& store, IdentityBackend& backend, BiometricGate& gate,
                     PinFallback& pin, DeviceIdentity& device, AuthMetrics& metrics, Settings settings);

    [[nodiscard]] AuthResult<CredentialRecord> sign_in(std::string_view email, std::string_view password);
    [[nodiscard]] AuthResult<CredentialRecord> sign_up(std::string_view email, std::string_view password,
                                                       std::string_view name);
    [[nodiscard]] AuthResult<void> sign_out();

    // A LockedOut error carries pin_fallback_available; the caller is then
    // expected to offer sign_in_with_pin().
    [[nodiscard]] AuthResult<CredentialRecord> sign_in_with_biometric();
    [[nodiscard]] AuthResult<CredentialRecord> sign_in_with_pin(std::string_view pin);

    [[nodiscard]] AuthResult<void> refresh_token();

    // Re-presents the stored email and password.
    [[nodiscard]] AuthResult<CredentialRecord> auto_login();

    // Binds the current password session to the biometric factor.
    [[nodiscard]] AuthResult<void> enable_biometric();

    [[nodiscard]] AuthResult<boost::json::object> fetch_profile();

    // Writes a full session in one record; logged_in is always set.
    [[nodiscard]] AuthResult<void> store_credentials(std::string_view email, std::string_view password,
                                                     std::string_view name, std::string_view user_id,
                                                     std::string_view access_token,
                                                     std::string_view refresh_token);
    [[nodiscard]] AuthResult<CredentialRecord> stored_credentials();

    // Fail closed: a vault fault reads as signed out.
    [[nodiscard]] bool is_logged_in();
    [[nodiscard]] std::optional<CredentialRecord> current_record();

    [[nodiscard]] const Settings& settings() const { return cfg; }

private:
    [[nodiscard]] AuthResult<CredentialRecord> record_from(const BackendResponse& res, std::string_view email,
                                                           std::string_view password, std::string_view name);
    [[nodiscard]] AuthResult<CredentialRecord> adopt(const BoundIdentity& identity, AuthMethod method);

    std::reference_wrapper<vault::SecureStore> store;
    std::reference_wrapper<IdentityBackend> backend;
    std::reference_wrapper<BiometricGate> gate;
    std::reference_wrapper<PinFallback> pin;
    std::reference_wrapper<DeviceIdentity> device;
    std::reference_wrapper<AuthMetrics> metrics;
    Settings cfg;
};

// Tallies a failed biometric or PIN attempt against that factor's counters.
void count_factor_failure(AuthMetrics& m, const AuthError& err,
                          std::atomic<uint64_t>& failed, std::atomic<uint64_t>& lockouts);

}
