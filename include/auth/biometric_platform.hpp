#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>

namespace auth
{

enum class BiometricType : uint8_t
{
    Fingerprint,
    Face,
    Iris,
    Strong,
    Weak,
};

[[nodiscard]] std::string_view display_name(BiometricType t);

struct PromptOptions
{
    bool biometric_only = true;
    bool sticky_auth = true;
};

/**
 * Platform biometric capability. Signal verification happens entirely on the
 * platform side; the engine only sees the boolean verdict.
 * authenticate() may block until the user acts. It may throw on platform
 * errors; the gate counts a throw as a failed attempt.
 */
class BiometricPlatform
{
public:
    virtual ~BiometricPlatform() = default;

    [[nodiscard]] virtual bool can_check_biometrics() = 0;
    [[nodiscard]] virtual bool is_device_supported() = 0;
    [[nodiscard]] virtual std::set<BiometricType> available_types() = 0;
    [[nodiscard]] virtual bool authenticate(std::string_view reason, const PromptOptions& opts) = 0;
    virtual void stop_authentication() = 0;
};

// Host without a sensor.
class UnsupportedBiometricPlatform final : public BiometricPlatform
{
public:
    [[nodiscard]] bool can_check_biometrics() override { return false; }
    [[nodiscard]] bool is_device_supported() override { return false; }
    [[nodiscard]] std::set<BiometricType> available_types() override { return {}; }
    [[nodiscard]] bool authenticate(std::string_view, const PromptOptions&) override { return false; }
    void stop_authentication() override {}
};

}
