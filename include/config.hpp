#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Engine configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    enum class BackendMode { Local, Remote };

    struct BackendCfg
    {
        BackendMode mode = BackendMode::Local;
        std::string base_url = "http://localhost:8000/api";
        std::string db_path = "gatehouse_users.db";
        std::chrono::seconds timeout{10};
    };

    struct VaultCfg
    {
        std::string path = "gatehouse_vault.db";
        std::string key_file = "gatehouse_vault.key";
    };

    struct AuthCfg
    {
        size_t password_min_length = 8;
        bool probe_connectivity = false;
    };

    struct BiometricCfg
    {
        uint32_t max_attempts = 3;
        std::chrono::hours reset_window{24};
        // Single-prompt bound. Tunable; not a security threshold.
        std::chrono::milliseconds prompt_timeout{3000};
    };

    struct PinCfg
    {
        uint32_t max_attempts = 5;
        std::chrono::seconds lockout_duration{300};
        size_t min_length = 4;
        size_t max_length = 8;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static std::expected<Config, std::string> load_from_string(std::string_view text);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const BackendCfg& backend() const { return be; }
    [[nodiscard]] const VaultCfg& vault() const { return vlt; }
    [[nodiscard]] const AuthCfg& auth() const { return au; }
    [[nodiscard]] const BiometricCfg& biometric() const { return bio; }
    [[nodiscard]] const PinCfg& pin() const { return pn; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    BackendCfg be;
    VaultCfg vlt;
    AuthCfg au;
    BiometricCfg bio;
    PinCfg pn;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
