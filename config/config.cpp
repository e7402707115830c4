#include "config.hpp"

#include <concepts>
#include <fstream>
#include <sstream>
#include <format>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

const json::object* section(const json::object& root, std::string_view name)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return nullptr;
    }
    return std::addressof(it->value().as_object());
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

std::expected<Config, std::string> Config::load_from_string(std::string_view text)
{
    json::value jv;
    try
    {
        jv = json::parse(text);
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;

    if (const auto* be = section(root, "backend"))
    {
        auto mode = get_string(*be, "mode", "local");
        if (mode == "local")
        {
            config.be.mode = BackendMode::Local;
        }
        else if (mode == "remote")
        {
            config.be.mode = BackendMode::Remote;
        }
        else
        {
            return std::unexpected(std::format("'mode' must be \"local\" or \"remote\", got \"{}\"", mode));
        }
        config.be.base_url = get_string(*be, "base_url", config.be.base_url);
        config.be.db_path = get_string(*be, "db_path", config.be.db_path);
        if (auto to = get_uint<uint64_t>(*be, "timeout_sec", 1, 300, 10); to)
        {
            config.be.timeout = std::chrono::seconds(*to);
        }
        else
        {
            return std::unexpected(to.error());
        }
    }

    if (const auto* v = section(root, "vault"))
    {
        config.vlt.path = get_string(*v, "path", config.vlt.path);
        config.vlt.key_file = get_string(*v, "key_file", config.vlt.key_file);
    }

    if (const auto* a = section(root, "auth"))
    {
        if (auto min_len = get_uint<size_t>(*a, "password_min_length", 1, 128, 8); min_len)
        {
            config.au.password_min_length = *min_len;
        }
        else
        {
            return std::unexpected(min_len.error());
        }
        config.au.probe_connectivity = get_bool(*a, "probe_connectivity", false);
    }

    if (const auto* b = section(root, "biometric"))
    {
        if (auto max_att = get_uint<uint32_t>(*b, "max_attempts", 1, 20, 3); max_att)
        {
            config.bio.max_attempts = *max_att;
        }
        else
        {
            return std::unexpected(max_att.error());
        }
        if (auto window = get_uint<uint64_t>(*b, "reset_window_hours", 1, 24 * 30, 24); window)
        {
            config.bio.reset_window = std::chrono::hours(*window);
        }
        else
        {
            return std::unexpected(window.error());
        }
        if (auto prompt_to = get_uint<uint64_t>(*b, "prompt_timeout_ms", 100, 120000, 3000); prompt_to)
        {
            config.bio.prompt_timeout = std::chrono::milliseconds(*prompt_to);
        }
        else
        {
            return std::unexpected(prompt_to.error());
        }
    }

    if (const auto* p = section(root, "pin"))
    {
        if (auto max_att = get_uint<uint32_t>(*p, "max_attempts", 1, 20, 5); max_att)
        {
            config.pn.max_attempts = *max_att;
        }
        else
        {
            return std::unexpected(max_att.error());
        }
        if (auto lockout = get_uint<uint64_t>(*p, "lockout_duration_sec", 1, 86400, 300); lockout)
        {
            config.pn.lockout_duration = std::chrono::seconds(*lockout);
        }
        else
        {
            return std::unexpected(lockout.error());
        }
        auto min_len = get_uint<size_t>(*p, "min_length", 1, 32, 4);
        if (!min_len)
        {
            return std::unexpected(min_len.error());
        }
        auto max_len = get_uint<size_t>(*p, "max_length", 1, 32, 8);
        if (!max_len)
        {
            return std::unexpected(max_len.error());
        }
        if (*min_len > *max_len)
        {
            return std::unexpected("'min_length' must not exceed 'max_length'");
        }
        config.pn.min_length = *min_len;
        config.pn.max_length = *max_len;
    }

    if (const auto* log = section(root, "logging"))
    {
        config.log.level = get_string(*log, "level", "info");
        config.log.file = get_string(*log, "file", "");
        if (auto max_size = get_uint<size_t>(*log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(*log, "enable_console", true);
    }
    return config;
}
