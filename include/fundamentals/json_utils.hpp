#pragma once
#include <boost/json.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <optional>
#include <initializer_list>
#include <format>
#include <cstdint>

namespace json_utils
{

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

// First present key wins. Numeric ids are rendered as decimal strings,
// since backends disagree on whether user ids are numbers or strings.
inline std::optional<std::string> first_str(const boost::json::object& obj,
                                            std::initializer_list<std::string_view> keys)
{
    for (auto key : keys)
    {
        auto it = obj.find(key);
        if (it == obj.end())
        {
            continue;
        }
        const auto& v = it->value();
        if (v.is_string())
        {
            return std::string(v.as_string());
        }
        if (v.is_int64())
        {
            return std::to_string(v.as_int64());
        }
        if (v.is_uint64())
        {
            return std::to_string(v.as_uint64());
        }
    }
    return std::nullopt;
}

inline std::string str_or(const boost::json::object& obj, std::string_view key, std::string_view fallback = "")
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(fallback);
    }
    return std::string(it->value().as_string());
}

inline int64_t int_or(const boost::json::object& obj, std::string_view key, int64_t fallback = 0)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return fallback;
    }
    if (it->value().is_int64())
    {
        return it->value().as_int64();
    }
    if (it->value().is_uint64())
    {
        return static_cast<int64_t>(it->value().as_uint64());
    }
    return fallback;
}

inline bool bool_or(const boost::json::object& obj, std::string_view key, bool fallback = false)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return fallback;
    }
    return it->value().as_bool();
}

} // namespace json_utils
