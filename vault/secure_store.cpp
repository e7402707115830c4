#include "vault/secure_store.hpp"
#include "logger.hpp"

#include <format>

namespace json = boost::json;

namespace vault
{

SecureStore::SecureStore(CredentialVault& v)
    : vlt(v)
{
}

template<class Fn>
decltype(auto) SecureStore::guarded(std::string_view op, std::string_view key, Fn&& fn)
{
    try
    {
        return std::invoke(std::forward<Fn>(fn));
    }
    catch (const StorageError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Vault {} failed for '{}': {}", op, key, e.what());
        throw StorageError(std::format("Vault {} failed for '{}': {}", op, key, e.what()));
    }
    catch (...)
    {
        LOG_ERROR("Vault {} failed for '{}': unknown fault", op, key);
        throw StorageError(std::format("Vault {} failed for '{}'", op, key));
    }
}

std::optional<std::string> SecureStore::get(std::string_view key)
{
    return guarded("read", key, [&] { return vlt.get().get(key); });
}

void SecureStore::set(std::string_view key, std::string_view value)
{
    guarded("write", key, [&] { vlt.get().set(key, value); });
}

void SecureStore::remove(std::string_view key)
{
    guarded("delete", key, [&] { vlt.get().remove(key); });
}

void SecureStore::clear()
{
    guarded("clear", "*", [&] { vlt.get().clear(); });
}

std::optional<json::object> SecureStore::get_object(std::string_view key)
{
    auto raw = get(key);
    if (!raw)
    {
        return std::nullopt;
    }

    json::error_code ec;
    auto jv = json::parse(*raw, ec);
    if (ec || !jv.is_object())
    {
        LOG_ERROR("Vault record '{}' is corrupt", key);
        throw StorageError(std::format("Vault record '{}' is corrupt", key));
    }
    return std::move(jv.as_object());
}

void SecureStore::set_object(std::string_view key, const json::object& obj)
{
    set(key, json::serialize(obj));
}

} // namespace vault
