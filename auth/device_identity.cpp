#include "auth/device_identity.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <openssl/evp.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <format>
#include <fstream>
#include <span>
#include <vector>

namespace auth
{

namespace
{

constexpr size_t id_bytes = 16;

std::string read_machine_id()
{
    for (const char* path : {"/etc/machine-id", "/var/lib/dbus/machine-id"})
    {
        std::ifstream in(path);
        std::string line;
        if (in.is_open() && std::getline(in, line) && !line.empty())
        {
            return line;
        }
    }
    return {};
}

std::string host_name()
{
    std::array<char, 256> buf{};
    if (gethostname(buf.data(), buf.size() - 1) != 0)
    {
        return {};
    }
    return std::string(buf.data());
}

} // namespace

DeviceIdentity::DeviceIdentity(vault::SecureStore& s)
    : store(s)
{
}

std::optional<std::string> DeviceIdentity::derive()
{
    auto info = device_info();
    if (info["machine_id"].empty() && info["hostname"].empty())
    {
        return std::nullopt;
    }

    std::string material;
    for (const auto& [k, v] : info)
    {
        if (v.empty())
        {
            continue;
        }
        if (!material.empty())
        {
            material += '|';
        }
        material += v;
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(material.data(), material.size(), digest.data(), std::addressof(digest_len),
                   EVP_sha256(), nullptr) != 1)
    {
        return std::nullopt;
    }

    return "device_" + crypto::to_hex(std::span<const uint8_t>(digest.data(), id_bytes));
}

std::string DeviceIdentity::random_id()
{
    if (auto bytes = crypto::random_bytes(id_bytes))
    {
        return "device_" + crypto::to_hex(*bytes);
    }
    // RAND_bytes only fails on a broken entropy source; fall back to time and pid.
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::format("device_fallback_{:x}_{:x}", now, static_cast<unsigned>(getpid()));
}

std::string DeviceIdentity::device_id()
{
    std::lock_guard lock(mtx);
    if (cached)
    {
        return *cached;
    }

    try
    {
        if (auto stored = store.get().get(vault::keys::device_id); stored && !stored->empty())
        {
            cached = *stored;
            return *cached;
        }

        auto derived = derive();
        auto id = derived ? *derived : random_id();
        store.get().set(vault::keys::device_id, id);
        LOG_INFO("Generated device identity {}", id);
        cached = id;
        return id;
    }
    catch (const vault::StorageError& e)
    {
        LOG_WARN("Device identity not persisted: {}", e.what());
        cached = random_id();
        return *cached;
    }
}

bool DeviceIdentity::has_device_id()
{
    try
    {
        auto stored = store.get().get(vault::keys::device_id);
        return stored && !stored->empty();
    }
    catch (const vault::StorageError& e)
    {
        LOG_WARN("Device identity check failed: {}", e.what());
        return false;
    }
}

bool DeviceIdentity::clear_device_id()
{
    std::lock_guard lock(mtx);
    try
    {
        store.get().remove(vault::keys::device_id);
        cached.reset();
        return true;
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("Failed to clear device identity: {}", e.what());
        return false;
    }
}

std::map<std::string, std::string> DeviceIdentity::device_info()
{
    std::map<std::string, std::string> info;
    info["machine_id"] = read_machine_id();
    info["hostname"] = host_name();

    utsname uts{};
    if (uname(std::addressof(uts)) == 0)
    {
        info["sysname"] = uts.sysname;
        info["machine"] = uts.machine;
    }
    return info;
}

}
