#pragma once

#include "vault/secure_store.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace auth
{

/**
 * One stable identifier per install, used to bind backend sessions to this
 * device. Derived once from host characteristics, then persisted and cached;
 * later changes to the host do not change it.
 */
class DeviceIdentity
{
public:
    explicit DeviceIdentity(vault::SecureStore& store);

    // Never fails. If the vault is unusable, an unpersisted random id is
    // returned for this process only.
    [[nodiscard]] std::string device_id();
    [[nodiscard]] bool has_device_id();
    [[nodiscard]] bool clear_device_id();

    [[nodiscard]] static std::map<std::string, std::string> device_info();

private:
    [[nodiscard]] static std::optional<std::string> derive();
    [[nodiscard]] static std::string random_id();

    std::reference_wrapper<vault::SecureStore> store;
    std::optional<std::string> cached;
    std::mutex mtx;
};

}
