#pragma once

#include "vault/credential_vault.hpp"

#include <map>
#include <mutex>
#include <string>

namespace vault
{

// In-process vault. Nothing survives the object; used by tests and by hosts
// that keep state elsewhere.
class MemoryVault final : public CredentialVault
{
public:
    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    void set(std::string_view key, std::string_view value) override;
    void remove(std::string_view key) override;
    void clear() override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mtx;
    std::map<std::string, std::string, std::less<>> entries;
};

} // namespace vault
