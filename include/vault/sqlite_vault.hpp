#pragma once

#include "vault/credential_vault.hpp"
#include "crypto/aesgcm256.hpp"

#include <sqlite3.h>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>

namespace vault
{

/**
 * File-backed vault. Each value is sealed with AES-256-GCM under a device key
 * kept in a separate 0600 key file; the entry key is bound as AAD so sealed
 * values cannot be swapped between keys.
 */
class SqliteVault final : public CredentialVault
{
public:
    [[nodiscard]] static std::expected<SqliteVault, std::string> open(std::string_view db_path,
                                                                      std::string_view key_file);
    ~SqliteVault() override;

    SqliteVault(const SqliteVault&) = delete;
    SqliteVault& operator=(const SqliteVault&) = delete;
    SqliteVault(SqliteVault&& other) noexcept;
    SqliteVault& operator=(SqliteVault&& other) noexcept;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    void set(std::string_view key, std::string_view value) override;
    void remove(std::string_view key) override;
    void clear() override;

private:
    SqliteVault(sqlite3* db, const crypto::AES256GCM::key_t& key);

    [[nodiscard]] static std::expected<crypto::AES256GCM::key_t, std::string> load_or_create_key(std::string_view key_file);
    [[noreturn]] void fail(std::string_view what) const;
    void exec(const char* sql);

    sqlite3* db;
    crypto::AES256GCM::key_t key;
    std::mutex mtx;
};

} // namespace vault
