#include "vault/sqlite_vault.hpp"
#include "crypto/utils.hpp"

#include <cerrno>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace vault
{

namespace
{

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

std::span<const uint8_t> as_bytes(std::string_view sv)
{
    return {reinterpret_cast<const uint8_t*>(sv.data()), sv.size()};
}

struct fd_guard
{
    int fd;
    ~fd_guard()
    {
        if (fd >= 0)
        {
            ::close(fd);
        }
    }
};

// Owner-only from creation; never follows or reuses an existing file.
std::expected<void, std::string> write_key_file(const std::filesystem::path& path,
                                                const crypto::AES256GCM::key_t& key)
{
    fd_guard f{::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600)};
    if (f.fd < 0)
    {
        return std::unexpected(std::format("Failed to create vault key file: {}", path.string()));
    }

    size_t off = 0;
    while (off < key.size())
    {
        auto n = ::write(f.fd, key.data() + off, key.size() - off);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n <= 0)
        {
            return std::unexpected(std::format("Failed to write vault key file: {}", path.string()));
        }
        off += static_cast<size_t>(n);
    }
    if (::fsync(f.fd) != 0)
    {
        return std::unexpected(std::format("Failed to flush vault key file: {}", path.string()));
    }
    return {};
}

} // namespace

std::expected<crypto::AES256GCM::key_t, std::string> SqliteVault::load_or_create_key(std::string_view key_file)
{
    namespace fs = std::filesystem;
    crypto::AES256GCM::key_t key{};
    const fs::path path{std::string(key_file)};

    std::error_code ec;
    if (fs::exists(path, ec))
    {
        std::ifstream in(path, std::ios::binary);
        in.read(reinterpret_cast<char*>(key.data()), static_cast<std::streamsize>(key.size()));
        if (in.gcount() != static_cast<std::streamsize>(key.size()))
        {
            crypto::secure_clear(key);
            return std::unexpected(std::format("Vault key file is truncated: {}", path.string()));
        }
        return key;
    }

    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1)
    {
        return std::unexpected("Failed to generate vault key");
    }

    // Written under a private temp name, then renamed, so a crash never leaves
    // a partial key at `path`.
    const fs::path tmp{path.string() + std::format(".tmp.{}", ::getpid())};
    if (auto written = write_key_file(tmp, key); !written)
    {
        crypto::secure_clear(key);
        fs::remove(tmp, ec);
        return std::unexpected(written.error());
    }

    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec)
    {
        crypto::secure_clear(key);
        fs::remove(tmp, ec);
        return std::unexpected(std::format("Failed to restrict vault key file: {}", tmp.string()));
    }

    fs::rename(tmp, path, ec);
    if (ec)
    {
        crypto::secure_clear(key);
        auto msg = std::format("Failed to install vault key file {}: {}", path.string(), ec.message());
        fs::remove(tmp, ec);
        return std::unexpected(msg);
    }
    return key;
}

std::expected<SqliteVault, std::string> SqliteVault::open(std::string_view db_path, std::string_view key_file)
{
    auto key = load_or_create_key(key_file);
    if (!key)
    {
        return std::unexpected(key.error());
    }

    sqlite3* handle = nullptr;
    int rc = sqlite3_open(std::string(db_path).c_str(), &handle);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        crypto::secure_clear(*key);
        return std::unexpected(err);
    }

    SqliteVault v(handle, *key);
    crypto::secure_clear(*key);

    // A lock written on backgrounding must be on disk before the call returns.
    const char* sql = R"(
        PRAGMA journal_mode=WAL;
        PRAGMA synchronous=FULL;
        CREATE TABLE IF NOT EXISTS vault (
            key TEXT PRIMARY KEY,
            value BLOB NOT NULL
        ) WITHOUT ROWID;
    )";
    char* err = nullptr;
    if (sqlite3_exec(handle, sql, nullptr, nullptr, std::addressof(err)) != SQLITE_OK)
    {
        std::string msg = err ? err : "schema creation failed";
        sqlite3_free(err);
        return std::unexpected(msg);
    }

    return v;
}

SqliteVault::SqliteVault(sqlite3* handle, const crypto::AES256GCM::key_t& k)
    : db(handle)
    , key(k)
{
}

SqliteVault::~SqliteVault()
{
    crypto::secure_clear(key);
    if (db)
    {
        sqlite3_close(db);
    }
}

SqliteVault::SqliteVault(SqliteVault&& other) noexcept
    : db(other.db)
    , key(other.key)
{
    other.db = nullptr;
    crypto::secure_clear(other.key);
}

SqliteVault& SqliteVault::operator=(SqliteVault&& other) noexcept
{
    if (this != &other)
    {
        if (db) sqlite3_close(db);
        db = other.db;
        key = other.key;
        other.db = nullptr;
        crypto::secure_clear(other.key);
    }
    return *this;
}

void SqliteVault::fail(std::string_view what) const
{
    throw std::runtime_error(std::format("{}: {}", what, db ? sqlite3_errmsg(db) : "vault closed"));
}

void SqliteVault::exec(const char* sql)
{
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err)) != SQLITE_OK)
    {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error(std::format("vault exec failed: {}", msg));
    }
}

std::optional<std::string> SqliteVault::get(std::string_view k)
{
    std::lock_guard lock(mtx);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT value FROM vault WHERE key = ?;", -1, &raw, nullptr) != SQLITE_OK)
    {
        fail("vault read prepare failed");
    }
    stmt_ptr stmt(raw, &sqlite3_finalize);

    sqlite3_bind_text(stmt.get(), 1, k.data(), static_cast<int>(k.size()), SQLITE_STATIC);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
    {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW)
    {
        fail("vault read failed");
    }

    const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt.get(), 0));
    auto blob_len = static_cast<size_t>(sqlite3_column_bytes(stmt.get(), 0));

    auto plain = crypto::AES256GCM::open(key, std::span<const uint8_t>(blob, blob_len), as_bytes(k));
    if (!plain)
    {
        throw std::runtime_error(std::format("vault entry '{}' failed authentication", k));
    }
    std::string out(plain->begin(), plain->end());
    crypto::secure_clear(*plain);
    return out;
}

void SqliteVault::set(std::string_view k, std::string_view value)
{
    auto sealed = crypto::AES256GCM::seal(key, as_bytes(value), as_bytes(k));
    if (!sealed)
    {
        throw std::runtime_error("vault encryption failed");
    }

    std::lock_guard lock(mtx);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT OR REPLACE INTO vault (key, value) VALUES (?, ?);", -1, &raw, nullptr) != SQLITE_OK)
    {
        fail("vault write prepare failed");
    }
    stmt_ptr stmt(raw, &sqlite3_finalize);

    sqlite3_bind_text(stmt.get(), 1, k.data(), static_cast<int>(k.size()), SQLITE_STATIC);
    sqlite3_bind_blob(stmt.get(), 2, sealed->data(), static_cast<int>(sealed->size()), SQLITE_STATIC);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        fail("vault write failed");
    }
}

void SqliteVault::remove(std::string_view k)
{
    std::lock_guard lock(mtx);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM vault WHERE key = ?;", -1, &raw, nullptr) != SQLITE_OK)
    {
        fail("vault delete prepare failed");
    }
    stmt_ptr stmt(raw, &sqlite3_finalize);

    sqlite3_bind_text(stmt.get(), 1, k.data(), static_cast<int>(k.size()), SQLITE_STATIC);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        fail("vault delete failed");
    }
}

void SqliteVault::clear()
{
    std::lock_guard lock(mtx);
    exec("DELETE FROM vault;");
}

} // namespace vault
