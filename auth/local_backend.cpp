#include "auth/local_backend.hpp"
#include "auth/argon2_hasher.hpp"
#include "crypto/utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>
#include <memory>

namespace json = boost::json;

namespace auth
{

namespace
{

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

stmt_ptr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK)
    {
        LOG_ERROR("Statement prepare failed: {}", sqlite3_errmsg(db));
        return stmt_ptr(nullptr, &sqlite3_finalize);
    }
    return stmt_ptr(raw, &sqlite3_finalize);
}

void bind(sqlite3_stmt* stmt, int idx, std::string_view text)
{
    sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

std::string column_str(sqlite3_stmt* stmt, int col)
{
    const auto* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return val ? std::string(val) : std::string{};
}

std::string normalize_email(std::string_view email)
{
    std::string out(email);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::string> random_token(size_t n_bytes)
{
    auto bytes = crypto::random_bytes(n_bytes);
    if (!bytes)
    {
        return std::nullopt;
    }
    return crypto::to_hex(*bytes);
}

json::object user_json(std::string_view id, std::string_view name, std::string_view email)
{
    return json::object{
        {"user_id", id},
        {"name", name},
        {"email", email}
    };
}

} // namespace

std::expected<LocalBackend, std::string> LocalBackend::open(std::string_view db_path)
{
    sqlite3* handle = nullptr;
    int rc = sqlite3_open(std::string(db_path).c_str(), &handle);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : "out of memory";
        sqlite3_close(handle);
        return std::unexpected(err);
    }

    LocalBackend be(handle);

    sqlite3_exec(handle, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(handle, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    if (!be.init_schema())
    {
        return std::unexpected(std::format("Failed to initialize user database: {}", sqlite3_errmsg(handle)));
    }
    return be;
}

LocalBackend::LocalBackend(sqlite3* handle)
    : db(handle)
{
}

LocalBackend::~LocalBackend()
{
    if (db)
    {
        sqlite3_close(db);
    }
}

LocalBackend::LocalBackend(LocalBackend&& other) noexcept
    : db(other.db)
{
    other.db = nullptr;
}

LocalBackend& LocalBackend::operator=(LocalBackend&& other) noexcept
{
    if (this != &other)
    {
        if (db) sqlite3_close(db);
        db = other.db;
        other.db = nullptr;
    }
    return *this;
}

bool LocalBackend::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS users (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            email TEXT UNIQUE NOT NULL,
            password_hash TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        ) WITHOUT ROWID;

        CREATE TABLE IF NOT EXISTS user_sessions (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
            auth_token TEXT NOT NULL,
            refresh_token TEXT NOT NULL UNIQUE,
            device_id TEXT,
            created_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL
        ) WITHOUT ROWID;

        CREATE INDEX IF NOT EXISTS idx_sessions_user_id ON user_sessions(user_id);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, std::addressof(err));
    if (rc != SQLITE_OK && err)
    {
        LOG_ERROR("User database schema failed: {}", err);
        sqlite3_free(err);
        return false;
    }
    return rc == SQLITE_OK;
}

bool LocalBackend::reachable()
{
    std::lock_guard lock(mtx);
    if (!db)
    {
        return false;
    }
    auto stmt = prepare(db, "SELECT 1;");
    return stmt && sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::optional<LocalBackend::UserRow> LocalBackend::find_user(std::string_view column, std::string_view value)
{
    auto sql = std::format("SELECT id, name, email, password_hash, created_at FROM users WHERE {} = ?;", column);
    auto stmt = prepare(db, sql.c_str());
    if (!stmt)
    {
        return std::nullopt;
    }
    bind(stmt.get(), 1, value);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    {
        return std::nullopt;
    }

    UserRow row;
    row.id = column_str(stmt.get(), 0);
    row.name = column_str(stmt.get(), 1);
    row.email = column_str(stmt.get(), 2);
    row.password_hash = column_str(stmt.get(), 3);
    row.created_at = sqlite3_column_int64(stmt.get(), 4);
    return row;
}

std::optional<json::object> LocalBackend::issue_session(const UserRow& user, std::string_view device_id)
{
    auto session_id = random_token(16);
    auto token = random_token(32);
    auto refresh = random_token(32);
    if (!session_id || !token || !refresh)
    {
        LOG_ERROR("Session token generation failed");
        return std::nullopt;
    }

    auto now = static_cast<int64_t>(std::time(nullptr));
    auto expires = now + std::chrono::duration_cast<std::chrono::seconds>(session_lifetime).count();

    auto stmt = prepare(db, "INSERT INTO user_sessions (id, user_id, auth_token, refresh_token, device_id, created_at, expires_at) "
                            "VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!stmt)
    {
        return std::nullopt;
    }
    bind(stmt.get(), 1, *session_id);
    bind(stmt.get(), 2, user.id);
    bind(stmt.get(), 3, *token);
    bind(stmt.get(), 4, *refresh);
    if (device_id.empty())
    {
        sqlite3_bind_null(stmt.get(), 5);
    }
    else
    {
        bind(stmt.get(), 5, device_id);
    }
    sqlite3_bind_int64(stmt.get(), 6, now);
    sqlite3_bind_int64(stmt.get(), 7, expires);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE)
    {
        LOG_ERROR("Session insert failed: {}", sqlite3_errmsg(db));
        return std::nullopt;
    }

    auto out = user_json(user.id, user.name, user.email);
    out["token"] = *token;
    out["refresh_token"] = *refresh;
    return out;
}

BackendResponse LocalBackend::login(std::string_view email, std::string_view password, std::string_view device_id)
{
    std::lock_guard lock(mtx);

    auto user = find_user("email", normalize_email(email));
    if (!user || !Argon2Hasher::verify(password, user->password_hash))
    {
        LOG_INFO("Local login rejected");
        return BackendResponse::error(401, "Invalid email or password");
    }

    auto session = issue_session(*user, device_id);
    if (!session)
    {
        return BackendResponse::error(500, "Failed to create session");
    }
    LOG_INFO("Local login succeeded for user {}", user->id);
    return BackendResponse::ok(200, std::move(*session), "Login successful");
}

BackendResponse LocalBackend::register_user(std::string_view name, std::string_view email, std::string_view password)
{
    std::lock_guard lock(mtx);

    auto normalized = normalize_email(email);
    if (find_user("email", normalized))
    {
        return BackendResponse::error(409, "User with this email already exists");
    }

    auto hashed = Argon2Hasher::hash(password);
    if (!hashed)
    {
        LOG_ERROR("Password hashing failed: {}", hashed.error());
        return BackendResponse::error(500, "Failed to create user");
    }

    auto id_hex = random_token(16);
    if (!id_hex)
    {
        return BackendResponse::error(500, "Failed to create user");
    }

    UserRow row{"user_" + *id_hex, std::string(name), normalized, hashed->encoded, static_cast<int64_t>(std::time(nullptr))};

    auto stmt = prepare(db, "INSERT INTO users (id, name, email, password_hash, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?);");
    if (!stmt)
    {
        return BackendResponse::error(500, "Failed to create user");
    }
    bind(stmt.get(), 1, row.id);
    bind(stmt.get(), 2, row.name);
    bind(stmt.get(), 3, row.email);
    bind(stmt.get(), 4, row.password_hash);
    sqlite3_bind_int64(stmt.get(), 5, row.created_at);
    sqlite3_bind_int64(stmt.get(), 6, row.created_at);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT)
    {
        return BackendResponse::error(409, "User with this email already exists");
    }
    if (rc != SQLITE_DONE)
    {
        LOG_ERROR("User insert failed: {}", sqlite3_errmsg(db));
        return BackendResponse::error(500, "Failed to create user");
    }

    auto session = issue_session(row, "");
    if (!session)
    {
        return BackendResponse::error(500, "Failed to create session");
    }
    LOG_INFO("Local user {} registered", row.id);
    return BackendResponse::ok(201, std::move(*session), "User created successfully");
}

BackendResponse LocalBackend::get_user(std::string_view user_id)
{
    std::lock_guard lock(mtx);

    auto user = find_user("id", user_id);
    if (!user)
    {
        return BackendResponse::error(404, "User not found");
    }
    auto data = user_json(user->id, user->name, user->email);
    data["created_at"] = user->created_at;
    return BackendResponse::ok(200, std::move(data), "User found");
}

BackendResponse LocalBackend::refresh(std::string_view refresh_token, std::string_view device_id)
{
    std::lock_guard lock(mtx);

    auto stmt = prepare(db, "SELECT id, user_id, device_id, expires_at FROM user_sessions WHERE refresh_token = ?;");
    if (!stmt)
    {
        return BackendResponse::error(500, "Failed to refresh session");
    }
    bind(stmt.get(), 1, refresh_token);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    {
        return BackendResponse::error(401, "Invalid refresh token");
    }

    auto session_id = column_str(stmt.get(), 0);
    auto user_id = column_str(stmt.get(), 1);
    auto bound_device = column_str(stmt.get(), 2);
    auto expires_at = sqlite3_column_int64(stmt.get(), 3);
    stmt.reset();

    if (expires_at <= static_cast<int64_t>(std::time(nullptr)))
    {
        return BackendResponse::error(401, "Refresh token expired");
    }
    if (!bound_device.empty() && !device_id.empty() && bound_device != device_id)
    {
        LOG_WARN("Refresh for user {} presented from another device", user_id);
        return BackendResponse::error(401, "Session is bound to another device");
    }

    auto user = find_user("id", user_id);
    if (!user)
    {
        return BackendResponse::error(401, "Invalid refresh token");
    }

    // Refresh tokens are single use.
    auto del = prepare(db, "DELETE FROM user_sessions WHERE id = ?;");
    if (!del)
    {
        return BackendResponse::error(500, "Failed to refresh session");
    }
    bind(del.get(), 1, session_id);
    if (sqlite3_step(del.get()) != SQLITE_DONE)
    {
        return BackendResponse::error(500, "Failed to refresh session");
    }

    auto session = issue_session(*user, bound_device.empty() ? device_id : std::string_view(bound_device));
    if (!session)
    {
        return BackendResponse::error(500, "Failed to refresh session");
    }
    return BackendResponse::ok(200, std::move(*session), "Token refreshed");
}

}
