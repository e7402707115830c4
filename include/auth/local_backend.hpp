#pragma once

#include "auth/identity_backend.hpp"

#include <sqlite3.h>
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

/**
 * On-device identity store: users with Argon2id password hashes and
 * device-bound sessions with rotating refresh tokens, in one sqlite3 file.
 * Status codes mirror what the HTTP backend would answer.
 */
class LocalBackend final : public IdentityBackend
{
public:
    [[nodiscard]] static std::expected<LocalBackend, std::string> open(std::string_view db_path);
    ~LocalBackend() override;

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;
    LocalBackend(LocalBackend&& other) noexcept;
    LocalBackend& operator=(LocalBackend&& other) noexcept;

    [[nodiscard]] bool reachable() override;
    [[nodiscard]] BackendResponse login(std::string_view email, std::string_view password,
                                        std::string_view device_id) override;
    [[nodiscard]] BackendResponse register_user(std::string_view name, std::string_view email,
                                                std::string_view password) override;
    [[nodiscard]] BackendResponse get_user(std::string_view user_id) override;
    [[nodiscard]] BackendResponse refresh(std::string_view refresh_token, std::string_view device_id) override;

    static constexpr std::chrono::hours session_lifetime{24 * 30};

private:
    struct UserRow
    {
        std::string id;
        std::string name;
        std::string email;
        std::string password_hash;
        int64_t created_at = 0;
    };

    explicit LocalBackend(sqlite3* db);

    [[nodiscard]] bool init_schema();
    [[nodiscard]] std::optional<UserRow> find_user(std::string_view column, std::string_view value);
    [[nodiscard]] std::optional<boost::json::object> issue_session(const UserRow& user, std::string_view device_id);

    sqlite3* db;
    std::mutex mtx;
};

}
