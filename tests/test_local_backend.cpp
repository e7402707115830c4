#include <catch2/catch_test_macros.hpp>

#include "auth/local_backend.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace auth;

namespace
{

struct TempDb
{
    explicit TempDb(std::string name)
        : path("/tmp/" + std::move(name))
    {
        cleanup();
    }

    ~TempDb() { cleanup(); }

    void cleanup() const
    {
        fs::remove(path);
        fs::remove(path + "-wal");
        fs::remove(path + "-shm");
    }

    std::string path;
};

std::string str(const BackendResponse& res, std::string_view key)
{
    return std::string(res.data.at(key).as_string());
}

}

TEST_CASE("LocalBackend register then login with the same password")
{
    TempDb tmp("gatehouse_test_users_login.db");
    auto be = LocalBackend::open(tmp.path);
    REQUIRE(be.has_value());

    auto reg = be->register_user("Grace", "Grace@Example.com", "longenough");
    REQUIRE(reg.success);
    CHECK(reg.status == 201);
    CHECK(str(reg, "user_id").starts_with("user_"));
    CHECK(str(reg, "email") == "grace@example.com");
    CHECK(!str(reg, "token").empty());
    CHECK(!str(reg, "refresh_token").empty());

    auto login = be->login("grace@example.com", "longenough", "device_a");
    REQUIRE(login.success);
    CHECK(login.status == 200);
    CHECK(str(login, "user_id") == str(reg, "user_id"));
    CHECK(str(login, "name") == "Grace");
    CHECK(str(login, "token") != str(reg, "token"));
}

TEST_CASE("LocalBackend rejects a wrong password and an unknown user alike")
{
    TempDb tmp("gatehouse_test_users_reject.db");
    auto be = LocalBackend::open(tmp.path);
    REQUIRE(be.has_value());
    REQUIRE(be->register_user("Grace", "grace@example.com", "longenough").success);

    auto wrong = be->login("grace@example.com", "not it", "device_a");
    auto unknown = be->login("nobody@example.com", "longenough", "device_a");

    CHECK(wrong.status == 401);
    CHECK(unknown.status == 401);
    CHECK(wrong.message == unknown.message);
}

TEST_CASE("LocalBackend refuses duplicate emails regardless of case")
{
    TempDb tmp("gatehouse_test_users_dup.db");
    auto be = LocalBackend::open(tmp.path);
    REQUIRE(be.has_value());
    REQUIRE(be->register_user("Grace", "grace@example.com", "longenough").success);

    auto dup = be->register_user("Other", "GRACE@example.com", "different1");

    CHECK(dup.success == false);
    CHECK(dup.status == 409);
}

TEST_CASE("LocalBackend get_user returns the profile")
{
    TempDb tmp("gatehouse_test_users_get.db");
    auto be = LocalBackend::open(tmp.path);
    REQUIRE(be.has_value());
    auto reg = be->register_user("Grace", "grace@example.com", "longenough");
    REQUIRE(reg.success);

    auto user = be->get_user(str(reg, "user_id"));
    REQUIRE(user.success);
    CHECK(str(user, "name") == "Grace");
    CHECK(user.data.contains("created_at"));
    CHECK(!user.data.contains("password_hash"));

    CHECK(be->get_user("user_missing").status == 404);
}

TEST_CASE("LocalBackend refresh tokens are single use")
{
    TempDb tmp("gatehouse_test_users_refresh.db");
    auto be = LocalBackend::open(tmp.path);
    REQUIRE(be.has_value());
    REQUIRE(be->register_user("Grace", "grace@example.com", "longenough").success);
    auto login = be->login("grace@example.com", "longenough", "device_a");
    REQUIRE(login.success);
    auto first = str(login, "refresh_token");

    auto rotated = be->refresh(first, "device_a");
    REQUIRE(rotated.success);
    CHECK(str(rotated, "refresh_token") != first);
    CHECK(!str(rotated, "token").empty());

    auto replay = be->refresh(first, "device_a");
    CHECK(replay.status == 401);

    CHECK(be->refresh(str(rotated, "refresh_token"), "device_a").success);
}

TEST_CASE("LocalBackend refresh is bound to the issuing device")
{
    TempDb tmp("gatehouse_test_users_device.db");
    auto be = LocalBackend::open(tmp.path);
    REQUIRE(be.has_value());
    REQUIRE(be->register_user("Grace", "grace@example.com", "longenough").success);
    auto login = be->login("grace@example.com", "longenough", "device_a");
    REQUIRE(login.success);

    auto elsewhere = be->refresh(str(login, "refresh_token"), "device_b");
    CHECK(elsewhere.status == 401);

    CHECK(be->refresh(str(login, "refresh_token"), "device_a").success);
}

TEST_CASE("LocalBackend keeps users across reopen")
{
    TempDb tmp("gatehouse_test_users_reopen.db");
    {
        auto be = LocalBackend::open(tmp.path);
        REQUIRE(be.has_value());
        REQUIRE(be->register_user("Grace", "grace@example.com", "longenough").success);
    }

    auto be = LocalBackend::open(tmp.path);
    REQUIRE(be.has_value());
    CHECK(be->reachable() == true);
    CHECK(be->login("grace@example.com", "longenough", "device_a").success);
}

TEST_CASE("LocalBackend open fails for an unwritable path")
{
    auto be = LocalBackend::open("/nonexistent/dir/users.db");

    CHECK(!be.has_value());
}
