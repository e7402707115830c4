#pragma once

#include "auth/identity_backend.hpp"

#include <boost/beast/http/verb.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace auth
{

/**
 * Identity backend reached over plain HTTP/1.1 with JSON bodies.
 * Each call opens a fresh connection and is bounded by the configured
 * timeout; transport failures come back as status 0.
 */
class RemoteBackend final : public IdentityBackend
{
public:
    struct Endpoint
    {
        std::string host;
        std::string port;
        std::string base_path;
    };

    [[nodiscard]] static std::expected<Endpoint, std::string> parse_url(std::string_view url);
    [[nodiscard]] static std::expected<RemoteBackend, std::string> create(std::string_view base_url,
                                                                          std::chrono::seconds timeout);

    [[nodiscard]] bool reachable() override;
    [[nodiscard]] BackendResponse login(std::string_view email, std::string_view password,
                                        std::string_view device_id) override;
    [[nodiscard]] BackendResponse register_user(std::string_view name, std::string_view email,
                                                std::string_view password) override;
    [[nodiscard]] BackendResponse get_user(std::string_view user_id) override;
    [[nodiscard]] BackendResponse refresh(std::string_view refresh_token, std::string_view device_id) override;

    // Maps a raw HTTP status and body onto a BackendResponse.
    [[nodiscard]] static BackendResponse interpret(int status, std::string_view body);

private:
    RemoteBackend(Endpoint ep, std::chrono::seconds timeout);

    [[nodiscard]] BackendResponse request(boost::beast::http::verb method, std::string_view path,
                                          const boost::json::object* body, std::string_view device_id);

    Endpoint ep;
    std::chrono::seconds timeout;
};

}
