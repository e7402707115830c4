#pragma once

#include <boost/json.hpp>
#include <string>
#include <string_view>

namespace auth
{

/**
 * Uniform answer from an identity backend.
 * status is the HTTP status (or its local equivalent); 0 means the request
 * never completed, i.e. a connectivity failure.
 * data holds the response payload. User fields may be spelled user_id or
 * userId, tokens token or access_token; readers must accept both.
 */
struct BackendResponse
{
    bool success = false;
    int status = 0;
    boost::json::object data;
    std::string message;

    [[nodiscard]] static BackendResponse ok(int status, boost::json::object data, std::string message)
    {
        return BackendResponse{true, status, std::move(data), std::move(message)};
    }

    [[nodiscard]] static BackendResponse error(int status, std::string message)
    {
        return BackendResponse{false, status, {}, std::move(message)};
    }
};

// Implementations never throw; every failure is a BackendResponse.
class IdentityBackend
{
public:
    virtual ~IdentityBackend() = default;

    [[nodiscard]] virtual bool reachable() = 0;
    [[nodiscard]] virtual BackendResponse login(std::string_view email, std::string_view password,
                                                std::string_view device_id) = 0;
    [[nodiscard]] virtual BackendResponse register_user(std::string_view name, std::string_view email,
                                                        std::string_view password) = 0;
    [[nodiscard]] virtual BackendResponse get_user(std::string_view user_id) = 0;
    [[nodiscard]] virtual BackendResponse refresh(std::string_view refresh_token, std::string_view device_id) = 0;
};

}
