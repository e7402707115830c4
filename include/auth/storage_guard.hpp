#pragma once

#include "auth/auth_error.hpp"
#include "vault/secure_store.hpp"
#include "logger.hpp"

#include <format>
#include <functional>
#include <string_view>

namespace auth
{

// Runs an AuthResult-returning body and turns a vault fault into a closed
// failure. Nothing above this point sees StorageError.
template<class Fn>
auto storage_guarded(std::string_view op, Fn&& fn) -> std::invoke_result_t<Fn>
{
    try
    {
        return std::invoke(std::forward<Fn>(fn));
    }
    catch (const vault::StorageError& e)
    {
        LOG_ERROR("{} failed closed: {}", op, e.what());
        return fail(AuthErrc::Storage, std::format("{} failed: secure storage is unavailable", op));
    }
}

}
