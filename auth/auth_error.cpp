#include "auth/auth_error.hpp"

namespace auth
{

std::string_view to_string(AuthErrc code)
{
    switch (code)
    {
        case AuthErrc::Validation: return "validation";
        case AuthErrc::Connectivity: return "connectivity";
        case AuthErrc::InvalidCredentials: return "invalid_credentials";
        case AuthErrc::NotConfigured: return "not_configured";
        case AuthErrc::LockedOut: return "locked_out";
        case AuthErrc::NotAuthenticated: return "not_authenticated";
        case AuthErrc::Storage: return "storage";
        case AuthErrc::Busy: return "busy";
    }
    return "unknown";
}

}
