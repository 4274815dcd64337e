#include <sig-vault/vault_status.hpp>
#include <fmt/format.h>

namespace SigVault
{

const char *statusCodeToString(StatusCode code)
{
    switch (code)
    {
    case StatusCode::SUCCESS:
        return "SUCCESS";
    case StatusCode::INVALID_NAME:
        return "INVALID_NAME";
    case StatusCode::NOT_FOUND:
        return "NOT_FOUND";
    case StatusCode::PERMISSION_DENIED:
        return "PERMISSION_DENIED";
    case StatusCode::CONNECTION_ERROR:
        return "CONNECTION_ERROR";
    case StatusCode::QUOTA_EXCEEDED:
        return "QUOTA_EXCEEDED";
    case StatusCode::CACHE_CORRUPTION:
        return "CACHE_CORRUPTION";
    case StatusCode::CANCELLED:
        return "CANCELLED";
    case StatusCode::SUPERSEDED:
        return "SUPERSEDED";
    case StatusCode::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    case StatusCode::IO_ERROR:
        return "IO_ERROR";
    default:
        return "UNKNOWN";
    }
}

std::string describeStatus(const VaultStatus &status)
{
    if (status.message.empty())
    {
        return statusCodeToString(status.code);
    }
    return fmt::format("{}: {}", statusCodeToString(status.code), status.message);
}

} // namespace SigVault
