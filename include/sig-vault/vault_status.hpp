#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace SigVault
{

enum class StatusCode : std::uint8_t
{
    SUCCESS = 0,
    INVALID_NAME,
    NOT_FOUND,
    PERMISSION_DENIED,
    CONNECTION_ERROR,
    QUOTA_EXCEEDED,
    CACHE_CORRUPTION,
    CANCELLED, // Job was cancelled before reaching another terminal state
    SUPERSEDED, // Listing discarded because the active backend changed
    INVALID_ARGUMENT,
    IO_ERROR // Local disk failure while staging a transfer
};

struct VaultStatus
{
    StatusCode code = StatusCode::SUCCESS;
    std::string message;

    VaultStatus() = default;
    VaultStatus(StatusCode status_code, std::string status_message = {})
    : code(status_code), message(std::move(status_message))
    {
    }

    static VaultStatus success()
    {
        return VaultStatus{};
    }
};

inline bool isSuccess(const VaultStatus &status)
{
    return status.code == StatusCode::SUCCESS;
}

const char *statusCodeToString(StatusCode code);

// "NOT_FOUND: message" or just "SUCCESS"
std::string describeStatus(const VaultStatus &status);

} // namespace SigVault
