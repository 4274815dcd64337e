#pragma once

#include "entry.hpp"
#include <sig-vault/vault_status.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace SigVault
{

using JobId = uint64_t;

enum class TransferDirection : std::uint8_t
{
    UPLOAD,
    DOWNLOAD
};

enum class TransferState : std::uint8_t
{
    QUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

inline bool isTerminal(TransferState state)
{
    return state == TransferState::SUCCEEDED || state == TransferState::FAILED || state == TransferState::CANCELLED;
}

const char *transferStateToString(TransferState state);
const char *transferDirectionToString(TransferDirection direction);

struct ProgressSnapshot
{
    JobId job_id{};
    uint64_t bytes_done{};
    std::optional<uint64_t> bytes_total;
    TransferState state = TransferState::QUEUED;
};

// Point-in-time copy of a job, safe to hand to callers
struct TransferJobInfo
{
    JobId id{};
    TransferDirection direction = TransferDirection::DOWNLOAD;
    std::string backend_id;
    RemoteRef remote_ref;
    std::string local_path;
    std::optional<uint64_t> bytes_total;
    uint64_t bytes_done{};
    TransferState state = TransferState::QUEUED;
    std::optional<VaultStatus> error; // Present iff state == FAILED
    bool from_cache = false;
};

} // namespace SigVault
