#pragma once

#include "entry.hpp"
#include "transfer_job.hpp"
#include <optional>
#include <string>
#include <vector>

namespace SigVault
{

enum class EventType : std::uint8_t
{
    DIRECTORY_LISTED,
    TRANSFER_PROGRESS,
    TRANSFER_FAILED,
    BACKEND_SWITCHED
};

struct VaultEvent
{
    EventType type = EventType::DIRECTORY_LISTED;

    // DIRECTORY_LISTED
    std::string path;
    std::vector<Entry> entries;

    // TRANSFER_PROGRESS / TRANSFER_FAILED
    JobId job_id{};
    uint64_t bytes_done{};
    std::optional<uint64_t> bytes_total;
    TransferState state = TransferState::QUEUED;
    StatusCode error_kind = StatusCode::SUCCESS;
    std::string message;

    // BACKEND_SWITCHED
    std::string backend_name;
    std::string backend_id;
};

} // namespace SigVault
