#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace SigVault
{

struct CacheRecord
{
    std::string remote_key; // RemoteRef::cacheKey()
    std::string local_path;
    uint64_t size_at_download{};
    std::optional<std::chrono::system_clock::time_point> remote_modified_at;
    std::chrono::system_clock::time_point fetched_at{};

    // Set by invalidate() or when the backend reports a newer modification time.
    // A stale record still points at a usable file.
    bool stale = false;
};

struct CacheStatistics
{
    size_t entry_count{};
    uint64_t total_bytes{};
    uint64_t hits{};
    uint64_t misses{};
    size_t stale_count{};
};

} // namespace SigVault
