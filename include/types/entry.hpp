#pragma once

#include "config.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace SigVault
{

enum class EntryKind : std::uint8_t
{
    FILE,
    DIRECTORY
};

enum class MediaType : std::uint8_t
{
    IMAGE,
    VIDEO,
    OTHER
};

// Handle used to re-request a remote object. For SMB the path is share
// relative with '\' separators, for cloud backends it is the URL-decoded
// path below the WebDAV files root with '/' separators.
struct RemoteRef
{
    BackendKind kind = BackendKind::SMB;
    std::string backend_id; // BackendConfig::qualifiedId()
    std::string path;

    std::string cacheKey() const
    {
        return backend_id + "|" + path;
    }

    bool operator==(const RemoteRef &other) const
    {
        return kind == other.kind && backend_id == other.backend_id && path == other.path;
    }
};

struct Entry
{
    std::string name;
    EntryKind kind = EntryKind::FILE;
    std::optional<uint64_t> size; // Files only
    std::optional<std::chrono::system_clock::time_point> modified_at;
    RemoteRef remote_ref;
    MediaType media_type = MediaType::OTHER;

    bool isDirectory() const
    {
        return kind == EntryKind::DIRECTORY;
    }
};

} // namespace SigVault
