#pragma once

#include "../types/cache_record.hpp"
#include "../types/config.hpp"
#include "../types/entry.hpp"
#include "vault_status.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace SigVault
{

struct DownloadMetadata
{
    uint64_t size{};
    std::optional<std::chrono::system_clock::time_point> remote_modified_at;
};

/**
 * Maps remote objects to downloaded files under the cache directory and
 * persists that mapping in <directory>/index.json.
 *
 * Lookups may run concurrently; every mutation takes the writer lock and
 * rewrites the index before returning. A record is always removed before
 * its file, and a replaced record's old file is deleted only after the new
 * record is in place, so a looked-up record never points at a file this
 * cache already deleted.
 */
class LocalCache
{
    public:
    explicit LocalCache(const CacheConfig &config);
    ~LocalCache() = default;

    LocalCache(const LocalCache &) = delete;
    LocalCache &operator=(const LocalCache &) = delete;

    // Creates the directory and loads the index. Records whose file is gone
    // are dropped.
    VaultStatus initialize();

    // Stale records are returned too; callers decide whether stale is good enough
    std::optional<CacheRecord> lookup(const RemoteRef &remote_ref);

    // Fresh file name in the cache directory for a download of `remote_ref`
    std::string allocateLocalPath(const RemoteRef &remote_ref) const;

    VaultStatus recordCompletedDownload(const RemoteRef &remote_ref,
                                        const std::string &local_path,
                                        const DownloadMetadata &metadata);

    // Marks the record stale, keeping the file. False if there is no record.
    bool invalidate(const RemoteRef &remote_ref);

    // Marks the record stale when the backend reports a newer modification time
    bool markStaleIfNewer(const RemoteRef &remote_ref, std::chrono::system_clock::time_point remote_modified_at);

    // Drops the record and deletes its file
    VaultStatus remove(const RemoteRef &remote_ref);

    // Removes least recently fetched records until `target_freed_bytes` have
    // been freed or nothing evictable remains. Returns the bytes freed.
    uint64_t evictLeastRecentlyFetched(uint64_t target_freed_bytes);

    // A pinned file is never evicted
    void pin(const std::string &local_path);
    void unpin(const std::string &local_path);

    CacheStatistics statistics() const;
    std::vector<CacheRecord> records() const;

    const std::string &directory() const
    {
        return cache_directory;
    }

    private:
    VaultStatus loadIndex();
    VaultStatus persistLocked() const;
    uint64_t evictLocked(uint64_t target_freed_bytes,
                         std::vector<std::string> &files_to_delete,
                         const std::string &keep_key = {});
    bool isPinned(const std::string &local_path) const;
    void deleteFiles(const std::vector<std::string> &paths) const;
    void publishSizeLocked() const;
    uint64_t totalBytesLocked() const;

    std::string cache_directory;
    std::string index_path;
    uint64_t max_size_bytes;

    mutable std::shared_mutex records_mutex;
    std::unordered_map<std::string, CacheRecord> records_by_key;

    mutable std::mutex pins_mutex;
    std::unordered_map<std::string, size_t> pinned_paths;

    std::atomic<uint64_t> hits{ 0 };
    std::atomic<uint64_t> misses{ 0 };
};

} // namespace SigVault
