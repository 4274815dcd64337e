#include <sig-vault/local_cache.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/metrics_collector.hpp>
#include <sig-vault/path_model.hpp>
#include <sig-vault/string_utils.hpp>
#include <sig-vault/time_utils.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace SigVault
{

namespace
{
const int INDEX_VERSION = 1;

// Evicting to exactly the bound would evict again on the next download
constexpr double EVICTION_LOW_WATERMARK = 0.8;

bool fileExists(const std::string &path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

nlohmann::json recordToJson(const CacheRecord &record)
{
    nlohmann::json j;
    j["remote_key"] = record.remote_key;
    j["local_path"] = record.local_path;
    j["size_at_download"] = record.size_at_download;
    if (record.remote_modified_at)
    {
        j["remote_modified_at_ms"] = TimeUtils::toEpochMillis(*record.remote_modified_at);
    }
    else
    {
        j["remote_modified_at_ms"] = nullptr;
    }
    j["fetched_at_ms"] = TimeUtils::toEpochMillis(record.fetched_at);
    j["stale"] = record.stale;
    return j;
}

CacheRecord recordFromJson(const nlohmann::json &j)
{
    CacheRecord record;
    record.remote_key = j.at("remote_key").get<std::string>();
    record.local_path = j.at("local_path").get<std::string>();
    record.size_at_download = j.at("size_at_download").get<uint64_t>();
    if (j.contains("remote_modified_at_ms") && j["remote_modified_at_ms"].is_number())
    {
        record.remote_modified_at = TimeUtils::fromEpochMillis(j["remote_modified_at_ms"].get<int64_t>());
    }
    record.fetched_at = TimeUtils::fromEpochMillis(j.at("fetched_at_ms").get<int64_t>());
    record.stale = j.value("stale", false);
    return record;
}
} // namespace

LocalCache::LocalCache(const CacheConfig &config)
: cache_directory(config.directory), index_path((std::filesystem::path(config.directory) / "index.json").string()),
  max_size_bytes(static_cast<uint64_t>(config.max_size_mb) * 1024 * 1024)
{
}

VaultStatus LocalCache::initialize()
{
    std::error_code ec;
    std::filesystem::create_directories(cache_directory, ec);
    if (ec)
    {
        return { StatusCode::IO_ERROR, "cannot create cache directory " + cache_directory + ": " + ec.message() };
    }

    return loadIndex();
}

VaultStatus LocalCache::loadIndex()
{
    std::unique_lock<std::shared_mutex> lock(records_mutex);
    records_by_key.clear();

    if (!fileExists(index_path))
    {
        Logger::info(LogCategory::CACHE, "No cache index at {}, starting empty", index_path);
        publishSizeLocked();
        return VaultStatus::success();
    }

    std::ifstream file(index_path);
    if (!file.is_open())
    {
        return { StatusCode::IO_ERROR, "cannot open cache index " + index_path };
    }

    size_t dropped = 0;
    try
    {
        nlohmann::json j = nlohmann::json::parse(file);
        if (j.value("version", 0) != INDEX_VERSION)
        {
            Logger::warn(LogCategory::CACHE, "Ignoring cache index with unknown version in {}", index_path);
            publishSizeLocked();
            return VaultStatus::success();
        }

        for (const auto &entry : j.at("records"))
        {
            CacheRecord record = recordFromJson(entry);
            if (!fileExists(record.local_path))
            {
                // Self-heal: the file went away while we were not running
                Logger::warn(LogCategory::CACHE, "Dropping record for {}: file {} is missing", record.remote_key,
                             record.local_path);
                ++dropped;
                continue;
            }
            records_by_key[record.remote_key] = std::move(record);
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error(LogCategory::CACHE, "Cache index {} is unreadable: {}", index_path, e.what());
        records_by_key.clear();
        publishSizeLocked();
        return { StatusCode::CACHE_CORRUPTION, "cache index " + index_path + " is unreadable: " + e.what() };
    }

    Logger::info(LogCategory::CACHE, "Loaded {} cache record(s) from {}", records_by_key.size(), index_path);
    publishSizeLocked();

    if (dropped > 0)
    {
        return persistLocked();
    }
    return VaultStatus::success();
}

VaultStatus LocalCache::persistLocked() const
{
    nlohmann::json j;
    j["version"] = INDEX_VERSION;
    j["records"] = nlohmann::json::array();
    for (const auto &[key, record] : records_by_key)
    {
        j["records"].push_back(recordToJson(record));
    }

    std::string temp_path = index_path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open())
        {
            return { StatusCode::IO_ERROR, "cannot write cache index " + temp_path };
        }
        file << j.dump(2);
        file.flush();
        if (!file)
        {
            return { StatusCode::IO_ERROR, "short write on cache index " + temp_path };
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, index_path, ec);
    if (ec)
    {
        return { StatusCode::IO_ERROR, "cannot replace cache index " + index_path + ": " + ec.message() };
    }
    return VaultStatus::success();
}

std::optional<CacheRecord> LocalCache::lookup(const RemoteRef &remote_ref)
{
    const std::string key = remote_ref.cacheKey();
    {
        std::shared_lock<std::shared_mutex> lock(records_mutex);
        auto it = records_by_key.find(key);
        if (it == records_by_key.end())
        {
            misses++;
            GlobalMetrics::instance().recordCacheMiss();
            return std::nullopt;
        }
        if (fileExists(it->second.local_path))
        {
            hits++;
            GlobalMetrics::instance().recordCacheHit();
            return it->second;
        }
    }

    // CACHE_CORRUPTION: the record outlived its file. Remove the stray record.
    std::unique_lock<std::shared_mutex> lock(records_mutex);
    auto it = records_by_key.find(key);
    if (it != records_by_key.end() && !fileExists(it->second.local_path))
    {
        Logger::warn(LogCategory::CACHE, "{}: record for {} points at missing file {}, removing it",
                     statusCodeToString(StatusCode::CACHE_CORRUPTION), key, it->second.local_path);
        records_by_key.erase(it);
        VaultStatus status = persistLocked();
        if (!isSuccess(status))
        {
            Logger::error(LogCategory::CACHE, "Could not persist cache index: {}", status.message);
        }
        publishSizeLocked();
    }
    else if (it != records_by_key.end())
    {
        // Replaced by a concurrent download in the meantime
        hits++;
        GlobalMetrics::instance().recordCacheHit();
        return it->second;
    }

    misses++;
    GlobalMetrics::instance().recordCacheMiss();
    return std::nullopt;
}

std::string LocalCache::allocateLocalPath(const RemoteRef &remote_ref) const
{
    std::string name = PathModel::baseName(remote_ref.path, remote_ref.kind);
    std::string extension;
    size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0)
    {
        extension = StringUtils::toLower(name.substr(dot));
    }

    auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
                 std::chrono::system_clock::now().time_since_epoch())
                 .count();
    std::string file_name = fmt::format("{}-{}{}", StringUtils::hashHex(remote_ref.cacheKey()), stamp, extension);
    return (std::filesystem::path(cache_directory) / file_name).string();
}

VaultStatus LocalCache::recordCompletedDownload(const RemoteRef &remote_ref,
                                                const std::string &local_path,
                                                const DownloadMetadata &metadata)
{
    if (!fileExists(local_path))
    {
        return { StatusCode::CACHE_CORRUPTION, "downloaded file " + local_path + " does not exist" };
    }

    CacheRecord record;
    record.remote_key = remote_ref.cacheKey();
    record.local_path = local_path;
    record.size_at_download = metadata.size;
    record.remote_modified_at = metadata.remote_modified_at;
    record.fetched_at = std::chrono::system_clock::now();

    std::vector<std::string> files_to_delete;
    VaultStatus status;
    {
        std::unique_lock<std::shared_mutex> lock(records_mutex);

        auto it = records_by_key.find(record.remote_key);
        if (it != records_by_key.end() && it->second.local_path != local_path)
        {
            files_to_delete.push_back(it->second.local_path);
        }
        records_by_key[record.remote_key] = record;

        if (max_size_bytes > 0 && totalBytesLocked() > max_size_bytes)
        {
            uint64_t low_watermark = static_cast<uint64_t>(static_cast<double>(max_size_bytes) * EVICTION_LOW_WATERMARK);
            uint64_t freed = evictLocked(totalBytesLocked() - low_watermark, files_to_delete, record.remote_key);
            Logger::info(LogCategory::CACHE, "Cache over {} limit, evicted {}",
                         StringUtils::formatSize(max_size_bytes), StringUtils::formatSize(freed));
        }

        status = persistLocked();
        publishSizeLocked();
    }

    // The replaced file goes only now that the new record is visible
    deleteFiles(files_to_delete);

    Logger::debug(LogCategory::CACHE, "Recorded {} -> {} ({})", record.remote_key, local_path,
                  StringUtils::formatSize(metadata.size));
    return status;
}

bool LocalCache::invalidate(const RemoteRef &remote_ref)
{
    std::unique_lock<std::shared_mutex> lock(records_mutex);
    auto it = records_by_key.find(remote_ref.cacheKey());
    if (it == records_by_key.end())
    {
        return false;
    }

    if (!it->second.stale)
    {
        it->second.stale = true;
        VaultStatus status = persistLocked();
        if (!isSuccess(status))
        {
            Logger::error(LogCategory::CACHE, "Could not persist cache index: {}", status.message);
        }
    }
    Logger::debug(LogCategory::CACHE, "Invalidated {}", it->first);
    return true;
}

bool LocalCache::markStaleIfNewer(const RemoteRef &remote_ref, std::chrono::system_clock::time_point remote_modified_at)
{
    std::unique_lock<std::shared_mutex> lock(records_mutex);
    auto it = records_by_key.find(remote_ref.cacheKey());
    if (it == records_by_key.end() || it->second.stale)
    {
        return false;
    }

    // Without a recorded time there is nothing to compare against
    if (!it->second.remote_modified_at || remote_modified_at <= *it->second.remote_modified_at)
    {
        return false;
    }

    it->second.stale = true;
    VaultStatus status = persistLocked();
    if (!isSuccess(status))
    {
        Logger::error(LogCategory::CACHE, "Could not persist cache index: {}", status.message);
    }
    Logger::info(LogCategory::CACHE, "{} changed remotely, cached copy is now stale", it->first);
    return true;
}

VaultStatus LocalCache::remove(const RemoteRef &remote_ref)
{
    std::vector<std::string> files_to_delete;
    VaultStatus status;
    {
        std::unique_lock<std::shared_mutex> lock(records_mutex);
        auto it = records_by_key.find(remote_ref.cacheKey());
        if (it == records_by_key.end())
        {
            return { StatusCode::NOT_FOUND, "no cache record for " + remote_ref.cacheKey() };
        }
        files_to_delete.push_back(it->second.local_path);
        records_by_key.erase(it);
        status = persistLocked();
        publishSizeLocked();
    }

    deleteFiles(files_to_delete);
    return status;
}

uint64_t LocalCache::evictLeastRecentlyFetched(uint64_t target_freed_bytes)
{
    std::vector<std::string> files_to_delete;
    uint64_t freed = 0;
    {
        std::unique_lock<std::shared_mutex> lock(records_mutex);
        freed = evictLocked(target_freed_bytes, files_to_delete);
        if (!files_to_delete.empty())
        {
            VaultStatus status = persistLocked();
            if (!isSuccess(status))
            {
                Logger::error(LogCategory::CACHE, "Could not persist cache index: {}", status.message);
            }
        }
        publishSizeLocked();
    }

    deleteFiles(files_to_delete);
    return freed;
}

uint64_t LocalCache::evictLocked(uint64_t target_freed_bytes,
                                 std::vector<std::string> &files_to_delete,
                                 const std::string &keep_key)
{
    std::vector<const CacheRecord *> candidates;
    candidates.reserve(records_by_key.size());
    for (const auto &[key, record] : records_by_key)
    {
        candidates.push_back(&record);
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const CacheRecord *lhs, const CacheRecord *rhs)
              {
                  return lhs->fetched_at < rhs->fetched_at;
              });

    uint64_t freed = 0;
    std::vector<std::string> evicted_keys;
    for (const CacheRecord *record : candidates)
    {
        if (freed >= target_freed_bytes)
        {
            break;
        }
        if (record->remote_key == keep_key)
        {
            continue;
        }
        if (isPinned(record->local_path))
        {
            Logger::debug(LogCategory::CACHE, "Not evicting {}: in use by a transfer", record->remote_key);
            continue;
        }
        freed += record->size_at_download;
        files_to_delete.push_back(record->local_path);
        evicted_keys.push_back(record->remote_key);
    }

    for (const auto &key : evicted_keys)
    {
        records_by_key.erase(key);
        GlobalMetrics::instance().recordCacheEviction();
    }

    if (!evicted_keys.empty())
    {
        Logger::info(LogCategory::CACHE, "Evicted {} record(s), {}", evicted_keys.size(), StringUtils::formatSize(freed));
    }
    return freed;
}

void LocalCache::pin(const std::string &local_path)
{
    std::lock_guard<std::mutex> lock(pins_mutex);
    pinned_paths[local_path]++;
}

void LocalCache::unpin(const std::string &local_path)
{
    std::lock_guard<std::mutex> lock(pins_mutex);
    auto it = pinned_paths.find(local_path);
    if (it != pinned_paths.end() && --it->second == 0)
    {
        pinned_paths.erase(it);
    }
}

bool LocalCache::isPinned(const std::string &local_path) const
{
    std::lock_guard<std::mutex> lock(pins_mutex);
    return pinned_paths.find(local_path) != pinned_paths.end();
}

void LocalCache::deleteFiles(const std::vector<std::string> &paths) const
{
    for (const auto &path : paths)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            Logger::warn(LogCategory::CACHE, "Could not delete {}: {}", path, ec.message());
        }
    }
}

uint64_t LocalCache::totalBytesLocked() const
{
    uint64_t total = 0;
    for (const auto &[key, record] : records_by_key)
    {
        total += record.size_at_download;
    }
    return total;
}

void LocalCache::publishSizeLocked() const
{
    GlobalMetrics::instance().updateCacheSize(totalBytesLocked());
    GlobalMetrics::instance().updateCacheEntryCount(records_by_key.size());
}

CacheStatistics LocalCache::statistics() const
{
    std::shared_lock<std::shared_mutex> lock(records_mutex);
    CacheStatistics stats;
    stats.entry_count = records_by_key.size();
    stats.total_bytes = totalBytesLocked();
    stats.hits = hits.load();
    stats.misses = misses.load();
    for (const auto &[key, record] : records_by_key)
    {
        if (record.stale)
        {
            stats.stale_count++;
        }
    }
    return stats;
}

std::vector<CacheRecord> LocalCache::records() const
{
    std::shared_lock<std::shared_mutex> lock(records_mutex);
    std::vector<CacheRecord> result;
    result.reserve(records_by_key.size());
    for (const auto &[key, record] : records_by_key)
    {
        result.push_back(record);
    }
    std::sort(result.begin(), result.end(),
              [](const CacheRecord &lhs, const CacheRecord &rhs)
              {
                  return lhs.fetched_at > rhs.fetched_at;
              });
    return result;
}

} // namespace SigVault
