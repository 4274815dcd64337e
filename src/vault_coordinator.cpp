#include <sig-vault/vault_coordinator.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/path_model.hpp>
#include <deque>
#include <utility>

namespace SigVault
{

namespace
{
// Bounds the walk when a share links a directory into itself
constexpr size_t MAX_FOLDER_DEPTH = 32;
} // namespace

VaultCoordinator::VaultCoordinator(const Config &config, AdapterFactory factory)
: config(config), adapter_factory(std::move(factory)), local_cache(config.cache),
  transfer_engine(local_cache, events, config.transfers)
{
}

VaultCoordinator::~VaultCoordinator()
{
    transfer_engine.shutdown();
}

VaultStatus VaultCoordinator::initialize()
{
    VaultStatus status = local_cache.initialize();
    if (!isSuccess(status) && status.code != StatusCode::CACHE_CORRUPTION)
    {
        return status;
    }
    if (status.code == StatusCode::CACHE_CORRUPTION)
    {
        // The index is rebuilt from scratch by the next download
        Logger::warn(LogCategory::CACHE, "Starting with an empty cache: {}", status.message);
    }

    if (!config.active_backend.empty())
    {
        return setActiveBackend(config.active_backend);
    }
    return VaultStatus::success();
}

void VaultCoordinator::setActiveBackend(const BackendConfig &backend)
{
    std::shared_ptr<BackendAdapter> adapter = adapter_factory(backend, config.transfers);
    if (!adapter)
    {
        Logger::error(LogCategory::BACKEND, "No adapter for backend '{}'", backend.name);
        return;
    }

    // Adapters may normalize their configuration (the cloud base URL gains a
    // trailing '/'), and the refs they hand out carry the normalized id
    std::string backend_id = adapter->backend().qualifiedId();
    {
        std::lock_guard<std::mutex> lock(backend_mutex);
        active_adapter = adapter;
        active_name = backend.name;
        generation++;
        adapters_by_id[backend_id] = adapter;
    }

    Logger::info(LogCategory::BACKEND, "Active backend is now '{}' ({})", backend.name, backend_id);

    VaultEvent event;
    event.type = EventType::BACKEND_SWITCHED;
    event.backend_name = backend.name;
    event.backend_id = backend_id;
    events.publish(event);
}

VaultStatus VaultCoordinator::setActiveBackend(const std::string &name)
{
    auto it = config.backends.find(name);
    if (it == config.backends.end())
    {
        return { StatusCode::INVALID_ARGUMENT, "no backend named '" + name + "' in the configuration" };
    }
    setActiveBackend(it->second);
    return VaultStatus::success();
}

std::shared_ptr<BackendAdapter> VaultCoordinator::activeAdapter() const
{
    std::lock_guard<std::mutex> lock(backend_mutex);
    return active_adapter;
}

std::shared_ptr<BackendAdapter> VaultCoordinator::adapterFor(const RemoteRef &remote_ref) const
{
    std::lock_guard<std::mutex> lock(backend_mutex);
    if (active_adapter && active_adapter->backend().qualifiedId() == remote_ref.backend_id)
    {
        return active_adapter;
    }
    auto it = adapters_by_id.find(remote_ref.backend_id);
    return it == adapters_by_id.end() ? nullptr : it->second;
}

VaultStatus VaultCoordinator::browse(const std::string &path, std::vector<Entry> &entries)
{
    entries.clear();

    std::shared_ptr<BackendAdapter> adapter;
    uint64_t started_generation = 0;
    {
        std::lock_guard<std::mutex> lock(backend_mutex);
        adapter = active_adapter;
        started_generation = generation;
    }

    if (!adapter)
    {
        return { StatusCode::INVALID_ARGUMENT, "no active backend" };
    }

    std::vector<Entry> listed;
    VaultStatus status = adapter->listDirectory(path, listed);

    {
        std::lock_guard<std::mutex> lock(backend_mutex);
        if (generation != started_generation)
        {
            Logger::debug(LogCategory::BACKEND, "Discarding listing of {}: backend switched meanwhile", path);
            return { StatusCode::SUPERSEDED, "backend switched while listing " + path };
        }
    }

    if (!isSuccess(status))
    {
        return status;
    }

    // Advisory staleness: cached copies stay usable
    for (const auto &entry : listed)
    {
        if (!entry.isDirectory() && entry.modified_at)
        {
            local_cache.markStaleIfNewer(entry.remote_ref, *entry.modified_at);
        }
    }

    VaultEvent event;
    event.type = EventType::DIRECTORY_LISTED;
    event.path = path;
    event.entries = listed;
    events.publish(event);

    entries = std::move(listed);
    return VaultStatus::success();
}

std::future<BrowseResult> VaultCoordinator::browseAsync(const std::string &path)
{
    return std::async(std::launch::async,
                      [this, path]
                      {
                          BrowseResult result;
                          result.status = browse(path, result.entries);
                          return result;
                      });
}

TransferJobInfo VaultCoordinator::rejectedJob(TransferDirection direction,
                                              const RemoteRef &remote_ref,
                                              const std::string &local_path,
                                              VaultStatus error)
{
    Logger::warn(LogCategory::TRANSFER, "Rejecting {} of {}: {}", transferDirectionToString(direction),
                 remote_ref.path, describeStatus(error));

    TransferJobInfo info;
    info.direction = direction;
    info.backend_id = remote_ref.backend_id;
    info.remote_ref = remote_ref;
    info.local_path = local_path;
    info.state = TransferState::FAILED;
    info.error = std::move(error);
    return transfer_engine.addFinishedJob(std::move(info));
}

TransferJobInfo VaultCoordinator::startDownload(const RemoteRef &remote_ref,
                                                std::optional<uint64_t> size,
                                                std::optional<std::chrono::system_clock::time_point> modified_at)
{
    std::optional<CacheRecord> record = local_cache.lookup(remote_ref);
    if (record && !record->stale)
    {
        Logger::debug(LogCategory::CACHE, "Serving {} from {}", remote_ref.path, record->local_path);

        TransferJobInfo info;
        info.direction = TransferDirection::DOWNLOAD;
        info.backend_id = remote_ref.backend_id;
        info.remote_ref = remote_ref;
        info.local_path = record->local_path;
        info.bytes_total = record->size_at_download;
        info.bytes_done = record->size_at_download;
        info.state = TransferState::SUCCEEDED;
        info.from_cache = true;
        return transfer_engine.addFinishedJob(std::move(info));
    }

    std::shared_ptr<BackendAdapter> adapter = adapterFor(remote_ref);
    if (!adapter)
    {
        return rejectedJob(TransferDirection::DOWNLOAD, remote_ref, "",
                           { StatusCode::INVALID_ARGUMENT, "no configured backend matches " + remote_ref.backend_id });
    }

    TransferRequest request;
    request.direction = TransferDirection::DOWNLOAD;
    request.adapter = adapter;
    request.remote_ref = remote_ref;
    request.bytes_total = size;
    request.remote_modified_at = modified_at;
    return transfer_engine.submit(std::move(request));
}

TransferJobInfo VaultCoordinator::download(const RemoteRef &remote_ref)
{
    return startDownload(remote_ref, std::nullopt, std::nullopt);
}

TransferJobInfo VaultCoordinator::download(const Entry &entry)
{
    if (entry.isDirectory())
    {
        return rejectedJob(TransferDirection::DOWNLOAD, entry.remote_ref, "",
                           { StatusCode::INVALID_ARGUMENT, entry.name + " is a directory" });
    }
    return startDownload(entry.remote_ref, entry.size, entry.modified_at);
}

VaultStatus VaultCoordinator::downloadFolder(const std::string &path, std::vector<TransferJobInfo> &jobs)
{
    jobs.clear();

    std::deque<std::pair<std::string, size_t>> pending;
    pending.emplace_back(path, 0);

    while (!pending.empty())
    {
        auto [folder, depth] = pending.front();
        pending.pop_front();

        std::vector<Entry> entries;
        VaultStatus status = browse(folder, entries);
        if (!isSuccess(status))
        {
            Logger::warn(LogCategory::TRANSFER, "Folder download stopped at {}: {}", folder, describeStatus(status));
            return status;
        }

        for (const auto &entry : entries)
        {
            if (!entry.isDirectory())
            {
                jobs.push_back(download(entry));
            }
            else if (depth + 1 < MAX_FOLDER_DEPTH)
            {
                pending.emplace_back(entry.remote_ref.path, depth + 1);
            }
            else
            {
                Logger::warn(LogCategory::TRANSFER, "Not descending into {}: nested too deeply", entry.remote_ref.path);
            }
        }
    }

    Logger::info(LogCategory::TRANSFER, "Submitted {} download(s) below {}", jobs.size(), path);
    return VaultStatus::success();
}

TransferJobInfo VaultCoordinator::upload(const std::string &local_path, const std::string &destination_path)
{
    std::shared_ptr<BackendAdapter> adapter = activeAdapter();

    RemoteRef remote_ref;
    if (adapter)
    {
        remote_ref = adapter->makeRef(PathModel::canonicalPath(destination_path, adapter->backend().kind));
    }
    else
    {
        remote_ref.path = destination_path;
        return rejectedJob(TransferDirection::UPLOAD, remote_ref, local_path,
                           { StatusCode::INVALID_ARGUMENT, "no active backend" });
    }

    const BackendKind kind = adapter->backend().kind;
    std::string name;
    VaultStatus status = PathModel::normalize(PathModel::baseName(destination_path, kind), kind, name);
    if (!isSuccess(status))
    {
        return rejectedJob(TransferDirection::UPLOAD, remote_ref, local_path, status);
    }

    TransferRequest request;
    request.direction = TransferDirection::UPLOAD;
    request.adapter = adapter;
    request.remote_ref = remote_ref;
    request.local_path = local_path;
    return transfer_engine.submit(std::move(request));
}

bool VaultCoordinator::cancel(JobId id)
{
    return transfer_engine.cancel(id);
}

std::optional<ProgressSubscription> VaultCoordinator::subscribe(JobId id)
{
    return transfer_engine.subscribe(id);
}

std::optional<TransferJobInfo> VaultCoordinator::wait(JobId id)
{
    return transfer_engine.wait(id);
}

bool VaultCoordinator::invalidate(const RemoteRef &remote_ref)
{
    return local_cache.invalidate(remote_ref);
}

VaultStatus VaultCoordinator::revalidate(const RemoteRef &remote_ref)
{
    std::shared_ptr<BackendAdapter> adapter = adapterFor(remote_ref);
    if (!adapter)
    {
        return { StatusCode::INVALID_ARGUMENT, "no configured backend matches " + remote_ref.backend_id };
    }

    Entry entry;
    VaultStatus status = adapter->statEntry(remote_ref, entry);
    if (status.code == StatusCode::NOT_FOUND)
    {
        Logger::info(LogCategory::CACHE, "{} no longer exists remotely, dropping cached copy", remote_ref.path);
        VaultStatus removed = local_cache.remove(remote_ref);
        if (!isSuccess(removed) && removed.code != StatusCode::NOT_FOUND)
        {
            Logger::error(LogCategory::CACHE, "Could not drop {}: {}", remote_ref.path, removed.message);
        }
        return status;
    }
    if (!isSuccess(status))
    {
        return status;
    }

    if (entry.modified_at)
    {
        local_cache.markStaleIfNewer(remote_ref, *entry.modified_at);
    }
    return VaultStatus::success();
}

uint64_t VaultCoordinator::evict(uint64_t target_freed_bytes)
{
    return local_cache.evictLeastRecentlyFetched(target_freed_bytes);
}

ListenerId VaultCoordinator::addListener(EventListener listener)
{
    return events.addListener(std::move(listener));
}

void VaultCoordinator::removeListener(ListenerId id)
{
    events.removeListener(id);
}

} // namespace SigVault
