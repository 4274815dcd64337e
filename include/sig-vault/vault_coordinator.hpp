#pragma once

#include "../types/config.hpp"
#include "backend_adapter.hpp"
#include "event_dispatcher.hpp"
#include "local_cache.hpp"
#include "transfer_engine.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace SigVault
{

struct BrowseResult
{
    VaultStatus status;
    std::vector<Entry> entries;
};

/**
 * Entry point for callers: routes browsing to the active backend, serves
 * downloads from the local cache when it can and hands everything else to
 * the transfer engine.
 *
 * Switching the active backend does not touch submitted transfers, which
 * keep the adapter they were submitted with. A listing that completes after
 * a switch is discarded and reported as SUPERSEDED.
 */
class VaultCoordinator
{
    public:
    explicit VaultCoordinator(const Config &config, AdapterFactory factory = createBackendAdapter);
    ~VaultCoordinator();

    VaultCoordinator(const VaultCoordinator &) = delete;
    VaultCoordinator &operator=(const VaultCoordinator &) = delete;

    // Loads the cache index and activates `active_backend` when configured
    VaultStatus initialize();

    void setActiveBackend(const BackendConfig &backend);

    // Activates a backend from the configuration by its key
    VaultStatus setActiveBackend(const std::string &name);

    std::shared_ptr<BackendAdapter> activeAdapter() const;

    VaultStatus browse(const std::string &path, std::vector<Entry> &entries);

    // Runs the listing on its own thread, never on a transfer worker
    std::future<BrowseResult> browseAsync(const std::string &path);

    TransferJobInfo download(const RemoteRef &remote_ref);

    // Uses the entry's size and modification time instead of asking the backend
    TransferJobInfo download(const Entry &entry);

    // Submits a download for every file below `path` on the active backend,
    // subdirectories included. Jobs already submitted stay submitted when a
    // later listing fails; the failure is returned.
    VaultStatus downloadFolder(const std::string &path, std::vector<TransferJobInfo> &jobs);

    TransferJobInfo upload(const std::string &local_path, const std::string &destination_path);

    bool cancel(JobId id);
    std::optional<ProgressSubscription> subscribe(JobId id);
    std::optional<TransferJobInfo> wait(JobId id);

    bool invalidate(const RemoteRef &remote_ref);

    // Compares the cached copy with the backend: a newer remote marks it
    // stale, a vanished remote removes it
    VaultStatus revalidate(const RemoteRef &remote_ref);

    uint64_t evict(uint64_t target_freed_bytes);

    ListenerId addListener(EventListener listener);
    void removeListener(ListenerId id);

    LocalCache &cache()
    {
        return local_cache;
    }

    TransferEngine &transfers()
    {
        return transfer_engine;
    }

    private:
    TransferJobInfo startDownload(const RemoteRef &remote_ref,
                                  std::optional<uint64_t> size,
                                  std::optional<std::chrono::system_clock::time_point> modified_at);
    TransferJobInfo rejectedJob(TransferDirection direction,
                                const RemoteRef &remote_ref,
                                const std::string &local_path,
                                VaultStatus error);
    std::shared_ptr<BackendAdapter> adapterFor(const RemoteRef &remote_ref) const;

    Config config;
    AdapterFactory adapter_factory;

    EventDispatcher events;
    LocalCache local_cache;
    TransferEngine transfer_engine;

    mutable std::mutex backend_mutex;
    std::shared_ptr<BackendAdapter> active_adapter;
    std::string active_name;
    uint64_t generation = 0;
    // Every adapter activated so far, so refs from an earlier backend still resolve
    std::unordered_map<std::string, std::shared_ptr<BackendAdapter>> adapters_by_id;
};

} // namespace SigVault
