#pragma once

#include "../types/config.hpp"
#include "../types/transfer_job.hpp"
#include "backend_adapter.hpp"
#include "event_dispatcher.hpp"
#include "local_cache.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace SigVault
{

struct TransferRequest
{
    TransferDirection direction = TransferDirection::DOWNLOAD;

    // The job stays bound to this adapter even if the active backend changes
    std::shared_ptr<BackendAdapter> adapter;

    // Download source, or upload destination
    RemoteRef remote_ref;

    // Upload source. Downloads are always written into the cache.
    std::string local_path;

    // Known metadata of the remote object, saves a stat before downloading
    std::optional<uint64_t> bytes_total;
    std::optional<std::chrono::system_clock::time_point> remote_modified_at;
};

struct TransferJob;

// Lazy sequence of snapshots for one job. Intermediate snapshots may be
// coalesced when the subscriber is slower than the transfer; bytes_done
// never decreases and the terminal snapshot is always delivered.
class ProgressSubscription
{
    public:
    explicit ProgressSubscription(std::shared_ptr<TransferJob> job);

    // Blocks until there is something new. std::nullopt once the terminal
    // snapshot has been handed out.
    std::optional<ProgressSnapshot> next();

    // Full record of the job, valid even after the engine has retired it
    TransferJobInfo info() const;

    private:
    std::shared_ptr<TransferJob> job;
    uint64_t seen_version = 0;
    bool finished = false;
};

/**
 * Runs uploads and downloads on a fixed pool of worker threads.
 *
 * Jobs move QUEUED -> RUNNING -> SUCCEEDED | FAILED | CANCELLED and never
 * leave a terminal state. Cancellation of a running job is cooperative and
 * takes effect at the next buffer boundary. Failed jobs are not retried.
 */
class TransferEngine
{
    public:
    TransferEngine(LocalCache &cache, EventDispatcher &events, const TransferConfig &config);
    ~TransferEngine();

    TransferEngine(const TransferEngine &) = delete;
    TransferEngine &operator=(const TransferEngine &) = delete;

    // Enqueues and returns immediately
    TransferJobInfo submit(TransferRequest request);

    // Registers a job that is already terminal (served from the cache, or
    // rejected before it could start)
    TransferJobInfo addFinishedJob(TransferJobInfo info);

    // False when the job is unknown or already terminal
    bool cancel(JobId id);

    std::optional<ProgressSubscription> subscribe(JobId id);

    // Blocks until the job is terminal
    std::optional<TransferJobInfo> wait(JobId id);

    // Only the most recent config.job_history finished jobs stay queryable

    std::optional<TransferJobInfo> jobInfo(JobId id) const;
    std::vector<TransferJobInfo> jobs() const;

    void shutdown();

    size_t getPendingCount() const;
    size_t getActiveCount() const;
    size_t workerCount() const
    {
        return worker_threads.size();
    }

    private:
    void workerThread();
    void processJob(const std::shared_ptr<TransferJob> &job);
    VaultStatus runDownload(TransferJob &job);
    VaultStatus runUpload(TransferJob &job);

    void setRunning(TransferJob &job);
    // False once cancellation was requested; no progress is recorded after that
    bool reportProgress(TransferJob &job, uint64_t bytes_done);
    void setBytesTotal(TransferJob &job, uint64_t bytes_total);
    void finishJob(TransferJob &job, TransferState state, std::optional<VaultStatus> error);
    void publishProgress(TransferJob &job, const TransferJobInfo &info, uint64_t version);
    void retireJob(JobId id);

    std::shared_ptr<TransferJob> findJob(JobId id) const;

    LocalCache &cache;
    EventDispatcher &events;
    TransferConfig config;
    size_t buffer_size;

    std::vector<std::thread> worker_threads{};
    std::deque<std::shared_ptr<TransferJob>> job_queue;
    std::unordered_map<JobId, std::shared_ptr<TransferJob>> jobs_by_id;
    std::deque<JobId> finished_ids;

    mutable std::mutex queue_mutex{};
    std::condition_variable queue_condition{};
    std::atomic<bool> shutdown_requested{};
    std::atomic<JobId> next_job_id{ 1 };

    std::atomic<size_t> pending_count{};
    std::atomic<size_t> active_count{};
};

} // namespace SigVault
