#include <sig-vault/transfer_engine.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/metrics_collector.hpp>
#include <sig-vault/string_utils.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace SigVault
{

struct TransferJob
{
    TransferJobInfo info; // Guarded by mutex
    TransferRequest request; // Owned by the worker once the job runs

    std::mutex mutex;
    std::condition_variable changed;
    uint64_t version = 1;

    // Events for one job are delivered one at a time and in version order.
    // Recursive so a listener may cancel the job it is being told about.
    std::recursive_mutex publish_mutex;
    uint64_t published_version = 0;

    std::atomic<bool> cancel_requested{ false };
};

const char *transferStateToString(TransferState state)
{
    switch (state)
    {
    case TransferState::QUEUED:
        return "QUEUED";
    case TransferState::RUNNING:
        return "RUNNING";
    case TransferState::SUCCEEDED:
        return "SUCCEEDED";
    case TransferState::FAILED:
        return "FAILED";
    case TransferState::CANCELLED:
        return "CANCELLED";
    }
    return "UNKNOWN";
}

const char *transferDirectionToString(TransferDirection direction)
{
    return direction == TransferDirection::UPLOAD ? "upload" : "download";
}

namespace
{
// Keeps the upload source from being evicted while it is read
class PinGuard
{
    public:
    PinGuard(LocalCache &cache, std::string path) : cache(cache), path(std::move(path))
    {
        this->cache.pin(this->path);
    }

    ~PinGuard()
    {
        cache.unpin(path);
    }

    PinGuard(const PinGuard &) = delete;
    PinGuard &operator=(const PinGuard &) = delete;

    private:
    LocalCache &cache;
    std::string path;
};

void removeQuietly(const std::string &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        Logger::warn(LogCategory::TRANSFER, "Could not remove {}: {}", path, ec.message());
    }
}
} // namespace

ProgressSubscription::ProgressSubscription(std::shared_ptr<TransferJob> job) : job(std::move(job))
{
}

std::optional<ProgressSnapshot> ProgressSubscription::next()
{
    if (finished)
    {
        return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(job->mutex);
    job->changed.wait(lock,
                      [this]
                      {
                          return job->version > seen_version;
                      });
    seen_version = job->version;

    ProgressSnapshot snapshot;
    snapshot.job_id = job->info.id;
    snapshot.bytes_done = job->info.bytes_done;
    snapshot.bytes_total = job->info.bytes_total;
    snapshot.state = job->info.state;

    if (isTerminal(snapshot.state))
    {
        finished = true;
    }
    return snapshot;
}

TransferJobInfo ProgressSubscription::info() const
{
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->info;
}

TransferEngine::TransferEngine(LocalCache &cache, EventDispatcher &events, const TransferConfig &config)
: cache(cache), events(events), config(config), buffer_size(std::max<size_t>(1, config.buffer_size_kb) * 1024),
  shutdown_requested(false), pending_count(0), active_count(0)
{
    size_t thread_count = std::max<size_t>(1, config.max_concurrent_transfers);
    for (size_t i = 0; i < thread_count; ++i)
    {
        worker_threads.emplace_back(&TransferEngine::workerThread, this);
    }
    Logger::debug(LogCategory::TRANSFER, "Transfer engine started with {} worker(s)", thread_count);
}

TransferEngine::~TransferEngine()
{
    shutdown();
}

TransferJobInfo TransferEngine::submit(TransferRequest request)
{
    if (!request.adapter)
    {
        TransferJobInfo rejected;
        rejected.direction = request.direction;
        rejected.remote_ref = request.remote_ref;
        rejected.local_path = request.local_path;
        rejected.state = TransferState::FAILED;
        rejected.error = VaultStatus{ StatusCode::INVALID_ARGUMENT, "no backend adapter for transfer" };
        return addFinishedJob(std::move(rejected));
    }

    auto job = std::make_shared<TransferJob>();
    TransferJobInfo &info = job->info;
    info.id = next_job_id++;
    info.direction = request.direction;
    info.backend_id = request.adapter->backend().qualifiedId();
    info.remote_ref = request.remote_ref;
    info.local_path =
    request.direction == TransferDirection::DOWNLOAD ? cache.allocateLocalPath(request.remote_ref) : request.local_path;
    info.bytes_total = request.bytes_total;
    info.state = TransferState::QUEUED;
    job->request = std::move(request);

    TransferJobInfo snapshot = info;
    const uint64_t queued_version = job->version;
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        jobs_by_id[snapshot.id] = job;

        if (shutdown_requested)
        {
            rejected = true;
        }
        else
        {
            job_queue.push_back(job);
            pending_count++;

            GlobalMetrics::instance().recordTransferSubmitted(snapshot.direction);
            GlobalMetrics::instance().updatePendingTransfers(pending_count.load());
            queue_condition.notify_one();
        }
    }

    if (rejected)
    {
        Logger::warn(LogCategory::TRANSFER, "Job {} submitted during shutdown, cancelling", snapshot.id);
        finishJob(*job, TransferState::CANCELLED, std::nullopt);
        std::lock_guard<std::mutex> lock(job->mutex);
        return job->info;
    }

    Logger::info(LogCategory::TRANSFER, "Queued {} job {} for {}", transferDirectionToString(snapshot.direction),
                 snapshot.id, snapshot.remote_ref.path);
    // A worker may already have moved the job on; the stale QUEUED event is then dropped
    publishProgress(*job, snapshot, queued_version);
    return snapshot;
}

TransferJobInfo TransferEngine::addFinishedJob(TransferJobInfo info)
{
    info.id = next_job_id++;
    if (info.state != TransferState::FAILED)
    {
        info.error.reset();
    }

    auto job = std::make_shared<TransferJob>();
    job->info = info;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        jobs_by_id[info.id] = job;
    }

    publishProgress(*job, info, job->version);
    retireJob(info.id);
    return info;
}

bool TransferEngine::cancel(JobId id)
{
    std::shared_ptr<TransferJob> job;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        auto it = jobs_by_id.find(id);
        if (it == jobs_by_id.end())
        {
            return false;
        }
        job = it->second;

        TransferState state;
        {
            std::lock_guard<std::mutex> job_lock(job->mutex);
            state = job->info.state;
        }

        if (state == TransferState::RUNNING)
        {
            job->cancel_requested.store(true);
            Logger::info(LogCategory::TRANSFER, "Cancellation requested for running job {}", id);
            return true;
        }
        if (state != TransferState::QUEUED)
        {
            return false;
        }

        // Still queued: it never starts
        auto queued = std::find(job_queue.begin(), job_queue.end(), job);
        if (queued != job_queue.end())
        {
            job_queue.erase(queued);
            pending_count--;
            GlobalMetrics::instance().updatePendingTransfers(pending_count.load());
        }
    }

    Logger::info(LogCategory::TRANSFER, "Cancelled queued job {}", id);
    finishJob(*job, TransferState::CANCELLED, std::nullopt);
    return true;
}

std::optional<ProgressSubscription> TransferEngine::subscribe(JobId id)
{
    auto job = findJob(id);
    if (!job)
    {
        return std::nullopt;
    }
    return ProgressSubscription(job);
}

std::optional<TransferJobInfo> TransferEngine::wait(JobId id)
{
    auto job = findJob(id);
    if (!job)
    {
        return std::nullopt;
    }

    // Holds the job itself, so retiring it meanwhile does not matter
    std::unique_lock<std::mutex> lock(job->mutex);
    job->changed.wait(lock,
                      [&job]
                      {
                          return isTerminal(job->info.state);
                      });
    return job->info;
}

std::optional<TransferJobInfo> TransferEngine::jobInfo(JobId id) const
{
    auto job = findJob(id);
    if (!job)
    {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(job->mutex);
    return job->info;
}

std::vector<TransferJobInfo> TransferEngine::jobs() const
{
    std::vector<std::shared_ptr<TransferJob>> all;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        all.reserve(jobs_by_id.size());
        for (const auto &[id, job] : jobs_by_id)
        {
            all.push_back(job);
        }
    }

    std::vector<TransferJobInfo> result;
    result.reserve(all.size());
    for (const auto &job : all)
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        result.push_back(job->info);
    }
    std::sort(result.begin(), result.end(),
              [](const TransferJobInfo &lhs, const TransferJobInfo &rhs)
              {
                  return lhs.id < rhs.id;
              });
    return result;
}

std::shared_ptr<TransferJob> TransferEngine::findJob(JobId id) const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    auto it = jobs_by_id.find(id);
    return it == jobs_by_id.end() ? nullptr : it->second;
}

void TransferEngine::shutdown()
{
    std::deque<std::shared_ptr<TransferJob>> abandoned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        shutdown_requested = true;
        abandoned.swap(job_queue);
        pending_count = 0;

        // Running jobs stop at their next buffer boundary
        for (const auto &[id, job] : jobs_by_id)
        {
            job->cancel_requested.store(true);
        }
    }

    queue_condition.notify_all();

    for (auto &thread : worker_threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }

    worker_threads.clear();

    for (const auto &job : abandoned)
    {
        finishJob(*job, TransferState::CANCELLED, std::nullopt);
    }
}

size_t TransferEngine::getPendingCount() const
{
    return pending_count.load();
}

size_t TransferEngine::getActiveCount() const
{
    return active_count.load();
}

void TransferEngine::workerThread()
{
    while (!shutdown_requested)
    {
        std::shared_ptr<TransferJob> job;
        std::optional<TransferJobInfo> started;
        uint64_t started_version = 0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_condition.wait(lock,
                                 [this]
                                 {
                                     return !job_queue.empty() || shutdown_requested;
                                 });

            if (shutdown_requested)
            {
                break;
            }

            job = job_queue.front();
            job_queue.pop_front();
            pending_count--;
            active_count++;

            // The state flips under the queue lock so cancel() never sees a
            // dequeued job as QUEUED
            {
                std::lock_guard<std::mutex> job_lock(job->mutex);
                job->info.state = TransferState::RUNNING;
                job->version++;
                job->changed.notify_all();
                started = job->info;
                started_version = job->version;
            }

            GlobalMetrics::instance().updatePendingTransfers(pending_count.load());
            GlobalMetrics::instance().updateActiveTransfers(active_count.load());
        }

        publishProgress(*job, *started, started_version);
        processJob(job);
        active_count--;

        GlobalMetrics::instance().updateActiveTransfers(active_count.load());
    }
}

void TransferEngine::processJob(const std::shared_ptr<TransferJob> &job)
{
    auto start_time = std::chrono::steady_clock::now();
    const TransferDirection direction = job->request.direction;
    const JobId id = job->info.id;

    Logger::debug(LogCategory::TRANSFER, "Job {} running", id);

    VaultStatus status;
    if (job->cancel_requested.load())
    {
        status = { StatusCode::CANCELLED, "cancelled before start" };
    }
    else
    {
        try
        {
            status = direction == TransferDirection::DOWNLOAD ? runDownload(*job) : runUpload(*job);
        }
        catch (const std::exception &e)
        {
            status = { StatusCode::IO_ERROR, std::string("unexpected failure: ") + e.what() };
        }
    }

    auto duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();

    if (isSuccess(status))
    {
        finishJob(*job, TransferState::SUCCEEDED, std::nullopt);
        GlobalMetrics::instance().recordTransferCompleted(direction, duration);
        Logger::info(LogCategory::TRANSFER, "Job {} succeeded in {:.2f}s", id, duration);
    }
    else if (status.code == StatusCode::CANCELLED)
    {
        finishJob(*job, TransferState::CANCELLED, std::nullopt);
        GlobalMetrics::instance().recordTransferCancelled();
        Logger::info(LogCategory::TRANSFER, "Job {} cancelled", id);
    }
    else
    {
        GlobalMetrics::instance().recordTransferFailed(direction, status.code);
        Logger::error(LogCategory::TRANSFER, "Job {} failed: {}", id, describeStatus(status));
        finishJob(*job, TransferState::FAILED, status);
    }
}

VaultStatus TransferEngine::runDownload(TransferJob &job)
{
    TransferRequest &request = job.request;
    BackendAdapter &adapter = *request.adapter;

    if (!request.remote_modified_at || !request.bytes_total)
    {
        Entry entry;
        VaultStatus status = adapter.statEntry(request.remote_ref, entry);
        if (!isSuccess(status))
        {
            return status;
        }
        if (entry.isDirectory())
        {
            return { StatusCode::NOT_FOUND, request.remote_ref.path + " is a directory" };
        }
        if (!request.remote_modified_at)
        {
            request.remote_modified_at = entry.modified_at;
        }
        if (!request.bytes_total)
        {
            request.bytes_total = entry.size;
        }
    }

    std::unique_ptr<ByteStream> stream;
    VaultStatus status = adapter.openForRead(request.remote_ref, stream);
    if (!isSuccess(status))
    {
        return status;
    }

    std::optional<uint64_t> bytes_total = stream->size() ? stream->size() : request.bytes_total;
    if (bytes_total)
    {
        setBytesTotal(job, *bytes_total);
    }

    std::string local_path;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        local_path = job.info.local_path;
    }
    const std::string part_path = local_path + ".part";

    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        stream->close();
        return { StatusCode::IO_ERROR, "cannot create " + part_path };
    }

    std::vector<uint8_t> buffer(buffer_size);
    uint64_t bytes_done = 0;

    while (true)
    {
        if (job.cancel_requested.load())
        {
            status = { StatusCode::CANCELLED, "cancelled" };
            break;
        }

        size_t bytes_read = 0;
        status = stream->read(buffer.data(), buffer.size(), bytes_read);
        if (!isSuccess(status) || bytes_read == 0)
        {
            break;
        }

        if (bytes_total && bytes_done + bytes_read > *bytes_total)
        {
            status = { StatusCode::CONNECTION_ERROR,
                       fmt::format("{} sent more than the announced {} bytes", request.remote_ref.path, *bytes_total) };
            break;
        }

        out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(bytes_read));
        if (!out)
        {
            status = { StatusCode::IO_ERROR, "write to " + part_path + " failed" };
            break;
        }

        bytes_done += bytes_read;
        if (!reportProgress(job, bytes_done))
        {
            status = { StatusCode::CANCELLED, "cancelled" };
            break;
        }
    }

    stream->close();
    out.close();

    if (isSuccess(status) && out.fail())
    {
        status = { StatusCode::IO_ERROR, "could not finish writing " + part_path };
    }
    if (isSuccess(status) && bytes_total && bytes_done != *bytes_total)
    {
        status = { StatusCode::CONNECTION_ERROR, fmt::format("{} ended after {} of {} bytes", request.remote_ref.path,
                                                             bytes_done, *bytes_total) };
    }

    if (!isSuccess(status))
    {
        // A truncated file must never be seen by the cache
        removeQuietly(part_path);
        return status;
    }

    std::error_code ec;
    std::filesystem::rename(part_path, local_path, ec);
    if (ec)
    {
        removeQuietly(part_path);
        return { StatusCode::IO_ERROR, "cannot move download into place: " + ec.message() };
    }

    status = cache.recordCompletedDownload(request.remote_ref, local_path, { bytes_done, request.remote_modified_at });
    if (status.code == StatusCode::IO_ERROR)
    {
        // The record is live; only writing the index failed
        Logger::warn(LogCategory::TRANSFER, "Job {}: {}", job.info.id, status.message);
    }
    else if (!isSuccess(status))
    {
        removeQuietly(local_path);
        return status;
    }

    Logger::debug(LogCategory::TRANSFER, "Downloaded {} ({}) to {}", request.remote_ref.path,
                  StringUtils::formatSize(bytes_done), local_path);
    return VaultStatus::success();
}

VaultStatus TransferEngine::runUpload(TransferJob &job)
{
    TransferRequest &request = job.request;
    BackendAdapter &adapter = *request.adapter;
    const std::string &local_path = request.local_path;

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(local_path, ec);
    if (ec)
    {
        return { StatusCode::NOT_FOUND, "cannot read " + local_path + ": " + ec.message() };
    }
    setBytesTotal(job, size);

    std::ifstream in(local_path, std::ios::binary);
    if (!in.is_open())
    {
        return { StatusCode::IO_ERROR, "cannot open " + local_path };
    }

    PinGuard pin(cache, local_path);

    std::unique_ptr<ByteSink> sink;
    VaultStatus status = adapter.openForWrite(request.remote_ref.path, size, sink);
    if (!isSuccess(status))
    {
        return status;
    }

    std::vector<uint8_t> buffer(buffer_size);
    uint64_t bytes_done = 0;

    while (true)
    {
        if (job.cancel_requested.load())
        {
            sink->abort();
            return { StatusCode::CANCELLED, "cancelled" };
        }

        in.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        size_t bytes_read = static_cast<size_t>(in.gcount());
        if (bytes_read == 0)
        {
            if (in.bad())
            {
                sink->abort();
                return { StatusCode::IO_ERROR, "read from " + local_path + " failed" };
            }
            break;
        }

        if (bytes_done + bytes_read > size)
        {
            sink->abort();
            return { StatusCode::IO_ERROR, local_path + " grew during the upload" };
        }

        status = sink->write(buffer.data(), bytes_read);
        if (!isSuccess(status))
        {
            sink->abort();
            return status;
        }

        bytes_done += bytes_read;
        if (!reportProgress(job, bytes_done))
        {
            sink->abort();
            return { StatusCode::CANCELLED, "cancelled" };
        }
    }

    if (bytes_done != size)
    {
        sink->abort();
        return { StatusCode::IO_ERROR, fmt::format("{} shrank during the upload ({} of {} bytes)", local_path,
                                                   bytes_done, size) };
    }

    status = sink->close();
    if (!isSuccess(status))
    {
        return status;
    }

    // Any cached copy of the destination predates this upload
    cache.invalidate(request.remote_ref);

    Logger::debug(LogCategory::TRANSFER, "Uploaded {} ({}) to {}", local_path, StringUtils::formatSize(bytes_done),
                  request.remote_ref.path);
    return VaultStatus::success();
}

bool TransferEngine::reportProgress(TransferJob &job, uint64_t bytes_done)
{
    if (job.cancel_requested.load())
    {
        return false;
    }

    TransferJobInfo snapshot;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        job.info.bytes_done = std::max(job.info.bytes_done, bytes_done);
        job.version++;
        job.changed.notify_all();
        snapshot = job.info;
        version = job.version;
    }

    publishProgress(job, snapshot, version);
    return true;
}

void TransferEngine::setBytesTotal(TransferJob &job, uint64_t bytes_total)
{
    std::lock_guard<std::mutex> lock(job.mutex);
    job.info.bytes_total = bytes_total;
    job.version++;
    job.changed.notify_all();
}

void TransferEngine::finishJob(TransferJob &job, TransferState state, std::optional<VaultStatus> error)
{
    TransferJobInfo snapshot;
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(job.mutex);
        if (isTerminal(job.info.state))
        {
            return;
        }
        job.info.state = state;
        job.info.error = state == TransferState::FAILED ? error : std::nullopt;
        job.version++;
        job.changed.notify_all();
        snapshot = job.info;
        version = job.version;
    }

    // Every caller is the only user of the request at this point
    job.request.adapter.reset();

    publishProgress(job, snapshot, version);
    retireJob(snapshot.id);
}

void TransferEngine::publishProgress(TransferJob &job, const TransferJobInfo &info, uint64_t version)
{
    std::lock_guard<std::recursive_mutex> lock(job.publish_mutex);
    if (version <= job.published_version)
    {
        return;
    }
    job.published_version = version;

    VaultEvent event;
    event.type = EventType::TRANSFER_PROGRESS;
    event.job_id = info.id;
    event.bytes_done = info.bytes_done;
    event.bytes_total = info.bytes_total;
    event.state = info.state;
    events.publish(event);

    if (info.state == TransferState::FAILED && info.error)
    {
        VaultEvent failed;
        failed.type = EventType::TRANSFER_FAILED;
        failed.job_id = info.id;
        failed.error_kind = info.error->code;
        failed.message = info.error->message;
        events.publish(failed);
    }
}

void TransferEngine::retireJob(JobId id)
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    finished_ids.push_back(id);
    while (finished_ids.size() > std::max<size_t>(1, config.job_history))
    {
        // Subscriptions and waiters hold the job, not the table entry
        jobs_by_id.erase(finished_ids.front());
        finished_ids.pop_front();
    }
}

} // namespace SigVault
