#include <sig-vault/cloud_adapter.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/metrics_collector.hpp>
#include <sig-vault/path_model.hpp>
#include <sig-vault/string_utils.hpp>
#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <curl/curl.h>
#include <deque>
#include <thread>

namespace SigVault
{

struct CloudSession
{
    CloudSession();
    ~CloudSession();

    CloudSession(const CloudSession &) = delete;
    CloudSession &operator=(const CloudSession &) = delete;

    std::array<std::mutex, static_cast<size_t>(CURL_LOCK_DATA_LAST)> locks{};
    CURLSH *share = nullptr;
    std::atomic<bool> valid{ true };

    void invalidate()
    {
        valid.store(false);
    }
};

namespace
{
constexpr size_t PIPE_DEPTH = 8;

void ensureCurlInitialized()
{
    static std::once_flag init_once;
    std::call_once(init_once,
                   []
                   {
                       CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
                       if (rc != CURLE_OK)
                       {
                           Logger::error(LogCategory::CLOUD, "curl_global_init failed: {}", curl_easy_strerror(rc));
                       }
                   });
}

void shareLock(CURL *, curl_lock_data data, curl_lock_access, void *userptr)
{
    auto *session = static_cast<CloudSession *>(userptr);
    size_t index = static_cast<size_t>(data);
    if (session && index < session->locks.size())
    {
        session->locks[index].lock();
    }
}

void shareUnlock(CURL *, curl_lock_data data, void *userptr)
{
    auto *session = static_cast<CloudSession *>(userptr);
    size_t index = static_cast<size_t>(data);
    if (session && index < session->locks.size())
    {
        session->locks[index].unlock();
    }
}

struct CurlEasyDeleter
{
    void operator()(CURL *handle) const
    {
        curl_easy_cleanup(handle);
    }
};

struct CurlListDeleter
{
    void operator()(curl_slist *list) const
    {
        curl_slist_free_all(list);
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlListDeleter>;

VaultStatus statusFromCurl(CURLcode code, const std::string &context)
{
    // Every transport level failure is a connection problem for the caller;
    // the libcurl message keeps the detail.
    return { StatusCode::CONNECTION_ERROR, context + ": " + curl_easy_strerror(code) };
}

// Bounded hand-over queue between the thread running curl_easy_perform and
// the caller's stream or sink
class ChunkPipe
{
    public:
    // Blocks while full. False once cancelled.
    bool push(std::string chunk)
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock,
                [this]
                {
                    return chunks.size() < PIPE_DEPTH || cancelled;
                });
        if (cancelled)
        {
            return false;
        }
        chunks.push_back(std::move(chunk));
        cv.notify_all();
        return true;
    }

    // Blocks while empty. False at the end of data or once cancelled.
    bool pop(std::string &chunk)
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock,
                [this]
                {
                    return !chunks.empty() || finished || cancelled;
                });
        if (cancelled || chunks.empty())
        {
            return false;
        }
        chunk = std::move(chunks.front());
        chunks.pop_front();
        cv.notify_all();
        return true;
    }

    void finish()
    {
        std::lock_guard<std::mutex> lock(mutex);
        finished = true;
        cv.notify_all();
    }

    void cancel()
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
        chunks.clear();
        cv.notify_all();
    }

    bool isCancelled()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return cancelled;
    }

    private:
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> chunks;
    bool finished = false;
    bool cancelled = false;
};

struct HandleOptions
{
    const BackendConfig &backend;
    const TransferConfig &transfers;
    CloudSession &session;
};

VaultStatus prepareHandle(const HandleOptions &options, const std::string &url, CurlHandle &handle, CurlHeaders &headers)
{
    handle.reset(curl_easy_init());
    if (!handle)
    {
        return { StatusCode::CONNECTION_ERROR, "curl_easy_init failed" };
    }

    CURL *curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (options.session.share)
    {
        curl_easy_setopt(curl, CURLOPT_SHARE, options.session.share);
    }
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.transfers.connect_timeout_ms));

    // A read or write that makes no progress for the configured time aborts
    long low_speed_seconds = std::max<long>(1L, static_cast<long>(options.transfers.read_write_timeout_ms / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, low_speed_seconds);

    if (!options.backend.cloud.verify_tls)
    {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    const Credentials &credentials = options.backend.credentials;
    curl_slist *list = nullptr;
    if (!credentials.token.empty())
    {
        list = curl_slist_append(list, ("Authorization: Bearer " + credentials.token).c_str());
    }
    else if (!credentials.username.empty())
    {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl, CURLOPT_USERNAME, credentials.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, credentials.password.c_str());
    }
    headers.reset(list);

    return VaultStatus::success();
}

void applyHeaders(CURL *curl, CurlHeaders &headers, std::initializer_list<const char *> extra)
{
    curl_slist *list = headers.release();
    for (const char *header : extra)
    {
        list = curl_slist_append(list, header);
    }
    headers.reset(list);
    if (list)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    }
}

size_t collectBody(char *data, size_t size, size_t count, void *userdata)
{
    static_cast<std::string *>(userdata)->append(data, size * count);
    return size * count;
}

class CloudReadStream : public ByteStream
{
    public:
    CloudReadStream(CurlHandle handle, CurlHeaders headers, std::string path, std::shared_ptr<CloudSession> session)
    : handle(std::move(handle)), headers(std::move(headers)), path(std::move(path)), session(std::move(session))
    {
    }

    ~CloudReadStream() override
    {
        close();
    }

    // Starts the transfer and waits until the response headers have arrived
    // or the request has failed
    VaultStatus start()
    {
        curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &CloudReadStream::onBody);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, this);

        producer = std::thread(&CloudReadStream::run, this);

        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock,
                [this]
                {
                    return started;
                });

        if (done && !isSuccess(result))
        {
            return result;
        }
        return VaultStatus::success();
    }

    VaultStatus read(uint8_t *buffer, size_t capacity, size_t &bytes_read) override
    {
        bytes_read = 0;
        if (closed)
        {
            return { StatusCode::CONNECTION_ERROR, "stream already closed: " + path };
        }

        while (offset == current.size())
        {
            offset = 0;
            current.clear();
            if (!pipe.pop(current))
            {
                std::lock_guard<std::mutex> lock(mutex);
                return result;
            }
        }

        bytes_read = std::min(capacity, current.size() - offset);
        std::memcpy(buffer, current.data() + offset, bytes_read);
        offset += bytes_read;
        return VaultStatus::success();
    }

    void close() override
    {
        if (closed)
        {
            return;
        }
        closed = true;
        pipe.cancel();
        if (producer.joinable())
        {
            producer.join();
        }
    }

    std::optional<uint64_t> size() const override
    {
        std::lock_guard<std::mutex> lock(mutex);
        return content_length;
    }

    private:
    static size_t onBody(char *data, size_t size, size_t count, void *userdata)
    {
        auto *self = static_cast<CloudReadStream *>(userdata);
        self->markStarted();
        return self->pipe.push(std::string(data, size * count)) ? size * count : 0;
    }

    void markStarted()
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (started)
        {
            return;
        }
        curl_off_t length = -1;
        if (curl_easy_getinfo(handle.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0)
        {
            content_length = static_cast<uint64_t>(length);
        }
        started = true;
        cv.notify_all();
    }

    void run()
    {
        CURLcode rc = curl_easy_perform(handle.get());

        VaultStatus status = VaultStatus::success();
        if (rc == CURLE_HTTP_RETURNED_ERROR)
        {
            long http_code = 0;
            curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_code);
            status = CloudAdapter::statusFromHttp(http_code, "GET " + path);
        }
        else if (rc == CURLE_WRITE_ERROR && pipe.isCancelled())
        {
            status = { StatusCode::CANCELLED, "read of " + path + " closed early" };
        }
        else if (rc != CURLE_OK)
        {
            status = statusFromCurl(rc, "GET " + path);
        }

        if (status.code == StatusCode::CONNECTION_ERROR)
        {
            session->invalidate();
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            result = status;
            done = true;
            if (!started && rc == CURLE_OK)
            {
                // Empty body: no write callback ever ran
                content_length = 0;
            }
            started = true;
            cv.notify_all();
        }
        pipe.finish();
    }

    CurlHandle handle;
    CurlHeaders headers;
    std::string path;
    std::shared_ptr<CloudSession> session;

    ChunkPipe pipe;
    std::thread producer;
    std::string current;
    size_t offset = 0;
    bool closed = false;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool started = false;
    bool done = false;
    std::optional<uint64_t> content_length;
    VaultStatus result;
};

class CloudWriteSink : public ByteSink
{
    public:
    CloudWriteSink(CurlHandle handle, CurlHeaders headers, std::string path, std::shared_ptr<CloudSession> session)
    : handle(std::move(handle)), headers(std::move(headers)), path(std::move(path)), session(std::move(session))
    {
    }

    ~CloudWriteSink() override
    {
        abort();
    }

    void start(std::optional<uint64_t> expected_size)
    {
        curl_easy_setopt(handle.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_READFUNCTION, &CloudWriteSink::onRead);
        curl_easy_setopt(handle.get(), CURLOPT_READDATA, this);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, collectBody);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response_body);
        if (expected_size)
        {
            curl_easy_setopt(handle.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*expected_size));
        }

        producer = std::thread(&CloudWriteSink::run, this);
    }

    VaultStatus write(const uint8_t *data, size_t length) override
    {
        if (finished)
        {
            return { StatusCode::CONNECTION_ERROR, "sink already closed: " + path };
        }
        if (length == 0)
        {
            return VaultStatus::success();
        }

        if (!pipe.push(std::string(reinterpret_cast<const char *>(data), length)))
        {
            // The request ended before the body was fully sent
            join();
            finished = true;
            if (isSuccess(result))
            {
                return { StatusCode::CONNECTION_ERROR, "server ended the upload of " + path + " early" };
            }
            return result;
        }
        return VaultStatus::success();
    }

    VaultStatus close() override
    {
        if (finished)
        {
            return { StatusCode::CONNECTION_ERROR, "sink already closed: " + path };
        }
        finished = true;
        pipe.finish();
        join();
        return result;
    }

    void abort() override
    {
        if (finished)
        {
            return;
        }
        finished = true;
        aborted.store(true);
        pipe.cancel();
        join();
    }

    private:
    static size_t onRead(char *buffer, size_t size, size_t count, void *userdata)
    {
        auto *self = static_cast<CloudWriteSink *>(userdata);
        size_t capacity = size * count;

        while (self->offset == self->current.size())
        {
            self->offset = 0;
            self->current.clear();
            if (!self->pipe.pop(self->current))
            {
                return self->aborted.load() ? CURL_READFUNC_ABORT : 0;
            }
        }

        size_t n = std::min(capacity, self->current.size() - self->offset);
        std::memcpy(buffer, self->current.data() + self->offset, n);
        self->offset += n;
        return n;
    }

    void run()
    {
        CURLcode rc = curl_easy_perform(handle.get());
        long http_code = 0;
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_code);

        VaultStatus status = VaultStatus::success();
        if (rc == CURLE_ABORTED_BY_CALLBACK && aborted.load())
        {
            status = { StatusCode::CANCELLED, "upload of " + path + " aborted" };
        }
        else if (rc != CURLE_OK)
        {
            status = statusFromCurl(rc, "PUT " + path);
        }
        else if (http_code < 200 || http_code >= 300)
        {
            status = CloudAdapter::statusFromHttp(http_code, "PUT " + path, true);
        }

        if (status.code == StatusCode::CONNECTION_ERROR)
        {
            session->invalidate();
        }
        result = status;

        // Unblocks a writer waiting on a full pipe
        pipe.cancel();
    }

    void join()
    {
        if (producer.joinable())
        {
            producer.join();
        }
    }

    CurlHandle handle;
    CurlHeaders headers;
    std::string path;
    std::shared_ptr<CloudSession> session;

    ChunkPipe pipe;
    std::thread producer;
    std::string current;
    size_t offset = 0;
    std::string response_body;
    std::atomic<bool> aborted{ false };
    bool finished = false;
    VaultStatus result; // Written by the producer, read after join()
};
} // namespace

CloudSession::CloudSession()
{
    ensureCurlInitialized();
    share = curl_share_init();
    if (!share)
    {
        Logger::warn(LogCategory::CLOUD, "curl_share_init failed, requests will not reuse connections");
        return;
    }
    curl_share_setopt(share, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share, CURLSHOPT_LOCKFUNC, shareLock);
    curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, shareUnlock);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
}

CloudSession::~CloudSession()
{
    if (share)
    {
        curl_share_cleanup(share);
    }
}

CloudAdapter::CloudAdapter(const BackendConfig &backend, const TransferConfig &transfers)
: backend_config(backend), transfers(transfers)
{
    if (backend_config.cloud.base_url.empty() || backend_config.cloud.base_url.back() != '/')
    {
        backend_config.cloud.base_url += '/';
    }
    root_path = WebDavParser::hrefPath(backend_config.cloud.base_url);
}

CloudAdapter::~CloudAdapter() = default;

std::shared_ptr<CloudSession> CloudAdapter::currentSession()
{
    std::lock_guard<std::mutex> lock(session_mutex);
    if (!session || !session->valid.load())
    {
        session = std::make_shared<CloudSession>();
        Logger::debug(LogCategory::CLOUD, "New session for {}", backend_config.cloud.base_url);
    }
    return session;
}

void CloudAdapter::invalidateSession()
{
    std::lock_guard<std::mutex> lock(session_mutex);
    if (session)
    {
        session->invalidate();
        Logger::info(LogCategory::CLOUD, "Session to {} invalidated", backend_config.cloud.base_url);
    }
}

std::string CloudAdapter::urlFor(const std::string &path, bool collection) const
{
    std::string canonical = PathModel::canonicalPath(path, BackendKind::CLOUD);
    std::string url = backend_config.cloud.base_url + StringUtils::urlEncodePath(canonical);
    if (collection && !canonical.empty())
    {
        url += '/';
    }
    return url;
}

VaultStatus CloudAdapter::statusFromHttp(long http_code, const std::string &context, bool upload)
{
    std::string message = fmt::format("{}: HTTP {}", context, http_code);

    switch (http_code)
    {
    case 401:
    case 403:
        return { StatusCode::PERMISSION_DENIED, message };
    case 404:
    case 410:
        return { StatusCode::NOT_FOUND, message };
    case 409:
        if (upload)
        {
            return { StatusCode::NOT_FOUND, message + " (parent collection missing)" };
        }
        return { StatusCode::CONNECTION_ERROR, message };
    case 413:
    case 507:
        return { StatusCode::QUOTA_EXCEEDED, message };
    default:
        if (http_code >= 200 && http_code < 300)
        {
            return VaultStatus::success();
        }
        return { StatusCode::CONNECTION_ERROR, message };
    }
}

VaultStatus CloudAdapter::record(const char *operation, VaultStatus status)
{
    if (status.code == StatusCode::CONNECTION_ERROR)
    {
        Logger::warn(LogCategory::CLOUD, "{} failed: {}", operation, status.message);
        invalidateSession();
    }
    GlobalMetrics::instance().recordBackendOperation(BackendKind::CLOUD, operation, status.code);
    return status;
}

VaultStatus CloudAdapter::propfind(const std::string &path,
                                   bool collection,
                                   int depth,
                                   std::vector<DavResource> &resources,
                                   const char *request_body)
{
    auto active = currentSession();
    std::string url = urlFor(path, collection);

    CurlHandle handle;
    CurlHeaders headers;
    VaultStatus status = prepareHandle({ backend_config, transfers, *active }, url, handle, headers);
    if (!isSuccess(status))
    {
        return status;
    }

    std::string depth_header = fmt::format("Depth: {}", depth);
    applyHeaders(handle.get(), headers, { depth_header.c_str(), "Content-Type: application/xml; charset=utf-8" });

    std::string body;
    curl_easy_setopt(handle.get(), CURLOPT_CUSTOMREQUEST, "PROPFIND");
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request_body);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, collectBody);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

    Logger::trace(LogCategory::CLOUD, "PROPFIND {} (Depth {})", url, depth);
    CURLcode rc = curl_easy_perform(handle.get());
    if (rc != CURLE_OK)
    {
        active->invalidate();
        return statusFromCurl(rc, "PROPFIND " + url);
    }

    long http_code = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 207)
    {
        if (http_code >= 200 && http_code < 300)
        {
            return { StatusCode::CONNECTION_ERROR, fmt::format("PROPFIND {}: unexpected HTTP {}", url, http_code) };
        }
        return statusFromHttp(http_code, "PROPFIND " + url);
    }

    return WebDavParser::parseMultistatus(body, root_path, resources);
}

Entry CloudAdapter::entryFromResource(const DavResource &resource) const
{
    Entry entry;
    entry.name = PathModel::baseName(resource.path, BackendKind::CLOUD);
    entry.kind = resource.is_collection ? EntryKind::DIRECTORY : EntryKind::FILE;
    if (!resource.is_collection)
    {
        entry.size = resource.content_length;
        entry.media_type = PathModel::classifyMedia(entry.name);
    }
    entry.modified_at = resource.last_modified;
    entry.remote_ref = makeRef(resource.path);
    return entry;
}

VaultStatus CloudAdapter::listDirectory(const std::string &path, std::vector<Entry> &entries)
{
    entries.clear();
    std::string dir_path = PathModel::canonicalPath(path, BackendKind::CLOUD);

    std::vector<DavResource> resources;
    VaultStatus status = propfind(dir_path, true, 1, resources);
    if (!isSuccess(status))
    {
        return record("list", status);
    }

    for (const auto &resource : resources)
    {
        if (resource.path == dir_path)
        {
            if (!resource.is_collection)
            {
                return record("list", { StatusCode::NOT_FOUND, dir_path + " is not a collection" });
            }
            continue;
        }
        if (PathModel::parentPath(resource.path, BackendKind::CLOUD) != dir_path)
        {
            continue;
        }

        std::string raw_name = PathModel::baseName(resource.path, BackendKind::CLOUD);
        std::string accepted;
        if (!isSuccess(PathModel::normalize(raw_name, BackendKind::CLOUD, accepted)))
        {
            Logger::warn(LogCategory::CLOUD, "Skipping entry with unusable name in /{}: {}", dir_path, raw_name);
            continue;
        }

        Entry entry = entryFromResource(resource);
        entry.name = accepted;
        entries.push_back(std::move(entry));
    }

    PathModel::finalizeListing(entries);
    Logger::debug(LogCategory::CLOUD, "Listed {} entries in /{}", entries.size(), dir_path);
    return record("list", VaultStatus::success());
}

VaultStatus CloudAdapter::statEntry(const RemoteRef &remote_ref, Entry &entry)
{
    std::string path = PathModel::canonicalPath(remote_ref.path, BackendKind::CLOUD);

    std::vector<DavResource> resources;
    VaultStatus status = propfind(path, false, 0, resources);
    if (!isSuccess(status))
    {
        return record("stat", status);
    }

    for (const auto &resource : resources)
    {
        if (resource.path == path)
        {
            entry = entryFromResource(resource);
            return record("stat", VaultStatus::success());
        }
    }

    return record("stat", { StatusCode::NOT_FOUND, "PROPFIND response does not describe /" + path });
}

VaultStatus CloudAdapter::quota(StorageQuota &result)
{
    result = StorageQuota{};

    std::vector<DavResource> resources;
    VaultStatus status = propfind("", true, 0, resources, WebDavParser::quotaRequestBody());
    if (!isSuccess(status))
    {
        return record("quota", status);
    }

    for (const auto &resource : resources)
    {
        if (resource.path.empty())
        {
            result.used_bytes = resource.quota_used_bytes;
            result.available_bytes = resource.quota_available_bytes;
            return record("quota", VaultStatus::success());
        }
    }

    return record("quota", { StatusCode::CONNECTION_ERROR, "PROPFIND response does not describe the files root" });
}

VaultStatus CloudAdapter::openForRead(const RemoteRef &remote_ref, std::unique_ptr<ByteStream> &stream)
{
    auto active = currentSession();
    std::string path = PathModel::canonicalPath(remote_ref.path, BackendKind::CLOUD);

    CurlHandle handle;
    CurlHeaders headers;
    VaultStatus status = prepareHandle({ backend_config, transfers, *active }, urlFor(path, false), handle, headers);
    if (!isSuccess(status))
    {
        return record("open_read", status);
    }
    applyHeaders(handle.get(), headers, {});

    auto reader = std::make_unique<CloudReadStream>(std::move(handle), std::move(headers), path, active);
    status = reader->start();
    if (!isSuccess(status))
    {
        reader->close();
        return record("open_read", status);
    }

    stream = std::move(reader);
    return record("open_read", VaultStatus::success());
}

VaultStatus CloudAdapter::makeCollections(const std::string &parent)
{
    if (parent.empty())
    {
        return VaultStatus::success();
    }

    auto active = currentSession();
    std::string prefix;
    size_t start = 0;

    while (start <= parent.size())
    {
        size_t slash = parent.find('/', start);
        prefix = parent.substr(0, slash);

        CurlHandle handle;
        CurlHeaders headers;
        VaultStatus status = prepareHandle({ backend_config, transfers, *active }, urlFor(prefix, true), handle, headers);
        if (!isSuccess(status))
        {
            return status;
        }
        applyHeaders(handle.get(), headers, {});

        std::string body;
        curl_easy_setopt(handle.get(), CURLOPT_CUSTOMREQUEST, "MKCOL");
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, collectBody);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

        CURLcode rc = curl_easy_perform(handle.get());
        if (rc != CURLE_OK)
        {
            active->invalidate();
            return statusFromCurl(rc, "MKCOL /" + prefix);
        }

        long http_code = 0;
        curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &http_code);
        // 405: the collection already exists
        if (http_code != 201 && http_code != 405)
        {
            return statusFromHttp(http_code, "MKCOL /" + prefix, true);
        }
        if (http_code == 201)
        {
            Logger::debug(LogCategory::CLOUD, "Created collection /{}", prefix);
        }

        if (slash == std::string::npos)
        {
            break;
        }
        start = slash + 1;
    }

    return VaultStatus::success();
}

VaultStatus CloudAdapter::openForWrite(const std::string &path,
                                       std::optional<uint64_t> expected_size,
                                       std::unique_ptr<ByteSink> &sink)
{
    std::string canonical = PathModel::canonicalPath(path, BackendKind::CLOUD);

    std::string name;
    VaultStatus status = PathModel::normalize(PathModel::baseName(canonical, BackendKind::CLOUD), BackendKind::CLOUD, name);
    if (!isSuccess(status))
    {
        return status;
    }

    status = makeCollections(PathModel::parentPath(canonical, BackendKind::CLOUD));
    if (!isSuccess(status))
    {
        return record("open_write", status);
    }

    auto active = currentSession();
    CurlHandle handle;
    CurlHeaders headers;
    status = prepareHandle({ backend_config, transfers, *active }, urlFor(canonical, false), handle, headers);
    if (!isSuccess(status))
    {
        return record("open_write", status);
    }
    // Without Expect the server's rejection (quota, permissions) arrives only
    // after the body was sent
    applyHeaders(handle.get(), headers, { "Expect: 100-continue", "Content-Type: application/octet-stream" });

    auto writer = std::make_unique<CloudWriteSink>(std::move(handle), std::move(headers), canonical, active);
    writer->start(expected_size);

    sink = std::move(writer);
    return record("open_write", VaultStatus::success());
}

} // namespace SigVault
