#include <sig-vault/smb_adapter.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/metrics_collector.hpp>
#include <sig-vault/path_model.hpp>
#include <sig-vault/timed_io.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace SigVault
{

namespace
{
std::chrono::system_clock::time_point modifiedTime(const struct stat &st)
{
    auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
    return std::chrono::system_clock::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

// Outcome of one call made on a TimedIo helper; shared so an abandoned
// call never writes into the caller's stack
struct IoResult
{
    ssize_t bytes = -1;
    int error = 0;
    int fd = -1;
    struct stat st{};
    const char *stage = "";
};

void callHook(const std::function<void(const char *)> &hook, const char *operation)
{
    if (hook)
    {
        hook(operation);
    }
}

void removeTempQuietly(const std::string &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        Logger::warn(LogCategory::SMB, "Could not remove partial upload {}: {}", path, ec.message());
    }
}

VaultStatus timeoutStatus(const char *operation, const std::string &share_path, std::chrono::milliseconds limit)
{
    return { StatusCode::CONNECTION_ERROR,
             fmt::format("{} {} timed out after {} ms", operation, share_path, limit.count()) };
}

class SmbReadStream : public ByteStream
{
    public:
    SmbReadStream(int fd,
                  uint64_t file_size,
                  std::string share_path,
                  std::shared_ptr<SmbSession> session,
                  std::chrono::milliseconds timeout)
    : fd(fd), file_size(file_size), share_path(std::move(share_path)), session(std::move(session)), io(timeout),
      scratch(std::make_shared<std::vector<uint8_t>>())
    {
    }

    ~SmbReadStream() override
    {
        close();
    }

    VaultStatus read(uint8_t *buffer, size_t capacity, size_t &bytes_read) override
    {
        bytes_read = 0;
        if (fd < 0)
        {
            return { StatusCode::CONNECTION_ERROR, "stream already closed: " + share_path };
        }

        if (scratch->size() < capacity)
        {
            scratch->resize(capacity);
        }

        auto result = std::make_shared<IoResult>();
        bool finished = io.run(
        [handle = fd, chunk = scratch, capacity, result, hook = session->io_hook]
        {
            callHook(hook, "read");
            ssize_t n;
            do
            {
                n = ::read(handle, chunk->data(), capacity);
            } while (n < 0 && errno == EINTR);
            result->bytes = n;
            result->error = n < 0 ? errno : 0;
        });

        if (!finished)
        {
            // The helper still owns the descriptor
            io.deferCleanup([handle = fd] { ::close(handle); });
            fd = -1;
            session->invalidate();
            return timeoutStatus("read", share_path, io.timeout());
        }

        if (result->bytes < 0)
        {
            VaultStatus status = SmbAdapter::statusFromErrno(result->error, "read " + share_path);
            if (status.code == StatusCode::CONNECTION_ERROR)
            {
                session->invalidate();
            }
            return status;
        }

        bytes_read = static_cast<size_t>(result->bytes);
        std::memcpy(buffer, scratch->data(), bytes_read);
        return VaultStatus::success();
    }

    void close() override
    {
        if (fd < 0)
        {
            return;
        }
        if (!io.run([handle = fd] { ::close(handle); }))
        {
            Logger::debug(LogCategory::SMB, "Close of {} is still pending", share_path);
        }
        fd = -1;
    }

    std::optional<uint64_t> size() const override
    {
        return file_size;
    }

    private:
    int fd;
    uint64_t file_size;
    std::string share_path;
    std::shared_ptr<SmbSession> session;
    TimedIo io;
    std::shared_ptr<std::vector<uint8_t>> scratch;
};

class SmbWriteSink : public ByteSink
{
    public:
    SmbWriteSink(int fd,
                 std::filesystem::path temp_path,
                 std::filesystem::path final_path,
                 std::string share_path,
                 std::shared_ptr<SmbSession> session,
                 std::chrono::milliseconds timeout)
    : fd(fd), temp_path(temp_path.string()), final_path(final_path.string()), share_path(std::move(share_path)),
      session(std::move(session)), io(timeout), scratch(std::make_shared<std::vector<uint8_t>>())
    {
    }

    ~SmbWriteSink() override
    {
        abort();
    }

    VaultStatus write(const uint8_t *data, size_t length) override
    {
        if (failure)
        {
            return *failure;
        }
        if (fd < 0)
        {
            return { StatusCode::CONNECTION_ERROR, "sink already closed: " + share_path };
        }

        scratch->assign(data, data + length);
        auto result = std::make_shared<IoResult>();
        bool finished = io.run(
        [handle = fd, chunk = scratch, result, hook = session->io_hook]
        {
            callHook(hook, "write");
            size_t offset = 0;
            while (offset < chunk->size())
            {
                ssize_t n = ::write(handle, chunk->data() + offset, chunk->size() - offset);
                if (n < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    result->error = errno;
                    return;
                }
                offset += static_cast<size_t>(n);
            }
            result->bytes = static_cast<ssize_t>(offset);
        });

        if (!finished)
        {
            abandonFile();
            return fail(timeoutStatus("write", share_path, io.timeout()));
        }
        if (result->error != 0)
        {
            return fail(SmbAdapter::statusFromErrno(result->error, "write " + share_path));
        }
        return VaultStatus::success();
    }

    VaultStatus close() override
    {
        if (failure)
        {
            VaultStatus status = *failure;
            abort();
            return status;
        }
        if (fd < 0)
        {
            return { StatusCode::CONNECTION_ERROR, "sink already closed: " + share_path };
        }

        // rename() replaces the destination atomically, so readers see either
        // the previous file or the complete new one
        auto result = std::make_shared<IoResult>();
        bool finished = io.run(
        [handle = fd, temp = temp_path, target = final_path, result, hook = session->io_hook]
        {
            callHook(hook, "commit");
            if (::fsync(handle) != 0)
            {
                result->error = errno;
                result->stage = "flush";
                ::close(handle);
                removeTempQuietly(temp);
                return;
            }
            if (::close(handle) != 0)
            {
                result->error = errno;
                result->stage = "close";
                removeTempQuietly(temp);
                return;
            }
            if (::rename(temp.c_str(), target.c_str()) != 0)
            {
                result->error = errno;
                result->stage = "commit";
                removeTempQuietly(temp);
            }
        });
        fd = -1;

        if (!finished)
        {
            // The helper finishes the commit or removes the temp file on its own
            return fail(timeoutStatus("commit", share_path, io.timeout()));
        }
        if (result->error != 0)
        {
            return fail(SmbAdapter::statusFromErrno(result->error, std::string(result->stage) + " " + share_path));
        }
        return VaultStatus::success();
    }

    void abort() override
    {
        if (fd < 0)
        {
            return;
        }
        if (!io.run([handle = fd, temp = temp_path]
                    {
                        ::close(handle);
                        removeTempQuietly(temp);
                    }))
        {
            Logger::debug(LogCategory::SMB, "Abort of {} is still pending", share_path);
        }
        fd = -1;
    }

    private:
    VaultStatus fail(VaultStatus status)
    {
        if (status.code == StatusCode::CONNECTION_ERROR)
        {
            session->invalidate();
        }
        failure = status;
        return status;
    }

    // The stuck helper owns the descriptor and the temp file from here on
    void abandonFile()
    {
        if (fd >= 0)
        {
            io.deferCleanup([handle = fd, temp = temp_path]
                            {
                                ::close(handle);
                                removeTempQuietly(temp);
                            });
            fd = -1;
        }
    }

    int fd;
    std::string temp_path;
    std::string final_path;
    std::string share_path;
    std::shared_ptr<SmbSession> session;
    TimedIo io;
    std::shared_ptr<std::vector<uint8_t>> scratch;
    std::optional<VaultStatus> failure;
};

// One directory entry as read from the mount, before any validation
struct RawDirEntry
{
    std::string name;
    int stat_error = 0;
    struct stat st{};
};

struct RawListing
{
    int error = 0;
    std::vector<RawDirEntry> items;
};
} // namespace

SmbAdapter::SmbAdapter(const BackendConfig &backend, const TransferConfig &transfers)
: backend_config(backend), transfers(transfers), session(std::make_shared<SmbSession>())
{
    if (backend_config.smb.mount_root.empty())
    {
        backend_config.smb.mount_root = "/mnt/" + backend_config.smb.host + "/" + backend_config.smb.share;
    }
    mount_root = std::filesystem::path(backend_config.smb.mount_root);
}

bool SmbAdapter::isConnected() const
{
    return session->connected.load();
}

void SmbAdapter::invalidateSession()
{
    if (session->connected.exchange(false))
    {
        Logger::info(LogCategory::SMB, "Session to \\\\{}\\{} invalidated", backend_config.smb.host,
                     backend_config.smb.share);
    }
}

void SmbAdapter::setIoHook(std::function<void(const char *)> hook)
{
    session->io_hook = std::move(hook);
}

std::chrono::milliseconds SmbAdapter::ioTimeout() const
{
    return std::chrono::milliseconds(transfers.read_write_timeout_ms);
}

VaultStatus SmbAdapter::timedOut(const char *operation, const std::string &path) const
{
    return timeoutStatus(operation, path, ioTimeout());
}

VaultStatus SmbAdapter::statusFromErrno(int err, const std::string &context)
{
    std::string message = context + ": " + std::strerror(err);

    switch (err)
    {
    case ENOENT:
    case ENOTDIR:
        return { StatusCode::NOT_FOUND, message };
    case EACCES:
    case EPERM:
    case EROFS:
        return { StatusCode::PERMISSION_DENIED, message };
    case ENOSPC:
    case EDQUOT:
    case EFBIG:
        return { StatusCode::QUOTA_EXCEEDED, message };
    default:
        // EHOSTDOWN, ETIMEDOUT, ENOTCONN, ESTALE, EIO and anything unexpected
        // from the SMB client means the share is not usable right now
        return { StatusCode::CONNECTION_ERROR, message };
    }
}

VaultStatus SmbAdapter::ensureConnected()
{
    if (session->connected.load())
    {
        return VaultStatus::success();
    }

    std::lock_guard<std::mutex> lock(connect_mutex);
    if (session->connected.load())
    {
        return VaultStatus::success();
    }
    return establishConnection();
}

VaultStatus SmbAdapter::establishConnection()
{
    Logger::debug(LogCategory::SMB, "Connecting to \\\\{}\\{} at {}", backend_config.smb.host, backend_config.smb.share,
                  mount_root.string());

    // A hung SMB mount blocks stat() indefinitely
    std::string root = mount_root.string();
    auto result = std::make_shared<IoResult>();
    TimedIo mount_check(std::chrono::milliseconds(transfers.connect_timeout_ms));
    bool finished = mount_check.run(
    [root, result, hook = session->io_hook]
    {
        callHook(hook, "connect");
        result->error = ::stat(root.c_str(), &result->st) == 0 ? 0 : errno;
    });

    if (!finished)
    {
        return { StatusCode::CONNECTION_ERROR,
                 fmt::format("timed out after {} ms connecting to {}", transfers.connect_timeout_ms, root) };
    }
    if (result->error != 0)
    {
        VaultStatus status = statusFromErrno(result->error, "connect " + root);
        if (status.code == StatusCode::NOT_FOUND)
        {
            // Missing mount root means the share is not mounted
            status.code = StatusCode::CONNECTION_ERROR;
        }
        return status;
    }
    if (!S_ISDIR(result->st.st_mode))
    {
        return { StatusCode::CONNECTION_ERROR, root + " is not a directory" };
    }

    session->connected.store(true);
    Logger::info(LogCategory::SMB, "Connected to \\\\{}\\{}", backend_config.smb.host, backend_config.smb.share);
    return VaultStatus::success();
}

VaultStatus SmbAdapter::resolveLocalPath(const std::string &share_path, std::filesystem::path &local_path) const
{
    std::string canonical = PathModel::canonicalPath(share_path, BackendKind::SMB);
    local_path = mount_root;

    size_t start = 1;
    while (start < canonical.size())
    {
        size_t next = canonical.find('\\', start);
        std::string component = canonical.substr(start, next == std::string::npos ? std::string::npos : next - start);
        if (component == "." || component == "..")
        {
            return { StatusCode::NOT_FOUND, "path escapes the share: " + share_path };
        }
        local_path /= component;
        if (next == std::string::npos)
        {
            break;
        }
        start = next + 1;
    }

    return VaultStatus::success();
}

VaultStatus SmbAdapter::record(const char *operation, VaultStatus status)
{
    if (status.code == StatusCode::CONNECTION_ERROR)
    {
        Logger::warn(LogCategory::SMB, "{} failed: {}", operation, status.message);
        invalidateSession();
    }
    GlobalMetrics::instance().recordBackendOperation(BackendKind::SMB, operation, status.code);
    return status;
}

VaultStatus SmbAdapter::listDirectory(const std::string &path, std::vector<Entry> &entries)
{
    entries.clear();

    VaultStatus status = ensureConnected();
    if (!isSuccess(status))
    {
        return record("list", status);
    }

    std::filesystem::path local_dir;
    status = resolveLocalPath(path, local_dir);
    if (!isSuccess(status))
    {
        return record("list", status);
    }

    std::string dir_path = PathModel::canonicalPath(path, BackendKind::SMB);

    auto raw = std::make_shared<RawListing>();
    TimedIo io(ioTimeout());
    bool finished = io.run(
    [dir = local_dir.string(), raw, hook = session->io_hook]
    {
        callHook(hook, "list");
        DIR *handle = ::opendir(dir.c_str());
        if (!handle)
        {
            raw->error = errno;
            return;
        }

        errno = 0;
        while (struct dirent *item = ::readdir(handle))
        {
            RawDirEntry found;
            found.name = item->d_name;
            if (!PathModel::isPseudoEntry(found.name))
            {
                std::string full = dir + "/" + found.name;
                found.stat_error = ::stat(full.c_str(), &found.st) == 0 ? 0 : errno;
            }
            raw->items.push_back(std::move(found));
            errno = 0;
        }
        raw->error = errno;
        ::closedir(handle);
    });

    if (!finished)
    {
        return record("list", timedOut("list", dir_path));
    }
    if (raw->error != 0)
    {
        return record("list", statusFromErrno(raw->error, "list " + dir_path));
    }

    for (const RawDirEntry &item : raw->items)
    {
        // Pseudo entries and unusable names never become Entry objects
        if (PathModel::isPseudoEntry(item.name))
        {
            continue;
        }
        std::string accepted;
        if (!isSuccess(PathModel::normalize(item.name, BackendKind::SMB, accepted)))
        {
            Logger::warn(LogCategory::SMB, "Skipping entry with unusable name in {}: {}", dir_path, item.name);
            continue;
        }
        if (item.stat_error != 0)
        {
            // Removed between readdir and stat, or a dangling link
            Logger::debug(LogCategory::SMB, "Skipping {}: {}", item.name, std::strerror(item.stat_error));
            continue;
        }

        Entry entry;
        entry.name = accepted;
        entry.kind = S_ISDIR(item.st.st_mode) ? EntryKind::DIRECTORY : EntryKind::FILE;
        if (!entry.isDirectory())
        {
            entry.size = static_cast<uint64_t>(item.st.st_size);
            entry.media_type = PathModel::classifyMedia(accepted);
        }
        entry.modified_at = modifiedTime(item.st);
        entry.remote_ref = makeRef(PathModel::joinPath(dir_path, accepted, BackendKind::SMB));
        entries.push_back(std::move(entry));
    }

    PathModel::finalizeListing(entries);
    Logger::debug(LogCategory::SMB, "Listed {} entries in {}", entries.size(), dir_path);
    return record("list", VaultStatus::success());
}

VaultStatus SmbAdapter::openForRead(const RemoteRef &remote_ref, std::unique_ptr<ByteStream> &stream)
{
    VaultStatus status = ensureConnected();
    if (!isSuccess(status))
    {
        return record("open_read", status);
    }

    std::filesystem::path local_path;
    status = resolveLocalPath(remote_ref.path, local_path);
    if (!isSuccess(status))
    {
        return record("open_read", status);
    }

    auto result = std::make_shared<IoResult>();
    TimedIo io(ioTimeout());
    bool finished = io.run(
    [file = local_path.string(), result, hook = session->io_hook]
    {
        callHook(hook, "open_read");
        int fd = ::open(file.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0)
        {
            result->error = errno;
            result->stage = "open";
            return;
        }
        if (::fstat(fd, &result->st) != 0)
        {
            result->error = errno;
            result->stage = "stat";
            ::close(fd);
            return;
        }
        result->fd = fd;
    });

    if (!finished)
    {
        // Close whatever the stuck open eventually returns
        io.deferCleanup(
        [result]
        {
            if (result->fd >= 0)
            {
                ::close(result->fd);
            }
        });
        return record("open_read", timedOut("open", remote_ref.path));
    }
    if (result->fd < 0)
    {
        return record("open_read",
                      statusFromErrno(result->error, std::string(result->stage) + " " + remote_ref.path));
    }
    if (S_ISDIR(result->st.st_mode))
    {
        ::close(result->fd);
        return record("open_read", { StatusCode::NOT_FOUND, remote_ref.path + " is a directory" });
    }

    stream = std::make_unique<SmbReadStream>(result->fd, static_cast<uint64_t>(result->st.st_size), remote_ref.path,
                                             session, ioTimeout());
    return record("open_read", VaultStatus::success());
}

VaultStatus SmbAdapter::openForWrite(const std::string &path,
                                     std::optional<uint64_t> expected_size,
                                     std::unique_ptr<ByteSink> &sink)
{
    VaultStatus status = ensureConnected();
    if (!isSuccess(status))
    {
        return record("open_write", status);
    }

    std::string name;
    status = PathModel::normalize(PathModel::baseName(path, BackendKind::SMB), BackendKind::SMB, name);
    if (!isSuccess(status))
    {
        return status;
    }

    std::filesystem::path final_path;
    status = resolveLocalPath(path, final_path);
    if (!isSuccess(status))
    {
        return record("open_write", status);
    }

    std::filesystem::path temp_path = final_path.parent_path() / ("." + name + ".sigvault-part");

    auto result = std::make_shared<IoResult>();
    TimedIo io(ioTimeout());
    bool finished = io.run(
    [parent = final_path.parent_path(), temp = temp_path.string(), reserve = expected_size.value_or(0), result,
     hook = session->io_hook]
    {
        callHook(hook, "open_write");
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            result->error = ec.value();
            result->stage = "create parent of";
            return;
        }

        int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0)
        {
            result->error = errno;
            result->stage = "create";
            return;
        }

        if (reserve > 0)
        {
            // Surfaces a full share before any byte is sent
            int rc = ::posix_fallocate(fd, 0, static_cast<off_t>(reserve));
            if (rc == ENOSPC || rc == EDQUOT || rc == EFBIG)
            {
                ::close(fd);
                removeTempQuietly(temp);
                result->error = rc;
                result->stage = "reserve space for";
                return;
            }
        }
        result->fd = fd;
    });

    if (!finished)
    {
        io.deferCleanup(
        [result, temp = temp_path.string()]
        {
            if (result->fd >= 0)
            {
                ::close(result->fd);
                removeTempQuietly(temp);
            }
        });
        return record("open_write", timedOut("create", path));
    }
    if (result->fd < 0)
    {
        return record("open_write", statusFromErrno(result->error, std::string(result->stage) + " " + path));
    }

    sink = std::make_unique<SmbWriteSink>(result->fd, temp_path, final_path, path, session, ioTimeout());
    return record("open_write", VaultStatus::success());
}

VaultStatus SmbAdapter::buildEntry(const std::string &share_path, Entry &entry)
{
    std::filesystem::path local_path;
    VaultStatus status = resolveLocalPath(share_path, local_path);
    if (!isSuccess(status))
    {
        return status;
    }

    auto result = std::make_shared<IoResult>();
    TimedIo io(ioTimeout());
    bool finished = io.run(
    [file = local_path.string(), result, hook = session->io_hook]
    {
        callHook(hook, "stat");
        result->error = ::stat(file.c_str(), &result->st) == 0 ? 0 : errno;
    });

    if (!finished)
    {
        return timedOut("stat", share_path);
    }
    if (result->error != 0)
    {
        return statusFromErrno(result->error, "stat " + share_path);
    }

    std::string canonical = PathModel::canonicalPath(share_path, BackendKind::SMB);
    entry = Entry{};
    entry.name = PathModel::baseName(canonical, BackendKind::SMB);
    entry.kind = S_ISDIR(result->st.st_mode) ? EntryKind::DIRECTORY : EntryKind::FILE;
    if (!entry.isDirectory())
    {
        entry.size = static_cast<uint64_t>(result->st.st_size);
        entry.media_type = PathModel::classifyMedia(entry.name);
    }
    entry.modified_at = modifiedTime(result->st);
    entry.remote_ref = makeRef(canonical);
    return VaultStatus::success();
}

VaultStatus SmbAdapter::statEntry(const RemoteRef &remote_ref, Entry &entry)
{
    VaultStatus status = ensureConnected();
    if (!isSuccess(status))
    {
        return record("stat", status);
    }
    return record("stat", buildEntry(remote_ref.path, entry));
}

} // namespace SigVault
