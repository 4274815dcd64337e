#pragma once

#include <sig-vault/backend_adapter.hpp>
#include <sig-vault/path_model.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace SigVault
{

// In-memory backend for exercising the engine and the coordinator without a
// network. Streams hand out `chunk_size` bytes per read and sleep
// `read_delay` before each one.
class FakeBackendAdapter : public BackendAdapter
{
    public:
    struct RemoteFile
    {
        std::vector<uint8_t> bytes;
        std::chrono::system_clock::time_point modified_at;
    };

    explicit FakeBackendAdapter(std::string name = "fake", BackendKind kind = BackendKind::CLOUD)
    {
        config.name = name;
        config.kind = kind;
        config.cloud.base_url = "https://" + name + ".example/remote.php/dav/files/tester/";
        config.smb.host = name;
        config.smb.share = "share";
    }

    explicit FakeBackendAdapter(const BackendConfig &backend) : config(backend)
    {
    }

    void addFile(const std::string &path, const std::string &content,
                 std::chrono::system_clock::time_point modified_at = std::chrono::system_clock::now())
    {
        std::lock_guard<std::mutex> lock(mutex);
        files[canonical(path)] = { std::vector<uint8_t>(content.begin(), content.end()), modified_at };
    }

    void addDirectory(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex);
        directories.insert(canonical(path));
    }

    // Names reported verbatim by the next listing of `path`, pseudo entries included
    void setRawListing(const std::string &path, std::vector<Entry> entries)
    {
        std::lock_guard<std::mutex> lock(mutex);
        raw_listings[canonical(path)] = std::move(entries);
    }

    std::optional<std::string> content(const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = files.find(canonical(path));
        if (it == files.end())
        {
            return std::nullopt;
        }
        return std::string(it->second.bytes.begin(), it->second.bytes.end());
    }

    void touch(const std::string &path, std::chrono::system_clock::time_point modified_at)
    {
        std::lock_guard<std::mutex> lock(mutex);
        files[canonical(path)].modified_at = modified_at;
    }

    void removeFile(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex);
        files.erase(canonical(path));
    }

    VaultStatus listDirectory(const std::string &path, std::vector<Entry> &entries) override
    {
        entries.clear();
        list_calls++;
        if (list_delay.count() > 0)
        {
            std::this_thread::sleep_for(list_delay);
        }

        std::lock_guard<std::mutex> lock(mutex);
        std::string dir = canonical(path);

        auto raw = raw_listings.find(dir);
        if (raw != raw_listings.end())
        {
            entries = raw->second;
            PathModel::finalizeListing(entries);
            return VaultStatus::success();
        }

        if (!dir.empty() && directories.find(dir) == directories.end())
        {
            return { StatusCode::NOT_FOUND, "no directory " + dir };
        }

        for (const auto &[file_path, file] : files)
        {
            if (PathModel::parentPath(file_path, config.kind) != dir)
            {
                continue;
            }
            Entry entry;
            entry.name = PathModel::baseName(file_path, config.kind);
            entry.size = file.bytes.size();
            entry.modified_at = file.modified_at;
            entry.media_type = PathModel::classifyMedia(entry.name);
            entry.remote_ref = makeRef(file_path);
            entries.push_back(entry);
        }
        for (const auto &sub : directories)
        {
            if (sub.empty() || PathModel::parentPath(sub, config.kind) != dir)
            {
                continue;
            }
            Entry entry;
            entry.name = PathModel::baseName(sub, config.kind);
            entry.kind = EntryKind::DIRECTORY;
            entry.remote_ref = makeRef(sub);
            entries.push_back(entry);
        }

        PathModel::finalizeListing(entries);
        return VaultStatus::success();
    }

    VaultStatus openForRead(const RemoteRef &remote_ref, std::unique_ptr<ByteStream> &stream) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = files.find(canonical(remote_ref.path));
        if (it == files.end())
        {
            return { StatusCode::NOT_FOUND, "no file " + remote_ref.path };
        }
        open_reads++;
        stream = std::make_unique<FakeStream>(*this, it->second.bytes);
        return VaultStatus::success();
    }

    VaultStatus openForWrite(const std::string &path,
                             std::optional<uint64_t> expected_size,
                             std::unique_ptr<ByteSink> &sink) override
    {
        (void)expected_size;
        std::string name;
        VaultStatus status = PathModel::normalize(PathModel::baseName(path, config.kind), config.kind, name);
        if (!isSuccess(status))
        {
            return status;
        }
        if (deny_writes)
        {
            return { StatusCode::PERMISSION_DENIED, "read-only backend" };
        }
        sink = std::make_unique<FakeSink>(*this, canonical(path));
        return VaultStatus::success();
    }

    VaultStatus statEntry(const RemoteRef &remote_ref, Entry &entry) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        stat_calls++;
        std::string path = canonical(remote_ref.path);
        auto it = files.find(path);
        if (it == files.end())
        {
            if (directories.count(path))
            {
                entry = Entry{};
                entry.name = PathModel::baseName(path, config.kind);
                entry.kind = EntryKind::DIRECTORY;
                entry.remote_ref = makeRef(path);
                return VaultStatus::success();
            }
            return { StatusCode::NOT_FOUND, "no file " + remote_ref.path };
        }
        entry = Entry{};
        entry.name = PathModel::baseName(path, config.kind);
        entry.size = it->second.bytes.size();
        entry.modified_at = it->second.modified_at;
        entry.remote_ref = makeRef(path);
        return VaultStatus::success();
    }

    const BackendConfig &backend() const override
    {
        return config;
    }

    // Tuning knobs, set before starting transfers
    size_t chunk_size = 4;
    std::chrono::milliseconds read_delay{ 0 };
    std::chrono::milliseconds list_delay{ 0 };
    // Reads fail with CONNECTION_ERROR once this many bytes were delivered
    std::optional<uint64_t> fail_after_bytes;
    bool deny_writes = false;

    std::atomic<int> open_reads{ 0 };
    std::atomic<int> stat_calls{ 0 };
    std::atomic<int> list_calls{ 0 };
    std::atomic<int> active_streams{ 0 };
    std::atomic<int> max_active_streams{ 0 };

    private:
    class FakeStream : public ByteStream
    {
        public:
        FakeStream(FakeBackendAdapter &owner, std::vector<uint8_t> bytes) : owner(owner), bytes(std::move(bytes))
        {
            int now = ++owner.active_streams;
            int seen = owner.max_active_streams.load();
            while (now > seen && !owner.max_active_streams.compare_exchange_weak(seen, now))
            {
            }
        }

        ~FakeStream() override
        {
            close();
        }

        VaultStatus read(uint8_t *buffer, size_t capacity, size_t &bytes_read) override
        {
            bytes_read = 0;
            if (owner.read_delay.count() > 0)
            {
                std::this_thread::sleep_for(owner.read_delay);
            }
            if (owner.fail_after_bytes && offset >= *owner.fail_after_bytes && offset < bytes.size())
            {
                return { StatusCode::CONNECTION_ERROR, "connection reset by peer" };
            }
            size_t n = std::min({ capacity, owner.chunk_size, bytes.size() - offset });
            std::copy(bytes.begin() + offset, bytes.begin() + offset + n, buffer);
            offset += n;
            bytes_read = n;
            return VaultStatus::success();
        }

        void close() override
        {
            if (!closed)
            {
                closed = true;
                owner.active_streams--;
            }
        }

        std::optional<uint64_t> size() const override
        {
            return bytes.size();
        }

        private:
        FakeBackendAdapter &owner;
        std::vector<uint8_t> bytes;
        size_t offset = 0;
        bool closed = false;
    };

    class FakeSink : public ByteSink
    {
        public:
        FakeSink(FakeBackendAdapter &owner, std::string path) : owner(owner), path(std::move(path))
        {
        }

        VaultStatus write(const uint8_t *data, size_t length) override
        {
            pending.insert(pending.end(), data, data + length);
            return VaultStatus::success();
        }

        VaultStatus close() override
        {
            std::lock_guard<std::mutex> lock(owner.mutex);
            owner.files[path] = { pending, std::chrono::system_clock::now() };
            return VaultStatus::success();
        }

        void abort() override
        {
            pending.clear();
        }

        private:
        FakeBackendAdapter &owner;
        std::string path;
        std::vector<uint8_t> pending;
    };

    std::string canonical(const std::string &path) const
    {
        return PathModel::canonicalPath(path, config.kind);
    }

    BackendConfig config;
    mutable std::mutex mutex;
    std::map<std::string, RemoteFile> files;
    std::set<std::string> directories;
    std::map<std::string, std::vector<Entry>> raw_listings;
};

} // namespace SigVault
