#pragma once

#include "backend_adapter.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace SigVault
{

// Shared between the adapter and the streams/sinks it hands out so a
// connection failure seen mid-transfer still drops the session.
struct SmbSession
{
    std::atomic<bool> connected{ false };

    // Called on the I/O thread right before each blocking call, with the
    // operation name. Lets tests stand in for a hung mount.
    std::function<void(const char *)> io_hook;

    void invalidate()
    {
        connected.store(false);
    }
};

/**
 * SMB share reached through the operating system's SMB client. The share
 * //host/share is expected under `mount_root`; remote paths are share
 * relative with '\' separators and are mapped onto the mount.
 */
class SmbAdapter : public BackendAdapter
{
    public:
    SmbAdapter(const BackendConfig &backend, const TransferConfig &transfers);
    ~SmbAdapter() override = default;

    VaultStatus listDirectory(const std::string &path, std::vector<Entry> &entries) override;
    VaultStatus openForRead(const RemoteRef &remote_ref, std::unique_ptr<ByteStream> &stream) override;
    VaultStatus openForWrite(const std::string &path,
                             std::optional<uint64_t> expected_size,
                             std::unique_ptr<ByteSink> &sink) override;
    VaultStatus statEntry(const RemoteRef &remote_ref, Entry &entry) override;

    const BackendConfig &backend() const override
    {
        return backend_config;
    }

    bool isConnected() const;
    void invalidateSession();

    // Must be set before any I/O starts
    void setIoHook(std::function<void(const char *)> hook);

    // errno -> shared taxonomy
    static VaultStatus statusFromErrno(int err, const std::string &context);

    private:
    VaultStatus ensureConnected();
    VaultStatus establishConnection();
    VaultStatus resolveLocalPath(const std::string &share_path, std::filesystem::path &local_path) const;
    VaultStatus buildEntry(const std::string &share_path, Entry &entry);
    VaultStatus record(const char *operation, VaultStatus status);
    std::chrono::milliseconds ioTimeout() const;
    VaultStatus timedOut(const char *operation, const std::string &path) const;

    BackendConfig backend_config;
    TransferConfig transfers;
    std::filesystem::path mount_root;
    std::shared_ptr<SmbSession> session;
    std::mutex connect_mutex;
};

} // namespace SigVault
