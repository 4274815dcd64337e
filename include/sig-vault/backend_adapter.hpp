#pragma once

#include "../types/config.hpp"
#include "../types/entry.hpp"
#include "vault_status.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace SigVault
{

// Lazily produced, finite, non-restartable byte sequence.
class ByteStream
{
    public:
    virtual ~ByteStream() = default;

    // Reads up to `capacity` bytes. `bytes_read` == 0 with a success status
    // marks the end of the stream.
    virtual VaultStatus read(uint8_t *buffer, size_t capacity, size_t &bytes_read) = 0;

    // Releases the underlying connection. Safe to call more than once and
    // before the end of the stream.
    virtual void close() = 0;

    // Total size when the backend announced one
    virtual std::optional<uint64_t> size() const = 0;
};

// Accepts bytes until closed. Only a successful close() commits; a sink that
// saw a failed write, or is aborted or destroyed without close(), leaves the
// destination untouched.
class ByteSink
{
    public:
    virtual ~ByteSink() = default;

    virtual VaultStatus write(const uint8_t *data, size_t length) = 0;

    // Durably commits everything written so far
    virtual VaultStatus close() = 0;

    virtual void abort() = 0;
};

/**
 * Capability set every backend implements. Each operation reports its
 * failures with the shared status taxonomy so callers never branch on the
 * backend type.
 *
 * A CONNECTION_ERROR from any operation invalidates the adapter's session;
 * the next call connects afresh. Adapters never retry internally.
 *
 * All operations may block on network I/O.
 */
class BackendAdapter
{
    public:
    virtual ~BackendAdapter() = default;

    // NOT_FOUND, PERMISSION_DENIED or CONNECTION_ERROR on failure. Entries
    // come back free of pseudo entries, directories first then ordered by
    // name ignoring case.
    virtual VaultStatus listDirectory(const std::string &path, std::vector<Entry> &entries) = 0;

    // NOT_FOUND or CONNECTION_ERROR on failure
    virtual VaultStatus openForRead(const RemoteRef &remote_ref, std::unique_ptr<ByteStream> &stream) = 0;

    // PERMISSION_DENIED, CONNECTION_ERROR or QUOTA_EXCEEDED on failure
    virtual VaultStatus openForWrite(const std::string &path,
                                     std::optional<uint64_t> expected_size,
                                     std::unique_ptr<ByteSink> &sink) = 0;

    // NOT_FOUND on failure
    virtual VaultStatus statEntry(const RemoteRef &remote_ref, Entry &entry) = 0;

    virtual const BackendConfig &backend() const = 0;

    RemoteRef makeRef(const std::string &path) const
    {
        RemoteRef ref;
        ref.kind = backend().kind;
        ref.backend_id = backend().qualifiedId();
        ref.path = path;
        return ref;
    }
};

using AdapterFactory = std::function<std::shared_ptr<BackendAdapter>(const BackendConfig &, const TransferConfig &)>;

// Builds an SmbAdapter or CloudAdapter according to the backend kind
std::shared_ptr<BackendAdapter> createBackendAdapter(const BackendConfig &backend, const TransferConfig &transfers);

} // namespace SigVault
