#pragma once

#include "backend_adapter.hpp"
#include "webdav_parser.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace SigVault
{

struct CloudSession;

// Storage quota of the account behind the files root; unset when the server
// does not report a value
struct StorageQuota
{
    std::optional<uint64_t> used_bytes;
    std::optional<uint64_t> available_bytes;
};

/**
 * Nextcloud/ownCloud style WebDAV backend over libcurl.
 *
 * Paths are relative to the configured files root and use '/'. Listing and
 * stat use PROPFIND (Depth 1 and Depth 0), reads are a streamed GET and
 * writes a streamed PUT, preceded by MKCOL for missing parents.
 *
 * Requests made through one session share DNS, TLS sessions and
 * connections. A CONNECTION_ERROR drops the session; the next request builds
 * a new one.
 */
class CloudAdapter : public BackendAdapter
{
    public:
    CloudAdapter(const BackendConfig &backend, const TransferConfig &transfers);
    ~CloudAdapter() override;

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

    void invalidateSession();

    // Asks the files root for the RFC 4331 quota properties
    VaultStatus quota(StorageQuota &result);

    // Escaped URL of a path below the files root
    std::string urlFor(const std::string &path, bool collection) const;

    // HTTP status -> shared taxonomy. `upload` turns 409 (missing parent) into NOT_FOUND.
    static VaultStatus statusFromHttp(long http_code, const std::string &context, bool upload = false);

    private:
    std::shared_ptr<CloudSession> currentSession();
    VaultStatus propfind(const std::string &path,
                         bool collection,
                         int depth,
                         std::vector<DavResource> &resources,
                         const char *request_body = WebDavParser::propfindRequestBody());
    VaultStatus makeCollections(const std::string &parent);
    Entry entryFromResource(const DavResource &resource) const;
    VaultStatus record(const char *operation, VaultStatus status);

    BackendConfig backend_config;
    TransferConfig transfers;
    std::string root_path;

    std::mutex session_mutex;
    std::shared_ptr<CloudSession> session;
};

} // namespace SigVault
