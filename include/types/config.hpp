#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace SigVault
{

enum class BackendKind : std::uint8_t
{
    SMB,
    CLOUD
};

struct Credentials
{
    std::string username;
    std::string password;
    std::string token; // Bearer token, takes precedence over password for cloud backends
};

struct SmbTarget
{
    std::string host;
    std::string share;
    std::string mount_root; // Where the OS SMB client exposes //host/share
};

struct CloudTarget
{
    std::string base_url; // Normalized to the WebDAV files root, always ends with '/'
    bool verify_tls = true;
};

struct BackendConfig
{
    std::string name;
    BackendKind kind = BackendKind::SMB;
    SmbTarget smb;
    CloudTarget cloud;
    Credentials credentials;

    // Stable across runs; prefixes cache keys so two backends never collide
    std::string qualifiedId() const
    {
        if (kind == BackendKind::SMB)
        {
            return "smb://" + smb.host + "/" + smb.share;
        }
        return cloud.base_url;
    }
};

struct TransferConfig
{
    size_t max_concurrent_transfers = 3;
    uint32_t connect_timeout_ms = 10000;
    uint32_t read_write_timeout_ms = 30000;
    size_t buffer_size_kb = 256;

    // Finished jobs kept queryable by id; older ones are forgotten
    size_t job_history = 256;
};

struct CacheConfig
{
    std::string directory = "./sig-vault-cache";
    size_t max_size_mb = 2048;
};

struct MetricsConfig
{
    bool enabled = false;
    std::string bind_address = "127.0.0.1";
    int port = 9464;
    std::string endpoint_path = "/metrics";
};

struct Config
{
    std::unordered_map<std::string, BackendConfig> backends;
    std::string active_backend;
    TransferConfig transfers;
    CacheConfig cache;
    MetricsConfig metrics;
};

} // namespace SigVault
