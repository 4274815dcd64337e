#include <sig-vault/config_parser.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/string_utils.hpp>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace SigVault
{

namespace
{
const char *const DAV_FILES_SEGMENT = "/remote.php/dav/files/";

std::string stringField(const nlohmann::json &j, const char *key)
{
    if (j.contains(key) && j[key].is_string())
    {
        return j[key].get<std::string>();
    }
    return "";
}

// Fills credentials, resolving password_env. False when the environment
// variable named there is not set.
bool parseCredentials(const std::string &backend_name, const nlohmann::json &j, Credentials &credentials)
{
    credentials.username = stringField(j, "username");
    credentials.password = stringField(j, "password");
    credentials.token = stringField(j, "token");

    std::string password_env = stringField(j, "password_env");
    if (!password_env.empty())
    {
        const char *secret = std::getenv(password_env.c_str());
        if (!secret)
        {
            Logger::error(LogCategory::CONFIG, "Backend '{}': environment variable {} is not set", backend_name,
                          password_env);
            return false;
        }
        credentials.password = secret;
    }
    return true;
}

bool parseBackend(const std::string &name, const nlohmann::json &j, BackendConfig &backend)
{
    backend.name = name;

    std::string type = StringUtils::toLower(stringField(j, "type"));
    if (type == "smb")
    {
        backend.kind = BackendKind::SMB;
        backend.smb.host = stringField(j, "host");
        backend.smb.share = stringField(j, "share");
        backend.smb.mount_root = stringField(j, "mount_root");

        if (backend.smb.host.empty() || backend.smb.share.empty())
        {
            Logger::error(LogCategory::CONFIG, "Backend '{}': smb backends need 'host' and 'share'", name);
            return false;
        }
        if (backend.smb.mount_root.empty())
        {
            backend.smb.mount_root = "/mnt/" + backend.smb.host + "/" + backend.smb.share;
        }
    }
    else if (type == "cloud" || type == "webdav" || type == "nextcloud")
    {
        backend.kind = BackendKind::CLOUD;
        std::string base_url = stringField(j, "base_url");
        if (base_url.empty())
        {
            Logger::error(LogCategory::CONFIG, "Backend '{}': cloud backends need 'base_url'", name);
            return false;
        }
        if (j.contains("verify_tls") && j["verify_tls"].is_boolean())
        {
            backend.cloud.verify_tls = j["verify_tls"];
        }
        backend.credentials.username = stringField(j, "username");
        backend.cloud.base_url = ConfigParser::normalizeCloudBaseUrl(base_url, backend.credentials.username);
    }
    else
    {
        Logger::error(LogCategory::CONFIG, "Backend '{}': unknown type '{}'", name, stringField(j, "type"));
        return false;
    }

    return parseCredentials(name, j, backend.credentials);
}
} // namespace

std::string ConfigParser::normalizeCloudBaseUrl(const std::string &base_url, const std::string &username)
{
    std::string url = base_url;
    if (url.find(DAV_FILES_SEGMENT) == std::string::npos)
    {
        while (!url.empty() && url.back() == '/')
        {
            url.pop_back();
        }
        url += DAV_FILES_SEGMENT + StringUtils::urlEncodePath(username);
        Logger::debug(LogCategory::CONFIG, "Using WebDAV files root {} for {}", url, base_url);
    }
    if (url.empty() || url.back() != '/')
    {
        url += '/';
    }
    return url;
}

std::optional<Config> ConfigParser::parseJsonFile(std::string_view file_path)
{
    std::string filename(file_path);
    Logger::debug(LogCategory::CONFIG, "Loading configuration from {}", filename);

    std::ifstream file(filename, std::ios::in);
    if (!file.is_open())
    {
        std::error_code ec;
        if (std::filesystem::exists(filename, ec))
        {
            Logger::error(LogCategory::CONFIG, "Config file {} exists but cannot be opened (permission issue?)", filename);
        }
        else
        {
            Logger::error(LogCategory::CONFIG, "Config file {} does not exist (working directory {})", filename,
                          std::filesystem::current_path(ec).string());
        }
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseJsonString(content);
}

std::optional<Config> ConfigParser::parseJsonString(std::string_view json_content)
{
    try
    {
        nlohmann::json j = nlohmann::json::parse(json_content);
        Config config;

        // Parse backends section
        if (j.contains("backends") && j["backends"].is_object())
        {
            for (const auto &[name, backend_json] : j["backends"].items())
            {
                if (!backend_json.is_object())
                {
                    Logger::error(LogCategory::CONFIG, "Backend '{}' is not an object", name);
                    return std::nullopt;
                }

                BackendConfig backend;
                if (!parseBackend(name, backend_json, backend))
                {
                    return std::nullopt;
                }
                config.backends[name] = std::move(backend);
            }
        }

        config.active_backend = stringField(j, "active_backend");
        if (!config.active_backend.empty() && config.backends.find(config.active_backend) == config.backends.end())
        {
            Logger::error(LogCategory::CONFIG, "active_backend '{}' is not a configured backend", config.active_backend);
            return std::nullopt;
        }
        if (config.active_backend.empty() && config.backends.size() == 1)
        {
            config.active_backend = config.backends.begin()->first;
        }

        // Parse transfers section
        if (j.contains("transfers") && j["transfers"].is_object())
        {
            const auto &transfers = j["transfers"];

            if (transfers.contains("max_concurrent_transfers") && transfers["max_concurrent_transfers"].is_number_integer())
            {
                int64_t requested = transfers["max_concurrent_transfers"];
                int64_t clamped = std::clamp<int64_t>(requested, MIN_CONCURRENT_TRANSFERS, MAX_CONCURRENT_TRANSFERS);
                if (clamped != requested)
                {
                    Logger::warn(LogCategory::CONFIG, "max_concurrent_transfers {} clamped to {}", requested, clamped);
                }
                config.transfers.max_concurrent_transfers = static_cast<size_t>(clamped);
            }

            if (transfers.contains("connect_timeout_ms") && transfers["connect_timeout_ms"].is_number_unsigned())
            {
                config.transfers.connect_timeout_ms = transfers["connect_timeout_ms"];
            }

            if (transfers.contains("read_write_timeout_ms") && transfers["read_write_timeout_ms"].is_number_unsigned())
            {
                config.transfers.read_write_timeout_ms = transfers["read_write_timeout_ms"];
            }

            if (transfers.contains("job_history") && transfers["job_history"].is_number_unsigned())
            {
                config.transfers.job_history = std::max<size_t>(1, transfers["job_history"].get<size_t>());
            }

            if (transfers.contains("buffer_size_kb") && transfers["buffer_size_kb"].is_number_unsigned())
            {
                config.transfers.buffer_size_kb = std::max<size_t>(1, transfers["buffer_size_kb"].get<size_t>());
            }
        }

        // Parse cache section
        if (j.contains("cache") && j["cache"].is_object())
        {
            const auto &cache = j["cache"];

            if (cache.contains("directory") && cache["directory"].is_string())
            {
                config.cache.directory = cache["directory"];
            }

            if (cache.contains("max_size_mb") && cache["max_size_mb"].is_number_unsigned())
            {
                config.cache.max_size_mb = cache["max_size_mb"];
            }
        }

        // Parse metrics section
        if (j.contains("metrics") && j["metrics"].is_object())
        {
            const auto &metrics = j["metrics"];

            if (metrics.contains("enabled") && metrics["enabled"].is_boolean())
            {
                config.metrics.enabled = metrics["enabled"];
            }

            if (metrics.contains("bind_address") && metrics["bind_address"].is_string())
            {
                config.metrics.bind_address = metrics["bind_address"];
            }

            if (metrics.contains("port") && metrics["port"].is_number_integer())
            {
                config.metrics.port = metrics["port"];
            }

            if (metrics.contains("endpoint_path") && metrics["endpoint_path"].is_string())
            {
                config.metrics.endpoint_path = metrics["endpoint_path"];
            }
        }

        Logger::info(LogCategory::CONFIG, "Configuration loaded: {} backend(s), active '{}'", config.backends.size(),
                     config.active_backend);
        return config;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error(LogCategory::CONFIG, "JSON parsing error: {}", e.what());
        return std::nullopt;
    }
}

} // namespace SigVault
