#include <sig-vault/config_parser.hpp>
#include <sig-vault/logger.hpp>
#include <sig-vault/metrics_collector.hpp>
#include <sig-vault/path_model.hpp>
#include <sig-vault/string_utils.hpp>
#include <sig-vault/time_utils.hpp>
#include <sig-vault/cloud_adapter.hpp>
#include <sig-vault/vault_coordinator.hpp>
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fmt/format.h>
#include <map>
#include <mutex>
#include <string>
#include <vector>

using namespace SigVault;

namespace
{
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Helper functions for logging configuration
LogLevel parseLogLevel(const std::string &level_str)
{
    if (auto level = Logger::parseLevel(level_str))
    {
        return *level;
    }
    Logger::warn_fallback("Unknown log level '{}', using WARN", level_str);
    return LogLevel::WARN;
}

LogOutput parseLogOutput(const std::string &output_str)
{
    std::string lower_output = StringUtils::toLower(output_str);

    if (lower_output == "console")
        return LogOutput::CONSOLE;
    if (lower_output == "file")
        return LogOutput::FILE;
    if (lower_output == "both")
        return LogOutput::BOTH;
    if (lower_output == "disabled")
        return LogOutput::DISABLED;

    Logger::warn_fallback("Unknown log output '{}', using CONSOLE", output_str);
    return LogOutput::CONSOLE;
}

// Command line parsing structure
struct ProgramOptions
{
    std::string config_file = "sig-vault.json";
    std::string backend;
    std::string command;
    std::vector<std::string> arguments;
    std::string output_file;
    bool show_help = false;
    bool usage_error = false;

    // Application logging options
    LogLevel log_level = LogLevel::WARN;
    LogOutput log_output = LogOutput::CONSOLE;
    std::string log_file = "sig-vault.log";
    std::string log_categories = "all";
};

void printUsage()
{
    fmt::print(
    "Usage: sig-vault [OPTIONS] COMMAND [ARGS]\n"
    "\n"
    "Commands:\n"
    "  browse [PATH]              List a directory of the active backend\n"
    "  download REMOTE [--out FILE]\n"
    "                             Fetch a file into the cache (and copy it to FILE)\n"
    "  download-folder REMOTE [--out DIR]\n"
    "                             Fetch every file below REMOTE (and mirror them into DIR)\n"
    "  upload LOCAL REMOTE        Upload a local file\n"
    "  invalidate REMOTE          Force the next download of REMOTE to refetch\n"
    "  revalidate REMOTE          Compare the cached copy of REMOTE with the backend\n"
    "  evict BYTES                Free at least BYTES (e.g. 512M) from the cache\n"
    "  cache                      Show cache statistics and records\n"
    "  quota                      Show used and available space of a cloud backend\n"
    "\n"
    "Options:\n"
    "  -c, --config FILE          Configuration file (default: sig-vault.json)\n"
    "  -b, --backend NAME         Backend to use (default: active_backend from the config)\n"
    "  -h, --help                 Show this help message\n"
    "\n"
    "Application Logging Options:\n"
    "  -l, --log-level LEVEL      trace, debug, info, warn, error, fatal, off (default: warn)\n"
    "  -o, --log-output TYPE      console, file, both, disabled (default: console)\n"
    "  -f, --log-file FILE        Log file path (default: sig-vault.log)\n"
    "      --log-categories LIST  Comma separated: general,backend,smb,cloud,transfer,cache,config,events or all\n"
    "\n"
    "Examples:\n"
    "  sig-vault --backend nas browse Photos\n"
    "  sig-vault download Photos/IMG_0001.jpg --out ./IMG_0001.jpg\n"
    "  sig-vault --backend cloud download-folder Photos/2024 --out ./2024\n"
    "  sig-vault -l debug --log-categories cloud,transfer upload ./clip.mp4 Videos/clip.mp4\n");
}

// Parse command line arguments
ProgramOptions parseCommandLine(int argc, char **argv)
{
    ProgramOptions options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg{ argv[i] };

        if (arg == "-c" || arg == "--config")
        {
            const char *config_path = StringUtils::getNextArg(argv, i, argc);
            if (!config_path)
            {
                Logger::error_fallback("--config requires a file path");
                options.usage_error = true;
                break;
            }
            options.config_file = config_path;
        }
        else if (arg == "-b" || arg == "--backend")
        {
            const char *backend = StringUtils::getNextArg(argv, i, argc);
            if (!backend)
            {
                Logger::error_fallback("--backend requires a backend name");
                options.usage_error = true;
                break;
            }
            options.backend = backend;
        }
        else if (arg == "--out")
        {
            const char *out = StringUtils::getNextArg(argv, i, argc);
            if (!out)
            {
                Logger::error_fallback("--out requires a file path");
                options.usage_error = true;
                break;
            }
            options.output_file = out;
        }
        else if (arg == "-l" || arg == "--log-level")
        {
            const char *log_level = StringUtils::getNextArg(argv, i, argc);
            if (!log_level)
            {
                Logger::error_fallback("--log-level requires a level (trace, debug, info, warn, error, fatal, off)");
                options.usage_error = true;
                break;
            }
            options.log_level = parseLogLevel(log_level);
        }
        else if (arg == "-o" || arg == "--log-output")
        {
            const char *log_output = StringUtils::getNextArg(argv, i, argc);
            if (!log_output)
            {
                Logger::error_fallback("--log-output requires a type (console, file, both, disabled)");
                options.usage_error = true;
                break;
            }
            options.log_output = parseLogOutput(log_output);
        }
        else if (arg == "-f" || arg == "--log-file")
        {
            const char *log_file = StringUtils::getNextArg(argv, i, argc);
            if (!log_file)
            {
                Logger::error_fallback("--log-file requires a file path");
                options.usage_error = true;
                break;
            }
            options.log_file = log_file;
        }
        else if (arg == "--log-categories")
        {
            const char *categories = StringUtils::getNextArg(argv, i, argc);
            if (!categories)
            {
                Logger::error_fallback("--log-categories requires a list");
                options.usage_error = true;
                break;
            }
            options.log_categories = categories;
        }
        else if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
            break;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            Logger::error_fallback("Unknown argument: {}", arg);
            options.usage_error = true;
            break;
        }
        else if (options.command.empty())
        {
            options.command = arg;
        }
        else
        {
            options.arguments.push_back(arg);
        }
    }

    return options;
}

bool checkArgumentCount(const ProgramOptions &options, size_t min_count, size_t max_count)
{
    if (options.arguments.size() < min_count || options.arguments.size() > max_count)
    {
        Logger::error_fallback("'{}' takes {} argument(s), got {}", options.command,
                               min_count == max_count ? std::to_string(min_count) :
                                                        fmt::format("{} to {}", min_count, max_count),
                               options.arguments.size());
        return false;
    }
    return true;
}

int reportFailure(const VaultStatus &status)
{
    fmt::print(stderr, "error: {}\n", describeStatus(status));
    return EXIT_FAILED;
}

const char *mediaLabel(MediaType type)
{
    switch (type)
    {
    case MediaType::IMAGE:
        return "image";
    case MediaType::VIDEO:
        return "video";
    default:
        return "";
    }
}

int runBrowse(VaultCoordinator &vault, const ProgramOptions &options)
{
    std::string path = options.arguments.empty() ? "" : options.arguments[0];

    BrowseResult result = vault.browseAsync(path).get();
    if (!isSuccess(result.status))
    {
        return reportFailure(result.status);
    }

    for (const auto &entry : result.entries)
    {
        std::string modified = entry.modified_at ? TimeUtils::formatTimestamp(*entry.modified_at) : "-";
        if (entry.isDirectory())
        {
            fmt::print("{:<10} {:<16} {}/\n", "<dir>", modified, entry.name);
        }
        else
        {
            std::string size = entry.size ? StringUtils::formatSize(*entry.size) : "?";
            fmt::print("{:<10} {:<16} {} {}\n", size, modified, entry.name, mediaLabel(entry.media_type));
        }
    }
    fmt::print("{} entr{}\n", result.entries.size(), result.entries.size() == 1 ? "y" : "ies");
    return EXIT_OK;
}

// Prints progress from a subscription until the job is terminal
std::optional<TransferJobInfo> followJob(VaultCoordinator &vault, const TransferJobInfo &job)
{
    auto subscription = vault.subscribe(job.id);
    if (!subscription)
    {
        return std::nullopt;
    }

    int last_percent = -1;
    while (auto snapshot = subscription->next())
    {
        if (snapshot->state != TransferState::RUNNING)
        {
            continue;
        }
        if (snapshot->bytes_total && *snapshot->bytes_total > 0)
        {
            int percent = static_cast<int>(snapshot->bytes_done * 100 / *snapshot->bytes_total);
            if (percent != last_percent)
            {
                fmt::print(stderr, "\r{:3d}% {} / {}", percent, StringUtils::formatSize(snapshot->bytes_done),
                           StringUtils::formatSize(*snapshot->bytes_total));
                last_percent = percent;
            }
        }
        else
        {
            fmt::print(stderr, "\r{}", StringUtils::formatSize(snapshot->bytes_done));
        }
    }
    if (last_percent >= 0)
    {
        fmt::print(stderr, "\n");
    }

    return subscription->info();
}

int finishTransfer(const std::optional<TransferJobInfo> &info)
{
    if (!info)
    {
        fmt::print(stderr, "error: transfer vanished\n");
        return EXIT_FAILED;
    }
    if (info->state == TransferState::FAILED)
    {
        return reportFailure(info->error.value_or(VaultStatus{ StatusCode::CONNECTION_ERROR, "unknown failure" }));
    }
    if (info->state == TransferState::CANCELLED)
    {
        fmt::print(stderr, "transfer cancelled\n");
        return EXIT_FAILED;
    }
    return EXIT_OK;
}

RemoteRef remoteRefFor(VaultCoordinator &vault, const std::string &path)
{
    auto adapter = vault.activeAdapter();
    return adapter->makeRef(PathModel::canonicalPath(path, adapter->backend().kind));
}

int runDownload(VaultCoordinator &vault, const ProgramOptions &options)
{
    TransferJobInfo job = vault.download(remoteRefFor(vault, options.arguments[0]));
    std::optional<TransferJobInfo> info = followJob(vault, job);

    int rc = finishTransfer(info);
    if (rc != EXIT_OK)
    {
        return rc;
    }

    if (!options.output_file.empty())
    {
        std::error_code ec;
        std::filesystem::copy_file(info->local_path, options.output_file,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
        {
            return reportFailure({ StatusCode::IO_ERROR, "cannot write " + options.output_file + ": " + ec.message() });
        }
        fmt::print("{}\n", options.output_file);
    }
    else
    {
        fmt::print("{}\n", info->local_path);
    }
    if (info->from_cache)
    {
        Logger::info(LogCategory::CACHE, "Served from cache");
    }
    return EXIT_OK;
}

// Terminal state of every job seen on the event bus
struct FolderProgress
{
    std::mutex mutex;
    std::condition_variable changed;
    std::map<JobId, VaultEvent> finished;
};

// Path of `remote_path` below `folder` as a local relative path
std::filesystem::path relativeLocalPath(const std::string &folder, const std::string &remote_path, BackendKind kind)
{
    const char sep = PathModel::separator(kind);
    std::string base = PathModel::canonicalPath(folder, kind);
    std::string path = PathModel::canonicalPath(remote_path, kind);

    std::string rest = path.substr(std::min(base.size(), path.size()));
    std::filesystem::path relative;
    for (const std::string &part : StringUtils::split(rest, sep))
    {
        if (!part.empty())
        {
            relative /= part;
        }
    }
    return relative;
}

int runDownloadFolder(VaultCoordinator &vault, const ProgramOptions &options)
{
    const std::string &folder = options.arguments[0];
    const BackendKind kind = vault.activeAdapter()->backend().kind;

    // Registered first: cached files finish while the folder is still being walked
    auto progress = std::make_shared<FolderProgress>();
    ListenerId listener = vault.addListener(
    [progress](const VaultEvent &event)
    {
        if (event.type != EventType::TRANSFER_PROGRESS || !isTerminal(event.state))
        {
            return;
        }
        std::lock_guard<std::mutex> lock(progress->mutex);
        progress->finished[event.job_id] = event;
        progress->changed.notify_all();
    });

    std::vector<TransferJobInfo> jobs;
    VaultStatus status = vault.downloadFolder(folder, jobs);

    size_t fetched = 0;
    size_t failed = 0;
    std::vector<RemoteRef> succeeded;
    {
        std::unique_lock<std::mutex> lock(progress->mutex);
        for (const auto &job : jobs)
        {
            progress->changed.wait(lock,
                                   [&]
                                   {
                                       return progress->finished.count(job.id) != 0;
                                   });
            const VaultEvent &event = progress->finished[job.id];
            if (event.state == TransferState::SUCCEEDED)
            {
                fetched++;
                succeeded.push_back(job.remote_ref);
            }
            else
            {
                failed++;
                fmt::print(stderr, "{}: {}\n", job.remote_ref.path,
                           event.message.empty() ? transferStateToString(event.state) : event.message);
            }
        }
    }
    vault.removeListener(listener);

    if (!options.output_file.empty())
    {
        for (const auto &ref : succeeded)
        {
            auto record = vault.cache().lookup(ref);
            if (!record)
            {
                continue;
            }
            std::filesystem::path target =
            std::filesystem::path(options.output_file) / relativeLocalPath(folder, ref.path, kind);

            std::error_code ec;
            std::filesystem::create_directories(target.parent_path(), ec);
            if (!ec)
            {
                std::filesystem::copy_file(record->local_path, target, std::filesystem::copy_options::overwrite_existing,
                                           ec);
            }
            if (ec)
            {
                return reportFailure({ StatusCode::IO_ERROR, "cannot write " + target.string() + ": " + ec.message() });
            }
        }
    }

    fmt::print("fetched {} file(s), {} failed\n", fetched, failed);
    if (!isSuccess(status))
    {
        return reportFailure(status);
    }
    return failed == 0 ? EXIT_OK : EXIT_FAILED;
}

int runQuota(VaultCoordinator &vault)
{
    auto cloud = std::dynamic_pointer_cast<CloudAdapter>(vault.activeAdapter());
    if (!cloud)
    {
        return reportFailure({ StatusCode::INVALID_ARGUMENT, "quota is only reported by cloud backends" });
    }

    StorageQuota quota;
    VaultStatus status = cloud->quota(quota);
    if (!isSuccess(status))
    {
        return reportFailure(status);
    }

    fmt::print("used:      {}\n", quota.used_bytes ? StringUtils::formatSize(*quota.used_bytes) : "unknown");
    fmt::print("available: {}\n", quota.available_bytes ? StringUtils::formatSize(*quota.available_bytes) : "unlimited");
    return EXIT_OK;
}

int runUpload(VaultCoordinator &vault, const ProgramOptions &options)
{
    TransferJobInfo job = vault.upload(options.arguments[0], options.arguments[1]);
    int rc = finishTransfer(followJob(vault, job));
    if (rc == EXIT_OK)
    {
        fmt::print("uploaded {}\n", job.remote_ref.path);
    }
    return rc;
}

int runInvalidate(VaultCoordinator &vault, const ProgramOptions &options)
{
    RemoteRef ref = remoteRefFor(vault, options.arguments[0]);
    if (!vault.invalidate(ref))
    {
        return reportFailure({ StatusCode::NOT_FOUND, "nothing cached for " + ref.path });
    }
    fmt::print("{} will be fetched again on the next download\n", ref.path);
    return EXIT_OK;
}

int runRevalidate(VaultCoordinator &vault, const ProgramOptions &options)
{
    RemoteRef ref = remoteRefFor(vault, options.arguments[0]);
    VaultStatus status = vault.revalidate(ref);
    if (!isSuccess(status))
    {
        return reportFailure(status);
    }

    auto record = vault.cache().lookup(ref);
    if (!record)
    {
        fmt::print("{} is not cached\n", ref.path);
    }
    else
    {
        fmt::print("{} is {}\n", ref.path, record->stale ? "stale" : "fresh");
    }
    return EXIT_OK;
}

int runEvict(VaultCoordinator &vault, const ProgramOptions &options)
{
    std::optional<uint64_t> bytes = StringUtils::parseByteCount(options.arguments[0]);
    if (!bytes)
    {
        Logger::error_fallback("'{}' is not a byte count", options.arguments[0]);
        return EXIT_USAGE;
    }
    uint64_t freed = vault.evict(*bytes);
    fmt::print("freed {}\n", StringUtils::formatSize(freed));
    return EXIT_OK;
}

int runCache(VaultCoordinator &vault)
{
    CacheStatistics stats = vault.cache().statistics();
    fmt::print("directory: {}\n", vault.cache().directory());
    fmt::print("entries:   {} ({} stale)\n", stats.entry_count, stats.stale_count);
    fmt::print("size:      {}\n", StringUtils::formatSize(stats.total_bytes));

    for (const auto &record : vault.cache().records())
    {
        fmt::print("{:<10} {:<16} {}{}\n", StringUtils::formatSize(record.size_at_download),
                   TimeUtils::formatTimestamp(record.fetched_at), record.remote_key, record.stale ? " (stale)" : "");
    }
    return EXIT_OK;
}
} // namespace

int main(int argc, char **argv)
{
    ProgramOptions options = parseCommandLine(argc, argv);

    if (options.show_help)
    {
        printUsage();
        return EXIT_OK;
    }
    if (options.usage_error || options.command.empty())
    {
        printUsage();
        return EXIT_USAGE;
    }

    Logger::setLogFile(options.log_file);
    Logger::initialize(options.log_level, options.log_output);
    Logger::setCategoriesFromString(options.log_categories);

    const std::string &command = options.command;
    bool arguments_ok = true;
    if (command == "browse")
        arguments_ok = checkArgumentCount(options, 0, 1);
    else if (command == "download" || command == "download-folder" || command == "invalidate" ||
             command == "revalidate" || command == "evict")
        arguments_ok = checkArgumentCount(options, 1, 1);
    else if (command == "upload")
        arguments_ok = checkArgumentCount(options, 2, 2);
    else if (command == "cache" || command == "quota")
        arguments_ok = checkArgumentCount(options, 0, 0);
    else
    {
        Logger::error_fallback("Unknown command: {}", command);
        arguments_ok = false;
    }
    if (!arguments_ok)
    {
        return EXIT_USAGE;
    }

    std::optional<Config> config = ConfigParser::parseJsonFile(options.config_file);
    if (!config)
    {
        Logger::error_fallback("Could not load configuration from {}", options.config_file);
        return EXIT_FAILED;
    }
    if (!options.backend.empty())
    {
        config->active_backend = options.backend;
    }

    GlobalMetrics::initialize(config->metrics);

    int rc = EXIT_OK;
    {
        VaultCoordinator vault(*config);
        VaultStatus status = vault.initialize();
        if (!isSuccess(status))
        {
            rc = reportFailure(status);
        }
        else if (command != "cache" && !vault.activeAdapter())
        {
            rc = reportFailure({ StatusCode::INVALID_ARGUMENT, "no backend selected, use --backend NAME" });
        }
        else if (command == "browse")
            rc = runBrowse(vault, options);
        else if (command == "download")
            rc = runDownload(vault, options);
        else if (command == "download-folder")
            rc = runDownloadFolder(vault, options);
        else if (command == "upload")
            rc = runUpload(vault, options);
        else if (command == "invalidate")
            rc = runInvalidate(vault, options);
        else if (command == "revalidate")
            rc = runRevalidate(vault, options);
        else if (command == "evict")
            rc = runEvict(vault, options);
        else if (command == "cache")
            rc = runCache(vault);
        else if (command == "quota")
            rc = runQuota(vault);
    }

    GlobalMetrics::shutdown();
    Logger::shutdown();
    return rc;
}
