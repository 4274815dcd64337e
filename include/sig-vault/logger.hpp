#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace SigVault
{

enum class LogLevel : std::uint8_t
{
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    FATAL = 5,
    OFF = 6
};

enum class LogOutput : std::uint8_t
{
    CONSOLE = 0,
    FILE = 1,
    BOTH = 2,
    DISABLED = 3
};

enum class LogCategory : std::uint32_t
{
    GENERAL = 1 << 0,  // process lifecycle and CLI
    BACKEND = 1 << 1,  // adapter selection and session state
    SMB = 1 << 2,      // share I/O
    CLOUD = 1 << 3,    // WebDAV requests
    TRANSFER = 1 << 4, // engine jobs and workers
    CACHE = 1 << 5,    // local cache records
    CONFIG = 1 << 6,
    EVENTS = 1 << 7,
    METRICS = 1 << 8,
    ALL = 0xFFFFFFFF
};

// Process wide logger. Nothing is written until initialize() has run, so
// library code can log unconditionally from tests and tools.
class Logger
{
    public:
    static void initialize(LogLevel level = LogLevel::INFO, LogOutput output = LogOutput::CONSOLE);
    static void setLevel(LogLevel level);
    static void setLogFile(const std::string &filename);
    static void setCategories(std::uint32_t mask);
    static void setCategoriesFromString(const std::string &categories_str);
    static void shutdown();

    static std::optional<LogLevel> parseLevel(const std::string &name);
    static bool shouldLog(LogLevel level, LogCategory category);

    // Written to stderr regardless of initialization, for failures that
    // happen before the logger is configured.
    static void error_fallback(const std::string &message);
    static void warn_fallback(const std::string &message);

    template <typename... Args>
    static void error_fallback(const std::string &format, Args &&...args)
    {
        error_fallback(render(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn_fallback(const std::string &format, Args &&...args)
    {
        warn_fallback(render(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void log(LogLevel level, LogCategory category, const std::string &format, Args &&...args)
    {
        if (shouldLog(level, category))
        {
            instance().write(level, category, render(format, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void trace(LogCategory category, const std::string &format, Args &&...args)
    {
        log(LogLevel::TRACE, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(LogCategory category, const std::string &format, Args &&...args)
    {
        log(LogLevel::DEBUG, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(LogCategory category, const std::string &format, Args &&...args)
    {
        log(LogLevel::INFO, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(LogCategory category, const std::string &format, Args &&...args)
    {
        log(LogLevel::WARN, category, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(LogCategory category, const std::string &format, Args &&...args)
    {
        log(LogLevel::ERR, category, format, std::forward<Args>(args)...);
    }

    static const char *levelName(LogLevel level);
    static const char *categoryTag(LogCategory category);

    private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    static Logger &instance();
    void write(LogLevel level, LogCategory category, const std::string &message);
    bool openFileLocked();

    template <typename... Args>
    static std::string render(const std::string &format, Args &&...args)
    {
        if constexpr (sizeof...(args) == 0)
        {
            return format;
        }
        else
        {
            return fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
        }
    }

    LogLevel current_level{ LogLevel::INFO };
    LogOutput output_type{ LogOutput::CONSOLE };
    std::uint32_t category_mask{ static_cast<std::uint32_t>(LogCategory::ALL) };
    std::string log_filename{ "sig-vault.log" };
    std::unique_ptr<std::ofstream> log_file;
    std::mutex log_mutex;
    bool initialized{ false };
};

} // namespace SigVault
