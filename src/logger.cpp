#include <sig-vault/logger.hpp>
#include <sig-vault/string_utils.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <iostream>

namespace SigVault
{

namespace
{

struct CategoryName
{
    const char *name;
    LogCategory category;
};

constexpr CategoryName category_names[] = {
    { "general", LogCategory::GENERAL },   { "backend", LogCategory::BACKEND }, { "smb", LogCategory::SMB },
    { "cloud", LogCategory::CLOUD },       { "dav", LogCategory::CLOUD },       { "transfer", LogCategory::TRANSFER },
    { "cache", LogCategory::CACHE },       { "config", LogCategory::CONFIG },   { "events", LogCategory::EVENTS },
    { "metrics", LogCategory::METRICS },
};

// Small per-thread number so worker output can be told apart
unsigned threadTag()
{
    static std::atomic<unsigned> next{ 0 };
    thread_local unsigned tag = next++;
    return tag;
}

std::string timestampNow()
{
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d}", local_tm, ms);
}

} // namespace

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::initialize(LogLevel level, LogOutput output)
{
    Logger &self = instance();
    std::lock_guard<std::mutex> lock(self.log_mutex);

    self.current_level = level;
    self.output_type = output;
    self.initialized = true;

    if ((output == LogOutput::FILE || output == LogOutput::BOTH) && !self.openFileLocked())
    {
        self.output_type = LogOutput::CONSOLE;
        std::cerr << fmt::format("sig-vault: cannot open log file '{}', logging to console\n", self.log_filename);
    }
}

bool Logger::openFileLocked()
{
    log_file = std::make_unique<std::ofstream>(log_filename, std::ios::app);
    if (!log_file->is_open())
    {
        log_file.reset();
        return false;
    }
    return true;
}

void Logger::setLevel(LogLevel level)
{
    Logger &self = instance();
    std::lock_guard<std::mutex> lock(self.log_mutex);
    self.current_level = level;
}

void Logger::setLogFile(const std::string &filename)
{
    Logger &self = instance();
    std::lock_guard<std::mutex> lock(self.log_mutex);

    self.log_filename = filename;
    if (self.initialized && (self.output_type == LogOutput::FILE || self.output_type == LogOutput::BOTH) &&
        !self.openFileLocked())
    {
        std::cerr << fmt::format("sig-vault: cannot open log file '{}'\n", filename);
    }
}

void Logger::setCategories(std::uint32_t mask)
{
    Logger &self = instance();
    std::lock_guard<std::mutex> lock(self.log_mutex);
    self.category_mask = mask;
}

void Logger::setCategoriesFromString(const std::string &categories_str)
{
    std::uint32_t mask = 0;

    for (const std::string &part : StringUtils::split(categories_str, ','))
    {
        std::string name = StringUtils::toLower(StringUtils::trim(part));
        if (name.empty())
        {
            continue;
        }
        if (name == "all")
        {
            mask = static_cast<std::uint32_t>(LogCategory::ALL);
            continue;
        }

        bool known = false;
        for (const CategoryName &entry : category_names)
        {
            if (name == entry.name)
            {
                mask |= static_cast<std::uint32_t>(entry.category);
                known = true;
            }
        }
        if (!known)
        {
            warn_fallback("Unknown log category '{}'", name);
        }
    }

    setCategories(mask);
}

void Logger::shutdown()
{
    Logger &self = instance();
    std::lock_guard<std::mutex> lock(self.log_mutex);

    if (self.log_file)
    {
        self.log_file->flush();
    }
    self.log_file.reset();
    self.initialized = false;
}

std::optional<LogLevel> Logger::parseLevel(const std::string &name)
{
    std::string lowered = StringUtils::toLower(name);
    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::WARN;
    if (lowered == "error")
        return LogLevel::ERR;
    if (lowered == "fatal")
        return LogLevel::FATAL;
    if (lowered == "off")
        return LogLevel::OFF;
    return std::nullopt;
}

bool Logger::shouldLog(LogLevel level, LogCategory category)
{
    Logger &self = instance();
    std::lock_guard<std::mutex> lock(self.log_mutex);
    return self.initialized && self.output_type != LogOutput::DISABLED && level != LogLevel::OFF &&
           level >= self.current_level && (self.category_mask & static_cast<std::uint32_t>(category)) != 0;
}

const char *Logger::levelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::TRACE:
        return "TRACE";
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERR:
        return "ERROR";
    case LogLevel::FATAL:
        return "FATAL";
    default:
        return "OFF";
    }
}

const char *Logger::categoryTag(LogCategory category)
{
    switch (category)
    {
    case LogCategory::GENERAL:
        return "GEN";
    case LogCategory::BACKEND:
        return "BCK";
    case LogCategory::SMB:
        return "SMB";
    case LogCategory::CLOUD:
        return "DAV";
    case LogCategory::TRANSFER:
        return "XFR";
    case LogCategory::CACHE:
        return "CAC";
    case LogCategory::CONFIG:
        return "CFG";
    case LogCategory::EVENTS:
        return "EVT";
    case LogCategory::METRICS:
        return "MET";
    default:
        return "UNK";
    }
}

void Logger::write(LogLevel level, LogCategory category, const std::string &message)
{
    std::string line = fmt::format("[{}] [{:<5}] [{}] [t{}] {}\n", timestampNow(), levelName(level),
                                   categoryTag(category), threadTag(), message);

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!initialized)
    {
        return;
    }

    // stdout carries command output, so console logging always goes to stderr
    if (output_type == LogOutput::CONSOLE || output_type == LogOutput::BOTH)
    {
        std::cerr << line;
    }
    if ((output_type == LogOutput::FILE || output_type == LogOutput::BOTH) && log_file)
    {
        *log_file << line;
        log_file->flush();
    }
}

void Logger::error_fallback(const std::string &message)
{
    std::cerr << fmt::format("sig-vault: error: {}\n", message);
}

void Logger::warn_fallback(const std::string &message)
{
    std::cerr << fmt::format("sig-vault: warning: {}\n", message);
}

} // namespace SigVault
