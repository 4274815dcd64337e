#include <sig-vault/time_utils.hpp>
#include <ctime>
#include <fmt/chrono.h>

namespace SigVault
{

int64_t TimeUtils::toEpochMillis(std::chrono::system_clock::time_point tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::fromEpochMillis(int64_t millis)
{
    return std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis)));
}

std::string TimeUtils::formatTimestamp(std::chrono::system_clock::time_point tp, const char *format)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);
    return fmt::format(fmt::runtime(fmt::format("{{:{}}}", format)), local_tm);
}

std::string TimeUtils::formatDuration(std::chrono::system_clock::duration duration)
{
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();

    if (seconds < 60)
    {
        return fmt::format("{} seconds", seconds);
    }
    if (seconds < 3600)
    {
        return fmt::format("{} minutes", seconds / 60);
    }
    if (seconds < 86400)
    {
        return fmt::format("{} hours", seconds / 3600);
    }
    return fmt::format("{} days", seconds / 86400);
}

} // namespace SigVault
