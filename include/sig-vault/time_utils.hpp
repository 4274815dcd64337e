#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace SigVault
{

const char *const TIME_FORMAT_DEFAULT = "%Y-%m-%d %H:%M";

class TimeUtils
{
    public:
    static int64_t toEpochMillis(std::chrono::system_clock::time_point tp);
    static std::chrono::system_clock::time_point fromEpochMillis(int64_t millis);

    static std::string formatTimestamp(std::chrono::system_clock::time_point tp, const char *format = TIME_FORMAT_DEFAULT);
    static std::string formatDuration(std::chrono::system_clock::duration duration);
};

} // namespace SigVault
