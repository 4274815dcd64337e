#include <sig-vault/string_utils.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fmt/format.h>

namespace SigVault
{

namespace
{
char asciiLower(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

std::string StringUtils::toLower(std::string value)
{
    for (char &c : value)
    {
        c = asciiLower(c);
    }
    return value;
}

int StringUtils::compareCaseInsensitive(std::string_view lhs, std::string_view rhs)
{
    size_t common = std::min(lhs.size(), rhs.size());
    for (size_t i = 0; i < common; ++i)
    {
        unsigned char a = static_cast<unsigned char>(asciiLower(lhs[i]));
        unsigned char b = static_cast<unsigned char>(asciiLower(rhs[i]));
        if (a != b)
        {
            return a < b ? -1 : 1;
        }
    }

    if (lhs.size() == rhs.size())
    {
        return 0;
    }
    return lhs.size() < rhs.size() ? -1 : 1;
}

std::string StringUtils::trim(std::string_view value)
{
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return std::string();
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(start, end - start + 1));
}

std::vector<std::string> StringUtils::split(std::string_view value, char separator)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (true)
    {
        size_t pos = value.find(separator, start);
        if (pos == std::string_view::npos)
        {
            parts.emplace_back(value.substr(start));
            return parts;
        }
        parts.emplace_back(value.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string StringUtils::formatSize(uint64_t bytes)
{
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    if (bytes >= GB)
    {
        return fmt::format("{:.1f} GB", static_cast<double>(bytes) / GB);
    }
    if (bytes >= MB)
    {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    }
    if (bytes >= KB)
    {
        return fmt::format("{:.1f} KB", static_cast<double>(bytes) / KB);
    }
    return fmt::format("{} B", bytes);
}

std::string StringUtils::urlEncodePath(std::string_view path)
{
    std::string encoded;
    encoded.reserve(path.size());

    for (unsigned char c : path)
    {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                          c == '.' || c == '_' || c == '~' || c == '/';
        if (unreserved)
        {
            encoded += static_cast<char>(c);
        }
        else
        {
            encoded += fmt::format("%{:02X}", c);
        }
    }

    return encoded;
}

std::string StringUtils::urlDecode(std::string_view value)
{
    std::string decoded;
    decoded.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '%' && i + 2 < value.size())
        {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0)
            {
                decoded += static_cast<char>((high << 4) | low);
                i += 2;
                continue;
            }
        }
        decoded += value[i];
    }

    return decoded;
}

std::string StringUtils::hashHex(std::string_view value)
{
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : value)
    {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return fmt::format("{:016x}", hash);
}

std::optional<uint64_t> StringUtils::parseByteCount(const std::string &value)
{
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0])))
    {
        return std::nullopt;
    }

    char *end = nullptr;
    errno = 0;
    unsigned long long number = std::strtoull(value.c_str(), &end, 10);
    if (errno == ERANGE)
    {
        return std::nullopt;
    }

    std::string suffix = toLower(std::string(end));
    uint64_t multiplier = 1;
    if (suffix.empty() || suffix == "b")
        multiplier = 1;
    else if (suffix == "k" || suffix == "kb")
        multiplier = 1024ULL;
    else if (suffix == "m" || suffix == "mb")
        multiplier = 1024ULL * 1024;
    else if (suffix == "g" || suffix == "gb")
        multiplier = 1024ULL * 1024 * 1024;
    else
        return std::nullopt;

    return static_cast<uint64_t>(number) * multiplier;
}

const char *StringUtils::getNextArg(char *argv[], int &index, int argc)
{
    if (index + 1 < argc)
    {
        return argv[++index];
    }
    return nullptr;
}

} // namespace SigVault
