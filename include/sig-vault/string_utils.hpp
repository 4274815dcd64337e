#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SigVault
{

class StringUtils
{
    public:
    /**
     * ASCII lower-casing; bytes >= 0x80 are left untouched so UTF-8
     * sequences survive intact
     */
    static std::string toLower(std::string value);

    /**
     * Compare two names ignoring ASCII case
     * @return negative, zero or positive like strcmp
     */
    static int compareCaseInsensitive(std::string_view lhs, std::string_view rhs);

    static std::string trim(std::string_view value);

    static std::vector<std::string> split(std::string_view value, char separator);

    /**
     * Human readable size: "512 B", "2.0 KB", "5.0 MB", "1.2 GB"
     */
    static std::string formatSize(uint64_t bytes);

    /**
     * Percent-encode a path for use in a URL, leaving '/' intact
     */
    static std::string urlEncodePath(std::string_view path);

    /**
     * Decode %XX escapes. Malformed escapes are copied verbatim.
     */
    static std::string urlDecode(std::string_view value);

    /**
     * Stable 64-bit FNV-1a hash rendered as 16 hex digits, used for cache file names
     */
    static std::string hashHex(std::string_view value);

    /**
     * "4096", "512K", "10MB", "2G" -> bytes (1024 based)
     */
    static std::optional<uint64_t> parseByteCount(const std::string &value);

    static const char *getNextArg(char *argv[], int &index, int argc);
};

} // namespace SigVault
