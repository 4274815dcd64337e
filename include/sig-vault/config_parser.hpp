#pragma once

#include "../types/config.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace SigVault
{

class ConfigParser
{
    public:
    static std::optional<Config> parseJsonFile(std::string_view file_path);
    static std::optional<Config> parseJsonString(std::string_view json_content);

    // Nextcloud/ownCloud: <base>/remote.php/dav/files/<username>/
    static std::string normalizeCloudBaseUrl(const std::string &base_url, const std::string &username);

    static constexpr size_t MIN_CONCURRENT_TRANSFERS = 1;
    static constexpr size_t MAX_CONCURRENT_TRANSFERS = 16;
};

} // namespace SigVault
