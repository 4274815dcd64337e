#pragma once

#include "vault_status.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace SigVault
{

// One <d:response> of a PROPFIND multistatus body
struct DavResource
{
    std::string path; // Decoded, relative to the files root, canonical cloud form ("" is the root)
    bool is_collection = false;
    std::optional<uint64_t> content_length;
    std::optional<std::chrono::system_clock::time_point> last_modified;

    // RFC 4331 quota properties, only present when asked for. Negative
    // values (unknown, unlimited) are left unset.
    std::optional<uint64_t> quota_used_bytes;
    std::optional<uint64_t> quota_available_bytes;
};

class WebDavParser
{
    public:
    /**
     * Parses a 207 multistatus body. `root_path` is the URL path of the
     * WebDAV files root (e.g. "/remote.php/dav/files/alice/"). Hrefs outside
     * of it are skipped. Only properties reported with a 2xx propstat are
     * taken into account.
     */
    static VaultStatus parseMultistatus(std::string_view body, std::string_view root_path, std::vector<DavResource> &resources);

    // Strips scheme and authority from an absolute href
    static std::string hrefPath(std::string_view href);

    // RFC 1123 date as used by getlastmodified
    static std::optional<std::chrono::system_clock::time_point> parseHttpDate(const std::string &value);

    // The PROPFIND request body asking for the properties above
    static const char *propfindRequestBody();

    // PROPFIND body asking for the quota properties only
    static const char *quotaRequestBody();
};

} // namespace SigVault
