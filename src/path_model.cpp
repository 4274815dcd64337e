#include <sig-vault/path_model.hpp>
#include <sig-vault/string_utils.hpp>
#include <algorithm>
#include <array>
#include <unordered_set>

namespace SigVault
{

namespace
{
constexpr std::array<std::string_view, 8> IMAGE_EXTENSIONS = { ".jpg", ".jpeg", ".png", ".bmp",
                                                               ".gif", ".tiff", ".heic", ".webp" };
constexpr std::array<std::string_view, 5> VIDEO_EXTENSIONS = { ".mp4", ".mov", ".avi", ".mkv", ".webm" };

bool isSeparatorFor(char c, BackendKind kind)
{
    if (kind == BackendKind::SMB)
    {
        // SMB servers reject both forms inside a component
        return c == '\\' || c == '/';
    }
    return c == '/';
}
} // namespace

char PathModel::separator(BackendKind kind)
{
    return kind == BackendKind::SMB ? '\\' : '/';
}

VaultStatus PathModel::normalize(std::string_view raw_name, BackendKind kind, std::string &name)
{
    if (raw_name.empty())
    {
        return { StatusCode::INVALID_NAME, "empty name" };
    }

    if (raw_name == "." || raw_name == "..")
    {
        return { StatusCode::INVALID_NAME, "'" + std::string(raw_name) + "' is not a valid name" };
    }

    for (char c : raw_name)
    {
        if (isSeparatorFor(c, kind))
        {
            return { StatusCode::INVALID_NAME, "'" + std::string(raw_name) + "' contains a path separator" };
        }
    }

    if (isPseudoEntry(raw_name))
    {
        return { StatusCode::INVALID_NAME, "'" + std::string(raw_name) + "' is not a valid name" };
    }

    name.assign(raw_name);
    return VaultStatus::success();
}

std::string PathModel::joinPath(std::string_view parent, std::string_view name, BackendKind kind)
{
    const char sep = separator(kind);
    std::string result = canonicalPath(parent, kind);

    if (result.empty() || result.back() != sep)
    {
        result += sep;
    }
    if (kind == BackendKind::CLOUD && result == "/")
    {
        result.clear();
    }

    result.append(name);
    return result;
}

std::string PathModel::parentPath(std::string_view path, BackendKind kind)
{
    std::string canonical = canonicalPath(path, kind);
    size_t last = canonical.find_last_of(separator(kind));
    if (last == std::string::npos)
    {
        return "";
    }
    if (last == 0)
    {
        return kind == BackendKind::SMB ? std::string(1, separator(kind)) : "";
    }
    return canonical.substr(0, last);
}

std::string PathModel::baseName(std::string_view path, BackendKind kind)
{
    std::string canonical = canonicalPath(path, kind);
    size_t last = canonical.find_last_of(separator(kind));
    return last == std::string::npos ? canonical : canonical.substr(last + 1);
}

std::string PathModel::canonicalPath(std::string_view path, BackendKind kind)
{
    const char sep = separator(kind);
    std::string result;
    result.reserve(path.size() + 1);

    if (kind == BackendKind::SMB)
    {
        result += sep;
    }

    for (char c : path)
    {
        // Callers may hand either separator; the output never mixes them
        char mapped = (c == '\\' || c == '/') ? sep : c;
        if (mapped == sep && !result.empty() && result.back() == sep)
        {
            continue;
        }
        if (mapped == sep && result.empty())
        {
            continue;
        }
        result += mapped;
    }

    if (result.size() > 1 && result.back() == sep)
    {
        result.pop_back();
    }

    return result;
}

bool PathModel::isPseudoEntry(std::string_view name)
{
    if (name.empty() || name == "." || name == "..")
    {
        return true;
    }

    // UTF-8 encoded byte-order mark on its own
    if (name == "\xEF\xBB\xBF")
    {
        return true;
    }

    bool has_visible = false;
    for (unsigned char c : name)
    {
        if (c < 0x20 || c == 0x7F)
        {
            return true;
        }
        if (c != ' ' && c != '\t')
        {
            has_visible = true;
        }
    }

    return !has_visible;
}

bool PathModel::listingOrderLess(const Entry &lhs, const Entry &rhs)
{
    if (lhs.isDirectory() != rhs.isDirectory())
    {
        return lhs.isDirectory();
    }

    int folded = StringUtils::compareCaseInsensitive(lhs.name, rhs.name);
    if (folded != 0)
    {
        return folded < 0;
    }

    // Names equal ignoring case: byte order keeps the result deterministic
    return lhs.name < rhs.name;
}

void PathModel::finalizeListing(std::vector<Entry> &entries)
{
    std::unordered_set<std::string> seen;
    std::vector<Entry> kept;
    kept.reserve(entries.size());

    for (auto &entry : entries)
    {
        if (isPseudoEntry(entry.name))
        {
            continue;
        }
        if (!seen.insert(entry.name).second)
        {
            continue;
        }
        kept.push_back(std::move(entry));
    }

    std::stable_sort(kept.begin(), kept.end(), listingOrderLess);
    entries = std::move(kept);
}

MediaType PathModel::classifyMedia(std::string_view name)
{
    size_t dot = name.find_last_of('.');
    if (dot == std::string_view::npos)
    {
        return MediaType::OTHER;
    }

    std::string extension = StringUtils::toLower(std::string(name.substr(dot)));

    if (std::find(IMAGE_EXTENSIONS.begin(), IMAGE_EXTENSIONS.end(), extension) != IMAGE_EXTENSIONS.end())
    {
        return MediaType::IMAGE;
    }
    if (std::find(VIDEO_EXTENSIONS.begin(), VIDEO_EXTENSIONS.end(), extension) != VIDEO_EXTENSIONS.end())
    {
        return MediaType::VIDEO;
    }
    return MediaType::OTHER;
}

} // namespace SigVault
