#pragma once

#include "../types/entry.hpp"
#include "vault_status.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace SigVault
{

/**
 * Backend-agnostic naming rules. No I/O happens here.
 *
 * SMB paths are share relative and use '\', cloud paths use '/'. The two are
 * never mixed: joinPath picks the separator from the backend kind and
 * normalize rejects names carrying either separator the backend treats as one.
 */
class PathModel
{
    public:
    static char separator(BackendKind kind);

    // Validates a single path component. On success `name` receives the
    // accepted name.
    static VaultStatus normalize(std::string_view raw_name, BackendKind kind, std::string &name);

    static std::string joinPath(std::string_view parent, std::string_view name, BackendKind kind);

    // Parent directory of a path ("" for the root) and its last component
    static std::string parentPath(std::string_view path, BackendKind kind);
    static std::string baseName(std::string_view path, BackendKind kind);

    // Canonical form: single separators, no trailing separator, no leading
    // separator for cloud paths and a single leading '\' for SMB paths.
    static std::string canonicalPath(std::string_view path, BackendKind kind);

    // True for ".", ".." and names the SMB listing reports but never represent
    // real files (empty, whitespace only, a lone byte-order mark, control characters)
    static bool isPseudoEntry(std::string_view name);

    // Drops pseudo entries, de-duplicates by name keeping the first seen and
    // orders directories first, then case-insensitive by name.
    static void finalizeListing(std::vector<Entry> &entries);

    static bool listingOrderLess(const Entry &lhs, const Entry &rhs);

    static MediaType classifyMedia(std::string_view name);
};

} // namespace SigVault
