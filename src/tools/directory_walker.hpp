#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace winsys::tools {

enum class EntryKind {
    File,
    Directory
};

struct ListingEntry {
    std::string name;
    EntryKind kind = EntryKind::File;
    bool access_denied = false;   // stat failed; size and date are unknown
    bool has_size = false;        // regular files only
    std::uintmax_t size_bytes = 0;
    std::string modified;         // YYYY-MM-DD
};

enum class ListingStatus {
    Listed,
    AccessDenied,    // the nested listing failed outright
    AlreadyListed    // canonical path seen earlier in the same traversal
};

struct DirectoryListing {
    std::filesystem::path path;
    std::string name;
    ListingStatus status = ListingStatus::Listed;
    std::vector<ListingEntry> directories;
    std::vector<ListingEntry> files;
    bool recursed = false;
    std::vector<DirectoryListing> subdirectories;
};

// Lists a directory, optionally descending while depth remains. Entries keep
// the order the file system returned them in; directories are rendered first.
class DirectoryWalker {
public:
    virtual ~DirectoryWalker() = default;

    core::errors::Result<DirectoryListing> list(const std::filesystem::path& path,
                                                bool recursive, int max_depth) const;

protected:
    // Opens one level of the traversal; a set error code fails that level only.
    virtual std::filesystem::directory_iterator open_directory(
        const std::filesystem::path& path, std::error_code& ec) const;

private:
    core::errors::Result<DirectoryListing> list_level(
        const std::filesystem::path& path, bool recursive, int depth,
        std::set<std::filesystem::path>& visited) const;
};

std::string render_listing(const DirectoryListing& listing);

}  // namespace winsys::tools
