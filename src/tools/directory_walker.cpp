#include "tools/directory_walker.hpp"

#include <sstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

ListingEntry inspect_entry(const std::filesystem::directory_entry& entry) {
    ListingEntry item;
    item.name = entry.path().filename().string();

    std::error_code ec;
    const auto status = entry.status(ec);
    if (ec || !std::filesystem::exists(status)) {
        // Dangling link or unreadable target: classify by the entry itself.
        std::error_code link_ec;
        const auto own_status = entry.symlink_status(link_ec);
        item.kind = (!link_ec && std::filesystem::is_directory(own_status))
                        ? EntryKind::Directory
                        : EntryKind::File;
        item.access_denied = true;
        return item;
    }

    item.kind = std::filesystem::is_directory(status) ? EntryKind::Directory
                                                      : EntryKind::File;

    if (std::filesystem::is_regular_file(status)) {
        const auto size = std::filesystem::file_size(entry.path(), ec);
        if (ec) {
            item.access_denied = true;
            return item;
        }
        item.has_size = true;
        item.size_bytes = size;
    }

    const auto modified = std::filesystem::last_write_time(entry.path(), ec);
    if (ec) {
        item.access_denied = true;
        return item;
    }
    item.modified = format::format_date(modified);
    return item;
}

std::filesystem::path canonical_or_empty(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        return {};
    }
    return canonical;
}

std::string render_directory(const ListingEntry& entry) {
    if (entry.access_denied) {
        return "\xF0\x9F\x93\x81 " + entry.name + "/ (access denied)";
    }
    return "\xF0\x9F\x93\x81 " + entry.name + "/ (" + entry.modified + ")";
}

std::string render_file(const ListingEntry& entry) {
    if (entry.access_denied) {
        return "\xF0\x9F\x93\x84 " + entry.name + " (access denied)";
    }
    if (!entry.has_size) {
        return "\xF0\x9F\x93\x84 " + entry.name + " (" + entry.modified + ")";
    }
    return "\xF0\x9F\x93\x84 " + entry.name + " (" +
           format::format_bytes(static_cast<double>(entry.size_bytes)) + ", " +
           entry.modified + ")";
}

}  // namespace

std::filesystem::directory_iterator DirectoryWalker::open_directory(
    const std::filesystem::path& path, std::error_code& ec) const {
    return std::filesystem::directory_iterator(path, ec);
}

core::errors::Result<DirectoryListing> DirectoryWalker::list(
    const std::filesystem::path& path, const bool recursive,
    const int max_depth) const {
    std::set<std::filesystem::path> visited;
    const auto root = canonical_or_empty(path);
    if (!root.empty()) {
        visited.insert(root);
    }
    return list_level(path, recursive, max_depth, visited);
}

core::errors::Result<DirectoryListing> DirectoryWalker::list_level(
    const std::filesystem::path& path, const bool recursive, const int depth,
    std::set<std::filesystem::path>& visited) const {
    std::error_code ec;
    auto it = open_directory(path, ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution,
                         "Cannot list directory " + path.string() + ": " + ec.message(),
                         "list_directory_failed"};
    }

    DirectoryListing listing;
    listing.path = path;
    listing.name = path.filename().string();

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        ListingEntry item = inspect_entry(*it);
        if (item.kind == EntryKind::Directory) {
            listing.directories.push_back(std::move(item));
        } else {
            listing.files.push_back(std::move(item));
        }
    }
    if (ec) {
        WINSYS_LOG_WARN("Directory enumeration stopped early in " + path.string() +
                        ": " + ec.message());
    }

    if (!recursive || depth <= 0) {
        return listing;
    }

    listing.recursed = true;
    for (const auto& directory : listing.directories) {
        const auto child_path = path / directory.name;

        const auto canonical = canonical_or_empty(child_path);
        if (!canonical.empty() && !visited.insert(canonical).second) {
            DirectoryListing repeated;
            repeated.path = child_path;
            repeated.name = directory.name;
            repeated.status = ListingStatus::AlreadyListed;
            listing.subdirectories.push_back(std::move(repeated));
            continue;
        }

        auto child = list_level(child_path, true, depth - 1, visited);
        if (core::errors::is_error(child)) {
            WINSYS_LOG_DEBUG(core::errors::get_error(child).message);
            DirectoryListing denied;
            denied.path = child_path;
            denied.name = directory.name;
            denied.status = ListingStatus::AccessDenied;
            listing.subdirectories.push_back(std::move(denied));
            continue;
        }
        listing.subdirectories.push_back(std::get<DirectoryListing>(std::move(child)));
    }
    return listing;
}

std::string render_listing(const DirectoryListing& listing) {
    std::ostringstream out;
    out << "# Directory Listing: " << listing.path.string() << "\n\n";

    out << "## Directories:\n";
    for (std::size_t i = 0; i < listing.directories.size(); ++i) {
        out << (i == 0 ? "" : "\n") << render_directory(listing.directories[i]);
    }
    out << "\n\n## Files:\n";
    for (std::size_t i = 0; i < listing.files.size(); ++i) {
        out << (i == 0 ? "" : "\n") << render_file(listing.files[i]);
    }

    if (listing.recursed) {
        out << "\n\n## Subdirectories (recursive):\n";
        for (const auto& child : listing.subdirectories) {
            switch (child.status) {
                case ListingStatus::Listed:
                    out << "\n### " << child.name << "/\n" << render_listing(child) << "\n";
                    break;
                case ListingStatus::AccessDenied:
                    out << "\n### " << child.name << "/ (access denied)\n";
                    break;
                case ListingStatus::AlreadyListed:
                    out << "\n### " << child.name << "/ (already listed)\n";
                    break;
            }
        }
    }
    return out.str();
}

}  // namespace winsys::tools
