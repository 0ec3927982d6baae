#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <unistd.h>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "tools/directory_walker.hpp"

namespace {

using winsys::core::errors::get_error;
using winsys::core::errors::get_value;
using winsys::core::errors::is_error;
using winsys::tools::DirectoryListing;
using winsys::tools::DirectoryWalker;
using winsys::tools::EntryKind;
using winsys::tools::ListingStatus;
using winsys::tools::render_listing;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_directory_walker_" + winsys::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::permissions(root_ / "locked", std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

// Fails to open any directory with the given name, whoever runs the test.
class RefusingWalker : public DirectoryWalker {
public:
    explicit RefusingWalker(std::string refused) : refused_(std::move(refused)) {}

protected:
    std::filesystem::directory_iterator open_directory(const std::filesystem::path& path,
                                                       std::error_code& ec) const override {
        if (path.filename() == refused_) {
            ec = std::make_error_code(std::errc::permission_denied);
            return {};
        }
        return DirectoryWalker::open_directory(path, ec);
    }

private:
    std::string refused_;
};

std::size_t count_occurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

const DirectoryListing* find_child(const DirectoryListing& listing, const std::string& name) {
    const auto it = std::find_if(listing.subdirectories.begin(), listing.subdirectories.end(),
                                 [&name](const DirectoryListing& child) { return child.name == name; });
    return it == listing.subdirectories.end() ? nullptr : &*it;
}

TEST(DirectoryWalkerTest, ListsDirectoriesBeforeFiles) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "alpha");
    std::filesystem::create_directories(workspace.root() / "beta");
    write_file(workspace.root() / "notes.txt", "hello");

    DirectoryWalker walker;
    auto result = walker.list(workspace.root(), false, 3);
    ASSERT_FALSE(is_error(result));

    const auto& listing = get_value(result);
    EXPECT_EQ(listing.directories.size(), 2u);
    ASSERT_EQ(listing.files.size(), 1u);
    EXPECT_EQ(listing.files[0].name, "notes.txt");
    EXPECT_EQ(listing.files[0].size_bytes, 5u);
    EXPECT_FALSE(listing.recursed);

    const std::string report = render_listing(listing);
    EXPECT_EQ(report.rfind("# Directory Listing: " + workspace.root().string() + "\n\n", 0), 0u);
    EXPECT_LT(report.find("## Directories:"), report.find("## Files:"));
    EXPECT_EQ(count_occurrences(report, "\xF0\x9F\x93\x81 "), 2u);
    EXPECT_EQ(count_occurrences(report, "\xF0\x9F\x93\x84 "), 1u);
    EXPECT_NE(report.find("\xF0\x9F\x93\x84 notes.txt (5.00 B, "), std::string::npos);
    EXPECT_EQ(report.find("Subdirectories (recursive)"), std::string::npos);
}

TEST(DirectoryWalkerTest, NonPositiveDepthNeverRecurses) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "nested/deeper");

    DirectoryWalker walker;
    for (const int depth : {0, -1}) {
        auto result = walker.list(workspace.root(), true, depth);
        ASSERT_FALSE(is_error(result));
        EXPECT_FALSE(get_value(result).recursed);
        EXPECT_TRUE(get_value(result).subdirectories.empty());
        EXPECT_EQ(render_listing(get_value(result)).find("Subdirectories (recursive)"),
                  std::string::npos);
    }
}

TEST(DirectoryWalkerTest, RecursionStopsAtDepth) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "one/two/three");

    DirectoryWalker walker;
    auto result = walker.list(workspace.root(), true, 2);
    ASSERT_FALSE(is_error(result));

    const auto& listing = get_value(result);
    const auto* one = find_child(listing, "one");
    ASSERT_NE(one, nullptr);
    EXPECT_TRUE(one->recursed);
    const auto* two = find_child(*one, "two");
    ASSERT_NE(two, nullptr);
    EXPECT_FALSE(two->recursed);
    EXPECT_EQ(two->directories.size(), 1u);

    const std::string report = render_listing(listing);
    EXPECT_NE(report.find("\n### one/\n# Directory Listing: "), std::string::npos);
    EXPECT_NE(report.find("\n### two/\n"), std::string::npos);
    EXPECT_EQ(report.find("\n### three/"), std::string::npos);
}

TEST(DirectoryWalkerTest, DanglingLinkIsMarkedAndSiblingsListed) {
    TempWorkspace workspace;
    write_file(workspace.root() / "good.txt", "data");
    std::filesystem::create_symlink(workspace.root() / "missing-target",
                                    workspace.root() / "broken");

    DirectoryWalker walker;
    auto result = walker.list(workspace.root(), false, 1);
    ASSERT_FALSE(is_error(result));

    const auto& files = get_value(result).files;
    ASSERT_EQ(files.size(), 2u);
    const auto broken = std::find_if(files.begin(), files.end(),
                                     [](const auto& entry) { return entry.name == "broken"; });
    ASSERT_NE(broken, files.end());
    EXPECT_TRUE(broken->access_denied);

    const std::string report = render_listing(get_value(result));
    EXPECT_NE(report.find("\xF0\x9F\x93\x84 broken (access denied)"), std::string::npos);
    EXPECT_NE(report.find("\xF0\x9F\x93\x84 good.txt (4.00 B, "), std::string::npos);
}

TEST(DirectoryWalkerTest, UnreadableSubdirectoryIsSoftFailure) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission bits do not restrict root";
    }
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "locked/inner");
    std::filesystem::create_directories(workspace.root() / "open/inner");
    std::filesystem::permissions(workspace.root() / "locked", std::filesystem::perms::none);

    DirectoryWalker walker;
    auto result = walker.list(workspace.root(), true, 2);
    ASSERT_FALSE(is_error(result));

    const auto* locked = find_child(get_value(result), "locked");
    ASSERT_NE(locked, nullptr);
    EXPECT_EQ(locked->status, ListingStatus::AccessDenied);
    const auto* open = find_child(get_value(result), "open");
    ASSERT_NE(open, nullptr);
    EXPECT_EQ(open->status, ListingStatus::Listed);
    EXPECT_EQ(open->directories.size(), 1u);

    const std::string report = render_listing(get_value(result));
    EXPECT_NE(report.find("\n### locked/ (access denied)\n"), std::string::npos);
}

TEST(DirectoryWalkerTest, FailedNestedListingKeepsSiblings) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "alpha/inner");
    std::filesystem::create_directories(workspace.root() / "blocked/inner");
    std::filesystem::create_directories(workspace.root() / "omega/inner");
    write_file(workspace.root() / "notes.txt", "x");

    const RefusingWalker walker("blocked");
    auto result = walker.list(workspace.root(), true, 2);
    ASSERT_FALSE(is_error(result));

    const auto& listing = get_value(result);
    ASSERT_EQ(listing.subdirectories.size(), 3u);
    EXPECT_EQ(listing.files.size(), 1u);
    const auto* blocked = find_child(listing, "blocked");
    ASSERT_NE(blocked, nullptr);
    EXPECT_EQ(blocked->status, ListingStatus::AccessDenied);
    for (const char* name : {"alpha", "omega"}) {
        const auto* sibling = find_child(listing, name);
        ASSERT_NE(sibling, nullptr) << name;
        EXPECT_EQ(sibling->status, ListingStatus::Listed) << name;
        ASSERT_EQ(sibling->directories.size(), 1u) << name;
        EXPECT_EQ(sibling->directories[0].name, "inner");
    }

    const std::string report = render_listing(listing);
    EXPECT_NE(report.find("\n### blocked/ (access denied)\n"), std::string::npos);
    EXPECT_NE(report.find("\n### omega/\n"), std::string::npos);
}

TEST(DirectoryWalkerTest, RefusedRootIsAnError) {
    TempWorkspace workspace;
    const RefusingWalker walker(workspace.root().filename().string());
    auto result = walker.list(workspace.root(), true, 2);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "list_directory_failed");
}

TEST(DirectoryWalkerTest, SymlinkCycleIsListedOnce) {
    TempWorkspace workspace;
    std::filesystem::create_directories(workspace.root() / "a");
    std::filesystem::create_directory_symlink(workspace.root(), workspace.root() / "a/back");

    DirectoryWalker walker;
    auto result = walker.list(workspace.root(), true, 10);
    ASSERT_FALSE(is_error(result));

    const auto* a = find_child(get_value(result), "a");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->directories.size(), 1u);
    EXPECT_EQ(a->directories[0].kind, EntryKind::Directory);
    const auto* back = find_child(*a, "back");
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->status, ListingStatus::AlreadyListed);

    const std::string report = render_listing(get_value(result));
    EXPECT_EQ(count_occurrences(report, "### back/ (already listed)"), 1u);
}

TEST(DirectoryWalkerTest, MissingRootIsAnError) {
    TempWorkspace workspace;
    DirectoryWalker walker;
    auto result = walker.list(workspace.root() / "does-not-exist", false, 3);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "list_directory_failed");
    EXPECT_NE(get_error(result).message.find("Cannot list directory"), std::string::npos);
}

}  // namespace
