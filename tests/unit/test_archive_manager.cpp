#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/loop_errors.hpp"
#include "session/archive_manager.hpp"

namespace {

using storyloop::core::errors::get_value;
using storyloop::core::errors::is_error;
using storyloop::session::ArchiveManager;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_archive_manager_" + storyloop::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
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

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

TEST(ArchiveManagerTest, FirstRunOnlyRemembersBranch) {
    TempWorkspace workspace;
    write_file(workspace.root() / "backlog.json", "{}");
    ArchiveManager archives(workspace.root(), "backlog.json", "progress.txt");

    auto result = archives.archive_if_branch_changed("storyloop/login");
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).has_value());
    EXPECT_EQ(archives.last_branch(), "storyloop/login");
    EXPECT_FALSE(std::filesystem::exists(workspace.root() / "archive"));
}

TEST(ArchiveManagerTest, SameBranchDoesNotArchive) {
    TempWorkspace workspace;
    write_file(workspace.root() / "backlog.json", "{}");
    write_file(workspace.root() / "progress.txt", "notes");
    ArchiveManager archives(workspace.root(), "backlog.json", "progress.txt");
    ASSERT_FALSE(is_error(archives.save_last_branch("storyloop/login")));

    auto result = archives.archive_if_branch_changed("storyloop/login");
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).has_value());
    EXPECT_EQ(read_file(workspace.root() / "progress.txt"), "notes");
}

TEST(ArchiveManagerTest, BranchChangeArchivesPreviousRun) {
    TempWorkspace workspace;
    write_file(workspace.root() / "backlog.json", "{\"old\": true}");
    write_file(workspace.root() / "progress.txt", "old notes");
    ArchiveManager archives(workspace.root(), "backlog.json", "progress.txt");
    ASSERT_FALSE(is_error(archives.save_last_branch("storyloop/team/login")));

    auto result = archives.archive_if_branch_changed("storyloop/checkout");
    ASSERT_FALSE(is_error(result));
    ASSERT_TRUE(get_value(result).has_value());

    const auto archived = get_value(result).value();
    EXPECT_EQ(archived.parent_path().filename().string(), "archive");
    EXPECT_TRUE(ends_with(archived.filename().string(), "-team-login"));
    EXPECT_EQ(read_file(archived / "backlog.json"), "{\"old\": true}");
    EXPECT_EQ(read_file(archived / "progress.txt"), "old notes");

    const auto fresh_progress = read_file(workspace.root() / "progress.txt");
    EXPECT_EQ(fresh_progress.rfind("# storyloop progress log", 0), 0u);
    EXPECT_EQ(archives.last_branch(), "storyloop/checkout");
}

TEST(ArchiveManagerTest, ArchiveWithNothingToCopyIsEmpty) {
    TempWorkspace workspace;
    ArchiveManager archives(workspace.root(), "backlog.json", "progress.txt");

    auto result = archives.archive("storyloop/login");
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).has_value());
}

TEST(ArchiveManagerTest, InitializeProgressKeepsExistingFile) {
    TempWorkspace workspace;
    ArchiveManager archives(workspace.root(), "backlog.json", "logs/progress.txt");

    auto created = archives.initialize_progress_file();
    ASSERT_FALSE(is_error(created));
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / "logs" / "progress.txt"));

    write_file(workspace.root() / "logs" / "progress.txt", "kept");
    ASSERT_FALSE(is_error(archives.initialize_progress_file()));
    EXPECT_EQ(read_file(workspace.root() / "logs" / "progress.txt"), "kept");
}

}  // namespace
