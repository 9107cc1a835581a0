#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "controlhub/plugin/plugin_package.hpp"
#include "controlhub/plugin/plugin_tree.hpp"
#include "test_helpers.hpp"

#include <filesystem>

namespace scoreboard::controlhub::test {

namespace fs = std::filesystem;

class PluginTreeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = temp.path() / "plugins";
        trees = std::make_unique<PluginTreeStore>(root, root / ".staging");
    }

    TempDir temp;
    fs::path root;
    std::unique_ptr<PluginTreeStore> trees;
};

TEST_F(PluginTreeStoreTest, StagedTreeInvisibleUntilFinalized) {
    const auto manifest = make_manifest("weather");
    auto staged = trees->stage_tree(1, "weather", package_files(manifest));
    ASSERT_TRUE(staged.has_value()) << staged.error().to_string();

    EXPECT_TRUE(fs::is_regular_file(staged.value() / "assets" / "logo.txt"));
    EXPECT_FALSE(trees->tree_exists("weather"));

    ASSERT_TRUE(trees->finalize_install(1, "weather").has_value());
    EXPECT_TRUE(trees->tree_exists("weather"));
    EXPECT_EQ(read_text(root / "weather" / "board.py"), "# weather\n");

    trees->discard_staging(1);
    EXPECT_FALSE(fs::exists(root / ".staging" / "tx-1"));
}

TEST_F(PluginTreeStoreTest, FinalizeRefusesExistingTree) {
    write_text(root / "weather" / "board.py", "old\n");
    ASSERT_TRUE(trees->stage_tree(2, "weather", package_files(make_manifest("weather"))).has_value());

    auto placed = trees->finalize_install(2, "weather");
    ASSERT_FALSE(placed.has_value());
    EXPECT_EQ(placed.error().code(), ErrorCode::PLUGIN_FILE_COLLISION);
    EXPECT_EQ(read_text(root / "weather" / "board.py"), "old\n");
}

TEST_F(PluginTreeStoreTest, UnsafePathsRejected) {
    PackageFiles files;
    files["../escape.py"] = "x";

    auto staged = trees->stage_tree(3, "weather", files);
    ASSERT_FALSE(staged.has_value());
    EXPECT_EQ(staged.error().code(), ErrorCode::PLUGIN_BAD_MANIFEST);
    EXPECT_FALSE(fs::exists(root / ".staging" / "escape.py"));
}

TEST_F(PluginTreeStoreTest, InvalidIdRejected) {
    auto staged = trees->stage_tree(4, "../weather", {});
    ASSERT_FALSE(staged.has_value());
    EXPECT_EQ(staged.error().code(), ErrorCode::INVALID_PARAMETER);
}

TEST_F(PluginTreeStoreTest, RemoveTree) {
    write_text(root / "weather" / "nested" / "file.txt", "x");

    ASSERT_TRUE(trees->remove_tree("weather").has_value());
    EXPECT_FALSE(trees->tree_exists("weather"));
    EXPECT_FALSE(fs::exists(root / ".weather.removed"));

    EXPECT_TRUE(trees->remove_tree("weather").has_value());
}

TEST_F(PluginTreeStoreTest, ReplaceKeepsBackupUntilDropped) {
    write_text(root / "weather" / "board.py", "old\n");
    ASSERT_TRUE(trees->stage_tree(5, "weather", package_files(make_manifest("weather", "1.1.0"))).has_value());

    ASSERT_TRUE(trees->replace_tree(5, "weather").has_value());
    EXPECT_EQ(read_text(root / "weather" / "board.py"), "# weather\n");
    EXPECT_TRUE(trees->has_backup("weather"));
    EXPECT_THAT(trees->backup_ids(), ::testing::ElementsAre("weather"));

    trees->drop_backup("weather");
    EXPECT_FALSE(trees->has_backup("weather"));
    EXPECT_TRUE(trees->restore_tree("weather").has_value());
    EXPECT_EQ(read_text(root / "weather" / "board.py"), "# weather\n");
}

TEST_F(PluginTreeStoreTest, RestorePutsPreviousTreeBack) {
    write_text(root / "weather" / "board.py", "old\n");
    ASSERT_TRUE(trees->stage_tree(6, "weather", package_files(make_manifest("weather"))).has_value());
    ASSERT_TRUE(trees->replace_tree(6, "weather").has_value());

    ASSERT_TRUE(trees->restore_tree("weather").has_value());
    EXPECT_EQ(read_text(root / "weather" / "board.py"), "old\n");
    EXPECT_FALSE(trees->has_backup("weather"));
}

TEST_F(PluginTreeStoreTest, TreeIdsSkipHiddenEntries) {
    write_text(root / "weather" / "board.py", "x");
    write_text(root / "clock" / "board.py", "x");
    write_text(root / ".staging" / "tx-1" / "a", "x");
    write_text(root / ".goal_horn.removed" / "board.py", "x");
    write_text(root / "README.txt", "x");

    EXPECT_THAT(trees->tree_ids(), ::testing::ElementsAre("clock", "weather"));

    trees->sweep_removed();
    EXPECT_FALSE(fs::exists(root / ".goal_horn.removed"));
}

TEST_F(PluginTreeStoreTest, QuarantineMovesTreeAside) {
    write_text(root / "stray" / "board.py", "x");

    auto moved = trees->quarantine_tree("stray");
    ASSERT_TRUE(moved.has_value()) << moved.error().to_string();
    EXPECT_FALSE(trees->tree_exists("stray"));
    EXPECT_EQ(moved->parent_path(), root / ".orphaned");
    EXPECT_EQ(read_text(moved.value() / "board.py"), "x");
    EXPECT_TRUE(trees->tree_ids().empty());
}

class DirectoryPackageSourceTest : public ::testing::Test {
protected:
    // Unpacks `manifest` under <packages>/<directory>.
    fs::path unpack(const PluginManifest& manifest, const std::string& directory) {
        const fs::path target = temp.path() / "packages" / directory;
        for (const auto& [relative, contents] : package_files(manifest)) {
            write_text(target / relative, contents);
        }
        return target;
    }

    TempDir temp;
};

TEST_F(DirectoryPackageSourceTest, FetchReadsEveryFile) {
    unpack(make_manifest("weather", "1.4.0"), "weather");
    DirectoryPackageSource source(temp.path() / "packages");

    auto package = source.fetch("weather");
    ASSERT_TRUE(package.has_value()) << package.error().to_string();
    EXPECT_EQ(package->manifest.id(), "weather");
    EXPECT_EQ(package->manifest.version().to_string(), "1.4.0");
    ASSERT_EQ(package->files.size(), 3u);
    EXPECT_EQ(package->files.at("assets/logo.txt"), "weather");
    EXPECT_TRUE(package->files.count(PluginManifest::kFileName));
}

TEST_F(DirectoryPackageSourceTest, UnknownPackage) {
    DirectoryPackageSource source(temp.path() / "packages");

    auto missing = source.fetch("weather");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), ErrorCode::PACKAGE_NOT_FOUND);

    auto invalid = source.fetch("../etc");
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code(), ErrorCode::PACKAGE_NOT_FOUND);
}

TEST_F(DirectoryPackageSourceTest, DirectoryMustMatchDeclaredId) {
    unpack(make_manifest("weather"), "forecast");
    DirectoryPackageSource source(temp.path() / "packages");

    auto package = source.fetch("forecast");
    ASSERT_FALSE(package.has_value());
    EXPECT_EQ(package.error().code(), ErrorCode::PLUGIN_BAD_MANIFEST);
    EXPECT_EQ(package.error().field(), "id");
}

TEST_F(DirectoryPackageSourceTest, LoadDirectoryWithoutManifest) {
    write_text(temp.path() / "loose" / "board.py", "x");

    auto package = DirectoryPackageSource::load_directory(temp.path() / "loose");
    ASSERT_FALSE(package.has_value());
    EXPECT_EQ(package.error().code(), ErrorCode::PACKAGE_NOT_FOUND);
}

}  // namespace scoreboard::controlhub::test
