#include <gtest/gtest.h>
#include "controlhub/config/config_store.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <memory>

namespace scoreboard::controlhub::test {

namespace fs = std::filesystem;

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        paths.canonical = temp.path() / "config" / ".controlhub" / "config.json";
        paths.staging_dir = temp.path() / "config" / ".controlhub" / "staging";
        paths.live = temp.path() / "config" / "config.json";
        paths.max_backups = 2;
        store = std::make_unique<ConfigStore>(paths);
    }

    // Seeds version 1 from valid_config().
    void seed() {
        auto seeded = store->seed(valid_config());
        ASSERT_TRUE(seeded.has_value()) << seeded.error().to_string();
    }

    TempDir temp;
    ConfigStorePaths paths;
    std::unique_ptr<ConfigStore> store;
};

TEST_F(ConfigStoreTest, ReadWithoutCanonicalIsUnavailable) {
    auto result = store->read();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::STORE_UNAVAILABLE);
    EXPECT_FALSE(store->exists());
}

TEST_F(ConfigStoreTest, SeedCommitsVersionOne) {
    seed();

    auto document = store->read();
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ(document->version(), 1u);
    EXPECT_EQ(document->get_string("preferences.location").value_or(""), "Montreal");
    EXPECT_TRUE(store->backups().empty());
}

TEST_F(ConfigStoreTest, SeedKeepsExistingDocument) {
    seed();
    ConfigDocument other;
    ASSERT_TRUE(other.set("debug", true).has_value());

    auto result = store->seed(other);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->get_bool("debug").value_or(true));
}

TEST_F(ConfigStoreTest, SeedMovesCorruptFileAside) {
    write_text(paths.canonical, "{ not json");

    auto result = store->seed(valid_config());
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(result->version(), 1u);

    bool found_corrupt = false;
    for (const auto& entry : fs::directory_iterator(paths.canonical.parent_path())) {
        const auto name = entry.path().filename().string();
        found_corrupt = found_corrupt || name.find(".corrupt.bak") != std::string::npos;
    }
    EXPECT_TRUE(found_corrupt);
}

TEST_F(ConfigStoreTest, StagingNeverChangesRead) {
    seed();
    const std::string before = read_text(paths.canonical);

    auto candidate = store->read().value();
    ASSERT_TRUE(candidate.set("preferences.live_game_refresh_rate", 30).has_value());
    auto handle = store->stage(candidate);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->base_version(), 1u);
    EXPECT_EQ(handle->staged_version(), 2u);
    EXPECT_TRUE(fs::exists(handle->path()));

    EXPECT_EQ(read_text(paths.canonical), before);
    EXPECT_EQ(store->read()->get_int("preferences.live_game_refresh_rate").value_or(0), 15);

    store->discard(*handle);
    EXPECT_FALSE(handle->active());
    EXPECT_FALSE(fs::exists(handle->path()));
    EXPECT_EQ(read_text(paths.canonical), before);
}

TEST_F(ConfigStoreTest, CommitReplacesCanonicalAndBacksUp) {
    seed();
    auto candidate = store->read().value();
    ASSERT_TRUE(candidate.set("preferences.live_game_refresh_rate", 30).has_value());
    auto handle = store->stage(candidate).value();

    auto committed = store->commit(handle);
    ASSERT_TRUE(committed.has_value()) << committed.error().to_string();

    auto document = store->read().value();
    EXPECT_EQ(document.version(), 2u);
    EXPECT_EQ(document.get_int("preferences.live_game_refresh_rate").value_or(0), 30);
    EXPECT_EQ(store->backups().size(), 1u);
    EXPECT_FALSE(handle.active());
}

TEST_F(ConfigStoreTest, CommitTwiceIsInvalidState) {
    seed();
    auto handle = store->stage(store->read().value()).value();
    ASSERT_TRUE(store->commit(handle).has_value());

    auto again = store->commit(handle);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), ErrorCode::INVALID_STATE);
}

TEST_F(ConfigStoreTest, StaleStageRejected) {
    seed();
    const auto base = store->read().value();
    auto first = store->stage(base).value();
    auto second = store->stage(base).value();

    ASSERT_TRUE(store->commit(first).has_value());
    const std::string after_first = read_text(paths.canonical);

    auto result = store->commit(second);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::STALE_STAGE);
    EXPECT_EQ(read_text(paths.canonical), after_first);
    store->discard(second);
}

TEST_F(ConfigStoreTest, BackupsArePruned) {
    seed();
    for (int rate = 20; rate < 25; ++rate) {
        auto candidate = store->read().value();
        ASSERT_TRUE(candidate.set("preferences.live_game_refresh_rate", rate).has_value());
        auto handle = store->stage(candidate).value();
        ASSERT_TRUE(store->commit(handle).has_value());
    }

    EXPECT_EQ(store->backups().size(), paths.max_backups);
    EXPECT_EQ(store->read()->version(), 6u);
}

TEST_F(ConfigStoreTest, SnapshotRestoresExactBytes) {
    seed();
    auto candidate = store->read().value();
    ASSERT_TRUE(candidate.set("debug", true).has_value());
    auto changed = store->stage(candidate).value();
    ASSERT_TRUE(store->commit(changed).has_value());

    // Odd spacing proves the bytes are committed without re-serialization.
    const std::string raw = "{\"_controlhub\": {\"version\": 2},   \"debug\": false}\n";
    const size_t backups_before = store->backups().size();

    auto snapshot = store->stage_snapshot(raw);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->kind(), StagedHandle::Kind::Snapshot);
    EXPECT_EQ(snapshot->base_version(), 2u);
    EXPECT_EQ(snapshot->staged_version(), 2u);
    ASSERT_TRUE(store->commit(*snapshot).has_value());

    EXPECT_EQ(read_text(paths.canonical), raw);
    EXPECT_EQ(store->backups().size(), backups_before);
}

TEST_F(ConfigStoreTest, SnapshotRejectsGarbage) {
    auto result = store->stage_snapshot("not a document");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::STAGE_FAILED);
}

TEST_F(ConfigStoreTest, PublishStripsMetadata) {
    seed();
    auto candidate = store->read().value();
    ASSERT_TRUE(candidate.set("preferences.location", "Quebec").has_value());
    auto handle = store->stage(candidate).value();

    ASSERT_TRUE(store->publish(handle).has_value());
    auto live = ConfigDocument::parse(read_text(paths.live)).value();
    EXPECT_EQ(live.get_string("preferences.location").value_or(""), "Quebec");
    EXPECT_FALSE(live.root().contains(ConfigDocument::kReservedSection));

    store->discard(handle);
    ASSERT_TRUE(store->publish_canonical().has_value());
    live = ConfigDocument::parse(read_text(paths.live)).value();
    EXPECT_EQ(live.get_string("preferences.location").value_or(""), "Montreal");
}

TEST_F(ConfigStoreTest, PublishInactiveHandleFails) {
    seed();
    auto handle = store->stage(store->read().value()).value();
    store->discard(handle);

    auto result = store->publish(handle);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::INVALID_STATE);
}

}  // namespace scoreboard::controlhub::test
