#include "server/game_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using ghack::server::GameConfig;

namespace {

class GameConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::path(::testing::TempDir()) /
               ("ghack_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& contents) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_F(GameConfigTest, LoadsAllFiles) {
    write("server.json", R"({"default_port": 9000, "protocol_version": 3, "version_str": "test",
                             "max_players": 2, "max_nesting_depth": 16, "max_queued_frames": 10,
                             "handshake_timeout_ms": 0})");
    write("world.json", R"({"width": 50.0, "height": 20.0, "move_step": 2.0,
                            "spawn_x": 5.0, "spawn_y": 6.0, "player_asset": "&", "player_health": 12})");
    write("accounts.json", R"({"require_auth": true,
                               "accounts": [{"name": "admin", "authtoken": "pw", "permissions": 3}],
                               "banned": ["mallory"]})");

    GameConfig config;
    ASSERT_TRUE(config.load(dir_.string()));

    EXPECT_EQ(config.server().default_port, 9000);
    EXPECT_EQ(config.server().protocol_version, 3u);
    EXPECT_EQ(config.server().version_str, "test");
    EXPECT_EQ(config.server().max_players, 2u);
    EXPECT_EQ(config.server().max_nesting_depth, 16u);
    EXPECT_EQ(config.server().max_queued_frames, 10u);
    EXPECT_EQ(config.server().handshake_timeout_ms, 0u);

    EXPECT_DOUBLE_EQ(config.world().width, 50.0);
    EXPECT_DOUBLE_EQ(config.world().move_step, 2.0);
    EXPECT_EQ(config.world().player_asset, "&");
    EXPECT_EQ(config.world().player_health, 12);

    EXPECT_TRUE(config.auth().require_auth);
    ASSERT_EQ(config.auth().accounts.size(), 1u);
    EXPECT_EQ(config.auth().accounts[0].name, "admin");
    EXPECT_EQ(config.auth().accounts[0].authtoken, "pw");
    EXPECT_EQ(config.auth().accounts[0].permissions, 3u);
    ASSERT_EQ(config.auth().banned.size(), 1u);
    EXPECT_EQ(config.auth().banned[0], "mallory");
}

TEST_F(GameConfigTest, MissingKeysUseDefaults) {
    GameConfig config;
    ASSERT_TRUE(config.load_server(write("server.json", "{}")));
    EXPECT_EQ(config.server().default_port, 7777);
    EXPECT_EQ(config.server().protocol_version, 1u);
    EXPECT_EQ(config.server().max_nesting_depth, 64u);
    EXPECT_EQ(config.server().max_queued_frames, 1024u);
    EXPECT_EQ(config.server().handshake_timeout_ms, 10000u);

    ASSERT_TRUE(config.load_accounts(write("accounts.json", "{}")));
    EXPECT_FALSE(config.auth().require_auth);
    EXPECT_TRUE(config.auth().accounts.empty());
}

TEST_F(GameConfigTest, TinyNestingDepthIsRaised) {
    GameConfig config;
    ASSERT_TRUE(config.load_server(write("server.json", R"({"max_nesting_depth": 1})")));
    EXPECT_EQ(config.server().max_nesting_depth, 3u);
}

TEST_F(GameConfigTest, AccountsWithoutNamesAreSkipped) {
    GameConfig config;
    ASSERT_TRUE(config.load_accounts(write("accounts.json",
                                           R"({"accounts": [{"authtoken": "x"}, {"name": "bob"}]})")));
    ASSERT_EQ(config.auth().accounts.size(), 1u);
    EXPECT_EQ(config.auth().accounts[0].name, "bob");
}

TEST_F(GameConfigTest, MissingFileFails) {
    GameConfig config;
    EXPECT_FALSE(config.load_world((dir_ / "nope.json").string()));
    EXPECT_FALSE(config.load(dir_.string()));
}

TEST_F(GameConfigTest, BadJsonFails) {
    GameConfig config;
    EXPECT_FALSE(config.load_world(write("world.json", "{ not json")));
}
