/*
 * Build state tests - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <devdeck/state/atomic_file.hpp>
#include <devdeck/state/build_state.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace devdeck;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class BuildStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() / ("devdeck_state_" + std::to_string(::getpid()) + "_" + info->name());
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);
    }
    void TearDown() override { fs::remove_all(m_dir); }

    fs::path m_dir;
};

TEST_F(BuildStateTest, SaveAndLoad) {
    BuildStateStore store(m_dir);
    EXPECT_FALSE(store.load().has_value());
    ASSERT_FALSE(store.save(BuildStateRecord{1735689600, BuildStatus::Success, "release \"x\"\n"}));
    EXPECT_EQ(store.path(), m_dir / ".devdeck" / "state" / "build.json");
    auto rec = store.load();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->timestamp, 1735689600);
    EXPECT_EQ(rec->status, BuildStatus::Success);
    EXPECT_EQ(rec->task, "release \"x\"\n");
    EXPECT_FALSE(fs::exists(temp_path_for(store.path())));
}

TEST_F(BuildStateTest, InterruptedWriteLeavesPreviousState) {
    BuildStateStore store(m_dir);
    ASSERT_FALSE(store.save(BuildStateRecord{100, BuildStatus::Success, "build"}));
    // A crash after writing the temp file but before rename leaves a partial temp behind.
    {
        std::ofstream tmp(temp_path_for(store.path()));
        tmp << "{\"timestamp\": 200, \"status\": \"Fai";
    }
    auto rec = store.load();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->timestamp, 100);
    EXPECT_EQ(rec->status, BuildStatus::Success);

    // The next successful write replaces both.
    ASSERT_FALSE(store.save(BuildStateRecord{300, BuildStatus::Failed, "build"}));
    EXPECT_EQ(store.load()->status, BuildStatus::Failed);
    EXPECT_FALSE(fs::exists(temp_path_for(store.path())));
}

TEST_F(BuildStateTest, MalformedFileReadsAsAbsent) {
    BuildStateStore store(m_dir);
    fs::create_directories(store.path().parent_path());
    {
        std::ofstream out(store.path());
        out << "{\"timestamp\": 1, \"status\": \"Exploded\", \"task\": \"x\"}";
    }
    EXPECT_FALSE(store.load().has_value());
    EXPECT_FALSE(load_build_state(m_dir).has_value());
}

TEST_F(BuildStateTest, OnlyBuildCommandsUpdateState) {
    BuildStateStore store(m_dir);
    auto lint = make_result("cargo clippy", "", "", 1, std::chrono::system_clock::now(), 1ms);
    EXPECT_FALSE(update_build_state(store, lint));
    EXPECT_FALSE(store.load().has_value());

    auto build = make_result("cd app && npm run build", "", "err", 1, std::chrono::system_clock::now(), 1ms);
    EXPECT_TRUE(update_build_state(store, build));
    auto rec = store.load();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, BuildStatus::Failed);
    EXPECT_EQ(rec->task, "cd app && npm run build");

    auto ok = make_result("cargo build", "", "", 0, std::chrono::system_clock::now(), 1ms);
    EXPECT_TRUE(update_build_state(store, ok, "release"));
    EXPECT_EQ(store.load()->status, BuildStatus::Success);
    EXPECT_EQ(store.load()->task, "release");
}

TEST_F(BuildStateTest, MarkRunning) {
    BuildStateStore store(m_dir);
    ASSERT_FALSE(store.mark_running("frontend"));
    auto rec = store.load();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->status, BuildStatus::Running);
    EXPECT_EQ(rec->task, "frontend");
    EXPECT_GT(rec->timestamp, 0);
}

TEST(BuildStateJson, Shape) {
    std::string json = to_json(BuildStateRecord{42, BuildStatus::Running, "t"});
    EXPECT_NE(json.find("\"timestamp\": 42"), std::string::npos);
    EXPECT_NE(json.find("\"status\": \"Running\""), std::string::npos);
    EXPECT_NE(json.find("\"task\": \"t\""), std::string::npos);
    EXPECT_FALSE(parse_build_state_json("").has_value());
    EXPECT_FALSE(parse_build_state_json("{\"status\": \"Success\"}").has_value());
    auto compact = parse_build_state_json("{\"timestamp\":7,\"status\":\"Failed\",\"task\":\"a\\\\b\"}");
    ASSERT_TRUE(compact.has_value());
    EXPECT_EQ(compact->task, "a\\b");
}
