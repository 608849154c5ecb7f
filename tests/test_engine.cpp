/*
 * Execution engine tests - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <devdeck/exec/engine.hpp>
#include <devdeck/exec/path.hpp>
#include <filesystem>
#include <unistd.h>

using namespace devdeck;
namespace fs = std::filesystem;

static CommandResult captured(const CommandSpec& spec) {
    ExecutionEngine engine;
    auto outcome = engine.run_captured(spec);
    if (auto* e = std::get_if<ExecError>(&outcome)) {
        ADD_FAILURE() << "unexpected error: " << e->message;
        return {};
    }
    return std::get<CommandResult>(outcome);
}

TEST(EngineCaptured, SeparatesStreamsAndExitCode) {
    auto r = captured(CommandBuilder::shell("echo out; echo err >&2; exit 3").build());
    EXPECT_EQ(r.stdout_text, "out\n");
    EXPECT_EQ(r.stderr_text, "err\n");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.command_display, "echo out; echo err >&2; exit 3");
}

TEST(EngineCaptured, SuccessFlagFollowsExitCode) {
    auto r = captured(CommandBuilder::shell("true").build());
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_TRUE(r.success);
    EXPECT_GE(r.duration.count(), 0);
}

TEST(EngineCaptured, SignalDeathReportsSentinel) {
    auto r = captured(CommandBuilder::shell("kill -9 $$").build());
    EXPECT_EQ(r.exit_code, k_signal_exit_code);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_FALSE(r.success);
}

TEST(EngineCaptured, EnvironmentOverride) {
    auto r = captured(CommandBuilder::shell("printf %s \"$DEVDECK_ENGINE_VAR\"").env("DEVDECK_ENGINE_VAR", "hello").build());
    EXPECT_EQ(r.stdout_text, "hello");
}

TEST(EngineCaptured, WorkingDirectory) {
    fs::path dir = fs::temp_directory_path() / ("devdeck_engine_cwd_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    auto r = captured(CommandBuilder::shell("pwd -P").working_dir(dir).build());
    EXPECT_EQ(r.stdout_text, fs::canonical(dir).string() + "\n");
    fs::remove_all(dir);
}

TEST(EngineCaptured, LargeOutputOnBothStreams) {
    auto r = captured(CommandBuilder::shell(
        "head -c 200000 /dev/zero | tr '\\000' a; head -c 200000 /dev/zero | tr '\\000' b >&2").build());
    EXPECT_EQ(r.stdout_text.size(), 200000u);
    EXPECT_EQ(r.stderr_text.size(), 200000u);
    EXPECT_EQ(r.exit_code, 0);
}

TEST(EngineCaptured, InvalidUtf8IsReplaced) {
    auto r = captured(CommandBuilder::shell("printf 'ok\\377'").build());
    EXPECT_EQ(r.stdout_text, "ok\xEF\xBF\xBD");
}

TEST(EngineSpawn, MissingBinary) {
    ExecutionEngine engine;
    auto outcome = engine.run_captured(CommandBuilder("devdeck-no-such-program").build());
    ASSERT_TRUE(std::holds_alternative<ExecError>(outcome));
    EXPECT_EQ(std::get<ExecError>(outcome).kind, ErrorKind::SpawnFailed);
}

TEST(EngineSpawn, MissingWorkingDirectory) {
    ExecutionEngine engine;
    auto outcome = engine.run_captured(CommandBuilder::shell("true").working_dir("/nonexistent/devdeck/dir").build());
    ASSERT_TRUE(std::holds_alternative<ExecError>(outcome));
    const auto& e = std::get<ExecError>(outcome);
    EXPECT_EQ(e.kind, ErrorKind::SpawnFailed);
    EXPECT_NE(e.message.find("working directory"), std::string::npos);
}

TEST(EngineSpawn, PathOverrideIsHonoured) {
    ExecutionEngine engine;
    auto outcome = engine.run_captured(CommandBuilder::shell("true").env("PATH", "/nonexistent").build());
    ASSERT_TRUE(std::holds_alternative<ExecError>(outcome));
    EXPECT_EQ(std::get<ExecError>(outcome).kind, ErrorKind::SpawnFailed);
}

TEST(EngineStatus, ReportsSuccessOnly) {
    ExecutionEngine engine;
    EXPECT_TRUE(engine.run_status(CommandBuilder::shell("echo noise; exit 0").build()));
    EXPECT_FALSE(engine.run_status(CommandBuilder::shell("exit 2").build()));
    EXPECT_FALSE(engine.run_status(CommandBuilder("devdeck-no-such-program").build()));
}

TEST(EngineInteractive, ExitHandling) {
    ExecutionEngine engine;
    EXPECT_FALSE(engine.run_interactive(CommandBuilder::shell("exit 0").mode(ExecMode::Interactive).build()));
    auto err = engine.run_interactive(CommandBuilder::shell("exit 4").mode(ExecMode::Interactive).build());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::NonZeroExit);
    auto missing = engine.run_interactive(CommandBuilder("devdeck-no-such-program").mode(ExecMode::Interactive).build());
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->kind, ErrorKind::SpawnFailed);
}

TEST(EngineDispatch, StatusModeFoldsIntoResult) {
    ExecutionEngine engine;
    auto ok = engine.run(CommandBuilder::shell("echo hidden").mode(ExecMode::StatusOnly).build());
    ASSERT_TRUE(std::holds_alternative<CommandResult>(ok));
    EXPECT_TRUE(std::get<CommandResult>(ok).success);
    EXPECT_TRUE(std::get<CommandResult>(ok).stdout_text.empty());
    auto bad = engine.run(CommandBuilder::shell("exit 9").mode(ExecMode::StatusOnly).build());
    EXPECT_FALSE(std::get<CommandResult>(bad).success);
    EXPECT_EQ(std::get<CommandResult>(bad).exit_code, 9);
}

TEST(EngineDispatch, StatusModeSpawnFailureIsAnError) {
    ExecutionEngine engine;
    auto missing = engine.run(CommandBuilder("devdeck-no-such-program").mode(ExecMode::StatusOnly).build());
    ASSERT_TRUE(std::holds_alternative<ExecError>(missing));
    EXPECT_EQ(std::get<ExecError>(missing).kind, ErrorKind::SpawnFailed);
    EXPECT_FALSE(std::get<ExecError>(missing).message.empty());
    EXPECT_FALSE(engine.run_status(CommandBuilder("devdeck-no-such-program").build()));
}

TEST(DecodeLossy, Sequences) {
    EXPECT_EQ(decode_lossy("plain"), "plain");
    EXPECT_EQ(decode_lossy("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(decode_lossy("\xE2\x82"), "\xEF\xBF\xBD");
    EXPECT_EQ(decode_lossy("a\xC0\xAF" "b"), "a\xEF\xBF\xBD\xEF\xBF\xBD" "b");
    EXPECT_EQ(decode_lossy(std::string("\0x", 2)), std::string("\0x", 2));
}

TEST(PathResolve, OverrideAndAbsolute) {
    EXPECT_TRUE(resolve_executable("sh").has_value());
    EXPECT_FALSE(resolve_executable("sh", std::string("/nonexistent")).has_value());
    EXPECT_TRUE(resolve_executable("/bin/sh").has_value());
    EXPECT_FALSE(resolve_executable("").has_value());
}
