//! # Environment and Process Runner Tests
//!
//! ProcessEnvironment search-path handling and the fork/exec runner,
//! driven against /bin/sh.

#include "core/environment.hpp"
#include "core/process.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace cannyup;
using namespace cannyup::test;

// ============================================================================
// ProcessEnvironment
// ============================================================================

TEST(ProcessEnvironmentTest, SearchPathSplitsOnColon) {
    auto env = make_env("/usr/bin::/opt/bin", {}, "/");
    auto dirs = env.search_path();

    ASSERT_EQ(dirs.size(), 3u);
    EXPECT_EQ(dirs[0], fs::path("/usr/bin"));
    EXPECT_EQ(dirs[1], fs::path("."));
    EXPECT_EQ(dirs[2], fs::path("/opt/bin"));
}

TEST(ProcessEnvironmentTest, OnSearchPathIgnoresTrailingSlash) {
    auto env = make_env("/usr/bin:/home/u/.cargo/bin/", {}, "/");

    EXPECT_TRUE(env.on_search_path("/home/u/.cargo/bin"));
    EXPECT_TRUE(env.on_search_path("/usr/bin/"));
    EXPECT_FALSE(env.on_search_path("/usr/local/bin"));
}

TEST(ProcessEnvironmentTest, PrependIsIdempotent) {
    auto env = make_env("/usr/bin", {}, "/");
    env.prepend_search_path("/opt/cargo/bin");
    env.prepend_search_path("/opt/cargo/bin");

    EXPECT_EQ(env.get("PATH").value(), "/opt/cargo/bin:/usr/bin");
}

TEST(ProcessEnvironmentTest, PrependToEmptyPath) {
    ProcessEnvironment env({}, "/");
    env.prepend_search_path("/opt/cargo/bin");

    EXPECT_EQ(env.get("PATH").value(), "/opt/cargo/bin");
}

TEST(ProcessEnvironmentTest, CopiesAreIndependent) {
    auto original = make_env("/usr/bin", {}, "/");
    ProcessEnvironment copy = original;
    copy.prepend_search_path("/opt/cargo/bin");
    copy.set("RUSTUP_HOME", "/opt/rustup");

    EXPECT_EQ(original.get("PATH").value(), "/usr/bin");
    EXPECT_FALSE(original.get("RUSTUP_HOME").has_value());
}

TEST(ProcessEnvironmentTest, GetOrTreatsEmptyAsUnset) {
    ProcessEnvironment env({{"TMPDIR", ""}}, "/");

    EXPECT_EQ(env.get_or("TMPDIR", "/tmp"), "/tmp");
    EXPECT_EQ(env.get("TMPDIR").value(), "");
}

TEST(ProcessEnvironmentTest, FindExecutableSkipsNonExecutable) {
    TempDir dir;
    write_file(dir / "first/canny", "not executable");
    write_executable(dir / "second/canny");
    auto env = make_env((dir / "first").string() + ":" + (dir / "second").string(), {},
                        dir.path());

    auto found = env.find_executable("canny");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, dir / "second/canny");
}

TEST(ProcessEnvironmentTest, FindExecutableWithSlashIgnoresPath) {
    TempDir dir;
    write_executable(dir / "tools/cargo");
    auto env = make_env("", {}, dir.path());

    EXPECT_TRUE(env.find_executable("tools/cargo").has_value());
    EXPECT_FALSE(env.find_executable("cargo").has_value());
}

TEST(ProcessEnvironmentTest, EnvpRoundTripsVariables) {
    ProcessEnvironment env({{"A", "1"}, {"B", "x=y"}}, "/");
    auto envp = env.to_envp();

    ASSERT_EQ(envp.size(), 2u);
    EXPECT_EQ(envp[0], "A=1");
    EXPECT_EQ(envp[1], "B=x=y");
}

TEST(ProcessEnvironmentTest, CaptureSeesProcessPath) {
    auto env = ProcessEnvironment::capture();

    EXPECT_FALSE(env.cwd().empty());
    EXPECT_TRUE(env.get("PATH").has_value());
}

// ============================================================================
// PosixProcessRunner
// ============================================================================

class PosixRunnerTest : public ::testing::Test {
protected:
    ProcessEnvironment env = make_env("/usr/bin:/bin", {}, "/");
    PosixProcessRunner runner;

    ProcessResult sh(const std::string& script, OutputMode mode = OutputMode::Capture) {
        auto result = runner.run({{"sh", "-c", script}, std::nullopt, mode}, env);
        EXPECT_TRUE(is_ok(result));
        return is_ok(result) ? unwrap(result) : ProcessResult{};
    }
};

TEST_F(PosixRunnerTest, CapturesBothStreamsAndExitCode) {
    auto result = sh("echo out; echo err >&2; exit 3");

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST_F(PosixRunnerTest, PassesExplicitEnvironment) {
    env.set("CANNYUP_PROBE", "from-test");
    auto result = sh("printf %s \"$CANNYUP_PROBE\"");

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdout_output, "from-test");
}

TEST_F(PosixRunnerTest, RunsInRequestedDirectory) {
    TempDir dir;
    auto result = runner.run({{"sh", "-c", "pwd"}, dir.path(), OutputMode::Capture}, env);

    ASSERT_TRUE(is_ok(result));
    std::string printed = unwrap(result).stdout_output;
    while (!printed.empty() && printed.back() == '\n')
        printed.pop_back();
    EXPECT_TRUE(fs::equivalent(printed, dir.path()));
}

TEST_F(PosixRunnerTest, SignalBecomesHighExitCode) {
    auto result = sh("kill -9 $$");

    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST_F(PosixRunnerTest, DiscardedOutputStillReportsStatus) {
    auto result = sh("echo noise; exit 0", OutputMode::Discard);

    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.stdout_output.empty());
}

TEST_F(PosixRunnerTest, MissingProgramIsEnvironmentError) {
    auto result = runner.run({{"cannyup-no-such-program"}, std::nullopt, OutputMode::Capture},
                             env);

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Environment);
}

TEST(DescribeCommandTest, QuotesArgumentsWithSpaces) {
    EXPECT_EQ(describe_command({"cargo", "build", "--release"}), "cargo build --release");
    EXPECT_NE(describe_command({"sh", "/tmp/my script.sh"}).find("'/tmp/my script.sh'"),
              std::string::npos);
}
