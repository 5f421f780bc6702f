//! # Builder Tests

#include "core/builder.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace cannyup;
using namespace cannyup::test;

class BuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(dir / "Cargo.toml", "[package]\nname = \"canny\"\n");
        env = make_env("/opt/cargo/bin:/usr/bin", dir / "home", dir.path());
    }

    /// cargo exits with `code`; a successful build leaves the binary behind.
    void cargo_exits(int code) {
        fs::path root = dir.path();
        runner.on("cargo", [root, code](const CommandSpec& cmd, const ProcessEnvironment&) {
            if (code == 0 && cmd.argv.size() > 1 && cmd.argv[1] == "build") {
                bool release = cmd.argv.size() > 2 && cmd.argv[2] == "--release";
                write_executable(root / "target" / (release ? "release" : "debug") / "canny");
            }
            return exit_with(code);
        });
    }

    TempDir dir;
    ProcessEnvironment env;
    FakeProcessRunner runner;
};

TEST_F(BuilderTest, ReleaseBuildProducesArtifact) {
    cargo_exits(0);
    Builder builder(runner, dir.path(), "canny");

    auto artifact = builder.build(BuildProfile::Release, env);

    ASSERT_TRUE(is_ok(artifact));
    EXPECT_EQ(unwrap(artifact).output_path, dir / "target/release/canny");
    EXPECT_EQ(unwrap(artifact).profile, BuildProfile::Release);

    ASSERT_EQ(runner.calls.size(), 1u);
    const auto& call = runner.calls[0];
    EXPECT_EQ(describe_command(call.command.argv), "cargo build --release");
    ASSERT_TRUE(call.command.cwd.has_value());
    EXPECT_EQ(*call.command.cwd, dir.path());
    EXPECT_EQ(call.command.mode, OutputMode::Inherit);
    EXPECT_EQ(call.env.get("PATH").value(), "/opt/cargo/bin:/usr/bin");
}

TEST_F(BuilderTest, DebugBuildOmitsReleaseFlag) {
    cargo_exits(0);
    Builder builder(runner, dir.path(), "canny");

    auto artifact = builder.build(BuildProfile::Debug, env);

    ASSERT_TRUE(is_ok(artifact));
    EXPECT_EQ(unwrap(artifact).output_path, dir / "target/debug/canny");
    EXPECT_EQ(describe_command(runner.calls[0].command.argv), "cargo build");
}

TEST_F(BuilderTest, MissingManifestFailsBeforeCargo) {
    fs::remove(dir / "Cargo.toml");
    cargo_exits(0);
    Builder builder(runner, dir.path(), "canny");

    auto artifact = builder.build(BuildProfile::Release, env);

    ASSERT_TRUE(is_err(artifact));
    EXPECT_EQ(unwrap_err(artifact).kind, ErrorKind::Build);
    EXPECT_TRUE(runner.calls.empty());
}

TEST_F(BuilderTest, CompilerFailureNamesCommandAndCode) {
    cargo_exits(101);
    Builder builder(runner, dir.path(), "canny");

    auto artifact = builder.build(BuildProfile::Release, env);

    ASSERT_TRUE(is_err(artifact));
    EXPECT_EQ(unwrap_err(artifact).kind, ErrorKind::Build);
    EXPECT_NE(unwrap_err(artifact).message.find("cargo build --release"), std::string::npos);
    EXPECT_NE(unwrap_err(artifact).message.find("101"), std::string::npos);
    EXPECT_FALSE(fs::exists(dir / "target/release/canny"));
}

TEST_F(BuilderTest, SuccessWithoutBinaryIsBuildError) {
    runner.exits("cargo", 0);
    Builder builder(runner, dir.path(), "canny");

    auto artifact = builder.build(BuildProfile::Release, env);

    ASSERT_TRUE(is_err(artifact));
    EXPECT_EQ(unwrap_err(artifact).kind, ErrorKind::Build);
}

TEST_F(BuilderTest, MissingCargoIsBuildError) {
    Builder builder(runner, dir.path(), "canny");

    auto artifact = builder.build(BuildProfile::Release, env);

    ASSERT_TRUE(is_err(artifact));
    EXPECT_EQ(unwrap_err(artifact).kind, ErrorKind::Build);
    EXPECT_NE(unwrap_err(artifact).message.find("could not run cargo"), std::string::npos);
}

TEST_F(BuilderTest, LintRunsClippy) {
    cargo_exits(0);
    Builder builder(runner, dir.path(), "canny");

    auto status = builder.run_task(CargoTask::Lint, env);

    ASSERT_TRUE(is_ok(status));
    EXPECT_EQ(describe_command(runner.calls[0].command.argv), "cargo clippy");
}

TEST_F(BuilderTest, FailingTaskIsBuildError) {
    cargo_exits(101);
    Builder builder(runner, dir.path(), "canny");

    auto status = builder.run_task(CargoTask::Test, env);

    ASSERT_TRUE(is_err(status));
    EXPECT_EQ(unwrap_err(status).kind, ErrorKind::Build);
    EXPECT_NE(unwrap_err(status).message.find("cargo test"), std::string::npos);
}

TEST(CargoTaskTest, Names) {
    EXPECT_STREQ(cargo_task_name(CargoTask::Clean), "clean");
    EXPECT_STREQ(cargo_task_name(CargoTask::Fmt), "fmt");
    EXPECT_STREQ(cargo_task_name(CargoTask::Check), "check");
    EXPECT_STREQ(profile_name(BuildProfile::Debug), "debug");
}
