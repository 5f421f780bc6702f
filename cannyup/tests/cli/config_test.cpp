//! # Command Line Tests
//!
//! parse_invocation(), the usage text and the status line format.

#include "cli/config.hpp"
#include "cli/status.hpp"
#include "cli/utils.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace cannyup;
using namespace cannyup::cli;

class InvocationTest : public ::testing::Test {
protected:
    ProcessEnvironment env{{{"PATH", "/usr/bin"}}, "/work/canny"};

    Invocation parse_ok(const std::vector<std::string>& args) {
        auto parsed = parse_invocation(args, env);
        EXPECT_TRUE(is_ok(parsed)) << (is_err(parsed) ? unwrap_err(parsed) : "");
        return is_ok(parsed) ? unwrap(parsed) : Invocation{};
    }
};

TEST_F(InvocationTest, NoArgumentsMeansHelp) {
    auto inv = parse_ok({});

    EXPECT_EQ(inv.command, "help");
    EXPECT_EQ(inv.config.source_root, fs::path("/work/canny"));
    EXPECT_EQ(inv.config.system_dir, fs::path("/usr/local/bin"));
    EXPECT_EQ(inv.config.binary_name, "canny");
}

TEST_F(InvocationTest, CommandAndFlags) {
    auto inv = parse_ok({"install-user", "--no-color", "-vv", "--log-file=/tmp/c.log"});

    EXPECT_EQ(inv.command, "install-user");
    EXPECT_FALSE(inv.colors);
}

TEST_F(InvocationTest, VersionFlags) {
    EXPECT_EQ(parse_ok({"--version"}).command, "version");
    EXPECT_EQ(parse_ok({"-V"}).command, "version");
    EXPECT_EQ(parse_ok({"-h"}).command, "help");
}

TEST_F(InvocationTest, SourceDirRelativeToWorkingDirectory) {
    auto inv = parse_ok({"build", "--source-dir=../canny-cli/"});

    EXPECT_EQ(inv.config.source_root, fs::path("/work/canny-cli/"));
}

TEST_F(InvocationTest, SourceDirAbsolute) {
    auto inv = parse_ok({"--source-dir=/src/canny", "release"});

    EXPECT_EQ(inv.command, "release");
    EXPECT_EQ(inv.config.source_root, fs::path("/src/canny"));
}

TEST_F(InvocationTest, RejectsUnknownOption) {
    auto parsed = parse_invocation({"install", "--force"}, env);

    ASSERT_TRUE(is_err(parsed));
    EXPECT_NE(unwrap_err(parsed).find("--force"), std::string::npos);
}

TEST_F(InvocationTest, RejectsSecondCommand) {
    auto parsed = parse_invocation({"install", "uninstall"}, env);

    ASSERT_TRUE(is_err(parsed));
}

TEST_F(InvocationTest, RejectsEmptySourceDir) {
    auto parsed = parse_invocation({"build", "--source-dir="}, env);

    ASSERT_TRUE(is_err(parsed));
}

// ============================================================================
// Usage
// ============================================================================

TEST(UsageTest, ListsEveryCommand) {
    std::ostringstream out;
    print_usage(out);

    for (const auto& cmd : command_table()) {
        EXPECT_NE(out.str().find(std::string("  ") + cmd.name), std::string::npos) << cmd.name;
    }
    EXPECT_NE(out.str().find("--source-dir"), std::string::npos);
}

TEST(UsageTest, VersionLine) {
    std::ostringstream out;
    print_version(out);

    EXPECT_EQ(out.str(), std::string("cannyup ") + VERSION + "\n");
}

// ============================================================================
// Status Lines
// ============================================================================

TEST(StatusReporterTest, PlainLines) {
    std::ostringstream out;
    std::ostringstream err;
    StatusReporter status(out, err, false);

    status.info("Building canny...");
    status.note("detail");
    status.fatal(Error::build("cargo build --release failed with exit code 101", "fix it"));

    EXPECT_EQ(out.str(), "==> Building canny...\n    detail\n");
    EXPECT_EQ(err.str(),
              "==> error: cargo build --release failed with exit code 101\n    hint: fix it\n");
}

TEST(StatusReporterTest, ColoredLines) {
    std::ostringstream out;
    std::ostringstream err;
    StatusReporter status(out, err, true);

    status.success("Installed");

    EXPECT_EQ(out.str(), "\033[1;32m==> Installed\033[0m\n");
}
