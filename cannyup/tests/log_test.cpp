//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, file output, option parsing
//! and the CANNYUP_LOG fallback.

#include "log/log.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace cannyup::log;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("install=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "install"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "install"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "probe"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "probe"));
}

TEST_F(LogFilterTest, BareModuleEnablesEverything) {
    filter.parse("probe");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "probe"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "build"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("process=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "process"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "install"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("toolchain=trace,*=error");

    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

// ============================================================================
// Formatting and Sinks
// ============================================================================

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}

    void write(const LogRecord& record) override {
        lines_.push_back(std::string(record.module) + ":" + record.message);
    }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

TEST(LogFormatTest, TextContainsLevelAndModule) {
    LogRecord record{LogLevel::Warn, "install", "hello", __FILE__, __LINE__, epoch_ms()};
    auto line = format_record(record, LogFormat::Text);

    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[install] hello"), std::string::npos);
}

TEST(LogFormatTest, JsonEscapesMessage) {
    LogRecord record{LogLevel::Info, "build", "say \"hi\"\n", __FILE__, __LINE__, 42};
    auto line = format_record(record, LogFormat::JSON);

    EXPECT_EQ(line, "{\"ts\":42,\"level\":\"INFO\",\"module\":\"build\",\"msg\":\"say "
                    "\\\"hi\\\"\\n\"}");
}

TEST(ConsoleSinkTest, NoColorsOnNonTerminalStream) {
    std::ostringstream out;
    ConsoleSink sink(true, out);
    sink.write({LogLevel::Error, "cli", "boom", __FILE__, __LINE__, epoch_ms()});

    EXPECT_EQ(out.str().find("\033["), std::string::npos);
    EXPECT_NE(out.str().find("[cli] boom"), std::string::npos);
}

TEST(FileSinkTest, AppendsLines) {
    cannyup::test::TempDir dir;
    auto path = dir / "cannyup.log";
    {
        FileSink sink(path.string());
        ASSERT_TRUE(sink.is_open());
        sink.write({LogLevel::Info, "install", "first", __FILE__, __LINE__, epoch_ms()});
        sink.write({LogLevel::Error, "install", "second", __FILE__, __LINE__, epoch_ms()});
    }
    auto content = cannyup::test::read_file(path);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST(LoggerTest, MacrosRespectLevel) {
    std::vector<std::string> lines;
    auto& logger = Logger::instance();
    logger.reset(LogLevel::Info);
    logger.add_sink(std::make_unique<CaptureSink>(lines));

    CANNYUP_LOG_DEBUG("probe", "hidden");
    CANNYUP_LOG_INFO("probe", "shown " << 3);

    logger.reset();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "probe:shown 3");
}

TEST(LoggerTest, ResetLeavesNoSinks) {
    std::vector<std::string> lines;
    auto& logger = Logger::instance();
    logger.reset(LogLevel::Trace);
    logger.add_sink(std::make_unique<CaptureSink>(lines));
    logger.reset(LogLevel::Trace);

    CANNYUP_LOG_ERROR("cli", "nobody listens");
    logger.reset();
    EXPECT_TRUE(lines.empty());
}

// ============================================================================
// Option Parsing
// ============================================================================

namespace {

LogConfig parse(std::vector<std::string> args, std::string_view env_value = {}) {
    std::vector<char*> argv;
    static std::string program = "cannyup";
    argv.push_back(program.data());
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return parse_log_options(static_cast<int>(argv.size()), argv.data(), env_value);
}

} // namespace

TEST(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"install"});

    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.colors);
}

TEST(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"install", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"install", "-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"install", "-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"install", "--verbose"}).level, LogLevel::Info);
}

TEST(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    auto config = parse({"-vvv", "--log-level=error", "install"});

    EXPECT_EQ(config.level, LogLevel::Error);
}

TEST(LogOptionsTest, FileFormatAndColor) {
    auto config = parse({"--log-file=/tmp/x.log", "--log-format=json", "--no-color", "build"});

    EXPECT_EQ(config.log_file, "/tmp/x.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_FALSE(config.colors);
}

TEST(LogOptionsTest, EnvironmentLevelFallback) {
    EXPECT_EQ(parse({"install"}, "debug").level, LogLevel::Debug);
    EXPECT_EQ(parse({"install", "-q"}, "debug").level, LogLevel::Error);
}

TEST(LogOptionsTest, EnvironmentFilterFallback) {
    auto config = parse({"install"}, "install=trace,*=warn");

    EXPECT_EQ(config.filter_spec, "install=trace,*=warn");
}

TEST(LogOptionsTest, RecognizesOwnOptions) {
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--source-dir=."));
    EXPECT_FALSE(is_log_option("install"));
}
