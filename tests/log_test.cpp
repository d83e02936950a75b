//! # Logger Unit Tests
//!
//! Filter parsing, record formatting, file output, environment-style
//! configuration, and the module tags the clone engine logs under.

#include "log/log.hpp"
#include "test_types.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace deepclone::log;
namespace fs = std::filesystem;

namespace {

/// Keeps records in memory instead of writing them anywhere.
class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>& out_;
};

LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1700000000000;
    return record;
}

} // namespace

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, DefaultsToWarn) {
    EXPECT_EQ(filter.default_level(), LogLevel::Warn);
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "plan"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "plan"));
}

TEST_F(LogFilterTest, ModuleOverridesDefault) {
    filter.parse("plan=debug,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "plan"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "plan"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "cache"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "cache"));
}

TEST_F(LogFilterTest, BareModuleEnablesEverything) {
    filter.parse("cache");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "cache"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "reflect"));
}

TEST_F(LogFilterTest, OffSilencesModule) {
    filter.parse("reflect=off,*=trace");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "reflect"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "plan"));
}

TEST_F(LogFilterTest, OffIsNeverARecordLevel) {
    filter.set_default_level(LogLevel::Trace);
    EXPECT_FALSE(filter.should_log(LogLevel::Off, "plan"));
}

TEST_F(LogFilterTest, MinLevelTracksLowestModule) {
    filter.parse("plan=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    LogFilter plain;
    plain.set_default_level(LogLevel::Error);
    EXPECT_EQ(plain.min_level(), LogLevel::Error);
}

// ============================================================================
// Level helpers
// ============================================================================

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, ParseIgnoresCase) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("none"), LogLevel::Off);
}

TEST(LogLevelTest, ParseUnknownIsInfo) {
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_EQ(parse_level(""), LogLevel::Info);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(FormatRecordTest, TextCarriesLevelModuleAndMessage) {
    std::string line = format_record(make_record(LogLevel::Info, "plan", "compiled"), LogFormat::Text);

    EXPECT_NE(line.find("INFO"), std::string::npos);
    EXPECT_NE(line.find("[plan]"), std::string::npos);
    EXPECT_NE(line.find("compiled"), std::string::npos);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(FormatRecordTest, JsonFields) {
    std::string line = format_record(make_record(LogLevel::Error, "cache", "full"), LogFormat::JSON);

    EXPECT_EQ(line.rfind("{\"ts\":1700000000000,", 0), 0u);
    EXPECT_NE(line.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(line.find("\"module\":\"cache\""), std::string::npos);
    EXPECT_NE(line.find("\"msg\":\"full\""), std::string::npos);
    EXPECT_EQ(line.back(), '}');
}

TEST(FormatRecordTest, JsonEscapesMessage) {
    std::string line = format_record(
        make_record(LogLevel::Warn, "plan", "a\"b\\c\nd\te"), LogFormat::JSON);

    EXPECT_NE(line.find("a\\\"b\\\\c\\nd\\te"), std::string::npos);
}

TEST(TimestampTest, Format) {
    std::string ts = get_timestamp();
    ASSERT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[5], ':');
    EXPECT_EQ(ts[8], '.');
    EXPECT_GT(epoch_ms(), 0);
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "deepclone_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    std::string read_file() const {
        std::ifstream f(temp_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesLines) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "cache", "capacity reduced"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("WARN"), std::string::npos);
    EXPECT_NE(content.find("[cache] capacity reduced"), std::string::npos);
}

TEST_F(FileSinkTest, AppendKeepsEarlierLines) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "plan", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "plan", "second"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, TruncateReplacesContent) {
    {
        FileSink sink(temp_file.string(), false);
        sink.write(make_record(LogLevel::Info, "plan", "old"));
    }
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Info, "plan", "new"));
    }

    std::string content = read_file();
    EXPECT_EQ(content.find("old"), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"new\""), std::string::npos);
}

// ============================================================================
// Environment-style configuration
// ============================================================================

TEST(LogSpecTest, EmptyIsWarn) {
    LogConfig config = parse_log_spec("");
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST(LogSpecTest, SingleLevel) {
    LogConfig config = parse_log_spec("trace");
    EXPECT_EQ(config.level, LogLevel::Trace);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST(LogSpecTest, ModuleSpecBecomesFilter) {
    LogConfig config = parse_log_spec("plan=debug,*=error");
    EXPECT_EQ(config.filter_spec, "plan=debug,*=error");
    EXPECT_EQ(config.level, LogLevel::Warn);

    EXPECT_EQ(parse_log_spec("plan,cache").filter_spec, "plan,cache");
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(records));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
    }

    std::vector<CaptureSink::Entry> records;
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    Logger::instance().set_level(LogLevel::Info);

    DEEPCLONE_LOG_DEBUG("plan", "hidden");
    DEEPCLONE_LOG_INFO("plan", "shown " << 42);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Info);
    EXPECT_EQ(records[0].module, "plan");
    EXPECT_EQ(records[0].message, "shown 42");
}

TEST_F(LoggerTest, FilterSelectsModules) {
    Logger::instance().set_filter("cache=trace,*=off");

    DEEPCLONE_LOG_TRACE("cache", "evicted");
    DEEPCLONE_LOG_ERROR("plan", "dropped");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].module, "cache");
    EXPECT_EQ(Logger::instance().level(), LogLevel::Trace);
}

TEST_F(LoggerTest, InitWithFilterOpensFastPath) {
    LogConfig config;
    config.console = false;
    config.filter_spec = "plan=debug";
    Logger::init(config);
    Logger::instance().add_sink(std::make_unique<CaptureSink>(records));

    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);
    EXPECT_TRUE(Logger::instance().should_log(LogLevel::Debug, "plan"));
    EXPECT_FALSE(Logger::instance().should_log(LogLevel::Debug, "cache"));
}

TEST_F(LoggerTest, ClearSinksDropsMessages) {
    Logger::instance().set_level(LogLevel::Trace);
    Logger::instance().clear_sinks();

    DEEPCLONE_LOG_WARN("plan", "nowhere");
    EXPECT_TRUE(records.empty());
}

TEST_F(LoggerTest, PlanCompilationIsLoggedUnderPlan) {
    Logger::instance().set_filter("plan=debug,*=off");

    deepclone::plan::compile_plan(deepclone::reflect::type_of<fixtures::Node>());

    ASSERT_FALSE(records.empty());
    EXPECT_EQ(records[0].module, "plan");
    EXPECT_NE(records[0].message.find("fixtures::Node"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    Logger::instance().set_level(LogLevel::Trace);

    constexpr int kThreads = 8;
    constexpr int kMessages = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kMessages; ++i) {
                DEEPCLONE_LOG_INFO("cache", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(records.size()), kThreads * kMessages);
}
