//! # Logger Unit Tests
//!
//! Module filters, command-line log options, sinks and the macros.

#include "log/log.hpp"
#include "test_util.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace sfg::log;

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleAndDefault) {
    filter.parse("emit=debug,*=warn");
    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "emit"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "emit"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "io"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "io"));
}

TEST_F(LogFilterTest, BareModuleIsTrace) {
    filter.parse("regen");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "regen"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "watch"));
}

TEST_F(LogFilterTest, OffSilencesModule) {
    filter.parse("config=off");
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "pipeline"));
}

TEST_F(LogFilterTest, MinLevel) {
    filter.parse("lexer=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
    LogFilter plain;
    plain.set_default_level(LogLevel::Error);
    EXPECT_EQ(plain.min_level(), LogLevel::Error);
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("SFG_LOG");
    }
    void TearDown() override {
        unsetenv("SFG_LOG");
    }

    static auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "superfastgen");
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"generate"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST_F(LogOptionsTest, Verbosity) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"-vv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitOptions) {
    auto config = parse({"watch", "--log-filter=regen=trace", "--log-file=/tmp/sfg.log",
                         "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "regen=trace");
    EXPECT_EQ(config.log_file, "/tmp/sfg.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("SFG_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);
    setenv("SFG_LOG", "emit=trace,*=info", 1);
    EXPECT_EQ(parse({}).filter_spec, "emit=trace,*=info");
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--type=json"));
    EXPECT_FALSE(is_log_option("generate"));
}

// ============================================================================
// Sinks and Macros
// ============================================================================

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::vector<std::string>& out) : out_(out) {}

    void write(const LogRecord& record) override {
        out_.push_back(std::string(record.module) + ":" + record.message);
    }
    void flush() override {}

private:
    std::vector<std::string>& out_;
};

class LoggerTest : public ::testing::Test {
protected:
    std::vector<std::string> lines_;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Info);
        logger.set_filter("");
        logger.add_sink(std::make_unique<CaptureSink>(lines_));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    SFG_LOG_INFO("pipeline", "Processing " << 3 << " files");
    SFG_LOG_DEBUG("pipeline", "hidden");
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0], "pipeline:Processing 3 files");
}

TEST_F(LoggerTest, FilterEnablesVerboseModule) {
    Logger::instance().set_filter("emit=trace");
    SFG_LOG_TRACE("emit", "detail");
    SFG_LOG_TRACE("io", "noise");
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0], "emit:detail");
}

TEST(FileSinkTest, WritesTextAndJson) {
    sfg::test::TempDir dir;
    auto path = (dir / "sfg.log").string();
    {
        FileSink sink(path, false);
        ASSERT_TRUE(sink.is_open());
        sink.write(LogRecord{.level = LogLevel::Warn,
                             .module = "config",
                             .message = "Ignoring unknown key",
                             .file = __FILE__,
                             .line = __LINE__,
                             .timestamp_ms = 1});
        sink.set_format(LogFormat::JSON);
        sink.write(LogRecord{.level = LogLevel::Error,
                             .module = "io",
                             .message = "say \"hi\"\n",
                             .file = __FILE__,
                             .line = __LINE__,
                             .timestamp_ms = 42});
    }
    auto text = sfg::test::read_text(path);
    EXPECT_NE(text.find("WARN  [config] Ignoring unknown key\n"), std::string::npos);
    EXPECT_NE(text.find(R"({"ts":42,"level":"ERROR","module":"io","msg":"say \"hi\"\n"})"),
              std::string::npos);
}

TEST(JsonEscapeTest, ControlCharacters) {
    std::ostringstream out;
    write_json_escaped(out, std::string("a\\b\tc\x01", 6));
    EXPECT_EQ(out.str(), "a\\\\b\\tc\\u0001");
}

TEST(MultiSinkTest, FansOut) {
    std::vector<std::string> a;
    std::vector<std::string> b;
    MultiSink multi;
    multi.add(std::make_unique<CaptureSink>(a));
    multi.add(std::make_unique<CaptureSink>(b));
    EXPECT_EQ(multi.size(), 2u);
    multi.write(LogRecord{.level = LogLevel::Info,
                          .module = "cli",
                          .message = "hello",
                          .file = __FILE__,
                          .line = __LINE__,
                          .timestamp_ms = 0});
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(b.size(), 1u);
}
