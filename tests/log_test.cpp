//! # Logger Unit Tests
//!
//! LogFilter parsing, formatter templates, FileSink output, CLI option
//! parsing and concurrent logging.

#include "maplint/log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace maplint::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleOverrideAndDefault) {
    filter.parse("classify=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "classify"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "classify"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "snapshot"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "snapshot"));
}

TEST_F(LogFilterTest, BareModuleEnablesTrace) {
    filter.parse("hazard");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "hazard"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "fix"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "fix"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("registry=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "registry"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "config"));
}

TEST_F(LogFilterTest, MinLevelIsLowestThreshold) {
    filter.parse("fix=trace,*=error");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, DefaultsToInfo) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "check"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "check"));
}

TEST(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("nonsense"), LogLevel::Info);
}

// ============================================================================
// Formatter
// ============================================================================

TEST(LogFormatterTest, ExpandsKnownTokens) {
    LogFormatter formatter("{level_short} [{module}] {message} @{line}");

    LogRecord record{LogLevel::Warn, "config", "unknown key", "config.cpp", 42, 0};
    EXPECT_EQ(formatter.format(record), "WN [config] unknown key @42");
}

TEST(LogFormatterTest, UnknownTokensPassThrough) {
    LogFormatter formatter("{level} {nope} {message}");

    LogRecord record{LogLevel::Error, "fix", "failed", "fix.cpp", 1, 0};
    EXPECT_EQ(formatter.format(record), "ERROR {nope} failed");
}

TEST(LogFormatterTest, RecordToJsonEscapes) {
    LogRecord record{LogLevel::Info, "snapshot", "a \"quoted\"\nline", "s.cpp", 3, 12345};
    auto json = record_to_json(record);

    EXPECT_NE(json.find("\"ts\":12345"), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"module\":\"snapshot\""), std::string::npos);
    EXPECT_NE(json.find("a \\\"quoted\\\"\\nline"), std::string::npos);
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "maplint_log_test.log";
        fs::remove(temp_file);
    }

    void TearDown() override {
        fs::remove(temp_file);
    }

    static LogRecord record(LogLevel level, std::string_view module, std::string message) {
        return LogRecord{level, module, std::move(message), __FILE__, __LINE__, epoch_ms()};
    }

    std::string read_file() const {
        std::ifstream f(temp_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesTextLines) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(record(LogLevel::Info, "check", "analyzed 3 units"));
        sink.flush();
    }

    auto content = read_file();
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[check]"), std::string::npos);
    EXPECT_NE(content.find("analyzed 3 units"), std::string::npos);
}

TEST_F(FileSinkTest, AppendKeepsEarlierRecords) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(record(LogLevel::Info, "fix", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(record(LogLevel::Warn, "fix", "second"));
    }

    auto content = read_file();
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(record(LogLevel::Error, "snapshot", "bad member kind"));
    }

    auto content = read_file();
    EXPECT_NE(content.find("{\"ts\":"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"bad member kind\""), std::string::npos);
}

// ============================================================================
// CLI options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    std::vector<std::string> storage;
    std::vector<char*> argv;

    LogConfig parse(std::vector<std::string> args) {
        storage = std::move(args);
        storage.insert(storage.begin(), "maplint");
        argv.clear();
        for (auto& s : storage) {
            argv.push_back(s.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"check", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv", "check"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    EXPECT_EQ(parse({"--log-level=error", "-vvv"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, QuietMeansErrors) {
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"--log-filter=classify=trace,*=warn", "--log-file=out.log",
                         "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "classify=trace,*=warn");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_FALSE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("check"));
    EXPECT_FALSE(is_log_option("--format=json"));
}

// ============================================================================
// Thread safety
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        messages.push_back(record.message);
    }
    void flush() override {}

    std::vector<std::string> messages;
};

TEST(LoggerThreadSafetyTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "check", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture_ptr->messages.size()), num_threads * messages_per_thread);

    logger.clear_sinks();
    logger.set_level(LogLevel::Warn);
}
