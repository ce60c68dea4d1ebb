#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "flakelib/utils/log_config.hpp"

using namespace flakelib::utils;

namespace {

class MemorySink : public LogSink {
public:
    void write(const LogEntry& entry) override { entries.push_back(entry); }
    std::vector<LogEntry> entries;
};

LogEntry make_entry(LogLevel level, const std::string& message) {
    LogEntry e;
    e.level = level;
    e.logger_name = "test_module";
    e.message = message;
    e.timestamp = std::chrono::system_clock::now();
    return e;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

class LogConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // テスト用ディレクトリの作成
        test_dir = std::filesystem::temp_directory_path() / "flakelib_log_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        LogManager::instance().clear_global_sinks();
        LogManager::instance().set_global_level(LogLevel::Info);
        // テスト用ファイルのクリーンアップ
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    std::filesystem::path test_dir;
};

// 時刻 | レベル | ロガー名 | メッセージ
TEST_F(LogConfigTest, LineLayout) {
    LineFormatter formatter;
    std::string line = formatter.format(make_entry(LogLevel::Warning, "clock went back"));
    EXPECT_NE(line.find('-'), std::string::npos);
    EXPECT_NE(line.find(':'), std::string::npos);
    EXPECT_NE(line.find(" | WARNING | test_module | clock went back"), std::string::npos);
    EXPECT_EQ(line.find('['), std::string::npos);
}

TEST_F(LogConfigTest, MetadataIsSortedByKey) {
    LogEntry e = make_entry(LogLevel::Debug, "created");
    e.metadata = {{"worker_id", "00:01:02:03:04:05"}, {"endianness", "big"}};

    LineFormatter formatter;
    EXPECT_NE(formatter.format(e).find("| [endianness=big,worker_id=00:01:02:03:04:05]"), std::string::npos);

    LineFormatter::Options options;
    options.include_metadata = false;
    EXPECT_EQ(LineFormatter(options).format(e).find("endianness"), std::string::npos);
}

TEST_F(LogConfigTest, SourceLocationIsOptional) {
    LogEntry e = make_entry(LogLevel::Error, "failed");
    e.file = "flaker.cpp";
    e.line = 42;
    EXPECT_EQ(LineFormatter().format(e).find("flaker.cpp"), std::string::npos);

    LineFormatter::Options options;
    options.include_source = true;
    EXPECT_NE(LineFormatter(options).format(e).find("| flaker.cpp:42"), std::string::npos);
}

TEST_F(LogConfigTest, LoggerFiltersByLevel) {
    Logger logger("filter_test");
    auto sink = std::make_shared<MemorySink>();
    logger.add_sink(sink);
    logger.set_level(LogLevel::Warning);

    logger.debug("dropped");
    logger.info("dropped");
    logger.warning("kept warning");
    logger.error("kept error");

    ASSERT_EQ(sink->entries.size(), 2u);
    EXPECT_EQ(sink->entries[0].message, "kept warning");
    EXPECT_EQ(sink->entries[1].level, LogLevel::Error);
    EXPECT_EQ(sink->entries[1].logger_name, "filter_test");
    EXPECT_FALSE(logger.should_log(LogLevel::Info));
    EXPECT_FALSE(logger.should_log(LogLevel::Off));

    logger.set_level(LogLevel::Off);
    logger.error("silenced");
    EXPECT_EQ(sink->entries.size(), 2u);
}

TEST_F(LogConfigTest, SinkMinimumLevelAndRemoval) {
    Logger logger("sink_level_test");
    logger.set_level(LogLevel::Debug);
    auto all = std::make_shared<MemorySink>();
    auto errors_only = std::make_shared<MemorySink>();
    errors_only->set_min_level(LogLevel::Error);
    logger.add_sink(all);
    logger.add_sink(all);  // 重複登録は無視
    logger.add_sink(errors_only);

    logger.debug("d");
    logger.error("e");
    EXPECT_EQ(all->entries.size(), 2u);
    EXPECT_EQ(errors_only->entries.size(), 1u);

    logger.remove_sink(all);
    logger.error("e2");
    EXPECT_EQ(all->entries.size(), 2u);
    EXPECT_EQ(errors_only->entries.size(), 2u);
}

TEST_F(LogConfigTest, MacroRecordsSourceLocation) {
    auto logger = std::make_shared<Logger>("macro_test");
    auto sink = std::make_shared<MemorySink>();
    logger->add_sink(sink);
    FLAKELIB_LOG_INFO(logger, "with location");
    ASSERT_EQ(sink->entries.size(), 1u);
    EXPECT_NE(sink->entries[0].file.find("test_log_config"), std::string::npos);
    EXPECT_GT(sink->entries[0].line, 0);
}

TEST_F(LogConfigTest, MetadataLogging) {
    Logger logger("metadata_test");
    auto sink = std::make_shared<MemorySink>();
    logger.add_sink(sink);
    logger.log_with_metadata(LogLevel::Info, "msg", {{"k", "v"}});
    ASSERT_EQ(sink->entries.size(), 1u);
    EXPECT_EQ(sink->entries[0].metadata.at("k"), "v");
}

TEST_F(LogConfigTest, ConsoleSinkWritesFormattedLine) {
    std::ostringstream out;
    ConsoleLogSink sink(out);
    sink.write(make_entry(LogLevel::Info, "to console"));
    sink.flush();
    EXPECT_NE(out.str().find("INFO | test_module | to console"), std::string::npos);
    EXPECT_EQ(out.str().back(), '\n');
}

TEST_F(LogConfigTest, ManagerAppliesGlobalSinksAndLevel) {
    auto& manager = LogManager::instance();
    auto sink = std::make_shared<MemorySink>();
    auto existing = manager.get_logger("manager_existing");

    manager.add_global_sink(sink);
    manager.set_global_level(LogLevel::Debug);
    auto created = manager.get_logger("manager_created");

    EXPECT_EQ(manager.get_logger("manager_created"), created);
    EXPECT_EQ(created->level(), LogLevel::Debug);
    existing->debug("from existing");
    created->debug("from created");
    EXPECT_EQ(sink->entries.size(), 2u);

    manager.clear_global_sinks();
    created->error("after clear");
    EXPECT_EQ(sink->entries.size(), 2u);

    manager.remove_logger("manager_existing");
    manager.remove_logger("manager_created");
}

TEST_F(LogConfigTest, FileSinkWritesAndRotates) {
    auto path = test_dir / "flake.log";
    {
        FileLogSink sink(path, 200, 2);
        ASSERT_TRUE(sink.is_open());
        for (int i = 0; i < 10; ++i) {
            sink.write(make_entry(LogLevel::Info, "line number " + std::to_string(i)));
        }
        sink.flush();
    }
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::exists(test_dir / "flake.log.1"));
    EXPECT_TRUE(std::filesystem::exists(test_dir / "flake.log.2"));
    EXPECT_FALSE(std::filesystem::exists(test_dir / "flake.log.3"));

    // 最新の退避ファイルほど番号が小さい
    EXPECT_NE(read_file(test_dir / "flake.log.1").find("line number 7"), std::string::npos);
    EXPECT_NE(read_file(test_dir / "flake.log.2").find("line number 3"), std::string::npos);
}

TEST_F(LogConfigTest, SetupBasicLoggingWithFile) {
    auto path = test_dir / "nested" / "basic.log";
    log_utils::setup_basic_logging(LogLevel::Debug, false, path);
    auto logger = LogManager::instance().get_logger("basic_setup");
    logger->debug("written to file");
    LogManager::instance().flush_all();

    EXPECT_NE(read_file(path).find("written to file"), std::string::npos);
    LogManager::instance().remove_logger("basic_setup");
}

TEST(LogUtilsTest, ParseAndFormatLevels) {
    EXPECT_EQ(log_utils::parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(log_utils::parse_log_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(log_utils::parse_log_level("Error"), LogLevel::Error);
    EXPECT_EQ(log_utils::parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(log_utils::parse_log_level("unknown"), LogLevel::Info);
    EXPECT_EQ(log_utils::log_level_to_string(LogLevel::Warning), "WARNING");
    EXPECT_EQ(log_utils::log_level_to_string(LogLevel::Debug), "DEBUG");
}
