#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace flakelib::utils {

/**
 * @brief ログレベル（Off はフィルタ専用で出力には使わない）
 */
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

/**
 * @brief 1件のログ
 */
struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::string logger_name;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string file;
    int line = 0;
    std::map<std::string, std::string> metadata;  ///< キー順に出力される
};

/**
 * @brief ログを1行の文字列にする
 *
 * "2026-01-01 00:00:00 | WARNING | flakelib.flaker | message | [key=value,...]"
 */
class LineFormatter {
public:
    struct Options {
        std::string timestamp_format = "%Y-%m-%d %H:%M:%S";
        bool include_source = false;   ///< file:line を付ける
        bool include_metadata = true;
    };

    LineFormatter() = default;
    explicit LineFormatter(Options options) : options_(std::move(options)) {}

    std::string format(const LogEntry& entry) const;

private:
    Options options_;
};

/**
 * @brief ログの出力先
 */
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}

    void set_min_level(LogLevel level) { min_level_ = level; }
    bool accepts(LogLevel level) const { return level >= min_level_.load(); }

private:
    std::atomic<LogLevel> min_level_{LogLevel::Debug};
};

/**
 * @brief ストリーム出力。既定は std::clog（生成したIDを出す標準出力と分けるため）
 */
class ConsoleLogSink : public LogSink {
public:
    explicit ConsoleLogSink(std::ostream& out = std::clog) : out_(out) {}

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::ostream& out_;
    LineFormatter formatter_;
    std::mutex mtx_;
};

/**
 * @brief サイズでローテーションするファイル出力
 *
 * max_bytes を超えたら path → path.1 → ... → path.<max_files> と送り、最古を捨てる。
 * max_bytes が 0 ならローテーションしない。
 */
class FileLogSink : public LogSink {
public:
    explicit FileLogSink(const std::filesystem::path& path,
                         size_t max_bytes = 10 * 1024 * 1024,
                         size_t max_files = 5);
    ~FileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;

    bool is_open() const;

private:
    std::filesystem::path path_;
    size_t max_bytes_;
    size_t max_files_;
    size_t written_ = 0;
    std::ofstream out_;
    LineFormatter formatter_;
    std::mutex mtx_;

    void rotate();
    std::filesystem::path rotated_path(size_t index) const;
};

/**
 * @brief 名前付きロガー
 */
class Logger {
public:
    explicit Logger(std::string name);

    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_.load(); }
    bool should_log(LogLevel level) const;

    void log(LogLevel level, const std::string& message, const char* file = "", int line = 0);
    void log_with_metadata(LogLevel level, const std::string& message,
                           std::map<std::string, std::string> metadata,
                           const char* file = "", int line = 0);

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    void flush();

private:
    std::string name_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinks_mutex_;

    void dispatch(const LogEntry& entry);
};

/**
 * @brief ロガーの登録簿（プロセスで1つ）
 *
 * グローバルレベル・グローバルシンクは既存ロガーにも後から作るロガーにも適用される。
 */
class LogManager {
public:
    static LogManager& instance();

    std::shared_ptr<Logger> get_logger(const std::string& name);
    void remove_logger(const std::string& name);

    void set_global_level(LogLevel level);
    void add_global_sink(std::shared_ptr<LogSink> sink);
    void clear_global_sinks();

    void flush_all();

private:
    LogManager() = default;
    ~LogManager();

    std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
    std::vector<std::shared_ptr<LogSink>> global_sinks_;
    LogLevel global_level_ = LogLevel::Info;
    std::mutex mtx_;
};

#define FLAKELIB_LOG_DEBUG(logger, message) \
    (logger)->log(::flakelib::utils::LogLevel::Debug, (message), __FILE__, __LINE__)

#define FLAKELIB_LOG_INFO(logger, message) \
    (logger)->log(::flakelib::utils::LogLevel::Info, (message), __FILE__, __LINE__)

#define FLAKELIB_LOG_WARNING(logger, message) \
    (logger)->log(::flakelib::utils::LogLevel::Warning, (message), __FILE__, __LINE__)

#define FLAKELIB_LOG_ERROR(logger, message) \
    (logger)->log(::flakelib::utils::LogLevel::Error, (message), __FILE__, __LINE__)

namespace log_utils {

/**
 * @brief "debug" / "info" / "warn(ing)" / "error" / "off"（大文字小文字無視）。不明な値は Info
 */
LogLevel parse_log_level(const std::string& text);

std::string log_level_to_string(LogLevel level);

/**
 * @brief グローバル設定をまとめて初期化
 * @param level グローバルレベル
 * @param log_to_console std::clog へ出力する
 * @param log_file ローテーション付きファイル出力（空で無効、親ディレクトリは作成する）
 */
void setup_basic_logging(LogLevel level = LogLevel::Info,
                         bool log_to_console = true,
                         const std::filesystem::path& log_file = {});

} // namespace log_utils

} // namespace flakelib::utils
