#include "flakelib/utils/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>

namespace flakelib::utils {

namespace {

std::string format_time(const std::chrono::system_clock::time_point& tp, const std::string& fmt) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt.c_str(), &tm);
    return std::string(buf, n);
}

} // namespace

std::string LineFormatter::format(const LogEntry& e) const {
    std::ostringstream ss;
    ss << format_time(e.timestamp, options_.timestamp_format)
       << " | " << log_utils::log_level_to_string(e.level)
       << " | " << e.logger_name
       << " | " << e.message;
    if (options_.include_source && !e.file.empty()) {
        ss << " | " << e.file << ':' << e.line;
    }
    if (options_.include_metadata && !e.metadata.empty()) {
        ss << " | [";
        for (auto it = e.metadata.begin(); it != e.metadata.end(); ++it) {
            if (it != e.metadata.begin()) ss << ',';
            ss << it->first << '=' << it->second;
        }
        ss << ']';
    }
    return ss.str();
}

// ConsoleLogSink
void ConsoleLogSink::write(const LogEntry& entry) {
    std::string line = formatter_.format(entry);
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << line << '\n';
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

// FileLogSink
FileLogSink::FileLogSink(const std::filesystem::path& path, size_t max_bytes, size_t max_files)
    : path_(path), max_bytes_(max_bytes), max_files_(max_files) {
    out_.open(path_, std::ios::app);
    std::error_code ec;
    auto size = std::filesystem::file_size(path_, ec);
    if (!ec) written_ = static_cast<size_t>(size);
}

FileLogSink::~FileLogSink() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (out_.is_open()) out_.close();
}

bool FileLogSink::is_open() const { return out_.is_open(); }

void FileLogSink::write(const LogEntry& entry) {
    std::string line = formatter_.format(entry);
    std::lock_guard<std::mutex> lock(mtx_);
    if (!out_.is_open()) return;
    out_ << line << '\n';
    written_ += line.size() + 1;
    if (max_bytes_ > 0 && written_ > max_bytes_) rotate();
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

void FileLogSink::rotate() {
    out_.close();
    std::error_code ec;
    if (max_files_ > 0) {
        std::filesystem::remove(rotated_path(max_files_), ec);
        for (size_t i = max_files_; i > 1; --i) {
            std::filesystem::rename(rotated_path(i - 1), rotated_path(i), ec);
        }
        std::filesystem::rename(path_, rotated_path(1), ec);
    }
    out_.open(path_, std::ios::trunc);
    written_ = 0;
}

std::filesystem::path FileLogSink::rotated_path(size_t index) const {
    return std::filesystem::path(path_.string() + "." + std::to_string(index));
}

// Logger
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end()) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

bool Logger::should_log(LogLevel level) const {
    return level != LogLevel::Off && level >= level_.load();
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (!should_log(level)) return;
    LogEntry e;
    e.level = level;
    e.logger_name = name_;
    e.message = message;
    e.timestamp = std::chrono::system_clock::now();
    e.file = file;
    e.line = line;
    dispatch(e);
}

void Logger::log_with_metadata(LogLevel level, const std::string& message,
                               std::map<std::string, std::string> metadata,
                               const char* file, int line) {
    if (!should_log(level)) return;
    LogEntry e;
    e.level = level;
    e.logger_name = name_;
    e.message = message;
    e.timestamp = std::chrono::system_clock::now();
    e.file = file;
    e.line = line;
    e.metadata = std::move(metadata);
    dispatch(e);
}

void Logger::dispatch(const LogEntry& e) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) {
        if (sink->accepts(e.level)) sink->write(e);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (auto& sink : sinks_) sink->flush();
}

// LogManager
LogManager& LogManager::instance() {
    static LogManager manager;
    return manager;
}

LogManager::~LogManager() { flush_all(); }

std::shared_ptr<Logger> LogManager::get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& slot = loggers_[name];
    if (!slot) {
        slot = std::make_shared<Logger>(name);
        slot->set_level(global_level_);
        for (auto& sink : global_sinks_) slot->add_sink(sink);
    }
    return slot;
}

void LogManager::remove_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    loggers_.erase(name);
}

void LogManager::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mtx_);
    global_level_ = level;
    for (auto& [name, logger] : loggers_) logger->set_level(level);
}

void LogManager::add_global_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& [name, logger] : loggers_) logger->add_sink(sink);
    global_sinks_.push_back(std::move(sink));
}

void LogManager::clear_global_sinks() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& [name, logger] : loggers_) {
        for (auto& sink : global_sinks_) logger->remove_sink(sink);
    }
    global_sinks_.clear();
}

void LogManager::flush_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& [name, logger] : loggers_) logger->flush();
}

namespace log_utils {

LogLevel parse_log_level(const std::string& text) {
    std::string s;
    for (char c : text) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warning;
    if (s == "error") return LogLevel::Error;
    if (s == "off") return LogLevel::Off;
    return LogLevel::Info;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        default: return "OFF";
    }
}

void setup_basic_logging(LogLevel level, bool log_to_console, const std::filesystem::path& log_file) {
    auto& manager = LogManager::instance();
    manager.clear_global_sinks();
    manager.set_global_level(level);
    if (log_to_console) {
        manager.add_global_sink(std::make_shared<ConsoleLogSink>());
    }
    if (!log_file.empty()) {
        if (log_file.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(log_file.parent_path(), ec);
        }
        manager.add_global_sink(std::make_shared<FileLogSink>(log_file));
    }
}

} // namespace log_utils

} // namespace flakelib::utils
