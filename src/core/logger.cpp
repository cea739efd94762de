#include "duet/core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace duet::core {

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::mutex_;
std::vector<std::shared_ptr<ILogSink>> Logger::sinks_;

namespace {

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void writeLine(std::ostream& out, const LogMessage& msg) {
    out << "[" << msg.timestamp << "] [" << logLevelName(msg.level) << "] "
        << msg.message << std::endl;
}

} // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

void ConsoleSink::write(const LogMessage& msg) {
    writeLine(msg.level >= LogLevel::WARN ? std::cerr : std::cout, msg);
}

FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::app) {}

void FileSink::write(const LogMessage& msg) {
    if (file_) {
        writeLine(file_, msg);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::write(LogLevel level, std::string message) {
    LogMessage msg{level, currentTimestamp(), std::move(message)};

    std::lock_guard<std::mutex> lock(mutex_);
    if (sinks_.empty()) {
        ConsoleSink().write(msg);
        return;
    }
    for (const auto& sink : sinks_) {
        sink->write(msg);
    }
}

} // namespace duet::core
