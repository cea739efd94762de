#pragma once

#include <string>
#include <string_view>
#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include <mutex>
#include <vector>
#include <optional>

namespace duet::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

const char* logLevelName(LogLevel level);
std::optional<LogLevel> parseLogLevel(std::string_view name);

// Satu baris log yang sudah diformat
struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string message;
};

// Tujuan output log
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogMessage& msg) = 0;
};

class ConsoleSink : public ILogSink {
public:
    void write(const LogMessage& msg) override;
};

class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    void write(const LogMessage& msg) override;

private:
    std::ofstream file_;
};

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Tanpa sink terdaftar, log ditulis ke console
    static void addSink(std::shared_ptr<ILogSink> sink);
    static void removeSink(const std::shared_ptr<ILogSink>& sink);
    static void clearSinks();

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    // Simple format string implementation
    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string head = format.substr(0, pos) + oss.str();
            return head + formatString(format.substr(pos + 2), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }

private:
    static LogLevel current_level_;
    static std::mutex mutex_;
    static std::vector<std::shared_ptr<ILogSink>> sinks_;

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (level < getLevel()) return;
        write(level, formatString(format, std::forward<Args>(args)...));
    }

    static void write(LogLevel level, std::string message);
};

} // namespace duet::core
