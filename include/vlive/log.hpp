#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vlive {

// ---------- Levels (MCP / syslog order) ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

struct LogRecord {
    LogLevel level;
    std::string logger;
    nlohmann::json data;
    std::chrono::system_clock::time_point time;
};

void to_json(nlohmann::json& j, const LogRecord& r);

// ---------- Sinks ----------

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

/// One JSON object per line on stderr. stdout is reserved for the stdio transport.
class StderrSink : public LogSink {
public:
    void write(const LogRecord& record) override;

private:
    std::mutex mutex_;
};

/// Keeps records in memory. Used by tests.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;

    [[nodiscard]] std::vector<LogRecord> records() const;
    [[nodiscard]] std::vector<LogRecord> records_for(const std::string& logger) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// ---------- Logger ----------

class Logger {
public:
    explicit Logger(std::shared_ptr<LogSink> sink = std::make_shared<StderrSink>(),
                    LogLevel min_level = LogLevel::Info);

    void log(LogLevel level, const std::string& logger, const nlohmann::json& data);

    void debug(const std::string& logger, const nlohmann::json& data) {
        log(LogLevel::Debug, logger, data);
    }
    void info(const std::string& logger, const nlohmann::json& data) {
        log(LogLevel::Info, logger, data);
    }
    void warning(const std::string& logger, const nlohmann::json& data) {
        log(LogLevel::Warning, logger, data);
    }
    void error(const std::string& logger, const nlohmann::json& data) {
        log(LogLevel::Error, logger, data);
    }

    [[nodiscard]] bool enabled(LogLevel level) const { return level >= min_level_.load(); }
    void set_level(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel level() const { return min_level_.load(); }

private:
    std::shared_ptr<LogSink> sink_;
    std::atomic<LogLevel> min_level_;
};

} // namespace vlive
