#include "vlive/log.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace vlive {

// ---------- LogLevel ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
        default:                  return "info";
    }
}

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug")     return LogLevel::Debug;
    if (s == "info")      return LogLevel::Info;
    if (s == "notice")    return LogLevel::Notice;
    if (s == "warning")   return LogLevel::Warning;
    if (s == "error")     return LogLevel::Error;
    if (s == "critical")  return LogLevel::Critical;
    if (s == "alert")     return LogLevel::Alert;
    if (s == "emergency") return LogLevel::Emergency;
    throw std::invalid_argument("Unknown log level: " + s);
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

namespace {

std::string format_utc(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

} // anonymous namespace

void to_json(nlohmann::json& j, const LogRecord& r) {
    j = {
        {"time", format_utc(r.time)},
        {"level", r.level},
        {"logger", r.logger},
        {"data", r.data}
    };
}

// ---------- Sinks ----------

void StderrSink::write(const LogRecord& record) {
    nlohmann::json j = record;
    // Replace invalid UTF-8 instead of throwing from a log call
    std::string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line << '\n';
    std::cerr.flush();
}

void MemorySink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<LogRecord> MemorySink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::vector<LogRecord> MemorySink::records_for(const std::string& logger) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LogRecord> out;
    for (const auto& r : records_) {
        if (r.logger == logger) out.push_back(r);
    }
    return out;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// ---------- Logger ----------

Logger::Logger(std::shared_ptr<LogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {
}

void Logger::log(LogLevel level, const std::string& logger, const nlohmann::json& data) {
    if (!sink_ || !enabled(level)) return;
    sink_->write(LogRecord{level, logger, data, std::chrono::system_clock::now()});
}

} // namespace vlive
