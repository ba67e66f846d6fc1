/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 */

#include "core/logger.hpp"
#include "core/json.hpp"
#include "core/types.hpp"

#include <chrono>
#include <sstream>

namespace workflow_orchestrator {

LogLevel parse_log_level(std::string_view text) noexcept {
    if (text == "debug") return LogLevel::Debug;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    return LogLevel::Info;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message, std::string_view component) {
    log(LogLevel::Debug, message, component);
}
void Logger::info(std::string_view message, std::string_view component) {
    log(LogLevel::Info, message, component);
}
void Logger::warn(std::string_view message, std::string_view component) {
    log(LogLevel::Warn, message, component);
}
void Logger::error(std::string_view message, std::string_view component) {
    log(LogLevel::Error, message, component);
}

void Logger::log(LogLevel level, std::string_view message, std::string_view component) {
    if (level < min_level_.load()) return;

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(",)"
        << R"("ts":")" << format_timestamp(std::chrono::system_clock::now()) << R"(",)";
    if (!component.empty()) {
        oss << R"("component":)" << json_quote(component) << ',';
    }
    oss << R"("msg":)" << json_quote(message) << '}';

    std::lock_guard lock(mutex_);
    sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_.store(level); }
LogLevel Logger::level() const noexcept { return min_level_.load(); }

}  // namespace workflow_orchestrator
