#include "monitor/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <thread>

static inline long long nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

static const char* levelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "OFF";
    }
}

LogLevel parseLogLevel(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (n == "debug") return LogLevel::Debug;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    if (n == "off" || n == "none") return LogLevel::Off;
    return LogLevel::Info;
}

Logger::Logger(std::ostream& out, LogLevel level, const std::string& traceFilePath)
    : out_(out), level_(level) {
    if (traceFilePath.empty()) return;

    trace.open(traceFilePath, std::ios::out | std::ios::app);
    if (!trace.is_open()) {
        std::cerr << "[Logger] Cannot open trace file: " << traceFilePath << "\n";
        return;
    }
    if (trace.tellp() == 0) {
        trace << "timestamp,"
                 "component_count,"
                 "record_count,"
                 "token_count,"
                 "confidence,"
                 "duration_ms,"
                 "warnings\n";
    }
}

Logger::Logger(LogLevel level, const std::string& traceFilePath)
    : Logger(std::cout, level, traceFilePath) {}

Logger::~Logger() {
    flush();
    if (trace.is_open()) trace.close();
}

std::shared_ptr<Logger> Logger::silent() {
    return std::make_shared<Logger>(LogLevel::Off);
}

void Logger::debug(const std::string& tag, const std::string& msg) { write(LogLevel::Debug, tag, msg); }
void Logger::info(const std::string& tag, const std::string& msg)  { write(LogLevel::Info, tag, msg); }
void Logger::warn(const std::string& tag, const std::string& msg)  { write(LogLevel::Warn, tag, msg); }
void Logger::error(const std::string& tag, const std::string& msg) { write(LogLevel::Error, tag, msg); }

void Logger::write(LogLevel lvl, const std::string& tag, const std::string& msg) {
    if (lvl < level_ || level_ == LogLevel::Off) return;

    std::lock_guard<std::mutex> lock(mtx);
    out_ << "[" << nowMs() << "ms]"
         << "[TID " << std::this_thread::get_id() << "]"
         << "[" << levelName(lvl) << "]"
         << "[" << tag << "] " << msg << std::endl;
}

void Logger::log(const LogEntry& e) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!trace.is_open()) return;

    trace << e.timestamp << ","
          << e.component_count << ","
          << e.record_count << ","
          << e.token_count << ","
          << e.confidence << ","
          << e.duration_ms << ","
          << e.warnings << "\n";

    counter++;
    if (counter % 50 == 0)
        trace.flush();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mtx);
    if (trace.is_open()) trace.flush();
    out_.flush();
}
