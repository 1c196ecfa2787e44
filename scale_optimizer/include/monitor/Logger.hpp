#pragma once
#include <cstddef>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

LogLevel parseLogLevel(const std::string& name);

// One row of the optimisation trace (CSV)
struct LogEntry {
    std::string timestamp;

    std::size_t component_count;
    std::size_t record_count;
    std::size_t token_count;

    double confidence;
    double duration_ms;
    std::size_t warnings;
};

// Per-instance logger. Console lines go to the given stream; trace rows go to an
// optional CSV file.
class Logger {
public:
    explicit Logger(std::ostream& out, LogLevel level = LogLevel::Info,
                    const std::string& traceFilePath = "");
    Logger(LogLevel level = LogLevel::Info, const std::string& traceFilePath = "");
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Logger that drops everything
    static std::shared_ptr<Logger> silent();

    void debug(const std::string& tag, const std::string& msg);
    void info(const std::string& tag, const std::string& msg);
    void warn(const std::string& tag, const std::string& msg);
    void error(const std::string& tag, const std::string& msg);

    void log(const LogEntry& e);
    void flush();

    LogLevel level() const { return level_; }
    bool tracing() const { return trace.is_open(); }

private:
    void write(LogLevel lvl, const std::string& tag, const std::string& msg);

    std::ostream& out_;
    LogLevel level_;

    std::ofstream trace;
    std::mutex mtx;
    int counter = 0;
};
