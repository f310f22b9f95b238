#pragma once

#include "types.h"
#include <atomic>
#include <cstddef>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace swarm {

enum class LogLevel { Debug, Info, Warn, Error };

enum class LogCategory { System, Signal, Entry, Exit, Filter, Trade, Performance, Analysis };

std::string_view to_string(LogLevel);
std::string_view to_string(LogCategory);

struct LogRecord {
    time_point time{};
    LogLevel level{LogLevel::Info};
    LogCategory category{LogCategory::System};
    std::string message;
    std::string symbol;
    nlohmann::json data;

    nlohmann::json to_json() const;
};

// Destination for log records; may throw, the logger absorbs failures
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord &) = 0;
};

// Human-readable lines: debug/info to stdout, warn/error to stderr
class ConsoleSink : public LogSink {
public:
    void write(const LogRecord &) override;
};

// One JSON object per line, appended to a file
class JsonLinesSink : public LogSink {
public:
    explicit JsonLinesSink(std::string path);
    void write(const LogRecord &) override;

private:
    std::string path_;
    std::ofstream out_;
};

// Bounded in-memory capture of the most recent records
class MemorySink : public LogSink {
public:
    explicit MemorySink(std::size_t capacity = 1000uz) : capacity_{capacity} {}
    void write(const LogRecord &) override;

    std::vector<LogRecord> records() const;
    std::size_t count(LogCategory, std::string_view contains = {}) const;

private:
    mutable std::mutex mutex_;
    std::deque<LogRecord> records_;
    std::size_t capacity_;
};

// Leveled, categorised, fire-and-forget logging. Thread-safe.
class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::Info) : min_level_{min_level} {}

    void add_sink(std::shared_ptr<LogSink>);
    void set_min_level(LogLevel level) { min_level_.store(level); }

    void log(LogLevel, LogCategory, std::string message, std::string_view symbol = {},
             nlohmann::json data = nullptr);

    void debug(LogCategory c, std::string m, nlohmann::json d = nullptr) { log(LogLevel::Debug, c, std::move(m), {}, std::move(d)); }
    void info(LogCategory c, std::string m, nlohmann::json d = nullptr) { log(LogLevel::Info, c, std::move(m), {}, std::move(d)); }
    void warn(LogCategory c, std::string m, nlohmann::json d = nullptr) { log(LogLevel::Warn, c, std::move(m), {}, std::move(d)); }
    void error(LogCategory c, std::string m, nlohmann::json d = nullptr) { log(LogLevel::Error, c, std::move(m), {}, std::move(d)); }

    // Structured trading events
    void signal_detected(std::string_view symbol, const Signal &);
    void entry(std::string_view symbol, Direction, double price, double lots, double stop_loss,
               double take_profit, std::string_view reason);
    void filter(std::string_view code, std::string_view symbol, std::string message,
                nlohmann::json data = nullptr);

    // Records lost because a sink threw
    std::size_t dropped() const { return dropped_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::atomic<LogLevel> min_level_;
    std::atomic<std::size_t> dropped_{0uz};
};

} // namespace swarm
