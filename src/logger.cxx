#include "logger.h"
#include <chrono>
#include <format>
#include <print>
#include <stdexcept>

using json = nlohmann::json;

namespace swarm {

namespace {

constexpr auto level_marker(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "🔍";
  case LogLevel::Info:
    return "ℹ️ ";
  case LogLevel::Warn:
    return "⚠️ ";
  case LogLevel::Error:
    return "❌";
  }
  return "  ";
}

} // namespace

std::string_view to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string_view to_string(LogCategory category) {
  switch (category) {
  case LogCategory::System:
    return "SYSTEM";
  case LogCategory::Signal:
    return "SIGNAL";
  case LogCategory::Entry:
    return "ENTRY";
  case LogCategory::Exit:
    return "EXIT";
  case LogCategory::Filter:
    return "FILTER";
  case LogCategory::Trade:
    return "TRADE";
  case LogCategory::Performance:
    return "PERFORMANCE";
  case LogCategory::Analysis:
    return "ANALYSIS";
  }
  return "SYSTEM";
}

json LogRecord::to_json() const {
  auto j = json{{"timestamp", to_millis(time)},
                {"level", std::string{to_string(level)}},
                {"category", std::string{to_string(category)}},
                {"message", message}};
  if (not symbol.empty())
    j["symbol"] = symbol;
  if (not data.is_null())
    j["data"] = data;
  return j;
}

// ═══════════════════════════════════════════════════════════════
// Sinks
// ═══════════════════════════════════════════════════════════════

void ConsoleSink::write(const LogRecord &record) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(record.time);
  auto line = std::format("{:%H:%M:%S} {} [{}] {}{}", seconds,
                          level_marker(record.level), to_string(record.category),
                          record.symbol.empty() ? "" : record.symbol + ": ",
                          record.message);

  if (record.level == LogLevel::Warn or record.level == LogLevel::Error)
    std::println(stderr, "{}", line);
  else
    std::println("{}", line);
}

JsonLinesSink::JsonLinesSink(std::string path)
    : path_{std::move(path)}, out_{path_, std::ios::app} {
  if (not out_)
    throw std::runtime_error{std::format("Cannot open log file {}", path_)};
}

void JsonLinesSink::write(const LogRecord &record) {
  out_ << record.to_json().dump() << '\n';
  out_.flush();
  if (not out_)
    throw std::runtime_error{std::format("Write to {} failed", path_)};
}

void MemorySink::write(const LogRecord &record) {
  auto lock = std::scoped_lock{mutex_};
  records_.push_back(record);
  if (records_.size() > capacity_)
    records_.pop_front();
}

std::vector<LogRecord> MemorySink::records() const {
  auto lock = std::scoped_lock{mutex_};
  return {records_.begin(), records_.end()};
}

std::size_t MemorySink::count(LogCategory category,
                              std::string_view contains) const {
  auto lock = std::scoped_lock{mutex_};
  auto n = 0uz;
  for (const auto &r : records_)
    if (r.category == category and
        (contains.empty() or r.message.find(contains) != std::string::npos))
      ++n;
  return n;
}

// ═══════════════════════════════════════════════════════════════
// Logger
// ═══════════════════════════════════════════════════════════════

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
  auto lock = std::scoped_lock{mutex_};
  sinks_.push_back(std::move(sink));
}

void Logger::log(LogLevel level, LogCategory category, std::string message,
                 std::string_view symbol, json data) {
  if (level < min_level_.load())
    return;

  auto record = LogRecord{std::chrono::system_clock::now(), level, category,
                          std::move(message), std::string{symbol},
                          std::move(data)};

  auto lock = std::scoped_lock{mutex_};
  for (const auto &sink : sinks_) {
    try {
      sink->write(record);
    } catch (const std::exception &e) {
      // Never let a sink failure reach the caller
      ++dropped_;
      std::println(stderr, "Log sink failed: {}", e.what());
    }
  }
}

void Logger::signal_detected(std::string_view symbol, const Signal &signal) {
  log(LogLevel::Info, LogCategory::Signal,
      std::format("🎯 Signal detected: {} ({:.0f}%) {}", to_string(signal.direction),
                  signal.confidence, signal.reason),
      symbol,
      json{{"direction", std::string{to_string(signal.direction)}},
           {"confidence", signal.confidence},
           {"reason", signal.reason},
           {"indicators", signal.indicators}});
}

void Logger::entry(std::string_view symbol, Direction direction, double price,
                   double lots, double stop_loss, double take_profit,
                   std::string_view reason) {
  log(LogLevel::Info, LogCategory::Entry,
      std::format("✅ {} {} lots @ {:.5f} | SL {:.5f} | TP {:.5f}",
                  to_string(direction), lots, price, stop_loss, take_profit),
      symbol,
      json{{"direction", std::string{to_string(direction)}},
           {"price", price},
           {"lots", lots},
           {"stop_loss", stop_loss},
           {"take_profit", take_profit},
           {"reason", std::string{reason}}});
}

void Logger::filter(std::string_view code, std::string_view symbol,
                    std::string message, json data) {
  if (data.is_null())
    data = json::object();
  data["filter"] = std::string{code};
  log(LogLevel::Info, LogCategory::Filter,
      std::format("{}: {}", code, message), symbol, std::move(data));
}

} // namespace swarm
