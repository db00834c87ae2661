#include "portico/core/logger.h"

#include "portico/core/json.h"
#include "portico/core/time.h"

#include <cctype>
#include <iostream>
#include <kj/debug.h>
#include <kj/string-tree.h>

namespace portico::core {

kj::StringPtr to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE"_kj;
  case LogLevel::Debug:
    return "DEBUG"_kj;
  case LogLevel::Info:
    return "INFO"_kj;
  case LogLevel::Warn:
    return "WARN"_kj;
  case LogLevel::Error:
    return "ERROR"_kj;
  case LogLevel::Off:
    return "OFF"_kj;
  }
  return "UNKNOWN"_kj;
}

kj::Maybe<LogLevel> parse_log_level(kj::StringPtr text) {
  auto lower = kj::heapString(text);
  for (char& c : lower) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "trace") return LogLevel::Trace;
  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "warn" || lower == "warning") return LogLevel::Warn;
  if (lower == "error") return LogLevel::Error;
  if (lower == "off") return LogLevel::Off;
  return kj::none;
}

// ============================================================================
// Formatters
// ============================================================================

kj::String TextFormatter::format(const LogEntry& entry) const {
  kj::Vector<kj::StringTree> parts;
  parts.add(kj::strTree(format_iso8601(entry.time), " [", to_string(entry.level), "] ",
                        entry.message));
  for (auto& field : entry.fields) {
    parts.add(kj::strTree(" ", field.key, "=", field.value));
  }
  return kj::StringTree(parts.releaseAsArray(), "").flatten();
}

kj::String JsonFormatter::format(const LogEntry& entry) const {
  auto builder = JsonBuilder::object();
  builder.put("timestamp", format_iso8601(entry.time))
      .put("level", to_string(entry.level))
      .put("message", entry.message);
  for (auto& field : entry.fields) {
    builder.put(field.key, field.value);
  }
  return builder.build();
}

kj::String PlainFormatter::format(const LogEntry& entry) const {
  return kj::str(entry.message);
}

// ============================================================================
// Outputs
// ============================================================================

void ConsoleOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  std::ostream& out = (use_stderr_ || entry.level == LogLevel::Error) ? std::cerr : std::cout;
  out.write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  out << '\n';
}

void ConsoleOutput::flush() {
  std::cout.flush();
  std::cerr.flush();
}

FileOutput::FileOutput(kj::StringPtr path) : stream_(path.cStr(), std::ios::out | std::ios::app) {
  KJ_REQUIRE(stream_.is_open(), "failed to open log file", path);
}

void FileOutput::write(kj::StringPtr formatted, const LogEntry&) {
  stream_.write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  stream_ << '\n';
}

void FileOutput::flush() {
  stream_.flush();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(kj::Own<LogFormatter> formatter, kj::Own<LogOutput> output) {
  auto lock = guarded_.lockExclusive();
  lock->formatter = kj::mv(formatter);
  lock->outputs.add(kj::mv(output));
}

void Logger::set_level(LogLevel level) {
  guarded_.lockExclusive()->level = level;
}

LogLevel Logger::level() const {
  return guarded_.lockShared()->level;
}

bool Logger::enabled(LogLevel level) const {
  auto current = guarded_.lockShared()->level;
  return current != LogLevel::Off && level >= current;
}

void Logger::set_formatter(kj::Own<LogFormatter> formatter) {
  guarded_.lockExclusive()->formatter = kj::mv(formatter);
}

void Logger::add_output(kj::Own<LogOutput> output) {
  guarded_.lockExclusive()->outputs.add(kj::mv(output));
}

void Logger::log(LogLevel level, kj::StringPtr message, kj::Vector<LogField> fields) {
  auto lock = guarded_.lockExclusive();
  if (lock->level == LogLevel::Off || level == LogLevel::Off || level < lock->level) {
    return;
  }

  LogEntry entry{.level = level,
                 .time = kj::systemPreciseCalendarClock().now(),
                 .message = kj::heapString(message),
                 .fields = kj::mv(fields)};
  auto formatted = lock->formatter->format(entry);
  for (auto& output : lock->outputs) {
    output->write(formatted, entry);
  }
}

void Logger::flush() {
  auto lock = guarded_.lockExclusive();
  for (auto& output : lock->outputs) {
    output->flush();
  }
}

} // namespace portico::core
