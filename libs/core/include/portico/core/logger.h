/**
 * @file logger.h
 * @brief Structured log sink used for request access logs
 *
 * Operational diagnostics go through KJ_LOG. The Logger here is for records that operators
 * consume downstream (access logs), so it supports structured fields, selectable formats and
 * pluggable outputs.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace portico::core {

enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  Off = 5,
};

[[nodiscard]] kj::StringPtr to_string(LogLevel level);

/// Parse "trace".."error"/"off", case-insensitive.
[[nodiscard]] kj::Maybe<LogLevel> parse_log_level(kj::StringPtr text);

struct LogField {
  kj::String key;
  kj::String value;
};

/**
 * @brief One record handed to formatters and outputs
 */
struct LogEntry {
  LogLevel level;
  kj::Date time;
  kj::String message;
  kj::Vector<LogField> fields;
};

class LogFormatter {
public:
  virtual ~LogFormatter() = default;
  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
};

/**
 * @brief Human-readable: 2024-05-01T12:00:00.000Z [INFO] message key=value ...
 */
class TextFormatter final : public LogFormatter {
public:
  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
};

/**
 * @brief One JSON object per line with timestamp, level, message and every field
 */
class JsonFormatter final : public LogFormatter {
public:
  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
};

/**
 * @brief Message only; for pre-formatted lines such as Apache combined logs
 */
class PlainFormatter final : public LogFormatter {
public:
  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
};

class LogOutput {
public:
  virtual ~LogOutput() = default;
  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;
  virtual void flush() = 0;
};

/// stdout, with Error records sent to stderr unless use_stderr forces everything there.
class ConsoleOutput final : public LogOutput {
public:
  explicit ConsoleOutput(bool use_stderr = false) : use_stderr_(use_stderr) {}

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;

private:
  bool use_stderr_;
};

/// Appends one line per record to a file.
class FileOutput final : public LogOutput {
public:
  explicit FileOutput(kj::StringPtr path);

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;

private:
  std::ofstream stream_;
};

/**
 * @brief Thread-safe logger with a minimum level, one formatter and any number of outputs
 */
class Logger final {
public:
  explicit Logger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
                  kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;
  [[nodiscard]] bool enabled(LogLevel level) const;

  void set_formatter(kj::Own<LogFormatter> formatter);
  void add_output(kj::Own<LogOutput> output);

  void log(LogLevel level, kj::StringPtr message, kj::Vector<LogField> fields = {});

  void info(kj::StringPtr message, kj::Vector<LogField> fields = {}) {
    log(LogLevel::Info, message, kj::mv(fields));
  }
  void warn(kj::StringPtr message, kj::Vector<LogField> fields = {}) {
    log(LogLevel::Warn, message, kj::mv(fields));
  }
  void error(kj::StringPtr message, kj::Vector<LogField> fields = {}) {
    log(LogLevel::Error, message, kj::mv(fields));
  }

  void flush();

private:
  struct LoggerState {
    LogLevel level = LogLevel::Info;
    kj::Own<LogFormatter> formatter;
    kj::Vector<kj::Own<LogOutput>> outputs;
  };

  kj::MutexGuarded<LoggerState> guarded_;
};

} // namespace portico::core
