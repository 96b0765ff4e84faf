#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

namespace packdoc::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

namespace detail {

struct LevelName {
  std::string_view name;
  LogLevel level;
};

constexpr std::array<LevelName, 5> kLevelNames = {{
    {"debug", LogLevel::kDebug},
    {"info", LogLevel::kInfo},
    {"warn", LogLevel::kWarn},
    {"warning", LogLevel::kWarn},
    {"error", LogLevel::kError},
}};

inline bool EqualsLower(std::string_view raw, std::string_view lower) {
  if (raw.size() != lower.size()) {
    return false;
  }
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    const char folded = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    if (folded != lower[i]) {
      return false;
    }
  }
  return true;
}

// 2024-05-01T12:00:00.123Z
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const int millis_component = static_cast<int>((millis % 1000 + 1000) % 1000);

  const std::time_t seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc{};
#if defined(_WIN32)
  if (gmtime_s(&utc, &seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&seconds, &utc) == nullptr) {
    return "";
  }
#endif

  char buffer[32];
  const int written = std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                                    utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                                    utc.tm_min, utc.tm_sec, millis_component);
  if (written <= 0) {
    return "";
  }
  return std::string(buffer, static_cast<std::size_t>(written));
}

// Values are always double-quoted so paths with spaces stay one field.
inline void AppendQuoted(std::string& out, std::string_view raw) {
  out.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(c);
      break;
    }
  }
  out.push_back('"');
}

} // namespace detail

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  for (const auto& entry : detail::kLevelNames) {
    if (detail::EqualsLower(raw, entry.name)) {
      level = entry.level;
      return true;
    }
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// One key=value record per line on stderr:
//   ts_utc=<iso8601> level=INFO package="<dir>" msg="..." key="value" ...
// The package field names the directory being processed, "-" between
// packages.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetPackage(std::string package) {
    package_ = std::move(package);
  }

  const std::string& Package() const {
    return package_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    // Built in one buffer so a record is never split across writes.
    std::string record = "ts_utc=";
    record += detail::FormatUtcTimestamp(std::chrono::system_clock::now());
    record += " level=";
    record += ToString(level);
    record += " package=";
    detail::AppendQuoted(record, package_);
    record += " msg=";
    detail::AppendQuoted(record, message);
    for (const auto& field : fields) {
      record.push_back(' ');
      record += field.key;
      record.push_back('=');
      detail::AppendQuoted(record, field.value);
    }
    record.push_back('\n');

    (*out_) << record;
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string package_ = "-";
};

// Tags records with one package for the guard's lifetime, then restores the
// previous tag.
class ScopedPackage {
public:
  ScopedPackage(Logger& logger, std::string package)
      : logger_(logger), previous_(logger.Package()) {
    logger_.SetPackage(std::move(package));
  }

  ScopedPackage(const ScopedPackage&) = delete;
  ScopedPackage& operator=(const ScopedPackage&) = delete;

  ~ScopedPackage() {
    logger_.SetPackage(std::move(previous_));
  }

private:
  Logger& logger_;
  std::string previous_;
};

} // namespace packdoc::core::logging
