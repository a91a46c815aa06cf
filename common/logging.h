// Copyright 2023 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#ifndef __COMMON_LOGGING_H
#define __COMMON_LOGGING_H

#include "absl/status/statusor.h"
#include <stdarg.h>
#include <stdio.h>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>

namespace carno {

enum class LogLevel {
  kVerboseDebug,
  kDebug,
  kInfo,
  kWarning,
  kError,
  kFatal,
};

// Parses one of verbose, debug, info, warning, error or fatal.
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view s);

// A logger logs timestamped messages to a FILE pointer, possibly in color.
// Only messages that are are level above the current log level are
// logged.  Each line carries the name of the subsystem that owns the
// logger.
//
// The protoc plugin protocol uses stdout, so the default stream is
// stderr and must stay that way inside the plugin.
class Logger {
public:
  Logger() = default;
  explicit Logger(std::string subsystem) : subsystem_(std::move(subsystem)) {}
  Logger(std::string subsystem, LogLevel min)
      : subsystem_(std::move(subsystem)), min_level_(min) {}
  virtual ~Logger() = default;

  // Log a message at the given log level.  If the output stream is a TTY
  // it will be in color.
  virtual void Log(LogLevel level, const char *fmt, ...)
      __attribute__((format(printf, 3, 4)));
  virtual void VLog(LogLevel level, const char *fmt, va_list ap);

  // All logged messages with a level below the min level will be
  // ignored.
  void SetLogLevel(LogLevel l) { min_level_ = l; }

  LogLevel GetLogLevel() const { return min_level_; }
  void SetOutputStream(FILE *stream) {
    output_stream_ = stream;
    in_color_ = isatty(fileno(stream));
  }

private:
  enum ForegroundColor {
    kBlack = 30,
    kRed,
    kGreen,
    kYellow,
    kBlue,
    kMagenta,
    kCyan,
    kWhite,
    kNormal = 39,
  };

  static constexpr size_t kBufferSize = 512;

  static ForegroundColor ColorForLogLevel(LogLevel level);
  std::string ColorString(ForegroundColor color) const;
  std::string NormalString() const;

  std::string subsystem_ = "carno";
  LogLevel min_level_ = LogLevel::kInfo;
  FILE *output_stream_ = stderr;
  bool in_color_ = isatty(STDERR_FILENO);
};

} // namespace carno

#endif // __COMMON_LOGGING_H
