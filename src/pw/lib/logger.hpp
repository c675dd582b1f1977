#pragma once

#include <stdarg.h>

#include "pw/common.h"

// Receives one formatted log line; same contract as pwputsn
typedef int (*log_sink_fn)(const char *str, int n);

// Prefixed line logger. `level` is the subsystem's configured level from
// pw/config.h; log() prints at LSOFT and above, trace() only at LLOUD.
class Logger {
private:
  const char *prefix;
  int level;
  log_sink_fn sink;

  void vlog(const char *format, va_list args) {
    char message[256];
    char line[320];
    pwvsnprintf(message, sizeof(message), format, args);
    int len = pwsnprintf(line, sizeof(line), "[%s] %s\n", prefix, message);
    if (len < 0)
      return;
    if (len >= (int)sizeof(line)) {
      len = (int)sizeof(line) - 1;
      line[len - 1] = '\n';
    }
    sink(line, len);
  }

public:
  explicit Logger(const char *prefix, int level = LOG_GENERAL, log_sink_fn sink = pweputsn)
      : prefix(prefix), level(level), sink(sink) {}

  void log(const char *format, ...) __attribute__((format(printf, 2, 3))) {
    if (level < LSOFT)
      return;
    va_list args;
    va_start(args, format);
    vlog(format, args);
    va_end(args);
  }

  void trace(const char *format, ...) __attribute__((format(printf, 2, 3))) {
    if (level < LLOUD)
      return;
    va_list args;
    va_start(args, format);
    vlog(format, args);
    va_end(args);
  }
};
