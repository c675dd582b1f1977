// std.cpp - standard library like functions
#include "pw/common.h"

#include <stdio.h>

// Formatting buffer for pwprintf -- not safe to hold across calls
static char scratch_buffer[PW_SCRATCH_SIZE];

// ============================================================================
// Printf functions
// ============================================================================

int pwvsnprintf(char *str, size_t size, const char *format, va_list args) { return vsnprintf(str, size, format, args); }

int pwsnprintf(char *str, size_t size, const char *format, ...) {
  va_list args;
  va_start(args, format);
  int r = pwvsnprintf(str, size, format, args);
  va_end(args);
  return r;
}

void pwprintf(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  int len = pwvsnprintf(scratch_buffer, PW_SCRATCH_SIZE, fmt, args);
  va_end(args);
  if (len < 0) {
    return;
  }
  if (len >= PW_SCRATCH_SIZE) {
    len = PW_SCRATCH_SIZE - 1;
  }
  pwputsn(scratch_buffer, len);
}

void pweprintf(const char *fmt, ...) {
  char buffer[512];
  va_list args;
  va_start(args, fmt);
  int len = pwvsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  if (len < 0) {
    return;
  }
  if (len >= (int)sizeof(buffer)) {
    len = (int)sizeof(buffer) - 1;
  }
  pweputsn(buffer, len);
}

Result<uint64_t, ErrorCode> parse_uint(const char *s) {
  if (!s || *s == '\0') {
    return Result<uint64_t, ErrorCode>::err(ARGS__INVALID_NUMBER);
  }

  uint64_t result = 0;
  for (const char *p = s; *p; p++) {
    if (*p < '0' || *p > '9') {
      return Result<uint64_t, ErrorCode>::err(ARGS__INVALID_NUMBER);
    }
    uint64_t digit = (uint64_t)(*p - '0');
    if (result > (UINT64_MAX - digit) / 10) {
      return Result<uint64_t, ErrorCode>::err(ARGS__INVALID_NUMBER);
    }
    result = result * 10 + digit;
  }

  return Result<uint64_t, ErrorCode>::ok(result);
}
