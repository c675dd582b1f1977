// pw/common.h - global type definitions and globally available functions
#ifndef PW_COMMON_H
#define PW_COMMON_H

#include "pw/config.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

// Output primitives, callable from anywhere
void pwprintf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
int pwvsnprintf(char *str, size_t size, const char *format, va_list args);
int pwsnprintf(char *str, size_t size, const char *format, ...) __attribute__((format(printf, 3, 4)));

// pwputchar -- returns 0 in case of failure, 1 otherwise
int pwputchar(char);
int pwputsn(const char *str, int n);

// Diagnostic channel, kept apart from regular output
void pweprintf(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
int pweputsn(const char *str, int n);

#ifdef __cplusplus
} // extern "C"

#include "pw/lib/error-codes.hpp"
#include "pw/lib/result.hpp"

// Parse a non-negative decimal integer; no sign, no whitespace
Result<uint64_t, ErrorCode> parse_uint(const char *s);

#endif

#endif
