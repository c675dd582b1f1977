// posix-std.cpp - POSIX implementations of the pw output primitives
#include "pw/common.h"
#include <stdio.h>

extern "C" int pwputchar(char c) { return putchar(c) != EOF ? 1 : 0; }

extern "C" int pwputsn(const char *str, int n) {
  if (n <= 0) {
    return 1;
  }
  return fwrite(str, 1, (size_t)n, stdout) == (size_t)n ? 1 : 0;
}

extern "C" int pweputsn(const char *str, int n) {
  if (n <= 0) {
    return 1;
  }
  return fwrite(str, 1, (size_t)n, stderr) == (size_t)n ? 1 : 0;
}
