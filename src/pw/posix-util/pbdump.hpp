#ifndef PW_POSIX_UTIL_PBDUMP_HPP
#define PW_POSIX_UTIL_PBDUMP_HPP

#include "pw/common.h"
#include "pw/wire/wire-dump.hpp"

// Exit statuses
#define PBDUMP_OK 0
#define PBDUMP_FAILED 1
#define PBDUMP_USAGE 2

// Runs pbdump with the given arguments (argv[0] is the program name), writing
// the dump through out and diagnostics to stderr. Returns the exit status.
int pbdump_run(int argc, const char *const argv[], wire_putchar_fn out);

#endif // PW_POSIX_UTIL_PBDUMP_HPP
