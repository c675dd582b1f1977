#ifndef PW_WIRE_WIRE_DUMP_HPP
#define PW_WIRE_WIRE_DUMP_HPP

#include "pw/common.h"
#include "pw/wire/wire-iterate.hpp"

// Function pointer for character output
// Returns: non-zero on success, 0 to abort printing
typedef int (*wire_putchar_fn)(char ch);

struct WireDumpOptions {
  // Levels of length-delimited payloads rendered as nested messages
  int max_depth;
  // Payload bytes shown before the rest is elided
  size_t max_bytes_shown;
};

WireDumpOptions wire_dump_defaults();

// Pretty print an encoded message, one field per line. Length-delimited
// payloads print as strings when printable, as nested { } blocks when they
// decode completely as a message, and as hex otherwise.
//
// Returns 1 on success, 0 if decoding failed or putchar_fn aborted. On a decode
// failure the fields before it are printed and *error_out (if given) is
// filled in; on abort error_out->code is NONE.
int wire_print(const void *data, size_t len, wire_putchar_fn putchar_fn, const WireDumpOptions &options,
               IterateError *error_out);

// Pretty print a packed repeated field payload as [a, b, c], formatting each
// element according to field_type
int wire_print_packed(const void *data, size_t len, FieldType field_type, wire_putchar_fn putchar_fn,
                      IterateError *error_out);

// Pretty print an encoded message into buf
// Returns: number of bytes written (not including null terminator), or -1 if
// decoding failed or the buffer is too small. The output is always
// null-terminated when buf_size > 0.
int wire_sprint(const void *data, size_t len, char *buf, size_t buf_size, const WireDumpOptions &options);

#endif // PW_WIRE_WIRE_DUMP_HPP
