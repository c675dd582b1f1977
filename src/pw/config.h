#ifndef PW_CONFIG_H
#define PW_CONFIG_H

// Log levels
#define LSILENT 0
#define LSOFT 1
#define LLOUD 2

// Subsystem log levels (can be overridden by build system)
#ifndef LOG_GENERAL
#define LOG_GENERAL LSOFT
#endif
#ifndef LOG_DUMP
#define LOG_DUMP LSOFT
#endif

// Longest legal varint: ceil(64 / 7) bytes
#define PW_VARINT_MAX_BYTES 10

// Nesting depth at which wire dump stops trying to render length-delimited
// payloads as sub-messages
#ifndef PW_DUMP_MAX_DEPTH
#define PW_DUMP_MAX_DEPTH 8
#endif

// Largest depth pbdump accepts for -d
#define PW_DUMP_DEPTH_LIMIT 1024

// Number of payload bytes wire dump shows before eliding the rest
#ifndef PW_DUMP_MAX_BYTES_SHOWN
#define PW_DUMP_MAX_BYTES_SHOWN 32
#endif

#define PW_SCRATCH_SIZE 4096

#endif
