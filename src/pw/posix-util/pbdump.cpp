// pbdump.cpp - argument handling and dump loop for pbdump
#include "pw/posix-util/pbdump.hpp"
#include "pw/lib/logger.hpp"
#include <stdio.h>
#include <string.h>
#include <vector>

static Logger pblog("pbdump", LOG_GENERAL);

struct Options {
  WireDumpOptions dump;
  bool packed;
  FieldType packed_type;
};

static void usage() {
  pweprintf("usage: pbdump [-d depth] [-p field-type] [file ...]\n"
            "  -d depth       render nested messages up to this depth (default %d, at most %d)\n"
            "  -p field-type  treat input as a packed repeated field (int32, double, ...)\n"
            "  file           input file, or - for stdin (default)\n",
            PW_DUMP_MAX_DEPTH, PW_DUMP_DEPTH_LIMIT);
}

static void write_line(wire_putchar_fn out, const char *head, const char *tail) {
  for (const char *p = head; *p; p++) {
    if (!out(*p))
      return;
  }
  for (const char *p = tail; *p; p++) {
    if (!out(*p))
      return;
  }
  out('\n');
}

// Read an entire stream into out
static ErrorCode read_stream(FILE *f, std::vector<uint8_t> &out) {
  uint8_t chunk[PW_SCRATCH_SIZE];
  size_t n;
  while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) {
    out.insert(out.end(), chunk, chunk + n);
  }
  if (ferror(f)) {
    return IO__READ_FAILED;
  }
  return NONE;
}

static ErrorCode read_input(const char *path, std::vector<uint8_t> &out) {
  if (strcmp(path, "-") == 0) {
    return read_stream(stdin, out);
  }
  FILE *f = fopen(path, "rb");
  if (!f) {
    return IO__OPEN_FAILED;
  }
  ErrorCode err = read_stream(f, out);
  fclose(f);
  return err;
}

// Dump one input; returns false if it could not be read or decoded
static bool dump_input(const char *path, const Options &options, wire_putchar_fn out) {
  std::vector<uint8_t> data;
  ErrorCode err = read_input(path, data);
  if (err != NONE) {
    pblog.log("%s: %s", path, error_code_to_string(err));
    return false;
  }
  pblog.trace("%s: %zu bytes", path, data.size());

  IterateError decode_error;
  decode_error.code = NONE;
  int ok;
  if (options.packed) {
    ok = wire_print_packed(data.data(), data.size(), options.packed_type, out, &decode_error);
  } else {
    ok = wire_print(data.data(), data.size(), out, options.dump, &decode_error);
  }

  if (!ok) {
    if (decode_error.code != NONE) {
      char msg[128];
      iterate_error_format(decode_error, msg, sizeof(msg));
      pblog.log("%s: %s", path, msg);
    } else {
      pblog.log("%s: output failed", path);
    }
    return false;
  }
  return true;
}

int pbdump_run(int argc, const char *const argv[], wire_putchar_fn out) {
  Options options;
  options.dump = wire_dump_defaults();
  options.packed = false;
  options.packed_type = FIELD_INT32;

  std::vector<const char *> inputs;

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "-p") == 0) {
      if (i + 1 >= argc) {
        usage();
        return PBDUMP_USAGE;
      }
      const char *flag = argv[i];
      const char *arg = argv[++i];
      if (flag[1] == 'd') {
        auto depth = parse_uint(arg);
        if (depth.is_err()) {
          pblog.log("bad depth '%s': %s", arg, error_code_to_string(depth.error()));
          return PBDUMP_USAGE;
        }
        if (*depth > (uint64_t)PW_DUMP_DEPTH_LIMIT) {
          pblog.log("bad depth '%s': depth too large (limit %d)", arg, PW_DUMP_DEPTH_LIMIT);
          return PBDUMP_USAGE;
        }
        options.dump.max_depth = (int)*depth;
      } else {
        auto type = field_type_from_name(arg);
        if (type.is_err()) {
          pblog.log("bad field type '%s': %s", arg, error_code_to_string(type.error()));
          return PBDUMP_USAGE;
        }
        options.packed = true;
        options.packed_type = *type;
      }
    } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
      usage();
      return PBDUMP_OK;
    } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
      usage();
      return PBDUMP_USAGE;
    } else {
      inputs.push_back(argv[i]);
    }
  }

  if (inputs.empty()) {
    inputs.push_back("-");
  }

  int status = PBDUMP_OK;
  for (const char *path : inputs) {
    if (inputs.size() > 1) {
      write_line(out, "# ", path);
    }
    if (!dump_input(path, options, out)) {
      status = PBDUMP_FAILED;
    }
  }
  return status;
}
