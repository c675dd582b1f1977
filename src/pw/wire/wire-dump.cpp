#include "pw/wire/wire-dump.hpp"
#include "pw/lib/logger.hpp"

// Output target: either a putchar function or a bounded buffer
struct wire_sink {
  wire_putchar_fn putchar_fn;
  char *buf;
  size_t size;
  size_t pos;
};

// Context for pretty printing
struct wire_print_ctx {
  wire_sink *sink;
  WireDumpOptions options;
  int error; // Set to 1 if the sink refuses a character
};

static Logger dump_log("wire-dump", LOG_DUMP);

static void write_char(wire_print_ctx *ctx, char ch) {
  if (ctx->error)
    return;
  wire_sink *sink = ctx->sink;
  if (sink->putchar_fn) {
    if (!sink->putchar_fn(ch)) {
      ctx->error = 1;
    }
    return;
  }
  if (sink->pos + 1 < sink->size) {
    sink->buf[sink->pos++] = ch;
  } else {
    ctx->error = 1;
  }
}

static void write_str(wire_print_ctx *ctx, const char *s) {
  while (*s && !ctx->error) {
    write_char(ctx, *s++);
  }
}

static void write_fmt(wire_print_ctx *ctx, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

static void write_fmt(wire_print_ctx *ctx, const char *fmt, ...) {
  char buf[64];
  va_list args;
  va_start(args, fmt);
  pwvsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  write_str(ctx, buf);
}

static void write_indent(wire_print_ctx *ctx, int depth) {
  for (int i = 0; i < depth; i++) {
    write_str(ctx, "  ");
  }
}

static bool is_printable(const ByteView &bytes) {
  for (size_t i = 0; i < bytes.len; i++) {
    uint8_t c = bytes[i];
    if ((c < 0x20 || c > 0x7e) && c != '\n' && c != '\r' && c != '\t') {
      return false;
    }
  }
  return true;
}

// True if the payload decodes completely as a message with valid field numbers
static bool looks_like_message(const ByteView &bytes) {
  if (bytes.empty())
    return false;
  bool plausible = true;
  auto res = message_each(bytes, [&](int32_t field_number, const WireValue &) {
    if (field_number <= 0) {
      plausible = false;
      return false;
    }
    return true;
  });
  return res.is_ok() && plausible;
}

static void write_quoted(wire_print_ctx *ctx, const ByteView &bytes) {
  write_char(ctx, '"');
  for (size_t i = 0; i < bytes.len && !ctx->error; i++) {
    char ch = (char)bytes[i];
    switch (ch) {
    case '\n':
      write_str(ctx, "\\n");
      break;
    case '\r':
      write_str(ctx, "\\r");
      break;
    case '\t':
      write_str(ctx, "\\t");
      break;
    case '"':
      write_str(ctx, "\\\"");
      break;
    case '\\':
      write_str(ctx, "\\\\");
      break;
    default:
      write_char(ctx, ch);
      break;
    }
  }
  write_char(ctx, '"');
}

static void write_hex_bytes(wire_print_ctx *ctx, const ByteView &bytes) {
  write_fmt(ctx, "bytes[%zu]", bytes.len);
  size_t shown = bytes.len < ctx->options.max_bytes_shown ? bytes.len : ctx->options.max_bytes_shown;
  for (size_t i = 0; i < shown; i++) {
    write_fmt(ctx, " %02x", bytes[i]);
  }
  if (shown < bytes.len) {
    write_str(ctx, " ...");
  }
}

static void print_message(wire_print_ctx *ctx, const ByteView &message, int depth, IterateError *error_out);

static void print_length_delimited(wire_print_ctx *ctx, const ByteView &bytes, int depth) {
  if (is_printable(bytes)) {
    write_quoted(ctx, bytes);
  } else if (depth < ctx->options.max_depth && looks_like_message(bytes)) {
    write_str(ctx, "{\n");
    print_message(ctx, bytes, depth + 1, nullptr);
    write_indent(ctx, depth);
    write_char(ctx, '}');
  } else {
    write_hex_bytes(ctx, bytes);
  }
}

static void print_value(wire_print_ctx *ctx, const WireValue &value, int depth) {
  switch (value.wire_type) {
  case WIRE_VARINT:
    write_fmt(ctx, "%llu", (unsigned long long)value.as_uint64());
    break;
  case WIRE_FIXED32:
    write_fmt(ctx, "0x%08x (%g)", value.as_uint32(), (double)value.as_float());
    break;
  case WIRE_FIXED64:
    write_fmt(ctx, "0x%016llx (%g)", (unsigned long long)value.as_uint64(), value.as_double());
    break;
  case WIRE_LENGTH_DELIMITED:
    print_length_delimited(ctx, value.as_bytes(), depth);
    break;
  default:
    break;
  }
}

static void print_message(wire_print_ctx *ctx, const ByteView &message, int depth, IterateError *error_out) {
  auto res = message_each(message, [&](int32_t field_number, const WireValue &value) {
    write_indent(ctx, depth);
    write_fmt(ctx, "%d: ", (int)field_number);
    print_value(ctx, value, depth);
    write_char(ctx, '\n');
    return !ctx->error;
  });
  if (res.is_err() && error_out) {
    *error_out = res.error();
  }
}

WireDumpOptions wire_dump_defaults() {
  WireDumpOptions options;
  options.max_depth = PW_DUMP_MAX_DEPTH;
  options.max_bytes_shown = PW_DUMP_MAX_BYTES_SHOWN;
  return options;
}

static int run_print(wire_sink *sink, const void *data, size_t len, const WireDumpOptions &options,
                     IterateError *error_out) {
  wire_print_ctx ctx;
  ctx.sink = sink;
  ctx.options = options;
  ctx.error = 0;

  IterateError decode_error;
  decode_error.code = NONE;
  decode_error.phase = PHASE_TAG;
  decode_error.offset = 0;
  decode_error.field_number = 0;

  print_message(&ctx, byte_view(data, len), 0, &decode_error);
  if (error_out) {
    *error_out = decode_error;
  }

  if (decode_error.code != NONE) {
    dump_log.trace("stopped after %zu of %zu bytes", decode_error.offset, len);
    return 0;
  }
  return ctx.error ? 0 : 1;
}

int wire_print(const void *data, size_t len, wire_putchar_fn putchar_fn, const WireDumpOptions &options,
               IterateError *error_out) {
  if ((!data && len > 0) || !putchar_fn)
    return 0;

  wire_sink sink;
  sink.putchar_fn = putchar_fn;
  sink.buf = nullptr;
  sink.size = 0;
  sink.pos = 0;
  return run_print(&sink, data, len, options, error_out);
}

static void print_packed_element(wire_print_ctx *ctx, FieldType field_type, const WireValue &value) {
  switch (field_type) {
  case FIELD_INT32:
  case FIELD_ENUM:
  case FIELD_SFIXED32:
    write_fmt(ctx, "%d", (int)value.as_int32());
    break;
  case FIELD_INT64:
  case FIELD_SFIXED64:
    write_fmt(ctx, "%lld", (long long)value.as_int64());
    break;
  case FIELD_BOOL:
    write_str(ctx, value.as_bool() ? "true" : "false");
    break;
  case FIELD_FLOAT:
    write_fmt(ctx, "%g", (double)value.as_float());
    break;
  case FIELD_DOUBLE:
    write_fmt(ctx, "%g", value.as_double());
    break;
  case FIELD_STRING:
  case FIELD_BYTES:
  case FIELD_MESSAGE:
    if (is_printable(value.as_bytes())) {
      write_quoted(ctx, value.as_bytes());
    } else {
      write_hex_bytes(ctx, value.as_bytes());
    }
    break;
  // Unsigned and zigzag types print their raw bits
  default:
    write_fmt(ctx, "%llu", (unsigned long long)value.as_uint64());
    break;
  }
}

int wire_print_packed(const void *data, size_t len, FieldType field_type, wire_putchar_fn putchar_fn,
                      IterateError *error_out) {
  if ((!data && len > 0) || !putchar_fn)
    return 0;

  wire_sink sink;
  sink.putchar_fn = putchar_fn;
  sink.buf = nullptr;
  sink.size = 0;
  sink.pos = 0;

  wire_print_ctx ctx;
  ctx.sink = &sink;
  ctx.options = wire_dump_defaults();
  ctx.error = 0;

  bool first = true;
  write_char(&ctx, '[');
  auto res = packed_each(byte_view(data, len), field_type, [&](const WireValue &value) {
    if (!first) {
      write_str(&ctx, ", ");
    }
    first = false;
    print_packed_element(&ctx, field_type, value);
    return !ctx.error;
  });
  write_str(&ctx, "]\n");

  if (res.is_err()) {
    if (error_out) {
      *error_out = res.error();
    }
    return 0;
  }
  if (error_out) {
    error_out->code = NONE;
  }
  return ctx.error ? 0 : 1;
}

int wire_sprint(const void *data, size_t len, char *buf, size_t buf_size, const WireDumpOptions &options) {
  if ((!data && len > 0) || !buf || buf_size == 0)
    return -1;

  wire_sink sink;
  sink.putchar_fn = nullptr;
  sink.buf = buf;
  sink.size = buf_size;
  sink.pos = 0;

  int result = run_print(&sink, data, len, options, nullptr);
  buf[sink.pos] = '\0';

  return result ? (int)sink.pos : -1;
}
