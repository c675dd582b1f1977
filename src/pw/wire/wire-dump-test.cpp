#include <doctest/doctest.h>

#include "pw/common.h"
#include "pw/wire/wire-dump.hpp"

// Collects putchar output for wire_print tests
static char g_out[1024];
static size_t g_out_len;
static size_t g_out_limit;

static int capture_putchar(char ch) {
  if (g_out_len >= g_out_limit || g_out_len + 1 >= sizeof(g_out))
    return 0;
  g_out[g_out_len++] = ch;
  g_out[g_out_len] = '\0';
  return 1;
}

static void reset_capture(size_t limit = sizeof(g_out)) {
  g_out[0] = '\0';
  g_out_len = 0;
  g_out_limit = limit;
}

TEST_CASE("wire-dump - scalar and string fields") {
  const uint8_t buf[] = {0x08, 0x96, 0x01, 0x12, 0x02, 0x68, 0x69};
  char out[256];
  int n = wire_sprint(buf, sizeof(buf), out, sizeof(out), wire_dump_defaults());
  CHECK(n > 0);
  CHECK(strcmp(out, "1: 150\n2: \"hi\"\n") == 0);
}

TEST_CASE("wire-dump - fixed width fields") {
  const uint8_t buf[] = {
      0x0d, 0x00, 0x00, 0x80, 0x3f,                         // 1: fixed32 1.0f
      0x11, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x04, 0x40, // 2: fixed64 2.5
  };
  char out[256];
  int n = wire_sprint(buf, sizeof(buf), out, sizeof(out), wire_dump_defaults());
  CHECK(n > 0);
  CHECK(strcmp(out, "1: 0x3f800000 (1)\n2: 0x4004000000000000 (2.5)\n") == 0);
}

TEST_CASE("wire-dump - nested messages") {
  // 3: { 1: 5, 2: { 1: 1 } }
  const uint8_t buf[] = {0x1a, 0x06, 0x08, 0x05, 0x12, 0x02, 0x08, 0x01};
  char out[256];

  SUBCASE("rendered up to the depth limit") {
    int n = wire_sprint(buf, sizeof(buf), out, sizeof(out), wire_dump_defaults());
    CHECK(n > 0);
    CHECK(strcmp(out, "3: {\n"
                      "  1: 5\n"
                      "  2: {\n"
                      "    1: 1\n"
                      "  }\n"
                      "}\n") == 0);
  }

  SUBCASE("shown as bytes past the depth limit") {
    WireDumpOptions options = wire_dump_defaults();
    options.max_depth = 1;
    int n = wire_sprint(buf, sizeof(buf), out, sizeof(out), options);
    CHECK(n > 0);
    CHECK(strcmp(out, "3: {\n"
                      "  1: 5\n"
                      "  2: bytes[2] 08 01\n"
                      "}\n") == 0);
  }
}

TEST_CASE("wire-dump - binary payloads") {
  SUBCASE("non-message bytes print as hex") {
    const uint8_t buf[] = {0x0a, 0x03, 0x00, 0xff, 0x07};
    char out[256];
    wire_sprint(buf, sizeof(buf), out, sizeof(out), wire_dump_defaults());
    CHECK(strcmp(out, "1: bytes[3] 00 ff 07\n") == 0);
  }

  SUBCASE("long payloads are elided") {
    uint8_t buf[2 + 40];
    buf[0] = 0x0a;
    buf[1] = 40;
    memset(buf + 2, 0xff, 40);
    WireDumpOptions options = wire_dump_defaults();
    options.max_bytes_shown = 2;
    char out[256];
    wire_sprint(buf, sizeof(buf), out, sizeof(out), options);
    CHECK(strcmp(out, "1: bytes[40] ff ff ...\n") == 0);
  }

  SUBCASE("strings are escaped") {
    const uint8_t buf[] = {0x0a, 0x04, 'a', '"', '\n', 'b'};
    char out[256];
    wire_sprint(buf, sizeof(buf), out, sizeof(out), wire_dump_defaults());
    CHECK(strcmp(out, "1: \"a\\\"\\nb\"\n") == 0);
  }
}

TEST_CASE("wire-dump - decode errors") {
  // 1: 7, then a truncated length-delimited field
  const uint8_t buf[] = {0x08, 0x07, 0x12, 0x05, 0x01};

  SUBCASE("wire_print reports the error after printing earlier fields") {
    reset_capture();
    IterateError err;
    int ok = wire_print(buf, sizeof(buf), capture_putchar, wire_dump_defaults(), &err);
    CHECK(ok == 0);
    CHECK(strcmp(g_out, "1: 7\n") == 0);
    CHECK(err.code == WIRE__TRUNCATED);
    CHECK(err.phase == PHASE_VALUE);
    CHECK(err.field_number == 2);
  }

  SUBCASE("wire_sprint returns -1") {
    char out[256];
    CHECK(wire_sprint(buf, sizeof(buf), out, sizeof(out), wire_dump_defaults()) == -1);
    CHECK(strcmp(out, "1: 7\n") == 0);
  }
}

TEST_CASE("wire-dump - output limits") {
  const uint8_t buf[] = {0x08, 0x96, 0x01, 0x12, 0x02, 0x68, 0x69};

  SUBCASE("putchar abort") {
    reset_capture(3);
    IterateError err;
    int ok = wire_print(buf, sizeof(buf), capture_putchar, wire_dump_defaults(), &err);
    CHECK(ok == 0);
    CHECK(err.code == NONE);
    CHECK(g_out_len == 3);
  }

  SUBCASE("buffer too small") {
    char out[4];
    CHECK(wire_sprint(buf, sizeof(buf), out, sizeof(out), wire_dump_defaults()) == -1);
    CHECK(strlen(out) == 3);
  }

  SUBCASE("empty message") {
    char out[4];
    CHECK(wire_sprint(nullptr, 0, out, sizeof(out), wire_dump_defaults()) == 0);
    CHECK(out[0] == '\0');
  }
}

TEST_CASE("wire-dump - packed fields") {
  SUBCASE("int32 with a negative element") {
    const uint8_t buf[] = {0x96, 0x01, 0xfb, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01};
    reset_capture();
    IterateError err;
    CHECK(wire_print_packed(buf, sizeof(buf), FIELD_INT32, capture_putchar, &err) == 1);
    CHECK(strcmp(g_out, "[150, -5]\n") == 0);
  }

  SUBCASE("bool") {
    const uint8_t buf[] = {0x01, 0x00};
    reset_capture();
    CHECK(wire_print_packed(buf, sizeof(buf), FIELD_BOOL, capture_putchar, nullptr) == 1);
    CHECK(strcmp(g_out, "[true, false]\n") == 0);
  }

  SUBCASE("float") {
    const uint8_t buf[] = {0x00, 0x00, 0xc0, 0x3f};
    reset_capture();
    CHECK(wire_print_packed(buf, sizeof(buf), FIELD_FLOAT, capture_putchar, nullptr) == 1);
    CHECK(strcmp(g_out, "[1.5]\n") == 0);
  }

  SUBCASE("unknown field type") {
    const uint8_t buf[] = {0x01};
    reset_capture();
    IterateError err;
    CHECK(wire_print_packed(buf, sizeof(buf), (FieldType)10, capture_putchar, &err) == 0);
    CHECK(err.code == WIRE__UNKNOWN_FIELD_TYPE);
  }
}
