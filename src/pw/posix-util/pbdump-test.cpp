#include <doctest/doctest.h>

#include "pw/posix-util/pbdump.hpp"
#include <stdio.h>
#include <string.h>
#include <unistd.h>

static char g_out[1024];
static size_t g_out_len;

static int capture_putchar(char ch) {
  if (g_out_len + 1 >= sizeof(g_out))
    return 0;
  g_out[g_out_len++] = ch;
  g_out[g_out_len] = '\0';
  return 1;
}

static void reset_capture() {
  g_out[0] = '\0';
  g_out_len = 0;
}

// Temporary input file, removed when it goes out of scope
struct Fixture {
  char path[64];

  Fixture(const uint8_t *data, size_t len) {
    strcpy(path, "/tmp/pbdump-test-XXXXXX");
    int fd = mkstemp(path);
    REQUIRE(fd >= 0);
    REQUIRE(write(fd, data, len) == (ssize_t)len);
    close(fd);
  }

  ~Fixture() { unlink(path); }
};

static int run(const char *a1 = nullptr, const char *a2 = nullptr, const char *a3 = nullptr,
               const char *a4 = nullptr) {
  const char *argv[5] = {"pbdump", a1, a2, a3, a4};
  int argc = 1;
  while (argc < 5 && argv[argc]) {
    argc++;
  }
  reset_capture();
  return pbdump_run(argc, argv, capture_putchar);
}

TEST_CASE("pbdump - dumps a message file") {
  const uint8_t data[] = {0x08, 0x96, 0x01};
  Fixture file(data, sizeof(data));
  CHECK(run(file.path) == PBDUMP_OK);
  CHECK(strcmp(g_out, "1: 150\n") == 0);
}

TEST_CASE("pbdump - packed int32") {
  const uint8_t data[] = {0x96, 0x01, 0xac, 0x9c, 0x01};
  Fixture file(data, sizeof(data));
  CHECK(run("-p", "int32", file.path) == PBDUMP_OK);
  CHECK(strcmp(g_out, "[150, 20000]\n") == 0);
}

TEST_CASE("pbdump - depth option") {
  // 1: { 1: 1 }
  const uint8_t data[] = {0x0a, 0x02, 0x08, 0x01};
  Fixture file(data, sizeof(data));

  CHECK(run("-d", "0", file.path) == PBDUMP_OK);
  CHECK(strcmp(g_out, "1: bytes[2] 08 01\n") == 0);

  CHECK(run("-d", "1024", file.path) == PBDUMP_OK);
  CHECK(strcmp(g_out, "1: {\n  1: 1\n}\n") == 0);
}

TEST_CASE("pbdump - several inputs get a header each") {
  const uint8_t first[] = {0x08, 0x01};
  const uint8_t second[] = {0x10, 0x02};
  Fixture a(first, sizeof(first));
  Fixture b(second, sizeof(second));

  CHECK(run(a.path, b.path) == PBDUMP_OK);
  char expected[256];
  snprintf(expected, sizeof(expected), "# %s\n1: 1\n# %s\n2: 2\n", a.path, b.path);
  CHECK(strcmp(g_out, expected) == 0);
}

TEST_CASE("pbdump - failures exit 1") {
  SUBCASE("truncated input") {
    const uint8_t data[] = {0x08, 0x96};
    Fixture file(data, sizeof(data));
    CHECK(run(file.path) == PBDUMP_FAILED);
  }

  SUBCASE("missing file") { CHECK(run("/nonexistent/pbdump-input.bin") == PBDUMP_FAILED); }

  SUBCASE("one bad input among good ones") {
    const uint8_t good[] = {0x08, 0x01};
    Fixture file(good, sizeof(good));
    CHECK(run(file.path, "/nonexistent/pbdump-input.bin") == PBDUMP_FAILED);
    CHECK(strstr(g_out, "1: 1\n") != nullptr);
  }
}

TEST_CASE("pbdump - usage errors exit 2") {
  CHECK(run("-d", "-1") == PBDUMP_USAGE);
  CHECK(run("-d", "abc") == PBDUMP_USAGE);
  CHECK(run("-d", "1025") == PBDUMP_USAGE);
  CHECK(run("-p", "group") == PBDUMP_USAGE);
  CHECK(run("-x") == PBDUMP_USAGE);
  CHECK(run("-d") == PBDUMP_USAGE);
  CHECK(g_out_len == 0);
}

TEST_CASE("pbdump - help exits 0") { CHECK(run("--help") == PBDUMP_OK); }
