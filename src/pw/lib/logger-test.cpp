#include <doctest/doctest.h>

#include <string.h>

#include "pw/common.h"
#include "pw/lib/logger.hpp"

static char g_log[512];
static size_t g_log_len;

static int capture_sink(const char *str, int n) {
  for (int i = 0; i < n && g_log_len + 1 < sizeof(g_log); i++) {
    g_log[g_log_len++] = str[i];
  }
  g_log[g_log_len] = '\0';
  return 1;
}

static void reset_log() {
  g_log[0] = '\0';
  g_log_len = 0;
}

TEST_CASE("logger - silent level prints nothing") {
  reset_log();
  Logger logger("quiet", LSILENT, capture_sink);
  logger.log("dropped %d", 1);
  logger.trace("dropped %d", 2);
  CHECK(g_log_len == 0);
}

TEST_CASE("logger - soft level prints log but not trace") {
  reset_log();
  Logger logger("soft", LSOFT, capture_sink);
  logger.log("kept %d", 1);
  logger.trace("dropped %d", 2);
  CHECK(strcmp(g_log, "[soft] kept 1\n") == 0);
}

TEST_CASE("logger - loud level prints both") {
  reset_log();
  Logger logger("loud", LLOUD, capture_sink);
  logger.log("first");
  logger.trace("second %s", "line");
  CHECK(strcmp(g_log, "[loud] first\n[loud] second line\n") == 0);
}

TEST_CASE("logger - long messages are truncated, still one line") {
  reset_log();
  Logger logger("long", LSOFT, capture_sink);
  char big[400];
  memset(big, 'x', sizeof(big) - 1);
  big[sizeof(big) - 1] = '\0';
  logger.log("%s", big);
  CHECK(g_log_len > 0);
  CHECK(g_log_len < sizeof(big));
  CHECK(strncmp(g_log, "[long] xxx", 10) == 0);
  CHECK(g_log[g_log_len - 1] == '\n');
  CHECK(strchr(g_log, '\n') == g_log + g_log_len - 1);
}
