#include <doctest/doctest.h>

#include "pw/common.h"

TEST_CASE("parse_uint") {
  SUBCASE("valid numbers") {
    CHECK(parse_uint("0").value() == 0);
    CHECK(parse_uint("123").value() == 123);
    CHECK(parse_uint("18446744073709551615").value() == UINT64_MAX);
  }

  SUBCASE("rejected input") {
    const char *bad[] = {"", "-1", "+1", " 1", "1 ", "12a", "18446744073709551616", "99999999999999999999"};
    for (const char *s : bad) {
      CAPTURE(s);
      auto result = parse_uint(s);
      REQUIRE(result.is_err());
      CHECK(result.error() == ARGS__INVALID_NUMBER);
    }
    CHECK(parse_uint(nullptr).is_err());
  }
}

TEST_CASE("pwsnprintf") {
  char buf[16];
  CHECK(pwsnprintf(buf, sizeof(buf), "%d:%s", 7, "ok") == 4);
  CHECK(strcmp(buf, "7:ok") == 0);

  // Truncates but reports the full length
  CHECK(pwsnprintf(buf, 4, "%s", "abcdef") == 6);
  CHECK(strcmp(buf, "abc") == 0);
}

TEST_CASE("error_code_to_string") {
  CHECK(strcmp(error_code_to_string(NONE), "none") == 0);
  CHECK(strcmp(error_code_to_string(WIRE__UNKNOWN_FIELD_TYPE), "wire.unknown-field-type") == 0);
  CHECK(strcmp(error_code_to_string((ErrorCode)999), "unknown-error-code") == 0);
}
