#include <doctest/doctest.h>

#include "pw/common.h"
#include "pw/wire/wire-value.hpp"

TEST_CASE("wire-value - dispatch by wire type") {
  SUBCASE("varint") {
    const uint8_t buf[] = {0x96, 0x01};
    WireCursor cursor(buf, sizeof(buf));
    auto v = decode_value(WIRE_VARINT, cursor);
    REQUIRE(v.is_ok());
    CHECK(v->wire_type == WIRE_VARINT);
    CHECK(v->as_uint64() == 150);
    CHECK(v->bytes.empty());
  }

  SUBCASE("fixed32") {
    const uint8_t buf[] = {0x00, 0x00, 0x80, 0x3f};
    WireCursor cursor(buf, sizeof(buf));
    auto v = decode_value(WIRE_FIXED32, cursor);
    REQUIRE(v.is_ok());
    CHECK(v->wire_type == WIRE_FIXED32);
    CHECK(v->as_uint64() == 0x3f800000u);
    CHECK(v->as_float() == 1.0f);
  }

  SUBCASE("fixed64") {
    const uint8_t buf[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xf0, 0xbf};
    WireCursor cursor(buf, sizeof(buf));
    auto v = decode_value(WIRE_FIXED64, cursor);
    REQUIRE(v.is_ok());
    CHECK(v->wire_type == WIRE_FIXED64);
    CHECK(v->as_double() == -1.0);
  }

  SUBCASE("length delimited borrows from the buffer") {
    const uint8_t buf[] = {0x02, 0x68, 0x69};
    WireCursor cursor(buf, sizeof(buf));
    auto v = decode_value(WIRE_LENGTH_DELIMITED, cursor);
    REQUIRE(v.is_ok());
    CHECK(v->wire_type == WIRE_LENGTH_DELIMITED);
    CHECK(v->as_bytes().equals("hi"));
    CHECK(v->as_bytes().ptr == buf + 1);
    CHECK(v->number == 0);
  }
}

TEST_CASE("wire-value - rejected wire types") {
  const uint8_t buf[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

  SUBCASE("groups are unsupported") {
    for (uint8_t w = WIRE_START_GROUP; w <= WIRE_END_GROUP; w++) {
      WireCursor cursor(buf, sizeof(buf));
      auto v = decode_value(w, cursor);
      REQUIRE(v.is_err());
      CHECK(v.error() == WIRE__UNSUPPORTED_WIRE_TYPE);
      CHECK(cursor.offset() == 0);
    }
  }

  SUBCASE("6 and 7 are unknown") {
    for (uint8_t w = 6; w <= 7; w++) {
      WireCursor cursor(buf, sizeof(buf));
      auto v = decode_value(w, cursor);
      REQUIRE(v.is_err());
      CHECK(v.error() == WIRE__UNKNOWN_WIRE_TYPE);
    }
  }
}

TEST_CASE("wire-value - errors propagate from the cursor") {
  const uint8_t buf[] = {0x0a, 0x01};
  WireCursor cursor(buf, sizeof(buf));
  auto v = decode_value(WIRE_LENGTH_DELIMITED, cursor);
  REQUIRE(v.is_err());
  CHECK(v.error() == WIRE__TRUNCATED);
}

TEST_CASE("wire-value - raw reinterpretation") {
  WireValue v;
  v.wire_type = WIRE_VARINT;
  v.bytes = byte_view(nullptr, 0);

  SUBCASE("negative int32 is a ten-byte varint truncated to 32 bits") {
    v.number = 0xfffffffffffffffbULL;
    CHECK(v.as_int32() == -5);
    CHECK(v.as_int64() == -5);
    CHECK(v.as_uint32() == 0xfffffffbu);
  }

  SUBCASE("bool is any non-zero value") {
    v.number = 0;
    CHECK_FALSE(v.as_bool());
    v.number = 2;
    CHECK(v.as_bool());
  }
}
