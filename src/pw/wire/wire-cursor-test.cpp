#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "pw/common.h"
#include "pw/wire/wire-cursor.hpp"

// Base-128 encode value into out, returning the number of bytes written
static size_t encode_varint(uint64_t value, uint8_t *out) {
  size_t n = 0;
  while (value >= 0x80) {
    out[n++] = (uint8_t)(value | 0x80);
    value >>= 7;
  }
  out[n++] = (uint8_t)value;
  return n;
}

TEST_CASE("wire-cursor - empty buffer is exhausted") {
  WireCursor cursor(nullptr, 0);
  CHECK(cursor.is_exhausted());
  CHECK(cursor.offset() == 0);
  CHECK(cursor.remaining() == 0);
  CHECK(cursor.size() == 0);

  auto v = cursor.decode_varint();
  CHECK(v.is_err());
  CHECK(v.error() == WIRE__TRUNCATED);
}

TEST_CASE("wire-cursor - varint canonical encodings") {
  struct {
    uint64_t value;
    uint8_t bytes[10];
    size_t len;
  } cases[] = {
      {0, {0x00}, 1},
      {1, {0x01}, 1},
      {127, {0x7f}, 1},
      {128, {0x80, 0x01}, 2},
      {16384, {0x80, 0x80, 0x01}, 3},
      {0x7fffffffffffffffULL, {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f}, 9},
  };

  for (const auto &c : cases) {
    CAPTURE(c.value);

    uint8_t encoded[10];
    size_t n = encode_varint(c.value, encoded);
    REQUIRE(n == c.len);
    CHECK(memcmp(encoded, c.bytes, n) == 0);

    WireCursor cursor(c.bytes, c.len);
    auto v = cursor.decode_varint();
    REQUIRE(v.is_ok());
    CHECK(*v == c.value);
    CHECK(cursor.offset() == c.len);
    CHECK(cursor.is_exhausted());
  }
}

TEST_CASE("wire-cursor - varint maximum value") {
  const uint8_t buf[] = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01};
  WireCursor cursor(buf, sizeof(buf));
  auto v = cursor.decode_varint();
  REQUIRE(v.is_ok());
  CHECK(*v == UINT64_MAX);
  CHECK(cursor.is_exhausted());
}

TEST_CASE("wire-cursor - varint errors") {
  SUBCASE("eleven continuation bytes") {
    uint8_t buf[11];
    memset(buf, 0x80, sizeof(buf));
    WireCursor cursor(buf, sizeof(buf));
    auto v = cursor.decode_varint();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__MALFORMED_VARINT);
    CHECK(cursor.offset() <= sizeof(buf));
  }

  SUBCASE("tenth byte overflows 64 bits") {
    const uint8_t buf[] = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x02};
    WireCursor cursor(buf, sizeof(buf));
    auto v = cursor.decode_varint();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__MALFORMED_VARINT);
  }

  SUBCASE("region ends mid-varint") {
    const uint8_t buf[] = {0x96};
    WireCursor cursor(buf, sizeof(buf));
    auto v = cursor.decode_varint();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__TRUNCATED);
    CHECK(cursor.offset() == 1);
  }
}

TEST_CASE("wire-cursor - fixed width") {
  const uint8_t buf[] = {0x78, 0x56, 0x34, 0x12, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x88};

  SUBCASE("fixed32 is little-endian and zero-extended") {
    WireCursor cursor(buf, sizeof(buf));
    auto v = cursor.decode_fixed32();
    REQUIRE(v.is_ok());
    CHECK(*v == 0x12345678u);
    CHECK(cursor.offset() == 4);

    auto high = cursor.decode_fixed64();
    REQUIRE(high.is_ok());
    CHECK(*high == 0x8807060504030201ULL);
    CHECK(cursor.is_exhausted());
  }

  SUBCASE("fixed32 with high bit set does not sign-extend") {
    const uint8_t neg[] = {0xff, 0xff, 0xff, 0xff};
    WireCursor cursor(neg, sizeof(neg));
    auto v = cursor.decode_fixed32();
    REQUIRE(v.is_ok());
    CHECK(*v == 0xffffffffULL);
  }

  SUBCASE("truncated fixed32") {
    WireCursor cursor(buf, 3);
    auto v = cursor.decode_fixed32();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__TRUNCATED);
    CHECK(cursor.offset() == 0);
  }

  SUBCASE("truncated fixed64") {
    WireCursor cursor(buf, 7);
    auto v = cursor.decode_fixed64();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__TRUNCATED);
  }
}

TEST_CASE("wire-cursor - length delimited (zero-copy)") {
  const uint8_t buf[] = {0x03, 'a', 'b', 'c', 0x00};
  WireCursor cursor(buf, sizeof(buf));

  auto first = cursor.decode_length_delimited();
  REQUIRE(first.is_ok());
  CHECK(first->len == 3);
  CHECK(first->equals("abc"));
  CHECK(first->ptr == buf + 1);

  const uint8_t other[] = {'a', 'b', 'c'};
  CHECK(first->equals(byte_view(other, sizeof(other))));
  CHECK_FALSE(first->equals(byte_view(other, 2)));

  auto empty = cursor.decode_length_delimited();
  REQUIRE(empty.is_ok());
  CHECK(empty->empty());
  CHECK(cursor.is_exhausted());
}

TEST_CASE("wire-cursor - length delimited errors") {
  SUBCASE("declared length exceeds remaining bytes") {
    const uint8_t buf[] = {0x0a, 0x01, 0x02, 0x03};
    WireCursor cursor(buf, sizeof(buf));
    auto v = cursor.decode_length_delimited();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__TRUNCATED);
    CHECK(cursor.offset() <= sizeof(buf));
  }

  SUBCASE("huge length does not wrap") {
    const uint8_t buf[] = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x01, 0x00};
    WireCursor cursor(buf, sizeof(buf));
    auto v = cursor.decode_length_delimited();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__TRUNCATED);
  }

  SUBCASE("missing length") {
    WireCursor cursor(nullptr, 0);
    auto v = cursor.decode_length_delimited();
    REQUIRE(v.is_err());
    CHECK(v.error() == WIRE__TRUNCATED);
  }
}

TEST_CASE("wire-cursor - tag round trip") {
  const uint8_t wire_types[] = {WIRE_VARINT, WIRE_FIXED64, WIRE_LENGTH_DELIMITED, WIRE_FIXED32};
  const uint32_t max_field = 1u << 29;

  auto check_field = [&](uint32_t field) {
    for (uint8_t w : wire_types) {
      uint8_t buf[10];
      size_t n = encode_varint(((uint64_t)field << 3) | w, buf);
      WireCursor cursor(buf, n);
      auto tag = cursor.decode_tag();
      REQUIRE(tag.is_ok());
      CHECK(tag->field_number == (int32_t)field);
      CHECK(tag->wire_type == w);
      CHECK(cursor.is_exhausted());
    }
  };

  const uint32_t edges[] = {0, 1, 15, 16, 2047, 2048, 262143, 262144, 33554431, 33554432, max_field - 1};
  for (uint32_t f : edges) {
    check_field(f);
  }
  for (uint32_t f = 3; f < max_field; f += 104729) {
    check_field(f);
  }
}

TEST_CASE("wire-cursor - tag needs at least one byte") {
  const uint8_t buf[] = {0x08};
  WireCursor cursor(buf, 0);
  auto tag = cursor.decode_tag();
  REQUIRE(tag.is_err());
  CHECK(tag.error() == WIRE__TRUNCATED);
}
