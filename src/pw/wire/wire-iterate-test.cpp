#include <doctest/doctest.h>

#include "pw/common.h"
#include "pw/wire/wire-iterate.hpp"
#include <vector>

struct SeenField {
  int32_t field_number;
  WireValue value;
};

TEST_CASE("message-each - empty buffer") {
  WireCursor cursor(nullptr, 0);
  int calls = 0;
  auto res = message_each(cursor, [&](int32_t, const WireValue &) {
    calls++;
    return true;
  });
  CHECK(res.is_ok());
  CHECK(calls == 0);
}

TEST_CASE("message-each - varint and length-delimited fields") {
  const uint8_t buf[] = {0x08, 0x96, 0x01, 0x12, 0x02, 0x68, 0x69};
  WireCursor cursor(buf, sizeof(buf));

  std::vector<SeenField> seen;
  auto res = message_each(cursor, [&](int32_t field_number, const WireValue &value) {
    seen.push_back({field_number, value});
    return true;
  });

  REQUIRE(res.is_ok());
  REQUIRE(seen.size() == 2);

  CHECK(seen[0].field_number == 1);
  CHECK(seen[0].value.wire_type == WIRE_VARINT);
  CHECK(seen[0].value.number == 150);

  CHECK(seen[1].field_number == 2);
  CHECK(seen[1].value.wire_type == WIRE_LENGTH_DELIMITED);
  REQUIRE(seen[1].value.bytes.len == 2);
  CHECK(seen[1].value.bytes[0] == 0x68);
  CHECK(seen[1].value.bytes[1] == 0x69);
  CHECK(seen[1].value.bytes.ptr == buf + 5);

  CHECK(cursor.is_exhausted());
}

TEST_CASE("message-each - all scalar wire types") {
  const uint8_t buf[] = {
      0x0d, 0x01, 0x00, 0x00, 0x00,                         // 1: fixed32 1
      0x11, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // 2: fixed64 2
      0x18, 0x03,                                           // 3: varint 3
  };
  std::vector<SeenField> seen;
  auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t field_number, const WireValue &value) {
    seen.push_back({field_number, value});
    return true;
  });
  REQUIRE(res.is_ok());
  REQUIRE(seen.size() == 3);
  CHECK(seen[0].value.wire_type == WIRE_FIXED32);
  CHECK(seen[0].value.number == 1);
  CHECK(seen[1].value.wire_type == WIRE_FIXED64);
  CHECK(seen[1].value.number == 2);
  CHECK(seen[2].value.wire_type == WIRE_VARINT);
  CHECK(seen[2].value.number == 3);
}

TEST_CASE("message-each - early stop leaves the rest untouched") {
  // The second field is garbage; stopping on the first must not reach it
  const uint8_t buf[] = {0x08, 0x01, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff};
  WireCursor cursor(buf, sizeof(buf));

  int calls = 0;
  auto res = message_each(cursor, [&](int32_t field_number, const WireValue &value) {
    calls++;
    CHECK(field_number == 1);
    CHECK(value.number == 1);
    return false;
  });

  CHECK(res.is_ok());
  CHECK(calls == 1);
  CHECK(cursor.offset() == 2);
}

TEST_CASE("message-each - early stop on well formed input") {
  const uint8_t buf[] = {0x08, 0x01, 0x10, 0x02};
  WireCursor cursor(buf, sizeof(buf));
  int calls = 0;
  auto res = message_each(cursor, [&](int32_t, const WireValue &) {
    calls++;
    return false;
  });
  CHECK(res.is_ok());
  CHECK(calls == 1);
  CHECK_FALSE(cursor.is_exhausted());
}

TEST_CASE("message-each - malformed varint tag") {
  uint8_t buf[11];
  memset(buf, 0xff, sizeof(buf));
  WireCursor cursor(buf, sizeof(buf));

  int calls = 0;
  auto res = message_each(cursor, [&](int32_t, const WireValue &) {
    calls++;
    return true;
  });

  REQUIRE(res.is_err());
  CHECK(res.error().code == WIRE__MALFORMED_VARINT);
  CHECK(res.error().phase == PHASE_TAG);
  CHECK(res.error().offset == 0);
  CHECK(calls == 0);
}

TEST_CASE("message-each - malformed varint value") {
  const uint8_t buf[] = {0x08, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80};
  auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t, const WireValue &) { return true; });
  REQUIRE(res.is_err());
  CHECK(res.error().code == WIRE__MALFORMED_VARINT);
  CHECK(res.error().phase == PHASE_VALUE);
  CHECK(res.error().field_number == 1);
  CHECK(res.error().offset == 1);
}

TEST_CASE("message-each - truncated length-delimited field") {
  // field 1, length 10, only 3 bytes follow
  const uint8_t buf[] = {0x0a, 0x0a, 0x01, 0x02, 0x03};
  int calls = 0;
  auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t, const WireValue &) {
    calls++;
    return true;
  });
  REQUIRE(res.is_err());
  CHECK(res.error().code == WIRE__TRUNCATED);
  CHECK(res.error().phase == PHASE_VALUE);
  CHECK(calls == 0);
}

TEST_CASE("message-each - truncated fixed values") {
  SUBCASE("fixed32") {
    const uint8_t buf[] = {0x0d, 0x01, 0x02};
    auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t, const WireValue &) { return true; });
    REQUIRE(res.is_err());
    CHECK(res.error().code == WIRE__TRUNCATED);
  }

  SUBCASE("fixed64") {
    const uint8_t buf[] = {0x09, 0x01, 0x02, 0x03, 0x04};
    auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t, const WireValue &) { return true; });
    REQUIRE(res.is_err());
    CHECK(res.error().code == WIRE__TRUNCATED);
  }
}

TEST_CASE("message-each - group wire type is rejected after earlier fields") {
  // 1: varint 7, then tag for field 2 with wire type 3
  const uint8_t buf[] = {0x08, 0x07, 0x13, 0x00};
  std::vector<SeenField> seen;
  auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t field_number, const WireValue &value) {
    seen.push_back({field_number, value});
    return true;
  });

  REQUIRE(res.is_err());
  CHECK(res.error().code == WIRE__UNSUPPORTED_WIRE_TYPE);
  CHECK(res.error().phase == PHASE_VALUE);
  CHECK(res.error().field_number == 2);
  REQUIRE(seen.size() == 1);
  CHECK(seen[0].field_number == 1);
  CHECK(seen[0].value.number == 7);
}

TEST_CASE("message-each - end group and unknown wire types") {
  SUBCASE("end group") {
    const uint8_t buf[] = {0x0c};
    auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t, const WireValue &) { return true; });
    REQUIRE(res.is_err());
    CHECK(res.error().code == WIRE__UNSUPPORTED_WIRE_TYPE);
  }

  SUBCASE("wire type 6") {
    const uint8_t buf[] = {0x0e, 0x00};
    auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t, const WireValue &) { return true; });
    REQUIRE(res.is_err());
    CHECK(res.error().code == WIRE__UNKNOWN_WIRE_TYPE);
  }
}

TEST_CASE("message-each - caller descends into nested messages") {
  // 3: { 1: 5, 2: "x" }, 4: 9
  const uint8_t buf[] = {0x1a, 0x05, 0x08, 0x05, 0x12, 0x01, 0x78, 0x20, 0x09};

  ByteView nested = byte_view(nullptr, 0);
  uint64_t outer_four = 0;
  auto res = message_each(byte_view(buf, sizeof(buf)), [&](int32_t field_number, const WireValue &value) {
    if (field_number == 3)
      nested = value.bytes;
    if (field_number == 4)
      outer_four = value.number;
    return true;
  });
  REQUIRE(res.is_ok());
  CHECK(outer_four == 9);
  REQUIRE(nested.len == 5);

  uint64_t inner_one = 0;
  bool saw_x = false;
  auto inner = message_each(nested, [&](int32_t field_number, const WireValue &value) {
    if (field_number == 1)
      inner_one = value.number;
    if (field_number == 2)
      saw_x = value.bytes.equals("x");
    return true;
  });
  REQUIRE(inner.is_ok());
  CHECK(inner_one == 5);
  CHECK(saw_x);
}

TEST_CASE("packed-each - int32 elements") {
  const uint8_t buf[] = {0x96, 0x01, 0xac, 0x9c, 0x01};
  WireCursor cursor(buf, sizeof(buf));

  std::vector<uint64_t> values;
  auto res = packed_each(cursor, FIELD_INT32, [&](const WireValue &value) {
    CHECK(value.wire_type == WIRE_VARINT);
    values.push_back(value.number);
    return true;
  });

  REQUIRE(res.is_ok());
  REQUIRE(values.size() == 2);
  CHECK(values[0] == 150);
  CHECK(values[1] == 20000);
  CHECK(cursor.is_exhausted());
}

TEST_CASE("packed-each - fixed width elements") {
  SUBCASE("double") {
    const uint8_t buf[] = {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xf0, 0x3f,
                           0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x40};
    std::vector<double> values;
    auto res = packed_each(byte_view(buf, sizeof(buf)), FIELD_DOUBLE, [&](const WireValue &value) {
      values.push_back(value.as_double());
      return true;
    });
    REQUIRE(res.is_ok());
    REQUIRE(values.size() == 2);
    CHECK(values[0] == 1.0);
    CHECK(values[1] == 2.0);
  }

  SUBCASE("sfixed32 with trailing partial element") {
    const uint8_t buf[] = {0xff, 0xff, 0xff, 0xff, 0x01, 0x00};
    std::vector<int32_t> values;
    auto res = packed_each(byte_view(buf, sizeof(buf)), FIELD_SFIXED32, [&](const WireValue &value) {
      values.push_back(value.as_int32());
      return true;
    });
    REQUIRE(res.is_err());
    CHECK(res.error().code == WIRE__TRUNCATED);
    CHECK(res.error().phase == PHASE_VALUE);
    CHECK(res.error().offset == 4);
    REQUIRE(values.size() == 1);
    CHECK(values[0] == -1);
  }
}

TEST_CASE("packed-each - string elements are length-delimited") {
  const uint8_t buf[] = {0x01, 'a', 0x02, 'b', 'c'};
  std::vector<size_t> lengths;
  auto res = packed_each(byte_view(buf, sizeof(buf)), FIELD_STRING, [&](const WireValue &value) {
    CHECK(value.wire_type == WIRE_LENGTH_DELIMITED);
    lengths.push_back(value.bytes.len);
    return true;
  });
  REQUIRE(res.is_ok());
  REQUIRE(lengths.size() == 2);
  CHECK(lengths[0] == 1);
  CHECK(lengths[1] == 2);
}

TEST_CASE("packed-each - early stop") {
  const uint8_t buf[] = {0x01, 0x02, 0x03};
  WireCursor cursor(buf, sizeof(buf));
  int calls = 0;
  auto res = packed_each(cursor, FIELD_UINT32, [&](const WireValue &) {
    calls++;
    return calls < 2;
  });
  CHECK(res.is_ok());
  CHECK(calls == 2);
  CHECK(cursor.offset() == 2);
}

TEST_CASE("packed-each - unknown field type fails before reading") {
  const uint8_t buf[] = {0x01};
  WireCursor cursor(buf, sizeof(buf));
  int calls = 0;
  auto res = packed_each(cursor, (FieldType)10, [&](const WireValue &) {
    calls++;
    return true;
  });
  REQUIRE(res.is_err());
  CHECK(res.error().code == WIRE__UNKNOWN_FIELD_TYPE);
  CHECK(res.error().phase == PHASE_FIELD_TYPE);
  CHECK(calls == 0);
  CHECK(cursor.offset() == 0);
}

TEST_CASE("packed-each - empty payload") {
  int calls = 0;
  auto res = packed_each(byte_view(nullptr, 0), FIELD_INT64, [&](const WireValue &) {
    calls++;
    return true;
  });
  CHECK(res.is_ok());
  CHECK(calls == 0);
}

TEST_CASE("iterate-error - format") {
  char buf[128];

  SUBCASE("value phase names the field") {
    IterateError e;
    e.code = WIRE__TRUNCATED;
    e.phase = PHASE_VALUE;
    e.offset = 3;
    e.field_number = 2;
    iterate_error_format(e, buf, sizeof(buf));
    CHECK(strcmp(buf, "value decode failed at offset 3 (field 2): wire.truncated") == 0);
  }

  SUBCASE("tag phase") {
    IterateError e;
    e.code = WIRE__MALFORMED_VARINT;
    e.phase = PHASE_TAG;
    e.offset = 0;
    e.field_number = 0;
    iterate_error_format(e, buf, sizeof(buf));
    CHECK(strcmp(buf, "tag decode failed at offset 0: wire.malformed-varint") == 0);
  }
}
