#include <doctest/doctest.h>

#include "pw/common.h"
#include "pw/wire/wire-types.hpp"

TEST_CASE("wire-types - packed wire type table") {
  SUBCASE("varint types") {
    const FieldType types[] = {FIELD_INT32,  FIELD_INT64,  FIELD_UINT32, FIELD_UINT64,
                               FIELD_SINT32, FIELD_SINT64, FIELD_BOOL,   FIELD_ENUM};
    for (FieldType t : types) {
      CAPTURE(field_type_name(t));
      auto w = packed_wire_type(t);
      REQUIRE(w.is_ok());
      CHECK(*w == WIRE_VARINT);
    }
  }

  SUBCASE("fixed64 types") {
    const FieldType types[] = {FIELD_FIXED64, FIELD_SFIXED64, FIELD_DOUBLE};
    for (FieldType t : types) {
      auto w = packed_wire_type(t);
      REQUIRE(w.is_ok());
      CHECK(*w == WIRE_FIXED64);
    }
  }

  SUBCASE("fixed32 types") {
    const FieldType types[] = {FIELD_FIXED32, FIELD_SFIXED32, FIELD_FLOAT};
    for (FieldType t : types) {
      auto w = packed_wire_type(t);
      REQUIRE(w.is_ok());
      CHECK(*w == WIRE_FIXED32);
    }
  }

  SUBCASE("length-delimited types") {
    const FieldType types[] = {FIELD_STRING, FIELD_MESSAGE, FIELD_BYTES};
    for (FieldType t : types) {
      auto w = packed_wire_type(t);
      REQUIRE(w.is_ok());
      CHECK(*w == WIRE_LENGTH_DELIMITED);
    }
  }

  SUBCASE("group and out of range values are unknown") {
    const int32_t bad[] = {0, 10, 19, -1, 1000};
    for (int32_t raw : bad) {
      CAPTURE(raw);
      auto w = packed_wire_type((FieldType)raw);
      REQUIRE(w.is_err());
      CHECK(w.error() == WIRE__UNKNOWN_FIELD_TYPE);
    }
  }
}

TEST_CASE("wire-types - field type names") {
  CHECK(strcmp(field_type_name(FIELD_SFIXED64), "sfixed64") == 0);
  CHECK(field_type_name((FieldType)10) == nullptr);

  auto t = field_type_from_name("double");
  REQUIRE(t.is_ok());
  CHECK(*t == FIELD_DOUBLE);

  CHECK(field_type_from_name("group").is_err());
  CHECK(field_type_from_name("").is_err());
  CHECK(field_type_from_name(nullptr).is_err());

  // Every type round-trips through its name
  int count = 0;
  for (int32_t raw = 0; raw < 20; raw++) {
    const char *name = field_type_name((FieldType)raw);
    if (!name)
      continue;
    count++;
    auto back = field_type_from_name(name);
    REQUIRE(back.is_ok());
    CHECK(*back == (FieldType)raw);
  }
  CHECK(count == PW_FIELD_TYPE_COUNT);
}

TEST_CASE("wire-types - wire type names") {
  CHECK(strcmp(wire_type_name(WIRE_VARINT), "varint") == 0);
  CHECK(strcmp(wire_type_name(WIRE_LENGTH_DELIMITED), "length-delimited") == 0);
  CHECK(strcmp(wire_type_name(WIRE_START_GROUP), "start-group") == 0);
  CHECK(strcmp(wire_type_name(7), "unknown") == 0);
}
