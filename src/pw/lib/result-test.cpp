// result-test.cpp - Unit tests for Result<T,E> type

#include <doctest/doctest.h>

#include "pw/common.h"
#include "pw/wire/byte-view.hpp"

TEST_CASE("Result basic operations") {
  SUBCASE("ok() creates success result") {
    auto result = Result<uint64_t, ErrorCode>::ok(42);
    CHECK(result.is_ok());
    CHECK(!result.is_err());
    CHECK(result);
    CHECK(result.value() == 42);
    CHECK(*result == 42);
  }

  SUBCASE("err() creates error result") {
    auto result = Result<uint64_t, ErrorCode>::err(WIRE__TRUNCATED);
    CHECK(!result.is_ok());
    CHECK(result.is_err());
    CHECK(!result);
    CHECK(result.error() == WIRE__TRUNCATED);
  }

  SUBCASE("value_or()") {
    CHECK(Result<uint64_t, ErrorCode>::ok(42).value_or(100) == 42);
    CHECK(Result<uint64_t, ErrorCode>::err(WIRE__TRUNCATED).value_or(100) == 100);
  }
}

TEST_CASE("Result error forwarding") {
  auto inner = Result<uint64_t, ErrorCode>::err(WIRE__MALFORMED_VARINT);
  Result<ByteView, ErrorCode> outer = inner.forward_err<ByteView>();
  CHECK(outer.is_err());
  CHECK(outer.error() == WIRE__MALFORMED_VARINT);
}

TEST_CASE("Result copy and move operations") {
  SUBCASE("copy constructor") {
    auto result1 = Result<uint64_t, ErrorCode>::ok(42);
    auto result2 = result1;
    CHECK(result2.is_ok());
    CHECK(result2.value() == 42);
  }

  SUBCASE("copy assignment replaces state") {
    auto result1 = Result<uint64_t, ErrorCode>::err(WIRE__TRUNCATED);
    auto result2 = Result<uint64_t, ErrorCode>::ok(100);
    result2 = result1;
    CHECK(result2.is_err());
    CHECK(result2.error() == WIRE__TRUNCATED);
  }

  SUBCASE("move assignment") {
    auto result1 = Result<uint64_t, ErrorCode>::ok(42);
    auto result2 = Result<uint64_t, ErrorCode>::err(WIRE__TRUNCATED);
    result2 = static_cast<Result<uint64_t, ErrorCode> &&>(result1);
    CHECK(result2.is_ok());
    CHECK(result2.value() == 42);
  }
}

TEST_CASE("Result with Unit success") {
  auto result = Result<Unit, ErrorCode>::ok(Unit());
  CHECK(result.is_ok());
}

TEST_CASE("Result pointer operator") {
  const uint8_t data[] = {'o', 'k'};
  auto result = Result<ByteView, ErrorCode>::ok(byte_view(data, sizeof(data)));
  CHECK(result->len == 2);
  CHECK(result->equals("ok"));
}
