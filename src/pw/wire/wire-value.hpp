#ifndef PW_WIRE_WIRE_VALUE_HPP
#define PW_WIRE_WIRE_VALUE_HPP

#include "pw/common.h"
#include "pw/wire/byte-view.hpp"
#include "pw/wire/wire-cursor.hpp"
#include "pw/wire/wire-types.hpp"

// One decoded field payload. For varint/fixed32/fixed64 `number` holds the raw
// bit pattern; for length-delimited `bytes` borrows from the decoded buffer.
// The other member is zero.
struct WireValue {
  WireType wire_type;
  uint64_t number;
  ByteView bytes;

  uint64_t as_uint64() const { return number; }
  int64_t as_int64() const { return (int64_t)number; }

  // 32-bit types are truncated from the 64-bit encoding, as negative int32
  // values are sign-extended to ten-byte varints on the wire
  uint32_t as_uint32() const { return (uint32_t)number; }
  int32_t as_int32() const { return (int32_t)(uint32_t)number; }

  bool as_bool() const { return number != 0; }

  float as_float() const {
    uint32_t bits = (uint32_t)number;
    float f;
    memcpy(&f, &bits, sizeof(f));
    return f;
  }

  double as_double() const {
    double d;
    memcpy(&d, &number, sizeof(d));
    return d;
  }

  const ByteView &as_bytes() const { return bytes; }
};

// Decode one value of the given wire type from the cursor
Result<WireValue, ErrorCode> decode_value(uint8_t wire_type, WireCursor &cursor);

#endif // PW_WIRE_WIRE_VALUE_HPP
