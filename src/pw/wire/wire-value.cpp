#include "pw/wire/wire-value.hpp"

static Result<WireValue, ErrorCode> number_value(WireType wire_type, const Result<uint64_t, ErrorCode> &decoded) {
  if (decoded.is_err()) {
    return decoded.forward_err<WireValue>();
  }
  WireValue value;
  value.wire_type = wire_type;
  value.number = *decoded;
  value.bytes = byte_view(nullptr, 0);
  return Result<WireValue, ErrorCode>::ok(value);
}

Result<WireValue, ErrorCode> decode_value(uint8_t wire_type, WireCursor &cursor) {
  switch (wire_type) {
  case WIRE_VARINT:
    return number_value(WIRE_VARINT, cursor.decode_varint());
  case WIRE_FIXED32:
    return number_value(WIRE_FIXED32, cursor.decode_fixed32());
  case WIRE_FIXED64:
    return number_value(WIRE_FIXED64, cursor.decode_fixed64());
  case WIRE_LENGTH_DELIMITED: {
    auto bytes = cursor.decode_length_delimited();
    if (bytes.is_err()) {
      return bytes.forward_err<WireValue>();
    }
    WireValue value;
    value.wire_type = WIRE_LENGTH_DELIMITED;
    value.number = 0;
    value.bytes = *bytes;
    return Result<WireValue, ErrorCode>::ok(value);
  }
  case WIRE_START_GROUP:
  case WIRE_END_GROUP:
    return Result<WireValue, ErrorCode>::err(WIRE__UNSUPPORTED_WIRE_TYPE);
  default:
    return Result<WireValue, ErrorCode>::err(WIRE__UNKNOWN_WIRE_TYPE);
  }
}
