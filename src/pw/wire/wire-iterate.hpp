#ifndef PW_WIRE_WIRE_ITERATE_HPP
#define PW_WIRE_WIRE_ITERATE_HPP

#include "pw/common.h"
#include "pw/wire/wire-cursor.hpp"
#include "pw/wire/wire-value.hpp"

// Step of a scan that produced an error
enum IteratePhase : uint8_t {
  PHASE_TAG = 0,
  PHASE_VALUE = 1,
  PHASE_FIELD_TYPE = 2,
};

struct IterateError {
  ErrorCode code;
  IteratePhase phase;
  // Cursor offset at which the failing step began
  size_t offset;
  // Field whose value failed to decode; 0 for tag and field type failures
  int32_t field_number;
};

typedef Result<Unit, IterateError> IterateResult;

inline IterateResult iterate_fail(ErrorCode code, IteratePhase phase, size_t offset, int32_t field_number) {
  IterateError e;
  e.code = code;
  e.phase = phase;
  e.offset = offset;
  e.field_number = field_number;
  return IterateResult::err(e);
}

const char *iterate_phase_name(IteratePhase phase);

// Render as "<phase> failed at offset N[ (field F)]: <error-code>"
// Returns the number of characters written, like snprintf
int iterate_error_format(const IterateError &error, char *buf, size_t size);

/**
 * Calls fn(int32_t field_number, const WireValue &value) for each top-level
 * field left in the cursor. fn returns false to stop the scan; nothing past
 * the current field is examined in that case.
 *
 * Succeeds when the cursor is exhausted at a field boundary or fn stops the
 * scan. Fails on the first tag or value that cannot be decoded; fields
 * already passed to fn stand. Nested messages are not descended into: call
 * message_each again on a length-delimited value's bytes.
 */
template <typename Fn> IterateResult message_each(WireCursor &cursor, Fn &&fn) {
  while (!cursor.is_exhausted()) {
    size_t tag_offset = cursor.offset();
    auto tag = cursor.decode_tag();
    if (tag.is_err()) {
      return iterate_fail(tag.error(), PHASE_TAG, tag_offset, 0);
    }

    size_t value_offset = cursor.offset();
    auto value = decode_value(tag->wire_type, cursor);
    if (value.is_err()) {
      return iterate_fail(value.error(), PHASE_VALUE, value_offset, tag->field_number);
    }

    if (!fn(tag->field_number, *value)) {
      break;
    }
  }
  return IterateResult::ok(Unit());
}

template <typename Fn> IterateResult message_each(const ByteView &message, Fn &&fn) {
  WireCursor cursor(message);
  return message_each(cursor, static_cast<Fn &&>(fn));
}

/**
 * Calls fn(const WireValue &value) for each element of a packed repeated
 * field. The cursor must cover exactly the field's payload, usually the bytes
 * of a length-delimited value returned by message_each.
 *
 * field_type selects the element encoding; an unknown type fails before any
 * byte is read. Termination and errors behave as in message_each.
 */
template <typename Fn> IterateResult packed_each(WireCursor &cursor, FieldType field_type, Fn &&fn) {
  auto wire_type = packed_wire_type(field_type);
  if (wire_type.is_err()) {
    return iterate_fail(wire_type.error(), PHASE_FIELD_TYPE, cursor.offset(), 0);
  }

  while (!cursor.is_exhausted()) {
    size_t value_offset = cursor.offset();
    auto value = decode_value(*wire_type, cursor);
    if (value.is_err()) {
      return iterate_fail(value.error(), PHASE_VALUE, value_offset, 0);
    }
    if (!fn(*value)) {
      break;
    }
  }
  return IterateResult::ok(Unit());
}

template <typename Fn> IterateResult packed_each(const ByteView &payload, FieldType field_type, Fn &&fn) {
  WireCursor cursor(payload);
  return packed_each(cursor, field_type, static_cast<Fn &&>(fn));
}

#endif // PW_WIRE_WIRE_ITERATE_HPP
