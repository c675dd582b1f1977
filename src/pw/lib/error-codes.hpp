#ifndef PW_LIB_ERROR_CODES_HPP
#define PW_LIB_ERROR_CODES_HPP

enum ErrorCode {
  NONE = 0,

  // Wire format errors
  /** Not enough bytes remain for the construct being decoded */
  WIRE__TRUNCATED = 1,
  /** Varint runs past 10 bytes or overflows 64 bits */
  WIRE__MALFORMED_VARINT = 2,
  /** Group start/end wire type encountered */
  WIRE__UNSUPPORTED_WIRE_TYPE = 3,
  /** Wire type outside the valid range */
  WIRE__UNKNOWN_WIRE_TYPE = 4,
  /** Field type passed to packed iteration is not a known field type */
  WIRE__UNKNOWN_FIELD_TYPE = 5,

  // Host I/O errors
  IO__OPEN_FAILED = 6,
  IO__READ_FAILED = 7,

  // Command line errors
  ARGS__INVALID_NUMBER = 8,
  ARGS__UNKNOWN_FIELD_TYPE = 9,
};

inline const char *error_code_to_string(ErrorCode code) {
  switch (code) {
  case NONE:
    return "none";
  case WIRE__TRUNCATED:
    return "wire.truncated";
  case WIRE__MALFORMED_VARINT:
    return "wire.malformed-varint";
  case WIRE__UNSUPPORTED_WIRE_TYPE:
    return "wire.unsupported-wire-type";
  case WIRE__UNKNOWN_WIRE_TYPE:
    return "wire.unknown-wire-type";
  case WIRE__UNKNOWN_FIELD_TYPE:
    return "wire.unknown-field-type";
  case IO__OPEN_FAILED:
    return "io.open-failed";
  case IO__READ_FAILED:
    return "io.read-failed";
  case ARGS__INVALID_NUMBER:
    return "args.invalid-number";
  case ARGS__UNKNOWN_FIELD_TYPE:
    return "args.unknown-field-type";
  default:
    return "unknown-error-code";
  }
}

#endif
