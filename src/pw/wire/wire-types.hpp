#ifndef PW_WIRE_WIRE_TYPES_HPP
#define PW_WIRE_WIRE_TYPES_HPP

#include "pw/common.h"

// Physical encoding of a field, the low 3 bits of its tag
enum WireType : uint8_t {
  WIRE_VARINT = 0,
  WIRE_FIXED64 = 1,
  WIRE_LENGTH_DELIMITED = 2,
  WIRE_START_GROUP = 3,
  WIRE_END_GROUP = 4,
  WIRE_FIXED32 = 5,
};

// Schema-level field type. Values match FieldDescriptorProto.Type; 10 (group)
// is deliberately absent.
enum FieldType : int32_t {
  FIELD_DOUBLE = 1,
  FIELD_FLOAT = 2,
  FIELD_INT64 = 3,
  FIELD_UINT64 = 4,
  FIELD_INT32 = 5,
  FIELD_FIXED64 = 6,
  FIELD_FIXED32 = 7,
  FIELD_BOOL = 8,
  FIELD_STRING = 9,
  FIELD_MESSAGE = 11,
  FIELD_BYTES = 12,
  FIELD_UINT32 = 13,
  FIELD_ENUM = 14,
  FIELD_SFIXED32 = 15,
  FIELD_SFIXED64 = 16,
  FIELD_SINT32 = 17,
  FIELD_SINT64 = 18,
};

#define PW_FIELD_TYPE_COUNT 17

// Decoded tag prefix of a field
struct Tag {
  int32_t field_number;
  uint8_t wire_type;
};

// Wire type used by the elements of a packed field of the given type
Result<WireType, ErrorCode> packed_wire_type(FieldType type);

const char *wire_type_name(uint8_t wire_type);

// Lowercase schema name ("int32", "double", ...), or nullptr if unknown
const char *field_type_name(FieldType type);

// Inverse of field_type_name
Result<FieldType, ErrorCode> field_type_from_name(const char *name);

#endif // PW_WIRE_WIRE_TYPES_HPP
