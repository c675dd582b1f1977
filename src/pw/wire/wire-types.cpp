#include "pw/wire/wire-types.hpp"

Result<WireType, ErrorCode> packed_wire_type(FieldType type) {
  switch (type) {
  case FIELD_INT32:
  case FIELD_INT64:
  case FIELD_UINT32:
  case FIELD_UINT64:
  case FIELD_SINT32:
  case FIELD_SINT64:
  case FIELD_BOOL:
  case FIELD_ENUM:
    return Result<WireType, ErrorCode>::ok(WIRE_VARINT);
  case FIELD_FIXED64:
  case FIELD_SFIXED64:
  case FIELD_DOUBLE:
    return Result<WireType, ErrorCode>::ok(WIRE_FIXED64);
  case FIELD_FIXED32:
  case FIELD_SFIXED32:
  case FIELD_FLOAT:
    return Result<WireType, ErrorCode>::ok(WIRE_FIXED32);
  // Not validly packed, but accepted: each element is length-delimited
  case FIELD_STRING:
  case FIELD_MESSAGE:
  case FIELD_BYTES:
    return Result<WireType, ErrorCode>::ok(WIRE_LENGTH_DELIMITED);
  }
  return Result<WireType, ErrorCode>::err(WIRE__UNKNOWN_FIELD_TYPE);
}

const char *wire_type_name(uint8_t wire_type) {
  switch (wire_type) {
  case WIRE_VARINT:
    return "varint";
  case WIRE_FIXED64:
    return "fixed64";
  case WIRE_LENGTH_DELIMITED:
    return "length-delimited";
  case WIRE_START_GROUP:
    return "start-group";
  case WIRE_END_GROUP:
    return "end-group";
  case WIRE_FIXED32:
    return "fixed32";
  default:
    return "unknown";
  }
}

static const struct {
  FieldType type;
  const char *name;
} field_type_names[PW_FIELD_TYPE_COUNT] = {
    {FIELD_DOUBLE, "double"},   {FIELD_FLOAT, "float"},       {FIELD_INT64, "int64"},       {FIELD_UINT64, "uint64"},
    {FIELD_INT32, "int32"},     {FIELD_FIXED64, "fixed64"},   {FIELD_FIXED32, "fixed32"},   {FIELD_BOOL, "bool"},
    {FIELD_STRING, "string"},   {FIELD_MESSAGE, "message"},   {FIELD_BYTES, "bytes"},       {FIELD_UINT32, "uint32"},
    {FIELD_ENUM, "enum"},       {FIELD_SFIXED32, "sfixed32"}, {FIELD_SFIXED64, "sfixed64"}, {FIELD_SINT32, "sint32"},
    {FIELD_SINT64, "sint64"},
};

const char *field_type_name(FieldType type) {
  for (size_t i = 0; i < PW_FIELD_TYPE_COUNT; i++) {
    if (field_type_names[i].type == type) {
      return field_type_names[i].name;
    }
  }
  return nullptr;
}

Result<FieldType, ErrorCode> field_type_from_name(const char *name) {
  if (name) {
    for (size_t i = 0; i < PW_FIELD_TYPE_COUNT; i++) {
      if (strcmp(field_type_names[i].name, name) == 0) {
        return Result<FieldType, ErrorCode>::ok(field_type_names[i].type);
      }
    }
  }
  return Result<FieldType, ErrorCode>::err(ARGS__UNKNOWN_FIELD_TYPE);
}
