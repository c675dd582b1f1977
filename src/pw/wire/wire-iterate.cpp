#include "pw/wire/wire-iterate.hpp"

const char *iterate_phase_name(IteratePhase phase) {
  switch (phase) {
  case PHASE_TAG:
    return "tag decode";
  case PHASE_VALUE:
    return "value decode";
  case PHASE_FIELD_TYPE:
    return "field type lookup";
  default:
    return "unknown phase";
  }
}

int iterate_error_format(const IterateError &error, char *buf, size_t size) {
  if (error.phase == PHASE_VALUE && error.field_number != 0) {
    return pwsnprintf(buf, size, "%s failed at offset %zu (field %d): %s", iterate_phase_name(error.phase), error.offset,
                      (int)error.field_number, error_code_to_string(error.code));
  }
  return pwsnprintf(buf, size, "%s failed at offset %zu: %s", iterate_phase_name(error.phase), error.offset,
                    error_code_to_string(error.code));
}
