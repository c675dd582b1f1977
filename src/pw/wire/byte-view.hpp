#ifndef PW_WIRE_BYTE_VIEW_HPP
#define PW_WIRE_BYTE_VIEW_HPP

#include "pw/common.h"

// Non-owning view of a byte range. Valid only while the underlying buffer is
// alive and unmodified.
struct ByteView {
  const uint8_t *ptr;
  size_t len;

  bool empty() const { return len == 0; }

  // Compare with null-terminated C string
  bool equals(const char *s) const {
    if (!s)
      return false;
    size_t s_len = strlen(s);
    if (len != s_len)
      return false;
    return len == 0 || memcmp(ptr, s, len) == 0;
  }

  bool equals(const ByteView &other) const {
    if (len != other.len)
      return false;
    return len == 0 || memcmp(ptr, other.ptr, len) == 0;
  }

  // Get byte at index (unchecked)
  uint8_t operator[](size_t index) const { return ptr[index]; }
};

inline ByteView byte_view(const void *data, size_t len) {
  ByteView v;
  v.ptr = (const uint8_t *)data;
  v.len = len;
  return v;
}

#endif // PW_WIRE_BYTE_VIEW_HPP
