#ifndef PW_WIRE_WIRE_CURSOR_HPP
#define PW_WIRE_WIRE_CURSOR_HPP

#include "pw/common.h"
#include "pw/wire/byte-view.hpp"
#include "pw/wire/wire-types.hpp"

// Zero-copy reader for protocol buffer wire data.
//
// A cursor borrows an immutable byte region and walks it front to back. Each
// decode either succeeds and advances the offset by exactly the bytes it
// consumed, or fails and leaves the offset somewhere inside the region; after
// a failure the cursor must not be decoded from again.
class WireCursor {
private:
  const uint8_t *buf_;
  size_t len_;
  size_t pos_;

public:
  WireCursor(const void *buffer, size_t size);
  explicit WireCursor(const ByteView &view);

  // ===== Primitives =====

  // Base-128 varint, least significant group first
  Result<uint64_t, ErrorCode> decode_varint();

  // Little-endian 4 bytes, zero-extended
  Result<uint64_t, ErrorCode> decode_fixed32();

  // Little-endian 8 bytes
  Result<uint64_t, ErrorCode> decode_fixed64();

  // Varint length followed by that many bytes, returned as a view into the
  // cursor's region (zero-copy)
  Result<ByteView, ErrorCode> decode_length_delimited();

  // Varint split into field number (high bits) and wire type (low 3 bits)
  Result<Tag, ErrorCode> decode_tag();

  // ===== State Query =====

  bool is_exhausted() const { return pos_ == len_; }
  size_t offset() const { return pos_; }
  size_t remaining() const { return len_ - pos_; }
  size_t size() const { return len_; }
};

#endif // PW_WIRE_WIRE_CURSOR_HPP
