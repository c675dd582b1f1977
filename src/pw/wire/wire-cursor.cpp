#include "pw/wire/wire-cursor.hpp"

WireCursor::WireCursor(const void *buffer, size_t size) : buf_((const uint8_t *)buffer), len_(size), pos_(0) {}

WireCursor::WireCursor(const ByteView &view) : buf_(view.ptr), len_(view.len), pos_(0) {}

Result<uint64_t, ErrorCode> WireCursor::decode_varint() {
  uint64_t value = 0;
  for (int i = 0; i < PW_VARINT_MAX_BYTES; i++) {
    if (pos_ >= len_) {
      return Result<uint64_t, ErrorCode>::err(WIRE__TRUNCATED);
    }
    uint8_t b = buf_[pos_++];

    // The tenth byte holds only bit 63; anything more overflows
    if (i == PW_VARINT_MAX_BYTES - 1 && b > 1) {
      return Result<uint64_t, ErrorCode>::err(WIRE__MALFORMED_VARINT);
    }

    value |= (uint64_t)(b & 0x7f) << (7 * i);
    if ((b & 0x80) == 0) {
      return Result<uint64_t, ErrorCode>::ok(value);
    }
  }
  return Result<uint64_t, ErrorCode>::err(WIRE__MALFORMED_VARINT);
}

Result<uint64_t, ErrorCode> WireCursor::decode_fixed32() {
  if (len_ - pos_ < 4) {
    return Result<uint64_t, ErrorCode>::err(WIRE__TRUNCATED);
  }
  const uint8_t *p = buf_ + pos_;
  uint64_t value = (uint64_t)p[0] | ((uint64_t)p[1] << 8) | ((uint64_t)p[2] << 16) | ((uint64_t)p[3] << 24);
  pos_ += 4;
  return Result<uint64_t, ErrorCode>::ok(value);
}

Result<uint64_t, ErrorCode> WireCursor::decode_fixed64() {
  if (len_ - pos_ < 8) {
    return Result<uint64_t, ErrorCode>::err(WIRE__TRUNCATED);
  }
  const uint8_t *p = buf_ + pos_;
  uint64_t value = 0;
  for (int i = 7; i >= 0; i--) {
    value = (value << 8) | p[i];
  }
  pos_ += 8;
  return Result<uint64_t, ErrorCode>::ok(value);
}

Result<ByteView, ErrorCode> WireCursor::decode_length_delimited() {
  auto length = decode_varint();
  if (length.is_err()) {
    return length.forward_err<ByteView>();
  }
  // Checked against the remainder so that pos_ + length cannot wrap
  if (*length > (uint64_t)(len_ - pos_)) {
    return Result<ByteView, ErrorCode>::err(WIRE__TRUNCATED);
  }
  ByteView view = byte_view(buf_ + pos_, (size_t)*length);
  pos_ += (size_t)*length;
  return Result<ByteView, ErrorCode>::ok(view);
}

Result<Tag, ErrorCode> WireCursor::decode_tag() {
  auto raw = decode_varint();
  if (raw.is_err()) {
    return raw.forward_err<Tag>();
  }
  Tag tag;
  tag.field_number = (int32_t)(*raw >> 3);
  tag.wire_type = (uint8_t)(*raw & 0x7);
  return Result<Tag, ErrorCode>::ok(tag);
}
