#include "convert.h"

namespace cuproof {

converter_t::converter_t(bool _write) : write(_write), pointer(nullptr), offset(0), size(0) {}

converter_t::converter_t(byte_ptr out) : write(true), pointer(out), offset(0), size(0) {}

converter_t::converter_t(mem_t src) : write(false), pointer(src.data), offset(0), size(src.size) {}

void converter_t::set_error() {
  if (rv_error) return;
  rv_error = cuproof::error(E_FORMAT, "Converter error" + std::string(write ? "(write)" : "(read)"));
}

void converter_t::convert(bool& value) {
  uint8_t v = value ? 1 : 0;
  convert(v);
  if (is_error() || write) return;
  if (v > 1) {
    set_error();
    return;
  }
  value = v != 0;
}

// Fixed-width unsigned integer, most significant byte first.
template <typename T>
static void convert_be(converter_t& converter, T& value) {
  const int size = int(sizeof(T));
  if (converter.is_write()) {
    if (!converter.is_calc_size()) {
      byte_ptr out = converter.current();
      for (int i = 0; i < size; i++) out[i] = byte_t(uint64_t(value) >> (8 * (size - 1 - i)));
    }
  } else {
    if (converter.is_error() || !converter.at_least(size)) {
      converter.set_error();
      return;
    }
    const_byte_ptr in = converter.current();
    uint64_t v = 0;
    for (int i = 0; i < size; i++) v = (v << 8) | in[i];
    value = T(v);
  }
  converter.forward(size);
}

void converter_t::convert(uint8_t& value) { convert_be(*this, value); }
void converter_t::convert(uint16_t& value) { convert_be(*this, value); }
void converter_t::convert(uint32_t& value) { convert_be(*this, value); }
void converter_t::convert(uint64_t& value) { convert_be(*this, value); }

void converter_t::convert(int32_t& value) {
  uint32_t v = value;
  convert(v);
  if (!is_error() && !write) value = int32_t(v);
}

// Variable-length length prefix: 1 to 4 bytes, the top bits of the first byte select the size.
void converter_t::convert_len(uint32_t& len) {
  byte_t b = 0;
  if (write) {
    cp_assert(len <= 0x1fffffff);
    if (len <= 0x7f) {
      b = byte_t(len);
      convert(b);
      return;
    }
    if (len <= 0x3fff) {
      b = byte_t(len >> 8) | 0x80;
      convert(b);
      b = byte_t(len);
      convert(b);
      return;
    }
    if (len <= 0x1fffff) {
      b = byte_t(len >> 16) | 0xc0;
      convert(b);
      b = byte_t(len >> 8);
      convert(b);
      b = byte_t(len);
      convert(b);
      return;
    }
    b = byte_t(len >> 24) | 0xe0;
    convert(b);
    b = byte_t(len >> 16);
    convert(b);
    b = byte_t(len >> 8);
    convert(b);
    b = byte_t(len);
    convert(b);
    return;
  }

  convert(b);
  if (is_error()) {
    len = 0;
    return;
  }

  int extra;
  if ((b & 0x80) == 0) {
    len = b;
    return;
  } else if ((b & 0x40) == 0) {
    len = b & 0x3f;
    extra = 1;
  } else if ((b & 0x20) == 0) {
    len = b & 0x1f;
    extra = 2;
  } else {
    len = b & 0x1f;
    extra = 3;
  }

  for (int i = 0; i < extra; i++) {
    convert(b);
    len = (len << 8) | b;
  }
  if (is_error()) len = 0;
}

uint64_t converter_t::convert_code_type(uint64_t code) {
  uint64_t value = code;
  convert(value);
  if (is_error()) return 0;
  if (!write && value != code) {
    set_error();
    return 0;
  }
  return value;
}

}  // namespace cuproof
