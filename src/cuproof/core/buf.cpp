#include "buf.h"

#include <cuproof/core/convert.h>

namespace cuproof {

bool mem_t::operator==(const mem_t& b2) const {
  if (size != b2.size) return false;
  if (size == 0) return true;
  return 0 == memcmp(data, b2.data, size);
}

void buf_t::free() {
  if (!v.empty()) OPENSSL_cleanse(v.data(), v.size());
  v.clear();
}

byte_ptr buf_t::alloc(int new_size) {
  free();
  v.resize(new_size);
  return data();
}

buf_t& buf_t::operator=(const buf_t& src) {
  if (this != &src) {
    free();
    v = src.v;
  }
  return *this;
}

buf_t& buf_t::operator=(buf_t&& src) noexcept(true) {
  if (this != &src) {
    free();
    v = std::move(src.v);
  }
  return *this;
}

buf_t& buf_t::operator=(mem_t src) {
  std::vector<byte_t> copy(src.data, src.data + src.size);
  free();
  v = std::move(copy);
  return *this;
}

buf_t& buf_t::operator+=(mem_t src) {
  v.insert(v.end(), src.data, src.data + src.size);
  return *this;
}

buf_t operator+(mem_t src1, mem_t src2) {
  buf_t result(src1);
  result += src2;
  return result;
}

void buf_t::convert(converter_t& converter) {
  uint32_t value_size = size();
  converter.convert_len(value_size);

  if (converter.is_write()) {
    if (!converter.is_calc_size()) memmove(converter.current(), data(), value_size);
  } else {
    if (converter.is_error() || !converter.at_least(value_size)) {
      converter.set_error();
      return;
    }
    memmove(alloc(value_size), converter.current(), value_size);
  }
  converter.forward(value_size);
}

}  // namespace cuproof
