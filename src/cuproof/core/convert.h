#pragma once

#include <cuproof/core/buf.h>
#include <cuproof/core/error.h>

namespace cuproof {

// Two-pass binary codec. A write pass with a null pointer only computes the size. A read pass
// consumes a memory view and latches the first error.
class converter_t {
 public:
  explicit converter_t(bool write);
  explicit converter_t(byte_ptr out);
  explicit converter_t(mem_t src);

  bool is_calc_size() const { return !pointer; }
  bool is_write() const { return write; }
  bool is_error() const { return rv_error != SUCCESS; }
  void set_error();
  byte_ptr current() const { return pointer + offset; }
  bool at_least(int n) const { return n >= 0 && offset + n <= size; }
  void forward(int n) { offset += n; }
  int get_offset() const { return (int)offset; }

  void convert(bool& value);
  void convert(uint8_t& value);
  void convert(uint16_t& value);
  void convert(uint32_t& value);
  void convert(uint64_t& value);
  void convert(int32_t& value);

  template <typename FIRST, typename... LAST>
  void convert(FIRST& first, LAST&... last) {
    convert(first);
    if (!is_error()) convert(last...);
  }

  void convert_len(uint32_t& len);

  template <typename T>
  void convert(T& value) {
    value.convert(*this);
  }

  template <typename T>
  void convert(std::vector<T>& value) {
    if (!write) value.clear();

    uint32_t count = (uint32_t)value.size();
    convert_len(count);
    if (is_error()) return;

    // every element takes at least one byte, so a larger count cannot be valid
    if (!write && !at_least(int(count))) {
      set_error();
      return;
    }

    if (!write) value.resize(count);
    for (uint32_t i = 0; i < count && !is_error(); i++) convert(value[i]);
  }

  uint64_t convert_code_type(uint64_t code);

  error_t get_rv() const { return rv_error; }

 protected:
  error_t rv_error = SUCCESS;
  bool write;
  byte_ptr pointer;
  int64_t offset, size;
};

template <typename... ARGS>
buf_t ser(const ARGS&... args) {
  int n;
  {
    converter_t converter(true);
    converter.convert((ARGS&)args...);
    n = converter.get_offset();
  }

  buf_t out(n);

  {
    converter_t converter(out.data());
    converter.convert((ARGS&)args...);
  }

  return out;
}

// Fails with E_FORMAT on truncated input and on trailing bytes.
template <typename... ARGS>
error_t deser(mem_t bin, ARGS&... args) {
  converter_t converter(bin);
  converter.convert(args...);
  if (converter.is_error()) return converter.get_rv();
  if (converter.get_offset() != bin.size) return cuproof::error(E_FORMAT, "unexpected trailing bytes");
  return SUCCESS;
}

}  // namespace cuproof
