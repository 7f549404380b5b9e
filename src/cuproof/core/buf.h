#pragma once
#include <cuproof/core/macros.h>

namespace cuproof {

class buf_t;
class converter_t;

// Non-owning view over a byte range.
struct mem_t {
  byte_ptr data;
  int size;
  mem_t() noexcept(true) : data(0), size(0) {}
  mem_t(const_byte_ptr the_data, int the_size) noexcept(true) : data(byte_ptr(the_data)), size(the_size) {}

  mem_t(const std::string& s) noexcept(true) : data(byte_ptr(s.data())), size(int(s.size())) {}
  template <size_t N>
  mem_t(const char (&s)[N]) : data(byte_ptr(s)), size(N) {
    if (N > 0 && s[N - 1] == '\0') size--;  // zero-terminated
  }

  bool operator==(const mem_t& b2) const;
  bool operator!=(const mem_t& b2) const { return !(*this == b2); }
  uint8_t operator[](int index) const { return data[index]; }
  uint8_t& operator[](int index) { return data[index]; }

  mem_t range(int offset, int size) const { return mem_t(data + offset, size); }
  mem_t take(int size) const { return range(0, size); }

  std::string to_string() const { return std::string((const char*)data, size); }
};

}  // namespace cuproof

using cuproof::mem_t;

namespace cuproof {

// Owning byte buffer. The contents are wiped on release.
class buf_t {
 public:
  buf_t() noexcept(true) {}
  explicit buf_t(int new_size) : v(new_size) {}
  buf_t(const_byte_ptr src, int src_size) : v(src, src + src_size) {}
  buf_t(mem_t mem) : v(mem.data, mem.data + mem.size) {}
  buf_t(const buf_t& src) : v(src.v) {}
  buf_t(buf_t&& src) noexcept(true) : v(std::move(src.v)) {}
  ~buf_t() { free(); }

  void free();

  byte_ptr data() const { return byte_ptr(v.data()); }
  int size() const { return int(v.size()); }
  bool empty() const { return v.empty(); }
  byte_ptr alloc(int new_size);

  buf_t& operator=(const buf_t& src);
  buf_t& operator=(buf_t&& src) noexcept(true);
  buf_t& operator=(mem_t src);
  buf_t& operator+=(mem_t src);

  bool operator==(const buf_t& src) const { return mem_t(*this) == mem_t(src); }
  bool operator!=(const buf_t& src) const { return !(*this == src); }

  uint8_t operator[](int index) const { return v[index]; }
  uint8_t& operator[](int index) { return v[index]; }

  operator mem_t() const { return mem_t(data(), size()); }

  mem_t range(int offset, int size) const { return mem_t(data() + offset, size); }
  mem_t take(int size) const { return range(0, size); }

  std::string to_string() const { return mem_t(*this).to_string(); }

  void convert(converter_t& converter);

 private:
  std::vector<byte_t> v;
};

buf_t operator+(mem_t src1, mem_t src2);

}  // namespace cuproof

using cuproof::buf_t;
