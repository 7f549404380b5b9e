#include <cuproof/core/strext.h>

std::string strext::to_lower(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return char(tolower(c)); });
  return result;
}

void strext::trim_left(std::string& str) {
  size_t n = 0;
  while (n < str.length() && isspace((unsigned char)str[n])) n++;
  str.erase(0, n);
}

void strext::trim_right(std::string& str) {
  size_t n = str.length();
  while (n > 0 && isspace((unsigned char)str[n - 1])) n--;
  str.erase(n);
}

bool strext::starts_with(const std::string& str, const std::string& start) {
  return str.length() >= start.length() && 0 == str.compare(0, start.length(), start);
}

static int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

int strext::scan_hex_byte(const_char_ptr str) {
  int hi = hex_digit(str[0]);
  if (hi < 0) return -1;
  int lo = hex_digit(str[1]);
  if (lo < 0) return -1;
  return (hi << 4) | lo;
}

void strext::print_hex_byte(char_ptr str, uint8_t value) {
  static const char digits[] = "0123456789abcdef";
  str[0] = digits[value >> 4];
  str[1] = digits[value & 0x0f];
}

std::string strext::to_hex(mem_t mem) {
  std::string out(mem.size * 2, '\0');
  for (int i = 0; i < mem.size; i++) print_hex_byte(&out[i * 2], mem[i]);
  return out;
}

bool strext::from_hex(buf_t& dst, const std::string& src) {
  int src_size = (int)src.length();
  if (src_size & 1) return false;

  int dst_size = src_size / 2;
  buf_t out(dst_size);
  for (int i = 0; i < dst_size; i++) {
    int x = scan_hex_byte(src.c_str() + i * 2);
    if (x < 0) return false;
    out[i] = byte_t(x);
  }
  dst = std::move(out);
  return true;
}
