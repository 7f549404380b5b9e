#pragma once

#include <cuproof/core/buf.h>

struct strext {
  static mem_t mem(const std::string& s) { return mem_t((const_byte_ptr)s.c_str(), (int)s.length()); }

  static std::string to_lower(const std::string& str);

  static void trim_left(std::string& str);
  static void trim_right(std::string& str);
  static void trim(std::string& str) {
    trim_left(str);
    trim_right(str);
  }

  static bool starts_with(const std::string& str, const std::string& start);

  static std::string to_hex(mem_t hex);
  static bool from_hex(buf_t& dst, const std::string& src);

  static int scan_hex_byte(const_char_ptr str);
  static void print_hex_byte(char_ptr str, uint8_t value);
};
