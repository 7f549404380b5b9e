#pragma once

#include <cuproof/core/macros.h>

class log_string_buf_t {
 public:
  log_string_buf_t() : size(1) { buffer[0] = 0; }
  const_char_ptr get() const { return buffer; }
  void put(const_char_ptr ptr);
  void put(int value);
  void put(uint64_t value);
  void put_hex(int value);
  void end_line() { put("\n"); }

  log_string_buf_t& operator<<(const_char_ptr ptr) {
    put(ptr);
    return *this;
  }
  log_string_buf_t& operator<<(int value) {
    put(value);
    return *this;
  }

 private:
  enum { buf_size = 2048 };
  int size;
  char buffer[buf_size];
};

// One named argument of a log frame. Holds a reference to the caller's value, so it must not
// outlive the frame.
class log_data_t {
 public:
  log_data_t(const char* _name, int param) : name(_name), flags(log_int), data(int64_t(param)) {}
  log_data_t(const char* _name, int64_t param) : name(_name), flags(log_int), data(param) {}
  log_data_t(const char* _name, const std::string& param) : name(_name), flags(log_string), str(&param) {}
  log_data_t() {}

  void print(log_string_buf_t& ss) const;

 private:
  enum {
    log_none = 0,
    log_int = 1,
    log_string = 2,
  };
  const char* name = nullptr;
  unsigned flags = log_none;
  int64_t data = 0;
  const std::string* str = nullptr;
};

// Marks a call frame. Errors raised while the frame is alive are prefixed with the chain of
// active frames and their arguments.
class log_frame_t {
 public:
  explicit log_frame_t(const char* _func_name) : func_name(_func_name) { push(); }

  template <typename... ARGS>
  explicit log_frame_t(const char* _func_name, const ARGS&... args) : func_name(_func_name) {
    push();
    init(args...);
  }

  ~log_frame_t();

  void print_frames(log_string_buf_t& ss) const;

 private:
  template <typename FIRST, typename... LAST>
  void init(const FIRST& first, const LAST&... last) {
    init(first);
    init(last...);
  }
  void init(const log_data_t& param) {
    if (params_count < max_param) params[params_count++] = param;
  }
  void init() {}
  void print(log_string_buf_t& ss) const;
  void push();

  enum { max_param = 8 };

  const char* func_name;
  log_frame_t* up = nullptr;
  int params_count = 0;
  log_data_t params[max_param];
};

#define LOG(x) log_data_t(#x, x)
#define LOG_FRAME(...) log_frame_t _log_frame_(__func__, ##__VA_ARGS__)

// Suppresses error logging on the current thread while in scope.
struct dylog_disable_scope_t {
  dylog_disable_scope_t(bool enabled = false);
  ~dylog_disable_scope_t();

 private:
  int ref_counter;
};
