#include "error.h"

#include <charconv>

#include <cuproof/core/log.h>
#include <cuproof/core/macros.h>

typedef log_frame_t* log_frame_ptr_t;

static thread_local log_frame_ptr_t thread_local_storage_log_frame = nullptr;

static thread_local int thread_local_storage_log_disabled = 0;

namespace cuproof {

bool test_error_storing_mode = false;

out_log_str_f out_log_fun = nullptr;
std::string g_test_log_str = "";

#define LogItemError 6
static void out_error(const std::string& s) {
  if (out_log_fun) {
    out_log_fun(LogItemError, s.c_str());
    return;
  }
  std::cerr << s;
}

error_t error(error_t rv, const std::string& text) {
  if (thread_local_storage_log_disabled) return rv;

  if (test_error_storing_mode) g_test_log_str += "; " + text;

  log_string_buf_t ss;
  if (thread_local_storage_log_frame) thread_local_storage_log_frame->print_frames(ss);

  ss.put("Error ");
  ss.put_hex(rv);
  if (!text.empty()) {
    ss.put(": ");
    ss.put(text.c_str());
  }
  ss.end_line();
  out_error(ss.get());
  return rv;
}

error_t error(error_t rv) { return error(rv, ""); }

void assert_failed(const char* msg, const char* file, int line) {
  if (!thread_local_storage_log_disabled) {
    // strip everything before "src/" so the path is relative
    std::string relative_file(file);
    auto pos = relative_file.find("src/");
    if (pos != std::string::npos) relative_file.erase(0, pos);

    log_string_buf_t ss;
    ss << "[ASSERTION FAILED] " << msg << " (File: " << relative_file.c_str() << "#L" << line << ")";
    ss.end_line();
    out_error(ss.get());
  }
  throw assertion_failed_t(msg);
}

}  // namespace cuproof

void log_frame_t::print(log_string_buf_t& ss) const {
  ss.put(func_name);
  ss.put("(");
  for (int i = 0; i < params_count; i++) {
    if (i > 0) ss.put(", ");
    params[i].print(ss);
  }
  ss.put(")");
}

void log_frame_t::print_frames(log_string_buf_t& ss) const {
  std::vector<const log_frame_t*> frames;
  for (const log_frame_t* f = this; f; f = f->up) frames.push_back(f);

  for (int i = (int)frames.size() - 1; i >= 0; i--) {
    frames[i]->print(ss);
    ss.end_line();
  }
}

void log_frame_t::push() {
  up = thread_local_storage_log_frame;
  thread_local_storage_log_frame = this;
}

log_frame_t::~log_frame_t() { thread_local_storage_log_frame = up; }

dylog_disable_scope_t::dylog_disable_scope_t(bool enabled) {
  ref_counter = thread_local_storage_log_disabled;
  if (!enabled) thread_local_storage_log_disabled++;
}
dylog_disable_scope_t::~dylog_disable_scope_t() { thread_local_storage_log_disabled = ref_counter; }

void log_data_t::print(log_string_buf_t& ss) const {
  if (!name) return;
  ss.put(name);
  ss.put("=");

  switch (flags) {
    case log_int:
      if (data < 0) ss.put("-");
      ss.put(uint64_t(data < 0 ? -data : data));
      break;
    case log_string:
      ss.put(str->c_str());
      break;
  }
}

void log_string_buf_t::put(const_char_ptr ptr) {
  int len = (int)strlen(ptr);
  if (size + len > buf_size) len = buf_size - size;
  memmove(buffer + size - 1, ptr, len);
  size += len;
  buffer[size - 1] = 0;
}

void log_string_buf_t::put(int value) {
  char buf[32] = {0};
  std::to_chars(buf, buf + 31, value);
  put(buf);
}

void log_string_buf_t::put(uint64_t value) {
  char buf[32] = {0};
  std::to_chars(buf, buf + 31, value);
  put(buf);
}

void log_string_buf_t::put_hex(int value) {
  char buf[32] = {0};
  std::to_chars(buf, buf + 31, uint32_t(value), 16);
  put("0x");
  put(buf);
}
