#pragma once
#include <cuproof/core/precompiled.h>

typedef int error_t;

#define ERRCODE(category, code) (0xff000000 | (uint32_t(category) << 16) | uint32_t(code))
#define ECATEGORY(code) (((code) >> 16) & 0x00ff)

// clang-format off
enum {
  ECATEGORY_GENERIC      = 0x01,
  ECATEGORY_FILE         = 0x02,
  ECATEGORY_CRYPTO       = 0x04,
};

enum {
  SUCCESS = 0,
  UNINITIALIZED_ERROR = ERRCODE(ECATEGORY_GENERIC, 0x0000), // our function should never return this error
  E_GENERAL           = ERRCODE(ECATEGORY_GENERIC, 0x0001),
  E_BADARG            = ERRCODE(ECATEGORY_GENERIC, 0x0002),
  E_FORMAT            = ERRCODE(ECATEGORY_GENERIC, 0x0003),
  E_NOT_FOUND         = ERRCODE(ECATEGORY_GENERIC, 0x0006),
  E_RANGE             = ERRCODE(ECATEGORY_GENERIC, 0x0012),

  E_FILE              = ERRCODE(ECATEGORY_FILE, 0x0001),
};
// clang-format on

namespace cuproof {

error_t error(error_t rv, const std::string& text);
error_t error(error_t rv);

// Log sink. When unset, messages go to stderr.
typedef void (*out_log_str_f)(int mode, const char* str);
extern out_log_str_f out_log_fun;

extern bool test_error_storing_mode;
extern std::string g_test_log_str;

void assert_failed(const char* msg, const char* file, int line);

class assertion_failed_t : public std::logic_error {
 public:
  assertion_failed_t(const std::string& msg) : std::logic_error(msg) {}
};

inline void set_test_error_storing_mode(bool enabled) {
  test_error_storing_mode = enabled;
  g_test_log_str = "test error log";
}

}  // namespace cuproof

#define cp_assert(expr)                                                                  \
  do {                                                                                   \
    if (__builtin_expect(!(expr), 0)) cuproof::assert_failed(#expr, __FILE__, __LINE__); \
  } while (0)
