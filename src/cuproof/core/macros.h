#pragma once

#include <cuproof/core/precompiled.h>

typedef uint8_t byte_t;
typedef byte_t* byte_ptr;
typedef const byte_t* const_byte_ptr;

typedef char* char_ptr;
typedef const char* const_char_ptr;
