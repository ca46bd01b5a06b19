/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#pragma once

#include <cstdarg>
#include <iosfwd>
#include <string>

#include "ApkScopeException.h"
#include "Macros.h"

#ifdef _MSC_VER
#define UNREACHABLE() __assume(false)
#define PRETTY_FUNC() __func__
#else
#define UNREACHABLE() __builtin_unreachable()
#define PRETTY_FUNC() __PRETTY_FUNCTION__
#endif // _MSC_VER

/*
 * Throws ApkScopeException(GENERIC_ASSERTION_ERROR) naming the failed
 * expression and its location, with the current stack trace attached.
 */
[[noreturn]] void assert_fail(const char* expr,
                              const char* file,
                              unsigned line,
                              const char* func,
                              const char* fmt,
                              ...) ATTR_FORMAT(5, 6);

// An empty message is spelled " " to keep -Wformat-zero-length quiet.
#define always_assert(e)                                         \
  ((e) ? static_cast<void>(0)                                    \
       : assert_fail(#e, __FILE__, __LINE__, PRETTY_FUNC(), " "))

#define always_assert_log(e, msg, ...)                                    \
  ((e) ? static_cast<void>(0)                                             \
       : assert_fail(                                                     \
             #e, __FILE__, __LINE__, PRETTY_FUNC(), msg, ##__VA_ARGS__))

#define not_reached()     \
  do {                    \
    always_assert(false); \
    UNREACHABLE();        \
  } while (true)

std::string v_format2string(const char* fmt, va_list ap);
std::string format2string(const char* fmt, ...) ATTR_FORMAT(1, 2);

// Prints the stack trace captured when `e` was raised by a failed assertion,
// if there is one.
void print_stack_trace(std::ostream& os, const std::exception& e);
