/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#include "Debug.h"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ostream>
#include <vector>

#if !IS_WINDOWS
#include <execinfo.h>
#endif

#include <boost/exception/all.hpp>

namespace {

// Return addresses, resolved to symbols only when printed.
struct StackTrace {
#if !IS_WINDOWS
  std::array<void*, 128> frames;
  int depth{0};

  StackTrace() { depth = backtrace(frames.data(), frames.size()); }

  void print(std::ostream& os) const {
    char** symbols = backtrace_symbols(frames.data(), depth);
    if (symbols == nullptr) {
      return;
    }
    for (int i = 0; i < depth; ++i) {
      os << "  #" << i << " " << symbols[i] << "\n";
    }
    free(symbols);
  }
#else
  void print(std::ostream&) const {}
#endif
};

using traced = boost::error_info<struct tag_stacktrace, StackTrace>;

} // namespace

std::string v_format2string(const char* fmt, va_list ap) {
  va_list measure;
  va_copy(measure, ap);
  int size = vsnprintf(nullptr, 0, fmt, measure);
  va_end(measure);
  if (size <= 0) {
    return std::string();
  }
  std::vector<char> buffer(size + 1);
  vsnprintf(buffer.data(), buffer.size(), fmt, ap);
  return std::string(buffer.data(), size);
}

std::string format2string(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  auto str = v_format2string(fmt, ap);
  va_end(ap);
  return str;
}

void assert_fail(const char* expr,
                 const char* file,
                 unsigned line,
                 const char* func,
                 const char* fmt,
                 ...) {
  auto msg = format2string("%s:%u: %s: assertion `%s' failed.", file, line,
                           func, expr);
  if (strcmp(fmt, " ") != 0) {
    va_list ap;
    va_start(ap, fmt);
    msg += "\n" + v_format2string(fmt, ap);
    va_end(ap);
  }
  throw boost::enable_error_info(
      ApkScopeException(ApkScopeError::GENERIC_ASSERTION_ERROR, msg))
      << traced(StackTrace());
}

void print_stack_trace(std::ostream& os, const std::exception& e) {
  if (const auto* trace = boost::get_error_info<traced>(e)) {
    trace->print(os);
  }
}
