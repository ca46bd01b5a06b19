/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include "Macros.h"

#define TMS    \
  TM(APKINFO)  \
  TM(BACKEND)  \
  TM(CONFIG)   \
  TM(DEMANGLE) \
  TM(MTABLE)   \
  TM(SESSION)  \
  TM(SMALI)    \
  TM(TOOL)     \
  TM(WRAPPER)  \
  TM(XREF)     \
  /* End of list */

enum TraceModule : int {
#define TM(x) x,
  TMS
#undef TM
      N_TRACE_MODULES,
};

// Compiled in for release builds too; level 1 is for warnings.
bool traceEnabled(TraceModule module, int level);

void trace(TraceModule module, int level, const char* fmt, ...)
    ATTR_FORMAT(3, 4);

/*
 * TRACE(MODULE, level, fmt, ...) prints when the TRACE environment variable
 * enables `level` for MODULE, e.g. TRACE=XREF:3,DEMANGLE:1 or TRACE=2 for
 * every module.
 */
#define TRACE(module, level, fmt, ...)          \
  do {                                          \
    if (traceEnabled(module, level)) {          \
      trace(module, level, fmt, ##__VA_ARGS__); \
    }                                           \
  } while (0)

/*
 * Names the method currently being worked on. When TRACE_METHOD_FILTER is set,
 * only traces issued while the innermost context contains the filter text are
 * printed.
 */
class TraceContext {
 public:
  explicit TraceContext(const std::string& name)
      : m_name(name), m_enclosing(s_current) {
    s_current = this;
  }
  ~TraceContext() { s_current = m_enclosing; }

  TraceContext(const TraceContext&) = delete;
  TraceContext& operator=(const TraceContext&) = delete;

  const std::string& name() const { return m_name; }

  // The innermost context of the calling thread, if any.
  static const TraceContext* current() { return s_current; }

 private:
  static thread_local const TraceContext* s_current;
  const std::string& m_name;
  const TraceContext* m_enclosing;
};
