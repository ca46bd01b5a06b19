/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Trace.h"

#include <array>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/optional.hpp>

namespace {

const char* module_name(TraceModule module) {
  switch (module) {
#define TM(x) \
  case x:     \
    return #x;
    TMS
#undef TM
  case N_TRACE_MODULES:
    break;
  }
  return "?";
}

boost::optional<TraceModule> find_module(const std::string& name) {
  for (int m = 0; m < N_TRACE_MODULES; ++m) {
    auto module = static_cast<TraceModule>(m);
    if (name == module_name(module)) {
      return module;
    }
  }
  return boost::none;
}

struct TraceLevels {
  long global{0};
  std::array<long, N_TRACE_MODULES> per_module{};
};

// "XREF:3,DEMANGLE:1", "2", or both: "2 XREF:3".
TraceLevels parse_trace_levels(const std::string& text) {
  TraceLevels levels;
  std::vector<std::string> tokens;
  boost::split(tokens, text, boost::is_any_of(",: "),
               boost::token_compress_on);

  boost::optional<std::string> pending_module;
  for (const auto& token : tokens) {
    if (token.empty()) {
      continue;
    }
    long level;
    if (!boost::conversion::try_lexical_convert(token, level)) {
      pending_module = token;
      continue;
    }
    if (!pending_module) {
      levels.global = level;
      continue;
    }
    if (auto module = find_module(*pending_module)) {
      levels.per_module[*module] = level;
    } else {
      fprintf(stderr, "Unknown trace module %s, ignored\n",
              pending_module->c_str());
    }
    pending_module = boost::none;
  }
  return levels;
}

// TRACEFILE is either a path or the number of an open file descriptor.
FILE* open_trace_file(const char* tracefile) {
  if (tracefile == nullptr) {
    return stderr;
  }
  int fd;
  FILE* file = boost::conversion::try_lexical_convert(tracefile, fd)
                   ? fdopen(fd, "w")
                   : fopen(tracefile, "w");
  if (file == nullptr) {
    fprintf(stderr, "Cannot open TRACEFILE %s, tracing to stderr\n",
            tracefile);
    return stderr;
  }
  return file;
}

class Tracer {
 public:
  Tracer() {
    if (const char* levels = getenv("TRACE")) {
      m_levels = parse_trace_levels(levels);
    }
    m_file = open_trace_file(getenv("TRACEFILE"));
    m_show_timestamps = getenv("SHOW_TIMESTAMPS") != nullptr;
    m_show_module = getenv("SHOW_TRACEMODULE") != nullptr;
    if (const char* filter = getenv("TRACE_METHOD_FILTER")) {
      m_method_filter = std::string(filter);
    }
  }

  ~Tracer() {
    if (m_file != stderr) {
      fclose(m_file);
    }
  }

  bool enabled(TraceModule module, int level) const {
    if (level > m_levels.global && level > m_levels.per_module[module]) {
      return false;
    }
    if (!m_method_filter) {
      return true;
    }
    const auto* context = TraceContext::current();
    return context == nullptr ||
           context->name().find(*m_method_filter) != std::string::npos;
  }

  void print(TraceModule module, int level, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> lock(m_lock);
    if (m_show_timestamps) {
      std::array<char, 32> stamp;
      auto now = std::time(nullptr);
      struct tm local;
      localtime_r(&now, &local);
      std::strftime(stamp.data(), stamp.size(), "%F %T", &local);
      fprintf(m_file, "[%s] ", stamp.data());
    }
    if (m_show_module) {
      fprintf(m_file, "[%s:%d] ", module_name(module), level);
    }
    vfprintf(m_file, fmt, ap);
    fputc('\n', m_file);
    fflush(m_file);
  }

 private:
  TraceLevels m_levels;
  FILE* m_file{stderr};
  bool m_show_timestamps{false};
  bool m_show_module{false};
  boost::optional<std::string> m_method_filter;
  std::mutex m_lock;
};

Tracer& tracer() {
  static Tracer s_tracer;
  return s_tracer;
}

} // namespace

bool traceEnabled(TraceModule module, int level) {
  return tracer().enabled(module, level);
}

void trace(TraceModule module, int level, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  tracer().print(module, level, fmt, ap);
  va_end(ap);
}

thread_local const TraceContext* TraceContext::s_current = nullptr;
