/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

#include "AnalysisBackend.h"

struct RizinOptions {
  // Executable, looked up in PATH when not absolute.
  std::string path{"rizin"};
  // Passed before the input file, after "-q0".
  std::vector<std::string> args;
  std::string analysis_command{"aa"};
};

/*
 * Drives a rizin process over pipes, the way rzpipe's spawn mode does: rizin
 * runs with -q0, reads one command per line on stdin and terminates every
 * response with a NUL byte on stdout.
 *
 * A rizin that died mid-session shows up as BackendFailureException. Writes
 * block SIGPIPE in the calling thread only; no signal handler is installed.
 */
class RizinBackend final : public AnalysisBackend {
 public:
  explicit RizinBackend(RizinOptions options = RizinOptions())
      : m_options(std::move(options)) {}
  ~RizinBackend() override;

  RizinBackend(const RizinBackend&) = delete;
  RizinBackend& operator=(const RizinBackend&) = delete;

  std::string name() const override { return "rizin"; }

  bool can_open(InputKind kind) const override {
    return kind == InputKind::DEX;
  }

  void open(const std::string& path) override;

  std::string run(const BackendQuery& query) override;

  void close() override;

  // The rizin command for `query`, e.g. "axtj @ 0x1a2b".
  std::string render(const BackendQuery& query) const;

 private:
  std::string read_response();
  void write_command(const std::string& command);

  RizinOptions m_options;
  std::string m_path;
  pid_t m_child{-1};
  int m_to_child{-1};
  int m_from_child{-1};
};
