/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "AnalysisBackend.h"

namespace Json {
class Value;
} // namespace Json

/*
 * Owns the backend for one sub-image and serializes every query on it.
 *
 *   CREATED --open--> OPEN --analysis pass--> ANALYZED
 *      any state --channel failure--> FAILED
 *      any state --close()--> CLOSED
 *
 * The analysis pass runs once, before the first query. A session that failed
 * stays failed: all later queries throw BackendFailureException and the owner
 * is expected to drop it and create a new one. An undecodable response throws
 * MalformedResponseException for that query only.
 */
class AnalysisSession {
 public:
  enum class State {
    CREATED,
    OPEN,
    ANALYZED,
    FAILED,
    CLOSED,
  };

  /*
   * Throws UnsupportedInputKindException when `path` is not an input the
   * backend can open.
   */
  AnalysisSession(size_t subimage_index,
                  std::string path,
                  std::unique_ptr<AnalysisBackend> backend);
  ~AnalysisSession();

  AnalysisSession(const AnalysisSession&) = delete;
  AnalysisSession& operator=(const AnalysisSession&) = delete;

  size_t subimage_index() const { return m_subimage_index; }
  const std::string& path() const { return m_path; }
  const std::string& backend_name() const { return m_backend_name; }

  State state() const;

  // Opens the backend and runs the analysis pass unless already done.
  void ensure_analyzed();

  // Each of these returns a JSON array; an empty response is an empty array.
  Json::Value list_symbols();
  Json::Value list_classes();
  Json::Value list_strings();
  Json::Value xrefs_to(uint64_t address);
  Json::Value symbol_at(uint64_t address);
  // The instructions ("ops") of the function containing `address`.
  Json::Value disassemble_function(uint64_t address);

  void close();

 private:
  Json::Value query(const BackendQuery& query);
  Json::Value query_array(const BackendQuery& query);
  void ensure_analyzed_locked();
  [[noreturn]] void fail_locked(const std::exception& e);

  const size_t m_subimage_index;
  const std::string m_path;
  const std::string m_backend_name;
  std::unique_ptr<AnalysisBackend> m_backend;
  State m_state{State::CREATED};
  mutable std::mutex m_lock;
};

const char* show(AnalysisSession::State state);
