/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AnalysisSession.h"

#include <boost/algorithm/string/trim.hpp>
#include <json/value.h>

#include "ApkScopeException.h"
#include "Debug.h"
#include "InputKind.h"
#include "JsonWrapper.h"
#include "Macros.h"
#include "Trace.h"

const char* show(AnalysisSession::State state) {
  switch (state) {
  case AnalysisSession::State::CREATED:
    return "CREATED";
  case AnalysisSession::State::OPEN:
    return "OPEN";
  case AnalysisSession::State::ANALYZED:
    return "ANALYZED";
  case AnalysisSession::State::FAILED:
    return "FAILED";
  case AnalysisSession::State::CLOSED:
    return "CLOSED";
  }
  return "UNKNOWN";
}

AnalysisSession::AnalysisSession(size_t subimage_index,
                                 std::string path,
                                 std::unique_ptr<AnalysisBackend> backend)
    : m_subimage_index(subimage_index),
      m_path(std::move(path)),
      m_backend_name(backend ? backend->name() : std::string()),
      m_backend(std::move(backend)) {
  always_assert_log(m_backend != nullptr, "No backend for sub-image %zu",
                    m_subimage_index);
  auto kind = detect_input_kind(m_path);
  if (kind == InputKind::UNKNOWN || !m_backend->can_open(kind)) {
    throw apkscope::UnsupportedInputKindException(
        "Unsupported file type",
        {{"input", m_path},
         {"kind", show(kind)},
         {"backend", m_backend_name}});
  }
  TRACE(SESSION, 2, "Session %zu: %s input %s with %s", m_subimage_index,
        show(kind), m_path.c_str(), m_backend_name.c_str());
}

AnalysisSession::~AnalysisSession() { close(); }

AnalysisSession::State AnalysisSession::state() const {
  std::lock_guard<std::mutex> lock(m_lock);
  return m_state;
}

void AnalysisSession::close() {
  std::lock_guard<std::mutex> lock(m_lock);
  if (m_state == State::CLOSED) {
    return;
  }
  m_backend->close();
  m_state = State::CLOSED;
}

void AnalysisSession::fail_locked(const std::exception& e) {
  TRACE(SESSION, 1, "Session %zu on %s failed: %s", m_subimage_index,
        m_path.c_str(), e.what());
  m_state = State::FAILED;
  throw;
}

void AnalysisSession::ensure_analyzed() {
  std::lock_guard<std::mutex> lock(m_lock);
  ensure_analyzed_locked();
}

void AnalysisSession::ensure_analyzed_locked() {
  switch (m_state) {
  case State::ANALYZED:
    return;
  case State::FAILED:
    throw apkscope::BackendFailureException(
        "Session failed earlier and must be recreated",
        {{"input", m_path}, {"backend", m_backend_name}});
  case State::CLOSED:
    throw apkscope::BackendFailureException(
        "Session is closed", {{"input", m_path}, {"backend", m_backend_name}});
  case State::CREATED:
    try {
      m_backend->open(m_path);
    } catch (const apkscope::BackendFailureException& e) {
      fail_locked(e);
    }
    m_state = State::OPEN;
    FALLTHROUGH_INTENDED;
  case State::OPEN:
    TRACE(SESSION, 2, "Session %zu: running the analysis pass on %s",
          m_subimage_index, m_path.c_str());
    try {
      m_backend->run(BackendQuery::analyze_all());
    } catch (const apkscope::BackendFailureException& e) {
      fail_locked(e);
    }
    m_state = State::ANALYZED;
    return;
  }
}

Json::Value AnalysisSession::query(const BackendQuery& query) {
  std::string raw;
  {
    std::lock_guard<std::mutex> lock(m_lock);
    ensure_analyzed_locked();
    try {
      raw = m_backend->run(query);
    } catch (const apkscope::BackendFailureException& e) {
      fail_locked(e);
    }
  }

  boost::trim(raw);
  if (raw.empty()) {
    return Json::Value(Json::nullValue);
  }
  Json::Value root;
  std::string error;
  if (!parse_json(raw, root, error)) {
    throw apkscope::MalformedResponseException(
        "Backend response is not JSON",
        {{"query", query.key()}, {"input", m_path}, {"error", error}});
  }
  return root;
}

Json::Value AnalysisSession::query_array(const BackendQuery& q) {
  auto root = query(q);
  if (root.isNull()) {
    return Json::Value(Json::arrayValue);
  }
  if (!root.isArray()) {
    throw apkscope::MalformedResponseException(
        "Expected a JSON array", {{"query", q.key()}, {"input", m_path}});
  }
  return root;
}

Json::Value AnalysisSession::list_symbols() {
  return query_array(BackendQuery::list_symbols());
}

Json::Value AnalysisSession::list_classes() {
  return query_array(BackendQuery::list_classes());
}

Json::Value AnalysisSession::list_strings() {
  return query_array(BackendQuery::list_strings());
}

Json::Value AnalysisSession::xrefs_to(uint64_t address) {
  return query_array(BackendQuery::xrefs_to(address));
}

Json::Value AnalysisSession::symbol_at(uint64_t address) {
  return query_array(BackendQuery::symbol_at(address));
}

Json::Value AnalysisSession::disassemble_function(uint64_t address) {
  auto q = BackendQuery::disassemble_function(address);
  auto root = query(q);
  if (root.isNull()) {
    return Json::Value(Json::arrayValue);
  }
  if (!root.isObject()) {
    throw apkscope::MalformedResponseException(
        "Expected a JSON object", {{"query", q.key()}, {"input", m_path}});
  }
  const auto& ops = root["ops"];
  if (ops.isNull()) {
    return Json::Value(Json::arrayValue);
  }
  if (!ops.isArray()) {
    throw apkscope::MalformedResponseException(
        "Expected an instruction array",
        {{"query", q.key()}, {"input", m_path}});
  }
  return ops;
}
