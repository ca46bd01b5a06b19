/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ReplayBackend.h"

#include <fstream>
#include <sstream>

#include <json/json.h>

#include "ApkScopeException.h"
#include "JsonWrapper.h"
#include "Trace.h"

ReplayBackend::ReplayBackend(std::string transcript_path)
    : m_transcript_path(std::move(transcript_path)) {}

ReplayBackend::ReplayBackend(const Json::Value& transcript)
    : m_transcript(std::make_unique<Json::Value>(transcript)) {}

ReplayBackend::~ReplayBackend() {}

void ReplayBackend::open(const std::string& path) {
  if (!m_transcript) {
    std::ifstream in(*m_transcript_path);
    if (!in) {
      throw apkscope::BackendFailureException(
          "Cannot read replay transcript",
          {{"transcript", *m_transcript_path}, {"input", path}});
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto transcript = std::make_unique<Json::Value>();
    std::string error;
    if (!parse_json(buffer.str(), *transcript, error) ||
        !transcript->isObject()) {
      throw apkscope::BackendFailureException(
          "Replay transcript is not a JSON object",
          {{"transcript", *m_transcript_path}, {"error", error}});
    }
    m_transcript = std::move(transcript);
  }
  TRACE(BACKEND, 2, "Replaying %u recorded responses for %s",
        m_transcript->size(), path.c_str());
  m_open = true;
}

std::string ReplayBackend::run(const BackendQuery& query) {
  if (!m_open) {
    throw apkscope::BackendFailureException("replay backend is not open");
  }
  auto key = query.key();
  if (!m_transcript->isMember(key)) {
    TRACE(BACKEND, 3, "No recorded response for %s", key.c_str());
    return "";
  }
  const auto& response = (*m_transcript)[key];
  if (response.isString()) {
    return response.asString();
  }
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, response);
}
