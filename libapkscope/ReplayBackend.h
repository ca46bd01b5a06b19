/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "AnalysisBackend.h"

namespace Json {
class Value;
} // namespace Json

/*
 * Answers queries from a recorded transcript instead of a live process. The
 * transcript is a JSON object keyed by BackendQuery::key():
 *
 *   {
 *     "list-symbols": [ ... ],
 *     "xrefs-to@0x28c44": [ {"from": 282476, "type": "CALL"} ],
 *     "disassemble-function@0x597e8": { "ops": [ ... ] }
 *   }
 *
 * A string value is returned verbatim, anything else is serialized. Queries
 * missing from the transcript answer with an empty response.
 */
class ReplayBackend final : public AnalysisBackend {
 public:
  // Loads the transcript from `transcript_path` when opened.
  explicit ReplayBackend(std::string transcript_path);
  // Uses an in-memory transcript.
  explicit ReplayBackend(const Json::Value& transcript);
  ~ReplayBackend() override;

  std::string name() const override { return "replay"; }

  bool can_open(InputKind kind) const override {
    return kind == InputKind::DEX || kind == InputKind::APK;
  }

  void open(const std::string& path) override;

  std::string run(const BackendQuery& query) override;

  void close() override { m_open = false; }

 private:
  boost::optional<std::string> m_transcript_path;
  std::unique_ptr<Json::Value> m_transcript;
  bool m_open{false};
};
