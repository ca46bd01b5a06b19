/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <gmock/gmock.h>
#include <json/value.h>
#include <memory>
#include <string>
#include <vector>

#include "AnalysisBackend.h"
#include "ReplayBackend.h"

class MockBackend : public AnalysisBackend {
 public:
  MOCK_METHOD(std::string, name, (), (const, override));
  MOCK_METHOD(bool, can_open, (InputKind kind), (const, override));
  MOCK_METHOD(void, open, (const std::string& path), (override));
  MOCK_METHOD(std::string, run, (const BackendQuery& query), (override));
  MOCK_METHOD(void, close, (), (override));

  /*
   * Unless told otherwise, accept DEX inputs and answer every query from
   * `transcript` the way ReplayBackend does.
   */
  void delegate_to(const Json::Value& transcript) {
    m_replay = std::make_unique<ReplayBackend>(transcript);
    m_replay->open("");
    ON_CALL(*this, name()).WillByDefault(testing::Return("mock"));
    ON_CALL(*this, can_open(testing::_))
        .WillByDefault([](InputKind kind) { return kind == InputKind::DEX; });
    ON_CALL(*this, run(testing::_))
        .WillByDefault([this](const BackendQuery& query) {
          return m_replay->run(query);
        });
  }

 private:
  std::unique_ptr<ReplayBackend> m_replay;
};

using NiceMockBackend = testing::NiceMock<MockBackend>;

// Matches a BackendQuery by its key, e.g. IsQuery("xrefs-to@0x9000").
MATCHER_P(IsQuery, key, "") { return arg.key() == key; }

// A factory handing out replay backends, transcript i for sub-image i.
inline BackendFactory replay_factory(std::vector<Json::Value> transcripts) {
  return [transcripts](size_t i) -> std::unique_ptr<AnalysisBackend> {
    return std::make_unique<ReplayBackend>(transcripts.at(i));
  };
}
