/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cstdlib>
#include <gtest/gtest.h>

#include "AnalysisConfig.h"
#include "AnalysisSession.h"
#include "ApkInfo.h"
#include "ManifestReader.h"

/*
 * Runs against a real rizin on the DEX file named by the "dexfile" environment
 * variable; "rizin_path" overrides the executable.
 */
class RizinIntegrationTest : public testing::Test {
 protected:
  void SetUp() override {
    auto dexfile = std::getenv("dexfile");
    if (dexfile == nullptr) {
      GTEST_SKIP() << "Set dexfile to run against rizin";
    }
    m_dexfile = dexfile;
    if (auto rizin_path = std::getenv("rizin_path")) {
      m_config.rizin.path = rizin_path;
    }
    m_config.num_threads = 1;
  }

  std::string m_dexfile;
  AnalysisConfig m_config;
};

TEST_F(RizinIntegrationTest, test_methods_and_xrefs) {
  ApkInfo apk({m_dexfile}, std::make_shared<StaticManifestReader>(
                               std::set<std::string>{}),
              m_config);
  apk.prepare_all();
  ASSERT_TRUE(apk.failed_subimages().empty());
  EXPECT_EQ(AnalysisSession::State::ANALYZED, apk.session(0)->state());

  auto custom = apk.custom_methods();
  ASSERT_FALSE(custom.empty());
  EXPECT_FALSE(apk.android_apis().empty());

  // Every custom method with code can be disassembled, and every call site it
  // reports lies inside it.
  size_t with_code = 0;
  for (const auto& method : custom) {
    size_t count = 0;
    for (const auto& insn : apk.get_method_bytecode(method)) {
      EXPECT_FALSE(insn.mnemonic.empty());
      ++count;
    }
    if (count > 0) {
      ++with_code;
    }
    for (const auto& callee : apk.lowerfunc(method)) {
      EXPECT_GE(callee.second, 0);
    }
    if (with_code >= 20) {
      break;
    }
  }
  EXPECT_GT(with_code, 0u);
}

TEST_F(RizinIntegrationTest, test_callers_of_an_api) {
  ApkInfo apk({m_dexfile}, nullptr, m_config);
  bool found_caller = false;
  for (const auto& api : apk.android_apis()) {
    if (!apk.upperfunc(api).empty()) {
      found_caller = true;
      break;
    }
  }
  EXPECT_TRUE(found_caller);
}
