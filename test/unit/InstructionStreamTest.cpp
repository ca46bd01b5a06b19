/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "InstructionStream.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iterator>

#include "AnalysisSession.h"
#include "ApkScopeException.h"
#include "ApkScopeTest.h"
#include "MockBackend.h"
#include "SampleApp.h"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::ElementsAre;

class InstructionStreamTest : public ApkScopeFileTest {
 protected:
  std::shared_ptr<AnalysisSession> make_session(const std::string& transcript) {
    return std::make_shared<AnalysisSession>(
        0, make_dex(), std::make_unique<ReplayBackend>(parse(transcript)));
  }

  MethodSignature on_create() {
    return MethodSignature("Lcom/example/MainActivity;", "onCreate",
                           "(Landroid/os/Bundle;)V",
                           BackendHandle(0, 0x200, false));
  }
};

TEST_F(InstructionStreamTest, test_iterates_instructions) {
  InstructionStream stream(make_session(sample_app::kClassesDex), on_create());
  std::vector<std::string> mnemonics;
  for (const auto& insn : stream) {
    mnemonics.push_back(insn.mnemonic);
  }
  EXPECT_THAT(mnemonics, ElementsAre("invoke-super", "invoke-virtual",
                                     "invoke-virtual", "return-void"));

  auto it = stream.begin();
  auto first = *it;
  EXPECT_THAT(first.registers, ElementsAre("v0", "v1"));
  EXPECT_EQ("Landroid/app/Activity->onCreate(Landroid/os/Bundle;)V",
            *first.parameter);
  ++it;
  ++it;
  ++it;
  EXPECT_FALSE((*it).parameter);
  EXPECT_EQ("return-void", it.disasm());
  ++it;
  EXPECT_TRUE(it == stream.end());
}

TEST_F(InstructionStreamTest, test_comments_are_stripped) {
  MethodSignature send(sample_app::kSenderClass, "send",
                       sample_app::kSendDescriptor,
                       BackendHandle(0, 0x100, false));
  InstructionStream stream(make_session(sample_app::kClassesDex), send);
  auto it = stream.begin();
  ++it;
  EXPECT_EQ("invoke-virtual {v1, v0}, "
            "Landroid/os/Handler.sendMessage(Landroid/os/Message;)Z ; 0x9000",
            it.disasm());
  EXPECT_EQ("Landroid/os/Handler->sendMessage(Landroid/os/Message;)Z",
            *(*it).parameter);
}

TEST_F(InstructionStreamTest, test_restartable) {
  auto backend = std::make_unique<NiceMockBackend>();
  backend->delegate_to(parse(sample_app::kClassesDex));
  EXPECT_CALL(*backend, run(_)).Times(AnyNumber());
  EXPECT_CALL(*backend, run(IsQuery("disassemble-function@0x200"))).Times(2);
  auto session =
      std::make_shared<AnalysisSession>(0, make_dex(), std::move(backend));

  InstructionStream stream(session, on_create());
  size_t first_pass = std::distance(stream.begin(), stream.end());
  size_t second_pass = std::distance(stream.begin(), stream.end());
  EXPECT_EQ(4u, first_pass);
  EXPECT_EQ(first_pass, second_pass);
}

TEST_F(InstructionStreamTest, test_empty_streams) {
  auto session = make_session(sample_app::kClassesDex);
  MethodSignature imported("Landroid/os/Handler;", "sendMessage",
                           "(Landroid/os/Message;)Z",
                           BackendHandle(0, 0x9000, true));
  EXPECT_TRUE(InstructionStream(session, imported).begin() ==
              InstructionStream(session, imported).end());
  MethodSignature no_handle("LFoo;", "f", "()V");
  EXPECT_TRUE(InstructionStream(session, no_handle).begin() ==
              InstructionStream(session, no_handle).end());
  InstructionStream none;
  EXPECT_TRUE(none.begin() == none.end());
  // No disassembly for this address.
  MethodSignature unknown("LFoo;", "f", "()V", BackendHandle(0, 0x4242, false));
  EXPECT_TRUE(InstructionStream(session, unknown).begin() ==
              InstructionStream(session, unknown).end());
}

TEST_F(InstructionStreamTest, test_bad_lines_throw_when_dereferenced) {
  auto session = make_session(R"json({
    "disassemble-function@0x200": {
      "ops": [
        {"offset": 512, "disasm": "invoke-static/range {v3 .. v1}, LFoo;->f()V"},
        {"offset": 518, "disasm": "return-void"}
      ]
    }
  })json");
  InstructionStream stream(session, on_create());
  auto it = stream.begin();
  EXPECT_THROW(*it, apkscope::InvalidSmaliException);
  ++it;
  EXPECT_EQ("return-void", (*it).mnemonic);
}
