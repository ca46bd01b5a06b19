/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "WrapperEvidence.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <json/value.h>

#include "AnalysisSession.h"
#include "ApkScopeTest.h"
#include "ReplayBackend.h"
#include "SampleApp.h"
#include "SmaliParser.h"

using ::testing::ElementsAre;

namespace {

const MethodSignature kSendMessage("Landroid/os/Handler;",
                                   "sendMessage",
                                   "(Landroid/os/Message;)Z",
                                   BackendHandle(0, 0x9000, true));
const MethodSignature kConcat("Ljava/lang/String;",
                              "concat",
                              "(Ljava/lang/String;)Ljava/lang/String;",
                              BackendHandle(0, 0x9010, true));
const MethodSignature kSend(sample_app::kSenderClass,
                            "send",
                            sample_app::kSendDescriptor,
                            BackendHandle(0, 0x100, false));

} // namespace

class WrapperEvidenceTest : public ApkScopeFileTest {
 protected:
  WrapperEvidenceExtractor make_extractor(const std::string& transcript) {
    auto session = std::make_shared<AnalysisSession>(
        0, make_dex(), std::make_unique<ReplayBackend>(parse(transcript)));
    return WrapperEvidenceExtractor(
        [session](size_t) { return session; });
  }
};

TEST_F(WrapperEvidenceTest, test_format_hex) {
  EXPECT_EQ("6e 20 12 00", wrapper_evidence::format_hex("6e201200"));
  EXPECT_EQ("0e 00", wrapper_evidence::format_hex("0e00"));
  // A dangling nibble is not a byte.
  EXPECT_EQ("0e", wrapper_evidence::format_hex("0e0"));
  EXPECT_EQ("", wrapper_evidence::format_hex(""));
}

TEST_F(WrapperEvidenceTest, test_invokes) {
  BytecodeInstruction arrow(
      "invoke-virtual", {"v2", "v2"},
      std::string("Ljava/lang/String;->concat(Ljava/lang/String;)"
                  "Ljava/lang/String;"));
  EXPECT_TRUE(wrapper_evidence::invokes(arrow, kConcat));
  EXPECT_FALSE(wrapper_evidence::invokes(arrow, kSendMessage));

  BytecodeInstruction dropped_semicolon(
      "invoke-virtual", {"v1", "v0"},
      std::string("Landroid/os/Handler->sendMessage(Landroid/os/Message;)Z"));
  EXPECT_TRUE(wrapper_evidence::invokes(dropped_semicolon, kSendMessage));

  // Spaces between arguments are not significant.
  BytecodeInstruction spaced(
      "invoke-virtual", {"v1", "v2", "v3"},
      std::string("Lcom/example/Sender;->send(Landroid/os/Handler; "
                  "Ljava/lang/String;)V"));
  EXPECT_TRUE(wrapper_evidence::invokes(spaced, kSend));

  BytecodeInstruction not_an_invoke(
      "const-string", {"v0"},
      std::string("Ljava/lang/String;->concat(Ljava/lang/String;)"
                  "Ljava/lang/String;"));
  EXPECT_FALSE(wrapper_evidence::invokes(not_an_invoke, kConcat));
  EXPECT_FALSE(wrapper_evidence::invokes(
      BytecodeInstruction("return-void", {}, boost::none), kConcat));
}

TEST_F(WrapperEvidenceTest, test_invokes_matches_within_operand) {
  // sym.imp.clone carries no class, so any receiver matches.
  MethodSignature clone("", "clone", "()Ljava/lang/Object;",
                        BackendHandle(0, 0x9020, true));
  auto array_clone = smali::parse(
      "invoke-virtual {v0}, [Ljava/lang/String;.clone()Ljava/lang/Object;");
  EXPECT_TRUE(wrapper_evidence::invokes(array_clone, clone));
  EXPECT_FALSE(wrapper_evidence::invokes(array_clone, kConcat));

  BytecodeInstruction annotated(
      "invoke-virtual", {"v1", "v0"},
      std::string("Landroid/os/Handler;->sendMessage(Landroid/os/Message;)Z"
                  "@0x9000"));
  EXPECT_TRUE(wrapper_evidence::invokes(annotated, kSendMessage));
}

TEST_F(WrapperEvidenceTest, test_extract_last_call_site_wins) {
  auto extractor = make_extractor(sample_app::kClassesDex);
  auto evidence = extractor.extract(kSend, kSendMessage, kConcat);

  ASSERT_TRUE(evidence.first);
  EXPECT_THAT(evidence.first->to_list(),
              ElementsAre("invoke-virtual", "v1", "v0",
                          "Landroid/os/Handler->sendMessage("
                          "Landroid/os/Message;)Z"));
  EXPECT_EQ("6e 20 12 00 03 00", *evidence.first_hex);

  ASSERT_TRUE(evidence.second);
  EXPECT_THAT(evidence.second->registers, ElementsAre("v2", "v2"));
  EXPECT_EQ("6e 20 34 00 22 00", *evidence.second_hex);
}

TEST_F(WrapperEvidenceTest, test_extract_missing_callee) {
  auto extractor = make_extractor(sample_app::kClassesDex);
  MethodSignature absent("Ljava/lang/String;", "length", "()I");
  auto evidence = extractor.extract(kSend, kSendMessage, absent);
  EXPECT_TRUE(evidence.first);
  EXPECT_FALSE(evidence.second);
  EXPECT_FALSE(evidence.second_hex);
  EXPECT_FALSE(evidence.empty());
}

TEST_F(WrapperEvidenceTest, test_imported_parent_has_no_evidence) {
  auto extractor = make_extractor(sample_app::kClassesDex);
  EXPECT_TRUE(extractor.extract(kSendMessage, kSend, kConcat).empty());
  MethodSignature no_handle(sample_app::kSenderClass, "send",
                            sample_app::kSendDescriptor);
  EXPECT_TRUE(extractor.extract(no_handle, kSendMessage, kConcat).empty());
}

TEST_F(WrapperEvidenceTest, test_unparsable_lines_are_skipped) {
  auto extractor = make_extractor(R"json({
    "disassemble-function@0x100": {
      "ops": [
        {"offset": 256, "bytes": "7100", "disasm": "invoke-static {v3 .. v1}, LFoo;->f()V"},
        {"offset": 260, "bytes": "6e2034002200",
         "disasm": "invoke-virtual {v2, v2}, Ljava/lang/String;->concat(Ljava/lang/String;)Ljava/lang/String;"}
      ]
    }
  })json");
  auto evidence = extractor.extract(kSend, kSendMessage, kConcat);
  EXPECT_FALSE(evidence.first);
  ASSERT_TRUE(evidence.second);
  EXPECT_EQ("6e 20 34 00 22 00", *evidence.second_hex);
}

TEST_F(WrapperEvidenceTest, test_to_json) {
  WrapperEvidence evidence;
  evidence.second = BytecodeInstruction("invoke-static", {"v0"},
                                        std::string("LFoo;->f(I)V"));
  evidence.second_hex = "71 10 00 00 00 00";
  auto json = evidence.to_json();
  EXPECT_TRUE(json["first"].isNull());
  EXPECT_TRUE(json["first_hex"].isNull());
  ASSERT_TRUE(json["second"].isArray());
  ASSERT_EQ(3u, json["second"].size());
  EXPECT_EQ("invoke-static", json["second"][0].asString());
  EXPECT_EQ("v0", json["second"][1].asString());
  EXPECT_EQ("LFoo;->f(I)V", json["second"][2].asString());
  EXPECT_EQ("71 10 00 00 00 00", json["second_hex"].asString());
}
