/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <csignal>
#include <gtest/gtest.h>
#include <json/value.h>

#include "AnalysisBackend.h"
#include "ApkScopeException.h"
#include "ApkScopeTest.h"
#include "ReplayBackend.h"
#include "RizinBackend.h"

class BackendTest : public ApkScopeFileTest {};

TEST_F(BackendTest, test_query_keys) {
  EXPECT_EQ("analyze-all", BackendQuery::analyze_all().key());
  EXPECT_EQ("list-symbols", BackendQuery::list_symbols().key());
  EXPECT_EQ("list-classes", BackendQuery::list_classes().key());
  EXPECT_EQ("list-strings", BackendQuery::list_strings().key());
  EXPECT_EQ("xrefs-to@0x44f6c", BackendQuery::xrefs_to(282476).key());
  EXPECT_EQ("disassemble-function@0x1a2b",
            BackendQuery::disassemble_function(0x1a2b).key());
  EXPECT_EQ("symbol-at@0x0", BackendQuery::symbol_at(0).key());
}

TEST_F(BackendTest, test_rizin_commands) {
  RizinBackend rizin;
  EXPECT_EQ("aa", rizin.render(BackendQuery::analyze_all()));
  EXPECT_EQ("isj", rizin.render(BackendQuery::list_symbols()));
  EXPECT_EQ("icj", rizin.render(BackendQuery::list_classes()));
  EXPECT_EQ("izzj", rizin.render(BackendQuery::list_strings()));
  EXPECT_EQ("axtj @ 0x44f6c", rizin.render(BackendQuery::xrefs_to(282476)));
  EXPECT_EQ("pdfj @ 0x10",
            rizin.render(BackendQuery::disassemble_function(16)));
  EXPECT_EQ("is.j @ 0x10", rizin.render(BackendQuery::symbol_at(16)));

  RizinOptions options;
  options.analysis_command = "aaa";
  EXPECT_EQ("aaa", RizinBackend(options).render(BackendQuery::analyze_all()));
}

TEST_F(BackendTest, test_rizin_input_kinds) {
  RizinBackend rizin;
  EXPECT_TRUE(rizin.can_open(InputKind::DEX));
  EXPECT_FALSE(rizin.can_open(InputKind::APK));
  EXPECT_FALSE(rizin.can_open(InputKind::UNKNOWN));
}

TEST_F(BackendTest, test_rizin_missing_executable) {
  RizinOptions options;
  options.path = "/nonexistent/apkscope/rizin";
  RizinBackend rizin(options);
  EXPECT_THROW(rizin.open(make_dex()), apkscope::BackendFailureException);
}

TEST_F(BackendTest, test_rizin_exiting_early_is_a_backend_failure) {
  struct sigaction before {};
  ASSERT_EQ(0, sigaction(SIGPIPE, nullptr, &before));

  // Announces readiness, then quits without reading any command.
  auto script = make_file("fake-rizin.sh", "#!/bin/sh\nprintf '\\000'\n");
  boost::filesystem::permissions(script, boost::filesystem::owner_all);
  RizinOptions options;
  options.path = script;
  RizinBackend rizin(options);
  rizin.open(make_dex());
  for (int i = 0; i < 3; ++i) {
    EXPECT_THROW(rizin.run(BackendQuery::list_symbols()),
                 apkscope::BackendFailureException);
  }
  rizin.close();

  struct sigaction after {};
  ASSERT_EQ(0, sigaction(SIGPIPE, nullptr, &after));
  EXPECT_EQ(before.sa_handler, after.sa_handler);
}

TEST_F(BackendTest, test_rizin_not_open) {
  RizinBackend rizin;
  EXPECT_THROW(rizin.run(BackendQuery::list_symbols()),
               apkscope::BackendFailureException);
}

TEST_F(BackendTest, test_replay_in_memory) {
  ReplayBackend replay(parse(R"({
    "list-strings": [{"string": "hello"}],
    "xrefs-to@0x10": "[{\"from\": 32, \"type\": \"CALL\"}]"
  })"));
  EXPECT_TRUE(replay.can_open(InputKind::DEX));
  EXPECT_TRUE(replay.can_open(InputKind::APK));
  EXPECT_FALSE(replay.can_open(InputKind::UNKNOWN));

  EXPECT_THROW(replay.run(BackendQuery::list_strings()),
               apkscope::BackendFailureException);
  replay.open("classes.dex");

  // Structured responses are serialized, strings are passed through.
  EXPECT_EQ(R"([{"string":"hello"}])",
            replay.run(BackendQuery::list_strings()));
  EXPECT_EQ(R"([{"from": 32, "type": "CALL"}])",
            replay.run(BackendQuery::xrefs_to(16)));
  EXPECT_EQ("", replay.run(BackendQuery::list_symbols()));

  replay.close();
  EXPECT_THROW(replay.run(BackendQuery::list_strings()),
               apkscope::BackendFailureException);
}

TEST_F(BackendTest, test_replay_from_file) {
  auto transcript =
      make_file("classes.json", R"({"list-classes": [{"classname": "LA;"}]})");
  ReplayBackend replay(transcript);
  replay.open(make_dex());
  EXPECT_EQ(R"([{"classname":"LA;"}])",
            replay.run(BackendQuery::list_classes()));
}

TEST_F(BackendTest, test_replay_bad_transcripts) {
  ReplayBackend missing(tmp_dir.path + "/missing.json");
  EXPECT_THROW(missing.open("classes.dex"), apkscope::BackendFailureException);

  ReplayBackend garbage(make_file("garbage.json", "{not json"));
  EXPECT_THROW(garbage.open("classes.dex"), apkscope::BackendFailureException);

  ReplayBackend array(make_file("array.json", "[1, 2]"));
  EXPECT_THROW(array.open("classes.dex"), apkscope::BackendFailureException);
}
