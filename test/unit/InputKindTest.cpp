/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "InputKind.h"

#include <gtest/gtest.h>

#include "ApkScopeTest.h"

class InputKindTest : public ApkScopeFileTest {};

TEST_F(InputKindTest, test_detect) {
  EXPECT_EQ(InputKind::DEX, detect_input_kind(make_dex()));
  EXPECT_EQ(InputKind::APK, detect_input_kind(make_apk()));
  EXPECT_EQ(InputKind::UNKNOWN,
            detect_input_kind(make_file("notes.txt", "just some text")));
  EXPECT_EQ(InputKind::UNKNOWN, detect_input_kind(make_file("short", "de")));
  EXPECT_EQ(InputKind::UNKNOWN,
            detect_input_kind(tmp_dir.path + "/does-not-exist.dex"));
  EXPECT_EQ(InputKind::UNKNOWN, detect_input_kind(tmp_dir.path));
}

TEST_F(InputKindTest, test_show) {
  EXPECT_STREQ("DEX", show(InputKind::DEX));
  EXPECT_STREQ("APK", show(InputKind::APK));
  EXPECT_STREQ("UNKNOWN", show(InputKind::UNKNOWN));
}
