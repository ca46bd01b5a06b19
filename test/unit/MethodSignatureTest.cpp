/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "MethodSignature.h"

#include <gtest/gtest.h>
#include <sstream>

#include "ApkScopeTest.h"

class MethodSignatureTest : public ApkScopeTest {};

TEST_F(MethodSignatureTest, test_identity_ignores_handle_and_flags) {
  MethodSignature a("Lcom/foo/Bar;", "baz", "(I)V",
                    BackendHandle(0, 16, false));
  MethodSignature b("Lcom/foo/Bar;", "baz", "(I)V",
                    BackendHandle(3, 999, true), std::string("public"));
  MethodSignature c("Lcom/foo/Bar;", "baz", "(I)V");
  EXPECT_EQ(a, b);
  EXPECT_EQ(a, c);
  EXPECT_EQ(std::hash<MethodSignature>()(a), std::hash<MethodSignature>()(b));

  MethodSignatureSet set{a, b, c};
  EXPECT_EQ(1u, set.size());
}

TEST_F(MethodSignatureTest, test_fields_distinguish) {
  MethodSignature a("Lcom/foo/Bar;", "baz", "(I)V");
  EXPECT_NE(a, MethodSignature("Lcom/foo/Qux;", "baz", "(I)V"));
  EXPECT_NE(a, MethodSignature("Lcom/foo/Bar;", "qux", "(I)V"));
  EXPECT_NE(a, MethodSignature("Lcom/foo/Bar;", "baz", "(J)V"));
}

TEST_F(MethodSignatureTest, test_full_name) {
  MethodSignature m("Lcom/example/Foo;", "send",
                    "(Landroid/os/Handler; Ljava/lang/String;)V");
  EXPECT_EQ(
      "Lcom/example/Foo; send (Landroid/os/Handler; Ljava/lang/String;)V",
      m.full_name());
  std::ostringstream ss;
  ss << m;
  EXPECT_EQ(m.full_name(), ss.str());
}

TEST_F(MethodSignatureTest, test_invocation_text) {
  MethodSignature m("Lcom/example/Foo;", "send",
                    "(Landroid/os/Handler; Ljava/lang/String;)V");
  EXPECT_EQ(
      "Lcom/example/Foo;->send(Landroid/os/Handler;Ljava/lang/String;)V",
      m.invocation_text());
}

TEST_F(MethodSignatureTest, test_is_android_api) {
  EXPECT_TRUE(MethodSignature("Landroid/app/Activity;", "onCreate",
                              "(Landroid/os/Bundle;)V")
                  .is_android_api());
  EXPECT_TRUE(MethodSignature("Ljava/lang/String;", "length", "()I")
                  .is_android_api());
  EXPECT_TRUE(MethodSignature("Lorg/json/JSONObject;", "<init>", "()V")
                  .is_android_api());
  EXPECT_FALSE(MethodSignature("Lcom/example/Foo;", "bar", "()V")
                   .is_android_api());
  // Only whole package prefixes count.
  EXPECT_FALSE(MethodSignature("Landroidx/core/Foo;", "bar", "()V")
                   .is_android_api());
}

TEST_F(MethodSignatureTest, test_is_imported) {
  EXPECT_FALSE(MethodSignature("LFoo;", "f", "()V").is_imported());
  EXPECT_FALSE(MethodSignature("LFoo;", "f", "()V", BackendHandle(0, 4, false))
                   .is_imported());
  EXPECT_TRUE(MethodSignature("LFoo;", "f", "()V", BackendHandle(0, 0, true))
                  .is_imported());
}

TEST_F(MethodSignatureTest, test_ordering) {
  MethodSignature a("LA;", "f", "()V");
  MethodSignature b("LA;", "g", "()V");
  MethodSignature c("LB;", "a", "()V");
  EXPECT_TRUE(a < b);
  EXPECT_TRUE(b < c);
  EXPECT_FALSE(a < a);
}
