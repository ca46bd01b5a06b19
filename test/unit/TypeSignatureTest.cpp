/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TypeSignature.h"

#include <gtest/gtest.h>

#include "ApkScopeException.h"
#include "ApkScopeTest.h"

class TypeSignatureTest : public ApkScopeTest {};

using namespace type_signature;

TEST_F(TypeSignatureTest, test_convert_primitives) {
  EXPECT_EQ("V", convert("void"));
  EXPECT_EQ("Z", convert("boolean"));
  EXPECT_EQ("B", convert("byte"));
  EXPECT_EQ("C", convert("char"));
  EXPECT_EQ("S", convert("short"));
  EXPECT_EQ("I", convert("int"));
  EXPECT_EQ("J", convert("long"));
  EXPECT_EQ("F", convert("float"));
  EXPECT_EQ("D", convert("double"));
}

TEST_F(TypeSignatureTest, test_convert_arrays) {
  EXPECT_EQ("[D", convert("double[]"));
  EXPECT_EQ("[Ljava/lang/String;", convert("[String"));
  EXPECT_EQ("[[Ljava/lang/String;", convert("[[String"));
  EXPECT_EQ("[[Ljava/lang/String;", convert("String[][]"));
  EXPECT_EQ("[Landroid/accessibilityservice/AccessibilityServiceInfo;",
            convert("[android.accessibilityservice.AccessibilityServiceInfo"));
  EXPECT_EQ("[[Landroid/accessibilityservice/AccessibilityServiceInfo;",
            convert("[[android.accessibilityservice.AccessibilityServiceInfo"));
}

TEST_F(TypeSignatureTest, test_convert_varargs) {
  EXPECT_EQ("[Ljava/lang/Object;", convert("Object..."));
  EXPECT_EQ("[I", convert("int..."));
}

TEST_F(TypeSignatureTest, test_convert_class_names) {
  EXPECT_EQ("Ljava/lang/String;", convert("String"));
  EXPECT_EQ("Landroid/accessibilityservice/AccessibilityServiceInfo;",
            convert("android.accessibilityservice.AccessibilityServiceInfo"));
  EXPECT_EQ("Lcom/foo/Outer$Inner;", convert("com.foo.Outer_Inner"));
  EXPECT_EQ("LOuter$Inner;", convert("Outer_Inner"));
}

TEST_F(TypeSignatureTest, test_convert_empty) { EXPECT_EQ("", convert("")); }

TEST_F(TypeSignatureTest, test_normalize_descriptor) {
  EXPECT_EQ("()V", normalize_descriptor("()V"));
  EXPECT_EQ("(I)Z", normalize_descriptor("(I)Z"));
  EXPECT_EQ("(Landroid/os/Handler; Ljava/lang/String;)V",
            normalize_descriptor("(Landroid/os/Handler;Ljava/lang/String;)V"));
  EXPECT_EQ("([I J [[Ljava/lang/String; Z)[B",
            normalize_descriptor("([IJ[[Ljava/lang/String;Z)[B"));
  // Already normalized descriptors are left alone.
  EXPECT_EQ("(Landroid/os/Handler; Ljava/lang/String;)V",
            normalize_descriptor("(Landroid/os/Handler; Ljava/lang/String;)V"));
}

TEST_F(TypeSignatureTest, test_normalize_malformed_descriptor) {
  EXPECT_THROW(normalize_descriptor("V"),
               apkscope::MalformedDescriptorException);
  EXPECT_THROW(normalize_descriptor("(IV"),
               apkscope::MalformedDescriptorException);
  EXPECT_THROW(normalize_descriptor(")(V"),
               apkscope::MalformedDescriptorException);
  EXPECT_THROW(normalize_descriptor("(Ljava/lang/String)V"),
               apkscope::MalformedDescriptorException);
}

TEST_F(TypeSignatureTest, test_compact_descriptor) {
  EXPECT_EQ("(Landroid/os/Handler;Ljava/lang/String;)V",
            compact_descriptor("(Landroid/os/Handler; Ljava/lang/String;)V"));
  EXPECT_EQ("()V", compact_descriptor("()V"));
}
