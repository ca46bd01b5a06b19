/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

enum class InputKind {
  // A single bytecode sub-image ("dex\n" magic).
  DEX,
  // A zip container such as an APK ("PK\3\4" magic).
  APK,
  UNKNOWN,
};

const char* show(InputKind kind);

/*
 * Sniffs the kind of `path` from its leading magic bytes. Missing or
 * unreadable files are UNKNOWN.
 */
InputKind detect_input_kind(const std::string& path);
