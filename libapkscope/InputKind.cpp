/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "InputKind.h"

#include <array>
#include <cstring>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

const char* show(InputKind kind) {
  switch (kind) {
  case InputKind::DEX:
    return "DEX";
  case InputKind::APK:
    return "APK";
  case InputKind::UNKNOWN:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

InputKind detect_input_kind(const std::string& path) {
  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(path, ec) || ec) {
    return InputKind::UNKNOWN;
  }

  boost::filesystem::ifstream in(path, std::ios::binary);
  std::array<char, 4> magic{};
  if (!in.read(magic.data(), magic.size())) {
    return InputKind::UNKNOWN;
  }

  if (memcmp(magic.data(), "dex\n", 4) == 0) {
    return InputKind::DEX;
  }
  if (memcmp(magic.data(), "PK\3\4", 4) == 0) {
    return InputKind::APK;
  }
  return InputKind::UNKNOWN;
}
