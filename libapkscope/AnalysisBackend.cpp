/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AnalysisBackend.h"

#include <sstream>

const char* show(BackendCommand command) {
  switch (command) {
  case BackendCommand::ANALYZE_ALL:
    return "analyze-all";
  case BackendCommand::LIST_SYMBOLS:
    return "list-symbols";
  case BackendCommand::LIST_CLASSES:
    return "list-classes";
  case BackendCommand::LIST_STRINGS:
    return "list-strings";
  case BackendCommand::XREFS_TO:
    return "xrefs-to";
  case BackendCommand::DISASSEMBLE_FUNCTION:
    return "disassemble-function";
  case BackendCommand::SYMBOL_AT:
    return "symbol-at";
  }
  return "unknown";
}

std::string BackendQuery::key() const {
  std::ostringstream ss;
  ss << show(command);
  if (address) {
    ss << "@0x" << std::hex << *address;
  }
  return ss.str();
}
