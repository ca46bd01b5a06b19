/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "BytecodeInstruction.h"

#include <ostream>

std::vector<std::string> BytecodeInstruction::to_list() const {
  std::vector<std::string> list;
  list.reserve(registers.size() + 2);
  list.push_back(mnemonic);
  list.insert(list.end(), registers.begin(), registers.end());
  if (parameter) {
    list.push_back(*parameter);
  }
  return list;
}

std::ostream& operator<<(std::ostream& os, const BytecodeInstruction& insn) {
  os << insn.mnemonic;
  bool first = true;
  for (const auto& reg : insn.registers) {
    os << (first ? " " : ", ") << reg;
    first = false;
  }
  if (insn.parameter) {
    os << (first ? " " : ", ") << *insn.parameter;
  }
  return os;
}
