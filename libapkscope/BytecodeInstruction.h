/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <boost/optional.hpp>

/*
 * One disassembled instruction: its mnemonic, the registers it names (in
 * order, as "vN"), and an optional trailing operand such as a literal, a type,
 * a string or a method reference.
 */
struct BytecodeInstruction {
  std::string mnemonic;
  std::vector<std::string> registers;
  boost::optional<std::string> parameter;

  BytecodeInstruction() = default;
  BytecodeInstruction(std::string mnemonic,
                      std::vector<std::string> registers,
                      boost::optional<std::string> parameter)
      : mnemonic(std::move(mnemonic)),
        registers(std::move(registers)),
        parameter(std::move(parameter)) {}

  // [mnemonic, registers..., parameter]; the parameter is left out when
  // absent.
  std::vector<std::string> to_list() const;

  bool operator==(const BytecodeInstruction& that) const {
    return mnemonic == that.mnemonic && registers == that.registers &&
           parameter == that.parameter;
  }
  bool operator!=(const BytecodeInstruction& that) const {
    return !(*this == that);
  }
};

std::ostream& operator<<(std::ostream& os, const BytecodeInstruction& insn);
