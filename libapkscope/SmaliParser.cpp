/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "SmaliParser.h"

#include <cctype>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "ApkScopeException.h"
#include "Trace.h"

namespace {

constexpr char kRegisterPrefix = 'v';

[[noreturn]] void fail(std::string_view line, const char* reason) {
  throw apkscope::InvalidSmaliException(
      "Cannot parse bytecode: " + std::string(reason),
      {{"smali", std::string(line)}});
}

std::vector<std::string> split_operands(const std::string& operands) {
  std::vector<std::string> tokens;
  std::string current;
  auto flush = [&]() {
    boost::trim(current);
    if (!current.empty()) {
      tokens.push_back(current);
    }
    current.clear();
  };
  for (char c : operands) {
    if (c == '{' || c == '}' || c == ',') {
      flush();
    } else {
      current.push_back(c);
    }
  }
  flush();
  return tokens;
}

size_t parse_register_index(std::string_view line, std::string reg) {
  boost::trim(reg);
  if (reg.size() < 2 || reg.size() > 10 || reg[0] != kRegisterPrefix) {
    fail(line, "unknown register");
  }
  size_t index = 0;
  for (size_t i = 1; i < reg.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(reg[i]))) {
      fail(line, "unknown register");
    }
    index = index * 10 + (reg[i] - '0');
  }
  return index;
}

void append_registers(std::string_view line,
                      const std::string& token,
                      std::vector<std::string>& registers) {
  std::string lower;
  std::string upper;
  auto dots = token.find("..");
  auto colon = token.find(':');
  if (dots != std::string::npos) {
    lower = token.substr(0, dots);
    upper = token.substr(dots + 2);
  } else if (colon != std::string::npos) {
    lower = token.substr(0, colon);
    upper = token.substr(colon + 1);
  } else {
    registers.push_back(std::string(1, kRegisterPrefix) +
                        std::to_string(parse_register_index(line, token)));
    return;
  }

  auto first = parse_register_index(line, lower);
  auto last = parse_register_index(line, upper);
  if (last < first) {
    fail(line, "empty register range");
  }
  for (auto i = first; i <= last; ++i) {
    registers.push_back(std::string(1, kRegisterPrefix) + std::to_string(i));
  }
}

} // namespace

namespace smali {

bool is_invoke(std::string_view mnemonic) {
  return boost::starts_with(mnemonic, "invoke");
}

std::string strip_comment(std::string_view line) {
  // A string literal may contain " ;" itself, so only look past it.
  auto search_from = line.rfind('"');
  if (search_from == std::string_view::npos) {
    search_from = 0;
  }
  auto comment = line.find(" ;", search_from);
  std::string stripped(line.substr(0, comment));
  boost::trim_right(stripped);
  return stripped;
}

BytecodeInstruction parse(std::string_view line) {
  std::string text(line);
  boost::trim(text);
  if (text.empty()) {
    fail(line, "argument cannot be empty");
  }

  auto space = text.find_first_of(" \t");
  if (space == std::string::npos) {
    return BytecodeInstruction(text, {}, boost::none);
  }

  std::string mnemonic = text.substr(0, space);
  std::string operands = text.substr(space + 1);

  boost::optional<std::string> parameter;
  // A string literal is taken as a whole; it may contain the separators.
  auto quote = operands.find('"');
  if (quote != std::string::npos) {
    parameter = boost::trim_copy(operands.substr(quote));
    operands.erase(quote);
  }

  auto tokens = split_operands(operands);
  if (!parameter && !tokens.empty() && tokens.back()[0] != kRegisterPrefix) {
    parameter = tokens.back();
    tokens.pop_back();

    if (is_invoke(mnemonic) && parameter->find("->") == std::string::npos) {
      auto dot = parameter->find('.');
      if (dot != std::string::npos) {
        parameter->replace(dot, 1, "->");
      }
    }
  }

  std::vector<std::string> registers;
  for (const auto& token : tokens) {
    append_registers(line, token, registers);
  }

  TRACE(SMALI, 5, "Parsed %s: %zu registers", mnemonic.c_str(),
        registers.size());
  return BytecodeInstruction(std::move(mnemonic), std::move(registers),
                             std::move(parameter));
}

} // namespace smali
