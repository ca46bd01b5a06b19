/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "InputKind.h"

/*
 * The commands the core needs from a disassembly backend. How each one is
 * spelled is up to the backend; every response is JSON text.
 *
 *   ANALYZE_ALL           run the control-flow pass, once per session
 *   LIST_SYMBOLS          [{type, name, realname, flagname, is_imported,
 *                           vaddr}, ...]
 *   LIST_CLASSES          [{classname, super}, ...]
 *   LIST_STRINGS          [{string}, ...]
 *   XREFS_TO addr         [{from, type}, ...] for references to addr
 *   DISASSEMBLE_FUNCTION  {ops: [{offset, disasm, bytes,
 *                                 xrefs_from: [{addr, type}]}, ...]}
 *                         for the function containing addr
 *   SYMBOL_AT addr        [{...symbol...}] for the symbol at addr
 */
enum class BackendCommand {
  ANALYZE_ALL,
  LIST_SYMBOLS,
  LIST_CLASSES,
  LIST_STRINGS,
  XREFS_TO,
  DISASSEMBLE_FUNCTION,
  SYMBOL_AT,
};

const char* show(BackendCommand command);

struct BackendQuery {
  BackendCommand command;
  boost::optional<uint64_t> address;

  static BackendQuery analyze_all() {
    return {BackendCommand::ANALYZE_ALL, boost::none};
  }
  static BackendQuery list_symbols() {
    return {BackendCommand::LIST_SYMBOLS, boost::none};
  }
  static BackendQuery list_classes() {
    return {BackendCommand::LIST_CLASSES, boost::none};
  }
  static BackendQuery list_strings() {
    return {BackendCommand::LIST_STRINGS, boost::none};
  }
  static BackendQuery xrefs_to(uint64_t address) {
    return {BackendCommand::XREFS_TO, address};
  }
  static BackendQuery disassemble_function(uint64_t address) {
    return {BackendCommand::DISASSEMBLE_FUNCTION, address};
  }
  static BackendQuery symbol_at(uint64_t address) {
    return {BackendCommand::SYMBOL_AT, address};
  }

  // Backend-neutral spelling, e.g. "list-symbols" or "xrefs-to@0x1a2b".
  std::string key() const;
};

/*
 * A disassembly backend driving one sub-image. Implementations own whatever
 * channel they talk over; none of them is safe for concurrent use.
 *
 * `open` and `run` throw BackendFailureException when the channel breaks.
 */
class AnalysisBackend {
 public:
  virtual ~AnalysisBackend() {}

  virtual std::string name() const = 0;

  virtual bool can_open(InputKind kind) const = 0;

  virtual void open(const std::string& path) = 0;

  // Raw response text. An empty string means "no result".
  virtual std::string run(const BackendQuery& query) = 0;

  virtual void close() = 0;
};

// Creates the backend for the sub-image at the given index.
using BackendFactory =
    std::function<std::unique_ptr<AnalysisBackend>(size_t subimage_index)>;
