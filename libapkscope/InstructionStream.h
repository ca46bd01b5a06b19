/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <memory>

#include "BytecodeInstruction.h"
#include "MethodSignature.h"

namespace Json {
class Value;
} // namespace Json

class AnalysisSession;

/*
 * The instructions of one method, disassembled on demand. Every call to
 * `begin()` asks the backend again, so the stream can be walked any number of
 * times; lines are parsed only when dereferenced, which is where
 * InvalidSmaliException surfaces.
 *
 *   for (const auto& insn : apk.get_method_bytecode(method)) {
 *     ...
 *   }
 *
 * Imported methods and methods without a backend handle have no instructions.
 */
class InstructionStream {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = BytecodeInstruction;
    using difference_type = std::ptrdiff_t;
    using pointer = const BytecodeInstruction*;
    using reference = BytecodeInstruction;

    iterator() = default;

    BytecodeInstruction operator*() const;

    // Raw disassembly of the current line, comments included.
    std::string disasm() const;

    iterator& operator++() {
      ++m_index;
      return *this;
    }
    iterator operator++(int) {
      auto copy = *this;
      ++m_index;
      return copy;
    }

    bool operator==(const iterator& that) const {
      return at_end() == that.at_end() && (at_end() || m_index == that.m_index);
    }
    bool operator!=(const iterator& that) const { return !(*this == that); }

   private:
    friend class InstructionStream;
    iterator(std::shared_ptr<const Json::Value> ops, size_t index)
        : m_ops(std::move(ops)), m_index(index) {}

    bool at_end() const;

    std::shared_ptr<const Json::Value> m_ops;
    size_t m_index{0};
  };

  InstructionStream() = default;
  InstructionStream(std::shared_ptr<AnalysisSession> session,
                    MethodSignature method);

  iterator begin() const;
  iterator end() const { return iterator(); }

  const MethodSignature& method() const { return m_method; }

 private:
  std::shared_ptr<AnalysisSession> m_session;
  MethodSignature m_method;
};
