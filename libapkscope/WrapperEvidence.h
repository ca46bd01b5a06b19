/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "BytecodeInstruction.h"
#include "MethodSignature.h"

namespace Json {
class Value;
} // namespace Json

class AnalysisSession;

/*
 * The invoke instructions through which a method calls two other methods,
 * with the raw bytes of each as space-separated hex pairs ("6e 20 12 00").
 */
struct WrapperEvidence {
  boost::optional<BytecodeInstruction> first;
  boost::optional<std::string> first_hex;
  boost::optional<BytecodeInstruction> second;
  boost::optional<std::string> second_hex;

  bool empty() const { return !first && !second; }

  // {"first": [...] | null, "first_hex": "..." | null, ...}
  Json::Value to_json() const;
};

namespace wrapper_evidence {

// "6e201200" -> "6e 20 12 00"
std::string format_hex(const std::string& bytes);

// Whether the operand of an invoke instruction contains the reference to
// `method`. A class-less signature matches the call on any receiver type.
bool invokes(const BytecodeInstruction& insn, const MethodSignature& method);

} // namespace wrapper_evidence

/*
 * Scans the whole body of a parent method for invocations of `first` and
 * `second`. If either is called more than once, the last call site wins.
 * Imported parents have no body and give an empty record.
 */
class WrapperEvidenceExtractor {
 public:
  using SessionProvider =
      std::function<std::shared_ptr<AnalysisSession>(size_t subimage_index)>;

  explicit WrapperEvidenceExtractor(SessionProvider session_provider)
      : m_session_provider(std::move(session_provider)) {}

  WrapperEvidence extract(const MethodSignature& parent,
                          const MethodSignature& first,
                          const MethodSignature& second);

 private:
  SessionProvider m_session_provider;
};
