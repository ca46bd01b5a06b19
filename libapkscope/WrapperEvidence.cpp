/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "WrapperEvidence.h"

#include <vector>

#include <boost/algorithm/string/erase.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/regex.hpp>
#include <json/value.h>

#include "AnalysisSession.h"
#include "ApkScopeException.h"
#include "SmaliParser.h"
#include "Trace.h"
#include "TypeSignature.h"

namespace {

Json::Value instruction_to_json(
    const boost::optional<BytecodeInstruction>& insn) {
  if (!insn) {
    return Json::Value(Json::nullValue);
  }
  Json::Value list(Json::arrayValue);
  for (const auto& item : insn->to_list()) {
    list.append(item);
  }
  return list;
}

Json::Value string_to_json(const boost::optional<std::string>& str) {
  return str ? Json::Value(*str) : Json::Value(Json::nullValue);
}

} // namespace

Json::Value WrapperEvidence::to_json() const {
  Json::Value json(Json::objectValue);
  json["first"] = instruction_to_json(first);
  json["first_hex"] = string_to_json(first_hex);
  json["second"] = instruction_to_json(second);
  json["second_hex"] = string_to_json(second_hex);
  return json;
}

namespace wrapper_evidence {

std::string format_hex(const std::string& bytes) {
  static const boost::regex pair_re(R"(\w{2})");
  std::vector<std::string> pairs;
  for (boost::sregex_iterator it(bytes.begin(), bytes.end(), pair_re), end;
       it != end; ++it) {
    pairs.push_back(it->str());
  }
  return boost::algorithm::join(pairs, " ");
}

bool invokes(const BytecodeInstruction& insn, const MethodSignature& method) {
  if (!insn.parameter || !smali::is_invoke(insn.mnemonic)) {
    return false;
  }
  auto operand = boost::algorithm::erase_all_copy(*insn.parameter, " ");
  if (boost::algorithm::contains(operand, method.invocation_text())) {
    return true;
  }
  // The disassembler may drop the ';' closing the class descriptor.
  auto cls = method.get_class_name();
  if (!cls.empty() && cls.back() == ';') {
    cls.pop_back();
  }
  return boost::algorithm::contains(
      operand, cls + "->" + method.get_name() +
                   type_signature::compact_descriptor(method.get_descriptor()));
}

} // namespace wrapper_evidence

WrapperEvidence WrapperEvidenceExtractor::extract(
    const MethodSignature& parent,
    const MethodSignature& first,
    const MethodSignature& second) {
  WrapperEvidence evidence;
  const auto& handle = parent.get_handle();
  if (!handle || handle->is_imported) {
    return evidence;
  }

  auto session = m_session_provider(handle->subimage_index);
  auto ops = session->disassemble_function(handle->address);
  for (const auto& op : ops) {
    const auto& disasm = op["disasm"];
    if (!disasm.isString() || !smali::is_invoke(disasm.asString())) {
      continue;
    }
    BytecodeInstruction insn;
    try {
      insn = smali::parse(smali::strip_comment(disasm.asString()));
    } catch (const apkscope::InvalidSmaliException& e) {
      TRACE(WRAPPER, 1, "Skipping %s in %s: %s", disasm.asCString(),
            parent.full_name().c_str(), e.what());
      continue;
    }
    const auto& bytes = op["bytes"];
    auto hex = wrapper_evidence::format_hex(
        bytes.isString() ? bytes.asString() : std::string());
    if (wrapper_evidence::invokes(insn, first)) {
      evidence.first = insn;
      evidence.first_hex = hex;
    }
    if (wrapper_evidence::invokes(insn, second)) {
      evidence.second = insn;
      evidence.second_hex = hex;
    }
  }
  TRACE(WRAPPER, 3, "%s: first %s, second %s", parent.full_name().c_str(),
        evidence.first ? "found" : "missing",
        evidence.second ? "found" : "missing");
  return evidence;
}
