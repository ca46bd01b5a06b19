/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "InstructionStream.h"

#include <json/value.h>

#include "AnalysisSession.h"
#include "SmaliParser.h"
#include "Trace.h"

InstructionStream::InstructionStream(std::shared_ptr<AnalysisSession> session,
                                     MethodSignature method)
    : m_session(std::move(session)), m_method(std::move(method)) {}

InstructionStream::iterator InstructionStream::begin() const {
  const auto& handle = m_method.get_handle();
  if (!m_session || !handle || handle->is_imported) {
    return end();
  }
  auto ops = std::make_shared<const Json::Value>(
      m_session->disassemble_function(handle->address));
  TRACE(SMALI, 3, "%u instructions in %s", ops->size(),
        m_method.full_name().c_str());
  return iterator(std::move(ops), 0);
}

bool InstructionStream::iterator::at_end() const {
  return !m_ops || m_index >= m_ops->size();
}

std::string InstructionStream::iterator::disasm() const {
  const auto& op = (*m_ops)[static_cast<Json::ArrayIndex>(m_index)];
  const auto& disasm = op["disasm"];
  return disasm.isString() ? disasm.asString() : std::string();
}

BytecodeInstruction InstructionStream::iterator::operator*() const {
  return smali::parse(smali::strip_comment(disasm()));
}
