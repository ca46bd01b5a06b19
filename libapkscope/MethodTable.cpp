/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "MethodTable.h"

#include <algorithm>

#include <json/value.h>

#include "AnalysisSession.h"
#include "ApkScopeException.h"
#include "SymbolDemangler.h"
#include "Trace.h"

bool MethodTable::add(MethodSignature method) {
  auto it = m_methods.find(method.get_class_name());
  if (it == m_methods.end()) {
    m_class_order.push_back(method.get_class_name());
    it = m_methods.emplace(method.get_class_name(),
                           std::vector<MethodSignature>())
             .first;
  }
  auto& methods = it->second;
  if (std::find(methods.begin(), methods.end(), method) != methods.end()) {
    return false;
  }
  methods.push_back(std::move(method));
  ++m_size;
  return true;
}

const std::vector<MethodSignature>& MethodTable::methods_of(
    const std::string& class_name) const {
  static const std::vector<MethodSignature> s_none;
  auto it = m_methods.find(class_name);
  return it == m_methods.end() ? s_none : it->second;
}

boost::optional<MethodSignature> MethodTable::find(
    const boost::optional<std::string>& class_name,
    const boost::optional<std::string>& name,
    const boost::optional<std::string>& descriptor) const {
  auto matches = [&](const MethodSignature& method) {
    return (!name || *name == method.get_name()) &&
           (!descriptor || *descriptor == method.get_descriptor());
  };
  if (class_name) {
    for (const auto& method : methods_of(*class_name)) {
      if (matches(method)) {
        return method;
      }
    }
    return boost::none;
  }
  for (const auto& cls : m_class_order) {
    for (const auto& method : m_methods.at(cls)) {
      if (matches(method)) {
        return method;
      }
    }
  }
  return boost::none;
}

void MethodTable::for_each(
    const std::function<void(const MethodSignature&)>& f) const {
  for (const auto& cls : m_class_order) {
    for (const auto& method : m_methods.at(cls)) {
      f(method);
    }
  }
}

MethodTable MethodTable::build(AnalysisSession& session) {
  MethodTable table;
  Json::Value symbols;
  try {
    symbols = session.list_symbols();
  } catch (const apkscope::MalformedResponseException& e) {
    TRACE(MTABLE, 1, "Cannot list the symbols of %s: %s",
          session.path().c_str(), e.what());
    return table;
  }

  size_t skipped = 0;
  for (const auto& json : symbols) {
    auto record = SymbolRecord::from_json(json);
    auto method = demangler::parse(record, session.subimage_index());
    if (!method) {
      TRACE(MTABLE, 4, "Skipping symbol %s", record.flagname.c_str());
      ++skipped;
      continue;
    }
    table.add(std::move(*method));
  }
  TRACE(MTABLE, 2, "Sub-image %zu: %zu methods in %zu classes, %zu skipped",
        session.subimage_index(), table.size(), table.classes().size(),
        skipped);
  return table;
}

MethodTableBuilder::Slot& MethodTableBuilder::slot(size_t subimage_index) {
  std::lock_guard<std::mutex> lock(m_slots_lock);
  auto& slot = m_slots[subimage_index];
  if (!slot) {
    slot = std::make_unique<Slot>();
  }
  return *slot;
}

std::shared_ptr<const MethodTable> MethodTableBuilder::build(
    size_t subimage_index) {
  auto& s = slot(subimage_index);
  std::lock_guard<std::mutex> lock(s.lock);
  if (!s.table) {
    auto session = m_session_provider(subimage_index);
    s.table = std::make_shared<const MethodTable>(MethodTable::build(*session));
  }
  return s.table;
}

void MethodTableBuilder::invalidate(size_t subimage_index) {
  auto& s = slot(subimage_index);
  std::lock_guard<std::mutex> lock(s.lock);
  s.table.reset();
}
