/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "XrefResolver.h"

#include <json/value.h>

#include "AnalysisSession.h"
#include "ApkScopeException.h"
#include "SymbolDemangler.h"
#include "Trace.h"

namespace {

constexpr const char* kCallXref = "CALL";

bool is_call(const Json::Value& xref) {
  const auto& type = xref["type"];
  return type.isString() && type.asString() == kCallXref;
}

// Reads a non-negative integral address.
boost::optional<uint64_t> get_address(const Json::Value& json,
                                      const char* key) {
  const auto& val = json[key];
  if (!val.isIntegral()) {
    return boost::none;
  }
  if (val.isInt64() && val.asInt64() < 0) {
    return boost::none;
  }
  return val.asUInt64();
}

} // namespace

XrefResolver::MethodKey XrefResolver::method_key(
    const MethodSignature& method) {
  const auto& handle = method.get_handle();
  return MethodKey(method, handle ? handle->subimage_index : kNoSubimage);
}

MethodSignatureSet XrefResolver::upperfunc(const MethodSignature& method) {
  return m_upper.get_or_create(
      method_key(method),
      [this, &method](const MethodKey&) { return compute_upperfunc(method); });
}

MethodOffsetList XrefResolver::lowerfunc(const MethodSignature& method) {
  return m_lower.get_or_create(
      method_key(method),
      [this, &method](const MethodKey&) { return compute_lowerfunc(method); });
}

boost::optional<MethodSignature> XrefResolver::method_at(size_t subimage_index,
                                                         uint64_t address) {
  return m_methods_at.get_or_create(
      AddressKey(subimage_index, address),
      [this](const AddressKey& key) { return compute_method_at(key); });
}

void XrefResolver::clear() {
  m_upper.clear();
  m_lower.clear();
  m_methods_at.clear();
}

boost::optional<MethodSignature> XrefResolver::compute_method_at(
    const AddressKey& key) {
  auto session = m_session_provider(key.first);
  auto symbols = session->symbol_at(key.second);
  if (symbols.empty()) {
    return boost::none;
  }
  return demangler::parse(SymbolRecord::from_json(symbols[0]), key.first);
}

boost::optional<MethodSignature> XrefResolver::try_method_at(
    size_t subimage_index, uint64_t address) {
  try {
    return method_at(subimage_index, address);
  } catch (const apkscope::MalformedResponseException& e) {
    TRACE(XREF, 2, "Bad symbol lookup at 0x%llx: %s",
          static_cast<unsigned long long>(address), e.what());
    return boost::none;
  }
}

MethodSignatureSet XrefResolver::compute_upperfunc(
    const MethodSignature& method) {
  MethodSignatureSet callers;
  const auto& handle = method.get_handle();
  if (!handle) {
    TRACE(XREF, 2, "No backend handle for %s", method.full_name().c_str());
    return callers;
  }
  auto name = method.full_name();
  TraceContext context(name);

  auto session = m_session_provider(handle->subimage_index);
  auto xrefs = session->xrefs_to(handle->address);
  for (const auto& xref : xrefs) {
    if (!is_call(xref)) {
      continue;
    }
    auto from = get_address(xref, "from");
    if (!from) {
      TRACE(XREF, 3, "Call reference without a source to %s", name.c_str());
      continue;
    }
    auto caller = try_method_at(handle->subimage_index, *from);
    if (!caller) {
      // The function start is as good as the call site, when known.
      auto fcn_addr = get_address(xref, "fcn_addr");
      if (fcn_addr && *fcn_addr != *from) {
        caller = try_method_at(handle->subimage_index, *fcn_addr);
      }
    }
    if (!caller) {
      TRACE(XREF, 3, "Cannot identify the function at 0x%llx",
            static_cast<unsigned long long>(*from));
      continue;
    }
    callers.insert(std::move(*caller));
  }
  TRACE(XREF, 3, "%zu callers of %s", callers.size(), name.c_str());
  return callers;
}

MethodOffsetList XrefResolver::compute_lowerfunc(
    const MethodSignature& method) {
  MethodOffsetList callees;
  const auto& handle = method.get_handle();
  if (!handle || handle->is_imported) {
    return callees;
  }
  auto name = method.full_name();
  TraceContext context(name);

  auto session = m_session_provider(handle->subimage_index);
  auto ops = session->disassemble_function(handle->address);
  for (const auto& op : ops) {
    const auto& xrefs_from = op["xrefs_from"];
    if (!xrefs_from.isArray()) {
      continue;
    }
    for (const auto& xref : xrefs_from) {
      if (!is_call(xref)) {
        continue;
      }
      auto target = get_address(xref, "addr");
      if (!target) {
        TRACE(XREF, 3, "Call without a target in %s", name.c_str());
        continue;
      }
      auto callee = try_method_at(handle->subimage_index, *target);
      if (!callee) {
        TRACE(XREF, 3, "Cannot identify the function at 0x%llx",
              static_cast<unsigned long long>(*target));
        continue;
      }
      const auto& offset_json = op["offset"];
      if (!offset_json.isIntegral()) {
        TRACE(XREF, 2, "Instruction without an offset in %s", name.c_str());
        continue;
      }
      int64_t offset =
          offset_json.asInt64() - static_cast<int64_t>(handle->address);
      if (offset < 0) {
        TRACE(XREF, 1, "Call site at 0x%llx lies before %s",
              static_cast<unsigned long long>(offset_json.asUInt64()),
              name.c_str());
        continue;
      }
      callees.emplace_back(std::move(*callee), offset);
    }
  }
  TRACE(XREF, 3, "%zu call sites in %s", callees.size(), name.c_str());
  return callees;
}
