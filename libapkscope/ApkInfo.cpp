/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ApkInfo.h"

#include <algorithm>
#include <numeric>

#include <json/value.h>

#include "AnalysisConfig.h"
#include "AnalysisSession.h"
#include "ApkScopeException.h"
#include "Debug.h"
#include "ManifestReader.h"
#include "Trace.h"
#include "WorkQueue.h"

namespace {

// Failures that make a whole sub-image unusable, as opposed to a bad answer
// to one query.
bool is_subimage_failure(const ApkScopeException& e) {
  switch (e.type) {
  case ApkScopeError::UNSUPPORTED_INPUT_KIND:
  case ApkScopeError::BACKEND_FAILURE:
  case ApkScopeError::INVALID_CONFIG:
    return true;
  default:
    return false;
  }
}

void add_superclasses(const Json::Value& super,
                      std::set<std::string>& superclasses) {
  if (super.isString()) {
    superclasses.insert(super.asString());
  } else if (super.isArray()) {
    for (const auto& s : super) {
      if (s.isString()) {
        superclasses.insert(s.asString());
      }
    }
  }
}

} // namespace

ApkInfo::ApkInfo(std::vector<std::string> subimage_paths,
                 std::shared_ptr<ManifestReader> manifest,
                 BackendFactory backend_factory,
                 size_t num_threads)
    : m_paths(std::move(subimage_paths)),
      m_manifest(std::move(manifest)),
      m_backend_factory(std::move(backend_factory)),
      m_num_threads(std::max<size_t>(1, num_threads)),
      m_tables([this](size_t i) { return session(i); }),
      m_xrefs([this](size_t i) { return session(i); }),
      m_wrappers([this](size_t i) { return session(i); }) {
  always_assert_log(m_backend_factory != nullptr, "No backend factory");
  for (size_t i = 0; i < m_paths.size(); ++i) {
    m_subimages.push_back(std::make_unique<SubImage>());
  }
  TRACE(APKINFO, 2, "%zu sub-images", m_paths.size());
}

ApkInfo::ApkInfo(std::vector<std::string> subimage_paths,
                 std::shared_ptr<ManifestReader> manifest,
                 const AnalysisConfig& config)
    : ApkInfo(std::move(subimage_paths),
              std::move(manifest),
              make_backend_factory(config),
              config.num_threads) {}

ApkInfo::~ApkInfo() {}

ApkInfo::SubImage& ApkInfo::subimage(size_t subimage_index) const {
  always_assert_log(subimage_index < m_subimages.size(),
                    "Sub-image %zu out of range, there are %zu",
                    subimage_index, m_subimages.size());
  return *m_subimages[subimage_index];
}

std::shared_ptr<AnalysisSession> ApkInfo::session(size_t subimage_index) {
  auto& s = subimage(subimage_index);
  std::lock_guard<std::mutex> lock(s.lock);
  if (s.session) {
    return s.session;
  }
  if (s.failure) {
    throw apkscope::BackendFailureException(
        "Sub-image is unusable",
        {{"input", m_paths[subimage_index]}, {"reason", *s.failure}});
  }
  try {
    s.session = std::make_shared<AnalysisSession>(
        subimage_index, m_paths[subimage_index],
        m_backend_factory(subimage_index));
  } catch (const ApkScopeException& e) {
    if (is_subimage_failure(e)) {
      s.failure = e.what();
    }
    throw;
  }
  return s.session;
}

template <typename Fn>
void ApkInfo::for_each_subimage(const char* what, const Fn& fn) {
  for (size_t i = 0; i < m_paths.size(); ++i) {
    try {
      fn(i);
    } catch (const ApkScopeException& e) {
      if (!is_subimage_failure(e)) {
        throw;
      }
      TRACE(APKINFO, 1, "Skipping sub-image %zu (%s) for %s: %s", i,
            m_paths[i].c_str(), what, e.what());
    }
  }
}

std::shared_ptr<const MethodTable> ApkInfo::table(size_t subimage_index) {
  return m_tables.build(subimage_index);
}

std::set<std::string> ApkInfo::permissions() const {
  if (!m_manifest) {
    return {};
  }
  return m_manifest->permissions();
}

MethodSignatureSet ApkInfo::all_methods() {
  std::lock_guard<std::mutex> lock(m_aggregates_lock);
  if (!m_all_methods) {
    auto methods = std::make_unique<MethodSignatureSet>();
    // Lower indices first, so their handles win.
    for_each_subimage("the method listing", [&](size_t i) {
      table(i)->for_each(
          [&](const MethodSignature& method) { methods->insert(method); });
    });
    TRACE(APKINFO, 2, "%zu methods in total", methods->size());
    m_all_methods = std::move(methods);
  }
  return *m_all_methods;
}

MethodSignatureSet ApkInfo::android_apis() {
  MethodSignatureSet apis;
  for (const auto& method : all_methods()) {
    if (method.is_android_api() && method.is_imported()) {
      apis.insert(method);
    }
  }
  return apis;
}

MethodSignatureSet ApkInfo::custom_methods() {
  MethodSignatureSet custom;
  for (const auto& method : all_methods()) {
    if (!method.is_imported()) {
      custom.insert(method);
    }
  }
  return custom;
}

boost::optional<MethodSignature> ApkInfo::find_method(
    const boost::optional<std::string>& class_name,
    const boost::optional<std::string>& name,
    const boost::optional<std::string>& descriptor) {
  boost::optional<MethodSignature> found;
  for_each_subimage("a method lookup", [&](size_t i) {
    if (!found) {
      found = table(i)->find(class_name, name, descriptor);
    }
  });
  return found;
}

MethodSignatureSet ApkInfo::upperfunc(const MethodSignature& method) {
  return m_xrefs.upperfunc(method);
}

MethodOffsetList ApkInfo::lowerfunc(const MethodSignature& method) {
  return m_xrefs.lowerfunc(method);
}

InstructionStream ApkInfo::get_method_bytecode(const MethodSignature& method) {
  const auto& handle = method.get_handle();
  if (!handle || handle->is_imported) {
    return InstructionStream();
  }
  return InstructionStream(session(handle->subimage_index), method);
}

std::set<std::string> ApkInfo::get_strings() {
  std::set<std::string> strings;
  for_each_subimage("the string listing", [&](size_t i) {
    Json::Value listing;
    try {
      listing = session(i)->list_strings();
    } catch (const apkscope::MalformedResponseException& e) {
      TRACE(APKINFO, 1, "Cannot list the strings of %s: %s",
            m_paths[i].c_str(), e.what());
      return;
    }
    for (const auto& entry : listing) {
      const auto& str = entry.isObject() ? entry["string"] : entry;
      if (str.isString()) {
        strings.insert(str.asString());
      }
    }
  });
  return strings;
}

WrapperEvidence ApkInfo::get_wrapper_evidence(const MethodSignature& parent,
                                              const MethodSignature& first,
                                              const MethodSignature& second) {
  return m_wrappers.extract(parent, first, second);
}

const ApkInfo::ClassHierarchy& ApkInfo::class_hierarchy() {
  std::lock_guard<std::mutex> lock(m_aggregates_lock);
  if (m_hierarchy) {
    return *m_hierarchy;
  }
  auto hierarchy = std::make_unique<ClassHierarchy>();
  for_each_subimage("the class listing", [&](size_t i) {
    Json::Value classes;
    try {
      classes = session(i)->list_classes();
    } catch (const apkscope::MalformedResponseException& e) {
      TRACE(APKINFO, 1, "Cannot list the classes of %s: %s",
            m_paths[i].c_str(), e.what());
      return;
    }
    for (const auto& info : classes) {
      const auto& cls = info["classname"];
      if (!cls.isString()) {
        continue;
      }
      std::set<std::string> supers;
      add_superclasses(info["super"], supers);
      for (const auto& super : supers) {
        hierarchy->superclasses[cls.asString()].insert(super);
        hierarchy->subclasses[super].insert(cls.asString());
      }
    }
  });
  m_hierarchy = std::move(hierarchy);
  return *m_hierarchy;
}

std::set<std::string> ApkInfo::superclass_of(const std::string& class_name) {
  const auto& supers = class_hierarchy().superclasses;
  auto it = supers.find(class_name);
  return it == supers.end() ? std::set<std::string>() : it->second;
}

std::set<std::string> ApkInfo::subclasses_of(const std::string& class_name) {
  const auto& subs = class_hierarchy().subclasses;
  auto it = subs.find(class_name);
  return it == subs.end() ? std::set<std::string>() : it->second;
}

void ApkInfo::prepare_all() {
  std::vector<size_t> indices(m_paths.size());
  std::iota(indices.begin(), indices.end(), 0);
  workqueue_run<size_t>(
      [this](size_t i) {
        try {
          table(i);
        } catch (const ApkScopeException& e) {
          if (!is_subimage_failure(e)) {
            throw;
          }
          TRACE(APKINFO, 1, "Cannot prepare sub-image %zu (%s): %s", i,
                m_paths[i].c_str(), e.what());
        }
      },
      indices, static_cast<unsigned int>(m_num_threads));
}

void ApkInfo::reset_session(size_t subimage_index) {
  auto& s = subimage(subimage_index);
  {
    std::lock_guard<std::mutex> lock(s.lock);
    if (s.session) {
      s.session->close();
      s.session.reset();
    }
    s.failure = boost::none;
  }
  m_tables.invalidate(subimage_index);
  m_xrefs.clear();
  invalidate_aggregates();
  TRACE(APKINFO, 2, "Reset sub-image %zu", subimage_index);
}

void ApkInfo::invalidate_aggregates() {
  std::lock_guard<std::mutex> lock(m_aggregates_lock);
  m_all_methods.reset();
  m_hierarchy.reset();
}

std::vector<size_t> ApkInfo::failed_subimages() const {
  std::vector<size_t> failed;
  for (size_t i = 0; i < m_subimages.size(); ++i) {
    auto& s = *m_subimages[i];
    std::lock_guard<std::mutex> lock(s.lock);
    if (s.failure ||
        (s.session && s.session->state() == AnalysisSession::State::FAILED)) {
      failed.push_back(i);
    }
  }
  return failed;
}
