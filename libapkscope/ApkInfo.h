/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "AnalysisBackend.h"
#include "InstructionStream.h"
#include "MethodSignature.h"
#include "MethodTable.h"
#include "WrapperEvidence.h"
#include "XrefResolver.h"

class AnalysisSession;
class ManifestReader;
struct AnalysisConfig;

/*
 * Everything the rule engine asks about an application: its permissions, its
 * methods, who calls whom, method bodies, strings and the class hierarchy.
 *
 * Each sub-image (a classes*.dex) gets its own backend session, created on
 * first use. Queries on different sub-images may run in parallel; queries on
 * one sub-image are serialized by its session.
 *
 * Operations that aggregate over all sub-images skip the ones whose session
 * cannot be created or has failed, after tracing the failure under APKINFO;
 * `failed_subimages()` lists them. Operations on a single method throw
 * BackendFailureException when that method's sub-image has failed.
 */
class ApkInfo {
 public:
  ApkInfo(std::vector<std::string> subimage_paths,
          std::shared_ptr<ManifestReader> manifest,
          BackendFactory backend_factory,
          size_t num_threads = 1);

  ApkInfo(std::vector<std::string> subimage_paths,
          std::shared_ptr<ManifestReader> manifest,
          const AnalysisConfig& config);

  ~ApkInfo();

  ApkInfo(const ApkInfo&) = delete;
  ApkInfo& operator=(const ApkInfo&) = delete;

  size_t number_of_subimages() const { return m_paths.size(); }
  const std::vector<std::string>& subimage_paths() const { return m_paths; }

  // Empty when there is no manifest.
  std::set<std::string> permissions() const;

  // Imported platform methods, i.e. the Android APIs the application uses.
  MethodSignatureSet android_apis();
  // Methods with code in the application.
  MethodSignatureSet custom_methods();
  /*
   * All methods of all sub-images. A method listed by several sub-images
   * appears once, with the handle of the lowest sub-image index.
   */
  MethodSignatureSet all_methods();

  /*
   * The first method, by sub-image index then listing order, that matches
   * every given field. An absent field matches anything.
   */
  boost::optional<MethodSignature> find_method(
      const boost::optional<std::string>& class_name,
      const boost::optional<std::string>& name = boost::none,
      const boost::optional<std::string>& descriptor = boost::none);

  MethodSignatureSet upperfunc(const MethodSignature& method);
  MethodOffsetList lowerfunc(const MethodSignature& method);

  InstructionStream get_method_bytecode(const MethodSignature& method);

  std::set<std::string> get_strings();

  WrapperEvidence get_wrapper_evidence(const MethodSignature& parent,
                                       const MethodSignature& first,
                                       const MethodSignature& second);

  std::set<std::string> superclass_of(const std::string& class_name);
  std::set<std::string> subclasses_of(const std::string& class_name);

  /*
   * Opens, analyzes and lists every sub-image up front, in parallel. Failures
   * are recorded the same way lazy use records them.
   */
  void prepare_all();

  /*
   * Drops the session of a sub-image along with everything cached from it;
   * the next use starts a new one. Must not race with other queries.
   */
  void reset_session(size_t subimage_index);

  std::vector<size_t> failed_subimages() const;

  // The session of a sub-image, creating it on first use.
  std::shared_ptr<AnalysisSession> session(size_t subimage_index);

 private:
  struct SubImage {
    std::mutex lock;
    std::shared_ptr<AnalysisSession> session;
    // Why the session could not be created.
    boost::optional<std::string> failure;
  };

  struct ClassHierarchy {
    std::map<std::string, std::set<std::string>> superclasses;
    std::map<std::string, std::set<std::string>> subclasses;
  };

  SubImage& subimage(size_t subimage_index) const;

  // Runs `fn` for every sub-image, skipping the unusable ones.
  template <typename Fn>
  void for_each_subimage(const char* what, const Fn& fn);

  std::shared_ptr<const MethodTable> table(size_t subimage_index);
  const ClassHierarchy& class_hierarchy();
  void invalidate_aggregates();

  std::vector<std::string> m_paths;
  std::shared_ptr<ManifestReader> m_manifest;
  BackendFactory m_backend_factory;
  size_t m_num_threads;
  std::vector<std::unique_ptr<SubImage>> m_subimages;

  MethodTableBuilder m_tables;
  XrefResolver m_xrefs;
  WrapperEvidenceExtractor m_wrappers;

  std::mutex m_aggregates_lock;
  std::unique_ptr<MethodSignatureSet> m_all_methods;
  std::unique_ptr<ClassHierarchy> m_hierarchy;
};
