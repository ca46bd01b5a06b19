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
#include <utility>

#include <boost/functional/hash.hpp>
#include <boost/optional.hpp>

#include "ConcurrentContainers.h"
#include "MethodSignature.h"

class AnalysisSession;

/*
 * Answers "who calls this method" and "what does this method call" from the
 * backend's cross-reference data, mapping code addresses back to methods
 * through the symbol at each address.
 *
 * Every query is resolved in the sub-image recorded in the method's handle;
 * methods without a handle have no known callers or callees. Results are
 * cached per method identity and sub-image until `clear()`, so the same
 * import seen from two sub-images keeps two answers.
 *
 * MalformedResponseException and BackendFailureException from the method's
 * own query propagate and leave the cache untouched. Call edges whose target
 * cannot be resolved are traced under XREF and dropped.
 */
class XrefResolver {
 public:
  using SessionProvider =
      std::function<std::shared_ptr<AnalysisSession>(size_t subimage_index)>;

  explicit XrefResolver(SessionProvider session_provider)
      : m_session_provider(std::move(session_provider)) {}

  // The methods containing a call to `method`.
  MethodSignatureSet upperfunc(const MethodSignature& method);

  /*
   * The methods `method` calls, each paired with the call site's offset from
   * the start of `method`, in instruction order. A callee appears once per
   * call site.
   */
  MethodOffsetList lowerfunc(const MethodSignature& method);

  // The method whose symbol covers `address` in the given sub-image.
  boost::optional<MethodSignature> method_at(size_t subimage_index,
                                             uint64_t address);

  // Must not race with queries.
  void clear();

 private:
  using AddressKey = std::pair<size_t, uint64_t>;

  // Methods without a handle use kNoSubimage.
  using MethodKey = std::pair<MethodSignature, size_t>;
  static constexpr size_t kNoSubimage = static_cast<size_t>(-1);

  struct MethodKeyHash {
    size_t operator()(const MethodKey& key) const {
      size_t seed = std::hash<MethodSignature>()(key.first);
      boost::hash_combine(seed, key.second);
      return seed;
    }
  };

  static MethodKey method_key(const MethodSignature& method);

  MethodSignatureSet compute_upperfunc(const MethodSignature& method);
  MethodOffsetList compute_lowerfunc(const MethodSignature& method);
  boost::optional<MethodSignature> compute_method_at(const AddressKey& key);
  // method_at, with undecodable answers counted as unresolved.
  boost::optional<MethodSignature> try_method_at(size_t subimage_index,
                                                 uint64_t address);

  SessionProvider m_session_provider;
  InsertOnlyConcurrentMap<MethodKey, MethodSignatureSet, MethodKeyHash>
      m_upper;
  InsertOnlyConcurrentMap<MethodKey, MethodOffsetList, MethodKeyHash> m_lower;
  InsertOnlyConcurrentMap<AddressKey,
                          boost::optional<MethodSignature>,
                          boost::hash<AddressKey>>
      m_methods_at;
};
