/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/optional.hpp>

#include "MethodSignature.h"

class AnalysisSession;

/*
 * The methods of one sub-image grouped by declaring class. Within a class the
 * methods keep the order the backend listed them in, minus duplicates.
 */
class MethodTable {
 public:
  // Returns false if an equal signature is already listed for its class.
  bool add(MethodSignature method);

  // Empty for classes the table knows nothing about.
  const std::vector<MethodSignature>& methods_of(
      const std::string& class_name) const;

  /*
   * The first method matching every given field. An absent field matches
   * anything.
   */
  boost::optional<MethodSignature> find(
      const boost::optional<std::string>& class_name,
      const boost::optional<std::string>& name,
      const boost::optional<std::string>& descriptor) const;

  // Visits classes in first-seen order.
  void for_each(const std::function<void(const MethodSignature&)>& f) const;

  const std::vector<std::string>& classes() const { return m_class_order; }

  size_t size() const { return m_size; }
  bool empty() const { return m_size == 0; }

  // Lists, demangles and groups the symbols of `session`'s sub-image.
  static MethodTable build(AnalysisSession& session);

 private:
  std::unordered_map<std::string, std::vector<MethodSignature>> m_methods;
  std::vector<std::string> m_class_order;
  size_t m_size{0};
};

/*
 * Builds each sub-image's table once and hands out the cached copy after
 * that. Sessions come from `session_provider`; a table is dropped together
 * with its session through `invalidate`.
 */
class MethodTableBuilder {
 public:
  using SessionProvider =
      std::function<std::shared_ptr<AnalysisSession>(size_t subimage_index)>;

  explicit MethodTableBuilder(SessionProvider session_provider)
      : m_session_provider(std::move(session_provider)) {}

  /*
   * Throws BackendFailureException (and does not cache anything) when the
   * session is unusable.
   */
  std::shared_ptr<const MethodTable> build(size_t subimage_index);

  void invalidate(size_t subimage_index);

 private:
  struct Slot {
    std::mutex lock;
    std::shared_ptr<const MethodTable> table;
  };

  Slot& slot(size_t subimage_index);

  SessionProvider m_session_provider;
  std::mutex m_slots_lock;
  std::map<size_t, std::unique_ptr<Slot>> m_slots;
};
