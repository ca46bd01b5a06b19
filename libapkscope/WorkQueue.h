/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#pragma once

#include <algorithm>

#include <boost/thread/thread.hpp>
#include <sparta/WorkQueue.h>

namespace apkscope_parallel {
inline unsigned int default_num_threads() {
  // Hardware rather than physical concurrency, to use SMT.
  return std::max(1u, boost::thread::hardware_concurrency());
}
} // namespace apkscope_parallel

/*
 * Runs `fn` on every item through a sparta work queue of `num_threads`
 * workers (0 is taken as 1) and blocks until the queue drains. Once a call
 * throws, the queue drops the items no worker has started and the first
 * exception is rethrown from here.
 */
template <class Input, typename Fn, typename Items>
void workqueue_run(
    const Fn& fn,
    const Items& items,
    unsigned int num_threads = apkscope_parallel::default_num_threads()) {
  auto wq = sparta::work_queue<Input>(fn, std::max(1u, num_threads));
  for (const Input& item : items) {
    wq.add_item(item);
  }
  wq.run_all();
}
