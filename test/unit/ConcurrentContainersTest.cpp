/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ConcurrentContainers.h"

#include <atomic>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <boost/thread/thread.hpp>

constexpr size_t kThreads = 16;
constexpr size_t kKeys = 500;

TEST(ConcurrentContainersTest, insertAndGet) {
  InsertOnlyConcurrentMap<std::string, int> map;
  EXPECT_TRUE(map.empty());
  EXPECT_EQ(nullptr, map.get("a"));

  auto first = map.insert({"a", 1});
  EXPECT_TRUE(first.second);
  EXPECT_EQ(1, *first.first);

  // Inserting again keeps the old value.
  auto second = map.insert({"a", 2});
  EXPECT_FALSE(second.second);
  EXPECT_EQ(1, *second.first);
  EXPECT_EQ(first.first, second.first);

  EXPECT_EQ(1, *map.get("a"));
  EXPECT_EQ(1u, map.size());

  map.clear();
  EXPECT_TRUE(map.empty());
  EXPECT_EQ(nullptr, map.get("a"));
}

TEST(ConcurrentContainersTest, getOrCreateConverges) {
  InsertOnlyConcurrentMap<size_t, size_t> map;
  std::atomic<size_t> created{0};
  std::vector<std::vector<size_t>> seen(kThreads);

  std::vector<boost::thread> threads;
  for (size_t t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (size_t key = 0; key < kKeys; ++key) {
        seen[t].push_back(map.get_or_create(key, [&](size_t k) {
          created += 1;
          return k * 2 + t % 2;
        }));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(kKeys, map.size());
  EXPECT_GE(created.load(), kKeys);
  // Every thread saw the value that won the race for each key.
  for (size_t key = 0; key < kKeys; ++key) {
    auto value = *map.get(key);
    EXPECT_EQ(key, value / 2);
    for (size_t t = 0; t < kThreads; ++t) {
      EXPECT_EQ(value, seen[t][key]);
    }
  }
}
