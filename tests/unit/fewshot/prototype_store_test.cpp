#include <cropsight/core/error.hpp>
#include <cropsight/fewshot/prototype_store.hpp>
#include "support/test_helpers.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace nf = cropsight::fewshot;
namespace nc = cropsight::core;
namespace t = cropsight::test;

TEST(InMemoryPrototypeStore, PutThenGet) {
  nf::InMemoryPrototypeStore store;
  ASSERT_TRUE(store.put(t::make_prototype("Aphid", t::basis(4, 0))).has_value());
  auto p = store.get("Aphid");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->label, "Aphid");
  EXPECT_EQ(p->vector, t::basis(4, 0));
  EXPECT_EQ(store.size(), 1u);
}

TEST(InMemoryPrototypeStore, LookupIsCaseInsensitive) {
  nf::InMemoryPrototypeStore store;
  ASSERT_TRUE(store.put(t::make_prototype("Late Blight", t::basis(4, 1))).has_value());
  EXPECT_TRUE(store.contains("late blight"));
  EXPECT_TRUE(store.contains("LATE BLIGHT"));
  auto p = store.get("late BLIGHT");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->label, "Late Blight");
}

TEST(InMemoryPrototypeStore, GetUnknownIsNotFound) {
  nf::InMemoryPrototypeStore store;
  auto p = store.get("whitefly");
  ASSERT_FALSE(p.has_value());
  EXPECT_EQ(p.error().code, nc::ErrorCode::NotFound);
  EXPECT_FALSE(store.contains("whitefly"));
}

TEST(InMemoryPrototypeStore, DuplicateLabelRejectedAndOriginalKept) {
  nf::InMemoryPrototypeStore store;
  ASSERT_TRUE(store.put(t::make_prototype("Aphid", t::basis(4, 0))).has_value());
  auto again = store.put(t::make_prototype("APHID", t::basis(4, 3)));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, nc::ErrorCode::DuplicateClass);
  EXPECT_EQ(store.get("aphid")->vector, t::basis(4, 0));
  EXPECT_EQ(store.size(), 1u);
}

TEST(InMemoryPrototypeStore, EmptyLabelRejected) {
  nf::InMemoryPrototypeStore store;
  auto r = store.put(t::make_prototype("", t::basis(4, 0)));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, nc::ErrorCode::Validation);
}

TEST(InMemoryPrototypeStore, AllReturnsEveryPrototype) {
  nf::InMemoryPrototypeStore store;
  ASSERT_TRUE(store.put(t::make_prototype("b", t::basis(3, 0))).has_value());
  ASSERT_TRUE(store.put(t::make_prototype("a", t::basis(3, 1))).has_value());
  ASSERT_TRUE(store.put(t::make_prototype("c", t::basis(3, 2))).has_value());
  auto all = store.all();
  ASSERT_EQ(all.size(), 3u);
}

TEST(InMemoryPrototypeStore, RacingPutsOfSameLabelHaveOneWinner) {
  nf::InMemoryPrototypeStore store;
  constexpr int kThreads = 8;
  std::atomic<int> ok{0};
  std::atomic<int> duplicate{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&store, &ok, &duplicate, i]() {
      auto r = store.put(t::make_prototype(i % 2 ? "Mite" : "MITE", t::basis(8, i)));
      if (r) {
        ok++;
      } else if (r.error().code == nc::ErrorCode::DuplicateClass) {
        duplicate++;
      }
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(ok.load(), 1);
  EXPECT_EQ(duplicate.load(), kThreads - 1);
  EXPECT_EQ(store.size(), 1u);
}

TEST(InMemoryPrototypeStore, ReadersSeeConsistentSnapshotsDuringWrites) {
  nf::InMemoryPrototypeStore store;
  std::atomic<bool> done{false};
  std::atomic<bool> bad{false};
  std::thread reader([&]() {
    std::size_t last = 0;
    while (!done.load()) {
      const auto all = store.all();
      if (all.size() < last) bad = true;
      for (const auto& p : all) {
        if (p.vector.size() != 16u) bad = true;
      }
      last = all.size();
    }
  });
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(store.put(t::make_prototype("class-" + std::to_string(i), t::basis(16, i % 16)))
                    .has_value());
  }
  done = true;
  reader.join();
  EXPECT_FALSE(bad.load());
  EXPECT_EQ(store.size(), 50u);
}
