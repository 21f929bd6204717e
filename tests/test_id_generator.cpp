#include <gtest/gtest.h>
#include <trs/core/id_generator.hpp>

#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using trs::core::IdGenerator;

namespace {
bool IsBase62(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
  });
}
} // namespace

TEST(IdGenerator, IdsAreBase62WithFixedSequenceSuffix) {
  IdGenerator gen;
  const std::string a = gen.Next();
  const std::string b = gen.Next();

  EXPECT_TRUE(IsBase62(a)) << a;
  ASSERT_GT(a.size(), IdGenerator::kSequenceLength);
  EXPECT_EQ(a.substr(a.size() - IdGenerator::kSequenceLength), "000001");
  EXPECT_EQ(b.substr(b.size() - IdGenerator::kSequenceLength), "000002");
  EXPECT_NE(a, b);
}

TEST(IdGenerator, UniqueAcrossThreads) {
  IdGenerator gen;
  std::mutex mu;
  std::set<std::string> ids;

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      std::vector<std::string> local;
      for (int i = 0; i < 1000; ++i) local.push_back(gen.Next());
      std::scoped_lock lk(mu);
      ids.insert(local.begin(), local.end());
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(ids.size(), 8000u);
}
