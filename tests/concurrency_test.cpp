#include "value/tagged_value.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using clw::bytesrepr::Bytes;
using clw::value::TaggedValue;

TEST(Concurrency, ParallelEncodingIsIdentical) {
  const std::vector<std::string> names{"alpha", "beta", "gamma"};
  const auto expected = TaggedValue::from_string_list(names).to_wire();

  constexpr int kThreads = 8;
  constexpr int kIterations = 1000;
  std::vector<std::vector<Bytes>> results(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kIterations; ++i) {
        results[t].push_back(TaggedValue::from_string_list(names).to_wire());
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  for (const auto& per_thread : results) {
    ASSERT_EQ(per_thread.size(), static_cast<std::size_t>(kIterations));
    for (const auto& wire : per_thread) {
      ASSERT_EQ(wire, expected);
    }
  }
}
