#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

#include "bytesrepr/wide_uint.hpp"
#include "value/describe.hpp"
#include "value/tagged_value.hpp"

namespace {

using clw::value::TaggedValue;

auto make_strings(std::size_t count) -> std::vector<std::string> {
  std::vector<std::string> values;
  values.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    values.push_back("entry-" + std::to_string(i));
  }
  return values;
}

void BM_EncodeI32(benchmark::State& state) {
  std::uint32_t counter = 0;
  for (auto _ : state) {
    auto wire = TaggedValue::from_i32(static_cast<std::int32_t>(counter)).to_wire();
    benchmark::DoNotOptimize(wire);
    ++counter;
  }
}
BENCHMARK(BM_EncodeI32);

void BM_EncodeU512(benchmark::State& state) {
  const auto value = ~clw::bytesrepr::U512(0);
  for (auto _ : state) {
    auto wire = TaggedValue::from_u512(value).to_wire();
    benchmark::DoNotOptimize(wire);
  }
}
BENCHMARK(BM_EncodeU512);

void BM_EncodeStringList(benchmark::State& state) {
  const auto values = make_strings(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    auto wire = TaggedValue::from_string_list(values).to_wire();
    benchmark::DoNotOptimize(wire);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeStringList)->Range(1, 4096);

void BM_DecodeAndDescribeStringList(benchmark::State& state) {
  const auto wire = TaggedValue::from_string_list(
                        make_strings(static_cast<std::size_t>(state.range(0))))
                        .to_wire();
  for (auto _ : state) {
    auto value = TaggedValue::from_wire(wire);
    if (!value) {
      state.SkipWithError(value.error().message.c_str());
      break;
    }
    auto json = clw::value::describe(*value);
    benchmark::DoNotOptimize(json);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_DecodeAndDescribeStringList)->Range(1, 4096);

} // namespace

BENCHMARK_MAIN();
