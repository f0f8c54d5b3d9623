// Copyright 2026 The BitInt Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS-IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

// Run with --benchmark_filter=. to execute.

#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>
#include "absl/flags/flag.h"
#include "absl/flags/reflection.h"

#include "bitint/bit_integer.h"
#include "bitint/testing/bit_integer_testing.h"
#include "bitint/util/value_or_die.h"

namespace bitint {
namespace {

// Power of two for fast modulo.
constexpr int kOperandCount = 16;

std::vector<BitInteger> RandomOperands(int nbits) {
  std::seed_seq seed = MakeTaggedSeedSeq("RandomOperands", std::cerr);
  std::mt19937_64 bitgen(seed);
  std::vector<BitInteger> numbers;
  numbers.reserve(kOperandCount);
  for (int i = 0; i < kOperandCount; ++i) {
    numbers.push_back(RandomBitInteger(bitgen, nbits));
  }
  return numbers;
}

void BM_Add(benchmark::State& state) {
  const std::vector<BitInteger> numbers = RandomOperands(state.range(0));
  size_t idx = 0;
  for (auto _ : state) {
    const BitInteger& a = numbers[(idx + 0) % kOperandCount];
    const BitInteger& b = numbers[(idx + 1) % kOperandCount];
    benchmark::DoNotOptimize(Add(a, b));
    ++idx;
  }
}
BENCHMARK(BM_Add)->RangeMultiplier(4)->Range(64, 4096);

void BM_Subtract(benchmark::State& state) {
  const std::vector<BitInteger> numbers = RandomOperands(state.range(0));
  size_t idx = 0;
  for (auto _ : state) {
    const BitInteger& a = numbers[(idx + 0) % kOperandCount];
    const BitInteger& b = numbers[(idx + 1) % kOperandCount];
    benchmark::DoNotOptimize(a < b ? Subtract(b, a) : Subtract(a, b));
    ++idx;
  }
}
BENCHMARK(BM_Subtract)->RangeMultiplier(4)->Range(64, 4096);

// Argument 0 is the operand size in bits, argument 1 the value of
// --bitint_karatsuba_base_bits.
void BM_Multiply(benchmark::State& state) {
  absl::FlagSaver flag_saver;
  absl::SetFlag(&FLAGS_bitint_karatsuba_base_bits,
                static_cast<int32_t>(state.range(1)));

  const std::vector<BitInteger> numbers = RandomOperands(state.range(0));
  size_t idx = 0;
  for (auto _ : state) {
    const BitInteger& a = numbers[(idx + 0) % kOperandCount];
    const BitInteger& b = numbers[(idx + 1) % kOperandCount];
    benchmark::DoNotOptimize(ValueOrDie(Multiply(a, b)));
    ++idx;
  }
}
BENCHMARK(BM_Multiply)
    ->ArgsProduct({{64, 256, 1024}, {1, 8, 32, 128}});

void BM_MultiplyShiftAndAdd(benchmark::State& state) {
  const std::vector<BitInteger> numbers = RandomOperands(state.range(0));
  size_t idx = 0;
  for (auto _ : state) {
    const BitInteger& a = numbers[(idx + 0) % kOperandCount];
    const BitInteger& b = numbers[(idx + 1) % kOperandCount];
    benchmark::DoNotOptimize(MultiplyShiftAndAdd(a, b));
    ++idx;
  }
}
BENCHMARK(BM_MultiplyShiftAndAdd)->RangeMultiplier(4)->Range(64, 1024);

void BM_DivMod(benchmark::State& state) {
  const std::vector<BitInteger> dividends = RandomOperands(2 * state.range(0));
  const std::vector<BitInteger> divisors = RandomOperands(state.range(0));
  size_t idx = 0;
  for (auto _ : state) {
    const BitInteger& a = dividends[idx % kOperandCount];
    const BitInteger& b = divisors[(idx + 1) % kOperandCount];
    benchmark::DoNotOptimize(ValueOrDie(DivMod(a, b)));
    ++idx;
  }
}
BENCHMARK(BM_DivMod)->RangeMultiplier(4)->Range(64, 1024);

}  // namespace
}  // namespace bitint
