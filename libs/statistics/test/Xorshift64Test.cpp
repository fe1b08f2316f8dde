#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <set>
#include <vector>
#include "RngUtils.h"
#include "Xorshift64.h"

using mkc_backtest::Xorshift64;
using mkc_backtest::fisherYatesShuffle;
using mkc_backtest::rng_utils::SeedSequence;
using mkc_backtest::rng_utils::splitmix64;

TEST_CASE("Xorshift64 sequence", "[Xorshift64]")
{
  SECTION("Known first output for seed 1")
  {
    Xorshift64 rng(1);
    REQUIRE(rng.next() == UINT64_C(1082269761));
  }

  SECTION("Zero seed is remapped and never yields zero")
  {
    Xorshift64 zero(0);
    Xorshift64 one(1);
    REQUIRE(zero.getState() == 1);
    for (int i = 0; i < 1000; ++i)
    {
      const uint64_t x = zero.next();
      REQUIRE(x != 0);
      REQUIRE(x == one.next());
    }
  }

  SECTION("Same seed, same stream")
  {
    Xorshift64 a(987654321), b(987654321), c(987654322);
    bool differs = false;
    for (int i = 0; i < 100; ++i)
    {
      const uint64_t va = a.next();
      REQUIRE(va == b.next());
      differs = differs || va != c.next();
    }
    REQUIRE(differs);
  }
}

TEST_CASE("Xorshift64 nextIndex", "[Xorshift64]")
{
  Xorshift64 rng(42);

  SECTION("Values stay in [0, n)")
  {
    std::set<std::size_t> seen;
    for (int i = 0; i < 2000; ++i)
    {
      const std::size_t idx = rng.nextIndex(7);
      REQUIRE(idx < 7);
      seen.insert(idx);
    }
    REQUIRE(seen.size() == 7);
  }

  SECTION("Degenerate bounds")
  {
    REQUIRE(rng.nextIndex(0) == 0);
    REQUIRE(rng.nextIndex(1) == 0);
  }
}

TEST_CASE("fisherYatesShuffle is a deterministic permutation", "[Xorshift64]")
{
  std::vector<int> values(50);
  std::iota(values.begin(), values.end(), 0);

  std::vector<int> first(values), second(values);
  Xorshift64 rngA(7), rngB(7);
  fisherYatesShuffle(first, rngA);
  fisherYatesShuffle(second, rngB);

  REQUIRE(first == second);
  REQUIRE(first != values);

  std::vector<int> sorted(first);
  std::sort(sorted.begin(), sorted.end());
  REQUIRE(sorted == values);

  SECTION("Empty and single element inputs are untouched")
  {
    std::vector<int> empty;
    std::vector<int> single{5};
    fisherYatesShuffle(empty, rngA);
    fisherYatesShuffle(single, rngA);
    REQUIRE(empty.empty());
    REQUIRE(single == std::vector<int>{5});
  }
}

TEST_CASE("SeedSequence per-replicate seeds", "[rng][seed]")
{
  const SeedSequence seq(12345);

  REQUIRE(seq.masterSeed() == 12345);
  REQUIRE(seq.make_seed_for(0) == SeedSequence(12345).make_seed_for(0));
  REQUIRE(seq.make_seed_for(0) != seq.make_seed_for(1));
  REQUIRE(seq.make_seed_for(3) != SeedSequence(12346).make_seed_for(3));
  REQUIRE(seq.with_tag(1).make_seed_for(3) != seq.make_seed_for(3));

  std::set<uint64_t> seeds;
  for (std::size_t k = 0; k < 1000; ++k)
    seeds.insert(seq.make_seed_for(k));
  REQUIRE(seeds.size() == 1000);

  REQUIRE(splitmix64(0) != splitmix64(1));
}
