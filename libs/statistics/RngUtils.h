// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace mkc_backtest
{
  namespace rng_utils
  {
    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Combine several 64-bit values into one seed
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts)
    {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
	h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief Derives independent per-replicate seeds from one master seed.
     *
     * Replicate k always receives the same seed no matter which thread runs
     * it or in what order, which is what keeps parallel resampling runs
     * identical to sequential ones. Tags separate unrelated streams that
     * share a master seed.
     */
    class SeedSequence
    {
    public:
      explicit SeedSequence(uint64_t masterSeed, std::vector<uint64_t> tags = {})
	: m_masterSeed(masterSeed),
	  m_tags(std::move(tags))
      {}

      SeedSequence with_tag(uint64_t tag) const
      {
	auto t = m_tags;
	t.push_back(tag);
	return SeedSequence(m_masterSeed, std::move(t));
      }

      uint64_t masterSeed() const noexcept
      {
	return m_masterSeed;
      }

      uint64_t make_seed_for(std::size_t replicate) const
      {
	uint64_t h = m_masterSeed;
	for (auto v : m_tags)
	  h = hash_combine64({h, v});
	return hash_combine64({h, static_cast<uint64_t>(replicate)});
      }

    private:
      uint64_t m_masterSeed;
      std::vector<uint64_t> m_tags;
    };
  }
}
