// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __XORSHIFT64_H
#define __XORSHIFT64_H 1

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace mkc_backtest
{
  /**
   * @class Xorshift64
   * @brief Marsaglia xorshift64 (13, 7, 17) generator.
   *
   * The state is never zero: a zero seed is replaced by 1, and the
   * transform maps every non-zero state to a non-zero state. The output
   * sequence for a given seed is fixed on every platform.
   */
  class Xorshift64
  {
  public:
    explicit Xorshift64(uint64_t seed)
      : mState(seed == 0 ? 1 : seed)
    {}

    uint64_t next()
    {
      uint64_t x = mState;
      x ^= x << 13;
      x ^= x >> 7;
      x ^= x << 17;
      mState = x;
      return x;
    }

    /**
     * @brief Uniform integer in [0, n).
     *
     * Draws at or above the largest multiple of n that fits in 64 bits are
     * rejected so that the modulo carries no bias. n == 0 returns 0.
     */
    std::size_t nextIndex(std::size_t n)
    {
      if (n == 0)
	return 0;

      const uint64_t n64 = static_cast<uint64_t>(n);
      const uint64_t max = std::numeric_limits<uint64_t>::max();
      const uint64_t threshold = max - (max % n64);
      for (;;)
	{
	  const uint64_t x = next();
	  if (x < threshold)
	    return static_cast<std::size_t>(x % n64);
	}
    }

    uint64_t getState() const
    {
      return mState;
    }

  private:
    uint64_t mState;
  };

  // In-place Fisher-Yates shuffle driven by rng.
  template <class T>
  void fisherYatesShuffle(std::vector<T>& values, Xorshift64& rng)
  {
    for (std::size_t i = values.size(); i > 1; --i)
      {
	const std::size_t j = rng.nextIndex(i);
	std::swap(values[i - 1], values[j]);
      }
  }
}

#endif
