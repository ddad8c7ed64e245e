// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEAUTIL_RANDOM_HPP
#define SEAUTIL_RANDOM_HPP

#include "hash.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace seautil
{

/**
 * Deterministic stream of "random" numbers derived from a seed.  The bytes
 * of the current seed are handed out one by one, and when they run out, the
 * next seed is computed by hashing the previous one.  Two instances seeded
 * the same way produce the same sequence, which makes matches reproducible.
 */
class Random
{

private:

  /** The current seed whose bytes are handed out.  */
  Digest seed;

  /** Index of the next byte to hand out from seed.  */
  unsigned nextIndex = 0;

public:

  /**
   * Constructs an unseeded instance.  One of the Seed methods must be called
   * before any numbers are extracted.
   */
  Random ();

  Random (Random&&) = default;
  Random& operator= (Random&&) = default;

  Random (const Random&) = delete;
  void operator= (const Random&) = delete;

  /**
   * Sets the seed to the given digest.
   */
  void Seed (const Digest& s);

  /**
   * Seeds the instance from the hash of a string, e.g. a user-provided
   * match seed.
   */
  void SeedFromString (const std::string& str);

  /**
   * Seeds the instance from OpenSSL's secure random generator, for matches
   * that need not be reproducible.
   */
  void SeedSecurely ();

  /**
   * Returns true if the instance has been seeded.
   */
  bool IsSeeded () const;

  /**
   * Extracts the next value of the given type (unsigned char, bool, or
   * an unsigned integer type up to 64 bits).
   */
  template <typename T>
    T Next ();

  /**
   * Returns a uniformly distributed integer i with 0 <= i < n.
   */
  uint32_t NextInt (uint32_t n);

  /**
   * Returns true with probability numer / denom.
   */
  bool ProbabilityRoll (uint32_t numer, uint32_t denom);

  /**
   * Randomly permutes the given range.
   */
  template <typename Iterator>
    void Shuffle (Iterator begin, Iterator end);

  /**
   * Returns a uniformly chosen element of a non-empty vector.
   */
  template <typename T>
    const T& Pick (const std::vector<T>& choices);

};

} // namespace seautil

#include "random.tpp"

#endif // SEAUTIL_RANDOM_HPP
