// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.hpp"

#include <glog/logging.h>

#include <openssl/rand.h>

#include <limits>

namespace seautil
{

Random::Random ()
{
  seed.fill (0);
}

void
Random::Seed (const Digest& s)
{
  CHECK (!IsNullDigest (s)) << "Null seed given for Random";
  seed = s;
  nextIndex = 0;
}

void
Random::SeedFromString (const std::string& str)
{
  Seed (Sha256::Hash (str));
}

void
Random::SeedSecurely ()
{
  Digest s;
  do
    {
      CHECK_EQ (RAND_bytes (s.data (), s.size ()), 1)
          << "Failed to obtain secure random bytes";
    }
  while (IsNullDigest (s));

  Seed (s);
}

bool
Random::IsSeeded () const
{
  return !IsNullDigest (seed);
}

template <>
  unsigned char
  Random::Next<unsigned char> ()
{
  CHECK (IsSeeded ()) << "Random instance has not been seeded";

  if (nextIndex == seed.size ())
    {
      Sha256 hasher;
      hasher << seed;
      seed = hasher.Finalise ();
      nextIndex = 0;
    }
  CHECK_LT (nextIndex, seed.size ());

  return seed[nextIndex++];
}

template <>
  bool
  Random::Next<bool> ()
{
  return (Next<unsigned char> () & 1) != 0;
}

namespace
{

/**
 * Builds an unsigned integer of type T from individual random bytes
 * in big-endian order.
 */
template <typename T>
  T
  CombineBytes (Random& rnd)
{
  T res = 0;
  for (size_t i = 0; i < sizeof (T); ++i)
    {
      res <<= 8;
      res |= rnd.Next<unsigned char> ();
    }

  return res;
}

} // anonymous namespace

template <>
  uint16_t
  Random::Next<uint16_t> ()
{
  return CombineBytes<uint16_t> (*this);
}

template <>
  uint32_t
  Random::Next<uint32_t> ()
{
  return CombineBytes<uint32_t> (*this);
}

template <>
  uint64_t
  Random::Next<uint64_t> ()
{
  return CombineBytes<uint64_t> (*this);
}

uint32_t
Random::NextInt (const uint32_t n)
{
  CHECK_GT (n, 0);

  /* Values from the top partial "block" of the 64-bit range would make
     small results slightly more likely.  Reroll those.  */
  const uint64_t limit = (std::numeric_limits<uint64_t>::max () / n) * n;
  while (true)
    {
      const uint64_t x = Next<uint64_t> ();
      if (x < limit)
        return x % n;
    }
}

bool
Random::ProbabilityRoll (const uint32_t numer, const uint32_t denom)
{
  CHECK_LE (numer, denom);
  return NextInt (denom) < numer;
}

} // namespace seautil
