// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

namespace seautil
{
namespace
{

class RandomTests : public testing::Test
{

protected:

  Random rnd;

  RandomTests ()
  {
    rnd.SeedFromString ("test seed");
  }

};

TEST_F (RandomTests, FirstBytesAreSeed)
{
  const Digest seed = Sha256::Hash ("test seed");
  for (const auto b : seed)
    ASSERT_EQ (rnd.Next<unsigned char> (), b);
}

TEST_F (RandomTests, ReseedsByHashing)
{
  Digest seed = Sha256::Hash ("test seed");
  for (size_t i = 0; i < seed.size (); ++i)
    rnd.Next<unsigned char> ();

  Sha256 hasher;
  hasher << seed;
  const Digest next = hasher.Finalise ();
  for (const auto b : next)
    ASSERT_EQ (rnd.Next<unsigned char> (), b);
}

TEST_F (RandomTests, IntegersAreBigEndian)
{
  const Digest seed = Sha256::Hash ("test seed");
  const uint16_t expected = (static_cast<uint16_t> (seed[0]) << 8) | seed[1];
  EXPECT_EQ (rnd.Next<uint16_t> (), expected);
}

TEST_F (RandomTests, Deterministic)
{
  Random other;
  other.SeedFromString ("test seed");
  for (unsigned i = 0; i < 100; ++i)
    ASSERT_EQ (rnd.Next<uint64_t> (), other.Next<uint64_t> ());
}

TEST_F (RandomTests, NextIntRangeAndSpread)
{
  constexpr unsigned n = 10;
  constexpr unsigned rolls = 10'000;
  constexpr unsigned threshold = rolls / n * 80 / 100;

  std::vector<unsigned> cnt(n);
  for (unsigned i = 0; i < rolls; ++i)
    {
      const auto val = rnd.NextInt (n);
      ASSERT_LT (val, n);
      ++cnt[val];
    }

  for (const auto c : cnt)
    EXPECT_GE (c, threshold);
}

TEST_F (RandomTests, ProbabilityRoll)
{
  for (unsigned i = 0; i < 100; ++i)
    {
      EXPECT_FALSE (rnd.ProbabilityRoll (0, 5));
      EXPECT_TRUE (rnd.ProbabilityRoll (5, 5));
    }
}

TEST_F (RandomTests, ShuffleIsPermutation)
{
  std::vector<int> values;
  for (int i = 0; i < 50; ++i)
    values.push_back (i);

  std::vector<int> shuffled = values;
  rnd.Shuffle (shuffled.begin (), shuffled.end ());
  EXPECT_NE (shuffled, values);

  std::sort (shuffled.begin (), shuffled.end ());
  EXPECT_EQ (shuffled, values);
}

TEST_F (RandomTests, PickReturnsElement)
{
  const std::vector<int> choices = {3, 5, 7};
  std::set<int> seen;
  for (unsigned i = 0; i < 100; ++i)
    seen.insert (rnd.Pick (choices));

  EXPECT_THAT (seen, testing::ElementsAre (3, 5, 7));
}

TEST_F (RandomTests, SecureSeeding)
{
  Random a;
  Random b;
  a.SeedSecurely ();
  b.SeedSecurely ();
  EXPECT_TRUE (a.IsSeeded ());
  EXPECT_NE (a.Next<uint64_t> (), b.Next<uint64_t> ());
}

using RandomDeathTests = testing::Test;

TEST_F (RandomDeathTests, Unseeded)
{
  Random r;
  EXPECT_FALSE (r.IsSeeded ());
  EXPECT_DEATH (r.Next<unsigned char> (), "has not been seeded");
}

TEST_F (RandomDeathTests, PickFromEmpty)
{
  Random r;
  r.SeedFromString ("foo");
  const std::vector<int> empty;
  EXPECT_DEATH (r.Pick (empty), "empty choices");
}

} // anonymous namespace
} // namespace seautil
