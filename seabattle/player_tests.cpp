// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "player.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace seabattle
{
namespace
{

class PlayerTests : public testing::Test
{

protected:

  HumanPlayer human;
  AiPlayer ai;

  PlayerTests ()
    : human(1, "Alice", 0), ai(2, "Admiral", 1, "optimal", 1.5)
  {}

};

TEST_F (PlayerTests, Basics)
{
  EXPECT_EQ (human.GetType (), PlayerType::HUMAN);
  EXPECT_EQ (human.GetName (), "Alice");
  EXPECT_EQ (human.GetAlliance (), 0);
  EXPECT_EQ (human.GetFleet ().GetOwner (), 1);

  EXPECT_EQ (ai.GetType (), PlayerType::AI);
  EXPECT_EQ (ai.GetStrategy (), "optimal");
  EXPECT_EQ (ai.GetDifficulty (), 1.5);
  EXPECT_EQ (PlayerTypeToString (ai.GetType ()), "ai");
}

TEST_F (PlayerTests, DontShoot)
{
  EXPECT_TRUE (human.CanShootAt (Coord (1, 1)));
  human.MarkUnshootable (Coord (1, 1));
  human.MarkUnshootable (Coord (1, 1));
  EXPECT_FALSE (human.CanShootAt (Coord (1, 1)));
  EXPECT_TRUE (human.CanShootAt (Coord (1, 2)));
  EXPECT_EQ (human.GetDontShoot ().size (), 1);
}

TEST_F (PlayerTests, ShotStatistics)
{
  human.RecordShotOutcome (ShotResult::MISS);
  human.RecordShotOutcome (ShotResult::HIT);
  human.RecordShotOutcome (ShotResult::ALREADY_HIT);
  human.RecordShotOutcome (ShotResult::SUNK);

  const auto& stats = human.GetStats ();
  EXPECT_EQ (stats.shots, 4);
  EXPECT_EQ (stats.hits, 2);
  EXPECT_EQ (stats.misses, 1);
  EXPECT_EQ (stats.sunk, 1);
  EXPECT_DOUBLE_EQ (stats.score, 12.0);
  EXPECT_DOUBLE_EQ (stats.GetAccuracy (), 0.5);
}

TEST_F (PlayerTests, ScoreMultiplier)
{
  human.RecordShotOutcome (ShotResult::HIT, 2.0);
  human.RecordShotOutcome (ShotResult::SUNK, 2.0);
  EXPECT_DOUBLE_EQ (human.GetStats ().score, 24.0);
}

TEST_F (PlayerTests, AccuracyWithoutShots)
{
  EXPECT_EQ (human.GetStats ().GetAccuracy (), 0.0);
}

TEST_F (PlayerTests, Losses)
{
  human.RecordLoss (ShotResult::HIT);
  human.RecordLoss (ShotResult::SUNK);
  human.RecordLoss (ShotResult::MISS);
  EXPECT_EQ (human.GetStats ().hitsTaken, 2);
  EXPECT_EQ (human.GetStats ().shipsLost, 1);
}

TEST_F (PlayerTests, Munitions)
{
  human.SetMunitions (1, 2);
  EXPECT_TRUE (human.UseStarShell ());
  EXPECT_FALSE (human.UseStarShell ());
  EXPECT_TRUE (human.UseScatterShot ());
  EXPECT_TRUE (human.UseScatterShot ());
  EXPECT_FALSE (human.UseScatterShot ());
  EXPECT_EQ (human.GetStarShells (), 0);
  EXPECT_EQ (human.GetScatterShots (), 0);
}

TEST_F (PlayerTests, TorpedoLauncher)
{
  auto subCfg = TestShip ("U-1", 1);
  subCfg.set_ship_class ("submarine");
  subCfg.set_torpedoes (1);

  human.GetFleet ().AddShip (std::make_unique<Ship> (1, TestShip ("d", 2)));
  auto& sub = human.GetFleet ().AddShip (std::make_unique<Ship> (2, subCfg));
  sub.Place ({Coord (0, 0)});

  EXPECT_EQ (human.FindTorpedoLauncher (0), &sub);
  EXPECT_EQ (human.FindTorpedoLauncher (2), &sub);
  EXPECT_EQ (human.FindTorpedoLauncher (1), nullptr);

  ASSERT_TRUE (sub.UseTorpedo ());
  EXPECT_EQ (human.FindTorpedoLauncher (0), nullptr);
}

TEST_F (PlayerTests, SunkSubmarineCannotLaunch)
{
  auto subCfg = TestShip ("U-1", 1);
  subCfg.set_ship_class ("submarine");
  subCfg.set_torpedoes (3);

  auto& sub = human.GetFleet ().AddShip (std::make_unique<Ship> (2, subCfg));
  sub.Place ({Coord (0, 0)});
  sub.Hit (0);

  EXPECT_EQ (human.FindTorpedoLauncher (0), nullptr);
}

} // anonymous namespace
} // namespace seabattle
