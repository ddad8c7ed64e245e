// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ship.hpp"

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace seabattle
{
namespace
{

using testing::ElementsAre;

class ShipTests : public testing::Test
{

protected:

  Ship ship;

  ShipTests ()
    : ship(1, TestShip ("Destroyer", 2))
  {
    ship.Place ({Coord (3, 3), Coord (3, 4)});
  }

};

TEST_F (ShipTests, FromConfig)
{
  const Ship s(7, ParseTextProto<proto::ShipConfig> (R"(
    name: "Nautilus"
    ship_class: "submarine"
    size: 3
    allowed_terrain: DEEP
    torpedoes: 2
    defense: 0.5
  )"));

  EXPECT_EQ (s.GetId (), 7);
  EXPECT_EQ (s.GetName (), "Nautilus");
  EXPECT_EQ (s.GetSize (), 3);
  EXPECT_THAT (s.GetAllowedTerrain (), ElementsAre (Terrain::DEEP));
  EXPECT_EQ (s.GetTorpedoes (), 2);
  EXPECT_EQ (s.GetDefense (), 0.5);
  EXPECT_TRUE (s.IsSubmarine ());
  EXPECT_FALSE (s.IsPlaced ());
  EXPECT_FALSE (s.IsSunk ());
}

TEST_F (ShipTests, DefaultTerrain)
{
  const Ship s(1, ParseTextProto<proto::ShipConfig> ("size: 1"));
  EXPECT_THAT (s.GetAllowedTerrain (),
               ElementsAre (Terrain::DEEP, Terrain::SHALLOW));
  EXPECT_EQ (s.GetDefense (), 1.0);
  EXPECT_FALSE (s.IsSubmarine ());
}

TEST_F (ShipTests, PlaceAndReset)
{
  EXPECT_TRUE (ship.IsPlaced ());
  EXPECT_THAT (ship.GetCells (), ElementsAre (Coord (3, 3), Coord (3, 4)));

  ship.Reset ();
  EXPECT_FALSE (ship.IsPlaced ());
  EXPECT_TRUE (ship.GetCells ().empty ());
}

TEST_F (ShipTests, PlaceWrongSize)
{
  EXPECT_DEATH (ship.Place ({Coord (0, 0)}), "Wrong number of cells");
}

TEST_F (ShipTests, HitSequence)
{
  EXPECT_EQ (ship.Hit (0), ShotResult::HIT);
  EXPECT_TRUE (ship.IsCellDestroyed (0));
  EXPECT_FALSE (ship.IsSunk ());

  EXPECT_EQ (ship.Hit (0), ShotResult::ALREADY_HIT);

  EXPECT_EQ (ship.Hit (1), ShotResult::SUNK);
  EXPECT_TRUE (ship.IsSunk ());

  EXPECT_EQ (ship.Hit (1), ShotResult::ALREADY_HIT);
  EXPECT_TRUE (ship.IsSunk ());
}

TEST_F (ShipTests, HealthNeverNegative)
{
  EXPECT_EQ (ship.Hit (0, 5.0), ShotResult::HIT);
  EXPECT_EQ (ship.GetHealth (0), 0.0);
}

TEST_F (ShipTests, Defense)
{
  auto cfg = TestShip ("Armoured", 1);
  cfg.set_defense (0.5);
  Ship armoured(2, cfg);
  armoured.Place ({Coord (0, 0)});

  EXPECT_EQ (armoured.Hit (0), ShotResult::HIT);
  EXPECT_EQ (armoured.GetHealth (0), 0.5);
  EXPECT_FALSE (armoured.IsSunk ());

  EXPECT_EQ (armoured.Hit (0), ShotResult::SUNK);
}

TEST_F (ShipTests, InvalidCellIndex)
{
  EXPECT_DEATH (ship.Hit (2), "Invalid cell index");
}

TEST_F (ShipTests, Torpedoes)
{
  auto cfg = TestShip ("U-1", 1);
  cfg.set_ship_class ("submarine");
  cfg.set_torpedoes (1);
  Ship sub(3, cfg);

  EXPECT_TRUE (sub.UseTorpedo ());
  EXPECT_EQ (sub.GetTorpedoes (), 0);
  EXPECT_FALSE (sub.UseTorpedo ());
}

} // anonymous namespace
} // namespace seabattle
