// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "placement.hpp"

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>

namespace seabattle
{
namespace
{

using testing::ElementsAre;
using testing::IsEmpty;

/* ************************************************************************** */

using DragTests = testing::Test;

TEST_F (DragTests, DominantAxis)
{
  Direction dir;

  ASSERT_TRUE (DirectionFromDrag (1, 3, dir));
  EXPECT_EQ (dir, Direction::RIGHT);
  ASSERT_TRUE (DirectionFromDrag (-1, -3, dir));
  EXPECT_EQ (dir, Direction::LEFT);

  ASSERT_TRUE (DirectionFromDrag (4, -1, dir));
  EXPECT_EQ (dir, Direction::DOWN);
  ASSERT_TRUE (DirectionFromDrag (-4, 1, dir));
  EXPECT_EQ (dir, Direction::UP);
}

TEST_F (DragTests, TiesGoHorizontal)
{
  Direction dir;
  ASSERT_TRUE (DirectionFromDrag (2, 2, dir));
  EXPECT_EQ (dir, Direction::RIGHT);
  ASSERT_TRUE (DirectionFromDrag (2, -2, dir));
  EXPECT_EQ (dir, Direction::LEFT);
}

TEST_F (DragTests, NoDrag)
{
  Direction dir;
  EXPECT_FALSE (DirectionFromDrag (0, 0, dir));
}

TEST (ComputeRunTests, Directions)
{
  EXPECT_THAT (ComputeRun (Coord (3, 3), Direction::RIGHT, 3),
               ElementsAre (Coord (3, 3), Coord (3, 4), Coord (3, 5)));
  EXPECT_THAT (ComputeRun (Coord (3, 3), Direction::UP, 2),
               ElementsAre (Coord (3, 3), Coord (2, 3)));
  EXPECT_THAT (ComputeRun (Coord (0, 0), Direction::LEFT, 2),
               ElementsAre (Coord (0, 0), Coord (0, -1)));
}

/* ************************************************************************** */

class PlacementEngineTests : public testing::Test
{

protected:

  Board board;
  PlacementEngine engine;
  Fleet fleet;

  seautil::Random rnd;

  PlacementEngineTests ()
    : board(MakeTerrain ()), engine(board), fleet(1)
  {
    fleet.AddShip (std::make_unique<Ship> (1, TestShip ("carrier", 3)));
    fleet.AddShip (std::make_unique<Ship> (2, TestShip ("destroyer", 2)));
    rnd.SeedFromString ("placement");
  }

  static TerrainGrid
  MakeTerrain ()
  {
    TerrainGrid res(5, 5);
    CHECK (res.FromRowStrings ({
      "ddddd",
      "ddddd",
      "ddlld",
      "ddddx",
      "ddddx",
    }));
    return res;
  }

  Ship&
  GetShip (const ShipId id)
  {
    Ship* res = fleet.GetShip (id);
    CHECK (res != nullptr);
    return *res;
  }

};

TEST_F (PlacementEngineTests, ValidPlacement)
{
  EXPECT_EQ (engine.Place (fleet, GetShip (1), Coord (0, 0), Direction::RIGHT,
                           nullptr),
             PlacementError::NONE);
  EXPECT_THAT (GetShip (1).GetCells (),
               ElementsAre (Coord (0, 0), Coord (0, 1), Coord (0, 2)));
  EXPECT_THAT (board.GetOccupants (Coord (0, 2)),
               ElementsAre (Occupant{1, 2}));
}

TEST_F (PlacementEngineTests, ValidationOrder)
{
  EXPECT_EQ (engine.Place (fleet, GetShip (1), Coord (0, 3), Direction::RIGHT,
                           nullptr),
             PlacementError::OUT_OF_BOUNDS);
  EXPECT_EQ (engine.Place (fleet, GetShip (1), Coord (3, 2), Direction::RIGHT,
                           nullptr),
             PlacementError::EXCLUDED);
  EXPECT_EQ (engine.Place (fleet, GetShip (1), Coord (2, 0), Direction::RIGHT,
                           nullptr),
             PlacementError::TERRAIN);

  EXPECT_FALSE (GetShip (1).IsPlaced ());
  for (int r = 0; r < board.GetRows (); ++r)
    for (int c = 0; c < board.GetColumns (); ++c)
      EXPECT_THAT (board.GetOccupants (Coord (r, c)), IsEmpty ());
}

TEST_F (PlacementEngineTests, SameFleetOverlap)
{
  ASSERT_EQ (engine.Place (fleet, GetShip (1), Coord (0, 0), Direction::RIGHT,
                           nullptr),
             PlacementError::NONE);
  EXPECT_EQ (engine.Place (fleet, GetShip (2), Coord (0, 2), Direction::DOWN,
                           nullptr),
             PlacementError::OVERLAP);
  EXPECT_FALSE (GetShip (2).IsPlaced ());

  engine.SetPreventOverlap (false);
  EXPECT_EQ (engine.Place (fleet, GetShip (2), Coord (0, 2), Direction::DOWN,
                           nullptr),
             PlacementError::NONE);
  EXPECT_THAT (board.GetOccupants (Coord (0, 2)),
               ElementsAre (Occupant{1, 2}, Occupant{2, 0}));
}

TEST_F (PlacementEngineTests, OtherFleetsMayOverlap)
{
  Fleet other(2);
  other.AddShip (std::make_unique<Ship> (3, TestShip ("enemy", 2)));

  ASSERT_EQ (engine.Place (fleet, GetShip (2), Coord (1, 1), Direction::RIGHT,
                           nullptr),
             PlacementError::NONE);
  EXPECT_EQ (engine.Place (other, *other.GetShip (3), Coord (1, 1),
                           Direction::DOWN, nullptr),
             PlacementError::NONE);
}

TEST_F (PlacementEngineTests, Zone)
{
  const PlacementZone zone{0, 1, 0, 4};
  EXPECT_EQ (engine.Place (fleet, GetShip (2), Coord (1, 0), Direction::DOWN,
                           &zone),
             PlacementError::OUTSIDE_ZONE);
  EXPECT_EQ (engine.Place (fleet, GetShip (2), Coord (1, 0), Direction::UP,
                           &zone),
             PlacementError::NONE);
}

TEST_F (PlacementEngineTests, AlreadyPlaced)
{
  ASSERT_EQ (engine.Place (fleet, GetShip (2), Coord (0, 0), Direction::RIGHT,
                           nullptr),
             PlacementError::NONE);
  EXPECT_EQ (engine.Place (fleet, GetShip (2), Coord (4, 0), Direction::RIGHT,
                           nullptr),
             PlacementError::ALREADY_PLACED);
  EXPECT_THAT (GetShip (2).GetCells (),
               ElementsAre (Coord (0, 0), Coord (0, 1)));
}

TEST_F (PlacementEngineTests, ByDrag)
{
  EXPECT_EQ (engine.PlaceByDrag (fleet, GetShip (2), Coord (4, 1), -3, 1,
                                 nullptr),
             PlacementError::NONE);
  EXPECT_THAT (GetShip (2).GetCells (),
               ElementsAre (Coord (4, 1), Coord (3, 1)));

  EXPECT_EQ (engine.PlaceByDrag (fleet, GetShip (1), Coord (0, 0), 0, 0,
                                 nullptr),
             PlacementError::EMPTY_RUN);
}

TEST_F (PlacementEngineTests, PlaceAndReset)
{
  ASSERT_EQ (engine.Place (fleet, GetShip (1), Coord (0, 0), Direction::DOWN,
                           nullptr),
             PlacementError::NONE);

  engine.ResetShip (GetShip (1));
  EXPECT_FALSE (GetShip (1).IsPlaced ());
  EXPECT_THAT (GetShip (1).GetCells (), IsEmpty ());
  for (int r = 0; r < 3; ++r)
    EXPECT_THAT (board.GetOccupants (Coord (r, 0)), IsEmpty ());

  EXPECT_EQ (engine.Place (fleet, GetShip (1), Coord (4, 0), Direction::RIGHT,
                           nullptr),
             PlacementError::NONE);
}

TEST_F (PlacementEngineTests, AutoPlaceCompletes)
{
  ASSERT_EQ (engine.Place (fleet, GetShip (2), Coord (0, 0), Direction::RIGHT,
                           nullptr),
             PlacementError::NONE);

  EXPECT_THAT (engine.AutoPlace (fleet, nullptr, rnd), IsEmpty ());
  EXPECT_TRUE (fleet.IsComplete ());

  /* The manually placed ship stays where it was.  */
  EXPECT_THAT (GetShip (2).GetCells (),
               ElementsAre (Coord (0, 0), Coord (0, 1)));

  for (const auto& s : fleet.GetShips ())
    EXPECT_TRUE (board.CanPlace (s->GetCells (), s->GetAllowedTerrain ()));
}

TEST_F (PlacementEngineTests, AutoPlaceSingleValidRun)
{
  /* Only a single run of length three is available on this board,
     which random tries are unlikely to hit but the scan finds.  */
  TerrainGrid terrain(6, 6);
  ASSERT_TRUE (terrain.FromRowStrings ({
    "llllll",
    "llllll",
    "llllll",
    "lllddd",
    "llllll",
    "llllll",
  }));
  Board tight(terrain);
  PlacementEngine tightEngine(tight);

  Fleet f(5);
  f.AddShip (std::make_unique<Ship> (10, TestShip ("cruiser", 3)));

  EXPECT_THAT (tightEngine.AutoPlace (f, nullptr, rnd), IsEmpty ());
  ASSERT_TRUE (f.IsComplete ());

  std::set<Coord> cells(f.GetShip (10)->GetCells ().begin (),
                        f.GetShip (10)->GetCells ().end ());
  EXPECT_THAT (cells, ElementsAre (Coord (3, 3), Coord (3, 4), Coord (3, 5)));
}

TEST_F (PlacementEngineTests, AutoPlaceReportsFailure)
{
  Fleet f(5);
  f.AddShip (std::make_unique<Ship> (10, TestShip ("huge", 6)));
  f.AddShip (std::make_unique<Ship> (11, TestShip ("small", 1)));

  EXPECT_THAT (engine.AutoPlace (f, nullptr, rnd), ElementsAre (10));
  EXPECT_FALSE (f.GetShip (10)->IsPlaced ());
  EXPECT_TRUE (f.GetShip (11)->IsPlaced ());
  EXPECT_FALSE (f.IsComplete ());
}

TEST_F (PlacementEngineTests, AutoPlaceRespectsZone)
{
  const PlacementZone zone{3, 4, 0, 3};
  EXPECT_THAT (engine.AutoPlace (fleet, &zone, rnd), IsEmpty ());
  for (const auto& s : fleet.GetShips ())
    for (const auto& c : s->GetCells ())
      EXPECT_TRUE (zone.Contains (c)) << c;
}

} // anonymous namespace
} // namespace seabattle
