// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "placement.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <set>
#include <utility>

namespace seabattle
{

std::string
PlacementErrorToString (const PlacementError err)
{
  switch (err)
    {
    case PlacementError::NONE:
      return "ok";
    case PlacementError::ALREADY_PLACED:
      return "ship is already placed";
    case PlacementError::EMPTY_RUN:
      return "empty run of cells";
    case PlacementError::OUT_OF_BOUNDS:
      return "ship extends outside of the board";
    case PlacementError::EXCLUDED:
      return "ship covers an excluded cell";
    case PlacementError::TERRAIN:
      return "terrain not allowed for ship";
    case PlacementError::OVERLAP:
      return "ship overlaps another ship of the fleet";
    case PlacementError::OUTSIDE_ZONE:
      return "ship is outside of the placement zone";
    case PlacementError::NO_VALID_RUN:
      return "no valid placement exists for ship";
    }

  LOG (FATAL) << "Invalid placement error: " << static_cast<int> (err);
}

namespace
{

PlacementError
FromBoardCheck (const PlacementCheck check)
{
  switch (check)
    {
    case PlacementCheck::OK:
      return PlacementError::NONE;
    case PlacementCheck::EMPTY_RUN:
      return PlacementError::EMPTY_RUN;
    case PlacementCheck::OUT_OF_BOUNDS:
      return PlacementError::OUT_OF_BOUNDS;
    case PlacementCheck::EXCLUDED:
      return PlacementError::EXCLUDED;
    case PlacementCheck::TERRAIN:
      return PlacementError::TERRAIN;
    }

  LOG (FATAL) << "Invalid placement check: " << static_cast<int> (check);
}

} // anonymous namespace

bool
DirectionFromDrag (const int dRows, const int dCols, Direction& dir)
{
  if (dRows == 0 && dCols == 0)
    return false;

  if (std::abs (dCols) >= std::abs (dRows))
    dir = (dCols < 0 ? Direction::LEFT : Direction::RIGHT);
  else
    dir = (dRows < 0 ? Direction::UP : Direction::DOWN);

  return true;
}

std::vector<Coord>
ComputeRun (const Coord& start, const Direction dir, const unsigned size)
{
  std::vector<Coord> res;
  Coord cur = start;
  for (unsigned i = 0; i < size; ++i)
    {
      res.push_back (cur);
      cur = cur + dir;
    }

  return res;
}

PlacementError
PlacementEngine::Validate (const Fleet& fleet, const Ship& ship,
                           const std::vector<Coord>& cells,
                           const PlacementZone* zone) const
{
  if (cells.empty ())
    return PlacementError::EMPTY_RUN;
  CHECK_EQ (cells.size (), ship.GetSize ())
      << "Run length does not match ship " << ship.GetId ();

  const auto boardCheck
      = FromBoardCheck (board.CheckPlacement (cells,
                                              ship.GetAllowedTerrain ()));
  if (boardCheck != PlacementError::NONE)
    return boardCheck;

  if (preventOverlap)
    {
      const std::set<Coord> run(cells.begin (), cells.end ());
      for (const auto& other : fleet.GetShips ())
        {
          if (other->GetId () == ship.GetId ())
            continue;
          for (const auto& c : other->GetCells ())
            if (run.count (c) > 0)
              return PlacementError::OVERLAP;
        }
    }

  if (zone != nullptr)
    for (const auto& c : cells)
      if (!zone->Contains (c))
        return PlacementError::OUTSIDE_ZONE;

  return PlacementError::NONE;
}

PlacementError
PlacementEngine::PlaceCells (const Fleet& fleet, Ship& ship,
                             const std::vector<Coord>& cells,
                             const PlacementZone* zone)
{
  if (ship.IsPlaced ())
    return PlacementError::ALREADY_PLACED;

  const auto err = Validate (fleet, ship, cells, zone);
  if (err != PlacementError::NONE)
    return err;

  CHECK (board.RegisterPlacement (ship.GetId (), cells,
                                  ship.GetAllowedTerrain ()))
      << "Board rejected validated placement of ship " << ship.GetId ();
  ship.Place (cells);

  VLOG (1)
      << "Placed ship " << ship.GetId () << " (" << ship.GetName ()
      << ") at " << cells.front () << ".." << cells.back ();
  return PlacementError::NONE;
}

PlacementError
PlacementEngine::Place (const Fleet& fleet, Ship& ship, const Coord& start,
                        const Direction dir, const PlacementZone* zone)
{
  return PlaceCells (fleet, ship, ComputeRun (start, dir, ship.GetSize ()),
                     zone);
}

PlacementError
PlacementEngine::PlaceByDrag (const Fleet& fleet, Ship& ship,
                              const Coord& start, const int dRows,
                              const int dCols, const PlacementZone* zone)
{
  Direction dir;
  if (!DirectionFromDrag (dRows, dCols, dir))
    {
      /* Without a drag, a single-cell ship is still well-defined.  */
      if (ship.GetSize () != 1)
        return PlacementError::EMPTY_RUN;
      dir = Direction::RIGHT;
    }

  return Place (fleet, ship, start, dir, zone);
}

std::vector<ShipId>
PlacementEngine::AutoPlace (Fleet& fleet, const PlacementZone* zone,
                            seautil::Random& rnd)
{
  std::vector<ShipId> failed;

  const int rows = board.GetRows ();
  const int cols = board.GetColumns ();
  CHECK_GT (rows, 0);
  CHECK_GT (cols, 0);

  for (const auto& shipPtr : fleet.GetShips ())
    {
      Ship& ship = *shipPtr;
      if (ship.IsPlaced ())
        continue;

      bool placed = false;
      for (unsigned i = 0; i < RANDOM_TRIES && !placed; ++i)
        {
          const Coord start(rnd.NextInt (rows), rnd.NextInt (cols));
          const Direction dir = ALL_DIRECTIONS[rnd.NextInt (4)];
          placed = (Place (fleet, ship, start, dir, zone)
                      == PlacementError::NONE);
        }

      if (!placed)
        {
          VLOG (1)
              << "Random placement failed for ship " << ship.GetId ()
              << ", scanning all candidates";

          std::vector<std::pair<Coord, Direction>> candidates;
          for (int r = 0; r < rows; ++r)
            for (int c = 0; c < cols; ++c)
              for (const auto dir : ALL_DIRECTIONS)
                candidates.emplace_back (Coord (r, c), dir);
          rnd.Shuffle (candidates.begin (), candidates.end ());

          for (const auto& cand : candidates)
            if (Place (fleet, ship, cand.first, cand.second, zone)
                  == PlacementError::NONE)
              {
                placed = true;
                break;
              }
        }

      if (!placed)
        {
          LOG (WARNING)
              << "No valid placement for ship " << ship.GetId ()
              << " (" << ship.GetName () << ")";
          failed.push_back (ship.GetId ());
        }
    }

  return failed;
}

void
PlacementEngine::ResetShip (Ship& ship)
{
  board.UnregisterShip (ship.GetId ());
  ship.Reset ();
}

} // namespace seabattle
