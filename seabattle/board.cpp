// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "board.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace seabattle
{

std::string
PlacementCheckToString (const PlacementCheck res)
{
  switch (res)
    {
    case PlacementCheck::OK:
      return "ok";
    case PlacementCheck::EMPTY_RUN:
      return "empty run of cells";
    case PlacementCheck::OUT_OF_BOUNDS:
      return "cell outside of the board";
    case PlacementCheck::EXCLUDED:
      return "cell is excluded from play";
    case PlacementCheck::TERRAIN:
      return "terrain not allowed for ship";
    }

  LOG (FATAL) << "Invalid placement check result: " << static_cast<int> (res);
}

Board::Board (const TerrainGrid& t)
  : terrain(t)
{}

bool
Board::IsValidCoordinate (const Coord& c) const
{
  return terrain.IsInBounds (c);
}

Terrain
Board::TerrainAt (const Coord& c) const
{
  return terrain.Get (c);
}

bool
Board::IsExcluded (const Coord& c) const
{
  return IsValidCoordinate (c) && terrain.Get (c) == Terrain::EXCLUDED;
}

PlacementCheck
Board::CheckPlacement (const std::vector<Coord>& cells,
                       const TerrainSet& allowed) const
{
  if (cells.empty ())
    return PlacementCheck::EMPTY_RUN;

  /* The checks are done in order over all cells, so that the reported
     failure is the most basic one.  */

  for (const auto& c : cells)
    if (!IsValidCoordinate (c))
      return PlacementCheck::OUT_OF_BOUNDS;

  for (const auto& c : cells)
    if (IsExcluded (c))
      return PlacementCheck::EXCLUDED;

  for (const auto& c : cells)
    if (allowed.count (TerrainAt (c)) == 0)
      return PlacementCheck::TERRAIN;

  return PlacementCheck::OK;
}

bool
Board::RegisterPlacement (const ShipId ship, const std::vector<Coord>& cells,
                          const TerrainSet& allowed)
{
  const auto check = CheckPlacement (cells, allowed);
  if (check != PlacementCheck::OK)
    {
      VLOG (1)
          << "Cannot register ship " << ship << ": "
          << PlacementCheckToString (check);
      return false;
    }

  for (unsigned i = 0; i < cells.size (); ++i)
    {
      const Occupant entry{ship, i};
      auto& list = occupants[cells[i]];
      if (std::find (list.begin (), list.end (), entry) == list.end ())
        list.push_back (entry);
    }

  return true;
}

void
Board::UnregisterShip (const ShipId ship)
{
  for (auto it = occupants.begin (); it != occupants.end (); )
    {
      auto& list = it->second;
      list.erase (std::remove_if (list.begin (), list.end (),
                                  [ship] (const Occupant& o)
                                    {
                                      return o.ship == ship;
                                    }),
                  list.end ());

      if (list.empty ())
        it = occupants.erase (it);
      else
        ++it;
    }
}

const std::vector<Occupant>&
Board::GetOccupants (const Coord& c) const
{
  static const std::vector<Occupant> empty;

  const auto mit = occupants.find (c);
  if (mit == occupants.end ())
    return empty;

  return mit->second;
}

bool
Board::IsValidAttackTarget (const Coord& c) const
{
  return IsValidCoordinate (c) && !IsExcluded (c);
}

void
Board::RecordShot (const ShotRecord& shot)
{
  CHECK (IsValidAttackTarget (shot.target))
      << "Recording shot at invalid target " << shot.target;
  shots.push_back (shot);
}

std::vector<ShotRecord>
Board::GetShotsAt (const Coord& c) const
{
  std::vector<ShotRecord> res;
  for (const auto& s : shots)
    if (s.target == c)
      res.push_back (s);

  return res;
}

bool
Board::WasAttacked (const Coord& c) const
{
  for (const auto& s : shots)
    if (s.target == c)
      return true;

  return false;
}

void
Board::Clear ()
{
  occupants.clear ();
  shots.clear ();
}

} // namespace seabattle
