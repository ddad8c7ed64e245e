// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_BOARD_HPP
#define SEABATTLE_BOARD_HPP

#include "coord.hpp"
#include "terrain.hpp"
#include "types.hpp"

#include <chrono>
#include <map>
#include <vector>

namespace seabattle
{

/**
 * Entry in the cell index of a board:  Which cell of which ship is
 * placed at a given coordinate.
 */
struct Occupant
{

  ShipId ship;

  /** Index of the cell within the ship's cell list.  */
  unsigned cellIndex;

  friend bool
  operator== (const Occupant& a, const Occupant& b)
  {
    return a.ship == b.ship && a.cellIndex == b.cellIndex;
  }

};

/**
 * One entry of the shot history.
 */
struct ShotRecord
{
  Coord target;
  PlayerId attacker;
  ShotResult result;
  std::chrono::system_clock::time_point timestamp;
};

/**
 * Result of checking whether a run of cells is a valid placement with
 * respect to the board alone.
 */
enum class PlacementCheck
{
  OK,
  EMPTY_RUN,
  OUT_OF_BOUNDS,
  EXCLUDED,
  TERRAIN,
};

/**
 * Returns a human-readable description of a placement check result.
 */
std::string PlacementCheckToString (PlacementCheck res);

/**
 * The shared board of a match.  It holds the static terrain, an index
 * of which ship cells are at each coordinate (ships of different players
 * may share a cell) and the ordered shot history.  The board only deals
 * with ship IDs and knows nothing about players or the game flow.
 */
class Board
{

private:

  /** The terrain of this board.  */
  TerrainGrid terrain;

  /** Occupants for every coordinate that has at least one.  */
  std::map<Coord, std::vector<Occupant>> occupants;

  /** Shots made so far, in order.  */
  std::vector<ShotRecord> shots;

public:

  explicit Board (const TerrainGrid& t);

  Board (const Board&) = delete;
  void operator= (const Board&) = delete;

  int
  GetRows () const
  {
    return terrain.GetRows ();
  }

  int
  GetColumns () const
  {
    return terrain.GetColumns ();
  }

  const TerrainGrid&
  GetTerrain () const
  {
    return terrain;
  }

  /**
   * Returns true if the coordinate is inside the board rectangle.
   */
  bool IsValidCoordinate (const Coord& c) const;

  /**
   * Returns the terrain at a valid coordinate.
   */
  Terrain TerrainAt (const Coord& c) const;

  /**
   * Returns true if the coordinate is valid but excluded from play.
   */
  bool IsExcluded (const Coord& c) const;

  /**
   * Checks a run of cells against the board:  The run must be non-empty,
   * every cell must be in bounds, not excluded and of an allowed terrain.
   * Occupancy is not considered here.
   */
  PlacementCheck CheckPlacement (const std::vector<Coord>& cells,
                                 const TerrainSet& allowed) const;

  bool
  CanPlace (const std::vector<Coord>& cells, const TerrainSet& allowed) const
  {
    return CheckPlacement (cells, allowed) == PlacementCheck::OK;
  }

  /**
   * Adds the cells of a ship to the index.  Returns false without any
   * change if the placement is not valid.  Registering the same ship
   * cell at the same coordinate twice has no additional effect.
   */
  bool RegisterPlacement (ShipId ship, const std::vector<Coord>& cells,
                          const TerrainSet& allowed);

  /**
   * Removes every index entry of the given ship.
   */
  void UnregisterShip (ShipId ship);

  /**
   * Returns the occupants of a cell (possibly empty).
   */
  const std::vector<Occupant>& GetOccupants (const Coord& c) const;

  /**
   * Returns true if the cell can be fired at, i.e. is valid and
   * not excluded.
   */
  bool IsValidAttackTarget (const Coord& c) const;

  /**
   * Appends a shot to the history.
   */
  void RecordShot (const ShotRecord& shot);

  /**
   * Returns all shots made at the given cell.
   */
  std::vector<ShotRecord> GetShotsAt (const Coord& c) const;

  /**
   * Returns true if any shot has been made at the cell.
   */
  bool WasAttacked (const Coord& c) const;

  const std::vector<ShotRecord>&
  GetShotHistory () const
  {
    return shots;
  }

  /**
   * Removes all occupants and shots, keeping the terrain.
   */
  void Clear ();

};

} // namespace seabattle

#endif // SEABATTLE_BOARD_HPP
