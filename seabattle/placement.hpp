// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_PLACEMENT_HPP
#define SEABATTLE_PLACEMENT_HPP

#include "board.hpp"
#include "coord.hpp"
#include "fleet.hpp"
#include "ship.hpp"

#include <seautil/random.hpp>

#include <string>
#include <vector>

namespace seabattle
{

/**
 * Possible outcomes of a placement attempt.
 */
enum class PlacementError
{
  NONE,
  ALREADY_PLACED,
  EMPTY_RUN,
  OUT_OF_BOUNDS,
  EXCLUDED,
  TERRAIN,
  OVERLAP,
  OUTSIDE_ZONE,
  NO_VALID_RUN,
};

/**
 * Returns a human-readable description of a placement error.
 */
std::string PlacementErrorToString (PlacementError err);

/**
 * Rectangle (with inclusive bounds) in which a fleet has to be placed.
 */
struct PlacementZone
{

  int minRow;
  int maxRow;
  int minCol;
  int maxCol;

  bool
  Contains (const Coord& c) const
  {
    return c.GetRow () >= minRow && c.GetRow () <= maxRow
            && c.GetColumn () >= minCol && c.GetColumn () <= maxCol;
  }

};

/**
 * Derives the run direction of a ship from a drag gesture, given as delta
 * in rows and columns from the start cell.  The dominant axis wins, and
 * ties go horizontal.  The sign selects the direction, so that dragging
 * to the left or up extends the ship that way.  Returns false if there
 * is no drag at all.
 */
bool DirectionFromDrag (int dRows, int dCols, Direction& dir);

/**
 * Computes the run of cells of a ship with given size, starting at
 * the given cell and extending in the direction.
 */
std::vector<Coord> ComputeRun (const Coord& start, Direction dir,
                               unsigned size);

/**
 * Validates and commits ship placements on a board.  Placement is checked
 * in the order bounds, exclusion, terrain, same-fleet overlap (if the rule
 * is enabled) and finally an optional placement zone.  A failed placement
 * never leaves a partial registration behind.
 */
class PlacementEngine
{

private:

  /** Number of random attempts per ship before a full scan.  */
  static constexpr unsigned RANDOM_TRIES = 100;

  Board& board;

  /** Whether ships of the same fleet may not share cells.  */
  bool preventOverlap;

public:

  explicit PlacementEngine (Board& b, const bool overlap = true)
    : board(b), preventOverlap(overlap)
  {}

  PlacementEngine (const PlacementEngine&) = delete;
  void operator= (const PlacementEngine&) = delete;

  void
  SetPreventOverlap (const bool val)
  {
    preventOverlap = val;
  }

  /**
   * Checks whether the ship could be placed on the given cells.  The zone
   * may be null if there is no restriction.
   */
  PlacementError Validate (const Fleet& fleet, const Ship& ship,
                           const std::vector<Coord>& cells,
                           const PlacementZone* zone) const;

  /**
   * Places the ship on the given cells if valid.
   */
  PlacementError PlaceCells (const Fleet& fleet, Ship& ship,
                             const std::vector<Coord>& cells,
                             const PlacementZone* zone);

  /**
   * Places the ship starting at a cell in a given direction.
   */
  PlacementError Place (const Fleet& fleet, Ship& ship, const Coord& start,
                        Direction dir, const PlacementZone* zone);

  /**
   * Places the ship starting at a cell, with the direction derived
   * from a drag gesture.
   */
  PlacementError PlaceByDrag (const Fleet& fleet, Ship& ship,
                              const Coord& start, int dRows, int dCols,
                              const PlacementZone* zone);

  /**
   * Places all unplaced ships of the fleet randomly.  Each ship gets a number
   * of random attempts, after which every (cell, direction) candidate is
   * tried in a shuffled order.  Returns the IDs of ships for which no valid
   * placement exists; those remain unplaced.
   */
  std::vector<ShipId> AutoPlace (Fleet& fleet, const PlacementZone* zone,
                                 seautil::Random& rnd);

  /**
   * Removes a ship from the board and returns it to unplaced state.
   */
  void ResetShip (Ship& ship);

};

} // namespace seabattle

#endif // SEABATTLE_PLACEMENT_HPP
