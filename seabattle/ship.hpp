// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_SHIP_HPP
#define SEABATTLE_SHIP_HPP

#include "coord.hpp"
#include "terrain.hpp"
#include "types.hpp"

#include "proto/config.pb.h"

#include <string>
#include <vector>

namespace seabattle
{

/**
 * A single ship of a fleet.  It knows its own cells once placed and the
 * health of each of them.  Each cell starts with health 1.0; a cell is
 * destroyed once its health reaches zero, and the ship is sunk once all
 * of its cells are destroyed.
 */
class Ship
{

private:

  const ShipId id;
  const std::string name;
  const std::string shipClass;
  const unsigned size;

  /** Terrain types on which the ship may be placed.  */
  TerrainSet allowedTerrain;

  /** Multiplier applied to incoming damage.  */
  const double defense;

  /** The cells occupied, in order.  Empty while unplaced.  */
  std::vector<Coord> cells;

  /** Health per cell.  Always has size entries.  */
  std::vector<double> health;

  /** Remaining torpedoes.  */
  unsigned torpedoes;

public:

  /**
   * Constructs an unplaced ship from its era configuration.
   */
  explicit Ship (ShipId i, const proto::ShipConfig& cfg);

  Ship (const Ship&) = delete;
  void operator= (const Ship&) = delete;

  ShipId
  GetId () const
  {
    return id;
  }

  const std::string&
  GetName () const
  {
    return name;
  }

  const std::string&
  GetClass () const
  {
    return shipClass;
  }

  unsigned
  GetSize () const
  {
    return size;
  }

  const TerrainSet&
  GetAllowedTerrain () const
  {
    return allowedTerrain;
  }

  double
  GetDefense () const
  {
    return defense;
  }

  const std::vector<Coord>&
  GetCells () const
  {
    return cells;
  }

  bool
  IsPlaced () const
  {
    return !cells.empty ();
  }

  /**
   * Returns true if the ship is a submarine (judged by its class).
   */
  bool IsSubmarine () const;

  unsigned
  GetTorpedoes () const
  {
    return torpedoes;
  }

  /**
   * Consumes one torpedo.  Returns false if there are none left.
   */
  bool UseTorpedo ();

  /**
   * Sets the cells of the ship.  The number of cells must match the size.
   */
  void Place (const std::vector<Coord>& c);

  /**
   * Returns the ship to unplaced state with full health.
   */
  void Reset ();

  /**
   * Returns the remaining health of a cell.
   */
  double GetHealth (unsigned cellIndex) const;

  /**
   * Returns true if the given cell is destroyed.
   */
  bool
  IsCellDestroyed (const unsigned cellIndex) const
  {
    return GetHealth (cellIndex) <= 0.0;
  }

  /**
   * Returns true if every cell is destroyed.
   */
  bool IsSunk () const;

  /**
   * Applies damage to the given cell.  The damage is scaled by the ship's
   * defense, and health never drops below zero.  Returns ALREADY_HIT if the
   * cell was already destroyed (without any change), SUNK if this hit
   * sank the ship, and HIT otherwise.
   */
  ShotResult Hit (unsigned cellIndex, double damage = 1.0);

};

} // namespace seabattle

#endif // SEABATTLE_SHIP_HPP
