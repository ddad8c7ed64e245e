// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_FLEET_HPP
#define SEABATTLE_FLEET_HPP

#include "ship.hpp"
#include "types.hpp"

#include <memory>
#include <vector>

namespace seabattle
{

/**
 * The ordered collection of ships owned by one player.
 */
class Fleet
{

private:

  PlayerId owner;

  std::vector<std::unique_ptr<Ship>> ships;

public:

  explicit Fleet (const PlayerId o)
    : owner(o)
  {}

  Fleet (const Fleet&) = delete;
  void operator= (const Fleet&) = delete;

  PlayerId
  GetOwner () const
  {
    return owner;
  }

  /**
   * Adds a ship to the end of the fleet and returns a reference to it.
   */
  Ship& AddShip (std::unique_ptr<Ship> s);

  const std::vector<std::unique_ptr<Ship>>&
  GetShips () const
  {
    return ships;
  }

  size_t
  GetSize () const
  {
    return ships.size ();
  }

  /**
   * Returns the ship with the given ID, or null if it is not part
   * of this fleet.
   */
  Ship* GetShip (ShipId id);
  const Ship* GetShip (ShipId id) const;

  /**
   * Returns the first ship that is not yet placed, or null if all are.
   */
  Ship* NextUnplaced ();

  /**
   * Returns true if every ship is placed.
   */
  bool IsComplete () const;

  /**
   * Returns true if the fleet is empty or every ship is sunk.
   */
  bool IsDefeated () const;

  /**
   * Returns the number of ships not sunk.
   */
  unsigned CountAfloat () const;

};

} // namespace seabattle

#endif // SEABATTLE_FLEET_HPP
