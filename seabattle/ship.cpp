// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ship.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace seabattle
{

Ship::Ship (const ShipId i, const proto::ShipConfig& cfg)
  : id(i), name(cfg.name ()), shipClass(cfg.ship_class ()), size(cfg.size ()),
    defense(cfg.defense ()), torpedoes(cfg.torpedoes ())
{
  CHECK_GT (size, 0) << "Ship " << name << " has zero size";
  CHECK_GT (defense, 0.0) << "Ship " << name << " has invalid defense";

  for (const auto t : cfg.allowed_terrain ())
    allowedTerrain.insert (
        TerrainFromProto (static_cast<proto::TerrainType> (t)));
  if (allowedTerrain.empty ())
    allowedTerrain = {Terrain::DEEP, Terrain::SHALLOW};

  health.assign (size, 1.0);
}

bool
Ship::IsSubmarine () const
{
  return shipClass == "submarine";
}

bool
Ship::UseTorpedo ()
{
  if (torpedoes == 0)
    return false;

  --torpedoes;
  return true;
}

void
Ship::Place (const std::vector<Coord>& c)
{
  CHECK_EQ (c.size (), size) << "Wrong number of cells for ship " << name;
  cells = c;
  health.assign (size, 1.0);
}

void
Ship::Reset ()
{
  cells.clear ();
  health.assign (size, 1.0);
}

double
Ship::GetHealth (const unsigned cellIndex) const
{
  CHECK_LT (cellIndex, size) << "Invalid cell index for ship " << name;
  return health[cellIndex];
}

bool
Ship::IsSunk () const
{
  for (const double h : health)
    if (h > 0.0)
      return false;

  return true;
}

ShotResult
Ship::Hit (const unsigned cellIndex, const double damage)
{
  CHECK_LT (cellIndex, size) << "Invalid cell index for ship " << name;
  CHECK_GE (damage, 0.0);

  if (health[cellIndex] <= 0.0)
    return ShotResult::ALREADY_HIT;

  const bool wasSunk = IsSunk ();
  health[cellIndex] = std::max (0.0, health[cellIndex] - damage * defense);

  if (!wasSunk && IsSunk ())
    return ShotResult::SUNK;

  return ShotResult::HIT;
}

} // namespace seabattle
