// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "munitions.hpp"

#include <glog/logging.h>

namespace seabattle
{

Munition
MunitionFromProto (const proto::MunitionType m)
{
  switch (m)
    {
    case proto::SHOT:
      return Munition::SHOT;
    case proto::SCATTER_SHOT:
      return Munition::SCATTER_SHOT;
    case proto::STAR_SHELL:
      return Munition::STAR_SHELL;
    case proto::TORPEDO:
      return Munition::TORPEDO;
    }

  LOG (FATAL) << "Invalid munition type: " << static_cast<int> (m);
}

std::string
MunitionToString (const Munition m)
{
  switch (m)
    {
    case Munition::SHOT:
      return "shot";
    case Munition::SCATTER_SHOT:
      return "scatter shot";
    case Munition::STAR_SHELL:
      return "star shell";
    case Munition::TORPEDO:
      return "torpedo";
    }

  LOG (FATAL) << "Invalid munition: " << static_cast<int> (m);
}

std::vector<Coord>
ScatterPattern (const Coord& centre)
{
  std::vector<Coord> res = {centre};
  for (const auto dir : ALL_DIRECTIONS)
    res.push_back (centre + dir);

  return res;
}

std::vector<Coord>
StarShellArea (const Coord& centre)
{
  std::vector<Coord> res;
  for (int dr = -1; dr <= 1; ++dr)
    for (int dc = -1; dc <= 1; ++dc)
      res.emplace_back (centre.GetRow () + dr, centre.GetColumn () + dc);

  return res;
}

std::vector<Coord>
TorpedoPath (const Board& board, const Coord& start, const Direction heading,
             const unsigned range)
{
  std::vector<Coord> res;

  Coord cur = start;
  while (res.size () < range)
    {
      if (!board.IsValidCoordinate (cur)
            || !IsNavigable (board.TerrainAt (cur)))
        break;

      res.push_back (cur);
      cur = cur + heading;
    }

  return res;
}

unsigned
MunitionWithBoost (const unsigned base, const unsigned boost,
                   const unsigned opponents)
{
  if (opponents <= 1)
    return base;

  return base + boost * (opponents - 1);
}

} // namespace seabattle
