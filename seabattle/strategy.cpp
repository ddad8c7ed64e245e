// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "strategy.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace seabattle
{

namespace
{

/** Difficulty above which the AI follows up on its hits.  */
constexpr double HUNT_DIFFICULTY = 1.0;

/**
 * Returns the cells from available whose (row + column) is divisible by
 * the given modulus.
 */
std::vector<Coord>
ParityFilter (const std::vector<Coord>& available, const int modulus)
{
  std::vector<Coord> res;
  for (const auto& c : available)
    if ((c.GetRow () + c.GetColumn ()) % modulus == 0)
      res.push_back (c);

  return res;
}

std::vector<Coord>
RandomStrategy (const Board& board, const std::vector<Coord>& available)
{
  return available;
}

/**
 * Checkerboard pattern:  Every ship of size two or more covers at least
 * one cell of each colour.
 */
std::vector<Coord>
MethodicalStrategy (const Board& board, const std::vector<Coord>& available)
{
  return ParityFilter (available, 2);
}

/**
 * Every fourth diagonal first, which finds large ships with few shots,
 * then the checkerboard.
 */
std::vector<Coord>
OptimalStrategy (const Board& board, const std::vector<Coord>& available)
{
  auto res = ParityFilter (available, 4);
  if (res.empty ())
    res = ParityFilter (available, 2);

  return res;
}

/**
 * Works through the board quarter by quarter (top-left, top-right,
 * bottom-left, bottom-right), using the optimal pattern within each.
 */
std::vector<Coord>
QuarteringStrategy (const Board& board, const std::vector<Coord>& available)
{
  const int midRow = (board.GetRows () + 1) / 2;
  const int midCol = (board.GetColumns () + 1) / 2;

  for (int q = 0; q < 4; ++q)
    {
      const bool top = (q < 2);
      const bool left = (q % 2 == 0);

      std::vector<Coord> inQuarter;
      for (const auto& c : available)
        if ((c.GetRow () < midRow) == top && (c.GetColumn () < midCol) == left)
          inQuarter.push_back (c);

      if (!inQuarter.empty ())
        {
          auto res = OptimalStrategy (board, inQuarter);
          if (res.empty ())
            return inQuarter;
          return res;
        }
    }

  return {};
}

} // anonymous namespace

std::vector<Coord>
AvailableTargets (const Board& board, const std::set<Coord>& dontShoot)
{
  std::vector<Coord> res;
  for (int r = 0; r < board.GetRows (); ++r)
    for (int c = 0; c < board.GetColumns (); ++c)
      {
        const Coord coord(r, c);
        if (board.IsValidAttackTarget (coord) && dontShoot.count (coord) == 0)
          res.push_back (coord);
      }

  return res;
}

std::vector<Coord>
HuntCandidates (const std::vector<Coord>& available,
                const std::vector<Coord>& unresolvedHits)
{
  const std::set<Coord> availableSet(available.begin (), available.end ());
  const std::set<Coord> hits(unresolvedHits.begin (), unresolvedHits.end ());

  std::set<Coord> lines;
  std::set<Coord> neighbours;
  for (const auto& h : hits)
    for (const auto dir : ALL_DIRECTIONS)
      {
        const Coord n = h + dir;
        if (availableSet.count (n) == 0)
          continue;

        neighbours.insert (n);
        if (hits.count (h - dir) > 0)
          lines.insert (n);
      }

  const auto& chosen = (lines.empty () ? neighbours : lines);
  return std::vector<Coord> (chosen.begin (), chosen.end ());
}

bool
IsKnownStrategy (const std::string& tag)
{
  return tag == "random" || tag == "methodical" || tag == "optimal"
          || tag == "quartering";
}

TargetStrategy
MakeStrategy (const std::string& tag)
{
  if (tag == "methodical")
    return &MethodicalStrategy;
  if (tag == "optimal")
    return &OptimalStrategy;
  if (tag == "quartering")
    return &QuarteringStrategy;

  if (tag != "random")
    LOG (WARNING) << "Unknown AI strategy '" << tag << "', using random";
  return &RandomStrategy;
}

bool
ChooseTarget (const TargetingContext& ctx, const std::string& strategy,
              seautil::Random& rnd, Coord& out)
{
  const auto available = AvailableTargets (ctx.board, ctx.dontShoot);
  if (available.empty ())
    {
      VLOG (1) << "No targets available for AI";
      return false;
    }

  if (ctx.difficulty > HUNT_DIFFICULTY && !ctx.unresolvedHits.empty ())
    {
      const auto hunt = HuntCandidates (available, ctx.unresolvedHits);
      if (!hunt.empty ())
        {
          out = rnd.Pick (hunt);
          VLOG (1) << "AI hunting at " << out;
          return true;
        }
    }

  const auto preferred = MakeStrategy (strategy) (ctx.board, available);
  out = rnd.Pick (preferred.empty () ? available : preferred);
  VLOG (1) << "AI (" << strategy << ") targets " << out;

  return true;
}

} // namespace seabattle
