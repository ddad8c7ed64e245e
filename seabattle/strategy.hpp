// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_STRATEGY_HPP
#define SEABATTLE_STRATEGY_HPP

#include "board.hpp"
#include "coord.hpp"

#include <seautil/random.hpp>

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace seabattle
{

/**
 * Everything an AI needs to know to choose its next target.
 */
struct TargetingContext
{

  const Board& board;

  /** Cells the AI may not fire at.  */
  const std::set<Coord>& dontShoot;

  /** Cells where the AI hit a ship that is not yet sunk.  */
  std::vector<Coord> unresolvedHits;

  double difficulty;

};

/**
 * A targeting strategy.  Given the available targets (never empty), it
 * returns the subset that should be preferred.  If that is empty, any
 * available target is used.
 */
using TargetStrategy
    = std::function<std::vector<Coord> (const Board& board,
                                        const std::vector<Coord>& available)>;

/**
 * Returns all cells that are valid attack targets and not in the
 * dont-shoot set, in row-major order.
 */
std::vector<Coord> AvailableTargets (const Board& board,
                                     const std::set<Coord>& dontShoot);

/**
 * Returns the available cells orthogonally next to unresolved hits.
 * If some of them extend a line of two hits, only those are returned.
 */
std::vector<Coord> HuntCandidates (const std::vector<Coord>& available,
                                   const std::vector<Coord>& unresolvedHits);

/**
 * Returns true if the tag names a known strategy.
 */
bool IsKnownStrategy (const std::string& tag);

/**
 * Constructs the strategy for a tag.  Unknown tags yield the random
 * strategy.
 */
TargetStrategy MakeStrategy (const std::string& tag);

/**
 * Chooses the next target of an AI.  With a difficulty above one, cells next
 * to unresolved hits are preferred over the strategy.  Returns false if
 * there is no target available at all.
 */
bool ChooseTarget (const TargetingContext& ctx, const std::string& strategy,
                   seautil::Random& rnd, Coord& out);

} // namespace seabattle

#endif // SEABATTLE_STRATEGY_HPP
