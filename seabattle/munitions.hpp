// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_MUNITIONS_HPP
#define SEABATTLE_MUNITIONS_HPP

#include "board.hpp"
#include "coord.hpp"
#include "types.hpp"

#include "proto/action.pb.h"

#include <string>
#include <vector>

namespace seabattle
{

/**
 * Kinds of munitions a player can fire.
 */
enum class Munition
{

  /** Regular single-cell shot.  Unlimited.  */
  SHOT,

  /** Centre cell plus its four orthogonal neighbours.  */
  SCATTER_SHOT,

  /** Reveals a 3x3 area without doing damage.  */
  STAR_SHELL,

  /** Runs along a line of water cells from a submarine.  */
  TORPEDO,

};

Munition MunitionFromProto (proto::MunitionType m);

std::string MunitionToString (Munition m);

/**
 * Returns the cells hit by a scatter shot at the given centre, with the
 * centre first.  Cells may be off the board.
 */
std::vector<Coord> ScatterPattern (const Coord& centre);

/**
 * Returns the 3x3 area lit by a star shell in row-major order.  Cells may be
 * off the board.
 */
std::vector<Coord> StarShellArea (const Coord& centre);

/**
 * Returns the cells a torpedo runs through when launched at the given
 * start cell.  The run includes the start and continues along the heading
 * for at most range cells in total, stopping before leaving the board
 * or entering non-navigable terrain.  The result is empty if the start
 * itself is not navigable water.
 */
std::vector<Coord> TorpedoPath (const Board& board, const Coord& start,
                                Direction heading, unsigned range);

/**
 * Computes the starting balance of a limited munition.  With more than
 * one opponent, each additional opponent adds the boost.
 */
unsigned MunitionWithBoost (unsigned base, unsigned boost,
                            unsigned opponents);

/**
 * An order to fire a munition.
 */
struct FireOrder
{

  Coord target;
  Munition munition = Munition::SHOT;

  /** Direction in which a torpedo runs.  */
  Direction heading = Direction::RIGHT;

  /** Submarine that should launch a torpedo, or zero for any.  */
  ShipId submarine = 0;

};

} // namespace seabattle

#endif // SEABATTLE_MUNITIONS_HPP
