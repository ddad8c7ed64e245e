// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_TYPES_HPP
#define SEABATTLE_TYPES_HPP

#include <string>

namespace seabattle
{

/** Identifier of a ship within one match.  */
using ShipId = unsigned;

/** Identifier of a player within one match.  */
using PlayerId = unsigned;

/** Identifier (index) of an alliance within one match.  */
using AllianceId = unsigned;

/**
 * Result of a shot at a single cell.
 */
enum class ShotResult
{
  MISS,
  HIT,
  ALREADY_HIT,
  SUNK,
};

/**
 * Returns true if the result counts as a hit for turn and statistics
 * purposes (i.e. HIT or SUNK).
 */
bool IsHit (ShotResult res);

/**
 * Returns the lower-case name of a shot result, as used in the event
 * log and JSON state.
 */
std::string ShotResultToString (ShotResult res);

} // namespace seabattle

#endif // SEABATTLE_TYPES_HPP
