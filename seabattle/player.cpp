// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "player.hpp"

#include <glog/logging.h>

namespace seabattle
{

std::string
PlayerTypeToString (const PlayerType t)
{
  switch (t)
    {
    case PlayerType::HUMAN:
      return "human";
    case PlayerType::AI:
      return "ai";
    }

  LOG (FATAL) << "Invalid player type: " << static_cast<int> (t);
}

double
PlayerStats::GetAccuracy () const
{
  if (shots == 0)
    return 0.0;

  return static_cast<double> (hits) / shots;
}

Player::Player (const PlayerId i, const std::string& n, const AllianceId a)
  : id(i), name(n), alliance(a), fleet(i)
{}

bool
Player::CanShootAt (const Coord& c) const
{
  return dontShoot.count (c) == 0;
}

void
Player::MarkUnshootable (const Coord& c)
{
  dontShoot.insert (c);
}

void
Player::RecordShotOutcome (const ShotResult res, const double scoreMultiplier)
{
  ++stats.shots;
  switch (res)
    {
    case ShotResult::MISS:
      ++stats.misses;
      break;

    case ShotResult::HIT:
      ++stats.hits;
      stats.score += SCORE_PER_HIT * scoreMultiplier;
      break;

    case ShotResult::SUNK:
      ++stats.hits;
      ++stats.sunk;
      stats.score += (SCORE_PER_HIT + SCORE_PER_SINK) * scoreMultiplier;
      break;

    case ShotResult::ALREADY_HIT:
      break;

    default:
      LOG (FATAL) << "Invalid shot result: " << static_cast<int> (res);
    }
}

void
Player::RecordLoss (const ShotResult res)
{
  switch (res)
    {
    case ShotResult::HIT:
      ++stats.hitsTaken;
      break;

    case ShotResult::SUNK:
      ++stats.hitsTaken;
      ++stats.shipsLost;
      break;

    default:
      break;
    }
}

void
Player::SetMunitions (const unsigned star, const unsigned scatter)
{
  starShells = star;
  scatterShots = scatter;
}

bool
Player::UseStarShell ()
{
  if (starShells == 0)
    return false;

  --starShells;
  return true;
}

bool
Player::UseScatterShot ()
{
  if (scatterShots == 0)
    return false;

  --scatterShots;
  return true;
}

Ship*
Player::FindTorpedoLauncher (const ShipId preferred)
{
  for (const auto& s : fleet.GetShips ())
    {
      if (preferred != 0 && s->GetId () != preferred)
        continue;
      if (s->IsSubmarine () && !s->IsSunk () && s->GetTorpedoes () > 0)
        return s.get ();
    }

  return nullptr;
}

} // namespace seabattle
