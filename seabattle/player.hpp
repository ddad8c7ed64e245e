// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_PLAYER_HPP
#define SEABATTLE_PLAYER_HPP

#include "coord.hpp"
#include "fleet.hpp"
#include "targetrequest.hpp"
#include "types.hpp"

#include <set>
#include <string>

namespace seabattle
{

/** Score for hitting a ship cell.  */
constexpr double SCORE_PER_HIT = 1.0;
/** Additional score for sinking a ship.  */
constexpr double SCORE_PER_SINK = 10.0;

/**
 * Kind of turn participant.
 */
enum class PlayerType
{
  HUMAN,
  AI,
};

std::string PlayerTypeToString (PlayerType t);

/**
 * Running statistics of one player in a match.
 */
struct PlayerStats
{

  unsigned shots = 0;
  unsigned hits = 0;
  unsigned misses = 0;
  unsigned sunk = 0;

  /** Hits taken on own ships.  */
  unsigned hitsTaken = 0;
  /** Own ships sunk by opponents.  */
  unsigned shipsLost = 0;

  double score = 0.0;

  /**
   * Returns the fraction of shots that were hits, or zero if no shots
   * have been made.
   */
  double GetAccuracy () const;

};

/**
 * A participant in a match.  Each player owns a fleet and keeps track of
 * statistics, the cells it should no longer shoot at and its supply of
 * limited munitions.  Subclasses define how targets are chosen.
 */
class Player
{

private:

  const PlayerId id;
  const std::string name;
  const AllianceId alliance;

  Fleet fleet;

  PlayerStats stats;

  /** Cells that this player may not (or need not) fire at anymore.  */
  std::set<Coord> dontShoot;

  /** Cells with live enemy ships revealed by star shells.  */
  std::set<Coord> revealed;

  unsigned starShells = 0;
  unsigned scatterShots = 0;

protected:

  explicit Player (PlayerId i, const std::string& n, AllianceId a);

public:

  virtual ~Player () = default;

  Player (const Player&) = delete;
  void operator= (const Player&) = delete;

  virtual PlayerType GetType () const = 0;

  PlayerId
  GetId () const
  {
    return id;
  }

  const std::string&
  GetName () const
  {
    return name;
  }

  AllianceId
  GetAlliance () const
  {
    return alliance;
  }

  Fleet&
  GetFleet ()
  {
    return fleet;
  }

  const Fleet&
  GetFleet () const
  {
    return fleet;
  }

  const PlayerStats&
  GetStats () const
  {
    return stats;
  }

  bool
  IsDefeated () const
  {
    return fleet.IsDefeated ();
  }

  /**
   * Returns true if the player is still allowed to fire at the given cell.
   */
  bool CanShootAt (const Coord& c) const;

  /**
   * Adds a cell to the set of cells the player may not fire at.
   */
  void MarkUnshootable (const Coord& c);

  const std::set<Coord>&
  GetDontShoot () const
  {
    return dontShoot;
  }

  /**
   * Updates the statistics for the outcome of a shot at one cell fired by
   * this player.  The score awarded is scaled by the multiplier.
   */
  void RecordShotOutcome (ShotResult res, double scoreMultiplier = 1.0);

  /**
   * Updates the loss counters for a hit taken on one of our ships.
   */
  void RecordLoss (ShotResult res);

  void
  Reveal (const Coord& c)
  {
    revealed.insert (c);
  }

  const std::set<Coord>&
  GetRevealed () const
  {
    return revealed;
  }

  unsigned
  GetStarShells () const
  {
    return starShells;
  }

  unsigned
  GetScatterShots () const
  {
    return scatterShots;
  }

  void SetMunitions (unsigned star, unsigned scatter);

  /**
   * Consumes one star shell.  Returns false if there are none left.
   */
  bool UseStarShell ();

  /**
   * Consumes one scatter shot.  Returns false if there are none left.
   */
  bool UseScatterShot ();

  /**
   * Finds a submarine of this player that is afloat and has torpedoes.
   * If preferred is non-zero, only the ship with that ID qualifies.
   * Returns null if there is none.
   */
  Ship* FindTorpedoLauncher (ShipId preferred);

};

/**
 * A human player.  Targets are requested through a TargetRequest that
 * the UI layer resolves.
 */
class HumanPlayer : public Player
{

private:

  TargetRequest request;

public:

  explicit HumanPlayer (const PlayerId i, const std::string& n,
                        const AllianceId a)
    : Player(i, n, a)
  {}

  PlayerType
  GetType () const override
  {
    return PlayerType::HUMAN;
  }

  TargetRequest&
  GetTargetRequest ()
  {
    return request;
  }

};

/**
 * A computer-controlled player.  Targets are selected by a strategy
 * (see strategy.hpp) with the configured difficulty.
 */
class AiPlayer : public Player
{

private:

  const std::string strategy;
  const double difficulty;

public:

  explicit AiPlayer (const PlayerId i, const std::string& n,
                     const AllianceId a, const std::string& s, const double d)
    : Player(i, n, a), strategy(s), difficulty(d)
  {}

  PlayerType
  GetType () const override
  {
    return PlayerType::AI;
  }

  const std::string&
  GetStrategy () const
  {
    return strategy;
  }

  double
  GetDifficulty () const
  {
    return difficulty;
  }

};

} // namespace seabattle

#endif // SEABATTLE_PLAYER_HPP
