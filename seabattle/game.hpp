// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_GAME_HPP
#define SEABATTLE_GAME_HPP

#include "alliance.hpp"
#include "board.hpp"
#include "coord.hpp"
#include "munitions.hpp"
#include "placement.hpp"
#include "player.hpp"
#include "types.hpp"

#include "proto/action.pb.h"
#include "proto/config.pb.h"
#include "proto/stats.pb.h"

#include <seautil/random.hpp>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace seabattle
{

/**
 * Phases of a match.  Transitions are only forward, except for an
 * explicit reset.
 */
enum class GameState
{
  SETUP,
  PLACEMENT,
  PLAYING,
  FINISHED,
};

std::string GameStateToString (GameState s);

/**
 * Status of an action.  Anything except OK means that the action was
 * rejected and nothing was changed.
 */
enum class Status
{
  OK,

  /** Bad coordinates, terrain, overlap or malformed actions.  */
  VALIDATION,

  /** Out of munitions or AI targets.  */
  RESOURCE_EXHAUSTED,

  /** Wrong phase, wrong turn or busy engine.  */
  STATE,

  /** A human target request timed out.  */
  TIMEOUT,

  /** A human target request was cancelled.  */
  CANCELLED,
};

std::string StatusToString (Status s);

/**
 * Entry in the event log of a match.
 */
struct EventLogEntry
{
  unsigned turn;
  std::string message;
  std::chrono::system_clock::time_point timestamp;
};

/**
 * Outcome of an attack on a single cell.
 */
struct CellOutcome
{
  Coord cell;
  ShotResult result;
};

/**
 * Result of an action processed by the Game.
 */
struct ActionResult
{

  Status status = Status::OK;

  /** Reason for a rejection, or a summary on success.  */
  std::string message;

  /** Per-cell outcomes of an attack.  */
  std::vector<CellOutcome> affected;

  /** Cells with enemy ships revealed by a star shell.  */
  std::vector<Coord> revealed;

  /** The event log entry created for a successful action.  */
  EventLogEntry logEntry;

  /** Whether the turn moved on to another player.  */
  bool turnAdvanced = false;

  /** Whether the match is finished after this action.  */
  bool gameOver = false;

  bool
  IsOk () const
  {
    return status == Status::OK;
  }

};

/**
 * A single naval-combat match.  The Game owns the board and all players,
 * runs the phase state machine and resolves attacks.  It is not thread-safe;
 * all actions must come from one thread, and are applied one at a time.
 * Only the resolution of human target requests (see AdvanceHuman) involves
 * another thread.
 */
class Game
{

public:

  class Callbacks;

private:

  /** The era this match is played in.  */
  const proto::EraConfig config;

  Board board;
  PlacementEngine placement;

  GameState state = GameState::SETUP;

  /** All players, indexed by their ID.  */
  std::vector<std::unique_ptr<Player>> players;

  /** The alliances, indexed by ID (order in the config).  */
  std::vector<std::unique_ptr<Alliance>> alliances;

  /**
   * All ships of the match, indexed by ShipId.  The ships themselves are
   * owned by the fleets.  Entry zero is unused.
   */
  std::vector<Ship*> shipArena;

  /** Owner of each ship, indexed like shipArena.  */
  std::vector<PlayerId> shipOwner;

  /** Index of the player whose turn it is.  */
  PlayerId turnIndex = 0;

  /** Number of turn changes so far.  */
  unsigned turnCount = 0;

  bool hasWinner = false;
  AllianceId winner = 0;

  std::vector<EventLogEntry> eventLog;

  /** Set while an action is processed (including callbacks).  */
  bool busy = false;

  std::set<Callbacks*> callbacks;

  class BusyLock;

  /**
   * Returns a rejection result with the given status and message.
   */
  static ActionResult Reject (Status s, const std::string& msg);

  /**
   * Checks that we are in the given state and not busy.  Returns OK
   * or a rejection.
   */
  ActionResult CheckActionAllowed (GameState required) const;

  /**
   * Adds a player with its fleet built from the given ship configs.
   */
  Player& AddPlayerInternal (std::unique_ptr<Player> p,
                             const google::protobuf::RepeatedPtrField<
                                 proto::ShipConfig>& ships);

  /**
   * Looks up a player and one of its ships for a placement action.
   */
  ActionResult LookupShip (PlayerId playerId, ShipId shipId, Ship*& ship);

  /**
   * Returns the placement zone of the player, or null.
   */
  const PlacementZone* GetZone (PlayerId playerId, PlacementZone& buf) const;

  /**
   * Converts a placement error to an action result.
   */
  ActionResult FinishPlacement (PlayerId playerId, PlacementError err,
                                const std::string& what);

  /**
   * Resolves a damaging attack on one cell.
   */
  ShotResult ResolveCell (Player& attacker, const Coord& cell);

  /**
   * Moves the turn to the next player whose fleet is not defeated.
   */
  void AdvanceTurn ();

  /**
   * Checks whether one alliance is left and finishes the game if so.
   */
  void EvaluateWin ();

  /**
   * Computes the cells where the given player hit ships that are not yet
   * sunk.
   */
  std::vector<Coord> GetUnresolvedHits (const Player& p) const;

  /**
   * Appends to the event log, fills in the entry on the result and notifies
   * the callbacks.
   */
  void Complete (ActionResult& res, const std::string& msg);

public:

  /**
   * Constructs a match in setup state for the given era.  The config must be
   * valid (see ValidateEraConfig).
   */
  explicit Game (const proto::EraConfig& cfg);

  Game (const Game&) = delete;
  void operator= (const Game&) = delete;

  const proto::EraConfig&
  GetConfig () const
  {
    return config;
  }

  GameState
  GetState () const
  {
    return state;
  }

  const Board&
  GetBoard () const
  {
    return board;
  }

  /* Setup phase.  */

  /**
   * Adds a human player to an alliance, with the alliance's fleet.  Returns
   * false if this is not possible (wrong state, unknown alliance or too many
   * players).
   */
  bool AddHuman (const std::string& name, AllianceId alliance, PlayerId& id);

  /**
   * Adds an AI player for the given captain config.  The captain's own
   * ships are used as fleet if present, otherwise the alliance's.
   */
  bool AddAi (const proto::AiCaptain& captain, AllianceId alliance,
              PlayerId& id);

  /**
   * Adds all AI captains of the era config.  Returns the number of
   * captains added.
   */
  unsigned AddConfiguredAi ();

  /**
   * Moves from setup to placement.  Requires at least two players in at
   * least two alliances.  Limited munitions are handed out.
   */
  ActionResult StartPlacement ();

  /* Placement phase.  */

  ActionResult PlaceShip (PlayerId playerId, ShipId shipId,
                          const Coord& start, Direction dir);

  ActionResult PlaceShipByDrag (PlayerId playerId, ShipId shipId,
                                const Coord& start, int dRows, int dCols);

  /**
   * Places all remaining ships of the player randomly.  If some cannot be
   * placed, the ships placed by this call are removed again and a VALIDATION
   * result lists the failures.
   */
  ActionResult AutoPlace (PlayerId playerId, seautil::Random& rnd);

  /**
   * Auto-places the fleets of all AI players.
   */
  ActionResult AutoPlaceAi (seautil::Random& rnd);

  ActionResult ResetShip (PlayerId playerId, ShipId shipId);

  /**
   * Moves from placement to playing, with the given first player.
   * Requires every fleet to be complete.
   */
  ActionResult StartBattle (PlayerId first);

  /* Playing phase.  */

  /**
   * Returns true if the player could currently fire a regular shot
   * at the given cell.
   */
  bool IsValidAttack (PlayerId playerId, const Coord& target) const;

  ActionResult Fire (PlayerId attacker, const FireOrder& order);

  /**
   * Processes an action of any kind.  The random instance is used for
   * auto placement.
   */
  ActionResult ProcessAction (PlayerId actor, const proto::Action& action,
                              seautil::Random& rnd);

  /**
   * Lets the current player, which must be an AI, choose a target and fire.
   */
  ActionResult AdvanceAi (seautil::Random& rnd);

  /**
   * Waits for the current player, which must be human, to supply a target
   * through its TargetRequest and fires a shot there.  A timeout or
   * cancellation yields the corresponding status without any change.
   */
  ActionResult AdvanceHuman (std::chrono::milliseconds timeout);

  /* Queries.  */

  const std::vector<std::unique_ptr<Player>>&
  GetPlayers () const
  {
    return players;
  }

  /**
   * Returns the player with the given ID or null.
   */
  Player* GetPlayer (PlayerId id);
  const Player* GetPlayer (PlayerId id) const;

  const std::vector<std::unique_ptr<Alliance>>&
  GetAlliances () const
  {
    return alliances;
  }

  /**
   * Returns the player whose turn it is, or null if not playing.
   */
  const Player* GetCurrentPlayer () const;

  unsigned
  GetTurnCount () const
  {
    return turnCount;
  }

  /**
   * Returns true if the match finished with a winner, which is then
   * returned in the output.
   */
  bool GetWinner (AllianceId& out) const;

  const std::vector<EventLogEntry>&
  GetEventLog () const
  {
    return eventLog;
  }

  /**
   * Looks up a ship of the match by ID.  Returns null if there is none.
   */
  const Ship* GetShip (ShipId id) const;

  /**
   * Returns the owner of a ship, which must exist.
   */
  PlayerId GetShipOwner (ShipId id) const;

  /**
   * Returns to setup state, removing all players and clearing the board.
   */
  void Reset ();

  void RegisterCallback (Callbacks& cb);
  void UnregisterCallback (Callbacks& cb);

};

/**
 * Interface for callbacks invoked by the Game after actions.  They are
 * called while the Game is busy, so they cannot start new actions.
 */
class Game::Callbacks
{

public:

  Callbacks () = default;
  virtual ~Callbacks () = default;

  /**
   * Invoked after every successfully completed action.
   */
  virtual void
  StateChanged (const ActionResult& res)
  {}

  /**
   * Invoked once when the match finishes, with the statistics payload
   * for every human player.
   */
  virtual void
  MatchFinished (const proto::MatchResult& result)
  {}

};

} // namespace seabattle

#endif // SEABATTLE_GAME_HPP
