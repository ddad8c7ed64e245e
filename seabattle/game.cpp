// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "game.hpp"

#include "actions.hpp"
#include "eraconfig.hpp"
#include "gamestatejson.hpp"
#include "strategy.hpp"

#include <glog/logging.h>

#include <sstream>
#include <utility>

namespace seabattle
{

std::string
GameStateToString (const GameState s)
{
  switch (s)
    {
    case GameState::SETUP:
      return "setup";
    case GameState::PLACEMENT:
      return "placement";
    case GameState::PLAYING:
      return "playing";
    case GameState::FINISHED:
      return "finished";
    }

  LOG (FATAL) << "Invalid game state: " << static_cast<int> (s);
}

std::string
StatusToString (const Status s)
{
  switch (s)
    {
    case Status::OK:
      return "ok";
    case Status::VALIDATION:
      return "validation";
    case Status::RESOURCE_EXHAUSTED:
      return "resource-exhausted";
    case Status::STATE:
      return "state";
    case Status::TIMEOUT:
      return "timeout";
    case Status::CANCELLED:
      return "cancelled";
    }

  LOG (FATAL) << "Invalid status: " << static_cast<int> (s);
}

/**
 * RAII helper that marks the Game as busy while an action is processed.
 */
class Game::BusyLock
{

private:

  bool& flag;

public:

  explicit BusyLock (bool& f)
    : flag(f)
  {
    CHECK (!flag) << "Game is already busy";
    flag = true;
  }

  ~BusyLock ()
  {
    flag = false;
  }

  BusyLock (const BusyLock&) = delete;
  void operator= (const BusyLock&) = delete;

};

namespace
{

TerrainGrid
TerrainForEra (const proto::EraConfig& cfg)
{
  TerrainGrid res;
  CHECK (BuildTerrainGrid (cfg, res)) << "Invalid era config " << cfg.name ();
  return res;
}

} // anonymous namespace

Game::Game (const proto::EraConfig& cfg)
  : config(cfg), board(TerrainForEra (cfg)),
    placement(board, cfg.rules ().prevent_fleet_overlap ())
{
  for (int i = 0; i < config.alliances_size (); ++i)
    alliances.push_back (
        std::make_unique<Alliance> (i, config.alliances (i).name ()));

  /* Ship IDs start at one, so that zero can mean "none".  */
  shipArena.push_back (nullptr);
  shipOwner.push_back (0);
}

ActionResult
Game::Reject (const Status s, const std::string& msg)
{
  CHECK (s != Status::OK);
  LOG (WARNING) << "Rejected action (" << StatusToString (s) << "): " << msg;

  ActionResult res;
  res.status = s;
  res.message = msg;
  return res;
}

ActionResult
Game::CheckActionAllowed (const GameState required) const
{
  if (busy)
    return Reject (Status::STATE, "engine is busy");

  if (state != required)
    {
      std::ostringstream msg;
      msg << "action requires state " << GameStateToString (required)
          << ", but the game is in " << GameStateToString (state);
      return Reject (Status::STATE, msg.str ());
    }

  return ActionResult ();
}

void
Game::Complete (ActionResult& res, const std::string& msg)
{
  CHECK (res.IsOk ());
  CHECK (busy);

  res.message = msg;
  res.gameOver = (state == GameState::FINISHED);
  res.logEntry.turn = turnCount;
  res.logEntry.message = msg;
  res.logEntry.timestamp = std::chrono::system_clock::now ();
  eventLog.push_back (res.logEntry);
  LOG (INFO) << "Turn " << turnCount << ": " << msg;

  /* Callbacks may unregister themselves while being called.  */
  const auto cbs = callbacks;
  for (auto* cb : cbs)
    cb->StateChanged (res);

  if (res.gameOver)
    {
      const auto result = BuildMatchResult (*this);
      for (auto* cb : cbs)
        cb->MatchFinished (result);
    }
}

/* ************************************************************************** */

Player&
Game::AddPlayerInternal (
    std::unique_ptr<Player> p,
    const google::protobuf::RepeatedPtrField<proto::ShipConfig>& ships)
{
  CHECK_EQ (p->GetId (), players.size ());

  for (const auto& cfg : ships)
    {
      const ShipId id = shipArena.size ();
      auto& s = p->GetFleet ().AddShip (std::make_unique<Ship> (id, cfg));
      shipArena.push_back (&s);
      shipOwner.push_back (p->GetId ());
    }

  alliances[p->GetAlliance ()]->AddMember (*p);
  LOG (INFO)
      << "Added " << PlayerTypeToString (p->GetType ()) << " player "
      << p->GetName () << " (" << p->GetId () << ") to alliance "
      << alliances[p->GetAlliance ()]->GetName ();

  players.push_back (std::move (p));
  return *players.back ();
}

bool
Game::AddHuman (const std::string& name, const AllianceId alliance,
                PlayerId& id)
{
  if (busy || state != GameState::SETUP)
    {
      LOG (WARNING) << "Players can only be added during setup";
      return false;
    }
  if (alliance >= alliances.size ())
    {
      LOG (WARNING) << "Unknown alliance: " << alliance;
      return false;
    }
  if (config.max_players () > 0 && players.size () >= config.max_players ())
    {
      LOG (WARNING) << "Maximum number of players reached";
      return false;
    }

  id = players.size ();
  AddPlayerInternal (std::make_unique<HumanPlayer> (id, name, alliance),
                     config.alliances (alliance).ships ());
  return true;
}

bool
Game::AddAi (const proto::AiCaptain& captain, const AllianceId alliance,
             PlayerId& id)
{
  if (busy || state != GameState::SETUP)
    {
      LOG (WARNING) << "Players can only be added during setup";
      return false;
    }
  if (alliance >= alliances.size ())
    {
      LOG (WARNING) << "Unknown alliance: " << alliance;
      return false;
    }
  if (config.max_players () > 0 && players.size () >= config.max_players ())
    {
      LOG (WARNING) << "Maximum number of players reached";
      return false;
    }

  id = players.size ();
  const auto& ships = (captain.ships_size () > 0
                          ? captain.ships ()
                          : config.alliances (alliance).ships ());
  AddPlayerInternal (std::make_unique<AiPlayer> (id, captain.name (), alliance,
                                                 captain.strategy (),
                                                 captain.difficulty ()),
                     ships);
  return true;
}

unsigned
Game::AddConfiguredAi ()
{
  unsigned added = 0;
  for (int i = 0; i < config.alliances_size (); ++i)
    for (const auto& captain : config.alliances (i).ai_captains ())
      {
        PlayerId id;
        if (AddAi (captain, i, id))
          ++added;
      }

  return added;
}

ActionResult
Game::StartPlacement ()
{
  auto res = CheckActionAllowed (GameState::SETUP);
  if (!res.IsOk ())
    return res;
  BusyLock lock(busy);

  if (players.size () < 2)
    return Reject (Status::STATE, "at least two players are needed");

  unsigned populated = 0;
  for (const auto& a : alliances)
    if (!a->IsEmpty ())
      ++populated;
  if (populated < 2)
    return Reject (Status::STATE, "at least two alliances need players");

  const auto& mun = config.munitions ();
  for (auto& p : players)
    {
      unsigned opponents = 0;
      for (const auto& other : players)
        if (other->GetAlliance () != p->GetAlliance ())
          ++opponents;

      p->SetMunitions (
          MunitionWithBoost (mun.star_shells (), mun.star_shells_boost (),
                             opponents),
          MunitionWithBoost (mun.scatter_shot (), mun.scatter_shot_boost (),
                             opponents));
    }

  state = GameState::PLACEMENT;
  Complete (res, "Placement started");

  return res;
}

/* ************************************************************************** */

ActionResult
Game::LookupShip (const PlayerId playerId, const ShipId shipId, Ship*& ship)
{
  Player* p = GetPlayer (playerId);
  if (p == nullptr)
    return Reject (Status::VALIDATION, "unknown player");

  ship = p->GetFleet ().GetShip (shipId);
  if (ship == nullptr)
    return Reject (Status::VALIDATION,
                   "unknown ship " + std::to_string (shipId) + " for "
                      + p->GetName ());

  return ActionResult ();
}

const PlacementZone*
Game::GetZone (const PlayerId playerId, PlacementZone& buf) const
{
  if (GetPlacementZone (config, players[playerId]->GetAlliance (), buf))
    return &buf;

  return nullptr;
}

ActionResult
Game::FinishPlacement (const PlayerId playerId, const PlacementError err,
                       const std::string& what)
{
  if (err != PlacementError::NONE)
    return Reject (Status::VALIDATION, PlacementErrorToString (err));

  ActionResult res;
  Complete (res, players[playerId]->GetName () + " " + what);
  return res;
}

ActionResult
Game::PlaceShip (const PlayerId playerId, const ShipId shipId,
                 const Coord& start, const Direction dir)
{
  auto res = CheckActionAllowed (GameState::PLACEMENT);
  if (!res.IsOk ())
    return res;
  BusyLock lock(busy);

  Ship* ship;
  res = LookupShip (playerId, shipId, ship);
  if (!res.IsOk ())
    return res;

  PlacementZone zone;
  const auto err = placement.Place (players[playerId]->GetFleet (), *ship,
                                    start, dir, GetZone (playerId, zone));

  return FinishPlacement (playerId, err,
                          "placed " + ship->GetName () + " at "
                            + start.ToString () + " heading "
                            + DirectionToString (dir));
}

ActionResult
Game::PlaceShipByDrag (const PlayerId playerId, const ShipId shipId,
                       const Coord& start, const int dRows, const int dCols)
{
  auto res = CheckActionAllowed (GameState::PLACEMENT);
  if (!res.IsOk ())
    return res;
  BusyLock lock(busy);

  Ship* ship;
  res = LookupShip (playerId, shipId, ship);
  if (!res.IsOk ())
    return res;

  PlacementZone zone;
  const auto err
      = placement.PlaceByDrag (players[playerId]->GetFleet (), *ship, start,
                               dRows, dCols, GetZone (playerId, zone));

  return FinishPlacement (playerId, err,
                          "placed " + ship->GetName () + " at "
                            + start.ToString ());
}

ActionResult
Game::AutoPlace (const PlayerId playerId, seautil::Random& rnd)
{
  auto res = CheckActionAllowed (GameState::PLACEMENT);
  if (!res.IsOk ())
    return res;
  BusyLock lock(busy);

  Player* p = GetPlayer (playerId);
  if (p == nullptr)
    return Reject (Status::VALIDATION, "unknown player");
  Fleet& fleet = p->GetFleet ();

  std::vector<Ship*> before;
  for (const auto& s : fleet.GetShips ())
    if (!s->IsPlaced ())
      before.push_back (s.get ());

  PlacementZone zone;
  const auto failed = placement.AutoPlace (fleet, GetZone (playerId, zone),
                                           rnd);
  if (!failed.empty ())
    {
      /* Undo the ships placed by this call, so that a failed action
         leaves no trace.  */
      for (auto* s : before)
        if (s->IsPlaced ())
          placement.ResetShip (*s);

      std::ostringstream msg;
      msg << "no valid placement for ship";
      for (const auto id : failed)
        msg << " " << fleet.GetShip (id)->GetName ();
      return Reject (Status::VALIDATION, msg.str ());
    }

  Complete (res, p->GetName () + " auto-placed "
                    + std::to_string (before.size ()) + " ships");
  return res;
}

ActionResult
Game::AutoPlaceAi (seautil::Random& rnd)
{
  unsigned placed = 0;
  for (const auto& p : players)
    {
      if (p->GetType () != PlayerType::AI)
        continue;

      auto res = AutoPlace (p->GetId (), rnd);
      if (!res.IsOk ())
        return res;
      ++placed;
    }

  ActionResult res;
  res.message = "auto-placed " + std::to_string (placed) + " AI fleets";
  return res;
}

ActionResult
Game::ResetShip (const PlayerId playerId, const ShipId shipId)
{
  auto res = CheckActionAllowed (GameState::PLACEMENT);
  if (!res.IsOk ())
    return res;
  BusyLock lock(busy);

  Ship* ship;
  res = LookupShip (playerId, shipId, ship);
  if (!res.IsOk ())
    return res;

  if (!ship->IsPlaced ())
    return Reject (Status::VALIDATION, ship->GetName () + " is not placed");

  placement.ResetShip (*ship);
  Complete (res, players[playerId]->GetName () + " removed "
                    + ship->GetName ());
  return res;
}

ActionResult
Game::StartBattle (const PlayerId first)
{
  auto res = CheckActionAllowed (GameState::PLACEMENT);
  if (!res.IsOk ())
    return res;
  BusyLock lock(busy);

  if (GetPlayer (first) == nullptr)
    return Reject (Status::VALIDATION, "unknown first player");

  for (const auto& p : players)
    if (!p->GetFleet ().IsComplete ())
      return Reject (Status::STATE,
                     "fleet of " + p->GetName () + " is not complete");

  for (const auto& a : alliances)
    if (!a->IsEmpty () && a->IsDefeated ())
      return Reject (Status::STATE,
                     "alliance " + a->GetName () + " has no ships");

  if (players[first]->IsDefeated ())
    return Reject (Status::STATE,
                   players[first]->GetName () + " has no ships to fire with");

  state = GameState::PLAYING;
  turnIndex = first;
  Complete (res, "Battle started, " + players[first]->GetName ()
                    + " fires first");

  return res;
}

/* ************************************************************************** */

bool
Game::IsValidAttack (const PlayerId playerId, const Coord& target) const
{
  if (state != GameState::PLAYING)
    return false;

  const Player* p = GetPlayer (playerId);
  if (p == nullptr || p->IsDefeated ())
    return false;

  if (!config.rules ().simultaneous_fire () && playerId != turnIndex)
    return false;

  return board.IsValidAttackTarget (target) && p->CanShootAt (target);
}

namespace
{

/**
 * Returns true if the cell holds a not-yet destroyed ship cell of an
 * alliance other than the given one.
 */
bool
HasLiveEnemy (const Board& board, const std::vector<Ship*>& arena,
              const std::vector<std::unique_ptr<Player>>& players,
              const std::vector<PlayerId>& owners, const AllianceId own,
              const Coord& c)
{
  for (const auto& occ : board.GetOccupants (c))
    {
      if (players[owners[occ.ship]]->GetAlliance () == own)
        continue;
      if (!arena[occ.ship]->IsCellDestroyed (occ.cellIndex))
        return true;
    }

  return false;
}

} // anonymous namespace

ShotResult
Game::ResolveCell (Player& attacker, const Coord& cell)
{
  bool anyEnemy = false;
  bool hit = false;
  bool sunk = false;
  double multiplier = 1.0;

  for (const auto& occ : board.GetOccupants (cell))
    {
      Player& owner = *players[shipOwner[occ.ship]];
      if (owner.GetAlliance () == attacker.GetAlliance ())
        continue;
      anyEnemy = true;

      Ship& ship = *shipArena[occ.ship];
      if (ship.IsCellDestroyed (occ.cellIndex))
        continue;

      const ShotResult r = ship.Hit (occ.cellIndex);
      owner.RecordLoss (r);
      hit = true;

      if (attacker.GetType () == PlayerType::HUMAN
            && owner.GetType () == PlayerType::AI)
        multiplier = dynamic_cast<const AiPlayer&> (owner).GetDifficulty ();

      if (r == ShotResult::SUNK)
        {
          sunk = true;
          for (const auto& c : ship.GetCells ())
            attacker.MarkUnshootable (c);
          LOG (INFO)
              << attacker.GetName () << " sank " << ship.GetName ()
              << " of " << owner.GetName ();
        }
    }

  ShotResult res;
  if (sunk)
    res = ShotResult::SUNK;
  else if (hit)
    res = ShotResult::HIT;
  else if (anyEnemy)
    res = ShotResult::ALREADY_HIT;
  else
    {
      res = ShotResult::MISS;
      attacker.MarkUnshootable (cell);
    }

  attacker.RecordShotOutcome (res, multiplier);
  board.RecordShot ({cell, attacker.GetId (), res,
                     std::chrono::system_clock::now ()});
  VLOG (1)
      << attacker.GetName () << " at " << cell << ": "
      << ShotResultToString (res);

  return res;
}

ActionResult
Game::Fire (const PlayerId attacker, const FireOrder& order)
{
  auto res = CheckActionAllowed (GameState::PLAYING);
  if (!res.IsOk ())
    return res;
  BusyLock lock(busy);

  Player* p = GetPlayer (attacker);
  if (p == nullptr)
    return Reject (Status::VALIDATION, "unknown player");
  if (p->IsDefeated ())
    return Reject (Status::STATE, p->GetName () + " has no ships left");
  if (!config.rules ().simultaneous_fire () && attacker != turnIndex)
    return Reject (Status::STATE, "it is not the turn of " + p->GetName ());

  const Coord& target = order.target;
  if (!board.IsValidAttackTarget (target))
    return Reject (Status::VALIDATION,
                   "invalid target " + target.ToString ());

  /* Determine the cells affected and check munition supply.  Nothing
     is changed until all checks have passed.  */
  std::vector<Coord> cells;
  Ship* launcher = nullptr;
  switch (order.munition)
    {
    case Munition::SHOT:
      if (!p->CanShootAt (target))
        return Reject (Status::VALIDATION,
                       "cannot fire at " + target.ToString () + " again");
      cells.push_back (target);
      break;

    case Munition::SCATTER_SHOT:
      if (!p->CanShootAt (target))
        return Reject (Status::VALIDATION,
                       "cannot fire at " + target.ToString () + " again");
      if (p->GetScatterShots () == 0)
        return Reject (Status::RESOURCE_EXHAUSTED, "no scatter shots left");
      for (const auto& c : ScatterPattern (target))
        if (board.IsValidAttackTarget (c) && p->CanShootAt (c))
          cells.push_back (c);
      break;

    case Munition::STAR_SHELL:
      if (p->GetStarShells () == 0)
        return Reject (Status::RESOURCE_EXHAUSTED, "no star shells left");
      for (const auto& c : StarShellArea (target))
        if (board.IsValidAttackTarget (c))
          cells.push_back (c);
      break;

    case Munition::TORPEDO:
      if (!p->CanShootAt (target))
        return Reject (Status::VALIDATION,
                       "cannot fire at " + target.ToString () + " again");
      launcher = p->FindTorpedoLauncher (order.submarine);
      if (launcher == nullptr)
        return Reject (Status::RESOURCE_EXHAUSTED,
                       "no submarine with torpedoes available");
      cells = TorpedoPath (board, target, order.heading,
                           config.torpedo_range ());
      if (cells.empty ())
        return Reject (Status::VALIDATION,
                       "torpedo cannot run from " + target.ToString ());
      break;

    default:
      LOG (FATAL) << "Invalid munition: " << static_cast<int> (order.munition);
    }

  std::ostringstream msg;
  msg << p->GetName () << " fired " << MunitionToString (order.munition)
      << " at " << target;

  const AllianceId own = p->GetAlliance ();
  bool anyHit = false;
  bool anyMiss = (order.munition == Munition::STAR_SHELL);
  if (order.munition == Munition::STAR_SHELL)
    {
      CHECK (p->UseStarShell ());
      for (const auto& c : cells)
        if (HasLiveEnemy (board, shipArena, players, shipOwner, own, c))
          {
            p->Reveal (c);
            res.revealed.push_back (c);
          }
      msg << ": revealed " << res.revealed.size () << " cells";
    }
  else
    {
      if (order.munition == Munition::SCATTER_SHOT)
        CHECK (p->UseScatterShot ());
      else if (order.munition == Munition::TORPEDO)
        {
          CHECK (launcher->UseTorpedo ());

          /* The torpedo strikes the first live enemy cell on its path,
             or runs out at the last one.  */
          Coord impact = cells.back ();
          for (const auto& c : cells)
            if (HasLiveEnemy (board, shipArena, players, shipOwner, own, c))
              {
                impact = c;
                break;
              }
          cells = {impact};
        }

      for (const auto& c : cells)
        {
          const ShotResult r = ResolveCell (*p, c);
          res.affected.push_back ({c, r});
          anyHit = anyHit || IsHit (r);
          anyMiss = anyMiss || r == ShotResult::MISS;
          msg << (cells.size () > 1 ? " " + c.ToString () : "") << ": "
              << ShotResultToString (r);
        }
    }

  EvaluateWin ();

  if (state == GameState::PLAYING)
    {
      const auto& rules = config.rules ();
      /* Cells that were already hit before neither count as hit nor as
         miss, so they never grant another shot.  */
      bool extra = false;
      if (anyHit)
        extra = rules.turn_on_hit ();
      else if (anyMiss)
        extra = rules.turn_on_miss ();

      const PlayerId before = turnIndex;
      if ((!extra && attacker == turnIndex)
            || players[turnIndex]->IsDefeated ())
        AdvanceTurn ();
      res.turnAdvanced = (turnIndex != before);
    }
  else
    {
      AllianceId w;
      if (GetWinner (w))
        msg << "; " << alliances[w]->GetDisplayName () << " won";
      else
        msg << "; the match is a draw";
    }

  Complete (res, msg.str ());
  return res;
}

void
Game::AdvanceTurn ()
{
  const size_t n = players.size ();
  for (size_t i = 1; i <= n; ++i)
    {
      const PlayerId next = (turnIndex + i) % n;
      if (players[next]->IsDefeated ())
        continue;

      if (next != turnIndex)
        {
          turnIndex = next;
          ++turnCount;
          VLOG (1) << "Turn passes to " << players[next]->GetName ();
        }
      return;
    }
}

void
Game::EvaluateWin ()
{
  std::vector<AllianceId> alive;
  for (const auto& a : alliances)
    if (!a->IsEmpty () && !a->IsDefeated ())
      alive.push_back (a->GetId ());

  if (alive.size () > 1)
    return;

  state = GameState::FINISHED;
  if (alive.empty ())
    {
      LOG (INFO) << "Match finished in a draw";
      return;
    }

  hasWinner = true;
  winner = alive.front ();
  LOG (INFO)
      << "Match finished, winner: " << alliances[winner]->GetDisplayName ();
}

ActionResult
Game::ProcessAction (const PlayerId actor, const proto::Action& action,
                     seautil::Random& rnd)
{
  VLOG (1) << "Action from player " << actor << ": "
           << ActionToString (action);

  switch (action.action_case ())
    {
    case proto::Action::kPlaceShip:
      {
        const auto& place = action.place_ship ();
        const Coord start(place.row (), place.col ());

        Direction dir;
        if (DirectionFromProto (place.direction (), dir))
          return PlaceShip (actor, place.ship_id (), start, dir);

        return PlaceShipByDrag (actor, place.ship_id (), start,
                                place.drag_rows (), place.drag_cols ());
      }

    case proto::Action::kAutoPlace:
      return AutoPlace (actor, rnd);

    case proto::Action::kResetShip:
      return ResetShip (actor, action.reset_ship ().ship_id ());

    case proto::Action::kFire:
      return Fire (actor, FireOrderFromProto (action.fire ()));

    case proto::Action::ACTION_NOT_SET:
      return Reject (Status::VALIDATION, "empty action");
    }

  LOG (FATAL) << "Invalid action case: " << action.action_case ();
}

std::vector<Coord>
Game::GetUnresolvedHits (const Player& p) const
{
  std::set<Coord> res;
  for (const auto& shot : board.GetShotHistory ())
    {
      if (shot.attacker != p.GetId () || !IsHit (shot.result))
        continue;

      for (const auto& occ : board.GetOccupants (shot.target))
        {
          if (players[shipOwner[occ.ship]]->GetAlliance ()
                == p.GetAlliance ())
            continue;
          if (!shipArena[occ.ship]->IsSunk ())
            res.insert (shot.target);
        }
    }

  return std::vector<Coord> (res.begin (), res.end ());
}

ActionResult
Game::AdvanceAi (seautil::Random& rnd)
{
  auto res = CheckActionAllowed (GameState::PLAYING);
  if (!res.IsOk ())
    return res;

  const Player& p = *players[turnIndex];
  if (p.GetType () != PlayerType::AI)
    return Reject (Status::STATE, p.GetName () + " is not an AI");
  const auto& ai = dynamic_cast<const AiPlayer&> (p);

  /* Besides the dont-shoot cells, the AI also skips cells it has already
     attacked unless there is still something alive there.  */
  std::set<Coord> avoid = p.GetDontShoot ();
  for (const auto& shot : board.GetShotHistory ())
    if (shot.attacker == p.GetId ()
          && !HasLiveEnemy (board, shipArena, players, shipOwner,
                            p.GetAlliance (), shot.target))
      avoid.insert (shot.target);

  const TargetingContext ctx{board, avoid, GetUnresolvedHits (p),
                             ai.GetDifficulty ()};

  Coord target;
  if (!ChooseTarget (ctx, ai.GetStrategy (), rnd, target))
    return Reject (Status::RESOURCE_EXHAUSTED,
                   "no targets left for " + p.GetName ());

  FireOrder order;
  order.target = target;

  return Fire (p.GetId (), order);
}

ActionResult
Game::AdvanceHuman (const std::chrono::milliseconds timeout)
{
  auto res = CheckActionAllowed (GameState::PLAYING);
  if (!res.IsOk ())
    return res;

  Player& p = *players[turnIndex];
  if (p.GetType () != PlayerType::HUMAN)
    return Reject (Status::STATE, p.GetName () + " is not human");
  auto& human = dynamic_cast<HumanPlayer&> (p);

  FireOrder order;
  TargetRequest::Outcome outcome;
  {
    BusyLock lock(busy);
    outcome = human.GetTargetRequest ().Await (timeout, order);
  }

  switch (outcome)
    {
    case TargetRequest::Outcome::SELECTED:
      break;

    case TargetRequest::Outcome::TIMEOUT:
      return Reject (Status::TIMEOUT,
                     p.GetName () + " did not choose a target in time");

    case TargetRequest::Outcome::CANCELLED:
      return Reject (Status::CANCELLED,
                     "target request of " + p.GetName () + " was cancelled");
    }

  return Fire (p.GetId (), order);
}

/* ************************************************************************** */

Player*
Game::GetPlayer (const PlayerId id)
{
  if (id >= players.size ())
    return nullptr;

  return players[id].get ();
}

const Player*
Game::GetPlayer (const PlayerId id) const
{
  if (id >= players.size ())
    return nullptr;

  return players[id].get ();
}

const Player*
Game::GetCurrentPlayer () const
{
  if (state != GameState::PLAYING)
    return nullptr;

  return players[turnIndex].get ();
}

bool
Game::GetWinner (AllianceId& out) const
{
  if (!hasWinner)
    return false;

  out = winner;
  return true;
}

const Ship*
Game::GetShip (const ShipId id) const
{
  if (id == 0 || id >= shipArena.size ())
    return nullptr;

  return shipArena[id];
}

PlayerId
Game::GetShipOwner (const ShipId id) const
{
  CHECK (GetShip (id) != nullptr) << "Unknown ship " << id;
  return shipOwner[id];
}

void
Game::Reset ()
{
  CHECK (!busy) << "Game reset while processing an action";

  alliances.clear ();
  for (int i = 0; i < config.alliances_size (); ++i)
    alliances.push_back (
        std::make_unique<Alliance> (i, config.alliances (i).name ()));

  board.Clear ();
  players.clear ();
  shipArena.resize (1);
  shipOwner.resize (1);

  state = GameState::SETUP;
  turnIndex = 0;
  turnCount = 0;
  hasWinner = false;
  winner = 0;
  eventLog.clear ();

  LOG (INFO) << "Game reset to setup";
}

void
Game::RegisterCallback (Callbacks& cb)
{
  callbacks.insert (&cb);
}

void
Game::UnregisterCallback (Callbacks& cb)
{
  callbacks.erase (&cb);
}

} // namespace seabattle
