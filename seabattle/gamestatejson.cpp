// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "gamestatejson.hpp"

#include <glog/logging.h>

#include <chrono>

namespace seabattle
{

Json::Value
CoordToJson (const Coord& c)
{
  Json::Value res(Json::objectValue);
  res["row"] = c.GetRow ();
  res["col"] = c.GetColumn ();

  return res;
}

namespace
{

Json::Value
StatsToJson (const Player& p)
{
  const auto& stats = p.GetStats ();

  Json::Value res(Json::objectValue);
  res["shots"] = static_cast<int> (stats.shots);
  res["hits"] = static_cast<int> (stats.hits);
  res["misses"] = static_cast<int> (stats.misses);
  res["sunk"] = static_cast<int> (stats.sunk);
  res["hitstaken"] = static_cast<int> (stats.hitsTaken);
  res["shipslost"] = static_cast<int> (stats.shipsLost);
  res["accuracy"] = stats.GetAccuracy ();
  res["score"] = stats.score;

  return res;
}

Json::Value
ShipToJson (const Ship& s)
{
  Json::Value res(Json::objectValue);
  res["id"] = static_cast<int> (s.GetId ());
  res["name"] = s.GetName ();
  res["class"] = s.GetClass ();
  res["size"] = static_cast<int> (s.GetSize ());
  res["placed"] = s.IsPlaced ();
  res["sunk"] = s.IsSunk ();
  if (s.IsSubmarine ())
    res["torpedoes"] = static_cast<int> (s.GetTorpedoes ());

  Json::Value cells(Json::arrayValue);
  for (unsigned i = 0; i < s.GetCells ().size (); ++i)
    {
      Json::Value cur = CoordToJson (s.GetCells ()[i]);
      cur["health"] = s.GetHealth (i);
      cells.append (cur);
    }
  res["cells"] = cells;

  return res;
}

Json::Value
CoordSetToJson (const std::set<Coord>& coords)
{
  Json::Value res(Json::arrayValue);
  for (const auto& c : coords)
    res.append (CoordToJson (c));

  return res;
}

Json::Value
PlayerToJson (const Player& p)
{
  Json::Value res(Json::objectValue);
  res["id"] = static_cast<int> (p.GetId ());
  res["name"] = p.GetName ();
  res["type"] = PlayerTypeToString (p.GetType ());
  res["alliance"] = static_cast<int> (p.GetAlliance ());
  res["defeated"] = p.IsDefeated ();
  res["afloat"] = static_cast<int> (p.GetFleet ().CountAfloat ());
  res["stats"] = StatsToJson (p);

  Json::Value munitions(Json::objectValue);
  munitions["starshells"] = static_cast<int> (p.GetStarShells ());
  munitions["scattershots"] = static_cast<int> (p.GetScatterShots ());
  res["munitions"] = munitions;

  if (p.GetType () == PlayerType::AI)
    {
      const auto& ai = dynamic_cast<const AiPlayer&> (p);
      res["strategy"] = ai.GetStrategy ();
      res["difficulty"] = ai.GetDifficulty ();
    }

  Json::Value fleet(Json::arrayValue);
  for (const auto& s : p.GetFleet ().GetShips ())
    fleet.append (ShipToJson (*s));
  res["fleet"] = fleet;

  res["dontshoot"] = CoordSetToJson (p.GetDontShoot ());
  res["revealed"] = CoordSetToJson (p.GetRevealed ());

  return res;
}

} // anonymous namespace

Json::Value
GameStateJson::GetGameStats () const
{
  Json::Value res(Json::objectValue);
  for (const auto& p : game.GetPlayers ())
    res[p->GetName ()] = StatsToJson (*p);

  return res;
}

Json::Value
GameStateJson::GetFullJson () const
{
  const auto& board = game.GetBoard ();

  Json::Value res(Json::objectValue);
  res["era"] = game.GetConfig ().name ();
  res["state"] = GameStateToString (game.GetState ());
  res["turncount"] = static_cast<int> (game.GetTurnCount ());

  const Player* cur = game.GetCurrentPlayer ();
  if (cur == nullptr)
    res["whoseturn"] = Json::Value ();
  else
    res["whoseturn"] = static_cast<int> (cur->GetId ());

  AllianceId winner;
  if (game.GetWinner (winner))
    res["winner"] = game.GetAlliances ()[winner]->GetName ();
  else
    res["winner"] = Json::Value ();

  Json::Value boardJson(Json::objectValue);
  boardJson["rows"] = board.GetRows ();
  boardJson["cols"] = board.GetColumns ();
  Json::Value terrain(Json::arrayValue);
  for (int r = 0; r < board.GetRows (); ++r)
    {
      std::string row;
      for (int c = 0; c < board.GetColumns (); ++c)
        row.push_back (TerrainToChar (board.TerrainAt (Coord (r, c))));
      terrain.append (row);
    }
  boardJson["terrain"] = terrain;
  boardJson["shots"]
      = static_cast<int> (board.GetShotHistory ().size ());
  res["board"] = boardJson;

  Json::Value alliances(Json::arrayValue);
  for (const auto& a : game.GetAlliances ())
    {
      Json::Value cur(Json::objectValue);
      cur["id"] = static_cast<int> (a->GetId ());
      cur["name"] = a->GetName ();
      cur["display"] = a->GetDisplayName ();
      cur["defeated"] = !a->IsEmpty () && a->IsDefeated ();

      Json::Value members(Json::arrayValue);
      for (const auto* p : a->GetMembers ())
        members.append (static_cast<int> (p->GetId ()));
      cur["members"] = members;

      alliances.append (cur);
    }
  res["alliances"] = alliances;

  Json::Value players(Json::arrayValue);
  for (const auto& p : game.GetPlayers ())
    players.append (PlayerToJson (*p));
  res["players"] = players;

  return res;
}

Json::Value
ActionResultToJson (const ActionResult& res)
{
  Json::Value out(Json::objectValue);
  out["status"] = StatusToString (res.status);
  out["message"] = res.message;

  if (!res.IsOk ())
    return out;

  Json::Value affected(Json::arrayValue);
  for (const auto& a : res.affected)
    {
      Json::Value cur = CoordToJson (a.cell);
      cur["result"] = ShotResultToString (a.result);
      affected.append (cur);
    }
  out["affected"] = affected;

  Json::Value revealed(Json::arrayValue);
  for (const auto& c : res.revealed)
    revealed.append (CoordToJson (c));
  out["revealed"] = revealed;

  Json::Value entry(Json::objectValue);
  entry["turn"] = static_cast<int> (res.logEntry.turn);
  entry["message"] = res.logEntry.message;
  entry["timestamp"] = static_cast<Json::Int64> (
      std::chrono::duration_cast<std::chrono::milliseconds> (
          res.logEntry.timestamp.time_since_epoch ()).count ());
  out["log"] = entry;

  out["turnadvanced"] = res.turnAdvanced;
  out["gameover"] = res.gameOver;

  return out;
}

proto::MatchResult
BuildMatchResult (const Game& game)
{
  proto::MatchResult res;
  res.set_era (game.GetConfig ().name ());
  res.set_turns (game.GetTurnCount ());

  AllianceId winner;
  const bool hasWinner = game.GetWinner (winner);
  if (hasWinner)
    res.set_winner (game.GetAlliances ()[winner]->GetName ());

  for (const auto& p : game.GetPlayers ())
    {
      if (p->GetType () != PlayerType::HUMAN)
        continue;

      const auto& stats = p->GetStats ();
      auto* cur = res.add_players ();
      cur->set_name (p->GetName ());
      cur->set_shots (stats.shots);
      cur->set_hits (stats.hits);
      cur->set_misses (stats.misses);
      cur->set_ships_sunk (stats.sunk);
      cur->set_accuracy (stats.GetAccuracy ());
      cur->set_won (hasWinner && p->GetAlliance () == winner);
      cur->set_score (static_cast<int64_t> (stats.score));
    }

  VLOG (1) << "Match result: " << res.ShortDebugString ();
  return res;
}

} // namespace seabattle
