// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_GAMESTATEJSON_HPP
#define SEABATTLE_GAMESTATEJSON_HPP

#include "game.hpp"

#include "proto/stats.pb.h"

#include <json/json.h>

namespace seabattle
{

/**
 * Helper class that allows extracting the observable state of a match
 * as JSON.
 */
class GameStateJson
{

private:

  /** The underlying game.  */
  const Game& game;

public:

  explicit GameStateJson (const Game& g)
    : game(g)
  {}

  GameStateJson () = delete;
  GameStateJson (const GameStateJson&) = delete;
  void operator= (const GameStateJson&) = delete;

  /**
   * Returns the statistics of all players (including AI players).
   */
  Json::Value GetGameStats () const;

  /**
   * Extracts the full current state as JSON.
   */
  Json::Value GetFullJson () const;

};

/**
 * Converts a coordinate to JSON.
 */
Json::Value CoordToJson (const Coord& c);

/**
 * Converts the result of an action to JSON.
 */
Json::Value ActionResultToJson (const ActionResult& res);

/**
 * Builds the statistics payload of a finished match, with one entry
 * per human player.
 */
proto::MatchResult BuildMatchResult (const Game& game);

} // namespace seabattle

#endif // SEABATTLE_GAMESTATEJSON_HPP
