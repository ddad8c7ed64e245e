// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_ACTIONS_HPP
#define SEABATTLE_ACTIONS_HPP

#include "coord.hpp"
#include "munitions.hpp"

#include "proto/action.pb.h"

#include <json/json.h>

#include <string>

namespace seabattle
{

/**
 * Parses an action as sent by the UI layer in JSON form, e.g.
 * {"type": "fire", "row": 3, "col": 4}.  Returns false if the JSON is
 * malformed, including unexpected fields.  Coordinates are not checked
 * against any board here.
 */
bool ParseAction (const Json::Value& val, proto::Action& action);

/**
 * Converts a heading from the protocol buffer.  Returns false for
 * HEADING_UNSPECIFIED.
 */
bool DirectionFromProto (proto::Heading h, Direction& dir);

/**
 * Builds the order for a fire action.  The heading defaults to right
 * if it is not given.
 */
FireOrder FireOrderFromProto (const proto::Fire& fire);

/**
 * Returns a short description of an action for logging.
 */
std::string ActionToString (const proto::Action& action);

} // namespace seabattle

#endif // SEABATTLE_ACTIONS_HPP
