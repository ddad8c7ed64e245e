// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "actions.hpp"

#include <seautil/jsonutils.hpp>

#include <glog/logging.h>

#include <limits>
#include <set>

namespace seabattle
{

namespace
{

/** Bound for coordinate values accepted by the parser.  */
constexpr int MAX_COORD = 1'000'000;

/**
 * Checks that the object has no members except the given ones.
 */
bool
HasOnlyMembers (const Json::Value& obj, const std::set<std::string>& allowed)
{
  for (const auto& name : obj.getMemberNames ())
    if (allowed.count (name) == 0)
      {
        VLOG (1) << "Unexpected field in action: " << name;
        return false;
      }

  return true;
}

bool
ParseCoordinate (const Json::Value& obj, int& row, int& col)
{
  return seautil::IntFromJson (obj["row"], -MAX_COORD, MAX_COORD, row)
          && seautil::IntFromJson (obj["col"], -MAX_COORD, MAX_COORD, col);
}

bool
ParseShipId (const Json::Value& val, unsigned& id)
{
  int parsed;
  if (!seautil::IntFromJson (val, 1, std::numeric_limits<int>::max (),
                             parsed))
    return false;

  id = parsed;
  return true;
}

bool
ParseHeading (const Json::Value& val, proto::Heading& h)
{
  if (!val.isString ())
    return false;

  const std::string str = val.asString ();
  if (str == "left")
    h = proto::LEFT;
  else if (str == "right")
    h = proto::RIGHT;
  else if (str == "up")
    h = proto::UP;
  else if (str == "down")
    h = proto::DOWN;
  else
    return false;

  return true;
}

bool
ParseMunition (const Json::Value& val, proto::MunitionType& m)
{
  if (!val.isString ())
    return false;

  const std::string str = val.asString ();
  if (str == "shot")
    m = proto::SHOT;
  else if (str == "scatter")
    m = proto::SCATTER_SHOT;
  else if (str == "starshell")
    m = proto::STAR_SHELL;
  else if (str == "torpedo")
    m = proto::TORPEDO;
  else
    return false;

  return true;
}

bool
ParsePlace (const Json::Value& obj, proto::PlaceShip& place)
{
  if (!HasOnlyMembers (obj, {"type", "ship", "row", "col", "direction",
                             "drag"}))
    return false;

  unsigned ship;
  int row, col;
  if (!ParseShipId (obj["ship"], ship) || !ParseCoordinate (obj, row, col))
    return false;
  place.set_ship_id (ship);
  place.set_row (row);
  place.set_col (col);

  const bool hasDir = obj.isMember ("direction");
  const bool hasDrag = obj.isMember ("drag");
  if (hasDir == hasDrag)
    {
      VLOG (1) << "Placement needs exactly one of direction or drag";
      return false;
    }

  if (hasDir)
    {
      proto::Heading h;
      if (!ParseHeading (obj["direction"], h))
        return false;
      place.set_direction (h);
      return true;
    }

  const auto& drag = obj["drag"];
  if (!drag.isObject () || !HasOnlyMembers (drag, {"rows", "cols"}))
    return false;

  int dRows, dCols;
  if (!seautil::IntFromJson (drag["rows"], -MAX_COORD, MAX_COORD, dRows)
        || !seautil::IntFromJson (drag["cols"], -MAX_COORD, MAX_COORD, dCols))
    return false;
  place.set_drag_rows (dRows);
  place.set_drag_cols (dCols);

  return true;
}

bool
ParseFire (const Json::Value& obj, proto::Fire& fire)
{
  if (!HasOnlyMembers (obj, {"type", "row", "col", "munition", "heading",
                             "submarine"}))
    return false;

  int row, col;
  if (!ParseCoordinate (obj, row, col))
    return false;
  fire.set_row (row);
  fire.set_col (col);

  if (obj.isMember ("munition"))
    {
      proto::MunitionType m;
      if (!ParseMunition (obj["munition"], m))
        return false;
      fire.set_munition (m);
    }

  const bool isTorpedo = (fire.munition () == proto::TORPEDO);
  if (!isTorpedo
        && (obj.isMember ("heading") || obj.isMember ("submarine")))
    {
      VLOG (1) << "Heading and submarine are only valid for torpedoes";
      return false;
    }

  if (obj.isMember ("heading"))
    {
      proto::Heading h;
      if (!ParseHeading (obj["heading"], h))
        return false;
      fire.set_heading (h);
    }

  if (obj.isMember ("submarine"))
    {
      unsigned sub;
      if (!ParseShipId (obj["submarine"], sub))
        return false;
      fire.set_submarine (sub);
    }

  return true;
}

} // anonymous namespace

bool
ParseAction (const Json::Value& val, proto::Action& action)
{
  action.Clear ();

  if (!val.isObject ())
    {
      LOG (WARNING) << "Action is not an object: " << val;
      return false;
    }

  const auto& type = val["type"];
  if (!type.isString ())
    {
      LOG (WARNING) << "Action has no type: " << val;
      return false;
    }

  const std::string typeStr = type.asString ();
  bool ok = false;
  if (typeStr == "place")
    ok = ParsePlace (val, *action.mutable_place_ship ());
  else if (typeStr == "autoplace")
    {
      ok = HasOnlyMembers (val, {"type"});
      action.mutable_auto_place ();
    }
  else if (typeStr == "reset")
    {
      unsigned ship;
      ok = HasOnlyMembers (val, {"type", "ship"})
            && ParseShipId (val["ship"], ship);
      if (ok)
        action.mutable_reset_ship ()->set_ship_id (ship);
    }
  else if (typeStr == "fire")
    ok = ParseFire (val, *action.mutable_fire ());

  if (!ok)
    {
      LOG (WARNING) << "Invalid action: " << val;
      action.Clear ();
      return false;
    }

  return true;
}

bool
DirectionFromProto (const proto::Heading h, Direction& dir)
{
  switch (h)
    {
    case proto::LEFT:
      dir = Direction::LEFT;
      return true;
    case proto::RIGHT:
      dir = Direction::RIGHT;
      return true;
    case proto::UP:
      dir = Direction::UP;
      return true;
    case proto::DOWN:
      dir = Direction::DOWN;
      return true;

    case proto::HEADING_UNSPECIFIED:
      return false;
    }

  LOG (FATAL) << "Invalid heading: " << static_cast<int> (h);
}

FireOrder
FireOrderFromProto (const proto::Fire& fire)
{
  FireOrder res;
  res.target = Coord (fire.row (), fire.col ());
  res.munition = MunitionFromProto (fire.munition ());
  if (!DirectionFromProto (fire.heading (), res.heading))
    res.heading = Direction::RIGHT;
  res.submarine = fire.submarine ();

  return res;
}

std::string
ActionToString (const proto::Action& action)
{
  return action.ShortDebugString ();
}

} // namespace seabattle
