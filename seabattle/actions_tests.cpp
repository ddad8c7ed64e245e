// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "actions.hpp"

#include "testutils.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <gtest/gtest.h>

namespace seabattle
{
namespace
{

using google::protobuf::util::MessageDifferencer;

class ParseActionTests : public testing::Test
{

protected:

  /**
   * Expects that the JSON parses into the action given in text format.
   */
  static void
  ExpectAction (const std::string& json, const std::string& expected)
  {
    proto::Action action;
    ASSERT_TRUE (ParseAction (ParseJson (json), action)) << json;
    EXPECT_TRUE (MessageDifferencer::Equals (
        action, ParseTextProto<proto::Action> (expected)))
        << "Actual: " << action.DebugString ();
  }

  static void
  ExpectInvalid (const std::string& json)
  {
    proto::Action action;
    EXPECT_FALSE (ParseAction (ParseJson (json), action)) << json;
    EXPECT_EQ (action.action_case (), proto::Action::ACTION_NOT_SET);
  }

};

TEST_F (ParseActionTests, Fire)
{
  ExpectAction (R"({"type": "fire", "row": 3, "col": 4})",
                "fire: { row: 3 col: 4 }");
  ExpectAction (R"({"type": "fire", "row": 0, "col": 0,
                    "munition": "scatter"})",
                "fire: { row: 0 col: 0 munition: SCATTER_SHOT }");
  ExpectAction (R"({"type": "fire", "row": 1, "col": 1,
                    "munition": "starshell"})",
                "fire: { row: 1 col: 1 munition: STAR_SHELL }");
  ExpectAction (R"({"type": "fire", "row": 1, "col": 1,
                    "munition": "torpedo", "heading": "up",
                    "submarine": 7})",
                R"(fire: { row: 1 col: 1 munition: TORPEDO
                           heading: UP submarine: 7 })");
}

TEST_F (ParseActionTests, FireInvalid)
{
  ExpectInvalid (R"({"type": "fire", "row": 3})");
  ExpectInvalid (R"({"type": "fire", "row": 3, "col": 1.5})");
  ExpectInvalid (R"({"type": "fire", "row": "3", "col": 1})");
  ExpectInvalid (R"({"type": "fire", "row": 3, "col": 1, "x": 0})");
  ExpectInvalid (R"({"type": "fire", "row": 3, "col": 1,
                     "munition": "nuke"})");
  ExpectInvalid (R"({"type": "fire", "row": 3, "col": 1,
                     "heading": "up"})");
  ExpectInvalid (R"({"type": "fire", "row": 3, "col": 1,
                     "munition": "torpedo", "heading": "north"})");
}

TEST_F (ParseActionTests, FireOutOfBoardStillParses)
{
  ExpectAction (R"({"type": "fire", "row": -1, "col": 100})",
                "fire: { row: -1 col: 100 }");
}

TEST_F (ParseActionTests, Place)
{
  ExpectAction (R"({"type": "place", "ship": 2, "row": 1, "col": 2,
                    "direction": "down"})",
                "place_ship: { ship_id: 2 row: 1 col: 2 direction: DOWN }");
  ExpectAction (R"({"type": "place", "ship": 2, "row": 1, "col": 2,
                    "drag": {"rows": -1, "cols": 3}})",
                R"(place_ship: { ship_id: 2 row: 1 col: 2
                                 drag_rows: -1 drag_cols: 3 })");
}

TEST_F (ParseActionTests, PlaceInvalid)
{
  ExpectInvalid (R"({"type": "place", "ship": 2, "row": 1, "col": 2})");
  ExpectInvalid (R"({"type": "place", "ship": 0, "row": 1, "col": 2,
                     "direction": "up"})");
  ExpectInvalid (R"({"type": "place", "ship": 2, "row": 1, "col": 2,
                     "direction": "up", "drag": {"rows": 1, "cols": 0}})");
  ExpectInvalid (R"({"type": "place", "ship": 2, "row": 1, "col": 2,
                     "drag": {"rows": 1}})");
  ExpectInvalid (R"({"type": "place", "ship": 2, "row": 1, "col": 2,
                     "drag": {"rows": 1, "cols": 0, "z": 1}})");
}

TEST_F (ParseActionTests, AutoPlaceAndReset)
{
  ExpectAction (R"({"type": "autoplace"})", "auto_place: {}");
  ExpectAction (R"({"type": "reset", "ship": 5})",
                "reset_ship: { ship_id: 5 }");

  ExpectInvalid (R"({"type": "autoplace", "ship": 1})");
  ExpectInvalid (R"({"type": "reset"})");
}

TEST_F (ParseActionTests, Malformed)
{
  ExpectInvalid ("[]");
  ExpectInvalid ("42");
  ExpectInvalid (R"({"row": 1, "col": 1})");
  ExpectInvalid (R"({"type": "surrender"})");
}

TEST (DirectionFromProtoTests, Conversion)
{
  Direction dir;
  ASSERT_TRUE (DirectionFromProto (proto::LEFT, dir));
  EXPECT_EQ (dir, Direction::LEFT);
  ASSERT_TRUE (DirectionFromProto (proto::DOWN, dir));
  EXPECT_EQ (dir, Direction::DOWN);
  EXPECT_FALSE (DirectionFromProto (proto::HEADING_UNSPECIFIED, dir));
}

TEST (FireOrderFromProtoTests, Conversion)
{
  auto order = FireOrderFromProto (ParseTextProto<proto::Fire> (R"(
    row: 2 col: 5 munition: TORPEDO heading: DOWN submarine: 3
  )"));
  EXPECT_EQ (order.target, Coord (2, 5));
  EXPECT_EQ (order.munition, Munition::TORPEDO);
  EXPECT_EQ (order.heading, Direction::DOWN);
  EXPECT_EQ (order.submarine, 3);

  order = FireOrderFromProto (ParseTextProto<proto::Fire> ("row: 1 col: 0"));
  EXPECT_EQ (order.target, Coord (1, 0));
  EXPECT_EQ (order.munition, Munition::SHOT);
  EXPECT_EQ (order.heading, Direction::RIGHT);
  EXPECT_EQ (order.submarine, 0);
}

} // anonymous namespace
} // namespace seabattle
