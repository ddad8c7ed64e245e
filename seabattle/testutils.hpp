// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_TESTUTILS_HPP
#define SEABATTLE_TESTUTILS_HPP

#include "proto/config.pb.h"

#include <json/json.h>

#include <google/protobuf/text_format.h>

#include <glog/logging.h>

#include <string>

namespace seabattle
{

/**
 * Parses a string into JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Parses a protocol buffer from text format.  Invalid text is a test bug
 * and crashes.
 */
template <typename Proto>
  Proto
  ParseTextProto (const std::string& str)
{
  Proto res;
  CHECK (google::protobuf::TextFormat::ParseFromString (str, &res))
      << "Invalid text proto:\n" << str;
  return res;
}

/**
 * Returns the config of a simple surface ship of the given size, which may
 * be placed on deep and shallow water.
 */
proto::ShipConfig TestShip (const std::string& name, unsigned size);

/**
 * Returns an era config for a board of deep water with two alliances
 * "Allies" and "Axis", each with a fleet of one destroyer of size 2.
 * The config can then be modified further by tests.
 */
proto::EraConfig TestEra (unsigned rows, unsigned cols);

} // namespace seabattle

#endif // SEABATTLE_TESTUTILS_HPP
