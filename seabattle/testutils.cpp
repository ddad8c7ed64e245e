// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include <sstream>

namespace seabattle
{

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);

  Json::Value res;
  in >> res;
  CHECK (in);

  return res;
}

proto::ShipConfig
TestShip (const std::string& name, const unsigned size)
{
  proto::ShipConfig res;
  res.set_name (name);
  res.set_ship_class ("destroyer");
  res.set_size (size);
  res.add_allowed_terrain (proto::DEEP);
  res.add_allowed_terrain (proto::SHALLOW);

  return res;
}

proto::EraConfig
TestEra (const unsigned rows, const unsigned cols)
{
  proto::EraConfig res;
  res.set_name ("test");
  res.set_rows (rows);
  res.set_cols (cols);

  auto* allies = res.add_alliances ();
  allies->set_name ("Allies");
  *allies->add_ships () = TestShip ("destroyer", 2);

  auto* axis = res.add_alliances ();
  axis->set_name ("Axis");
  *axis->add_ships () = TestShip ("destroyer", 2);

  return res;
}

} // namespace seabattle
