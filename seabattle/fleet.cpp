// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fleet.hpp"

#include <glog/logging.h>

#include <utility>

namespace seabattle
{

Ship&
Fleet::AddShip (std::unique_ptr<Ship> s)
{
  CHECK (s != nullptr);
  CHECK (GetShip (s->GetId ()) == nullptr)
      << "Duplicate ship ID " << s->GetId () << " in fleet";

  ships.push_back (std::move (s));
  return *ships.back ();
}

Ship*
Fleet::GetShip (const ShipId id)
{
  for (auto& s : ships)
    if (s->GetId () == id)
      return s.get ();

  return nullptr;
}

const Ship*
Fleet::GetShip (const ShipId id) const
{
  for (const auto& s : ships)
    if (s->GetId () == id)
      return s.get ();

  return nullptr;
}

Ship*
Fleet::NextUnplaced ()
{
  for (auto& s : ships)
    if (!s->IsPlaced ())
      return s.get ();

  return nullptr;
}

bool
Fleet::IsComplete () const
{
  for (const auto& s : ships)
    if (!s->IsPlaced ())
      return false;

  return true;
}

bool
Fleet::IsDefeated () const
{
  for (const auto& s : ships)
    if (!s->IsSunk ())
      return false;

  return true;
}

unsigned
Fleet::CountAfloat () const
{
  unsigned res = 0;
  for (const auto& s : ships)
    if (!s->IsSunk ())
      ++res;

  return res;
}

} // namespace seabattle
