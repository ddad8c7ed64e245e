// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "alliance.hpp"

#include <glog/logging.h>

namespace seabattle
{

std::string
Alliance::GetDisplayName () const
{
  if (members.size () == 1)
    return members.front ()->GetName ();

  return name;
}

void
Alliance::AddMember (Player& p)
{
  CHECK_EQ (p.GetAlliance (), id)
      << "Player " << p.GetName () << " is not part of alliance " << name;
  members.push_back (&p);
}

bool
Alliance::IsDefeated () const
{
  for (const auto* p : members)
    if (!p->IsDefeated ())
      return false;

  return true;
}

} // namespace seabattle
