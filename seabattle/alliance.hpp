// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_ALLIANCE_HPP
#define SEABATTLE_ALLIANCE_HPP

#include "player.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace seabattle
{

/**
 * A named group of players that win or lose together.  The alliance does
 * not own its members; they are owned by the Game.
 */
class Alliance
{

private:

  const AllianceId id;
  const std::string name;

  std::vector<Player*> members;

public:

  explicit Alliance (const AllianceId i, const std::string& n)
    : id(i), name(n)
  {}

  Alliance (const Alliance&) = delete;
  void operator= (const Alliance&) = delete;

  AllianceId
  GetId () const
  {
    return id;
  }

  const std::string&
  GetName () const
  {
    return name;
  }

  /**
   * Returns the name shown for the alliance:  The member's name if there
   * is exactly one member, and the alliance name otherwise.
   */
  std::string GetDisplayName () const;

  void AddMember (Player& p);

  const std::vector<Player*>&
  GetMembers () const
  {
    return members;
  }

  bool
  IsEmpty () const
  {
    return members.empty ();
  }

  /**
   * Returns true if every member's fleet is defeated.
   */
  bool IsDefeated () const;

};

} // namespace seabattle

#endif // SEABATTLE_ALLIANCE_HPP
