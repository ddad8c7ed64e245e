// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "coord.hpp"

#include <glog/logging.h>

#include <sstream>

namespace seabattle
{

const Direction ALL_DIRECTIONS[4] =
  {
    Direction::LEFT,
    Direction::RIGHT,
    Direction::UP,
    Direction::DOWN,
  };

Direction
operator- (const Direction d)
{
  switch (d)
    {
    case Direction::LEFT:
      return Direction::RIGHT;
    case Direction::RIGHT:
      return Direction::LEFT;

    case Direction::UP:
      return Direction::DOWN;
    case Direction::DOWN:
      return Direction::UP;
    }

  LOG (FATAL) << "Invalid direction: " << static_cast<int> (d);
}

bool
IsHorizontal (const Direction d)
{
  switch (d)
    {
    case Direction::LEFT:
    case Direction::RIGHT:
      return true;

    case Direction::UP:
    case Direction::DOWN:
      return false;
    }

  LOG (FATAL) << "Invalid direction: " << static_cast<int> (d);
}

std::string
DirectionToString (const Direction d)
{
  switch (d)
    {
    case Direction::LEFT:
      return "left";
    case Direction::RIGHT:
      return "right";
    case Direction::UP:
      return "up";
    case Direction::DOWN:
      return "down";
    }

  LOG (FATAL) << "Invalid direction: " << static_cast<int> (d);
}

std::string
Coord::ToString () const
{
  if (row < 0 || column < 0)
    {
      std::ostringstream out;
      out << "(" << row << ", " << column << ")";
      return out.str ();
    }

  std::string letters;
  int c = column;
  while (true)
    {
      letters.insert (letters.begin (), static_cast<char> ('A' + c % 26));
      if (c < 26)
        break;
      c = c / 26 - 1;
    }

  return letters + std::to_string (row + 1);
}

Coord
Coord::operator+ (const Direction d) const
{
  switch (d)
    {
    case Direction::LEFT:
      return Coord (row, column - 1);
    case Direction::RIGHT:
      return Coord (row, column + 1);

    case Direction::UP:
      return Coord (row - 1, column);
    case Direction::DOWN:
      return Coord (row + 1, column);
    }

  LOG (FATAL) << "Invalid direction: " << static_cast<int> (d);
}

Coord
Coord::operator- (const Direction d) const
{
  return (*this) + (-d);
}

bool
operator== (const Coord& a, const Coord& b)
{
  return a.row == b.row && a.column == b.column;
}

bool
operator!= (const Coord& a, const Coord& b)
{
  return !(a == b);
}

bool
operator< (const Coord& a, const Coord& b)
{
  if (a.row != b.row)
    return a.row < b.row;
  return a.column < b.column;
}

std::ostream&
operator<< (std::ostream& out, const Coord& c)
{
  out << c.ToString ();
  return out;
}

} // namespace seabattle
