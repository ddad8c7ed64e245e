// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_COORD_HPP
#define SEABATTLE_COORD_HPP

#include <ostream>
#include <string>

namespace seabattle
{

/**
 * Directions on the board.  The grid is laid out like a matrix.
 */
enum class Direction
{

  /** Decreasing column.  */
  LEFT,

  /** Increasing column.  */
  RIGHT,

  /** Decreasing row.  */
  UP,

  /** Increasing row.  */
  DOWN,

};

/**
 * Returns the "inverse" direction.
 */
Direction operator- (Direction d);

/**
 * Returns true if the direction runs along a row.
 */
bool IsHorizontal (Direction d);

/**
 * Returns the lower-case name of a direction.
 */
std::string DirectionToString (Direction d);

/** All four directions, for iterating over neighbours.  */
extern const Direction ALL_DIRECTIONS[4];

/**
 * A coordinate on a board.  Coord itself does not know the board
 * dimensions; whether or not it is on the board is decided by the
 * TerrainGrid or Board instance it is used with.
 */
class Coord
{

private:

  /** The row (zero-based).  May be negative for off-board coordinates.  */
  int row = 0;

  /** The column (zero-based).  May be negative as well.  */
  int column = 0;

public:

  Coord () = default;
  Coord (const Coord&) = default;
  Coord& operator= (const Coord&) = default;

  explicit Coord (const int r, const int c)
    : row(r), column(c)
  {}

  int
  GetRow () const
  {
    return row;
  }

  int
  GetColumn () const
  {
    return column;
  }

  /**
   * Returns the cell name in the usual "A1" form, i.e. column letters
   * (A..Z, AA, AB, ...) followed by the one-based row.
   */
  std::string ToString () const;

  /**
   * Changes the coordinate in the given direction.
   */
  Coord operator+ (Direction d) const;

  /**
   * Changes the coordinate in the inverse direction.
   */
  Coord operator- (Direction d) const;

  friend bool operator== (const Coord& a, const Coord& b);
  friend bool operator!= (const Coord& a, const Coord& b);

  /** Row-major ordering, so Coord can be used in sets and maps.  */
  friend bool operator< (const Coord& a, const Coord& b);

};

std::ostream& operator<< (std::ostream& out, const Coord& c);

} // namespace seabattle

#endif // SEABATTLE_COORD_HPP
