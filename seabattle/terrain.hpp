// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_TERRAIN_HPP
#define SEABATTLE_TERRAIN_HPP

#include "coord.hpp"

#include "proto/config.pb.h"

#include <set>
#include <string>
#include <vector>

namespace seabattle
{

/**
 * Terrain classification of a cell.
 */
enum class Terrain
{
  DEEP,
  SHALLOW,
  SHOAL,
  MARSH,
  LAND,
  ROCK,

  /** Cells inside the bounding rectangle that are not part of the board.  */
  EXCLUDED,
};

/** A set of terrain types, e.g. where a ship may be placed.  */
using TerrainSet = std::set<Terrain>;

/**
 * Converts the protocol buffer enum to our terrain type.
 */
Terrain TerrainFromProto (proto::TerrainType t);

/**
 * Returns the character used for a terrain type in grid strings.
 */
char TerrainToChar (Terrain t);

/**
 * Parses a terrain character.  Returns false if it is invalid.
 */
bool TerrainFromChar (char c, Terrain& t);

/**
 * Returns true if a torpedo can travel through terrain of the given type.
 */
bool IsNavigable (Terrain t);

/**
 * The static terrain of a match.  This is a rectangular grid of arbitrary
 * dimensions, which never changes once the match is set up.
 */
class TerrainGrid
{

private:

  int rows = 0;
  int cols = 0;

  /** The terrain cells in row-major order.  */
  std::vector<Terrain> cells;

public:

  TerrainGrid () = default;

  /**
   * Constructs a grid with all cells set to deep water.
   */
  explicit TerrainGrid (int r, int c);

  TerrainGrid (const TerrainGrid&) = default;
  TerrainGrid& operator= (const TerrainGrid&) = default;

  int
  GetRows () const
  {
    return rows;
  }

  int
  GetColumns () const
  {
    return cols;
  }

  /**
   * Returns true if the coordinate is inside the bounding rectangle.
   * Excluded cells are inside it.
   */
  bool IsInBounds (const Coord& c) const;

  /**
   * Returns the terrain at a coordinate, which must be in bounds.
   */
  Terrain Get (const Coord& c) const;

  /**
   * Sets the terrain of a single cell, which must be in bounds.
   */
  void Set (const Coord& c, Terrain t);

  /**
   * Parses the terrain from one string per row.  Spaces are ignored.
   * Returns false if the data does not match the grid dimensions or
   * contains invalid characters.
   */
  bool FromRowStrings (const std::vector<std::string>& data);

  /**
   * Returns the grid in the form accepted by FromRowStrings, with
   * newlines after each row.
   */
  std::string ToString () const;

};

} // namespace seabattle

#endif // SEABATTLE_TERRAIN_HPP
