// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "terrain.hpp"

#include <glog/logging.h>

#include <sstream>
#include <utility>

namespace seabattle
{

Terrain
TerrainFromProto (const proto::TerrainType t)
{
  switch (t)
    {
    case proto::DEEP:
      return Terrain::DEEP;
    case proto::SHALLOW:
      return Terrain::SHALLOW;
    case proto::SHOAL:
      return Terrain::SHOAL;
    case proto::MARSH:
      return Terrain::MARSH;
    case proto::LAND:
      return Terrain::LAND;
    case proto::ROCK:
      return Terrain::ROCK;
    case proto::EXCLUDED:
      return Terrain::EXCLUDED;
    }

  LOG (FATAL) << "Invalid terrain type: " << static_cast<int> (t);
}

char
TerrainToChar (const Terrain t)
{
  switch (t)
    {
    case Terrain::DEEP:
      return 'd';
    case Terrain::SHALLOW:
      return 's';
    case Terrain::SHOAL:
      return 'h';
    case Terrain::MARSH:
      return 'm';
    case Terrain::LAND:
      return 'l';
    case Terrain::ROCK:
      return 'r';
    case Terrain::EXCLUDED:
      return 'x';
    }

  LOG (FATAL) << "Invalid terrain: " << static_cast<int> (t);
}

bool
TerrainFromChar (const char c, Terrain& t)
{
  switch (c)
    {
    case 'd':
      t = Terrain::DEEP;
      return true;
    case 's':
      t = Terrain::SHALLOW;
      return true;
    case 'h':
      t = Terrain::SHOAL;
      return true;
    case 'm':
      t = Terrain::MARSH;
      return true;
    case 'l':
      t = Terrain::LAND;
      return true;
    case 'r':
      t = Terrain::ROCK;
      return true;
    case 'x':
      t = Terrain::EXCLUDED;
      return true;
    default:
      return false;
    }
}

bool
IsNavigable (const Terrain t)
{
  switch (t)
    {
    case Terrain::DEEP:
    case Terrain::SHALLOW:
    case Terrain::SHOAL:
      return true;

    default:
      return false;
    }
}

TerrainGrid::TerrainGrid (const int r, const int c)
  : rows(r), cols(c)
{
  CHECK_GE (rows, 0);
  CHECK_GE (cols, 0);
  cells.assign (rows * cols, Terrain::DEEP);
}

bool
TerrainGrid::IsInBounds (const Coord& c) const
{
  if (c.GetRow () < 0 || c.GetRow () >= rows)
    return false;
  if (c.GetColumn () < 0 || c.GetColumn () >= cols)
    return false;

  return true;
}

Terrain
TerrainGrid::Get (const Coord& c) const
{
  CHECK (IsInBounds (c)) << "Coordinate out of bounds: " << c;
  return cells[c.GetRow () * cols + c.GetColumn ()];
}

void
TerrainGrid::Set (const Coord& c, const Terrain t)
{
  CHECK (IsInBounds (c)) << "Coordinate out of bounds: " << c;
  cells[c.GetRow () * cols + c.GetColumn ()] = t;
}

bool
TerrainGrid::FromRowStrings (const std::vector<std::string>& data)
{
  if (data.size () != static_cast<size_t> (rows))
    {
      LOG (WARNING)
          << "Terrain has " << data.size () << " rows, expected " << rows;
      return false;
    }

  std::vector<Terrain> parsed;
  parsed.reserve (rows * cols);
  for (int r = 0; r < rows; ++r)
    {
      int count = 0;
      for (const char ch : data[r])
        {
          if (ch == ' ')
            continue;

          Terrain t;
          if (!TerrainFromChar (ch, t))
            {
              LOG (WARNING) << "Invalid terrain character: " << ch;
              return false;
            }

          parsed.push_back (t);
          ++count;
        }

      if (count != cols)
        {
          LOG (WARNING)
              << "Terrain row " << r << " has " << count
              << " cells, expected " << cols;
          return false;
        }
    }

  cells = std::move (parsed);
  return true;
}

std::string
TerrainGrid::ToString () const
{
  std::ostringstream res;
  for (int r = 0; r < rows; ++r)
    {
      for (int c = 0; c < cols; ++c)
        res << TerrainToChar (Get (Coord (r, c)));
      res << '\n';
    }

  return res.str ();
}

} // namespace seabattle
