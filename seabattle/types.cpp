// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "types.hpp"

#include <glog/logging.h>

namespace seabattle
{

bool
IsHit (const ShotResult res)
{
  return res == ShotResult::HIT || res == ShotResult::SUNK;
}

std::string
ShotResultToString (const ShotResult res)
{
  switch (res)
    {
    case ShotResult::MISS:
      return "miss";
    case ShotResult::HIT:
      return "hit";
    case ShotResult::ALREADY_HIT:
      return "already-hit";
    case ShotResult::SUNK:
      return "sunk";
    }

  LOG (FATAL) << "Invalid shot result: " << static_cast<int> (res);
}

} // namespace seabattle
