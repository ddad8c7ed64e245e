// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "eraconfig.hpp"

#include "strategy.hpp"

#include <google/protobuf/util/json_util.h>

#include <glog/logging.h>

#include <vector>

namespace seabattle
{

namespace
{

bool
ValidateShip (const proto::ShipConfig& ship)
{
  if (ship.size () == 0)
    {
      LOG (WARNING) << "Ship '" << ship.name () << "' has zero size";
      return false;
    }

  if (ship.defense () <= 0.0)
    {
      LOG (WARNING)
          << "Ship '" << ship.name () << "' has invalid defense "
          << ship.defense ();
      return false;
    }

  for (const auto t : ship.allowed_terrain ())
    if (t == proto::EXCLUDED)
      {
        LOG (WARNING)
            << "Ship '" << ship.name () << "' allows excluded terrain";
        return false;
      }

  return true;
}

bool
ValidateZone (const proto::EraConfig& cfg, const proto::PlacementZone& zone)
{
  if (zone.min_row () > zone.max_row () || zone.min_col () > zone.max_col ())
    {
      LOG (WARNING) << "Empty placement zone: " << zone.ShortDebugString ();
      return false;
    }

  if (zone.max_row () >= cfg.rows () || zone.max_col () >= cfg.cols ())
    {
      LOG (WARNING)
          << "Placement zone outside of board: " << zone.ShortDebugString ();
      return false;
    }

  return true;
}

} // anonymous namespace

bool
ValidateEraConfig (const proto::EraConfig& cfg)
{
  if (cfg.rows () == 0 || cfg.cols () == 0)
    {
      LOG (WARNING) << "Era has empty board: " << cfg.rows () << "x"
                    << cfg.cols ();
      return false;
    }

  TerrainGrid terrain;
  if (!BuildTerrainGrid (cfg, terrain))
    return false;

  if (cfg.alliances_size () < 2)
    {
      LOG (WARNING) << "Era needs at least two alliances";
      return false;
    }

  for (const auto& a : cfg.alliances ())
    {
      for (const auto& s : a.ships ())
        if (!ValidateShip (s))
          return false;

      for (const auto& ai : a.ai_captains ())
        {
          if (!IsKnownStrategy (ai.strategy ()))
            {
              LOG (WARNING)
                  << "AI captain '" << ai.name () << "' has unknown strategy "
                  << ai.strategy ();
              return false;
            }
          if (ai.difficulty () <= 0.0)
            {
              LOG (WARNING)
                  << "AI captain '" << ai.name () << "' has invalid difficulty "
                  << ai.difficulty ();
              return false;
            }

          for (const auto& s : ai.ships ())
            if (!ValidateShip (s))
              return false;
        }

      if (a.has_placement_zone () && !ValidateZone (cfg, a.placement_zone ()))
        return false;
    }

  if (cfg.torpedo_range () == 0)
    {
      LOG (WARNING) << "Era has zero torpedo range";
      return false;
    }

  return true;
}

bool
BuildTerrainGrid (const proto::EraConfig& cfg, TerrainGrid& out)
{
  TerrainGrid res(cfg.rows (), cfg.cols ());

  if (cfg.terrain_size () > 0)
    {
      const std::vector<std::string> data(cfg.terrain ().begin (),
                                          cfg.terrain ().end ());
      if (!res.FromRowStrings (data))
        {
          LOG (WARNING) << "Invalid terrain data for era " << cfg.name ();
          return false;
        }
    }

  out = res;
  return true;
}

bool
LoadEraConfigFromJson (const std::string& json, proto::EraConfig& cfg)
{
  cfg.Clear ();

  const auto status = google::protobuf::util::JsonStringToMessage (json, &cfg);
  if (!status.ok ())
    {
      LOG (WARNING) << "Failed to parse era config: " << status.ToString ();
      return false;
    }

  return ValidateEraConfig (cfg);
}

AllianceId
OpposingAlliance (const proto::EraConfig& cfg, const AllianceId own)
{
  CHECK_GE (cfg.alliances_size (), 2);
  CHECK_LT (own, static_cast<unsigned> (cfg.alliances_size ()));

  return own == 0 ? 1 : 0;
}

bool
GetPlacementZone (const proto::EraConfig& cfg, const AllianceId alliance,
                  PlacementZone& out)
{
  if (!cfg.rules ().restrict_placement ())
    return false;

  CHECK_LT (alliance, static_cast<unsigned> (cfg.alliances_size ()));
  const auto& a = cfg.alliances (alliance);
  if (!a.has_placement_zone ())
    return false;

  const auto& z = a.placement_zone ();
  out.minRow = z.min_row ();
  out.maxRow = z.max_row ();
  out.minCol = z.min_col ();
  out.maxCol = z.max_col ();

  return true;
}

} // namespace seabattle
