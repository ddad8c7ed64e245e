// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_ERACONFIG_HPP
#define SEABATTLE_ERACONFIG_HPP

#include "placement.hpp"
#include "terrain.hpp"
#include "types.hpp"

#include "proto/config.pb.h"

#include <string>

namespace seabattle
{

/**
 * Checks an era config for consistency:  Board dimensions, terrain data,
 * at least two alliances, ship definitions, AI captains and placement
 * zones.  Problems are logged and false returned.
 */
bool ValidateEraConfig (const proto::EraConfig& cfg);

/**
 * Builds the terrain grid of an era.  Returns false if the terrain
 * data is invalid.
 */
bool BuildTerrainGrid (const proto::EraConfig& cfg, TerrainGrid& out);

/**
 * Parses an era config from its JSON representation and validates it.
 */
bool LoadEraConfigFromJson (const std::string& json, proto::EraConfig& cfg);

/**
 * Returns the alliance opposing the given one.  For two alliances this is
 * simply the other; with more, it is the first other alliance in the
 * configured order.
 */
AllianceId OpposingAlliance (const proto::EraConfig& cfg, AllianceId own);

/**
 * Looks up the placement zone of an alliance.  Returns false if placement
 * is not restricted for it, in which case out is not touched.
 */
bool GetPlacementZone (const proto::EraConfig& cfg, AllianceId alliance,
                       PlacementZone& out);

} // namespace seabattle

#endif // SEABATTLE_ERACONFIG_HPP
