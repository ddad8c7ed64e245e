// Copyright (C) 2020-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "jsonutils.hpp"

#include <glog/logging.h>

#include <memory>

namespace seautil
{

bool
IsIntegerValue (const Json::Value& val)
{
  switch (val.type ())
    {
    case Json::intValue:
    case Json::uintValue:
      return true;

    default:
      return false;
    }
}

bool
IntFromJson (const Json::Value& val, const int minValue, const int maxValue,
             int& out)
{
  if (!IsIntegerValue (val) || !val.isInt ())
    {
      VLOG (1) << "JSON value is not an int: " << val;
      return false;
    }

  const int res = val.asInt ();
  if (res < minValue || res > maxValue)
    {
      VLOG (1)
          << "Integer " << res << " is out of range "
          << "[" << minValue << ", " << maxValue << "]";
      return false;
    }

  out = res;
  return true;
}

bool
ParseJsonString (const std::string& str, Json::Value& out)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = false;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  std::unique_ptr<Json::CharReader> reader(rbuilder.newCharReader ());
  std::string parseErrs;
  if (!reader->parse (str.data (), str.data () + str.size (), &out,
                      &parseErrs))
    {
      LOG (WARNING) << "Failed parsing JSON: " << parseErrs;
      return false;
    }

  return true;
}

std::string
JsonToCompactString (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["enableYAMLCompatibility"] = false;

  return Json::writeString (wbuilder, val);
}

} // namespace seautil
