// Copyright (C) 2020-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEAUTIL_JSONUTILS_HPP
#define SEAUTIL_JSONUTILS_HPP

#include <json/json.h>

#include <string>

namespace seautil
{

/**
 * Returns true if the given JSON value is a true integer, i.e. really
 * was parsed from an integer literal.  This is in contrast to a value that
 * has isInt() return true, but was actually parsed from a floating-point
 * literal and just happens to be integral.
 */
bool IsIntegerValue (const Json::Value& val);

/**
 * Extracts an integer from JSON if it is an integer literal and in the
 * range [minValue, maxValue].  Returns false (without touching the output)
 * otherwise.
 */
bool IntFromJson (const Json::Value& val, int minValue, int maxValue,
                  int& out);

/**
 * Parses a string as JSON.  Returns false if it is not valid JSON
 * (including trailing garbage).
 */
bool ParseJsonString (const std::string& str, Json::Value& out);

/**
 * Serialises a JSON value in compact single-line form.
 */
std::string JsonToCompactString (const Json::Value& val);

} // namespace seautil

#endif // SEAUTIL_JSONUTILS_HPP
