/* linelog
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "linelog/log/log_fwd.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/array.hpp>
#include <boost/lexical_cast.hpp>
#include <istream>
#include <locale>
#include <ostream>
#include <utility>

namespace linelog::log
{

namespace
{

/// Each name accepted by `istream>>`, case-insensitively, with the level it denotes.
const boost::array<std::pair<util::String_view, Level>, 5> S_LEVEL_NAMES
  = {{ { "debug", Level::S_DEBUG },
       { "info", Level::S_INFO },
       { "warn", Level::S_WARN },
       { "warning", Level::S_WARN }, // Synonym; never output.
       { "error", Level::S_ERROR } }};

/**
 * Returns `true` if `val` is one of the four defined levels.
 *
 * @param val
 *        Value.
 * @return See above.
 */
bool is_defined_level(Level val)
{
  switch (val)
  {
    case Level::S_DEBUG:
    case Level::S_INFO:
    case Level::S_WARN:
    case Level::S_ERROR:
      return true;
  }
  return false;
}

} // Anonymous namespace

// Implementations.

util::String_view level_label(Level level)
{
  switch (level)
  {
    case Level::S_DEBUG: return "DEBUG";
    case Level::S_INFO: return "INFO";
    case Level::S_WARN: return "WARN";
    case Level::S_ERROR: return "ERROR";
  }
  // Only reachable via a cast from an arbitrary integer.  Not an error: see Level doc header.
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, Level val)
{
  return os << level_label(val);
}

std::istream& operator>>(std::istream& is, Level& val)
{
  using boost::algorithm::iequals;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using std::string;

  string token;
  if (!(is >> token))
  {
    return is; // Failbit already set by the string extraction.
  }
  // else

  for (const auto& name_and_level : S_LEVEL_NAMES)
  {
    if (iequals(token, name_and_level.first, std::locale::classic()))
    {
      val = name_and_level.second;
      return is;
    }
  }

  // Not a name; maybe the numeric encoding (possibly negative, hence no istream_to_enum()-style digit check).
  try
  {
    const auto candidate = Level(lexical_cast<int>(token));
    if (is_defined_level(candidate))
    {
      val = candidate;
      return is;
    }
  }
  catch (const bad_lexical_cast&)
  {
    // Fall through to the failure below.
  }

  is.setstate(std::ios_base::failbit);
  return is;
} // operator>>(istream&, Level&)

} // namespace linelog::log
