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
#include "linelog/log/config.hpp"
#include <cassert>
#include <utility>

namespace linelog::log
{

// Config implementations.

void Config::add_program_options(boost::program_options::options_description* opts_desc)
{
  using boost::program_options::value;
  using boost::program_options::bool_switch;
  using std::string;

  assert(opts_desc);

  opts_desc->add_options()
    ("log-level", value<Level>(&m_level)->default_value(m_level),
     "Minimum severity of messages to output: debug, info, warn, error.")
    ("log-time-format", value<string>(&m_time_format)->default_value(m_time_format),
     "strftime-style format of the time stamp starting each line (UTC).")
    ("log-prefix", value<string>(&m_prefix)->default_value(m_prefix),
     "Label shown between the level and the message; empty for none.")
    ("debug", bool_switch(&m_debug),
     "Same as --log-level=debug.");
}

void Config::apply_debug_flag()
{
  if (m_debug)
  {
    m_level = Level::S_DEBUG;
  }
}

// Free function implementations.

Option with_level(Level level)
{
  return [level](Config* config) { config->m_level = level; };
}

Option time_format(util::String_view format)
{
  return [format = std::string(format)](Config* config) { config->m_time_format = format; };
}

Option time_func(Clock_func clock)
{
  return [clock = std::move(clock)](Config* config) { config->m_clock = clock; };
}

Option prefix(std::string prefix)
{
  return [prefix = std::move(prefix)](Config* config) { config->m_prefix = prefix; };
}

} // namespace linelog::log
