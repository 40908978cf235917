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
#pragma once

#include "linelog/log/log_fwd.hpp"
#include <boost/program_options.hpp>
#include <string>

namespace linelog::log
{

// Types.

/**
 * Construction-time configuration of a Logger.  A default-constructed Config gives the documented defaults: level
 * Level::S_INFO, time format #S_TIME_FORMAT_RFC3339, the real clock, no prefix.
 *
 * There are two ways to fill one out, and they combine.  In code, apply Option values (see with_level() and
 * friends; make_logger() does this for you).  From the command line (or a config file), register the options with
 * add_program_options(), run the usual boost.program_options `store()` / `notify()` sequence, then call
 * apply_debug_flag():
 *
 *   ~~~
 *   namespace opts = boost::program_options;
 *   log::Config log_config;
 *   opts::options_description opts_desc("Logging");
 *   log_config.add_program_options(&opts_desc);
 *   opts::variables_map vm;
 *   opts::store(opts::parse_command_line(argc, argv, opts_desc), vm);
 *   opts::notify(vm); // Throws opts::error subclass on an invalid --log-level and the like.
 *   log_config.apply_debug_flag();
 *   log::Logger logger(std::cerr, log_config);
 *   ~~~
 *
 * A Config is used only during Logger construction; the Logger keeps copies of what it needs.
 */
struct Config
{
  // Methods.

  /**
   * Registers, in `*opts_desc`, options that store directly into the data members of `*this`:
   *   - `--log-level` (#m_level, as parsed by Level `istream>>`),
   *   - `--log-time-format` (#m_time_format),
   *   - `--log-prefix` (#m_prefix),
   *   - `--debug` (#m_debug; a switch).
   *
   * The current values of `*this` are the defaults shown in `--help`-style output.  `*this` must outlive the
   * parsing (`notify()` call).
   *
   * @param opts_desc
   *        Target options description.  Must not be null.
   */
  void add_program_options(boost::program_options::options_description* opts_desc);

  /// If #m_debug is `true`, lowers #m_level to Level::S_DEBUG; otherwise no-op.
  void apply_debug_flag();

  // Data.

  /// Minimum level of messages that will be emitted.
  Level m_level = Level::S_INFO;

  /// strftime-style time stamp format; see time_format().
  std::string m_time_format{S_TIME_FORMAT_RFC3339};

  /// Time source; empty means `Wall_clock::now()`.
  Clock_func m_clock;

  /// Initial prefix; empty means none.
  std::string m_prefix;

  /// Whether `--debug` was given.  Only meaningful to apply_debug_flag().
  bool m_debug = false;
}; // struct Config

} // namespace linelog::log
