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

#include "linelog/util/util_fwd.hpp"
#include <chrono>
#include <iosfwd>
#include <string>

/**
 * linelog module providing the logger proper: a leveled, human-readable line logger for command-line programs.
 *
 * A log line looks like this (styling escapes aside):
 *
 *   ~~~
 *   2025-04-01T13:34:03Z INFO http: Response from get repos status=200 duration=500ms
 *   ~~~
 *
 * That is: time stamp, level, optional prefix, the message verbatim, then zero or more `key=value` attributes.
 * Values are quoted (with C-style escapes) when empty or when containing whitespace, non-printable characters
 * or invalid UTF-8; keys never are.
 *
 * Log philosophy is as follows.
 * - Simplicity: there is one Logger class with four logging methods (Logger::debug(), Logger::info(),
 *   Logger::warn(), Logger::error()) and two derivation methods (Logger::with(), Logger::prefixed()); configuration
 *   happens once, at construction (see make_logger() and Config).
 * - A disabled or discarded log call costs one comparison: no clock read, no buffer, no lock, not even the
 *   conversion of the call's attribute arguments.
 * - An enabled log call assembles the line in a pooled buffer (detail::Buffer_pool) and writes it to the sink in one
 *   shot under a mutex shared by the Logger and every Logger derived from it, so lines never interleave.
 * - Logging never changes the caller's control flow: nothing here throws to the caller or reports an error, and a
 *   failing sink is ignored.
 *
 * log_fwd.hpp is separate from the other headers due to C++ circular dependency nonsense; include it when only
 * the names are needed.
 */
namespace linelog::log
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Attr;
class Attr_value;
struct Config;
class Logger;
class Log_scope;

/**
 * Enumeration of the message severity levels, ordered from least to most severe.  Comparison by underlying value
 * is meaningful: see should_emit().
 *
 * The values have gaps so that a level can be inserted between two others later without renumbering.  Any other
 * value (which can only be produced by a cast) is not an error anywhere in linelog: it is ordered by its underlying
 * value like any other, and its label is `unknown`.
 *
 * The supplied `ostream<<` and `istream>>` operators make Level parseable by boost.program_options and
 * `boost::lexical_cast`; see Config::add_program_options().
 */
enum class Level : int
{
  /// Verbose output intended for a `--debug` / `--verbose` mode or internal debugging.
  S_DEBUG = -4,

  /// The default level: progress updates and other informational messages.
  S_INFO = 0,

  /**
   * Recoverable issues worth flagging to the user, such as a missing configuration file when the program can fall
   * back to defaults.
   */
  S_WARN = 4,

  /// Non-recoverable errors, typically followed by the program reporting failure or exiting.
  S_ERROR = 8
}; // enum class Level

/**
 * Short-hand for the type of a log line time source: returns the current instant.  The default is
 * `Wall_clock::now()`; tests substitute a fixed instant.
 */
using Clock_func = Function<Wall_time_pt ()>;

/// Short-hand for the duration type in which attribute values of any `std::chrono::duration` type are kept.
using Duration = std::chrono::nanoseconds;

/**
 * Short-hand for a construction option of a Logger: a function that modifies a Config.  See with_level(),
 * time_format(), time_func(), prefix() and make_logger().
 */
using Option = Function<void (Config*)>;

// Constants.

/// strftime-style time stamp format equivalent to RFC 3339 in UTC, e.g., `2025-04-01T13:34:03Z`.  The default.
constexpr util::String_view S_TIME_FORMAT_RFC3339 = "%Y-%m-%dT%H:%M:%SZ";

/**
 * Time stamp format showing only the wall clock time, e.g., `1:34PM`.  Equivalent to strftime-style `%I:%M%p`,
 * except the hour has no leading zero: Logger recognizes this exact pattern and drops it.
 */
constexpr util::String_view S_TIME_FORMAT_KITCHEN = "%I:%M%p";

/**
 * The value text rendered for a key left without a value by an odd-length attribute list.  Rendered unquoted.
 * A real value equal to this text is indistinguishable from it in output.
 */
constexpr util::String_view S_MISSING_VALUE = "<MISSING>";

// Free functions.

/**
 * The level gate: returns `true` if and only if a message of level `attempted` should be emitted by a Logger
 * configured with minimum level `configured`.  Pure; total order on the underlying value.
 *
 * @param configured
 *        The Logger's minimum level.
 * @param attempted
 *        The level of the message.
 * @return `attempted >= configured`.
 */
constexpr bool should_emit(Level configured, Level attempted);

/**
 * Returns the unstyled label of a Level, as shown in log lines: `DEBUG`, `INFO`, `WARN`, `ERROR`; or `unknown` for
 * any other value.
 *
 * @param level
 *        Level.
 * @return See above.  The referred-to characters have static storage duration.
 */
util::String_view level_label(Level level);

/**
 * Serializes a Level to a standard output stream as its level_label().  The output is compatible with the reverse
 * `istream>>` operator, except for `unknown`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Level val);

/**
 * Deserializes a Level from a standard input stream.  Reads one whitespace-delimited token and accepts,
 * case-insensitively, `debug`, `info`, `warn`, `warning`, `error`; or the underlying numeric value of one of the
 * four levels (e.g., `-4`).  Anything else sets `failbit` and leaves `val` unchanged.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Level& val);

/**
 * Returns the designated discard sink: a process-wide `ostream` that drops everything written to it.
 * A Logger constructed with this sink emits nothing and, per the log namespace doc header, does no work at all.
 * Thread-safe.
 *
 * @return See above.
 */
std::ostream& discard_sink();

/**
 * Returns an Option setting the minimum level.  Default: Level::S_INFO.
 *
 * @param level
 *        The minimum level of messages that will be emitted.
 * @return See above.
 */
Option with_level(Level level);

/**
 * Returns an Option setting the time stamp format.  Default: #S_TIME_FORMAT_RFC3339.
 *
 * @param format
 *        strftime-style pattern as understood by `fmt`'s `std::tm` formatter, applied to the UTC calendar time.
 *        A pattern `fmt` rejects is not an error: the time stamp field then shows the pattern itself.
 * @return See above.
 */
Option time_format(util::String_view format);

/**
 * Returns an Option replacing the time source.  Default: `Wall_clock::now()`.
 *
 * @param clock
 *        The time source.  An empty function means the default.
 * @return See above.
 */
Option time_func(Clock_func clock);

/**
 * Returns an Option setting the initial prefix.  Default: none.
 *
 * @param prefix
 *        The prefix; empty means none.
 * @return See above.
 */
Option prefix(std::string prefix);

/**
 * Stores a Logger in a Log_scope, replacing any Logger stored there (or inherited from the scope it was copied from).
 *
 * @param scope
 *        The scope.  Must not be null.
 * @param logger
 *        The Logger; a copy is stored, sharing the original's sink and mutex.
 */
void bind_to_scope(Log_scope* scope, const Logger& logger);

/**
 * Returns the Logger stored in a Log_scope; or, if none was ever stored, a default Logger writing to `std::cerr`
 * with default configuration.  Never fails.
 *
 * @param scope
 *        The scope.
 * @return See above.
 */
Logger logger_from_scope(const Log_scope& scope);

// Template implementations.

constexpr bool should_emit(Level configured, Level attempted)
{
  return static_cast<int>(attempted) >= static_cast<int>(configured);
}

} // namespace linelog::log
