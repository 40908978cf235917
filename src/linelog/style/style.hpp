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
#include <string>

/**
 * linelog module that renders text in terminal styles (ANSI SGR sequences via `fmt/color.h`).
 *
 * The module knows nothing about log lines as such.  log::Logger asks it to style a piece of text in a fixed
 * semantic style::Role (time stamp, level, prefix, attribute key); whether that results in escape sequences or in the
 * text unchanged depends only on the process-wide enabled() switch.
 *
 * ### Process-wide switch ###
 * Styling is on or off for the whole process.  Its initial value is computed on first use: on if and only if
 * standard error is a terminal, the `NO_COLOR` environment variable is unset, and `TERM` is not `dumb`.
 * set_enabled() overrides that at any time (e.g., a `--no-color` flag, or a test that wants deterministic output).
 */
namespace linelog::style
{

// Types.

/// The semantic role of a piece of text; each maps to one fixed terminal style.
enum class Role
{
  /// Time stamp at the start of each line.  Faint.
  S_TIMESTAMP,
  /// Logger prefix between the level and the message.  Faint and bold.
  S_PREFIX,
  /// Key of a `key=value` attribute.  Magenta.
  S_KEY,
  /// Level label of a debug line.  Blue and bold.
  S_DEBUG,
  /// Level label of an info line.  Cyan and bold.
  S_INFO,
  /// Level label of a warning line.  Yellow and bold.
  S_WARN,
  /// Level label of an error line.  Red and bold.
  S_ERROR
}; // enum class Role

// Free functions.

/**
 * Returns whether styling is currently enabled for the process.  Thread-safe.
 *
 * @return See above.
 */
bool enabled();

/**
 * Forces styling on or off for the process, replacing the environment-derived default.  Thread-safe; the change is
 * seen by subsequent styling calls in all threads.
 *
 * @param enable
 *        `true` to emit escape sequences; `false` to pass text through unchanged.
 */
void set_enabled(bool enable);

/**
 * Appends `text` to `*target`, wrapped in the escape sequences for `role` if enabled(), else as-is.
 * Does not clear `*target`; this is the form used on the logging hot path, appending straight into a pooled buffer.
 *
 * @param target
 *        String to which to append.  Must not be null.
 * @param role
 *        Semantic role of `text`.
 * @param text
 *        The text.
 */
void append(std::string* target, Role role, util::String_view text);

/**
 * Returns `text` styled for `role` if enabled(), else a copy of `text`.
 *
 * @param role
 *        Semantic role of `text`.
 * @param text
 *        The text.
 * @return See above.
 */
std::string apply(Role role, util::String_view text);

} // namespace linelog::style
