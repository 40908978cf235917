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
#include "linelog/log/attr.hpp"
#include "linelog/log/config.hpp"
#include <boost/shared_ptr.hpp>
#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace linelog::log
{

// Types.

/**
 * The logger: writes one human-readable line per enabled log call to an `ostream` sink.  See the log namespace doc
 * header for the line format and the general philosophy.
 *
 * ### Value semantics; derivation ###
 * A Logger is a small value: copy it freely (e.g., into objects or Log_scope) and pass it by value or `const&`.
 * After construction it never changes.  To log with more context, derive a new Logger: with() adds persistent
 * attributes, prefixed() sets the prefix.  A derived Logger (like a plain copy) shares the original's sink and its
 * mutex; therefore lines written through any Logger of one "family" never interleave.  Loggers constructed
 * separately on the same sink have separate mutexes; this is not recommended.
 *
 * ### Attributes ###
 * The logging methods and with() take, after the message, any number of `key, value, key, value, ...` arguments,
 * each of a type convertible to Attr_value (strings, integers, floating-point, `bool`, `std::chrono::duration`s,
 * `std::vector<std::string>`, Attr).  A key is normally a string, but it's formatted the same way as a value.  An
 * odd-length list is not an error: the last key's value is shown as #S_MISSING_VALUE.  The persistent list (from
 * with()) and the list given to the logging call are each padded that way, separately, the persistent one first.
 *
 * ### Performance ###
 * If the level is disabled (see enabled()) or the sink is discard_sink(), a logging method returns before doing
 * anything else at all; in particular it does not convert its attribute arguments, read the clock or touch the
 * buffer pool.  So it is fine to leave many debug() calls in hot code.  Otherwise the line is assembled without
 * the lock, in a buffer from detail::Buffer_pool; then the lock is held only for writing it to the sink (and
 * flushing).  A slow sink blocks every thread logging through the family for that long.
 *
 * ### Thread safety ###
 * All `const` methods are safe to call concurrently on the same Logger, and on Loggers of one family.  Assigning to
 * a Logger object that another thread is using is not safe (as for any value type).
 *
 * ### Errors ###
 * None, ever.  If the sink is configured to throw on failure (`exceptions()`), the resulting `std::ios_base::failure`
 * is caught and ignored; the sink's error state remains for the user to inspect.
 */
class Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs a Logger writing to the given sink, configured per `config`.
   *
   * @param sink
   *        Where lines go.  The caller must keep it alive for as long as this Logger, or any Logger derived from
   *        it, exists.  If it is discard_sink(), the Logger does nothing.
   * @param config
   *        Configuration; see Config.  Not saved (the needed values are copied).
   */
  explicit Logger(std::ostream& sink, const Config& config = Config());

  // Methods.

  /**
   * Logs a Level::S_DEBUG line, if enabled.
   *
   * @tparam Kv
   *         Types convertible to Attr_value.
   * @param msg
   *        Message, output verbatim (not quoted or escaped).
   * @param kv
   *        `key, value, ...` attribute list; see class doc header.
   */
  template<typename... Kv>
  void debug(util::String_view msg, Kv&&... kv) const;

  /**
   * Logs a Level::S_INFO line, if enabled.  See debug().
   *
   * @tparam Kv
   *         See debug().
   * @param msg
   *        See debug().
   * @param kv
   *        See debug().
   */
  template<typename... Kv>
  void info(util::String_view msg, Kv&&... kv) const;

  /**
   * Logs a Level::S_WARN line, if enabled.  See debug().
   *
   * @tparam Kv
   *         See debug().
   * @param msg
   *        See debug().
   * @param kv
   *        See debug().
   */
  template<typename... Kv>
  void warn(util::String_view msg, Kv&&... kv) const;

  /**
   * Logs a Level::S_ERROR line, if enabled.  See debug().
   *
   * @tparam Kv
   *         See debug().
   * @param msg
   *        See debug().
   * @param kv
   *        See debug().
   */
  template<typename... Kv>
  void error(util::String_view msg, Kv&&... kv) const;

  /**
   * Returns a Logger identical to `*this` except that the given attributes are appended to its persistent attribute
   * list; these are output on every line it logs, before the logging call's own attributes.  `*this` is unchanged.
   *
   * @tparam Kv
   *         Types convertible to Attr_value.
   * @param kv
   *        `key, value, ...` attribute list.  May be odd-length (see class doc header).
   * @return See above.  Shares the sink and mutex of `*this`.
   */
  template<typename... Kv>
  Logger with(Kv&&... kv) const;

  /**
   * Returns a Logger identical to `*this` except for the prefix, which is replaced.  `*this` is unchanged.
   *
   * @param prefix
   *        The new prefix; empty means none.
   * @return See above.  Shares the sink and mutex of `*this`.
   */
  Logger prefixed(std::string prefix) const;

  /**
   * Returns `true` if and only if a line of the given level would be output: the sink is not discard_sink(), and
   * should_emit() says so.
   *
   * @param level
   *        The level of a would-be message.
   * @return See above.
   */
  bool enabled(Level level) const;

  /**
   * The minimum level of emitted lines.
   * @return See above.
   */
  Level level() const;

  /**
   * The prefix; empty if none.
   * @return See above.
   */
  const std::string& prefix() const;

  /**
   * Returns `true` if and only if the sink is discard_sink().
   * @return See above.
   */
  bool is_discard() const;

private:
  // Methods.

  /**
   * Helper of the logging methods: the fast reject, then conversion of the attribute arguments and log().
   *
   * @tparam Kv
   *         See debug().
   * @param level
   *        Level of the message.
   * @param msg
   *        See debug().
   * @param kv
   *        See debug().
   */
  template<typename... Kv>
  void log_if_enabled(Level level, util::String_view msg, Kv&&... kv) const;

  /**
   * Assembles and writes one line.  Must be called only if enabled().
   *
   * @param level
   *        Level of the message.
   * @param msg
   *        Message.
   * @param call_kv
   *        The call's attribute list.  May be null if `n_call_kv == 0`.
   * @param n_call_kv
   *        Size of `call_kv` array.
   */
  void log(Level level, util::String_view msg, const Attr_value* call_kv, size_t n_call_kv) const;

  /**
   * Appends the (styled) time stamp for now to `*target`.
   *
   * @param target
   *        Line being assembled.  Must not be null.
   */
  void append_time_stamp(std::string* target) const;

  // Data.

  /// The sink.  Not null.  Pointer (not reference) so that Logger is assignable.
  std::ostream* m_sink;

  /// Protects writes to #m_sink; shared by all Loggers of the family.  Not null.
  boost::shared_ptr<util::Mutex_non_recursive> m_sink_mutex;

  /// Time source.  Not empty.
  Clock_func m_clock;

  /// The configured time format, kept as-is for the fallback when `fmt` rejects it.
  std::string m_time_format;

  /// `fmt` replacement field built from #m_time_format once, at construction: `{:<format>}`.
  std::string m_time_format_spec;

  /// Whether #m_time_format is #S_TIME_FORMAT_KITCHEN, whose hour is shown without a leading zero.
  bool m_is_kitchen_time;

  /// See level().
  Level m_level;

  /// See prefix().
  std::string m_prefix;

  /// Persistent attribute list (flat `key, value, ...`; possibly odd-length).
  std::vector<Attr_value> m_attrs;

  /// See is_discard().  Computed once, at construction.
  bool m_is_discard;
}; // class Logger

// Free functions: in *_fwd.hpp; and the following template.

/**
 * Constructs a Logger from a sink and zero or more Option values, applied in order to a default Config.
 * E.g.: `auto logger = make_logger(std::cerr, with_level(Level::S_DEBUG), prefix("build"));`.
 *
 * @tparam Options
 *         Each convertible to #Option.
 * @param sink
 *        See Logger constructor.
 * @param options
 *        The options.
 * @return See above.
 */
template<typename... Options>
Logger make_logger(std::ostream& sink, Options&&... options);

// Template implementations.

template<typename... Kv>
void Logger::debug(util::String_view msg, Kv&&... kv) const
{
  log_if_enabled(Level::S_DEBUG, msg, std::forward<Kv>(kv)...);
}

template<typename... Kv>
void Logger::info(util::String_view msg, Kv&&... kv) const
{
  log_if_enabled(Level::S_INFO, msg, std::forward<Kv>(kv)...);
}

template<typename... Kv>
void Logger::warn(util::String_view msg, Kv&&... kv) const
{
  log_if_enabled(Level::S_WARN, msg, std::forward<Kv>(kv)...);
}

template<typename... Kv>
void Logger::error(util::String_view msg, Kv&&... kv) const
{
  log_if_enabled(Level::S_ERROR, msg, std::forward<Kv>(kv)...);
}

template<typename... Kv>
void Logger::log_if_enabled(Level level, util::String_view msg, Kv&&... kv) const
{
  if (!enabled(level))
  {
    return; // The arguments stay unconverted: a disabled call costs this check and nothing else.
  }
  // else

  if constexpr (sizeof...(Kv) == 0)
  {
    log(level, msg, nullptr, 0);
  }
  else
  {
    const std::array<Attr_value, sizeof...(Kv)> call_kv{{ Attr_value(std::forward<Kv>(kv))... }};
    log(level, msg, call_kv.data(), call_kv.size());
  }
}

template<typename... Kv>
Logger Logger::with(Kv&&... kv) const
{
  Logger derived(*this);
  derived.m_attrs.reserve(m_attrs.size() + sizeof...(Kv));
  (derived.m_attrs.emplace_back(std::forward<Kv>(kv)), ...);
  return derived;
}

template<typename... Options>
Logger make_logger(std::ostream& sink, Options&&... options)
{
  Config config;
  (Option(std::forward<Options>(options))(&config), ...);
  return Logger(sink, config);
}

} // namespace linelog::log
