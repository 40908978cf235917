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
#include "linelog/log/logger.hpp"
#include "linelog/log/detail/buffer_pool.hpp"
#include "linelog/style/style.hpp"
#include "linelog/util/fmt.hpp"
#include <boost/iostreams/device/null.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>
#include <cassert>
#include <iterator>

namespace linelog::log
{

namespace
{

/**
 * Returns the value shown for a key left without one.
 *
 * @return See above.
 */
const Attr_value& missing_value()
{
  static const Attr_value s_missing(S_MISSING_VALUE);
  return s_missing;
}

/**
 * Appends to `*target` the given flat `key, value, ...` list, each pair preceded by a space; pads an odd-length
 * list with missing_value().
 *
 * @param target
 *        Line being assembled.  Must not be null.
 * @param kv
 *        The list.  May be null if `n_kv == 0`.
 * @param n_kv
 *        Size of `kv` array.
 */
void append_attrs(std::string* target, const Attr_value* kv, size_t n_kv)
{
  for (size_t idx = 0; idx < n_kv; idx += 2)
  {
    target->push_back(' ');
    format_attr(target, kv[idx], ((idx + 1) < n_kv) ? kv[idx + 1] : missing_value());
  }
}

/**
 * Appends to `*target` the level label, styled with the level's role; a level with no label of its own
 * (`unknown`) is not styled.
 *
 * @param target
 *        Line being assembled.  Must not be null.
 * @param level
 *        Level.
 */
void append_level(std::string* target, Level level)
{
  using style::Role;

  Role role;
  switch (level)
  {
    case Level::S_DEBUG: role = Role::S_DEBUG; break;
    case Level::S_INFO: role = Role::S_INFO; break;
    case Level::S_WARN: role = Role::S_WARN; break;
    case Level::S_ERROR: role = Role::S_ERROR; break;
    default:
      target->append(level_label(level));
      return;
  }
  style::append(target, role, level_label(level));
}

} // Anonymous namespace

// Logger implementations.

Logger::Logger(std::ostream& sink, const Config& config) :
  m_sink(&sink),
  m_sink_mutex(boost::make_shared<util::Mutex_non_recursive>()),
  m_clock(config.m_clock.empty() ? Clock_func(&Wall_clock::now) : config.m_clock),
  m_time_format(config.m_time_format),
  m_time_format_spec("{:" + m_time_format + '}'),
  m_is_kitchen_time(m_time_format == S_TIME_FORMAT_KITCHEN),
  m_level(config.m_level),
  m_prefix(config.m_prefix),
  m_is_discard(&sink == &discard_sink())
{
  // Nothing else.
}

bool Logger::enabled(Level level) const
{
  return (!m_is_discard) && should_emit(m_level, level);
}

Level Logger::level() const
{
  return m_level;
}

const std::string& Logger::prefix() const
{
  return m_prefix;
}

bool Logger::is_discard() const
{
  return m_is_discard;
}

Logger Logger::prefixed(std::string prefix) const
{
  Logger derived(*this);
  derived.m_prefix = std::move(prefix);
  return derived;
}

void Logger::log(Level level, util::String_view msg, const Attr_value* call_kv, size_t n_call_kv) const
{
  assert(enabled(level));
  assert(call_kv || (n_call_kv == 0));

  detail::Pooled_buffer buf;
  auto& line = *(buf.get());

  append_time_stamp(&line);
  line.push_back(' ');
  append_level(&line, level);
  if (!m_prefix.empty())
  {
    line.push_back(' ');
    style::append(&line, style::Role::S_PREFIX, m_prefix);
  }
  line += ": ";
  line.append(msg.data(), msg.size());

  append_attrs(&line, m_attrs.data(), m_attrs.size());
  append_attrs(&line, call_kv, n_call_kv);
  line.push_back('\n');

  // Line ready.  Only the write itself needs the lock: one write() per line, so lines never interleave.
  util::Lock_guard<util::Mutex_non_recursive> lock(*m_sink_mutex);
  try
  {
    m_sink->write(line.data(), line.size());
    m_sink->flush();
  }
  catch (const std::ios_base::failure&)
  {
    /* The sink has exceptions() enabled and failed.  Logging must not change the caller's control flow; the
     * stream's error state is still there for the owner of the sink to see. */
  }
} // Logger::log()

void Logger::append_time_stamp(std::string* target) const
{
  fmt::memory_buffer stamp; // Inline storage; no heap allocation for any sane format.
  try
  {
    fmt::format_to(std::back_inserter(stamp), fmt::runtime(m_time_format_spec), fmt::gmtime(m_clock()));
    if (m_is_kitchen_time && (stamp.size() != 0) && (stamp[0] == '0'))
    {
      // `%I` zero-pads; the kitchen form does not.  (Hours run 01-12, so a digit always follows.)
      std::copy(stamp.begin() + 1, stamp.end(), stamp.begin());
      stamp.resize(stamp.size() - 1);
    }
  }
  catch (const fmt::format_error&)
  {
    // Pattern rejected by fmt (or time not representable): show the pattern itself.
    stamp.clear();
    stamp.append(m_time_format.data(), m_time_format.data() + m_time_format.size());
  }

  style::append(target, style::Role::S_TIMESTAMP, util::String_view(stamp.data(), stamp.size()));
}

// Free function implementations.

std::ostream& discard_sink()
{
  // Thread-safe on-demand init.  Never destroyed before any Logger using it, as it's destroyed at process exit.
  static boost::iostreams::stream<boost::iostreams::null_sink> s_discard_sink{boost::iostreams::null_sink()};
  return s_discard_sink;
}

} // namespace linelog::log
