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
#include "linelog/log/attr.hpp"
#include "linelog/style/style.hpp"
#include "linelog/util/fmt.hpp"
#include <boost/locale/utf.hpp>
#include <boost/make_shared.hpp>
#include <cassert>
#include <iterator>
#include <ostream>
#include <utility>

namespace linelog::log
{

namespace
{

using Code_point = boost::locale::utf::code_point;

/// Unicode replacement character.  Its presence means quoting, whether it came from bad input or not.
constexpr Code_point S_REPLACEMENT_CHAR = 0xFFFD;

/**
 * Returns whether a (valid, decoded) code point is printable in the sense of needs_quotes() doc header: a letter,
 * mark, number, punctuation or symbol, or the ASCII space.  Unassigned code points, controls, format characters,
 * surrogates, private use and every separator other than U+0020 are not.
 *
 * @param cp
 *        Code point.
 * @return See above.
 */
bool is_printable(Code_point cp)
{
  if (cp < 0x80)
  {
    return (cp >= 0x20) && (cp < 0x7F);
  }
  // else
  // fmt's Unicode table, the one behind its `{:?}` escaping, classifies code points this way.
  return fmt::detail::is_printable(uint32_t(cp));
}

/**
 * Returns whether an ASCII code point is whitespace.  (Every non-ASCII whitespace code point is also non-printable
 * per is_printable(), so only ASCII needs a separate check.)
 *
 * @param cp
 *        Code point.
 * @return See above.
 */
bool is_ascii_space(Code_point cp)
{
  return (cp == ' ') || (cp == '\t') || (cp == '\n') || (cp == '\v') || (cp == '\f') || (cp == '\r');
}

/**
 * Decodes one code point of UTF-8 at `*pos`, advancing it.  On an invalid or truncated sequence advances by exactly
 * one byte and returns `illegal`, so each bad byte is reported (and escaped) separately.
 *
 * @param pos
 *        Current position; advanced.
 * @param end
 *        End of text.
 * @return Code point or `boost::locale::utf::illegal`.
 */
Code_point decode_utf8(util::String_view::const_iterator* pos, util::String_view::const_iterator end)
{
  using boost::locale::utf::utf_traits;
  using boost::locale::utf::illegal;
  using boost::locale::utf::incomplete;

  const auto start = *pos;
  const Code_point cp = utf_traits<char>::decode(*pos, end);
  if ((cp == illegal) || (cp == incomplete))
  {
    *pos = start + 1;
    return illegal;
  }
  return cp;
}

/**
 * Appends the compact text of a duration: whole units `h`, `m` and fractional `s` at or above one second;
 * a single fractional unit of `ms`, `µs` or `ns` below; `0s` for zero.
 *
 * @param target
 *        String to which to append.
 * @param duration
 *        Duration.
 */
void append_duration(std::string* target, Duration duration)
{
  using std::back_inserter;

  // Work in unsigned, so the most negative value negates cleanly.
  const auto count = duration.count();
  uint64_t ns = (count < 0) ? (uint64_t(0) - uint64_t(count)) : uint64_t(count);

  if (ns == 0)
  {
    target->append("0s");
    return;
  }
  // else
  if (count < 0)
  {
    target->push_back('-');
  }

  // Appends `units_total / 10^precision` with the fraction, trailing zeroes (and then a lone '.') dropped.
  const auto append_with_fraction = [&](uint64_t units_total, unsigned int precision)
  {
    uint64_t scale = 1;
    for (unsigned int digit = 0; digit != precision; ++digit)
    {
      scale *= 10;
    }
    fmt::format_to(back_inserter(*target), "{}", units_total / scale);

    uint64_t fraction = units_total % scale;
    if (fraction == 0)
    {
      return;
    }
    // else
    unsigned int width = precision;
    while ((fraction % 10) == 0)
    {
      fraction /= 10;
      --width;
    }
    fmt::format_to(back_inserter(*target), ".{:0{}}", fraction, width);
  }; // const auto append_with_fraction =

  constexpr uint64_t NS_PER_USEC = 1000;
  constexpr uint64_t NS_PER_MSEC = 1000 * NS_PER_USEC;
  constexpr uint64_t NS_PER_SEC = 1000 * NS_PER_MSEC;

  if (ns < NS_PER_USEC)
  {
    append_with_fraction(ns, 0);
    target->append("ns");
  }
  else if (ns < NS_PER_MSEC)
  {
    append_with_fraction(ns, 3);
    target->append("µs"); // Micro sign, as UTF-8.
  }
  else if (ns < NS_PER_SEC)
  {
    append_with_fraction(ns, 6);
    target->append("ms");
  }
  else
  {
    const uint64_t total_secs = ns / NS_PER_SEC;
    const uint64_t hours = total_secs / 3600;
    const uint64_t minutes = (total_secs / 60) % 60;

    if (hours != 0)
    {
      fmt::format_to(back_inserter(*target), "{}h{}m", hours, minutes);
    }
    else if (minutes != 0)
    {
      fmt::format_to(back_inserter(*target), "{}m", minutes);
    }
    // Seconds within the minute, with the sub-second part as fraction.
    append_with_fraction(ns % (60 * NS_PER_SEC), 9);
    target->push_back('s');
  }
} // append_duration()

/**
 * Appends the text of `text` that goes between the quotes; see append_quoted().
 *
 * @param target
 *        String to which to append.
 * @param text
 *        Text.
 */
void append_escaped(std::string* target, util::String_view text)
{
  using boost::locale::utf::illegal;
  using std::back_inserter;

  auto pos = text.begin();
  const auto end = text.end();
  while (pos != end)
  {
    const auto start = pos;
    const Code_point cp = decode_utf8(&pos, end);

    if (cp == illegal)
    {
      fmt::format_to(back_inserter(*target), "\\x{:02x}", static_cast<unsigned char>(*start));
      continue;
    }
    // else
    if ((cp == '"') || (cp == '\\'))
    {
      target->push_back('\\');
      target->push_back(char(cp));
      continue;
    }
    // else
    if (is_printable(cp))
    {
      target->append(start, pos); // Copy the (valid) UTF-8 bytes unchanged.
      continue;
    }
    // else
    switch (cp)
    {
      case '\a': target->append("\\a"); break;
      case '\b': target->append("\\b"); break;
      case '\f': target->append("\\f"); break;
      case '\n': target->append("\\n"); break;
      case '\r': target->append("\\r"); break;
      case '\t': target->append("\\t"); break;
      case '\v': target->append("\\v"); break;
      default:
        if ((cp < ' ') || (cp == 0x7F))
        {
          fmt::format_to(back_inserter(*target), "\\x{:02x}", cp);
        }
        else if (cp < 0x10000)
        {
          fmt::format_to(back_inserter(*target), "\\u{:04x}", cp);
        }
        else
        {
          fmt::format_to(back_inserter(*target), "\\U{:08x}", cp);
        }
    } // switch (cp)
  } // while (pos != end)
} // append_escaped()

} // Anonymous namespace

// Attr implementations.

Attr::Attr(std::string key, Attr_value value) :
  m_key(std::move(key)),
  m_value(boost::make_shared<const Attr_value>(std::move(value)))
{
  // Nothing else.
}

// Attr_value implementations.

Attr_value::Attr_value(const char* str) :
  m_variant(std::in_place_type<std::string>, str)
{
  assert(str);
}

Attr_value::Attr_value(util::String_view str) :
  m_variant(std::in_place_type<std::string>, str)
{
  // Nothing else.
}

Attr_value::Attr_value(std::string str) :
  m_variant(std::in_place_type<std::string>, std::move(str))
{
  // Nothing else.
}

Attr_value::Attr_value(bool val) :
  m_variant(std::in_place_type<bool>, val)
{
  // Nothing else.
}

Attr_value::Attr_value(Sequence seq) :
  m_variant(std::in_place_type<Sequence>, std::move(seq))
{
  // Nothing else.
}

Attr_value::Attr_value(Attr attr) :
  m_variant(std::in_place_type<Attr>, std::move(attr))
{
  // Nothing else.
}

const Attr_value::Variant& Attr_value::variant() const
{
  return m_variant;
}

// Free function implementations.

void append_text(std::string* target, const Attr_value& val)
{
  using std::is_same_v;
  using std::decay_t;

  assert(target);

  std::visit([&](const auto& held)
  {
    using Held = decay_t<decltype(held)>;

    if constexpr(is_same_v<Held, std::string>)
    {
      target->append(held);
    }
    else if constexpr(is_same_v<Held, bool>)
    {
      target->append(held ? "true" : "false");
    }
    else if constexpr(is_same_v<Held, Duration>)
    {
      append_duration(target, held);
    }
    else if constexpr(is_same_v<Held, Attr_value::Sequence>)
    {
      target->push_back('[');
      bool first = true;
      for (const auto& element : held)
      {
        if (!first)
        {
          target->push_back(' ');
        }
        first = false;
        target->append(element);
      }
      target->push_back(']');
    }
    else if constexpr(is_same_v<Held, Attr>)
    {
      target->append(held.m_key);
      target->push_back('=');
      append_text(target, *held.m_value);
    }
    else
    {
      // int64_t, uint64_t, double: fmt's default is decimal, and shortest round-trip for floating point.
      static_assert(std::is_arithmetic_v<Held>, "Attr_value::Variant gained a kind that append_text() lacks.");
      fmt::format_to(std::back_inserter(*target), "{}", held);
    }
  }, val.variant()); // std::visit()
} // append_text()

std::string to_string(const Attr_value& val)
{
  std::string result;
  append_text(&result, val);
  return result;
}

std::ostream& operator<<(std::ostream& os, const Attr_value& val)
{
  return os << to_string(val);
}

bool needs_quotes(util::String_view text)
{
  using boost::locale::utf::illegal;

  if (text.empty())
  {
    return true; // Otherwise `key=` would look like a formatting mistake.
  }
  // else

  auto pos = text.begin();
  const auto end = text.end();
  while (pos != end)
  {
    const Code_point cp = decode_utf8(&pos, end);
    if ((cp == illegal) || (cp == S_REPLACEMENT_CHAR) || is_ascii_space(cp) || (!is_printable(cp)))
    {
      return true;
    }
  }
  return false;
}

void append_quoted(std::string* target, util::String_view text)
{
  assert(target);

  target->push_back('"');
  append_escaped(target, text);
  target->push_back('"');
}

std::string quote(util::String_view text)
{
  std::string result;
  append_quoted(&result, text);
  return result;
}

void format_attr(std::string* target, const Attr_value& key, const Attr_value& value)
{
  using style::Role;

  assert(target);

  // Strings (by far the usual kind, for keys always) need no intermediate copy.
  const auto* const key_str = std::get_if<std::string>(&key.variant());
  if (key_str)
  {
    style::append(target, Role::S_KEY, *key_str);
  }
  else
  {
    style::append(target, Role::S_KEY, to_string(key));
  }

  target->push_back('=');

  const auto* const value_str = std::get_if<std::string>(&value.variant());
  std::string value_text;
  if (!value_str)
  {
    append_text(&value_text, value);
  }
  const util::String_view text = value_str ? util::String_view(*value_str) : util::String_view(value_text);

  if (needs_quotes(text))
  {
    append_quoted(target, text);
  }
  else
  {
    target->append(text);
  }
} // format_attr()

} // namespace linelog::log
