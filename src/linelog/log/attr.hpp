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
#include <boost/shared_ptr.hpp>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace linelog::log
{

// Types.

/**
 * A named value usable as a single attribute value: its text is `key=value`.  This is the structured key/value
 * pair among the Attr_value kinds; e.g., `logger.info("Searing steak", "step", Attr("cook", "rare"))` yields
 * `step=cook=rare`.
 *
 * The value is held by ref-counted pointer, because Attr_value can itself hold an Attr; copies of an Attr share
 * the (immutable) value.
 */
struct Attr
{
  // Constructors/destructor.

  /**
   * Constructs the pair.
   *
   * @param key
   *        The name.  Output as-is.
   * @param value
   *        The value.
   */
  explicit Attr(std::string key, Attr_value value);

  // Data.

  /// The name.
  std::string m_key;

  /// The value.  Not null.
  boost::shared_ptr<const Attr_value> m_value;
}; // struct Attr

/**
 * A value (or key) of a `key=value` attribute: one of a closed set of kinds, each with one fixed text rendering
 * (see to_string()).  Implicitly constructible from each kind, so that Logger's logging methods can take
 * heterogeneous `key, value, key, value, ...` arguments.
 *
 * | C++ argument                       | Kind held      | Text                                  |
 * |------------------------------------|----------------|---------------------------------------|
 * | `const char*`, `std::string`, view | `std::string`  | verbatim                              |
 * | signed integer types               | `int64_t`      | decimal                               |
 * | unsigned integer types             | `uint64_t`     | decimal                               |
 * | `float`, `double`, `long double`   | `double`       | shortest round-trip decimal           |
 * | `bool`                             | `bool`         | `true` / `false`                      |
 * | any `std::chrono::duration`        | #Duration      | `57ms`, `30s`, `2m0s`, `1h2m3.5s`...  |
 * | `std::vector<std::string>`         | #Sequence      | `[a b c]`                             |
 * | Attr                               | Attr           | `key=value`                           |
 *
 * Other types are rejected at compile time.
 */
class Attr_value
{
public:
  // Types.

  /// The sequence-of-strings kind.
  using Sequence = std::vector<std::string>;

  /// The sum type actually stored.
  using Variant = std::variant<std::string, int64_t, uint64_t, double, bool, Duration, Sequence, Attr>;

  // Constructors/destructor.

  /**
   * Holds a string.
   * @param str
   *        NUL-terminated string.  Must not be null.
   */
  Attr_value(const char* str);

  /**
   * Holds a string.
   * @param str
   *        String.
   */
  Attr_value(util::String_view str);

  /**
   * Holds a string.
   * @param str
   *        String.
   */
  Attr_value(std::string str);

  /**
   * Holds a `bool`.
   * @param val
   *        Value.
   */
  Attr_value(bool val);

  /**
   * Holds an integer, as `int64_t` or `uint64_t` depending on the signedness of `Integer`.
   *
   * @tparam Integer
   *         Integer type other than `bool`.
   * @param val
   *        Value.
   */
  template<typename Integer,
           std::enable_if_t<std::is_integral_v<Integer> && (!std::is_same_v<Integer, bool>), int> = 0>
  Attr_value(Integer val);

  /**
   * Holds a floating-point value as `double`.
   *
   * @tparam Floating
   *         Floating-point type.
   * @param val
   *        Value.
   */
  template<typename Floating, std::enable_if_t<std::is_floating_point_v<Floating>, int> = 0>
  Attr_value(Floating val);

  /**
   * Holds a duration, converted to #Duration (truncating toward zero below nanoseconds).
   *
   * @tparam Rep
   *         See `std::chrono::duration`.
   * @tparam Period
   *         See `std::chrono::duration`.
   * @param val
   *        Value.
   */
  template<typename Rep, typename Period>
  Attr_value(std::chrono::duration<Rep, Period> val);

  /**
   * Holds a sequence of strings.
   * @param seq
   *        Value.
   */
  Attr_value(Sequence seq);

  /**
   * Holds a nested key/value pair.
   * @param attr
   *        Value.
   */
  Attr_value(Attr attr);

  // Methods.

  /**
   * Read-only access to the held value, e.g., for `std::visit()`.
   *
   * @return See above.
   */
  const Variant& variant() const;

private:
  // Data.

  /// The held value.
  Variant m_variant;
}; // class Attr_value

// Free functions.

/**
 * Appends the default text representation of `val` (see Attr_value doc header) to `*target`.  Never quoted; the
 * quoting rule is applied only by format_attr() to a value as a whole.
 *
 * @param target
 *        String to which to append.  Must not be null.
 * @param val
 *        Value.
 */
void append_text(std::string* target, const Attr_value& val);

/**
 * Returns the default text representation of `val`.  Same as append_text() to an empty string.
 *
 * @param val
 *        Value.
 * @return See above.
 */
std::string to_string(const Attr_value& val);

/**
 * Prints to_string() of `val`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Attr_value& val);

/**
 * Returns whether `text`, as an attribute value, must be quoted: it is empty; or it contains a whitespace character,
 * a non-printable character (including the Unicode replacement character), or a byte sequence that is not valid
 * UTF-8.
 *
 * Printability of non-ASCII code points follows the general categories (control, format, separator, private use
 * and noncharacters are non-printable); unassigned code points are treated as printable.
 *
 * @param text
 *        The would-be value text.
 * @return See above.
 */
bool needs_quotes(util::String_view text);

/**
 * Appends `text` to `*target` in double quotes, escaping as follows: `"` and `\` are backslash-escaped;
 * BEL, BS, FF, LF, CR, TAB, VT become `\a \b \f \n \r \t \v`; other ASCII control characters and DEL become `\xNN`;
 * each byte of an invalid UTF-8 sequence becomes `\xNN`; other non-printable code points become `\uNNNN` or
 * `\UNNNNNNNN`; everything else is copied as-is.
 *
 * @param target
 *        String to which to append.  Must not be null.
 * @param text
 *        Text to quote.
 */
void append_quoted(std::string* target, util::String_view text);

/**
 * Returns append_quoted() of `text` to an empty string.
 *
 * @param text
 *        Text to quote.
 * @return See above.
 */
std::string quote(util::String_view text);

/**
 * The attribute formatter: appends `key=value` to `*target`.  The key's text is styled as style::Role::S_KEY and
 * never quoted.  The value's text is quoted (see append_quoted()) if and only if needs_quotes() says so; the rule
 * applies identically whatever the value's kind.
 *
 * @param target
 *        String to which to append.  Must not be null.
 * @param key
 *        The key.
 * @param value
 *        The value.
 */
void format_attr(std::string* target, const Attr_value& key, const Attr_value& value);

// Template implementations.

template<typename Integer, std::enable_if_t<std::is_integral_v<Integer> && (!std::is_same_v<Integer, bool>), int>>
Attr_value::Attr_value(Integer val) :
  m_variant(std::in_place_type<std::conditional_t<std::is_signed_v<Integer>, int64_t, uint64_t>>, val)
{
  // Nothing else.
}

template<typename Floating, std::enable_if_t<std::is_floating_point_v<Floating>, int>>
Attr_value::Attr_value(Floating val) :
  m_variant(std::in_place_type<double>, static_cast<double>(val))
{
  // Nothing else.
}

template<typename Rep, typename Period>
Attr_value::Attr_value(std::chrono::duration<Rep, Period> val) :
  m_variant(std::in_place_type<Duration>, std::chrono::duration_cast<Duration>(val))
{
  // Nothing else.
}

} // namespace linelog::log
