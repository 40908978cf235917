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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>
#include <string>

namespace linelog::util
{

/**
 * An `ostream` appending into an `std::string` it owns, with direct read access to that string.
 * `ostringstream` is fine, except for the giant flaw that the only way to read its string is `str()` which returns
 * a copy.
 *
 * Typical use is as a log::Logger sink in code that wants to inspect what was logged: pass os() as the sink and
 * read str() afterwards.  log::Logger flushes after each line, so str() is current after each logging call returns.
 *
 * ### Thread safety ###
 * Same as `ostringstream`: no concurrent read/write access to the same object.  (Writes through a log::Logger are
 * serialized by the Logger's own mutex; reads must not race those writes.)
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Wraps a newly created empty string.
  String_ostream();

  // Methods.

  /**
   * Access to stream that will write to owned string.
   *
   * @return Stream.
   */
  std::ostream& os();

  /**
   * Read-only access to the string being wrapped.  Anything written to os() but not yet flushed is not included.
   *
   * @return Read-only reference to string; the address therein is guaranteed to always be the same given a `*this`.
   */
  const std::string& str() const;

  /// Performs `std::string::clear()` on the object returned by str().
  void str_clear();

private:
  // Types.

  /// Short-hand for an `ostream` writing to which will append to an std::string it is adapting.
  using String_appender_ostream = boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>>;

  // Data.

  /// The target string.
  std::string m_target;

  /// Inserter into #m_target.
  boost::iostreams::back_insert_device<std::string> m_target_inserter;

  /// Appender `ostream` into #m_target by way of #m_target_inserter.
  String_appender_ostream m_target_appender_ostream;
}; // class String_ostream

} // namespace linelog::util
