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

#include <chrono>
#include <functional>

/* We build in C++17 mode ourselves, and the public headers use `std::variant`, `std::optional`, fold expressions
 * and `if constexpr`; so there's no point in letting an older compile mode get further than this. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any linelog/ API headers, use C++17 compile mode or later."
#endif

// Macros.  These (conceptually) belong to the `linelog` namespace (hence the prefix for each macro).

#ifdef LINELOG_DOXYGEN_ONLY // Compiler ignores; Doxygen sees.

/// Macro that is defined if and only if the compiling environment is Linux.
#  define LINELOG_OS_LINUX

/// Macro that is defined if and only if the compiling environment is Mac OS X or higher macOS.
#  define LINELOG_OS_MAC

#else // if !defined(LINELOG_DOXYGEN_ONLY)

#  ifdef __linux__
#    define LINELOG_OS_LINUX
#  elif defined(__APPLE__)
#    define LINELOG_OS_MAC
#  endif

#endif // elif !defined(LINELOG_DOXYGEN_ONLY)

/**
 * Catch-all namespace for the linelog project: a leveled, human-readable line logger for command-line programs.
 *
 * The library is organized in modules, each a sub-namespace:
 *   - linelog::log: the Logger itself, its severity levels, attribute (`key=value`) formatting, and the
 *     scope-binding facility for handing a Logger down a call chain.
 *   - linelog::style: terminal styling of the semantic parts of a log line (time stamp, level, prefix, keys).
 *   - linelog::util: small general-use facilities shared by the above (mutex/thread short-hands, `String_view`,
 *     `String_ostream`).
 *
 * The types just below are outside any module for brevity, as they are used all over.
 */
namespace linelog
{

// Types.

/**
 * Clock used for the time stamps of log lines.  `system_clock` is UTC-based (not counting leap seconds), which is
 * what a log line time stamp wants.
 */
using Wall_clock = std::chrono::system_clock;

/// A time point as returned by `Wall_clock::now()`.
using Wall_time_pt = Wall_clock::time_point;

// See just below.
template<typename Signature>
class Function;

/**
 * Intended as the polymorphic function wrapper of choice for linelog, internally and externally; to be used
 * instead of `std::function` or `boost::function`.  Due to ubiquitous use of such function-object wrappers,
 * this is one of the few direct non-`namespace`d members of `namespace linelog`.
 *
 * It adds the `boost::function`-style empty() on top of `std::function`; otherwise it *is* an `std::function`.
 *
 * @tparam Result
 *         See `std::function`.
 * @tparam Args
 *         See `std::function`.
 */
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  // Types.

  /// Short-hand for the base.  We add no data of our own in this subclass, just empty().
  using Function_base = std::function<Result (Args...)>;

  // Ctors/destructor.

  /// Inherit all the constructors from #Function_base.  Add none of our own.
  using Function_base::Function_base;

  // Methods.

  /**
   * Returns `!bool(*this)`; i.e., `true` if and only if `*this` has no target.
   *
   * @return See above.
   */
  bool empty() const noexcept;
}; // class Function<Result (Args...)>

// Template implementations.

template<typename Result, typename... Args>
bool Function<Result (Args...)>::empty() const noexcept
{
  return !*this;
}

} // namespace linelog
