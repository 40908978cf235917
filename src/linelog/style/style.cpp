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
#include "linelog/style/style.hpp"
#include "linelog/util/fmt.hpp"
#include <atomic>
#include <cassert>
#include <cstdlib>
#include <cstring>
#include <iterator>
#if defined(LINELOG_OS_LINUX) || defined(LINELOG_OS_MAC)
#  include <unistd.h>
#else
#  error "Terminal detection (isatty()) is implemented for Linux and macOS only."
#endif

namespace linelog::style
{

namespace
{

/**
 * Computes the initial value of the process-wide switch from the environment.
 *
 * @return See style namespace doc header.
 */
bool styling_wanted_by_environment()
{
  using std::getenv;
  using std::strcmp;

  if (getenv("NO_COLOR"))
  {
    return false;
  }
  // else
  const char* const term = getenv("TERM");
  if (term && (strcmp(term, "dumb") == 0))
  {
    return false;
  }
  // else
  return ::isatty(STDERR_FILENO) == 1;
}

/**
 * The process-wide switch.  A function-local static, so the environment is consulted on first use, not during static
 * initialization of some unrelated translation unit.
 *
 * @return Reference to the switch.
 */
std::atomic<bool>& enabled_switch()
{
  static std::atomic<bool> s_enabled(styling_wanted_by_environment());
  return s_enabled;
}

/**
 * The fixed terminal style of each role.
 *
 * @param role
 *        Role.
 * @return See above.
 */
fmt::text_style text_style_of(Role role)
{
  using fmt::emphasis;
  using fmt::fg;
  using fmt::terminal_color;

  switch (role)
  {
    case Role::S_TIMESTAMP: return emphasis::faint;
    case Role::S_PREFIX: return emphasis::faint | emphasis::bold;
    case Role::S_KEY: return fg(terminal_color::magenta);
    case Role::S_DEBUG: return fg(terminal_color::blue) | emphasis::bold;
    case Role::S_INFO: return fg(terminal_color::cyan) | emphasis::bold;
    case Role::S_WARN: return fg(terminal_color::yellow) | emphasis::bold;
    case Role::S_ERROR: return fg(terminal_color::red) | emphasis::bold;
  }
  return fmt::text_style(); // Corrupt Role value: no styling.  gcc would've caught an incomplete switch().
}

} // Anonymous namespace

bool enabled()
{
  return enabled_switch().load(std::memory_order_relaxed);
}

void set_enabled(bool enable)
{
  enabled_switch().store(enable, std::memory_order_relaxed);
}

void append(std::string* target, Role role, util::String_view text)
{
  assert(target);

  if (!enabled())
  {
    target->append(text);
    return;
  }
  // else
  fmt::format_to(std::back_inserter(*target), text_style_of(role), "{}", text);
}

std::string apply(Role role, util::String_view text)
{
  std::string result;
  append(&result, role, text);
  return result;
}

} // namespace linelog::style
