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
#include "linelog/log/log_scope.hpp"
#include <cassert>
#include <iostream>

namespace linelog::log
{

// Log_scope implementations.

Log_scope::Log_scope() = default;

void Log_scope::set_logger(const Logger& logger)
{
  m_logger = logger;
}

const Logger* Log_scope::get_logger() const
{
  return m_logger ? &(*m_logger) : nullptr;
}

void Log_scope::swap(Log_scope& other)
{
  using std::swap;

  swap(m_logger, other.m_logger);
}

// Free function implementations.

void swap(Log_scope& val1, Log_scope& val2)
{
  val1.swap(val2);
}

void bind_to_scope(Log_scope* scope, const Logger& logger)
{
  assert(scope);
  scope->set_logger(logger);
}

Logger logger_from_scope(const Log_scope& scope)
{
  const auto logger = scope.get_logger();
  if (logger)
  {
    return *logger;
  }
  // else

  /* Nothing bound: the default Logger.  One object, so every fallback user shares its mutex, and lines of theirs to
   * std::cerr never interleave. */
  static const Logger s_default_logger(std::cerr);
  return s_default_logger;
}

} // namespace linelog::log
