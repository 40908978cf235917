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
#include "linelog/log/logger.hpp"
#include <optional>

namespace linelog::log
{

// Types.

/**
 * A request- or operation-scoped holder of a Logger, to pass down a call chain in place of the Logger itself, so
 * that code deep in the chain logs with whatever context (attributes, prefix) the code above it bound, without a
 * process-wide mutable logger.  Use bind_to_scope() to store and logger_from_scope() to retrieve; the latter never
 * fails, falling back to a default `std::cerr` Logger.
 *
 * Scopes nest by copying: a copy of a scope (the "child") starts with its parent's binding and can then bind its own
 * without affecting the parent.
 *
 *   ~~~
 *   void handle(const log::Log_scope& parent, const Request& req)
 *   {
 *     log::Log_scope scope(parent);
 *     log::bind_to_scope(&scope, log::logger_from_scope(parent).with("request_id", req.m_id));
 *     do_work(scope); // Lines logged in there carry request_id=...
 *   }
 *   ~~~
 *
 * ### Thread safety ###
 * As for any value type: concurrent reads are fine; a write concurrent with anything else is not.
 */
class Log_scope
{
public:
  // Constructors/destructor.

  /// Constructs a scope with no Logger bound.
  Log_scope();

  // Methods.

  /**
   * Stores a copy of `logger`, replacing any currently stored.  Same as bind_to_scope().
   *
   * @param logger
   *        The Logger.
   */
  void set_logger(const Logger& logger);

  /**
   * Returns pointer to the stored Logger; or null if none was bound (in `*this` or the scope it was copied from).
   *
   * @return See above.  Valid until `*this` is modified or destroyed.
   */
  const Logger* get_logger() const;

  /**
   * Swaps the bindings of `*this` and `other`.
   *
   * @param other
   *        Other object.
   */
  void swap(Log_scope& other);

private:
  // Data.

  /// The bound Logger, if any.
  std::optional<Logger> m_logger;
}; // class Log_scope

// Free functions: in *_fwd.hpp; and the following.

/**
 * Log_scope::swap() wrapper.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_scope& val1, Log_scope& val2);

} // namespace linelog::log
