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
#include <boost/noncopyable.hpp>
#include <boost/thread/tss.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace linelog::log::detail
{

// Types.

/**
 * Internal log class: process-wide pool of line buffers (`std::string`s) for Logger to assemble each line in,
 * so that the steady-state cost of an enabled log call involves no heap allocation for the line.
 *
 * The pool is a collection of per-thread free lists; acquire() and release() touch only the calling thread's list,
 * so they are safe under any amount of concurrency with no locking.  That works because a buffer is always released
 * by the thread that acquired it (see Pooled_buffer, the only intended way to use this class).  Each list is a
 * per-thread singleton: created lazily on the thread's first acquire() and freed by `boost::thread_specific_ptr`
 * when the thread exits.
 *
 * ### Bounded retention ###
 * A buffer is only as big as the biggest line ever assembled in it; left unchecked, one giant line would keep its
 * memory forever, and every later line would pay for carrying it around.  So release() frees, instead of pooling,
 * any buffer whose capacity exceeds #S_MAX_POOLED_CAPACITY; and a thread's list never holds more than
 * #S_MAX_POOLED_PER_THREAD buffers (more than one is only in use at a time if a line's assembly logs, e.g., from a
 * clock function).
 *
 * ### Thread safety ###
 * All methods are static and safe to call concurrently from any threads.
 */
class Buffer_pool :
  private boost::noncopyable
{
public:
  // Constants.

  /// release() frees a buffer with capacity above this instead of pooling it.  About 64 KiB.
  static constexpr size_t S_MAX_POOLED_CAPACITY = size_t(64) << 10;

  /// The most buffers a single thread's free list holds.
  static constexpr size_t S_MAX_POOLED_PER_THREAD = 4;

  /// Capacity reserved in a newly allocated buffer; enough for a typical line.
  static constexpr size_t S_INITIAL_CAPACITY = 256;

  // Methods.

  /**
   * Returns an empty buffer: a pooled one from this thread's free list if available, else a new one.
   *
   * @return See above.  The caller must pass it to release() in this same thread when done.
   */
  static std::string acquire();

  /**
   * Returns a buffer obtained from acquire() (in this thread) to this thread's free list; or frees it (see class doc
   * header).
   *
   * @param buf
   *        The buffer.  Moved-from.
   */
  static void release(std::string&& buf);

  /**
   * Returns how many times acquire() has been called in this thread.
   *
   * @return See above.
   */
  static uint64_t this_thread_acquire_count();

  /**
   * Returns how many buffers this thread's free list holds right now.
   *
   * @return See above.
   */
  static size_t this_thread_pooled_count();

private:
  // Types.

  /// Per-thread state.
  struct Free_list
  {
    /// Buffers available to acquire(); empty, capacity at most #S_MAX_POOLED_CAPACITY.
    std::vector<std::string> m_bufs;

    /// See this_thread_acquire_count().
    uint64_t m_n_acquired = 0;
  };

  // Methods.

  /**
   * Returns this thread's free list, creating it on first use.
   *
   * @return Pointer to the free list, valid until this thread exits.  Not null.
   */
  static Free_list* this_thread_free_list();

  // Data.

  /// Thread-local storage for each thread's free list (lazily set to non-null on 1st access).
  static boost::thread_specific_ptr<Free_list> s_this_thread_free_list;
}; // class Buffer_pool

/**
 * RAII handle of a Buffer_pool buffer: acquires in the constructor, releases in the destructor, so the buffer goes
 * back to the pool on every path out of the scope.
 */
class Pooled_buffer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Acquires an (empty) buffer.
  Pooled_buffer();

  /// Releases the buffer.
  ~Pooled_buffer();

  // Methods.

  /**
   * The buffer, to append to.
   *
   * @return Pointer, valid until `*this` is destroyed.  Not null.
   */
  std::string* get();

private:
  // Data.

  /// The buffer.
  std::string m_buf;
}; // class Pooled_buffer

} // namespace linelog::log::detail
